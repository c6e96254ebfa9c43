// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "websocketprovider.hpp"

#include <glog/logging.h>

#include <stdexcept>

namespace wsrpc
{

namespace
{

/** Method for subscribing to push notifications.  */
const std::string SUBSCRIBE_METHOD = "eth_subscribe";
/** Method for unsubscribing again.  */
const std::string UNSUBSCRIBE_METHOD = "eth_unsubscribe";
/** Method of the push notifications.  */
const std::string NOTIFICATION_METHOD = "eth_subscription";

/**
 * Parses the network argument into an expected chain ID (or -1).
 */
int64_t
ParseNetwork (const std::string& network)
{
  if (network.empty ())
    return -1;

  if (network.find_first_not_of ("0123456789") != std::string::npos
        || network.size () > 18)
    throw std::invalid_argument ("invalid network: " + network);

  return std::stoll (network);
}

} // anonymous namespace

WebSocketProvider::WebSocketProvider (const ConnectionInfo& info,
                                      EventLoop& loop,
                                      TransportFactory& factory,
                                      const std::string& network)
{
  if (network == NETWORK_ANY)
    throw UnsupportedOperation ("network:any",
                                "WebSocketProvider does not support"
                                " the 'any' network");
  expectedChainId = ParseNetwork (network);

  conn = std::make_unique<ConnectionManager> (info, loop, factory, tracker,
                                              NOTIFICATION_METHOD, *this);
  subs = std::make_unique<SubscriptionRegistry> (*conn, SUBSCRIBE_METHOD,
                                                 UNSUBSCRIBE_METHOD);
  dispatcher = std::make_unique<EventDispatcher> (*conn, *subs, listeners,
                                                  formatter);

  conn->Connect ();
}

WebSocketProvider::~WebSocketProvider ()
{
  /* Shut down the connection explicitly, so that no callbacks arrive
     while the other members are torn down.  */
  conn.reset ();
}

void
WebSocketProvider::ConnectionOpened ()
{
  dispatcher->RestartEvents ();
}

void
WebSocketProvider::NotificationReceived (const Json::Value& params)
{
  subs->Deliver (params);
}

void
WebSocketProvider::ConnectionLost ()
{
  /* The endpoint drops all subscriptions of the connection.  */
  subs->Reset ();
}

std::future<Json::Value>
WebSocketProvider::Send (const std::string& method, const Json::Value& params)
{
  auto promise = std::make_shared<std::promise<Json::Value>> ();
  auto res = promise->get_future ();

  conn->SendRequest (method, params,
      [promise] (std::exception_ptr err, const Json::Value& result)
        {
          if (err != nullptr)
            promise->set_exception (err);
          else
            promise->set_value (result);
        });

  return res;
}

std::shared_future<int64_t>
WebSocketProvider::DetectNetwork ()
{
  std::lock_guard<std::mutex> lock(mutNetwork);

  if (!networkStarted)
    {
      networkStarted = true;
      auto promise = std::make_shared<std::promise<int64_t>> ();
      network = promise->get_future ().share ();

      const int64_t expected = expectedChainId;
      conn->SendRequest ("eth_chainId", Json::Value (Json::arrayValue),
          [promise, expected] (std::exception_ptr err,
                               const Json::Value& result)
            {
              if (err != nullptr)
                {
                  promise->set_exception (err);
                  return;
                }

              try
                {
                  promise->set_value (ParseChainId (result, expected));
                }
              catch (const std::exception& exc)
                {
                  LOG (WARNING) << "Network detection failed: " << exc.what ();
                  promise->set_exception (std::current_exception ());
                }
            });
    }

  return network;
}

std::chrono::milliseconds
WebSocketProvider::GetPollingInterval () const
{
  return std::chrono::milliseconds (0);
}

void
WebSocketProvider::SetPollingInterval (const std::chrono::milliseconds val)
{
  throw UnsupportedOperation ("setPollingInterval",
                              "cannot set polling interval on"
                              " WebSocketProvider");
}

void
WebSocketProvider::SetPolling (const bool val)
{
  if (!val)
    return;

  throw UnsupportedOperation ("setPolling",
                              "cannot set polling on WebSocketProvider");
}

void
WebSocketProvider::ResetEventsBlock (const int64_t blockNumber)
{
  throw UnsupportedOperation ("resetEventBlock",
                              "cannot reset events block on"
                              " WebSocketProvider");
}

uint64_t
WebSocketProvider::On (const Event& ev, EventListeners::Listener fcn)
{
  const uint64_t id = listeners.Add (ev, std::move (fcn));
  dispatcher->StartEvent (ev);
  return id;
}

bool
WebSocketProvider::Off (const uint64_t id)
{
  Event ev;
  if (!listeners.Remove (id, ev))
    return false;

  dispatcher->StopEvent (ev);
  return true;
}

size_t
WebSocketProvider::GetListenerCount (const Event& ev) const
{
  return listeners.Count (ev.GetTag ());
}

int64_t
WebSocketProvider::GetBlockNumber () const
{
  return dispatcher->GetBlockNumber ();
}

void
WebSocketProvider::SetDebugCallback (DebugCallback cb)
{
  conn->SetDebugCallback (std::move (cb));
}

std::future<void>
WebSocketProvider::Destroy ()
{
  return conn->Destroy ();
}

ConnectionState
WebSocketProvider::GetState () const
{
  return conn->GetState ();
}

} // namespace wsrpc
