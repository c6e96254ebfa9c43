// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "connection.hpp"

#include "private/heartbeat.hpp"
#include "private/jsonutils.hpp"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

#include <exception>
#include <vector>

namespace wsrpc
{

/* ************************************************************************** */

/**
 * Transport callbacks for one particular transport.  They forward
 * to the manager together with the generation they are bound to.
 */
class ConnectionManager::Binding : public Transport::Callbacks
{

private:

  ConnectionManager& mgr;
  const uint64_t gen;

public:

  explicit Binding (ConnectionManager& m, const uint64_t g)
    : mgr(m), gen(g)
  {}

  void
  OnOpen () override
  {
    mgr.HandleOpen (gen);
  }

  void
  OnMessage (const std::string& text) override
  {
    mgr.HandleMessage (gen, text);
  }

  void
  OnClose (const int code) override
  {
    mgr.HandleLost (gen, "closed with code " + std::to_string (code));
  }

  void
  OnError (const std::string& reason) override
  {
    mgr.HandleLost (gen, "error: " + reason);
  }

};

/* ************************************************************************** */

ConnectionManager::ConnectionManager (const ConnectionInfo& i, EventLoop& l,
                                      TransportFactory& f, RequestTracker& t,
                                      const std::string& notification,
                                      Callbacks& c)
  : info(i), loop(l), factory(f), tracker(t),
    notificationMethod(notification), cb(c)
{
  heartbeat = std::make_unique<HeartbeatMonitor> (loop, info.timeout,
      [this] ()
        {
          HeartbeatExpired ();
        });
}

ConnectionManager::~ConnectionManager ()
{
  bool needDestroy;
  {
    std::lock_guard<std::mutex> lock(mut);
    needDestroy = !destroyed;
  }
  if (needDestroy)
    {
      /* We can not wait for the close to finish here, as the destructor
         may well be running on the event loop thread.  */
      Destroy ();
    }

  heartbeat->Stop ();

  std::shared_ptr<EventLoop::Timer> timer;
  std::shared_ptr<Transport> oldTransport;
  std::shared_ptr<Binding> oldBinding;
  bool settle;
  {
    std::lock_guard<std::mutex> lock(mut);
    /* A close still in progress will never be reported to us anymore.  */
    settle = !destroySettled;
    destroySettled = true;
    timer = std::move (reconnectTimer);
    oldBinding = std::move (binding);
    oldTransport = std::move (transport);
    /* Make sure late callbacks (while the transport is torn down)
       are ignored.  */
    ++generation;
  }

  if (timer != nullptr)
    timer->Cancel ();

  if (settle)
    destroyPromise.set_value ();
}

void
ConnectionManager::Connect ()
{
  std::shared_ptr<Binding> oldBinding;
  std::shared_ptr<Transport> oldTransport;

  uint64_t gen;
  bool failed = false;
  std::string failure;

  {
    std::lock_guard<std::mutex> lock(mut);

    if (destroyed)
      {
        VLOG (1) << "Not connecting, the connection has been destroyed";
        return;
      }
    if (state != ConnectionState::CLOSED)
      {
        LOG (WARNING) << "Connection to " << info.url << " is already active";
        return;
      }

    gen = ++generation;
    oldBinding = std::move (binding);
    oldTransport = std::move (transport);

    LOG (INFO) << "Connecting to " << info.url;
    binding = std::make_shared<Binding> (*this, gen);
    transport = factory.Create (info, *binding);
    state = ConnectionState::CONNECTING;

    try
      {
        transport->Connect ();
      }
    catch (const std::exception& exc)
      {
        failed = true;
        failure = exc.what ();
      }
  }

  /* The old transport (if any) is destructed here, before its binding,
     without our lock held.  */
  oldTransport.reset ();

  if (failed)
    HandleLost (gen, "connect failed: " + failure);
}

void
ConnectionManager::HandleOpen (const uint64_t gen)
{
  std::shared_ptr<Transport> toClose;
  {
    std::lock_guard<std::mutex> lock(mut);

    if (gen != generation || state != ConnectionState::CONNECTING)
      {
        VLOG (1) << "Ignoring open event of stale transport " << gen;
        return;
      }

    if (destroyed)
      {
        LOG (INFO) << "Connection opened after destroy, closing it";
        state = ConnectionState::CLOSING;
        toClose = transport;
      }
    else
      {
        LOG (INFO) << "Connected to " << info.url;
        state = ConnectionState::OPEN;

        /* Queued requests are written while holding the lock, so that
           requests sent concurrently are written after them.  */
        const auto queued = tracker.TakeUnsent ();
        if (!queued.empty ())
          LOG (INFO) << "Sending " << queued.size () << " queued requests";
        for (const auto& payload : queued)
          if (!transport->Send (payload))
            LOG (WARNING) << "Failed to send queued request: " << payload;
      }
  }

  if (toClose != nullptr)
    {
      toClose->Close (CLOSE_NORMAL);
      return;
    }

  heartbeat->Reset ();
  cb.ConnectionOpened ();
}

void
ConnectionManager::HandleMessage (const uint64_t gen, const std::string& text)
{
  bool open;
  {
    std::lock_guard<std::mutex> lock(mut);
    if (gen != generation || state == ConnectionState::CLOSED)
      {
        VLOG (1) << "Ignoring message of stale transport " << gen;
        return;
      }
    open = (state == ConnectionState::OPEN);
  }

  /* Any frame at all counts as sign of life.  */
  if (open)
    heartbeat->Reset ();

  VLOG (2) << "Received frame: " << text;

  Json::Value data;
  std::string err;
  if (!TryParseJson (text, data, err))
    {
      LOG (WARNING) << "Dropping invalid frame: " << err;
      return;
    }
  if (!data.isObject ())
    {
      LOG (WARNING) << "Dropping non-object frame: " << text;
      return;
    }

  if (data.isMember ("id") && !data["id"].isNull ())
    {
      RequestTracker::Completion c;
      if (!tracker.Resolve (data, text, c))
        {
          VLOG (1) << "Dropping response without request: " << data["id"];
          return;
        }
      Complete (c);
      return;
    }

  const auto& method = data["method"];
  if (method.isString () && method.asString () == notificationMethod)
    {
      cb.NotificationReceived (data["params"]);
      return;
    }

  LOG (WARNING) << "Dropping unexpected frame: " << text;
}

void
ConnectionManager::HandleLost (const uint64_t gen, const std::string& reason)
{
  bool wasOpen;
  bool settle = false;
  bool reconnect = false;

  {
    std::lock_guard<std::mutex> lock(mut);

    if (gen != generation || state == ConnectionState::CLOSED)
      {
        VLOG (1)
            << "Ignoring loss of stale transport " << gen << ": " << reason;
        return;
      }

    wasOpen = (state == ConnectionState::OPEN);
    state = ConnectionState::CLOSED;

    if (destroyed)
      {
        settle = true;
        destroySettled = true;
      }
    else
      reconnect = info.reconnect;
  }

  heartbeat->Stop ();

  if (settle)
    {
      LOG (INFO) << "Connection to " << info.url << " closed: " << reason;
      destroyPromise.set_value ();
      return;
    }

  LOG (WARNING) << "Connection to " << info.url << " lost: " << reason;
  if (wasOpen)
    cb.ConnectionLost ();

  if (reconnect)
    ScheduleReconnect ();
}

void
ConnectionManager::HeartbeatExpired ()
{
  std::shared_ptr<Transport> t;
  {
    std::lock_guard<std::mutex> lock(mut);
    if (state != ConnectionState::OPEN)
      return;
    t = transport;
  }

  /* Terminating may invoke the close handler right away, so it must
     not be done while holding the lock.  */
  LOG (WARNING) << "Terminating connection to " << info.url;
  t->Terminate ();
}

void
ConnectionManager::ScheduleReconnect ()
{
  LOG (INFO)
      << "Reconnecting in " << info.reconnectInterval.count () << " ms";

  auto timer = loop.Schedule (info.reconnectInterval, [this] ()
    {
      Connect ();
    });

  {
    std::lock_guard<std::mutex> lock(mut);
    if (!destroyed)
      {
        reconnectTimer = std::move (timer);
        return;
      }
  }

  timer->Cancel ();
}

std::future<void>
ConnectionManager::Destroy ()
{
  std::future<void> res;
  std::shared_ptr<EventLoop::Timer> timer;
  std::shared_ptr<Transport> toClose;
  bool settled = false;

  {
    std::lock_guard<std::mutex> lock(mut);

    if (destroyed)
      {
        std::promise<void> done;
        done.set_value ();
        return done.get_future ();
      }

    LOG (INFO) << "Destroying connection to " << info.url;
    destroyed = true;
    res = destroyPromise.get_future ();
    timer = std::move (reconnectTimer);

    switch (state)
      {
      case ConnectionState::CONNECTING:
        /* We wait for the attempt to settle, see HandleOpen
           and HandleLost.  */
        break;

      case ConnectionState::OPEN:
        state = ConnectionState::CLOSING;
        toClose = transport;
        break;

      case ConnectionState::CLOSING:
        LOG (FATAL) << "Closing state without destroy";
        break;

      case ConnectionState::CLOSED:
        settled = true;
        destroySettled = true;
        break;
      }
  }

  if (timer != nullptr)
    timer->Cancel ();
  heartbeat->Stop ();

  for (const auto& c : tracker.CancelAll ("connection destroyed"))
    Complete (c);

  if (toClose != nullptr)
    toClose->Close (CLOSE_NORMAL);
  if (settled)
    destroyPromise.set_value ();

  return res;
}

void
ConnectionManager::SendRequest (const std::string& method,
                                const Json::Value& params, ResponseCallback c)
{
  RequestTracker::Outbound out;
  {
    std::lock_guard<std::mutex> lock(mut);

    if (!destroyed)
      {
        const bool open = (state == ConnectionState::OPEN);
        out = tracker.Add (method, params, std::move (c), open);

        if (open && !transport->Send (out.payload))
          LOG (WARNING) << "Failed to send request " << out.id;
      }
  }

  if (out.payload.empty ())
    {
      VLOG (1) << "Rejecting request for " << method << " after destroy";
      c (std::make_exception_ptr (jsonrpc::JsonRpcException (
            jsonrpc::Errors::ERROR_CLIENT_CONNECTOR, "connection destroyed")),
         Json::Value ());
      return;
    }

  VLOG (1) << "Request " << out.id << ": " << method;
  VLOG (2) << "Request payload: " << out.payload;

  Json::Value event(Json::objectValue);
  event["action"] = "request";
  event["request"] = out.request;
  EmitDebug (event);
}

void
ConnectionManager::Complete (const RequestTracker::Completion& c)
{
  EmitDebug (c.GetDebugInfo ());
  c.Run ();
}

void
ConnectionManager::SetDebugCallback (DebugCallback d)
{
  std::lock_guard<std::mutex> lock(mutDebug);
  debug = std::move (d);
}

void
ConnectionManager::EmitDebug (const Json::Value& event)
{
  DebugCallback fcn;
  {
    std::lock_guard<std::mutex> lock(mutDebug);
    fcn = debug;
  }

  if (fcn)
    fcn (event);
}

ConnectionState
ConnectionManager::GetState () const
{
  std::lock_guard<std::mutex> lock(mut);
  return state;
}

/* ************************************************************************** */

} // namespace wsrpc
