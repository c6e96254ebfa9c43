// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_ETH_WEBSOCKETPROVIDER_HPP
#define WSRPC_ETH_WEBSOCKETPROVIDER_HPP

#include "dispatcher.hpp"
#include "events.hpp"
#include "formatter.hpp"
#include "provider.hpp"

#include "connection.hpp"
#include "eventloop.hpp"
#include "requests.hpp"
#include "subscriptions.hpp"
#include "transport.hpp"

#include <json/json.h>

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace wsrpc
{

/**
 * Provider for an Ethereum endpoint over a persistent WebSocket connection.
 * Requests are multiplexed over the single connection, and listeners
 * for events are served through push subscriptions instead of polling.
 */
class WebSocketProvider : public Provider,
                          private ConnectionManager::Callbacks
{

private:

  /** Network value that would allow the chain to change.  */
  static constexpr const char* NETWORK_ANY = "any";

  Formatter formatter;
  RequestTracker tracker;
  EventListeners listeners;

  /**
   * The expected chain ID, or -1 if the network is just detected from
   * the endpoint.
   */
  int64_t expectedChainId = -1;

  /** Lock for the network detection.  */
  std::mutex mutNetwork;

  /** Whether the network detection has been started.  */
  bool networkStarted = false;

  /** The detected network (once started).  */
  std::shared_future<int64_t> network;

  std::unique_ptr<SubscriptionRegistry> subs;
  std::unique_ptr<EventDispatcher> dispatcher;

  /**
   * The connection.  It is declared last, so that it is destructed first
   * (while the dispatcher still handles requests rejected on destruction).
   */
  std::unique_ptr<ConnectionManager> conn;

  void ConnectionOpened () override;
  void NotificationReceived (const Json::Value& params) override;
  void ConnectionLost () override;

public:

  /**
   * Constructs the provider and starts connecting.  network can be empty
   * (to just use whatever the endpoint is on) or a decimal chain ID that
   * the endpoint must match.  "any" is not supported.
   */
  explicit WebSocketProvider (const ConnectionInfo& info, EventLoop& loop,
                              TransportFactory& factory,
                              const std::string& network = "");

  ~WebSocketProvider ();

  std::future<Json::Value> Send (const std::string& method,
                                 const Json::Value& params) override;

  /**
   * Returns the chain ID.  It is queried the first time this is called,
   * and the result is reused afterwards.
   */
  std::shared_future<int64_t> DetectNetwork () override;

  const Formatter&
  GetFormatter () const override
  {
    return formatter;
  }

  /**
   * Always returns zero, as this provider does not poll.
   */
  std::chrono::milliseconds GetPollingInterval () const override;

  /**
   * Throws UnsupportedOperation.
   */
  void SetPollingInterval (std::chrono::milliseconds val) override;

  /**
   * Turning polling off is fine (and does nothing), turning it on throws
   * UnsupportedOperation.
   */
  void SetPolling (bool val) override;

  /**
   * Throws UnsupportedOperation.
   */
  void ResetEventsBlock (int64_t blockNumber) override;

  /**
   * Registers a listener for an event and returns its ID.
   */
  uint64_t On (const Event& ev, EventListeners::Listener fcn);

  /**
   * Removes the listener with the given ID.  Returns false if there
   * is no such listener.
   */
  bool Off (uint64_t id);

  /**
   * Returns the number of listeners for the given event.
   */
  size_t GetListenerCount (const Event& ev) const;

  /**
   * Returns the last block number emitted to listeners, or -1.
   */
  int64_t GetBlockNumber () const;

  /**
   * Installs a function that receives debug events for all requests
   * and responses.
   */
  void SetDebugCallback (DebugCallback cb);

  /**
   * Shuts the connection down, rejecting all pending requests.  The
   * future becomes ready when the connection is closed.
   */
  std::future<void> Destroy ();

  /**
   * Returns the underlying connection state.
   */
  ConnectionState GetState () const;

};

} // namespace wsrpc

#endif // WSRPC_ETH_WEBSOCKETPROVIDER_HPP
