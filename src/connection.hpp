// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_CONNECTION_HPP
#define WSRPC_CONNECTION_HPP

#include "eventloop.hpp"
#include "requests.hpp"
#include "transport.hpp"

#include <json/json.h>

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace wsrpc
{

class HeartbeatMonitor;

/**
 * States of the connection held by a ConnectionManager.
 */
enum class ConnectionState
{
  CONNECTING,
  OPEN,
  CLOSING,
  CLOSED,
};

/**
 * Function receiving debug events about requests and responses.
 */
using DebugCallback = std::function<void (const Json::Value& event)>;

/**
 * Manager for the single persistent connection to a streaming JSON-RPC
 * endpoint.  It owns the current transport, correlates responses to
 * requests through a RequestTracker, watches the connection liveness
 * and (if enabled) reconnects after the connection got lost.
 *
 * Requests sent while the connection is not open are queued and written
 * once it opens.  Requests already written on a connection that got lost
 * are not resent on the next one; they stay pending until answered or
 * until the manager is destroyed.
 *
 * Transport callbacks are bound to the generation of the transport they
 * belong to, so that late events from a replaced transport are ignored.
 */
class ConnectionManager : public RequestSender
{

public:

  class Callbacks;

private:

  class Binding;

  /** The connection configuration.  */
  const ConnectionInfo info;

  /** Event loop used for the heartbeat and reconnect timers.  */
  EventLoop& loop;

  /** Factory for the transports.  */
  TransportFactory& factory;

  /** The tracker of pending requests.  */
  RequestTracker& tracker;

  /** Method name of push notifications, e.g. eth_subscription.  */
  const std::string notificationMethod;

  /** Callbacks for the higher-level code.  */
  Callbacks& cb;

  /** The liveness monitor of the open connection.  */
  std::unique_ptr<HeartbeatMonitor> heartbeat;

  /** Lock for the connection state.  */
  mutable std::mutex mut;

  /** The current state.  */
  ConnectionState state = ConnectionState::CLOSED;

  /** Generation of the current transport.  */
  uint64_t generation = 0;

  /**
   * The callbacks bound to the current transport.  They must outlive the
   * transport, which is why they are destructed after it.
   */
  std::shared_ptr<Binding> binding;

  /** The current transport (if any).  */
  std::shared_ptr<Transport> transport;

  /** The scheduled reconnect (if any).  */
  std::shared_ptr<EventLoop::Timer> reconnectTimer;

  /** Set to true once Destroy has been called.  */
  bool destroyed = false;

  /** Promise fulfilled when the connection is closed after Destroy.  */
  std::promise<void> destroyPromise;

  /**
   * Set (under the lock) by whoever fulfills destroyPromise, so that
   * it is fulfilled exactly once.
   */
  bool destroySettled = false;

  /** Lock for the debug callback.  */
  std::mutex mutDebug;

  /** The debug callback, if one is set.  */
  DebugCallback debug;

  /**
   * Handles the open event of the transport with the given generation.
   */
  void HandleOpen (uint64_t gen);

  /**
   * Handles an incoming text frame.
   */
  void HandleMessage (uint64_t gen, const std::string& text);

  /**
   * Handles a close or error event of the transport.
   */
  void HandleLost (uint64_t gen, const std::string& reason);

  /**
   * Called when the heartbeat window passed without any data received.
   */
  void HeartbeatExpired ();

  /**
   * Schedules a new connection attempt after the reconnect interval.
   */
  void ScheduleReconnect ();

  /**
   * Runs a completion and reports its response to the debug callback.
   */
  void Complete (const RequestTracker::Completion& c);

  /**
   * Passes an event to the debug callback if there is one.
   */
  void EmitDebug (const Json::Value& event);

public:

  explicit ConnectionManager (const ConnectionInfo& i, EventLoop& l,
                              TransportFactory& f, RequestTracker& t,
                              const std::string& notification, Callbacks& c);
  ~ConnectionManager ();

  ConnectionManager (const ConnectionManager&) = delete;
  void operator= (const ConnectionManager&) = delete;

  /**
   * Starts a new connection attempt.  This returns right away, the outcome
   * is reported through the callbacks.  Does nothing if a connection
   * is already open or being opened, or after Destroy.
   */
  void Connect ();

  void SendRequest (const std::string& method, const Json::Value& params,
                    ResponseCallback c) override;

  /**
   * Shuts the connection down for good.  A connection attempt in progress
   * is allowed to settle first, and an open connection is closed normally.
   * All pending requests are rejected, as are all requests sent later on.
   * The returned future becomes ready when the connection is closed.
   */
  std::future<void> Destroy ();

  /**
   * Sets the debug callback, which receives request and response events.
   */
  void SetDebugCallback (DebugCallback d);

  /**
   * Returns the current connection info.
   */
  const ConnectionInfo&
  GetInfo () const
  {
    return info;
  }

  /**
   * Returns the current state of the connection.
   */
  ConnectionState GetState () const;

};

/**
 * Interface for the code built on top of the connection manager, which
 * gets notified about connection events and push notifications.  The
 * methods are invoked without any lock of the manager held.
 */
class ConnectionManager::Callbacks
{

public:

  virtual ~Callbacks () = default;

  /**
   * Invoked when a connection has been opened, after all queued requests
   * have been written.
   */
  virtual void
  ConnectionOpened ()
  {}

  /**
   * Invoked for a push notification, with its params.
   */
  virtual void
  NotificationReceived (const Json::Value& params)
  {}

  /**
   * Invoked when a connection that was open got lost.  All subscriptions
   * on it are gone at this point.
   */
  virtual void
  ConnectionLost ()
  {}

};

} // namespace wsrpc

#endif // WSRPC_CONNECTION_HPP
