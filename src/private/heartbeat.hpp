// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_HEARTBEAT_HPP
#define WSRPC_HEARTBEAT_HPP

#include "eventloop.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

namespace wsrpc
{

/**
 * Liveness timer for a connection.  It is restarted whenever anything
 * is received, and invokes the expiry function if nothing has been
 * received within the window.
 */
class HeartbeatMonitor
{

private:

  /** The event loop used for the deadline timer.  */
  EventLoop& loop;

  /** The heartbeat window.  */
  const std::chrono::milliseconds window;

  /** Function invoked when the deadline is reached.  */
  const std::function<void ()> expired;

  /** Lock for the fields below.  */
  std::mutex mut;

  /** The currently outstanding deadline (if any).  */
  std::shared_ptr<EventLoop::Timer> deadline;

  /**
   * Counter that is increased whenever the deadline is reset or stopped.
   * A firing timer only triggers the expiry if its generation is still
   * current.
   */
  uint64_t generation = 0;

  /**
   * Called from the timer when it fires.
   */
  void Fire (uint64_t gen);

public:

  explicit HeartbeatMonitor (EventLoop& l, std::chrono::milliseconds w,
                             std::function<void ()> e);
  ~HeartbeatMonitor ();

  HeartbeatMonitor (const HeartbeatMonitor&) = delete;
  void operator= (const HeartbeatMonitor&) = delete;

  /**
   * Cancels the outstanding deadline (if any) and starts a new one.
   */
  void Reset ();

  /**
   * Cancels the outstanding deadline without starting a new one.
   */
  void Stop ();

  /**
   * Returns true if a deadline is currently outstanding.
   */
  bool IsActive ();

};

} // namespace wsrpc

#endif // WSRPC_HEARTBEAT_HPP
