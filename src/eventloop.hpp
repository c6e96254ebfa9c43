// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_EVENTLOOP_HPP
#define WSRPC_EVENTLOOP_HPP

#include <chrono>
#include <functional>
#include <memory>

namespace wsrpc
{

/**
 * Interface for the loop that runs timers for a connection.  Timer
 * functions are run on the same thread that delivers the transport
 * callbacks, so they never run concurrently with those.
 */
class EventLoop
{

public:

  class Timer;

  EventLoop () = default;
  virtual ~EventLoop () = default;

  /**
   * Schedules fn to be run once after the given delay.  The returned
   * handle can be used to cancel the timer again.
   */
  virtual std::shared_ptr<Timer> Schedule (std::chrono::milliseconds delay,
                                           std::function<void ()> fn) = 0;

};

/**
 * Handle for a scheduled timer.
 */
class EventLoop::Timer
{

public:

  Timer () = default;
  virtual ~Timer () = default;

  /**
   * Cancels the timer.  When this returns, the timer function is guaranteed
   * to not be run anymore, and not be running at the moment (unless Cancel
   * is called from within the timer function itself).  Cancelling a timer
   * that has already fired is fine and does nothing.
   */
  virtual void Cancel () = 0;

};

} // namespace wsrpc

#endif // WSRPC_EVENTLOOP_HPP
