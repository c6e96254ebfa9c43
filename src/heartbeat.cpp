// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/heartbeat.hpp"

#include <glog/logging.h>

namespace wsrpc
{

HeartbeatMonitor::HeartbeatMonitor (EventLoop& l,
                                    const std::chrono::milliseconds w,
                                    std::function<void ()> e)
  : loop(l), window(w), expired(std::move (e))
{
  CHECK (expired);
}

HeartbeatMonitor::~HeartbeatMonitor ()
{
  Stop ();
}

void
HeartbeatMonitor::Reset ()
{
  std::shared_ptr<EventLoop::Timer> old;
  {
    std::lock_guard<std::mutex> lock(mut);
    const uint64_t gen = ++generation;
    old = std::move (deadline);
    deadline = loop.Schedule (window, [this, gen] ()
      {
        Fire (gen);
      });
  }

  /* The old timer is cancelled without holding our lock, as a concurrently
     firing timer needs the lock as well.  */
  if (old != nullptr)
    old->Cancel ();
}

void
HeartbeatMonitor::Stop ()
{
  std::shared_ptr<EventLoop::Timer> old;
  {
    std::lock_guard<std::mutex> lock(mut);
    ++generation;
    old = std::move (deadline);
  }

  if (old != nullptr)
    old->Cancel ();
}

bool
HeartbeatMonitor::IsActive ()
{
  std::lock_guard<std::mutex> lock(mut);
  return deadline != nullptr;
}

void
HeartbeatMonitor::Fire (const uint64_t gen)
{
  {
    std::lock_guard<std::mutex> lock(mut);
    if (gen != generation)
      return;
    deadline.reset ();
  }

  LOG (WARNING)
      << "Nothing received for " << window.count ()
      << " ms, assuming the connection is dead";
  expired ();
}

} // namespace wsrpc
