// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "events.hpp"

#include "private/jsonutils.hpp"

#include <glog/logging.h>

#include <set>

namespace wsrpc
{

Event
Event::Block ()
{
  return Event (EventKind::BLOCK, "block");
}

Event
Event::Pending ()
{
  return Event (EventKind::PENDING, "pending");
}

Event
Event::Logs (const Json::Value& filter)
{
  Event res(EventKind::FILTER, "filter:" + StoreJson (filter));
  res.filter = filter;
  return res;
}

Event
Event::Transaction (const std::string& hash)
{
  Event res(EventKind::TX, "tx:" + hash);
  res.hash = hash;
  return res;
}

/* ************************************************************************** */

uint64_t
EventListeners::Add (const Event& ev, Listener fcn)
{
  std::lock_guard<std::mutex> lock(mut);

  const uint64_t id = nextId++;
  listeners.emplace (id, Entry {ev, std::move (fcn)});
  VLOG (1) << "Added listener " << id << " for " << ev.GetTag ();

  return id;
}

bool
EventListeners::Remove (const uint64_t id, Event& ev)
{
  std::lock_guard<std::mutex> lock(mut);

  auto mit = listeners.find (id);
  if (mit == listeners.end ())
    return false;

  ev = mit->second.event;
  listeners.erase (mit);
  VLOG (1) << "Removed listener " << id << " for " << ev.GetTag ();

  return true;
}

size_t
EventListeners::Count (const std::string& tag) const
{
  std::lock_guard<std::mutex> lock(mut);

  size_t res = 0;
  for (const auto& entry : listeners)
    if (entry.second.event.GetTag () == tag)
      ++res;

  return res;
}

size_t
EventListeners::Count (const EventKind kind) const
{
  std::lock_guard<std::mutex> lock(mut);

  size_t res = 0;
  for (const auto& entry : listeners)
    if (entry.second.event.GetKind () == kind)
      ++res;

  return res;
}

std::vector<Event>
EventListeners::GetActive () const
{
  std::lock_guard<std::mutex> lock(mut);

  std::vector<Event> res;
  std::set<std::string> seen;
  for (const auto& entry : listeners)
    if (seen.insert (entry.second.event.GetTag ()).second)
      res.push_back (entry.second.event);

  return res;
}

size_t
EventListeners::Emit (const std::string& tag, const Json::Value& val) const
{
  std::vector<Listener> toCall;
  {
    std::lock_guard<std::mutex> lock(mut);
    for (const auto& entry : listeners)
      if (entry.second.event.GetTag () == tag)
        toCall.push_back (entry.second.fcn);
  }

  VLOG (2) << "Emitting for " << tag << ": " << val;
  for (const auto& fcn : toCall)
    fcn (val);

  return toCall.size ();
}

} // namespace wsrpc
