// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_ETH_EVENTS_HPP
#define WSRPC_ETH_EVENTS_HPP

#include <json/json.h>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace wsrpc
{

/**
 * The kinds of logical events listeners can register for.
 */
enum class EventKind
{
  BLOCK,
  PENDING,
  FILTER,
  TX,
};

/**
 * A logical event, identified by its tag.  Two events with the same tag
 * are the same event.
 */
class Event
{

private:

  EventKind kind;
  std::string tag;

  /** For filter events, the log filter.  */
  Json::Value filter;

  /** For transaction events, the hash being watched.  */
  std::string hash;

  explicit Event (const EventKind k, const std::string& t)
    : kind(k), tag(t)
  {}

public:

  /**
   * Constructs an empty placeholder event.  It is not equal to any
   * real event.
   */
  Event ()
    : kind(EventKind::BLOCK)
  {}

  /**
   * New block numbers.
   */
  static Event Block ();

  /**
   * New pending transaction hashes.
   */
  static Event Pending ();

  /**
   * Logs matching the given filter.  The filter should already be normalised
   * (see Formatter::Filter), and its canonical JSON forms the tag.
   */
  static Event Logs (const Json::Value& filter);

  /**
   * The receipt of the given transaction, once it is available.
   */
  static Event Transaction (const std::string& hash);

  EventKind
  GetKind () const
  {
    return kind;
  }

  const std::string&
  GetTag () const
  {
    return tag;
  }

  const Json::Value&
  GetFilter () const
  {
    return filter;
  }

  const std::string&
  GetHash () const
  {
    return hash;
  }

};

/**
 * Registry of listeners for logical events.  It keeps track of how many
 * listeners there are for each event (and kind of event), and fans out
 * emitted values to them.  The class is thread-safe.  Listeners are
 * invoked without the lock held, so they may add or remove listeners.
 */
class EventListeners
{

public:

  /** A listener function receiving the emitted values.  */
  using Listener = std::function<void (const Json::Value& val)>;

private:

  /**
   * Data about a registered listener.
   */
  struct Entry
  {
    Event event;
    Listener fcn;
  };

  /** Lock for this instance.  */
  mutable std::mutex mut;

  /** Next listener ID to give out.  */
  uint64_t nextId = 1;

  /** All listeners by their ID (and thus in registration order).  */
  std::map<uint64_t, Entry> listeners;

public:

  EventListeners () = default;

  EventListeners (const EventListeners&) = delete;
  void operator= (const EventListeners&) = delete;

  /**
   * Registers a listener and returns its ID.
   */
  uint64_t Add (const Event& ev, Listener fcn);

  /**
   * Removes the listener with the given ID.  Returns false if there is
   * none.  Otherwise returns true and the event it was registered for.
   */
  bool Remove (uint64_t id, Event& ev);

  /**
   * Returns the number of listeners for the event with the given tag.
   */
  size_t Count (const std::string& tag) const;

  /**
   * Returns the number of listeners for events of the given kind.
   */
  size_t Count (EventKind kind) const;

  /**
   * Returns all events that have listeners, each only once.
   */
  std::vector<Event> GetActive () const;

  /**
   * Invokes all listeners for the event with the given tag.  Returns
   * the number of listeners invoked.
   */
  size_t Emit (const std::string& tag, const Json::Value& val) const;

};

} // namespace wsrpc

#endif // WSRPC_ETH_EVENTS_HPP
