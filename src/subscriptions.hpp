// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_SUBSCRIPTIONS_HPP
#define WSRPC_SUBSCRIPTIONS_HPP

#include "requests.hpp"

#include <json/json.h>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

namespace wsrpc
{

/**
 * Registry of the push subscriptions on a connection.  Subscriptions are
 * requested under a local "tag", and requests for the same tag are
 * deduplicated.  When the endpoint returns the subscription ID, the
 * delivery function is registered for it and used for push notifications.
 *
 * Only the delivery function passed with the first Subscribe call for
 * a tag is used.  If multiple listeners share a tag, that function needs
 * to fan out to all of them.
 *
 * The class is thread-safe.  It never holds its lock while sending
 * requests or invoking a delivery function.
 */
class SubscriptionRegistry
{

public:

  /** Function invoked with the payload of each push notification.  */
  using DeliverFn = std::function<void (const Json::Value& payload)>;

private:

  /**
   * State of a tag.  While the subscribe request is in flight, the ID
   * is not yet known and the delivery function is stored here.
   */
  struct TagEntry
  {

    /**
     * Unique token for this subscribe attempt.  When the response arrives
     * and the tag has since been released (or re-subscribed), the token
     * will not match anymore.
     */
    uint64_t token;

    /** Whether the subscription ID is known.  */
    bool resolved = false;

    /** The subscription ID if resolved.  */
    std::string id;

    /** The delivery function.  */
    DeliverFn deliver;

  };

  /**
   * An active subscription (with known ID).
   */
  struct Subscription
  {
    std::string tag;
    DeliverFn deliver;
  };

  /** Where we send the subscribe and unsubscribe requests.  */
  RequestSender& sender;

  /** The method for subscribing, e.g. eth_subscribe.  */
  const std::string subscribeMethod;

  /** The method for unsubscribing, e.g. eth_unsubscribe.  */
  const std::string unsubscribeMethod;

  /** Lock for the state below.  */
  mutable std::mutex mut;

  /** Next token to use.  */
  uint64_t nextToken = 1;

  /** Pending or resolved subscriptions by tag.  */
  std::map<std::string, TagEntry> tags;

  /** Active subscriptions by their ID.  */
  std::map<std::string, Subscription> subs;

  /**
   * Processes the response to a subscribe request.
   */
  void Subscribed (const std::string& tag, uint64_t token,
                   std::exception_ptr err, const Json::Value& result);

  /**
   * Sends the unsubscribe request for the given ID.  This is fire-and-forget,
   * the result is just logged.
   */
  void SendUnsubscribe (const std::string& id);

public:

  explicit SubscriptionRegistry (RequestSender& s, const std::string& subMethod,
                                 const std::string& unsubMethod);

  SubscriptionRegistry (const SubscriptionRegistry&) = delete;
  void operator= (const SubscriptionRegistry&) = delete;

  /**
   * Requests a subscription with the given params under the given tag.
   * If the tag is already pending or active, this does nothing and
   * returns false.  Otherwise the subscribe request is sent and true
   * is returned.
   */
  bool Subscribe (const std::string& tag, const Json::Value& params,
                  DeliverFn deliver);

  /**
   * Releases the subscription with the given tag.  If it is active, it is
   * removed and the endpoint is asked to unsubscribe.  If the subscribe
   * request is still in flight, the unsubscribe is sent once the ID is
   * known.  Does nothing if the tag is unknown.
   */
  void Release (const std::string& tag);

  /**
   * Handles the params of a push notification, i.e. an object with the
   * subscription ID and the result.  Returns true if it was delivered,
   * and false if the subscription is unknown (or the data invalid).
   */
  bool Deliver (const Json::Value& params);

  /**
   * Forgets about all subscriptions without unsubscribing.  This is used
   * when the connection is lost, since the endpoint drops the subscriptions
   * for a connection anyway.
   */
  void Reset ();

  /**
   * Returns true if there is a pending or active entry for the tag.
   */
  bool HasTag (const std::string& tag) const;

  /**
   * Returns the subscription ID for a tag if it is known.
   */
  bool GetSubscriptionId (const std::string& tag, std::string& id) const;

  /**
   * Returns the number of active subscriptions (with known ID).
   */
  size_t GetNumActive () const;

};

} // namespace wsrpc

#endif // WSRPC_SUBSCRIPTIONS_HPP
