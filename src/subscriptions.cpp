// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "subscriptions.hpp"

#include <glog/logging.h>

namespace wsrpc
{

SubscriptionRegistry::SubscriptionRegistry (RequestSender& s,
                                            const std::string& subMethod,
                                            const std::string& unsubMethod)
  : sender(s), subscribeMethod(subMethod), unsubscribeMethod(unsubMethod)
{}

bool
SubscriptionRegistry::Subscribe (const std::string& tag,
                                 const Json::Value& params, DeliverFn deliver)
{
  uint64_t token;
  {
    std::lock_guard<std::mutex> lock(mut);
    if (tags.count (tag) > 0)
      {
        VLOG (1) << "Subscription for " << tag << " already exists";
        return false;
      }

    /* The entry is added right away (before the request is even sent),
       so that concurrent calls see it and do not subscribe again.  */
    token = nextToken++;
    TagEntry entry;
    entry.token = token;
    entry.deliver = std::move (deliver);
    tags.emplace (tag, std::move (entry));
  }

  VLOG (1) << "Subscribing for " << tag << " with params " << params;
  sender.SendRequest (subscribeMethod, params,
      [this, tag, token] (std::exception_ptr err, const Json::Value& result)
        {
          Subscribed (tag, token, err, result);
        });

  return true;
}

void
SubscriptionRegistry::Subscribed (const std::string& tag, const uint64_t token,
                                  std::exception_ptr err,
                                  const Json::Value& result)
{
  std::unique_lock<std::mutex> lock(mut);

  auto mit = tags.find (tag);
  const bool current = (mit != tags.end () && mit->second.token == token);

  if (err != nullptr || !result.isString ())
    {
      if (err != nullptr)
        LOG (WARNING)
            << "Subscription for " << tag << " failed: " << DescribeError (err);
      else
        LOG (WARNING)
            << "Invalid subscription ID for " << tag << ": " << result;

      /* Drop the entry, so that a later attempt can subscribe again.  */
      if (current)
        tags.erase (mit);
      return;
    }

  const std::string id = result.asString ();
  if (!current)
    {
      /* The tag has been released while the request was in flight.  */
      lock.unlock ();
      VLOG (1) << "Subscription " << id << " for " << tag << " is obsolete";
      SendUnsubscribe (id);
      return;
    }

  CHECK (!mit->second.resolved);
  mit->second.resolved = true;
  mit->second.id = id;

  Subscription sub;
  sub.tag = tag;
  sub.deliver = mit->second.deliver;
  if (!subs.emplace (id, std::move (sub)).second)
    LOG (WARNING) << "Duplicate subscription ID " << id << " for " << tag;

  LOG (INFO) << "Subscribed to " << tag << ": " << id;
}

void
SubscriptionRegistry::Release (const std::string& tag)
{
  std::string id;
  {
    std::lock_guard<std::mutex> lock(mut);

    auto mit = tags.find (tag);
    if (mit == tags.end ())
      return;

    if (!mit->second.resolved)
      {
        /* The unsubscribe is sent by Subscribed when the ID arrives.  */
        VLOG (1) << "Releasing pending subscription for " << tag;
        tags.erase (mit);
        return;
      }

    id = mit->second.id;
    tags.erase (mit);
    subs.erase (id);
  }

  LOG (INFO) << "Releasing subscription " << id << " for " << tag;
  SendUnsubscribe (id);
}

void
SubscriptionRegistry::SendUnsubscribe (const std::string& id)
{
  Json::Value params(Json::arrayValue);
  params.append (id);

  sender.SendRequest (unsubscribeMethod, params,
      [id] (std::exception_ptr err, const Json::Value& result)
        {
          if (err != nullptr)
            VLOG (1) << "Unsubscribe from " << id << " failed: "
                     << DescribeError (err);
          else
            VLOG (1) << "Unsubscribed from " << id << ": " << result;
        });
}

bool
SubscriptionRegistry::Deliver (const Json::Value& params)
{
  if (!params.isObject () || !params["subscription"].isString ())
    {
      LOG (WARNING) << "Invalid subscription notification: " << params;
      return false;
    }
  const std::string id = params["subscription"].asString ();

  DeliverFn deliver;
  {
    std::lock_guard<std::mutex> lock(mut);
    auto mit = subs.find (id);
    if (mit == subs.end ())
      {
        VLOG (1) << "Dropping notification for unknown subscription " << id;
        return false;
      }
    deliver = mit->second.deliver;
  }

  VLOG (2) << "Notification for " << id << ": " << params["result"];
  if (deliver)
    deliver (params["result"]);

  return true;
}

void
SubscriptionRegistry::Reset ()
{
  std::lock_guard<std::mutex> lock(mut);

  if (!tags.empty ())
    LOG (INFO) << "Forgetting about " << tags.size () << " subscriptions";

  tags.clear ();
  subs.clear ();
}

bool
SubscriptionRegistry::HasTag (const std::string& tag) const
{
  std::lock_guard<std::mutex> lock(mut);
  return tags.count (tag) > 0;
}

bool
SubscriptionRegistry::GetSubscriptionId (const std::string& tag,
                                         std::string& id) const
{
  std::lock_guard<std::mutex> lock(mut);

  auto mit = tags.find (tag);
  if (mit == tags.end () || !mit->second.resolved)
    return false;

  id = mit->second.id;
  return true;
}

size_t
SubscriptionRegistry::GetNumActive () const
{
  std::lock_guard<std::mutex> lock(mut);
  return subs.size ();
}

} // namespace wsrpc
