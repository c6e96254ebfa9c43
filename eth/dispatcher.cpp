// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dispatcher.hpp"

#include "hexutils.hpp"

#include <glog/logging.h>

#include <stdexcept>
#include <vector>

namespace wsrpc
{

EventDispatcher::EventDispatcher (RequestSender& s, SubscriptionRegistry& r,
                                  EventListeners& l, const Formatter& f)
  : sender(s), subs(r), listeners(l), formatter(f), blockNumber(-1)
{}

std::string
EventDispatcher::GetSubscriptionTag (const Event& ev)
{
  if (ev.GetKind () == EventKind::TX)
    return TX_TAG;
  return ev.GetTag ();
}

void
EventDispatcher::StartEvent (const Event& ev)
{
  Json::Value params(Json::arrayValue);

  switch (ev.GetKind ())
    {
    case EventKind::BLOCK:
      params.append ("newHeads");
      subs.Subscribe (ev.GetTag (), params, [this] (const Json::Value& head)
        {
          HandleNewHead (head);
        });
      break;

    case EventKind::PENDING:
      params.append ("newPendingTransactions");
      subs.Subscribe (ev.GetTag (), params, [this] (const Json::Value& txid)
        {
          listeners.Emit ("pending", txid);
        });
      break;

    case EventKind::FILTER:
      {
        params.append ("logs");
        params.append (ev.GetFilter ());
        const std::string tag = ev.GetTag ();
        subs.Subscribe (tag, params, [this, tag] (const Json::Value& log)
          {
            HandleLog (tag, log);
          });
        break;
      }

    case EventKind::TX:
      {
        /* The transaction may be mined already.  Receipts are emitted
           only once per hash while it has listeners, also across
           restarts of the subscription.  */
        bool emitted;
        {
          std::lock_guard<std::mutex> lock(mutReceipts);
          emitted = (emittedReceipts.count (ev.GetHash ()) > 0);
        }
        if (!emitted)
          CheckReceipt (ev.GetHash ());

        params.append ("newHeads");
        subs.Subscribe (TX_TAG, params, [this] (const Json::Value& head)
          {
            CheckAllReceipts ();
          });
        break;
      }
    }
}

void
EventDispatcher::StopEvent (const Event& ev)
{
  if (ev.GetKind () == EventKind::TX)
    {
      if (listeners.Count (ev.GetTag ()) == 0)
        {
          std::lock_guard<std::mutex> lock(mutReceipts);
          emittedReceipts.erase (ev.GetHash ());
        }

      if (listeners.Count (EventKind::TX) > 0)
        return;
    }
  else if (listeners.Count (ev.GetTag ()) > 0)
    return;

  subs.Release (GetSubscriptionTag (ev));
}

void
EventDispatcher::RestartEvents ()
{
  const auto active = listeners.GetActive ();

  /* Decide which events to start before starting any, since starting
     the first transaction watch creates the subscription for the others
     as well (and those should still check their receipts).  */
  std::vector<Event> toStart;
  for (const auto& ev : active)
    if (!subs.HasTag (GetSubscriptionTag (ev)))
      toStart.push_back (ev);

  if (!toStart.empty ())
    LOG (INFO) << "Restarting " << toStart.size () << " events";
  for (const auto& ev : toStart)
    StartEvent (ev);
}

void
EventDispatcher::HandleNewHead (const Json::Value& head)
{
  int64_t num;
  if (!head.isObject () || !head["number"].isString ()
        || !ParseHexInt (head["number"].asString (), num))
    {
      LOG (WARNING) << "Invalid block header received: " << head;
      return;
    }

  blockNumber = num;
  listeners.Emit ("block", static_cast<Json::Int64> (num));
}

void
EventDispatcher::HandleLog (const std::string& tag, const Json::Value& log)
{
  Json::Value formatted;
  try
    {
      formatted = formatter.FilterLog (log);
    }
  catch (const std::invalid_argument& exc)
    {
      LOG (WARNING) << "Invalid log received: " << exc.what ();
      return;
    }

  listeners.Emit (tag, formatted);
}

void
EventDispatcher::CheckReceipt (const std::string& hash)
{
  Json::Value params(Json::arrayValue);
  params.append (hash);

  sender.SendRequest ("eth_getTransactionReceipt", params,
      [this, hash] (std::exception_ptr err, const Json::Value& receipt)
        {
          HandleReceipt (hash, err, receipt);
        });
}

void
EventDispatcher::CheckAllReceipts ()
{
  std::set<std::string> hashes;
  for (const auto& ev : listeners.GetActive ())
    if (ev.GetKind () == EventKind::TX)
      hashes.insert (ev.GetHash ());

  VLOG (1) << "Checking receipts of " << hashes.size () << " transactions";
  for (const auto& h : hashes)
    {
      {
        std::lock_guard<std::mutex> lock(mutReceipts);
        if (emittedReceipts.count (h) > 0)
          continue;
      }
      CheckReceipt (h);
    }
}

void
EventDispatcher::HandleReceipt (const std::string& hash,
                                std::exception_ptr err,
                                const Json::Value& receipt)
{
  if (err != nullptr)
    {
      VLOG (1)
          << "Receipt query for " << hash << " failed: " << DescribeError (err);
      return;
    }

  if (receipt.isNull ())
    {
      VLOG (1) << "Transaction " << hash << " is not yet mined";
      return;
    }

  Json::Value formatted;
  try
    {
      formatted = formatter.Receipt (receipt);
    }
  catch (const std::invalid_argument& exc)
    {
      LOG (WARNING) << "Invalid receipt for " << hash << ": " << exc.what ();
      return;
    }

  {
    std::lock_guard<std::mutex> lock(mutReceipts);
    if (!emittedReceipts.insert (hash).second)
      return;
  }

  LOG (INFO) << "Receipt available for transaction " << hash;
  listeners.Emit (Event::Transaction (hash).GetTag (), formatted);
}

} // namespace wsrpc
