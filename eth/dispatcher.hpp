// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_ETH_DISPATCHER_HPP
#define WSRPC_ETH_DISPATCHER_HPP

#include "events.hpp"
#include "formatter.hpp"

#include "requests.hpp"
#include "subscriptions.hpp"

#include <json/json.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>

namespace wsrpc
{

/**
 * Translates logical events with listeners into subscriptions on the
 * connection, and the push notifications back into emitted values.
 *
 * Block, pending and filter events each use their own subscription,
 * which is released once no listeners for the event remain.  All
 * transaction watches share a single newHeads subscription (under its
 * own "tx" tag), on which the receipts of all watched transactions are
 * checked again.  It is released only when no transaction listeners
 * remain at all.
 */
class EventDispatcher
{

private:

  /** Tag of the subscription shared by all transaction watches.  */
  static constexpr const char* TX_TAG = "tx";

  /** Where receipt queries are sent.  */
  RequestSender& sender;

  /** The subscriptions on the connection.  */
  SubscriptionRegistry& subs;

  /** The listeners that get the emitted values.  */
  EventListeners& listeners;

  /** Formatter for the emitted payloads.  */
  const Formatter& formatter;

  /** The last block number emitted, or -1 if none yet.  */
  std::atomic<int64_t> blockNumber;

  /** Lock for the set of emitted receipts.  */
  std::mutex mutReceipts;

  /**
   * Transactions for which the receipt has been emitted already.  A hash
   * is removed again when its last listener is removed.
   */
  std::set<std::string> emittedReceipts;

  /**
   * Returns the subscription tag used for an event.
   */
  static std::string GetSubscriptionTag (const Event& ev);

  /**
   * Processes a newHeads notification for block events.
   */
  void HandleNewHead (const Json::Value& head);

  /**
   * Processes a log notification for the given filter event.
   */
  void HandleLog (const std::string& tag, const Json::Value& log);

  /**
   * Processes the result of a receipt query.
   */
  void HandleReceipt (const std::string& hash, std::exception_ptr err,
                      const Json::Value& receipt);

  /**
   * Checks the receipts of all watched transactions.
   */
  void CheckAllReceipts ();

public:

  explicit EventDispatcher (RequestSender& s, SubscriptionRegistry& r,
                            EventListeners& l, const Formatter& f);

  EventDispatcher (const EventDispatcher&) = delete;
  void operator= (const EventDispatcher&) = delete;

  /**
   * Makes sure the event is being watched.  This is called whenever
   * a listener is added for it.
   */
  void StartEvent (const Event& ev);

  /**
   * Releases the subscription for an event if no listeners need it
   * anymore.  This is called after a listener for it has been removed.
   */
  void StopEvent (const Event& ev);

  /**
   * Starts again all events with listeners whose subscription is missing.
   * This is used when a new connection opens.
   */
  void RestartEvents ();

  /**
   * Queries the receipt of a transaction, and emits it to the listeners
   * if it is available and has not been emitted yet.
   */
  void CheckReceipt (const std::string& hash);

  /**
   * Returns the last block number emitted, or -1 if none has been yet.
   */
  int64_t
  GetBlockNumber () const
  {
    return blockNumber;
  }

};

} // namespace wsrpc

#endif // WSRPC_ETH_DISPATCHER_HPP
