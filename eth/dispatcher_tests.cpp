// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dispatcher.hpp"

#include "testutils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

namespace wsrpc
{
namespace
{

using testing::ElementsAre;

/** Example address (lower-case).  */
#define ADDR "0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"
/** The example address with checksum.  */
#define ADDR_CHECKSUMMED "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"

class EventDispatcherTests : public testing::Test
{

protected:

  TestRequestSender sender;
  SubscriptionRegistry subs;
  EventListeners listeners;
  Formatter fmt;
  EventDispatcher dispatcher;

  EventDispatcherTests ()
    : subs(sender, "eth_subscribe", "eth_unsubscribe"),
      dispatcher(sender, subs, listeners, fmt)
  {}

  /**
   * Adds a listener collecting into the given vector, and starts
   * the event.  Returns the listener ID.
   */
  uint64_t
  On (const Event& ev, std::vector<Json::Value>& out)
  {
    const uint64_t id = listeners.Add (ev, [&out] (const Json::Value& val)
      {
        out.push_back (val);
      });
    dispatcher.StartEvent (ev);
    return id;
  }

  /**
   * Removes a listener and stops its event as needed.
   */
  void
  Off (const uint64_t id)
  {
    Event ev;
    ASSERT_TRUE (listeners.Remove (id, ev));
    dispatcher.StopEvent (ev);
  }

  /**
   * Delivers a push notification.
   */
  void
  Push (const std::string& subId, const Json::Value& result)
  {
    Json::Value params(Json::objectValue);
    params["subscription"] = subId;
    params["result"] = result;
    ASSERT_TRUE (subs.Deliver (params));
  }

  /**
   * Returns the indices of all requests with the given method.
   */
  std::vector<size_t>
  FindCalls (const std::string& method)
  {
    std::vector<size_t> res;
    for (size_t i = 0; i < sender.GetNumCalls (); ++i)
      if (sender.GetMethod (i) == method)
        res.push_back (i);
    return res;
  }

};

TEST_F (EventDispatcherTests, Blocks)
{
  EXPECT_EQ (dispatcher.GetBlockNumber (), -1);

  std::vector<Json::Value> a, b;
  const auto idA = On (Event::Block (), a);
  const auto idB = On (Event::Block (), b);

  ASSERT_EQ (sender.GetNumCalls (), 1);
  EXPECT_EQ (sender.GetMethod (0), "eth_subscribe");
  EXPECT_EQ (sender.GetParams (0), ParseJson (R"(["newHeads"])"));
  sender.Respond (0, "0xsub");

  Push ("0xsub", ParseJson (R"({"number": "0x10", "hash": "0xab"})"));
  Push ("0xsub", ParseJson (R"({"hash": "0xcd"})"));
  Push ("0xsub", ParseJson (R"({"number": "0x11"})"));

  EXPECT_THAT (a, ElementsAre (16, 17));
  EXPECT_THAT (b, ElementsAre (16, 17));
  EXPECT_EQ (dispatcher.GetBlockNumber (), 17);

  /* The subscription stays until the last listener is gone.  */
  Off (idA);
  EXPECT_EQ (sender.GetNumCalls (), 1);
  Off (idB);
  ASSERT_EQ (sender.GetNumCalls (), 2);
  EXPECT_EQ (sender.GetMethod (1), "eth_unsubscribe");
  EXPECT_EQ (sender.GetParams (1), ParseJson (R"(["0xsub"])"));
}

TEST_F (EventDispatcherTests, Pending)
{
  std::vector<Json::Value> out;
  const auto id = On (Event::Pending (), out);

  ASSERT_EQ (sender.GetNumCalls (), 1);
  EXPECT_EQ (sender.GetParams (0),
             ParseJson (R"(["newPendingTransactions"])"));
  sender.Respond (0, "0xsub");

  Push ("0xsub", "0xtx1");
  Push ("0xsub", "0xtx2");
  EXPECT_THAT (out, ElementsAre ("0xtx1", "0xtx2"));

  Off (id);
  EXPECT_EQ (FindCalls ("eth_unsubscribe").size (), 1);
}

TEST_F (EventDispatcherTests, Logs)
{
  const auto filter = fmt.Filter (ParseJson (R"({
    "address": ")" ADDR R"(",
    "topics": ["0x01"]
  })"));

  std::vector<Json::Value> out;
  const auto id = On (Event::Logs (filter), out);

  ASSERT_EQ (sender.GetNumCalls (), 1);
  EXPECT_EQ (sender.GetParams (0), ParseJson (R"([
    "logs",
    {"address": ")" ADDR R"(", "topics": ["0x01"]}
  ])"));
  sender.Respond (0, "0xsub");

  Push ("0xsub", ParseJson (R"({
    "address": ")" ADDR R"(",
    "blockNumber": "0x5",
    "logIndex": "0x1"
  })"));
  Push ("0xsub", ParseJson (R"({"blockNumber": "invalid"})"));
  Push ("0xsub", ParseJson (R"({"blockNumber": "0x6", "removed": true})"));

  EXPECT_THAT (out, ElementsAre (
      ParseJson (R"({
        "address": ")" ADDR_CHECKSUMMED R"(",
        "blockNumber": 5,
        "logIndex": 1,
        "removed": false
      })"),
      ParseJson (R"({"blockNumber": 6, "removed": true})")));

  Off (id);
  EXPECT_EQ (FindCalls ("eth_unsubscribe").size (), 1);
}

TEST_F (EventDispatcherTests, DifferentFiltersSeparate)
{
  std::vector<Json::Value> out1, out2;
  On (Event::Logs (ParseJson (R"({"topics": ["0x01"]})")), out1);
  On (Event::Logs (ParseJson (R"({"topics": ["0x02"]})")), out2);
  EXPECT_EQ (sender.GetNumCalls (), 2);
}

TEST_F (EventDispatcherTests, ReceiptAlreadyMined)
{
  std::vector<Json::Value> out;
  On (Event::Transaction ("0xtx"), out);

  const auto receipts = FindCalls ("eth_getTransactionReceipt");
  ASSERT_EQ (receipts.size (), 1);
  EXPECT_EQ (sender.GetParams (receipts[0]), ParseJson (R"(["0xtx"])"));

  const auto subCalls = FindCalls ("eth_subscribe");
  ASSERT_EQ (subCalls.size (), 1);
  EXPECT_EQ (sender.GetParams (subCalls[0]), ParseJson (R"(["newHeads"])"));

  sender.Respond (receipts[0], ParseJson (R"({
    "transactionHash": "0xtx",
    "blockNumber": "0x2",
    "status": "0x1"
  })"));
  EXPECT_THAT (out, ElementsAre (ParseJson (R"({
    "transactionHash": "0xtx",
    "blockNumber": 2,
    "status": 1
  })")));
}

TEST_F (EventDispatcherTests, ReceiptOnNewBlock)
{
  std::vector<Json::Value> out;
  On (Event::Transaction ("0xtx"), out);

  sender.Respond (FindCalls ("eth_getTransactionReceipt")[0],
                  Json::Value ());
  sender.Respond (FindCalls ("eth_subscribe")[0], "0xsub");
  EXPECT_THAT (out, ElementsAre ());

  /* Each new block triggers a check, until the receipt is there.  */
  Push ("0xsub", ParseJson (R"({"number": "0x1"})"));
  auto receipts = FindCalls ("eth_getTransactionReceipt");
  ASSERT_EQ (receipts.size (), 2);
  sender.Fail (receipts[1], -32000, "temporary failure");

  Push ("0xsub", ParseJson (R"({"number": "0x2"})"));
  receipts = FindCalls ("eth_getTransactionReceipt");
  ASSERT_EQ (receipts.size (), 3);
  sender.Respond (receipts[2], ParseJson (R"({"transactionHash": "0xtx"})"));
  EXPECT_THAT (out, ElementsAre (ParseJson (R"({"transactionHash": "0xtx"})")));

  /* Once emitted, no more queries are made.  */
  Push ("0xsub", ParseJson (R"({"number": "0x3"})"));
  EXPECT_EQ (FindCalls ("eth_getTransactionReceipt").size (), 3);
}

TEST_F (EventDispatcherTests, ReceiptEmittedOnce)
{
  std::vector<Json::Value> out;
  On (Event::Transaction ("0xtx"), out);
  sender.Respond (FindCalls ("eth_subscribe")[0], "0xsub");

  /* Two checks are in flight at the same time, both find the receipt.  */
  Push ("0xsub", ParseJson (R"({"number": "0x1"})"));
  const auto receipts = FindCalls ("eth_getTransactionReceipt");
  ASSERT_EQ (receipts.size (), 2);
  for (const auto r : receipts)
    sender.Respond (r, ParseJson (R"({"transactionHash": "0xtx"})"));

  EXPECT_EQ (out.size (), 1);
}

TEST_F (EventDispatcherTests, TransactionsShareSubscription)
{
  std::vector<Json::Value> out1, out2;
  const auto id1 = On (Event::Transaction ("0x1"), out1);
  const auto id2 = On (Event::Transaction ("0x2"), out2);

  const auto subCalls = FindCalls ("eth_subscribe");
  ASSERT_EQ (subCalls.size (), 1);
  sender.Respond (subCalls[0], "0xsub");

  Off (id1);
  EXPECT_EQ (FindCalls ("eth_unsubscribe").size (), 0);
  Off (id2);
  ASSERT_EQ (FindCalls ("eth_unsubscribe").size (), 1);
  EXPECT_EQ (sender.GetParams (FindCalls ("eth_unsubscribe")[0]),
             ParseJson (R"(["0xsub"])"));
}

TEST_F (EventDispatcherTests, TransactionsIndependentOfBlocks)
{
  std::vector<Json::Value> blocks, tx;
  const auto blockId = On (Event::Block (), blocks);
  On (Event::Transaction ("0xtx"), tx);

  /* Both use a newHeads subscription, but separate ones.  */
  const auto subCalls = FindCalls ("eth_subscribe");
  ASSERT_EQ (subCalls.size (), 2);
  sender.Respond (subCalls[0], "0xblocks");
  sender.Respond (subCalls[1], "0xtxsub");

  Off (blockId);
  const auto unsub = FindCalls ("eth_unsubscribe");
  ASSERT_EQ (unsub.size (), 1);
  EXPECT_EQ (sender.GetParams (unsub[0]), ParseJson (R"(["0xblocks"])"));

  /* The transaction watch still works.  */
  Push ("0xtxsub", ParseJson (R"({"number": "0x1"})"));
  EXPECT_EQ (FindCalls ("eth_getTransactionReceipt").size (), 2);
}

TEST_F (EventDispatcherTests, RestartEvents)
{
  std::vector<Json::Value> blocks, pending, tx1, tx2;
  On (Event::Block (), blocks);
  On (Event::Pending (), pending);
  On (Event::Transaction ("0x1"), tx1);
  On (Event::Transaction ("0x2"), tx2);
  EXPECT_EQ (FindCalls ("eth_subscribe").size (), 3);
  EXPECT_EQ (FindCalls ("eth_getTransactionReceipt").size (), 2);

  /* Nothing to do while all subscriptions are there.  */
  dispatcher.RestartEvents ();
  EXPECT_EQ (FindCalls ("eth_subscribe").size (), 3);

  /* After the connection is lost, everything is started again.  */
  subs.Reset ();
  dispatcher.RestartEvents ();

  const auto subCalls = FindCalls ("eth_subscribe");
  ASSERT_EQ (subCalls.size (), 6);
  EXPECT_EQ (sender.GetParams (subCalls[3]), ParseJson (R"(["newHeads"])"));
  EXPECT_EQ (sender.GetParams (subCalls[4]),
             ParseJson (R"(["newPendingTransactions"])"));
  EXPECT_EQ (sender.GetParams (subCalls[5]), ParseJson (R"(["newHeads"])"));

  /* Both transactions are checked again.  */
  EXPECT_EQ (FindCalls ("eth_getTransactionReceipt").size (), 4);

  sender.Respond (subCalls[3], "0xnew");
  Push ("0xnew", ParseJson (R"({"number": "0x20"})"));
  EXPECT_THAT (blocks, ElementsAre (32));
}

TEST_F (EventDispatcherTests, ReceiptNotRepeatedOnRestart)
{
  std::vector<Json::Value> out;
  On (Event::Transaction ("0xtx"), out);
  sender.Respond (FindCalls ("eth_subscribe")[0], "0xsub");
  sender.Respond (FindCalls ("eth_getTransactionReceipt")[0],
                  ParseJson (R"({"transactionHash": "0xtx"})"));
  ASSERT_EQ (out.size (), 1);

  subs.Reset ();
  dispatcher.RestartEvents ();

  /* The watch subscription is back, but the receipt is not queried
     (nor emitted) again.  */
  EXPECT_EQ (FindCalls ("eth_subscribe").size (), 2);
  EXPECT_EQ (FindCalls ("eth_getTransactionReceipt").size (), 1);
  EXPECT_EQ (out.size (), 1);
}

TEST_F (EventDispatcherTests, SecondListenerNoDuplicate)
{
  std::vector<Json::Value> first, second;
  const auto id1 = On (Event::Transaction ("0xtx"), first);
  sender.Respond (FindCalls ("eth_getTransactionReceipt")[0],
                  ParseJson (R"({"transactionHash": "0xtx"})"));
  ASSERT_EQ (first.size (), 1);

  const auto id2 = On (Event::Transaction ("0xtx"), second);
  EXPECT_EQ (FindCalls ("eth_getTransactionReceipt").size (), 1);
  EXPECT_EQ (first.size (), 1);
  EXPECT_TRUE (second.empty ());

  /* Once all listeners are gone, a new one gets the receipt again.  */
  Off (id1);
  Off (id2);
  std::vector<Json::Value> third;
  On (Event::Transaction ("0xtx"), third);
  const auto receipts = FindCalls ("eth_getTransactionReceipt");
  ASSERT_EQ (receipts.size (), 2);
  sender.Respond (receipts[1], ParseJson (R"({"transactionHash": "0xtx"})"));
  EXPECT_EQ (third.size (), 1);
  EXPECT_EQ (first.size (), 1);
}

} // anonymous namespace
} // namespace wsrpc
