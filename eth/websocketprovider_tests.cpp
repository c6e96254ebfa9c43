// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "websocketprovider.hpp"

#include "testutils.hpp"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace wsrpc
{
namespace
{

using std::chrono::milliseconds;
using testing::ElementsAre;

class WebSocketProviderTests : public testing::Test
{

protected:

  TestEventLoop loop;
  TestTransportFactory factory;

  ConnectionInfo info;

  WebSocketProviderTests ()
  {
    info.url = "ws://localhost:8546";
    info.timeout = milliseconds (1'000);
    info.reconnect = true;
    info.reconnectInterval = milliseconds (500);
  }

  /**
   * Expects exactly one frame sent on the socket and returns it.
   */
  static Json::Value
  ExpectOneSent (TestSocket& socket)
  {
    const auto sent = socket.TakeSent ();
    CHECK_EQ (sent.size (), 1);
    return sent[0];
  }

  /**
   * Responds with a result to the given request.
   */
  static void
  Respond (TestSocket& socket, const Json::Value& request,
           const Json::Value& result)
  {
    Json::Value resp(Json::objectValue);
    resp["jsonrpc"] = "2.0";
    resp["id"] = request["id"];
    resp["result"] = result;
    socket.Receive (resp);
  }

  /**
   * Sends a push notification for a subscription.
   */
  static void
  Push (TestSocket& socket, const std::string& subId,
        const Json::Value& result)
  {
    Json::Value msg(Json::objectValue);
    msg["jsonrpc"] = "2.0";
    msg["method"] = "eth_subscription";
    msg["params"]["subscription"] = subId;
    msg["params"]["result"] = result;
    socket.Receive (msg);
  }

};

TEST_F (WebSocketProviderTests, SendAndResolve)
{
  WebSocketProvider provider(info, loop, factory);
  auto& socket = factory.GetLatest ();
  EXPECT_TRUE (socket.IsConnectCalled ());

  auto fut = provider.Send ("eth_blockNumber", Json::Value (Json::arrayValue));
  EXPECT_EQ (socket.GetNumSent (), 0);

  socket.Open ();
  const auto req = ExpectOneSent (socket);
  EXPECT_EQ (req["method"], "eth_blockNumber");
  Respond (socket, req, "0x2a");

  EXPECT_EQ (fut.get (), "0x2a");
}

TEST_F (WebSocketProviderTests, SendError)
{
  WebSocketProvider provider(info, loop, factory);
  auto& socket = factory.GetLatest ();
  socket.Open ();

  auto fut = provider.Send ("eth_foo", Json::Value (Json::arrayValue));
  const auto req = ExpectOneSent (socket);

  Json::Value resp(Json::objectValue);
  resp["jsonrpc"] = "2.0";
  resp["id"] = req["id"];
  resp["error"]["code"] = -32601;
  resp["error"]["message"] = "method not found";
  socket.Receive (resp);

  try
    {
      fut.get ();
      FAIL () << "Expected an exception";
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      EXPECT_EQ (exc.GetCode (), -32601);
    }
}

TEST_F (WebSocketProviderTests, BlockListeners)
{
  WebSocketProvider provider(info, loop, factory);
  auto& socket = factory.GetLatest ();
  socket.Open ();

  std::vector<Json::Value> blocks;
  const auto id = provider.On (Event::Block (), [&] (const Json::Value& val)
    {
      blocks.push_back (val);
    });
  EXPECT_EQ (provider.GetListenerCount (Event::Block ()), 1);

  const auto sub = ExpectOneSent (socket);
  EXPECT_EQ (sub["method"], "eth_subscribe");
  EXPECT_EQ (sub["params"], ParseJson (R"(["newHeads"])"));
  Respond (socket, sub, "0xabc");

  Push (socket, "0xabc", ParseJson (R"({"number": "0x05"})"));
  Push (socket, "0xother", ParseJson (R"({"number": "0x99"})"));
  Push (socket, "0xabc", ParseJson (R"({"number": "0x06"})"));
  EXPECT_THAT (blocks, ElementsAre (5, 6));
  EXPECT_EQ (provider.GetBlockNumber (), 6);

  EXPECT_TRUE (provider.Off (id));
  EXPECT_FALSE (provider.Off (id));
  EXPECT_EQ (provider.GetListenerCount (Event::Block ()), 0);

  const auto unsub = ExpectOneSent (socket);
  EXPECT_EQ (unsub["method"], "eth_unsubscribe");
  EXPECT_EQ (unsub["params"], ParseJson (R"(["0xabc"])"));
  Respond (socket, unsub, true);

  Push (socket, "0xabc", ParseJson (R"({"number": "0x07"})"));
  EXPECT_THAT (blocks, ElementsAre (5, 6));
}

TEST_F (WebSocketProviderTests, ResubscribeOnReconnect)
{
  WebSocketProvider provider(info, loop, factory);
  auto& first = factory.GetLatest ();
  first.Open ();

  std::vector<Json::Value> pending;
  provider.On (Event::Pending (), [&] (const Json::Value& val)
    {
      pending.push_back (val);
    });
  Respond (first, ExpectOneSent (first), "0x1");
  Push (first, "0x1", "0xtx1");

  first.Closed (1006);
  EXPECT_EQ (provider.GetState (), ConnectionState::CLOSED);
  ASSERT_EQ (factory.GetNumCreated (), 1);

  loop.AdvanceTime (milliseconds (500));
  ASSERT_EQ (factory.GetNumCreated (), 2);
  auto& second = factory.GetLatest ();
  second.Open ();

  const auto sub = ExpectOneSent (second);
  EXPECT_EQ (sub["method"], "eth_subscribe");
  EXPECT_EQ (sub["params"], ParseJson (R"(["newPendingTransactions"])"));
  Respond (second, sub, "0x2");

  /* The old subscription ID is not routed anymore.  */
  Push (second, "0x1", "0xold");
  Push (second, "0x2", "0xtx2");
  EXPECT_THAT (pending, ElementsAre ("0xtx1", "0xtx2"));
}

TEST_F (WebSocketProviderTests, ReceiptOnceAcrossReconnect)
{
  WebSocketProvider provider(info, loop, factory);
  auto& first = factory.GetLatest ();
  first.Open ();

  unsigned calls = 0;
  provider.On (Event::Transaction ("0xtx"), [&] (const Json::Value& val)
    {
      ++calls;
    });

  for (const auto& req : first.TakeSent ())
    {
      if (req["method"] == "eth_getTransactionReceipt")
        Respond (first, req, ParseJson (R"({"transactionHash": "0xtx"})"));
      else
        Respond (first, req, "0x1");
    }
  ASSERT_EQ (calls, 1);

  first.Closed (1006);
  loop.AdvanceTime (milliseconds (500));
  auto& second = factory.GetLatest ();
  second.Open ();

  /* Only the block watch is subscribed again, the receipt is
     not queried anymore.  */
  const auto sent = second.TakeSent ();
  ASSERT_EQ (sent.size (), 1);
  EXPECT_EQ (sent[0]["method"], "eth_subscribe");
  Respond (second, sent[0], "0x2");

  Push (second, "0x2", ParseJson (R"({"number": "0x10"})"));
  EXPECT_EQ (second.GetNumSent (), 0);
  EXPECT_EQ (calls, 1);
}

TEST_F (WebSocketProviderTests, DetectNetwork)
{
  WebSocketProvider provider(info, loop, factory);
  auto& socket = factory.GetLatest ();
  socket.Open ();

  auto net = provider.DetectNetwork ();
  EXPECT_EQ (net.wait_for (milliseconds (0)), std::future_status::timeout);

  const auto req = ExpectOneSent (socket);
  EXPECT_EQ (req["method"], "eth_chainId");
  Respond (socket, req, "0x89");
  ASSERT_EQ (net.wait_for (milliseconds (0)), std::future_status::ready);
  EXPECT_EQ (net.get (), 137);

  /* The result is cached.  */
  EXPECT_EQ (provider.DetectNetwork ().get (), 137);
  EXPECT_EQ (socket.GetNumSent (), 0);
}

TEST_F (WebSocketProviderTests, ExpectedNetwork)
{
  WebSocketProvider provider(info, loop, factory, "1");
  auto& socket = factory.GetLatest ();
  socket.Open ();

  auto net = provider.DetectNetwork ();
  Respond (socket, ExpectOneSent (socket), "0x1");
  EXPECT_EQ (net.get (), 1);
}

TEST_F (WebSocketProviderTests, NetworkMismatch)
{
  WebSocketProvider provider(info, loop, factory, "1");
  auto& socket = factory.GetLatest ();
  socket.Open ();

  auto net = provider.DetectNetwork ();
  Respond (socket, ExpectOneSent (socket), "0x5");
  EXPECT_THROW (net.get (), std::runtime_error);
}

TEST_F (WebSocketProviderTests, InvalidChainId)
{
  WebSocketProvider provider(info, loop, factory);
  auto& socket = factory.GetLatest ();
  socket.Open ();

  auto net = provider.DetectNetwork ();
  Respond (socket, ExpectOneSent (socket), 42);
  EXPECT_THROW (net.get (), jsonrpc::JsonRpcException);
}

TEST_F (WebSocketProviderTests, AnyNetworkUnsupported)
{
  try
    {
      WebSocketProvider provider(info, loop, factory, "any");
      FAIL () << "Expected an exception";
    }
  catch (const UnsupportedOperation& exc)
    {
      EXPECT_EQ (exc.GetOperation (), "network:any");
    }
  EXPECT_EQ (factory.GetNumCreated (), 0);

  EXPECT_THROW (WebSocketProvider (info, loop, factory, "mainnet"),
                std::invalid_argument);
}

TEST_F (WebSocketProviderTests, PollingUnsupported)
{
  WebSocketProvider provider(info, loop, factory);

  EXPECT_EQ (provider.GetPollingInterval (), milliseconds (0));
  provider.SetPolling (false);

  const auto expectOperation = [] (const std::function<void ()>& fcn,
                                   const std::string& op)
    {
      try
        {
          fcn ();
          FAIL () << "Expected an exception for " << op;
        }
      catch (const UnsupportedOperation& exc)
        {
          EXPECT_EQ (exc.GetOperation (), op);
        }
    };

  expectOperation ([&] () { provider.SetPolling (true); }, "setPolling");
  expectOperation ([&] ()
    {
      provider.SetPollingInterval (milliseconds (100));
    }, "setPollingInterval");
  expectOperation ([&] () { provider.ResetEventsBlock (10); },
                   "resetEventBlock");
}

TEST_F (WebSocketProviderTests, DestroyRejectsPending)
{
  WebSocketProvider provider(info, loop, factory);
  auto& socket = factory.GetLatest ();
  socket.Open ();

  auto pending = provider.Send ("eth_blockNumber",
                                Json::Value (Json::arrayValue));
  socket.TakeSent ();

  auto done = provider.Destroy ();
  EXPECT_EQ (socket.GetCloseCode (), CLOSE_NORMAL);
  EXPECT_THROW (pending.get (), jsonrpc::JsonRpcException);

  auto later = provider.Send ("eth_blockNumber",
                              Json::Value (Json::arrayValue));
  EXPECT_THROW (later.get (), jsonrpc::JsonRpcException);

  socket.Closed (CLOSE_NORMAL);
  done.get ();
  EXPECT_EQ (provider.GetState (), ConnectionState::CLOSED);

  /* No reconnect after destroy.  */
  loop.AdvanceTime (milliseconds (10'000));
  EXPECT_EQ (factory.GetNumCreated (), 1);
}

} // anonymous namespace
} // namespace wsrpc
