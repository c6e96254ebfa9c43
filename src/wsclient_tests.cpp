// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wsclient.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace wsrpc
{
namespace
{

using std::chrono::milliseconds;

/**
 * Transport callbacks that do nothing.
 */
class NoopCallbacks : public Transport::Callbacks
{

public:

  void OnOpen () override {}
  void OnMessage (const std::string& text) override {}
  void OnClose (const int code) override {}
  void OnError (const std::string& reason) override {}

};

using WsClientTests = testing::Test;

TEST_F (WsClientTests, TimerFires)
{
  WsClient client;

  std::promise<void> fired;
  auto timer = client.Schedule (milliseconds (10), [&fired] ()
    {
      fired.set_value ();
    });

  auto fut = fired.get_future ();
  ASSERT_EQ (fut.wait_for (std::chrono::seconds (5)),
             std::future_status::ready);

  /* Cancelling after it fired is fine.  */
  timer->Cancel ();
}

TEST_F (WsClientTests, TimersInOrder)
{
  WsClient client;

  std::atomic<unsigned> order(0);
  unsigned first = 0;
  unsigned second = 0;
  std::promise<void> done;

  auto t2 = client.Schedule (milliseconds (100), [&] ()
    {
      second = ++order;
      done.set_value ();
    });
  auto t1 = client.Schedule (milliseconds (10), [&] ()
    {
      first = ++order;
    });

  auto fut = done.get_future ();
  ASSERT_EQ (fut.wait_for (std::chrono::seconds (5)),
             std::future_status::ready);
  EXPECT_EQ (first, 1);
  EXPECT_EQ (second, 2);
}

TEST_F (WsClientTests, CancelledTimer)
{
  WsClient client;

  std::atomic<bool> fired(false);
  auto timer = client.Schedule (milliseconds (50), [&fired] ()
    {
      fired = true;
    });
  timer->Cancel ();

  std::this_thread::sleep_for (milliseconds (200));
  EXPECT_FALSE (fired);
}

TEST_F (WsClientTests, TimerCancellingItself)
{
  WsClient client;

  std::promise<void> done;
  std::shared_ptr<EventLoop::Timer> timer;
  std::mutex mut;

  {
    std::lock_guard<std::mutex> lock(mut);
    timer = client.Schedule (milliseconds (10), [&] ()
      {
        std::lock_guard<std::mutex> lock(mut);
        timer->Cancel ();
        done.set_value ();
      });
  }

  auto fut = done.get_future ();
  ASSERT_EQ (fut.wait_for (std::chrono::seconds (5)),
             std::future_status::ready);
}

TEST_F (WsClientTests, InvalidUrl)
{
  WsClient client;
  NoopCallbacks cb;

  ConnectionInfo info;
  info.url = "not a websocket url";

  auto transport = client.Create (info, cb);
  EXPECT_THROW (transport->Connect (), std::runtime_error);
  EXPECT_FALSE (transport->Send ("foo"));
}

} // anonymous namespace
} // namespace wsrpc
