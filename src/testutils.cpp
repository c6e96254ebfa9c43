// Copyright (C) 2021-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "testutils.hpp"

#include "private/jsonutils.hpp"

#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

#include <atomic>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace wsrpc
{

Json::Value
ParseJson (const std::string& str)
{
  std::istringstream in(str);
  Json::Value res;
  in >> res;
  return res;
}

void
SleepSome ()
{
  std::this_thread::sleep_for (std::chrono::milliseconds (10));
}

/* ************************************************************************** */

class TestEventLoop::TestTimer : public EventLoop::Timer
{

private:

  std::atomic<bool> cancelled;

public:

  TestTimer ()
    : cancelled(false)
  {}

  void
  Cancel () override
  {
    cancelled = true;
  }

  bool
  IsCancelled () const
  {
    return cancelled;
  }

};

std::shared_ptr<EventLoop::Timer>
TestEventLoop::Schedule (const std::chrono::milliseconds delay,
                         std::function<void ()> fn)
{
  std::lock_guard<std::mutex> lock(mut);

  Entry e;
  e.timer = std::make_shared<TestTimer> ();
  e.fn = std::move (fn);

  auto res = e.timer;
  timers.emplace (std::make_pair (now + delay, nextSeq++), std::move (e));

  return res;
}

void
TestEventLoop::AdvanceTime (const std::chrono::milliseconds delta)
{
  std::unique_lock<std::mutex> lock(mut);
  const auto target = now + delta;

  while (true)
    {
      auto mit = timers.begin ();
      if (mit == timers.end () || mit->first.first > target)
        break;

      Entry e = std::move (mit->second);
      now = mit->first.first;
      timers.erase (mit);

      if (e.timer->IsCancelled ())
        continue;

      /* The timer function may schedule new timers (or cancel them),
         so it must run without our lock held.  */
      lock.unlock ();
      e.fn ();
      lock.lock ();
    }

  now = target;
}

std::chrono::milliseconds
TestEventLoop::GetTime ()
{
  std::lock_guard<std::mutex> lock(mut);
  return now;
}

size_t
TestEventLoop::GetNumScheduled ()
{
  std::lock_guard<std::mutex> lock(mut);

  size_t res = 0;
  for (const auto& entry : timers)
    if (!entry.second.timer->IsCancelled ())
      ++res;

  return res;
}

/* ************************************************************************** */

/**
 * The actual transport handle given out to the code under test.  It
 * just forwards everything to the TestSocket.
 */
class TestSocket::Handle : public Transport
{

private:

  std::shared_ptr<TestSocket> socket;

  /** Whether Connect should throw.  */
  const bool failConnect;

public:

  explicit Handle (std::shared_ptr<TestSocket> s, const bool f)
    : socket(std::move (s)), failConnect(f)
  {}

  ~Handle ()
  {
    socket->cb = nullptr;
  }

  void
  Connect () override
  {
    CHECK (!socket->connectCalled) << "Connect called twice";
    socket->connectCalled = true;
    if (failConnect)
      throw std::runtime_error ("connection failed immediately");
  }

  bool
  Send (const std::string& text) override
  {
    if (!socket->open)
      return false;
    socket->sent.push_back (text);
    return true;
  }

  void
  Close (const int code) override
  {
    socket->closeCode = code;
  }

  void
  Terminate () override
  {
    socket->terminated = true;
    socket->open = false;
  }

};

Transport::Callbacks&
TestSocket::GetCallbacks ()
{
  CHECK (cb != nullptr) << "Transport handle has already been destroyed";
  return *cb;
}

void
TestSocket::Open ()
{
  CHECK (connectCalled);
  open = true;
  GetCallbacks ().OnOpen ();
}

void
TestSocket::Receive (const std::string& text)
{
  GetCallbacks ().OnMessage (text);
}

void
TestSocket::Receive (const Json::Value& val)
{
  Receive (StoreJson (val));
}

void
TestSocket::Closed (const int code)
{
  open = false;
  GetCallbacks ().OnClose (code);
}

void
TestSocket::Fail (const std::string& reason)
{
  open = false;
  GetCallbacks ().OnError (reason);
}

std::vector<Json::Value>
TestSocket::TakeSent ()
{
  std::vector<Json::Value> res;
  for (const auto& s : sent)
    res.push_back (LoadJson (s));
  sent.clear ();
  return res;
}

size_t
TestSocket::GetNumSent () const
{
  return sent.size ();
}

std::unique_ptr<Transport>
TestTransportFactory::Create (const ConnectionInfo& info,
                              Transport::Callbacks& cb)
{
  auto socket = std::make_shared<TestSocket> (info, cb);
  sockets.push_back (socket);

  return std::make_unique<TestSocket::Handle> (socket, failConnect);
}

TestSocket&
TestTransportFactory::Get (const size_t n)
{
  CHECK_LT (n, sockets.size ());
  return *sockets[n];
}

TestSocket&
TestTransportFactory::GetLatest ()
{
  CHECK (!sockets.empty ());
  return *sockets.back ();
}

/* ************************************************************************** */

void
TestRequestSender::SendRequest (const std::string& method,
                                const Json::Value& params,
                                ResponseCallback cb)
{
  std::lock_guard<std::mutex> lock(mut);

  Call c;
  c.method = method;
  c.params = params;
  c.cb = std::move (cb);
  calls.push_back (std::move (c));
}

size_t
TestRequestSender::GetNumCalls ()
{
  std::lock_guard<std::mutex> lock(mut);
  return calls.size ();
}

std::string
TestRequestSender::GetMethod (const size_t n)
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK_LT (n, calls.size ());
  return calls[n].method;
}

Json::Value
TestRequestSender::GetParams (const size_t n)
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK_LT (n, calls.size ());
  return calls[n].params;
}

bool
TestRequestSender::IsDone (const size_t n)
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK_LT (n, calls.size ());
  return calls[n].done;
}

ResponseCallback
TestRequestSender::Finish (const size_t n)
{
  std::lock_guard<std::mutex> lock(mut);
  CHECK_LT (n, calls.size ());
  CHECK (!calls[n].done) << "Request " << n << " is already answered";
  calls[n].done = true;
  return calls[n].cb;
}

void
TestRequestSender::Respond (const size_t n, const Json::Value& result)
{
  const auto cb = Finish (n);
  if (cb)
    cb (nullptr, result);
}

void
TestRequestSender::Fail (const size_t n, const int code, const std::string& msg)
{
  const auto cb = Finish (n);
  if (cb)
    cb (std::make_exception_ptr (jsonrpc::JsonRpcException (code, msg)),
        Json::Value ());
}

/* ************************************************************************** */

} // namespace wsrpc
