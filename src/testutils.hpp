// Copyright (C) 2021-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_TESTUTILS_HPP
#define WSRPC_TESTUTILS_HPP

#include "eventloop.hpp"
#include "requests.hpp"
#include "transport.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace wsrpc
{

/**
 * Parses a string as JSON, for use in testing when JSON values are needed.
 */
Json::Value ParseJson (const std::string& str);

/**
 * Sleeps for a short amount of time (but enough to trigger other threads).
 */
void SleepSome ();

/**
 * Event loop with virtual time.  Timers are only run when the test
 * advances the time explicitly, and they run on the calling thread.
 */
class TestEventLoop : public EventLoop
{

private:

  class TestTimer;

  /**
   * A scheduled timer.  Entries are ordered by due time, and by the order
   * in which they were scheduled for the same due time.
   */
  struct Entry
  {
    std::shared_ptr<TestTimer> timer;
    std::function<void ()> fn;
  };

  /** Lock for this instance.  */
  std::mutex mut;

  /** The current virtual time.  */
  std::chrono::milliseconds now{0};

  /** Sequence number for ordering timers with the same due time.  */
  uint64_t nextSeq = 0;

  /** All scheduled timers by (due time, sequence number).  */
  std::map<std::pair<std::chrono::milliseconds, uint64_t>, Entry> timers;

public:

  TestEventLoop () = default;

  std::shared_ptr<Timer> Schedule (std::chrono::milliseconds delay,
                                   std::function<void ()> fn) override;

  /**
   * Advances the virtual time by the given duration, running all timers
   * that become due in the mean time (in order).
   */
  void AdvanceTime (std::chrono::milliseconds delta);

  /**
   * Returns the current virtual time.
   */
  std::chrono::milliseconds GetTime ();

  /**
   * Returns the number of timers that are scheduled and not cancelled.
   */
  size_t GetNumScheduled ();

};

/**
 * A fake socket that can be driven by tests.  It records everything
 * the code under test does with its transport handle, and allows the
 * test to inject the transport lifecycle events.
 */
class TestSocket
{

private:

  class Handle;

  /** The callbacks of the transport handle, or null if it is destroyed.  */
  Transport::Callbacks* cb;

  /** The connection info passed to the factory.  */
  const ConnectionInfo info;

  /** Whether Connect has been called.  */
  bool connectCalled = false;

  /** Whether the socket is currently open.  */
  bool open = false;

  /** The close code requested by the handle (or -1 if none).  */
  int closeCode = -1;

  /** Whether the handle terminated the connection.  */
  bool terminated = false;

  /** All frames sent so far and not yet taken by the test.  */
  std::vector<std::string> sent;

  /** Returns the callbacks, CHECK-failing if the handle is gone.  */
  Transport::Callbacks& GetCallbacks ();

  friend class TestTransportFactory;

public:

  explicit TestSocket (const ConnectionInfo& i, Transport::Callbacks& c)
    : cb(&c), info(i)
  {}

  TestSocket (const TestSocket&) = delete;
  void operator= (const TestSocket&) = delete;

  /** Signals that the connection is open.  */
  void Open ();

  /** Delivers a text frame.  */
  void Receive (const std::string& text);

  /** Delivers a JSON value as frame.  */
  void Receive (const Json::Value& val);

  /** Signals that the connection got closed with the given code.  */
  void Closed (int code);

  /** Signals an error.  */
  void Fail (const std::string& reason);

  /**
   * Returns all frames sent since the last call (parsed as JSON) and
   * clears the list.
   */
  std::vector<Json::Value> TakeSent ();

  /** Returns the number of frames sent and not yet taken.  */
  size_t GetNumSent () const;

  const ConnectionInfo&
  GetInfo () const
  {
    return info;
  }

  bool
  IsConnectCalled () const
  {
    return connectCalled;
  }

  bool
  IsOpen () const
  {
    return open;
  }

  int
  GetCloseCode () const
  {
    return closeCode;
  }

  bool
  IsTerminated () const
  {
    return terminated;
  }

  /** Returns true if the transport handle has been destroyed.  */
  bool
  IsDestroyed () const
  {
    return cb == nullptr;
  }

};

/**
 * Transport factory creating TestSocket instances.
 */
class TestTransportFactory : public TransportFactory
{

private:

  /** All sockets created so far.  */
  std::vector<std::shared_ptr<TestSocket>> sockets;

  /** If set, Connect on new transports throws.  */
  bool failConnect = false;

public:

  TestTransportFactory () = default;

  std::unique_ptr<Transport> Create (const ConnectionInfo& info,
                                     Transport::Callbacks& cb) override;

  /**
   * Makes Connect on all transports created from now on throw
   * (or not, if false is passed).
   */
  void
  SetFailConnect (const bool val)
  {
    failConnect = val;
  }

  size_t
  GetNumCreated () const
  {
    return sockets.size ();
  }

  /** Returns the n-th created socket.  */
  TestSocket& Get (size_t n);

  /** Returns the latest created socket.  */
  TestSocket& GetLatest ();

};

/**
 * RequestSender that just records the requests, and lets the test
 * respond to them explicitly.
 */
class TestRequestSender : public RequestSender
{

private:

  /**
   * Data about a received request.
   */
  struct Call
  {
    std::string method;
    Json::Value params;
    ResponseCallback cb;
    bool done = false;
  };

  /** Lock for this instance.  */
  std::mutex mut;

  /** All requests received.  */
  std::vector<Call> calls;

  /**
   * Marks a call as done and returns its callback.
   */
  ResponseCallback Finish (size_t n);

public:

  TestRequestSender () = default;

  void SendRequest (const std::string& method, const Json::Value& params,
                    ResponseCallback cb) override;

  /** Returns the number of requests received so far.  */
  size_t GetNumCalls ();

  /** Returns the method of the n-th request.  */
  std::string GetMethod (size_t n);

  /** Returns the params of the n-th request.  */
  Json::Value GetParams (size_t n);

  /** Returns whether the n-th request has been answered.  */
  bool IsDone (size_t n);

  /** Responds to the n-th request with a result.  */
  void Respond (size_t n, const Json::Value& result);

  /** Responds to the n-th request with an error.  */
  void Fail (size_t n, int code, const std::string& msg);

};

} // namespace wsrpc

#endif // WSRPC_TESTUTILS_HPP
