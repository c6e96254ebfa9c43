// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_REQUESTS_HPP
#define WSRPC_REQUESTS_HPP

#include <json/json.h>

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace wsrpc
{

/**
 * Callback invoked exactly once when a request is finished.  If the request
 * failed, err is set and result is null.
 */
using ResponseCallback
    = std::function<void (std::exception_ptr err, const Json::Value& result)>;

/**
 * Returns a human-readable description of the exception held by err
 * (for logging).
 */
std::string DescribeError (std::exception_ptr err);

/**
 * Interface for something that can send a JSON-RPC request and invoke
 * a callback with the response.  This is implemented by the connection
 * manager and used by the higher-level pieces (subscription registry
 * and event dispatcher).
 */
class RequestSender
{

public:

  RequestSender () = default;
  virtual ~RequestSender () = default;

  /**
   * Sends a request.  This returns immediately; the callback may be
   * invoked from another thread later on (or right away, if the request
   * is rejected immediately).
   */
  virtual void SendRequest (const std::string& method, const Json::Value& params,
                            ResponseCallback cb) = 0;

};

/**
 * Keeps track of all requests that have not yet been answered, keyed by
 * their correlation ID.  The class is thread-safe, and never invokes any
 * callbacks itself while holding its lock.  Instead, finished requests are
 * returned as Completion objects, which the caller runs when it is safe.
 */
class RequestTracker
{

public:

  class Completion;

  /**
   * Data about a request just added.
   */
  struct Outbound
  {

    /** The assigned correlation ID.  */
    uint64_t id;

    /** The full request envelope.  */
    Json::Value request;

    /** The serialised envelope as it goes on the wire.  */
    std::string payload;

  };

private:

  /**
   * Data stored for a request that is not yet finished.
   */
  struct PendingRequest
  {
    Json::Value request;
    std::string payload;
    ResponseCallback cb;

    /**
     * Whether the payload has been written to a connection.  Requests
     * that were not yet sent are flushed when the next connection opens.
     */
    bool sent;
  };

  /**
   * Process-wide counter for correlation IDs.  It is never reset, so IDs
   * stay unique across reconnects and across instances.
   */
  static std::atomic<uint64_t> nextId;

  /** Lock for the map of pending requests.  */
  mutable std::mutex mut;

  /**
   * All pending requests by ID.  Since IDs are increasing, the iteration
   * order is the insertion order.
   */
  std::map<uint64_t, PendingRequest> pending;

  /**
   * Tries to extract a correlation ID from the "id" field of a response.
   * Both integers and strings with a decimal number are accepted.
   */
  static bool ParseId (const Json::Value& val, uint64_t& id);

public:

  RequestTracker () = default;

  RequestTracker (const RequestTracker&) = delete;
  void operator= (const RequestTracker&) = delete;

  /**
   * Adds a new request, assigning it the next ID.  sent specifies whether
   * or not the caller writes it to the connection right away.
   */
  Outbound Add (const std::string& method, const Json::Value& params,
                ResponseCallback cb, bool sent);

  /**
   * Processes a correlated response.  If it matches a pending request,
   * that request is removed and its completion returned in out (and true
   * is returned).  If there is no matching request, false is returned and
   * nothing changes.  raw is the frame as received, which is attached to
   * errors.
   */
  bool Resolve (const Json::Value& response, const std::string& raw,
                Completion& out);

  /**
   * Returns the payloads of all requests not yet written, in insertion
   * order, and marks them as sent.
   */
  std::vector<std::string> TakeUnsent ();

  /**
   * Removes all pending requests, returning their completions which fail
   * with a connector error and the given message.
   */
  std::vector<Completion> CancelAll (const std::string& msg);

  /**
   * Returns the number of requests that are still pending.
   */
  size_t GetNumPending () const;

  /**
   * Returns the number of pending requests that have not been written yet.
   */
  size_t GetNumUnsent () const;

};

/**
 * A finished request whose callback still needs to be invoked.
 */
class RequestTracker::Completion
{

private:

  ResponseCallback cb;
  Json::Value request;
  Json::Value result;
  std::exception_ptr error;

  friend class RequestTracker;

public:

  Completion () = default;
  Completion (Completion&&) = default;
  Completion& operator= (Completion&&) = default;

  /**
   * Invokes the request's callback.
   */
  void Run () const;

  /**
   * Returns the debug event data for the response, i.e. an object
   * with the request and either the response or error.
   */
  Json::Value GetDebugInfo () const;

};

} // namespace wsrpc

#endif // WSRPC_REQUESTS_HPP
