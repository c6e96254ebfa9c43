// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_ETH_PROVIDER_HPP
#define WSRPC_ETH_PROVIDER_HPP

#include "formatter.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <stdexcept>
#include <string>

namespace wsrpc
{

/**
 * Exception thrown when an operation is called that the provider
 * does not support.
 */
class UnsupportedOperation : public std::logic_error
{

private:

  /** The operation that was rejected.  */
  std::string operation;

public:

  explicit UnsupportedOperation (const std::string& op, const std::string& msg)
    : std::logic_error(msg), operation(op)
  {}

  const std::string&
  GetOperation () const
  {
    return operation;
  }

};

/**
 * Interface for a connection to an Ethereum JSON-RPC endpoint, which is
 * implemented by both the polling HTTP and the streaming WebSocket
 * providers.
 */
class Provider
{

public:

  Provider () = default;
  virtual ~Provider () = default;

  Provider (const Provider&) = delete;
  void operator= (const Provider&) = delete;

  /**
   * Sends a request and returns the future result.  Errors returned
   * by the endpoint are thrown as jsonrpc::JsonRpcException from the
   * future's get.
   */
  virtual std::future<Json::Value> Send (const std::string& method,
                                         const Json::Value& params) = 0;

  /**
   * Returns the chain ID of the connected network.
   */
  virtual std::shared_future<int64_t> DetectNetwork () = 0;

  /**
   * Returns the formatter for payloads.
   */
  virtual const Formatter& GetFormatter () const = 0;

  /**
   * Returns the polling interval, or zero if the provider does not poll.
   */
  virtual std::chrono::milliseconds GetPollingInterval () const = 0;

  virtual void SetPollingInterval (std::chrono::milliseconds val) = 0;

  /**
   * Turns polling for events on or off.
   */
  virtual void SetPolling (bool val) = 0;

  /**
   * Sets the block from which on polling for events continues.
   */
  virtual void ResetEventsBlock (int64_t blockNumber) = 0;

};

/**
 * Parses the result of an eth_chainId call.  If expected is not negative,
 * the chain ID must match it.  Throws jsonrpc::JsonRpcException if the
 * result is invalid, and std::runtime_error on a mismatch.
 */
int64_t ParseChainId (const Json::Value& val, int64_t expected);

} // namespace wsrpc

#endif // WSRPC_ETH_PROVIDER_HPP
