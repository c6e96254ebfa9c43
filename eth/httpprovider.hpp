// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_ETH_HTTPPROVIDER_HPP
#define WSRPC_ETH_HTTPPROVIDER_HPP

#include "formatter.hpp"
#include "provider.hpp"

#include "rpcutils.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <future>
#include <mutex>
#include <string>

namespace wsrpc
{

/**
 * Provider that sends each request as a separate HTTP call.  It does not
 * keep a connection, and events would have to be polled for, so it
 * only holds the polling settings for them.
 */
class HttpProvider : public Provider
{

private:

  /** Default interval for polling.  */
  static constexpr std::chrono::milliseconds DEFAULT_POLLING_INTERVAL
      = std::chrono::milliseconds (4'000);

  /** The endpoint URL.  */
  const std::string endpoint;

  /** Extra headers to send with each request.  */
  const RpcHeaders headers;

  /** Expected chain ID, or -1 if any is fine.  */
  const int64_t expectedChainId;

  Formatter formatter;

  /** Lock for the mutable settings.  */
  mutable std::mutex mut;

  /** Timeout for each request.  */
  std::chrono::milliseconds timeout = std::chrono::seconds (120);

  std::chrono::milliseconds pollingInterval = DEFAULT_POLLING_INTERVAL;
  bool polling = false;
  int64_t eventsBlock = -1;

public:

  explicit HttpProvider (const std::string& ep, const RpcHeaders& h = {},
                         int64_t expected = -1);

  /**
   * Sets the timeout for requests sent from now on.
   */
  void SetTimeout (std::chrono::milliseconds val);

  /**
   * Sends the request asynchronously on a separate thread.
   */
  std::future<Json::Value> Send (const std::string& method,
                                 const Json::Value& params) override;

  /**
   * Queries the chain ID.  Each call sends a fresh request, as the
   * endpoint behind an URL may change.
   */
  std::shared_future<int64_t> DetectNetwork () override;

  const Formatter&
  GetFormatter () const override
  {
    return formatter;
  }

  std::chrono::milliseconds GetPollingInterval () const override;

  /**
   * Sets the polling interval, which must be positive.
   */
  void SetPollingInterval (std::chrono::milliseconds val) override;

  void SetPolling (bool val) override;
  void ResetEventsBlock (int64_t blockNumber) override;

  bool IsPolling () const;
  int64_t GetEventsBlock () const;

};

} // namespace wsrpc

#endif // WSRPC_ETH_HTTPPROVIDER_HPP
