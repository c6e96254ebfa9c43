// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "httpprovider.hpp"

#include <stdexcept>

namespace wsrpc
{

HttpProvider::HttpProvider (const std::string& ep, const RpcHeaders& h,
                            const int64_t expected)
  : endpoint(ep), headers(h), expectedChainId(expected)
{}

void
HttpProvider::SetTimeout (const std::chrono::milliseconds val)
{
  std::lock_guard<std::mutex> lock(mut);
  timeout = val;
}

std::future<Json::Value>
HttpProvider::Send (const std::string& method, const Json::Value& params)
{
  std::chrono::milliseconds t;
  {
    std::lock_guard<std::mutex> lock(mut);
    t = timeout;
  }

  const std::string ep = endpoint;
  const RpcHeaders h = headers;

  return std::async (std::launch::async, [ep, h, t, method, params] ()
    {
      RpcClient rpc(ep, t, h);
      return rpc.Call (method, params);
    });
}

std::shared_future<int64_t>
HttpProvider::DetectNetwork ()
{
  const int64_t expected = expectedChainId;
  auto resp = Send ("eth_chainId", Json::Value (Json::arrayValue));

  return std::async (std::launch::async,
      [expected] (std::future<Json::Value> r)
        {
          return ParseChainId (r.get (), expected);
        },
      std::move (resp)).share ();
}

std::chrono::milliseconds
HttpProvider::GetPollingInterval () const
{
  std::lock_guard<std::mutex> lock(mut);
  return pollingInterval;
}

void
HttpProvider::SetPollingInterval (const std::chrono::milliseconds val)
{
  if (val.count () <= 0)
    throw std::invalid_argument ("invalid polling interval: "
                                   + std::to_string (val.count ()));

  std::lock_guard<std::mutex> lock(mut);
  pollingInterval = val;
}

void
HttpProvider::SetPolling (const bool val)
{
  std::lock_guard<std::mutex> lock(mut);
  polling = val;
}

void
HttpProvider::ResetEventsBlock (const int64_t blockNumber)
{
  std::lock_guard<std::mutex> lock(mut);
  eventsBlock = blockNumber;
}

bool
HttpProvider::IsPolling () const
{
  std::lock_guard<std::mutex> lock(mut);
  return polling;
}

int64_t
HttpProvider::GetEventsBlock () const
{
  std::lock_guard<std::mutex> lock(mut);
  return eventsBlock;
}

} // namespace wsrpc
