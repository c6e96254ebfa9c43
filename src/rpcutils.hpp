// Copyright (C) 2021-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_RPCUTILS_HPP
#define WSRPC_RPCUTILS_HPP

#include <jsonrpccpp/client.h>
#include <jsonrpccpp/client/connectors/httpclient.h>

#include <json/json.h>

#include <chrono>
#include <map>
#include <string>

namespace wsrpc
{

/** A list of headers that can be added to the requests.  */
using RpcHeaders = std::map<std::string, std::string>;

/**
 * Parses a string into a list of headers (for both HTTP and the WebSocket
 * handshake).  The format is:
 *  header1=value1;header2=value2;...
 */
RpcHeaders ParseRpcHeaders (const std::string& str);

/**
 * JSON-RPC 2.0 connection to some HTTP endpoint.  This is what the
 * polling HttpProvider uses for each request (a fresh instance every time,
 * which keeps it thread-safe).  The streaming client has its own request
 * tracking instead.
 */
class RpcClient
{

private:

  /** The endpoint, for logging.  */
  const std::string endpoint;

  jsonrpc::HttpClient http;
  jsonrpc::Client rpc;

public:

  explicit RpcClient (const std::string& ep, std::chrono::milliseconds timeout,
                      const RpcHeaders& headers);

  RpcClient (const RpcClient&) = delete;
  void operator= (const RpcClient&) = delete;

  /**
   * Performs a call and returns its result.  Errors (from the transport
   * or returned by the endpoint) are thrown as jsonrpc::JsonRpcException.
   */
  Json::Value Call (const std::string& method, const Json::Value& params);

};

} // namespace wsrpc

#endif // WSRPC_RPCUTILS_HPP
