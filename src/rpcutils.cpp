// Copyright (C) 2023-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcutils.hpp"

#include <glog/logging.h>

namespace wsrpc
{

namespace
{

/**
 * Strips leading and trailing blanks from a header key or value.
 */
std::string
Trim (const std::string& str)
{
  const auto start = str.find_first_not_of (" \t");
  if (start == std::string::npos)
    return "";

  const auto end = str.find_last_not_of (" \t");
  return str.substr (start, end - start + 1);
}

} // anonymous namespace

RpcHeaders
ParseRpcHeaders (const std::string& str)
{
  RpcHeaders res;

  size_t pos = 0;
  while (pos < str.size ())
    {
      const size_t keyEnd = str.find ('=', pos);
      const size_t valueEnd = str.find (';', pos);
      if (keyEnd == std::string::npos || valueEnd < keyEnd)
        {
          LOG (WARNING)
              << "Ignoring invalid tail for headers: "
              << str.substr (pos);
          return res;
        }

      const std::string key = Trim (str.substr (pos, keyEnd - pos));
      const std::string value
          = Trim (str.substr (keyEnd + 1, valueEnd - keyEnd - 1));

      /* An empty header name cannot be sent in the HTTP request nor in the
         WebSocket handshake, so we just skip those.  */
      if (key.empty ())
        LOG (WARNING) << "Ignoring header without name (value: " << value << ")";
      else
        res[key] = value;

      if (valueEnd == std::string::npos)
        break;
      pos = valueEnd + 1;
    }

  return res;
}

/* ************************************************************************** */

RpcClient::RpcClient (const std::string& ep,
                      const std::chrono::milliseconds timeout,
                      const RpcHeaders& headers)
  : endpoint(ep), http(ep), rpc(http, jsonrpc::JSONRPC_CLIENT_V2)
{
  http.SetTimeout (timeout.count ());
  for (const auto& h : headers)
    http.AddHeader (h.first, h.second);
}

Json::Value
RpcClient::Call (const std::string& method, const Json::Value& params)
{
  VLOG (1) << "Calling " << method << " on " << endpoint;
  const Json::Value res = rpc.CallMethod (method, params);
  VLOG (2) << "Result of " << method << ": " << res;
  return res;
}

} // namespace wsrpc
