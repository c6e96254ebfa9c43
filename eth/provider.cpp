// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "provider.hpp"

#include "hexutils.hpp"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

#include <sstream>
#include <stdexcept>

namespace wsrpc
{

int64_t
ParseChainId (const Json::Value& val, const int64_t expected)
{
  int64_t chainId;
  if (!val.isString () || !ParseHexInt (val.asString (), chainId))
    {
      std::ostringstream msg;
      msg << "invalid chain ID: " << val;
      throw jsonrpc::JsonRpcException (
          jsonrpc::Errors::ERROR_CLIENT_INVALID_RESPONSE, msg.str ());
    }

  if (expected >= 0 && chainId != expected)
    {
      std::ostringstream msg;
      msg << "network mismatch: expected chain " << expected
          << ", but the endpoint is on chain " << chainId;
      throw std::runtime_error (msg.str ());
    }

  LOG (INFO) << "Detected network with chain ID " << chainId;
  return chainId;
}

} // namespace wsrpc
