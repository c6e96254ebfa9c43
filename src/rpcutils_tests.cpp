// Copyright (C) 2023-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "rpcutils.hpp"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <gtest/gtest.h>

#include <chrono>

namespace wsrpc
{
namespace
{

class ParseRpcHeadersTests : public testing::Test
{

protected:

  /**
   * Parses a string and expects the given elements.
   */
  static void
  Expect (const std::string& str, const RpcHeaders& expected)
  {
    EXPECT_EQ (ParseRpcHeaders (str), expected);
  }

};

TEST_F (ParseRpcHeadersTests, EmptyString)
{
  Expect ("", {});
}

TEST_F (ParseRpcHeadersTests, SingleElement)
{
  Expect ("Authorization=Bearer xyz", {{"Authorization", "Bearer xyz"}});
}

TEST_F (ParseRpcHeadersTests, MultipleElements)
{
  Expect ("1=4;abc=xyz;foo=bar", {{"1", "4"}, {"abc", "xyz"}, {"foo", "bar"}});
}

TEST_F (ParseRpcHeadersTests, TrailingSeparator)
{
  Expect ("abc=xyz;", {{"abc", "xyz"}});
}

TEST_F (ParseRpcHeadersTests, BlanksAreTrimmed)
{
  Expect (" abc = xyz ; foo=\tbar", {{"abc", "xyz"}, {"foo", "bar"}});
}

TEST_F (ParseRpcHeadersTests, EmptyKeyIgnored)
{
  Expect ("=abc", {});
  Expect ("=abc;foo=bar", {{"foo", "bar"}});
  Expect ("abc=", {{"abc", ""}});
}

TEST_F (ParseRpcHeadersTests, LaterValueOverrides)
{
  Expect ("abc=1;abc=2", {{"abc", "2"}});
}

TEST_F (ParseRpcHeadersTests, InvalidTailIgnored)
{
  Expect ("abc=xyz;foo", {{"abc", "xyz"}});
  Expect ("abc=xyz;foo;1=2", {{"abc", "xyz"}});
}

using RpcClientTests = testing::Test;

TEST_F (RpcClientTests, ConnectionFailure)
{
  RpcClient rpc("http://localhost:1", std::chrono::seconds (1),
                {{"Authorization", "Bearer xyz"}});

  try
    {
      rpc.Call ("eth_chainId", Json::Value (Json::arrayValue));
      FAIL () << "Expected an exception";
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      EXPECT_EQ (exc.GetCode (), jsonrpc::Errors::ERROR_CLIENT_CONNECTOR);
    }
}

} // anonymous namespace
} // namespace wsrpc
