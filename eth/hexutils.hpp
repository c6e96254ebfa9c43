// Copyright (C) 2021-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_ETH_HEXUTILS_HPP
#define WSRPC_ETH_HEXUTILS_HPP

#include <cstdint>
#include <string>

namespace wsrpc
{

/**
 * Parses a hex-encoded quantity with 0x prefix as returned by the Ethereum
 * RPC interface (e.g. "0x1b4").  Returns false if the string is not a valid
 * quantity or does not fit into int64_t.
 */
bool ParseHexInt (const std::string& str, int64_t& res);

} // namespace wsrpc

#endif // WSRPC_ETH_HEXUTILS_HPP
