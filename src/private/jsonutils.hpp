// Copyright (C) 2023-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_JSONUTILS_HPP
#define WSRPC_JSONUTILS_HPP

#include <json/json.h>

#include <string>

namespace wsrpc
{

/**
 * Converts a JSON value to a compact serialised string, in the way we
 * send it over the wire (and use it for canonical subscription tags).
 */
std::string StoreJson (const Json::Value& val);

/**
 * Parses JSON from a string that we constructed ourselves (e.g. with
 * StoreJson).  CHECK fails if it is invalid.
 */
Json::Value LoadJson (const std::string& str);

/**
 * Tries to parse JSON text received from a remote peer.  Returns false
 * (and leaves a description of the problem in err) if the data is not
 * valid JSON.  Unlike LoadJson, this never crashes on bad input.
 */
bool TryParseJson (const std::string& str, Json::Value& res, std::string& err);

} // namespace wsrpc

#endif // WSRPC_JSONUTILS_HPP
