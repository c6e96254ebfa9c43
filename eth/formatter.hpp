// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_ETH_FORMATTER_HPP
#define WSRPC_ETH_FORMATTER_HPP

#include <json/json.h>

namespace wsrpc
{

/**
 * Normalisation of the Ethereum payloads that are passed on to listeners.
 * Hex quantities are converted to integers, and addresses are brought
 * into their checksummed form.  All methods throw std::invalid_argument
 * if the data is malformed.
 */
class Formatter
{

public:

  Formatter () = default;

  /**
   * Formats a log entry as returned from a logs subscription or
   * as part of a receipt.
   */
  Json::Value FilterLog (const Json::Value& log) const;

  /**
   * Formats a transaction receipt.
   */
  Json::Value Receipt (const Json::Value& receipt) const;

  /**
   * Normalises a log filter for a logs subscription.  Only the address
   * (or list of addresses) and topics are kept, and addresses
   * are lower-cased.
   */
  Json::Value Filter (const Json::Value& filter) const;

};

} // namespace wsrpc

#endif // WSRPC_ETH_FORMATTER_HPP
