// Copyright (C) 2021-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hexutils.hpp"

#include <eth-utils/abi.hpp>

#include <glog/logging.h>

#include <cctype>

namespace wsrpc
{

bool
ParseHexInt (const std::string& str, int64_t& res)
{
  if (str.size () < 3 || str.substr (0, 2) != "0x")
    {
      VLOG (1) << "Missing 0x prefix or digits in quantity: " << str;
      return false;
    }

  /* AbiDecoder::ParseInt CHECK-fails on anything it can not round-trip,
     so we validate the input here (and normalise it to lower case)
     before handing it over.  */
  std::string digits = str.substr (2);
  for (auto& c : digits)
    {
      if (!std::isxdigit (static_cast<unsigned char> (c)))
        {
          VLOG (1) << "Invalid hex digit in quantity: " << str;
          return false;
        }
      c = std::tolower (static_cast<unsigned char> (c));
    }

  const size_t start = digits.find_first_not_of ('0');
  if (start != std::string::npos)
    {
      const size_t len = digits.size () - start;
      if (len > 16 || (len == 16 && digits[start] > '7'))
        {
          VLOG (1) << "Quantity is too large: " << str;
          return false;
        }
    }

  res = ethutils::AbiDecoder::ParseInt ("0x" + digits);
  return true;
}

} // namespace wsrpc
