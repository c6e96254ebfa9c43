// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "formatter.hpp"

#include "hexutils.hpp"

#include <eth-utils/address.hpp>

#include <glog/logging.h>

#include <sstream>
#include <stdexcept>
#include <string>

namespace wsrpc
{

namespace
{

/**
 * Converts a hex quantity field in the given object to an integer, if the
 * field is present (and not null).
 */
void
ConvertQuantity (Json::Value& obj, const std::string& key)
{
  if (!obj.isMember (key) || obj[key].isNull ())
    return;

  const auto& val = obj[key];
  int64_t num;
  if (!val.isString () || !ParseHexInt (val.asString (), num))
    {
      std::ostringstream msg;
      msg << "invalid quantity for " << key << ": " << val;
      throw std::invalid_argument (msg.str ());
    }

  obj[key] = static_cast<Json::Int64> (num);
}

/**
 * Parses an address from JSON.
 */
ethutils::Address
ParseAddress (const Json::Value& val)
{
  if (!val.isString ())
    throw std::invalid_argument ("address is not a string");

  const ethutils::Address res(val.asString ());
  if (!res)
    throw std::invalid_argument ("invalid address: " + val.asString ());

  return res;
}

/**
 * Converts an address field to its checksummed form, if the field
 * is present and not null.
 */
void
ChecksumAddress (Json::Value& obj, const std::string& key)
{
  if (!obj.isMember (key) || obj[key].isNull ())
    return;

  obj[key] = ParseAddress (obj[key]).GetChecksummed ();
}

} // anonymous namespace

Json::Value
Formatter::FilterLog (const Json::Value& log) const
{
  if (!log.isObject ())
    throw std::invalid_argument ("log is not an object");

  Json::Value res = log;
  ConvertQuantity (res, "blockNumber");
  ConvertQuantity (res, "transactionIndex");
  ConvertQuantity (res, "logIndex");
  ChecksumAddress (res, "address");

  if (!res.isMember ("removed") || res["removed"].isNull ())
    res["removed"] = false;
  else if (!res["removed"].isBool ())
    throw std::invalid_argument ("removed flag is not a bool");

  return res;
}

Json::Value
Formatter::Receipt (const Json::Value& receipt) const
{
  if (!receipt.isObject ())
    throw std::invalid_argument ("receipt is not an object");

  Json::Value res = receipt;
  for (const auto* key : {"blockNumber", "transactionIndex", "gasUsed",
                          "cumulativeGasUsed", "status", "type"})
    ConvertQuantity (res, key);
  for (const auto* key : {"from", "to", "contractAddress"})
    ChecksumAddress (res, key);

  if (res.isMember ("logs"))
    {
      const auto& logs = res["logs"];
      if (!logs.isArray ())
        throw std::invalid_argument ("receipt logs are not an array");

      Json::Value formatted(Json::arrayValue);
      for (const auto& l : logs)
        formatted.append (FilterLog (l));
      res["logs"] = formatted;
    }

  return res;
}

Json::Value
Formatter::Filter (const Json::Value& filter) const
{
  if (!filter.isObject ())
    throw std::invalid_argument ("filter is not an object");

  Json::Value res(Json::objectValue);

  if (filter.isMember ("address") && !filter["address"].isNull ())
    {
      const auto& addr = filter["address"];
      if (addr.isArray ())
        {
          Json::Value lst(Json::arrayValue);
          for (const auto& a : addr)
            lst.append (ParseAddress (a).GetLowerCase ());
          res["address"] = lst;
        }
      else
        res["address"] = ParseAddress (addr).GetLowerCase ();
    }

  if (filter.isMember ("topics") && !filter["topics"].isNull ())
    {
      if (!filter["topics"].isArray ())
        throw std::invalid_argument ("topics are not an array");
      res["topics"] = filter["topics"];
    }

  VLOG (2) << "Normalised filter " << filter << " to " << res;
  return res;
}

} // namespace wsrpc
