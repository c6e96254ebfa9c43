// Copyright (C) 2021-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "private/jsonutils.hpp"

#include <glog/logging.h>

#include <sstream>

namespace wsrpc
{

std::string
StoreJson (const Json::Value& val)
{
  Json::StreamWriterBuilder wbuilder;
  wbuilder["commentStyle"] = "None";
  wbuilder["indentation"] = "";
  wbuilder["enableYAMLCompatibility"] = false;
  wbuilder["dropNullPlaceholders"] = false;
  wbuilder["useSpecialFloats"] = false;

  return Json::writeString (wbuilder, val);
}

bool
TryParseJson (const std::string& str, Json::Value& res, std::string& err)
{
  Json::CharReaderBuilder rbuilder;
  rbuilder["allowComments"] = false;
  rbuilder["strictRoot"] = false;
  rbuilder["failIfExtra"] = true;
  rbuilder["rejectDupKeys"] = true;

  std::istringstream in(str);
  return Json::parseFromStream (rbuilder, in, &res, &err);
}

Json::Value
LoadJson (const std::string& str)
{
  Json::Value res;
  std::string parseErrs;
  CHECK (TryParseJson (str, res, parseErrs))
      << "Invalid JSON: " << parseErrs << "\n" << str;

  return res;
}

} // namespace wsrpc
