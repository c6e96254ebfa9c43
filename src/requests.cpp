// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "requests.hpp"

#include "private/jsonutils.hpp"

#include <jsonrpccpp/common/errors.h>
#include <jsonrpccpp/common/exception.h>

#include <glog/logging.h>

#include <sstream>

namespace wsrpc
{

std::string
DescribeError (const std::exception_ptr err)
{
  CHECK (err != nullptr);

  try
    {
      std::rethrow_exception (err);
    }
  catch (const jsonrpc::JsonRpcException& exc)
    {
      std::ostringstream out;
      out << "error " << exc.GetCode () << ": " << exc.GetMessage ();
      return out.str ();
    }
  catch (const std::exception& exc)
    {
      return exc.what ();
    }
}

/* ************************************************************************** */

std::atomic<uint64_t> RequestTracker::nextId(1);

bool
RequestTracker::ParseId (const Json::Value& val, uint64_t& id)
{
  if (val.isUInt64 ())
    {
      id = val.asUInt64 ();
      return true;
    }

  if (!val.isString ())
    return false;

  const std::string str = val.asString ();
  if (str.empty () || str.find_first_not_of ("0123456789") != std::string::npos)
    return false;

  std::istringstream in(str);
  in >> id;
  return !in.fail ();
}

RequestTracker::Outbound
RequestTracker::Add (const std::string& method, const Json::Value& params,
                     ResponseCallback cb, const bool sent)
{
  Outbound res;
  res.id = nextId++;

  res.request = Json::Value (Json::objectValue);
  res.request["method"] = method;
  res.request["params"] = params;
  res.request["id"] = static_cast<Json::Int64> (res.id);
  res.request["jsonrpc"] = "2.0";
  res.payload = StoreJson (res.request);

  PendingRequest req;
  req.request = res.request;
  req.payload = res.payload;
  req.cb = std::move (cb);
  req.sent = sent;

  std::lock_guard<std::mutex> lock(mut);
  const auto ins = pending.emplace (res.id, std::move (req));
  CHECK (ins.second) << "Duplicate request ID " << res.id;

  VLOG (1) << "New request " << res.id << ": " << method;
  return res;
}

bool
RequestTracker::Resolve (const Json::Value& response, const std::string& raw,
                         Completion& out)
{
  uint64_t id;
  if (!ParseId (response["id"], id))
    {
      VLOG (1) << "Ignoring response with invalid ID: " << response["id"];
      return false;
    }

  PendingRequest req;
  {
    std::lock_guard<std::mutex> lock(mut);
    auto mit = pending.find (id);
    if (mit == pending.end ())
      {
        VLOG (1) << "No pending request for response ID " << id;
        return false;
      }
    req = std::move (mit->second);
    pending.erase (mit);
  }

  out.cb = std::move (req.cb);
  out.request = std::move (req.request);
  out.result = Json::Value ();
  out.error = nullptr;

  /* A null result is still a valid result (e.g. for a receipt that
     does not exist yet).  */
  if (response.isMember ("result"))
    {
      out.result = response["result"];
      return true;
    }

  const auto& err = response["error"];
  if (!err.isObject ())
    {
      out.error = std::make_exception_ptr (jsonrpc::JsonRpcException (
          jsonrpc::Errors::ERROR_CLIENT_INVALID_RESPONSE, "unknown error",
          raw));
      return true;
    }

  std::string msg;
  if (err["message"].isString ())
    msg = err["message"].asString ();
  if (msg.empty ())
    msg = "unknown error";

  int code = 0;
  if (err["code"].isInt ())
    code = err["code"].asInt ();

  out.error = std::make_exception_ptr (
      jsonrpc::JsonRpcException (code, msg, raw));
  return true;
}

std::vector<std::string>
RequestTracker::TakeUnsent ()
{
  std::lock_guard<std::mutex> lock(mut);

  std::vector<std::string> res;
  for (auto& entry : pending)
    if (!entry.second.sent)
      {
        res.push_back (entry.second.payload);
        entry.second.sent = true;
      }

  return res;
}

std::vector<RequestTracker::Completion>
RequestTracker::CancelAll (const std::string& msg)
{
  std::map<uint64_t, PendingRequest> cancelled;
  {
    std::lock_guard<std::mutex> lock(mut);
    cancelled.swap (pending);
  }

  if (!cancelled.empty ())
    LOG (INFO) << "Rejecting " << cancelled.size () << " pending requests";

  std::vector<Completion> res;
  for (auto& entry : cancelled)
    {
      Completion c;
      c.cb = std::move (entry.second.cb);
      c.request = std::move (entry.second.request);
      c.error = std::make_exception_ptr (jsonrpc::JsonRpcException (
          jsonrpc::Errors::ERROR_CLIENT_CONNECTOR, msg));
      res.push_back (std::move (c));
    }

  return res;
}

size_t
RequestTracker::GetNumPending () const
{
  std::lock_guard<std::mutex> lock(mut);
  return pending.size ();
}

size_t
RequestTracker::GetNumUnsent () const
{
  std::lock_guard<std::mutex> lock(mut);

  size_t res = 0;
  for (const auto& entry : pending)
    if (!entry.second.sent)
      ++res;

  return res;
}

/* ************************************************************************** */

void
RequestTracker::Completion::Run () const
{
  if (cb)
    cb (error, result);
}

Json::Value
RequestTracker::Completion::GetDebugInfo () const
{
  Json::Value res(Json::objectValue);
  res["action"] = "response";
  res["request"] = request;

  if (error == nullptr)
    res["response"] = result;
  else
    res["error"] = DescribeError (error);

  return res;
}

} // namespace wsrpc
