// Copyright (C) 2021-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "events.hpp"
#include "websocketprovider.hpp"

#include "private/jsonutils.hpp"
#include "rpcutils.hpp"
#include "transport.hpp"
#include "wsclient.hpp"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include <json/json.h>

#include <pthread.h>
#include <signal.h>

#include <chrono>
#include <cstdlib>
#include <future>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{

DEFINE_string (ws_url, "",
               "URL of the Ethereum WebSocket endpoint (ws://)");
DEFINE_string (ws_headers, "",
               "extra headers for the WebSocket handshake,"
               " in the form key1=value1;key2=value2");
DEFINE_int32 (ws_timeout_ms, 120'000,
              "timeout for connecting and for the connection heartbeat");

DEFINE_bool (reconnect, false,
             "whether or not to reconnect when the connection is lost");
DEFINE_int32 (reconnect_interval_ms, 5'000,
              "delay before reconnecting");

DEFINE_bool (watch_blocks, false, "whether to log new blocks");
DEFINE_bool (watch_pending, false,
             "whether to log new pending transactions");
DEFINE_string (watch_logs_address, "",
               "if set, log events emitted by the given contract");
DEFINE_string (watch_tx, "",
               "if set, log the receipt of the given transaction once mined");

DEFINE_string (call_method, "",
               "if set, call this method and print the result");
DEFINE_string (call_params, "[]",
               "JSON array of parameters for --call_method");

/**
 * Returns a listener that logs emitted values with the given name.
 */
wsrpc::EventListeners::Listener
LogListener (const std::string& name)
{
  return [name] (const Json::Value& val)
    {
      LOG (INFO) << name << ": " << wsrpc::StoreJson (val);
    };
}

/**
 * Registers the listeners requested on the command line.  Returns true
 * if there is any.
 */
bool
WatchEvents (wsrpc::WebSocketProvider& provider)
{
  bool any = false;

  if (FLAGS_watch_blocks)
    {
      provider.On (wsrpc::Event::Block (), LogListener ("block"));
      any = true;
    }

  if (FLAGS_watch_pending)
    {
      provider.On (wsrpc::Event::Pending (), LogListener ("pending"));
      any = true;
    }

  if (!FLAGS_watch_logs_address.empty ())
    {
      Json::Value filter(Json::objectValue);
      filter["address"] = FLAGS_watch_logs_address;
      const auto ev = wsrpc::Event::Logs (
          provider.GetFormatter ().Filter (filter));
      provider.On (ev, LogListener ("log"));
      any = true;
    }

  if (!FLAGS_watch_tx.empty ())
    {
      provider.On (wsrpc::Event::Transaction (FLAGS_watch_tx),
                   LogListener ("receipt"));
      any = true;
    }

  return any;
}

} // anonymous namespace

int
main (int argc, char* argv[])
{
  google::InitGoogleLogging (argv[0]);

  gflags::SetUsageMessage ("Watch an Ethereum endpoint over WebSocket");
  gflags::SetVersionString (PACKAGE_VERSION);
  gflags::ParseCommandLineFlags (&argc, &argv, true);

  /* Block the termination signals before any threads are started, so that
     only the main thread receives them (with sigwait below).  */
  sigset_t signals;
  sigemptyset (&signals);
  sigaddset (&signals, SIGINT);
  sigaddset (&signals, SIGTERM);
  CHECK_EQ (pthread_sigmask (SIG_BLOCK, &signals, nullptr), 0);

  try
    {
      if (FLAGS_ws_url.empty ())
        throw std::runtime_error ("--ws_url must be set");
      if (FLAGS_ws_timeout_ms <= 0)
        throw std::runtime_error ("--ws_timeout_ms must be positive");
      if (FLAGS_reconnect_interval_ms <= 0)
        throw std::runtime_error ("--reconnect_interval_ms must be positive");

      Json::Value params;
      std::string err;
      if (!wsrpc::TryParseJson (FLAGS_call_params, params, err)
            || !params.isArray ())
        throw std::runtime_error ("--call_params must be a JSON array");

      wsrpc::ConnectionInfo info;
      info.url = FLAGS_ws_url;
      info.headers = wsrpc::ParseRpcHeaders (FLAGS_ws_headers);
      info.timeout = std::chrono::milliseconds (FLAGS_ws_timeout_ms);
      info.reconnect = FLAGS_reconnect;
      info.reconnectInterval
          = std::chrono::milliseconds (FLAGS_reconnect_interval_ms);

      wsrpc::WsClient client;
      wsrpc::WebSocketProvider provider(info, client, client);

      if (!FLAGS_call_method.empty ())
        {
          const auto res = provider.Send (FLAGS_call_method, params).get ();
          std::cout << res << std::endl;
        }

      if (WatchEvents (provider))
        {
          int sig;
          CHECK_EQ (sigwait (&signals, &sig), 0);
          LOG (INFO) << "Received signal " << sig << ", shutting down";
        }

      auto done = provider.Destroy ();
      if (done.wait_for (info.timeout) != std::future_status::ready)
        LOG (WARNING) << "Connection did not close in time";
    }
  catch (const std::exception& exc)
    {
      std::cerr << "Error: " << exc.what () << std::endl;
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
