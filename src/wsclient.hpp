// Copyright (C) 2021-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_WSCLIENT_HPP
#define WSRPC_WSCLIENT_HPP

#include "eventloop.hpp"
#include "transport.hpp"

#include <memory>

namespace wsrpc
{

/**
 * WebSocket client based on websocketpp.  It runs the networking loop on
 * its own worker thread, which is used both for the transports it creates
 * and for timers.  Thus it serves as event loop and transport factory for
 * a ConnectionManager.
 *
 * All transports created must be destructed before the client itself.
 */
class WsClient : public EventLoop, public TransportFactory
{

private:

  class Endpoint;
  class AsioTimer;
  class WsTransport;

  /** The websocketpp endpoint with its worker thread.  */
  std::unique_ptr<Endpoint> endpoint;

public:

  /**
   * Sets up the endpoint and starts the worker thread.
   */
  WsClient ();

  /**
   * Stops the networking loop and joins the worker thread.
   */
  ~WsClient ();

  WsClient (const WsClient&) = delete;
  void operator= (const WsClient&) = delete;

  std::shared_ptr<Timer> Schedule (std::chrono::milliseconds delay,
                                   std::function<void ()> fn) override;

  std::unique_ptr<Transport> Create (const ConnectionInfo& info,
                                     Transport::Callbacks& cb) override;

};

} // namespace wsrpc

#endif // WSRPC_WSCLIENT_HPP
