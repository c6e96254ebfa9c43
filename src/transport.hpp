// Copyright (C) 2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef WSRPC_TRANSPORT_HPP
#define WSRPC_TRANSPORT_HPP

#include "rpcutils.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace wsrpc
{

/** Close code for a normal closure of a WebSocket.  */
constexpr int CLOSE_NORMAL = 1'000;

/**
 * Configuration of the connection to a streaming RPC endpoint.
 */
struct ConnectionInfo
{

  /** The endpoint URL, e.g. ws://localhost:8546.  */
  std::string url;

  /** Extra headers to send with the handshake.  */
  RpcHeaders headers;

  /**
   * Timeout for opening the connection.  This is also used as the
   * heartbeat window, i.e. the connection is assumed dead if nothing at all
   * has been received for this long.
   */
  std::chrono::milliseconds timeout = std::chrono::milliseconds (120'000);

  /** Whether or not to reconnect automatically when the connection fails.  */
  bool reconnect = false;

  /** Fixed delay before a reconnect attempt.  */
  std::chrono::milliseconds reconnectInterval
      = std::chrono::milliseconds (5'000);

};

/**
 * A single socket connection that carries text frames.  Instances are
 * created by a TransportFactory and are used for exactly one connection
 * attempt.  The lifecycle callbacks are invoked on the event loop thread
 * and never concurrently with each other.
 */
class Transport
{

public:

  class Callbacks;

  Transport () = default;
  virtual ~Transport () = default;

  Transport (const Transport&) = delete;
  void operator= (const Transport&) = delete;

  /**
   * Starts the connection attempt.  This returns immediately; the outcome
   * is signalled through the callbacks.  It may throw if the connection
   * cannot even be attempted (e.g. because the URL is invalid).
   */
  virtual void Connect () = 0;

  /**
   * Queues a text frame for sending.  Returns false if that failed
   * (e.g. because the connection is not open).
   */
  virtual bool Send (const std::string& text) = 0;

  /**
   * Starts a graceful close handshake with the given code.
   */
  virtual void Close (int code) = 0;

  /**
   * Drops the connection abruptly, without any close handshake.
   */
  virtual void Terminate () = 0;

};

/**
 * Lifecycle callbacks of a transport.
 */
class Transport::Callbacks
{

public:

  Callbacks () = default;
  virtual ~Callbacks () = default;

  /** The connection has been established.  */
  virtual void OnOpen () = 0;

  /** A text frame has been received.  */
  virtual void OnMessage (const std::string& text) = 0;

  /** The connection has been closed (by either side, or terminated).  */
  virtual void OnClose (int code) = 0;

  /** The connection failed (or could not be opened at all).  */
  virtual void OnError (const std::string& reason) = 0;

};

/**
 * Interface for creating transports.  The callbacks instance passed must
 * outlive the created transport.
 */
class TransportFactory
{

public:

  TransportFactory () = default;
  virtual ~TransportFactory () = default;

  virtual std::unique_ptr<Transport> Create (const ConnectionInfo& info,
                                             Transport::Callbacks& cb) = 0;

};

} // namespace wsrpc

#endif // WSRPC_TRANSPORT_HPP
