// Copyright (C) 2021-2026 The Xaya developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "wsclient.hpp"

#include <websocketpp/client.hpp>
#include <websocketpp/close.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include <glog/logging.h>

#include <mutex>
#include <stdexcept>
#include <thread>

namespace wsrpc
{

namespace
{

using Config = websocketpp::config::asio_client;
using MessagePtr = Config::message_type::ptr;
using Client = websocketpp::client<Config>;

} // anonymous namespace

/* ************************************************************************** */

class WsClient::Endpoint
{

public:

  /** The websocketpp client instance.  */
  Client client;

  /** The worker thread running the networking loop.  */
  std::unique_ptr<std::thread> worker;

  Endpoint ();
  ~Endpoint ();

};

WsClient::Endpoint::Endpoint ()
{
  try
    {
      client.clear_access_channels (websocketpp::log::alevel::all);
      client.init_asio ();

      /* Keep the loop running even while there are no connections,
         so that transports and timers can be added at any time.  */
      client.start_perpetual ();
    }
  catch (const websocketpp::exception& exc)
    {
      LOG (FATAL) << "WebSocket error: " << exc.what ();
    }

  worker = std::make_unique<std::thread> ([this] ()
    {
      try
        {
          client.run ();
        }
      catch (const websocketpp::exception& exc)
        {
          LOG (FATAL) << "WebSocket error: " << exc.what ();
        }
    });
}

WsClient::Endpoint::~Endpoint ()
{
  if (worker != nullptr)
    {
      client.stop_perpetual ();
      client.stop ();
      worker->join ();
      worker.reset ();
    }
}

/* ************************************************************************** */

/**
 * Handle for a timer scheduled on the asio loop.
 */
class WsClient::AsioTimer : public EventLoop::Timer
{

public:

  /**
   * State shared between the handle and the timer handler.
   */
  struct State
  {

    /**
     * Lock held while the function runs, so that Cancel can wait for it.
     * It is recursive so that the function may cancel its own timer.
     */
    std::recursive_mutex mut;

    /** Set when cancelled or fired.  */
    bool done = false;

    /** The function to run.  */
    std::function<void ()> fn;

  };

private:

  std::shared_ptr<State> state;
  Client::timer_ptr timer;

public:

  explicit AsioTimer (std::shared_ptr<State> s, Client::timer_ptr t)
    : state(std::move (s)), timer(std::move (t))
  {}

  void
  Cancel () override
  {
    std::lock_guard<std::recursive_mutex> lock(state->mut);
    if (state->done)
      return;

    state->done = true;
    state->fn = nullptr;
    timer->cancel ();
  }

};

std::shared_ptr<EventLoop::Timer>
WsClient::Schedule (const std::chrono::milliseconds delay,
                    std::function<void ()> fn)
{
  auto state = std::make_shared<AsioTimer::State> ();
  state->fn = std::move (fn);

  auto timer = endpoint->client.set_timer (delay.count (),
      [state] (const websocketpp::lib::error_code& ec)
        {
          if (ec)
            {
              VLOG (2) << "Timer aborted: " << ec.message ();
              return;
            }

          std::lock_guard<std::recursive_mutex> lock(state->mut);
          if (state->done)
            return;
          state->done = true;

          auto fcn = std::move (state->fn);
          fcn ();
        });

  return std::make_shared<AsioTimer> (std::move (state), std::move (timer));
}

/* ************************************************************************** */

/**
 * Transport for a single WebSocket connection.
 */
class WsClient::WsTransport : public Transport
{

private:

  /**
   * The callbacks pointer shared with the websocketpp handlers.  It is
   * cleared when the transport is destructed, so that handlers still
   * queued on the loop do nothing anymore.
   */
  struct Hooks
  {

    /**
     * Lock for the pointer.  This is held while callbacks run, and is
     * recursive so that callbacks may destruct the transport.
     */
    std::recursive_mutex mut;

    Transport::Callbacks* cb;

  };

  /** The client to use.  */
  Client& client;

  /** The connection configuration.  */
  const ConnectionInfo info;

  /** The callbacks, shared with the handlers.  */
  std::shared_ptr<Hooks> hooks;

  /** Handle of the connection, once it is started.  */
  websocketpp::connection_hdl hdl;

  /**
   * Invokes a function on the callbacks, if they are still set.
   */
  template <typename Fcn>
    static void Invoke (Hooks& h, const Fcn& fcn);

public:

  explicit WsTransport (Client& c, const ConnectionInfo& i,
                        Transport::Callbacks& cb)
    : client(c), info(i), hooks(std::make_shared<Hooks> ())
  {
    hooks->cb = &cb;
  }

  ~WsTransport ();

  void Connect () override;
  bool Send (const std::string& text) override;
  void Close (int code) override;
  void Terminate () override;

};

template <typename Fcn>
  void
  WsClient::WsTransport::Invoke (Hooks& h, const Fcn& fcn)
{
  std::lock_guard<std::recursive_mutex> lock(h.mut);
  if (h.cb == nullptr)
    {
      VLOG (1) << "Ignoring event for destructed transport";
      return;
    }
  fcn (*h.cb);
}

WsClient::WsTransport::~WsTransport ()
{
  {
    std::lock_guard<std::recursive_mutex> lock(hooks->mut);
    hooks->cb = nullptr;
  }

  websocketpp::lib::error_code ec;
  auto conn = client.get_con_from_hdl (hdl, ec);
  if (ec)
    return;

  if (conn->get_state () == websocketpp::session::state::open)
    {
      client.close (hdl, websocketpp::close::status::going_away, "", ec);
      if (ec)
        VLOG (1) << "Failed to close connection: " << ec.message ();
    }
}

void
WsClient::WsTransport::Connect ()
{
  CHECK (hdl.expired ()) << "Connect called twice on a transport";

  websocketpp::lib::error_code ec;
  auto conn = client.get_connection (info.url, ec);
  if (ec)
    throw std::runtime_error ("WebSocket connection to " + info.url
                                + " failed: " + ec.message ());

  for (const auto& h : info.headers)
    conn->append_header (h.first, h.second);
  conn->set_open_handshake_timeout (info.timeout.count ());

  auto h = hooks;
  Client* c = &client;

  conn->set_open_handler (
    [h] (const websocketpp::connection_hdl)
      {
        Invoke (*h, [] (Transport::Callbacks& cb)
          {
            cb.OnOpen ();
          });
      });

  conn->set_message_handler (
    [h] (const websocketpp::connection_hdl, const MessagePtr msg)
      {
        const std::string& payload = msg->get_payload ();
        Invoke (*h, [&payload] (Transport::Callbacks& cb)
          {
            cb.OnMessage (payload);
          });
      });

  conn->set_close_handler (
    [h, c] (const websocketpp::connection_hdl hd)
      {
        const int code = c->get_con_from_hdl (hd)->get_remote_close_code ();
        Invoke (*h, [code] (Transport::Callbacks& cb)
          {
            cb.OnClose (code);
          });
      });

  conn->set_fail_handler (
    [h, c] (const websocketpp::connection_hdl hd)
      {
        const std::string reason
            = c->get_con_from_hdl (hd)->get_ec ().message ();
        Invoke (*h, [&reason] (Transport::Callbacks& cb)
          {
            cb.OnError (reason);
          });
      });

  hdl = conn->get_handle ();
  client.connect (conn);
}

bool
WsClient::WsTransport::Send (const std::string& text)
{
  websocketpp::lib::error_code ec;
  client.send (hdl, text, websocketpp::frame::opcode::text, ec);
  if (ec)
    {
      VLOG (1) << "Sending to " << info.url << " failed: " << ec.message ();
      return false;
    }

  return true;
}

void
WsClient::WsTransport::Close (const int code)
{
  websocketpp::lib::error_code ec;
  client.close (hdl, static_cast<websocketpp::close::status::value> (code),
                "", ec);
  if (ec)
    LOG (WARNING) << "Closing " << info.url << " failed: " << ec.message ();
}

void
WsClient::WsTransport::Terminate ()
{
  websocketpp::lib::error_code ec;
  auto conn = client.get_con_from_hdl (hdl, ec);
  if (ec)
    {
      LOG (WARNING)
          << "Cannot terminate connection to " << info.url
          << ": " << ec.message ();
      return;
    }

  /* This drops the socket without any close handshake.  */
  conn->terminate (websocketpp::lib::error_code ());
}

/* ************************************************************************** */

WsClient::WsClient ()
  : endpoint(std::make_unique<Endpoint> ())
{}

WsClient::~WsClient () = default;

std::unique_ptr<Transport>
WsClient::Create (const ConnectionInfo& info, Transport::Callbacks& cb)
{
  return std::make_unique<WsTransport> (endpoint->client, info, cb);
}

/* ************************************************************************** */

} // namespace wsrpc
