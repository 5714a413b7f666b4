#pragma once
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "mvr/server/HttpEndpoints.hpp"
#include "mvr/ws/PendingRequests.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace mvr {

class ServiceContext;

namespace server {

class WebSocketServer;

// One accepted TCP connection. Starts in HTTP mode: plain requests are answered
// by HttpEndpoints, an upgrade on /ws switches the connection to WebSocket
// mode. In WebSocket mode exactly one request is in flight: the next frame is
// read only after the previous response was written.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
  using tcp = boost::asio::ip::tcp;
  using Ws  = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  ClientSession(tcp::socket socket, WebSocketServer* server, ServiceContext* ctx);

  void run();

  // Close politely (idempotent). Safe from any thread.
  void stop() noexcept;

  // Valid once the upgrade was accepted.
  const std::string& sessionId() const { return sessionId_; }

private:
  void doReadHttp();
  void onReadHttp(boost::beast::error_code ec, std::size_t bytes);
  void writeHttp(HttpResponse res);
  void startWebSocket();
  void onAccept(boost::beast::error_code ec);

  void doRead();
  void onRead(boost::beast::error_code ec, std::size_t bytes);
  void onResponse(ws::PendingRequests::Ticket ticket, const std::string& text);
  void writeText(const std::string& text);
  void onWrite(boost::beast::error_code ec, std::size_t bytes);

  void finish(const char* reason, boost::beast::error_code ec = {});

  WebSocketServer* server_{nullptr};   // not owned
  ServiceContext*  ctx_{nullptr};      // not owned

  Ws ws_;
  boost::beast::flat_buffer buffer_;
  HttpRequest req_;
  std::string out_;

  ws::PendingRequests pending_;
  std::string sessionId_;
  bool newSession_{false};

  std::atomic<bool> wsOpen_{false};
  bool finished_{false};
};

} // namespace server
} // namespace mvr
