#include "mvr/server/ClientSession.hpp"
#include "mvr/server/WebSocketServer.hpp"
#include "mvr/ServiceContext.hpp"
#include "mvr/util/Logger.hpp"
#include "mvr/util/Metrics.hpp"
#include "mvr/ws/JsonCodec.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>

#include <chrono>

namespace mvr::server {

namespace net       = boost::asio;
namespace beast     = boost::beast;
namespace websocket = boost::beast::websocket;

namespace {

std::string targetPath(const HttpRequest& req) {
  const auto t = req.target();
  std::string path(t.data(), t.size());
  const auto q = path.find('?');
  if (q != std::string::npos) path.resize(q);
  return path;
}

} // namespace

ClientSession::ClientSession(tcp::socket socket, WebSocketServer* server, ServiceContext* ctx)
  : server_(server)
  , ctx_(ctx)
  , ws_(std::move(socket))
{}

void ClientSession::run() {
  // Hop onto the socket's strand before touching the stream.
  net::dispatch(ws_.get_executor(), [self = shared_from_this()]{ self->doReadHttp(); });
}

void ClientSession::doReadHttp() {
  req_ = {};
  beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
  http::async_read(ws_.next_layer(), buffer_, req_,
      [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->onReadHttp(ec, bytes);
      });
}

void ClientSession::onReadHttp(beast::error_code ec, std::size_t) {
  if (ec == http::error::end_of_stream) {
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
    finish("http.eof");
    return;
  }
  if (ec) {
    finish("http.read", ec);
    return;
  }

  if (!websocket::is_upgrade(req_)) {
    MVR_METRIC_HIT("http.request");
    writeHttp(ctx_->http()->handle(req_));
    return;
  }

  if (targetPath(req_) != kWebSocketPath) {
    HttpResponse res{http::status::not_found, req_.version()};
    res.keep_alive(false);
    res.prepare_payload();
    writeHttp(std::move(res));
    return;
  }

  if (!ctx_->http()->upgradeAllowed(req_)) {
    MVR_METRIC_HIT("ws.upgrade.forbidden");
    const auto origin = req_[http::field::origin];
    util::logger().log(util::LogLevel::Warn, "ws.upgrade.forbidden",
                       {{"origin", std::string(origin.data(), origin.size())}});
    HttpResponse res = ctx_->http()->forbidden(req_);
    res.keep_alive(false);
    writeHttp(std::move(res));
    return;
  }

  startWebSocket();
}

void ClientSession::writeHttp(HttpResponse res) {
  auto sp = std::make_shared<HttpResponse>(std::move(res));
  http::async_write(ws_.next_layer(), *sp,
      [self = shared_from_this(), sp](beast::error_code ec, std::size_t) {
        if (ec) {
          self->finish("http.write", ec);
          return;
        }
        if (sp->need_eof()) {
          beast::error_code ignored;
          beast::get_lowest_layer(self->ws_).socket().shutdown(tcp::socket::shutdown_send, ignored);
          self->finish("http.done");
          return;
        }
        self->doReadHttp();
      });
}

void ClientSession::startWebSocket() {
  const auto cookie = req_[http::field::cookie];
  const auto resolved = ctx_->sessions()->resolveId(
      session::SessionManager::cookieValue(std::string(cookie.data(), cookie.size())));
  sessionId_ = resolved.id;
  newSession_ = resolved.created;

  beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

  const std::string setCookie = newSession_ ? session::SessionManager::setCookieHeader(sessionId_) : std::string{};
  ws_.set_option(websocket::stream_base::decorator(
      [setCookie](websocket::response_type& res) {
        res.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " " + kServiceName);
        if (!setCookie.empty()) res.set(http::field::set_cookie, setCookie);
      }));

  ws_.async_accept(req_,
      [self = shared_from_this()](beast::error_code ec) {
        self->onAccept(ec);
      });
}

void ClientSession::onAccept(beast::error_code ec) {
  if (ec) {
    finish("ws.accept", ec);
    return;
  }
  wsOpen_ = true;
  MVR_METRIC_HIT("ws.session.open");
  util::logger().log(util::LogLevel::Info, "ws.session.open",
                     {{"session", sessionId_}, {"new", newSession_ ? "true" : "false"}});
  doRead();
}

void ClientSession::doRead() {
  ws_.async_read(buffer_,
      [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->onRead(ec, bytes);
      });
}

void ClientSession::onRead(beast::error_code ec, std::size_t) {
  if (ec == websocket::error::closed) {
    finish("ws.closed");
    return;
  }
  if (ec) {
    finish("ws.read", ec);
    return;
  }

  const std::string text = beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  MVR_METRIC_HIT("ws.msg_in");

  auto decoded = std::make_shared<ws::RequestRouter::Decoded>(ws::RequestRouter::decode(text));

  std::weak_ptr<ClientSession> weak = shared_from_this();
  const auto ticket = pending_.add(decoded->requestId, [weak](const std::string& out) {
    if (auto self = weak.lock()) self->writeText(out);
  });

  auto self = shared_from_this();
  const bool queued = ctx_->pool()->post([self, ticket, decoded] {
    std::string response = self->ctx_->router()->dispatch(self->sessionId_, *decoded);
    net::post(self->ws_.get_executor(), [self, ticket, response = std::move(response)] {
      self->onResponse(ticket, response);
    });
  });
  if (!queued) {
    onResponse(ticket, ws::errorResponse(decoded->requestId, "server shutting down"));
  }
}

void ClientSession::onResponse(ws::PendingRequests::Ticket ticket, const std::string& text) {
  if (!pending_.resolve(ticket, text)) {
    // The connection went away while the request was being served.
    MVR_METRIC_HIT("ws.response.dropped");
  }
}

void ClientSession::writeText(const std::string& text) {
  if (!wsOpen_) return;
  out_ = text;
  ws_.text(true);
  ws_.async_write(net::buffer(out_),
      [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
        self->onWrite(ec, bytes);
      });
}

void ClientSession::onWrite(beast::error_code ec, std::size_t) {
  if (ec) {
    finish("ws.write", ec);
    return;
  }
  MVR_METRIC_HIT("ws.msg_out");
  doRead();
}

void ClientSession::stop() noexcept {
  net::post(ws_.get_executor(), [self = shared_from_this()] {
    if (self->finished_) return;
    if (!self->wsOpen_) {
      beast::get_lowest_layer(self->ws_).close();
      return;
    }
    self->wsOpen_ = false;
    websocket::close_reason cr;
    cr.code   = websocket::close_code::going_away;
    cr.reason = "server shutdown";
    self->ws_.async_close(cr, [self](beast::error_code ec) {
      self->finish("ws.stop", ec);
    });
  });
}

void ClientSession::finish(const char* reason, beast::error_code ec) {
  if (finished_) return;
  finished_ = true;
  wsOpen_ = false;

  const std::size_t dropped = pending_.clear();
  const auto level = (ec && ec != net::error::operation_aborted) ? util::LogLevel::Warn : util::LogLevel::Debug;
  util::logger().log(level, "session.closed", {
    {"session", sessionId_},
    {"reason", reason},
    {"error", ec ? ec.message() : std::string{}},
    {"dropped", std::to_string(dropped)}
  });
  if (server_) server_->unregisterSession(this);
}

} // namespace mvr::server
