#include "mvr/server/WebSocketServer.hpp"
#include "mvr/server/ClientSession.hpp"
#include "mvr/util/Logger.hpp"
#include "mvr/util/Metrics.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/system/system_error.hpp>

#include <vector>

namespace mvr::server {

namespace net   = boost::asio;
namespace beast = boost::beast;

WebSocketServer::WebSocketServer(net::io_context& ioc,
                                 ServiceContext* ctx,
                                 const std::string& address,
                                 unsigned short port)
  : ioc_(ioc)
  , acceptor_(net::make_strand(ioc))
  , ctx_(ctx)
{
  beast::error_code ec;
  const auto addr = net::ip::make_address(address.empty() ? "0.0.0.0" : address, ec);
  if (ec) throw boost::system::system_error(ec);
  tcp::endpoint ep{addr, port};

  acceptor_.open(ep.protocol(), ec);
  if (ec) throw boost::system::system_error(ec);

  acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) throw boost::system::system_error(ec);

  acceptor_.bind(ep, ec);
  if (ec) throw boost::system::system_error(ec);

  acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) throw boost::system::system_error(ec);

  port_ = acceptor_.local_endpoint().port();
}

void WebSocketServer::run() {
  accepting_.store(true, std::memory_order_relaxed);
  util::logger().log(util::LogLevel::Info, "server.listening", {{"port", std::to_string(port_)}});
  doAccept();
}

void WebSocketServer::doAccept() {
  if (!accepting_.load(std::memory_order_relaxed)) return;
  acceptor_.async_accept(
      net::make_strand(ioc_),
      [this](beast::error_code ec, tcp::socket socket) {
        onAccept(ec, std::move(socket));
      });
}

void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (!accepting_.load(std::memory_order_relaxed)) return;
  if (ec) {
    MVR_METRIC_HIT("server.accept_error");
    util::logger().log(util::LogLevel::Warn, "server.accept.error", {{"error", ec.message()}});
  } else {
    MVR_METRIC_HIT("server.accept");
    auto session = std::make_shared<ClientSession>(std::move(socket), this, ctx_);
    registerSession(session);
    session->run();
  }
  doAccept();
}

void WebSocketServer::registerSession(const std::shared_ptr<ClientSession>& s) {
  if (!s) return;
  std::lock_guard<std::mutex> lk(sessions_mu_);
  sessions_[s.get()] = s;
  MVR_METRIC_SET("server.sessions", static_cast<double>(sessions_.size()));
}

void WebSocketServer::unregisterSession(ClientSession* s) noexcept {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  (void)sessions_.erase(s);
  MVR_METRIC_SET("server.sessions", static_cast<double>(sessions_.size()));
}

std::size_t WebSocketServer::sessionCount() const {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  return sessions_.size();
}

void WebSocketServer::stopAccept() noexcept {
  if (!accepting_.exchange(false, std::memory_order_relaxed)) return;
  // The acceptor lives on its own strand; close it there.
  net::post(acceptor_.get_executor(), [this]{
    beast::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
  });
}

void WebSocketServer::closeAll() noexcept {
  // Snapshot so stop() runs without holding the mutex.
  std::vector<std::shared_ptr<ClientSession>> to_close;
  {
    std::lock_guard<std::mutex> lk(sessions_mu_);
    to_close.reserve(sessions_.size());
    for (auto& kv : sessions_) {
      if (auto sp = kv.second.lock()) {
        to_close.emplace_back(std::move(sp));
      }
    }
  }
  for (auto& s : to_close) s->stop();
}

} // namespace mvr::server
