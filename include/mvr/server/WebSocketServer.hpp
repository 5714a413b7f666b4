#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mvr {

class ServiceContext;

namespace server {

class ClientSession;

class WebSocketServer {
public:
  using tcp = boost::asio::ip::tcp;

  // Binds immediately; throws boost::system::system_error when the address
  // cannot be bound. Port 0 picks a free port (see localPort()).
  WebSocketServer(boost::asio::io_context& ioc,
                  ServiceContext* ctx,
                  const std::string& address,
                  unsigned short port);

  void run();

  // Stop accepting new connections (idempotent).
  void stopAccept() noexcept;

  // Ask every live session to close.
  void closeAll() noexcept;

  unsigned short localPort() const { return port_; }
  std::size_t sessionCount() const;

  void registerSession(const std::shared_ptr<ClientSession>& s);
  void unregisterSession(ClientSession* s) noexcept;

private:
  void doAccept();
  void onAccept(boost::beast::error_code ec, tcp::socket socket);

  boost::asio::io_context& ioc_;
  tcp::acceptor acceptor_;        // bound to a strand of ioc_
  ServiceContext* ctx_{nullptr};  // not owned
  unsigned short port_{0};
  std::atomic<bool> accepting_{false};

  mutable std::mutex sessions_mu_;
  std::unordered_map<ClientSession*, std::weak_ptr<ClientSession>> sessions_;
};

} // namespace server
} // namespace mvr
