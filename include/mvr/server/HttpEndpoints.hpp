// include/mvr/server/HttpEndpoints.hpp
#pragma once

#include <boost/beast/http.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace mvr::server {

namespace http = boost::beast::http;

using HttpRequest  = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

constexpr const char* kServiceName = "mvr";
constexpr const char* kWebSocketPath = "/ws";

// "*" alone allows every origin; otherwise a case-insensitive exact match.
bool originAllowed(const std::string& origin, const std::vector<std::string>& allowed);

// 3725s -> "1h2m5s"
std::string formatUptime(std::chrono::seconds s);

// Plain HTTP routes served next to the WebSocket endpoint.
class HttpEndpoints {
public:
  HttpEndpoints(std::string version,
                std::vector<std::string> allowedOrigins,
                std::chrono::steady_clock::time_point startedAt = std::chrono::steady_clock::now());

  HttpResponse handle(const HttpRequest& req) const;

  // Upgrade requests without an Origin header are accepted.
  bool upgradeAllowed(const HttpRequest& req) const;

  HttpResponse forbidden(const HttpRequest& req) const;

  const std::vector<std::string>& allowedOrigins() const { return allowedOrigins_; }

private:
  void applyCors(const HttpRequest& req, HttpResponse& res) const;
  HttpResponse json(const HttpRequest& req, const std::string& body) const;
  HttpResponse empty(const HttpRequest& req, http::status status) const;

  std::string version_;
  std::vector<std::string> allowedOrigins_;
  std::chrono::steady_clock::time_point startedAt_;
};

} // namespace mvr::server
