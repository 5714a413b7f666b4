#include "mvr/server/HttpEndpoints.hpp"
#include "mvr/util/TimeUtil.hpp"

#include <boost/beast/version.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cctype>

namespace mvr::server {

namespace {

bool iequals(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string originOf(const HttpRequest& req) {
  auto it = req.find(http::field::origin);
  if (it == req.end()) return {};
  const auto v = it->value();
  return std::string(v.data(), v.size());
}

std::string pathOf(const HttpRequest& req) {
  const auto t = req.target();
  std::string target(t.data(), t.size());
  const auto q = target.find('?');
  if (q != std::string::npos) target.resize(q);
  return target;
}

} // namespace

bool originAllowed(const std::string& origin, const std::vector<std::string>& allowed) {
  if (allowed.empty()) return false;
  if (allowed.size() == 1 && allowed.front() == "*") return true;
  for (const auto& a : allowed) {
    if (iequals(origin, a)) return true;
  }
  return false;
}

std::string formatUptime(std::chrono::seconds s) {
  long long total = s.count();
  if (total <= 0) return "0s";
  const long long h = total / 3600;
  const long long m = (total / 60) % 60;
  const long long sec = total % 60;
  std::string out;
  if (h > 0) out += std::to_string(h) + "h";
  if (h > 0 || m > 0) out += std::to_string(m) + "m";
  out += std::to_string(sec) + "s";
  return out;
}

HttpEndpoints::HttpEndpoints(std::string version,
                             std::vector<std::string> allowedOrigins,
                             std::chrono::steady_clock::time_point startedAt)
  : version_(std::move(version))
  , allowedOrigins_(std::move(allowedOrigins))
  , startedAt_(startedAt)
{}

bool HttpEndpoints::upgradeAllowed(const HttpRequest& req) const {
  const std::string origin = originOf(req);
  return origin.empty() || originAllowed(origin, allowedOrigins_);
}

void HttpEndpoints::applyCors(const HttpRequest& req, HttpResponse& res) const {
  const std::string origin = originOf(req);
  if (origin.empty() || !originAllowed(origin, allowedOrigins_)) return;
  res.set(http::field::access_control_allow_origin, origin);
  res.set(http::field::vary, "Origin");
  res.set(http::field::access_control_allow_methods, "GET, POST, PUT, PATCH, DELETE, OPTIONS");
  res.set(http::field::access_control_allow_headers, "Content-Type, Authorization");
}

HttpResponse HttpEndpoints::empty(const HttpRequest& req, http::status status) const {
  HttpResponse res{status, req.version()};
  res.set(http::field::server, std::string(BOOST_BEAST_VERSION_STRING) + " " + kServiceName);
  res.keep_alive(req.keep_alive());
  applyCors(req, res);
  res.prepare_payload();
  return res;
}

HttpResponse HttpEndpoints::json(const HttpRequest& req, const std::string& body) const {
  HttpResponse res = empty(req, http::status::ok);
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.body() = body;
  res.prepare_payload();
  return res;
}

HttpResponse HttpEndpoints::forbidden(const HttpRequest& req) const {
  HttpResponse res = empty(req, http::status::forbidden);
  res.set(http::field::content_type, "text/plain; charset=utf-8");
  res.body() = "origin not allowed";
  res.prepare_payload();
  return res;
}

HttpResponse HttpEndpoints::handle(const HttpRequest& req) const {
  if (req.method() == http::verb::options) return empty(req, http::status::no_content);

  const std::string path = pathOf(req);
  if (path != "/" && path != "/health" && path != "/status") {
    return empty(req, http::status::not_found);
  }
  if (req.method() != http::verb::get) return empty(req, http::status::method_not_allowed);

  if (path == "/health") {
    HttpResponse res = empty(req, http::status::ok);
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.body() = "ok";
    res.prepare_payload();
    return res;
  }

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  if (path == "/status") {
    const auto up = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::steady_clock::now() - startedAt_);
    w.Key("status");   w.String("ready");
    w.Key("uptime");   w.String(formatUptime(up).c_str());
    w.Key("time_utc"); w.String(util::formatRfc3339(util::nowMs()).c_str());
    w.Key("version");  w.String(version_.c_str());
  } else {
    w.Key("service");  w.String(kServiceName);
    w.Key("status");   w.String("ready");
    w.Key("version");  w.String(version_.c_str());
  }
  w.EndObject();
  return json(req, sb.GetString());
}

} // namespace mvr::server
