#include "mvr/session/SessionManager.hpp"
#include "mvr/util/TimeUtil.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>

#include <mutex>

namespace mvr::session {

namespace {

std::string trimmed(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
  return s.substr(b, e - b);
}

} // namespace

SessionManager::SessionManager(Clock clock)
  : clock_(clock ? std::move(clock) : Clock([]{ return util::nowMs(); }))
{}

ResolvedId SessionManager::resolveId(const std::string& cookieValue) const {
  const std::string v = trimmed(cookieValue);
  if (!v.empty()) return {v, false};
  return {newId(), true};
}

std::optional<SessionState> SessionManager::get(const std::string& id) const {
  if (id.empty()) return std::nullopt;
  std::shared_lock lock(mx_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

void SessionManager::replace(const std::string& id, SessionState state) {
  if (id.empty()) return;
  state.updatedAtMs = clock_();
  std::unique_lock lock(mx_);
  sessions_[id] = std::move(state);
}

void SessionManager::updateRange(const std::string& id,
                                 std::int64_t startMs,
                                 std::int64_t endMs,
                                 int rangeStart,
                                 int rangeEnd,
                                 std::optional<bool> computeMode) {
  if (id.empty()) return;
  const std::int64_t now = clock_();
  std::unique_lock lock(mx_);
  auto& state = sessions_[id];
  state.rangeStart = rangeStart;
  state.rangeEnd = rangeEnd;
  state.rangeStartTime = util::formatRfc3339(startMs, true);
  state.rangeEndTime = util::formatRfc3339(endMs, true);
  if (computeMode) state.computeMode = *computeMode;
  state.updatedAtMs = now;
}

SessionState SessionManager::reset(const std::string& id) {
  SessionState zero;
  zero.updatedAtMs = clock_();
  if (id.empty()) return zero;
  std::unique_lock lock(mx_);
  sessions_[id] = zero;
  return zero;
}

std::size_t SessionManager::size() const {
  std::shared_lock lock(mx_);
  return sessions_.size();
}

std::string SessionManager::newId() {
  static const char kHex[] = "0123456789abcdef";
  thread_local boost::uuids::random_generator gen;
  const boost::uuids::uuid u = gen();

  std::string out;
  out.reserve(u.size() * 2);
  for (auto b : u) {
    out.push_back(kHex[(b >> 4) & 0x0F]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::string SessionManager::cookieValue(const std::string& header, const std::string& name) {
  std::size_t pos = 0;
  while (pos <= header.size()) {
    std::size_t semi = header.find(';', pos);
    if (semi == std::string::npos) semi = header.size();
    const std::string pair = trimmed(header.substr(pos, semi - pos));
    const auto eq = pair.find('=');
    if (eq != std::string::npos && trimmed(pair.substr(0, eq)) == name) {
      std::string v = trimmed(pair.substr(eq + 1));
      if (v.size() >= 2 && v.front() == '"' && v.back() == '"') v = v.substr(1, v.size() - 2);
      return v;
    }
    pos = semi + 1;
  }
  return {};
}

std::string SessionManager::setCookieHeader(const std::string& id) {
  return std::string(kSessionCookie) + "=" + id + "; Path=/; HttpOnly; SameSite=Lax";
}

} // namespace mvr::session
