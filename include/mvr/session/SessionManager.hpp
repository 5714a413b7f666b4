// include/mvr/session/SessionManager.hpp
#pragma once

#include "mvr/session/SessionState.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace mvr::session {

constexpr const char* kSessionCookie = "mvr_session";

struct ResolvedId {
  std::string id;
  bool created = false;
};

// Session table keyed by the opaque id carried in the session cookie. Entries
// never expire. Writes are last-writer-wins; an empty id is ignored.
class SessionManager {
public:
  using Clock = std::function<std::int64_t()>;   // unix ms

  explicit SessionManager(Clock clock = {});

  // Existing id when the cookie value is non-empty, otherwise a fresh one.
  ResolvedId resolveId(const std::string& cookieValue) const;

  std::optional<SessionState> get(const std::string& id) const;
  void replace(const std::string& id, SessionState state);
  void updateRange(const std::string& id,
                   std::int64_t startMs,
                   std::int64_t endMs,
                   int rangeStart,
                   int rangeEnd,
                   std::optional<bool> computeMode);
  // Stores and returns the zero state.
  SessionState reset(const std::string& id);

  std::size_t size() const;

  static std::string newId();
  // Value of cookie `name` from a Cookie header, empty if absent.
  static std::string cookieValue(const std::string& header, const std::string& name = kSessionCookie);
  static std::string setCookieHeader(const std::string& id);

private:
  Clock clock_;
  mutable std::shared_mutex mx_;
  std::unordered_map<std::string, SessionState> sessions_;
};

} // namespace mvr::session
