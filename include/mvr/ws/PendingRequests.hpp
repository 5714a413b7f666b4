#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mvr::ws {

// Correlations still awaiting a response on one connection. Each entry leaves
// the table exactly once: through resolve() or through clear() on connection
// loss.
class PendingRequests {
public:
  using SendFn = std::function<void(const std::string& text)>;
  using Ticket = std::uint64_t;

  Ticket add(std::string requestId, SendFn send);

  // Removes the entry and hands `text` to its send path (outside the lock).
  // Returns false if the entry was already gone.
  bool resolve(Ticket ticket, const std::string& text);

  // Drops every entry without sending. Returns how many were discarded.
  std::size_t clear();

  bool contains(Ticket ticket) const;
  std::size_t size() const;

private:
  struct Entry {
    std::string requestId;
    SendFn send;
  };

  mutable std::mutex mx_;
  Ticket next_{1};
  std::unordered_map<Ticket, Entry> m_;
};

} // namespace mvr::ws
