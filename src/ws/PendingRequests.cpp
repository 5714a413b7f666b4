#include "mvr/ws/PendingRequests.hpp"

namespace mvr::ws {

PendingRequests::Ticket PendingRequests::add(std::string requestId, SendFn send) {
  std::lock_guard<std::mutex> lk(mx_);
  const Ticket t = next_++;
  m_.emplace(t, Entry{std::move(requestId), std::move(send)});
  return t;
}

bool PendingRequests::resolve(Ticket ticket, const std::string& text) {
  Entry e;
  {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = m_.find(ticket);
    if (it == m_.end()) return false;
    e = std::move(it->second);
    m_.erase(it);
  }
  if (e.send) e.send(text);
  return true;
}

std::size_t PendingRequests::clear() {
  std::unordered_map<Ticket, Entry> tmp;
  {
    std::lock_guard<std::mutex> lk(mx_);
    tmp.swap(m_);
  }
  return tmp.size();
}

bool PendingRequests::contains(Ticket ticket) const {
  std::lock_guard<std::mutex> lk(mx_);
  return m_.count(ticket) > 0;
}

std::size_t PendingRequests::size() const {
  std::lock_guard<std::mutex> lk(mx_);
  return m_.size();
}

} // namespace mvr::ws
