#include "lh/memory_ttl_key_store.hpp"

namespace lh {

memory_ttl_key_store::memory_ttl_key_store(clock_function clock)
    : clock_(std::move(clock))
    , mu_()
    , entries_() {
}

bool memory_ttl_key_store::set_if_absent(
    std::string const& key, std::string const& value, std::chrono::milliseconds ttl) {
  std::lock_guard<std::mutex> lock(mu_);
  if (find_live(key) != entries_.end()) {
    return false;
  }
  entries_[key] = entry{value, clock_() + ttl};
  return true;
}

bool memory_ttl_key_store::get(std::string const& key, std::string* value) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = find_live(key);
  if (i == entries_.end()) {
    return false;
  }
  if (value != nullptr) {
    *value = i->second.value;
  }
  return true;
}

bool memory_ttl_key_store::expire(std::string const& key, std::chrono::milliseconds ttl) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = find_live(key);
  if (i == entries_.end()) {
    return false;
  }
  i->second.expires_at = clock_() + ttl;
  return true;
}

bool memory_ttl_key_store::remove(std::string const& key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = find_live(key);
  if (i == entries_.end()) {
    return false;
  }
  entries_.erase(i);
  return true;
}

clock_type::time_point memory_ttl_key_store::expiration(std::string const& key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = find_live(key);
  if (i == entries_.end()) {
    return clock_type::time_point();
  }
  return i->second.expires_at;
}

std::map<std::string, memory_ttl_key_store::entry>::iterator memory_ttl_key_store::find_live(std::string const& key) {
  auto i = entries_.find(key);
  if (i == entries_.end()) {
    return i;
  }
  if (i->second.expires_at <= clock_()) {
    entries_.erase(i);
    return entries_.end();
  }
  return i;
}

} // namespace lh
