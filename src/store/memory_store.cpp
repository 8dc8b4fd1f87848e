#include "logvault/store/memory_store.hpp"

#include <mutex>

namespace logvault::store {

auto MemoryStore::get(std::string_view key) const
    -> std::expected<std::optional<Bytes>, core::error> {
  std::shared_lock lock(mutex_);
  auto it = data_.find(key);
  if (it == data_.end()) return std::optional<Bytes>{};
  return std::optional<Bytes>{it->second};
}

void MemoryStore::put(std::string_view key, Bytes value) {
  std::unique_lock lock(mutex_);
  auto it = data_.find(key);
  if (it != data_.end()) {
    it->second = std::move(value);
  } else {
    data_.emplace(std::string(key), std::move(value));
  }
}

auto MemoryStore::remove(std::string_view key) -> bool {
  std::unique_lock lock(mutex_);
  auto it = data_.find(key);
  if (it == data_.end()) return false;
  data_.erase(it);
  return true;
}

auto MemoryStore::size() const -> std::size_t {
  std::shared_lock lock(mutex_);
  return data_.size();
}

} // namespace logvault::store
