#pragma once

/** \file memory_store.hpp
 *  \brief In-process ordered key-value store.
 *
 * Thread-safety: all operations are safe for concurrent use (shared_mutex).
 */

#include <cstddef>
#include <functional>
#include <map>
#include <shared_mutex>
#include <string>

#include "logvault/store/store.hpp"

namespace logvault::store {

class MemoryStore final : public Store {
public:
  MemoryStore() = default;
  MemoryStore(const MemoryStore&) = delete;
  MemoryStore& operator=(const MemoryStore&) = delete;

  auto get(std::string_view key) const
      -> std::expected<std::optional<Bytes>, core::error> override;

  /** Insert or overwrite. */
  void put(std::string_view key, Bytes value);

  /** \return true if the key existed. */
  auto remove(std::string_view key) -> bool;

  auto size() const -> std::size_t;

private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, Bytes, std::less<>> data_;
};

} // namespace logvault::store
