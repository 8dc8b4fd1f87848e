#pragma once

/** \file store.hpp
 *  \brief Key-value store seam used to fetch posting lists.
 *
 * Implementations decide their own thread-safety; callers must not assume a
 * store handle may be shared across threads unless the implementation says so.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string_view>
#include <vector>

#include "logvault/error.hpp"

namespace logvault::store {

using Bytes = std::vector<std::uint8_t>;

class Store {
public:
  virtual ~Store() = default;

  /** \brief Point lookup.
   *
   * \return value bytes, std::nullopt when the key is absent (distinct from an
   *         empty value), or an error from the backend
   */
  virtual auto get(std::string_view key) const
      -> std::expected<std::optional<Bytes>, core::error> = 0;
};

} // namespace logvault::store
