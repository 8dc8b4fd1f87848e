#pragma once

/** \file entry.hpp
 *  \brief Log entry type and payload decoding.
 *
 * Record layout inside a segment file (little-endian):
 *   [u64 length][payload: u64 timestamp | line bytes]
 * decode_entry() only sees the payload; the caller slices it using the length.
 *
 * Thread-safety: functions are stateless and thread-safe; Entry is immutable once shared.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "logvault/error.hpp"

namespace logvault::segment {

constexpr std::size_t ENTRY_LENGTH_SIZE = 8;     // length prefix before each payload
constexpr std::size_t ENTRY_TIMESTAMP_SIZE = 8;  // timestamp at the head of each payload

struct Entry {
  std::uint64_t ts{};               /**< entry timestamp */
  std::vector<std::uint8_t> line;   /**< raw log line bytes */

  auto line_view() const noexcept -> std::string_view {
    return {reinterpret_cast<const char*>(line.data()), line.size()};
  }
};

/** Shared, read-only handle; entries outlive the iterator that produced them. */
using EntryRef = std::shared_ptr<const Entry>;

/** \brief Decode one payload (timestamp + line) into an owned Entry.
 *
 * \param payload exactly the payload bytes of one record
 * \return Entry, or data_integrity when the payload cannot hold a timestamp
 */
auto decode_entry(std::span<const std::uint8_t> payload)
    -> std::expected<Entry, core::error>;

} // namespace logvault::segment
