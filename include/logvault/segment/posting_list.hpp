#pragma once

/** \file posting_list.hpp
 *  \brief Posting list codec: sorted 64-bit segment offsets.
 *
 * Wire format: CRoaring Roaring64Map portable serialization. Decoding is
 * bounded by the input size; malformed input never reads past the buffer.
 *
 * Thread-safety: functions are stateless and thread-safe.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "logvault/error.hpp"

namespace logvault::segment {

/** \brief Decode a stored posting list into ascending offsets.
 *
 * \return offsets, or data_integrity on truncated/malformed input
 */
auto decode_posting_list(std::span<const std::uint8_t> bytes)
    -> std::expected<std::vector<std::uint64_t>, core::error>;

/** \brief Encode offsets (any order, duplicates collapse) for storage. */
auto encode_posting_list(std::span<const std::uint64_t> offsets)
    -> std::vector<std::uint8_t>;

} // namespace logvault::segment
