#pragma once

/** \file offset_collector.hpp
 *  \brief Merge posting lists into a deduplicated, time-filtered entry list.
 *
 * Offsets from different terms may repeat; each distinct offset is decoded at
 * most once. An offset is marked seen even when its entry is filtered out.
 * Any offset or length that would read past the segment buffer fails the
 * whole collection with data_integrity.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "logvault/error.hpp"
#include "logvault/partition/query.hpp"
#include "logvault/segment/entry.hpp"
#include "logvault/store/store.hpp"

namespace logvault::partition {

/** \brief Counters gathered while resolving one segment query. */
struct ResolveStats {
  std::size_t terms{};            /**< posting lists fetched */
  std::size_t offsets{};          /**< offsets across all lists, before dedup */
  std::size_t duplicates{};       /**< offsets skipped as already seen */
  std::size_t filtered{};         /**< decoded entries outside the time range */
  std::size_t entries{};          /**< entries kept */
  std::size_t segment_bytes{};    /**< size of the buffered segment */
};

/** \brief Fetch and decode the posting list of every key, concatenated.
 *
 * \return offsets in fetch order; corrupt_index (message carries the key) when
 *         a key has no posting list; store and decode errors propagate
 */
auto fetch_offsets(const store::Store& store, std::span<const std::string> keys,
                   ResolveStats* stats = nullptr)
    -> std::expected<std::vector<std::uint64_t>, core::error>;

/** \brief Decode the entries at `offsets` from a fully buffered segment.
 *
 * Offsets are sorted ascending, deduplicated and filtered by `range`.
 */
auto collect_entries(std::span<const std::uint8_t> buffer,
                     std::vector<std::uint64_t> offsets,
                     const TimeRange& range,
                     ResolveStats* stats = nullptr)
    -> std::expected<std::vector<segment::EntryRef>, core::error>;

} // namespace logvault::partition
