#include "logvault/partition/offset_collector.hpp"
#include "logvault/core/bytes.hpp"
#include "logvault/segment/posting_list.hpp"

#include <algorithm>
#include <memory>

namespace logvault::partition {

auto fetch_offsets(const store::Store& store, std::span<const std::string> keys,
                   ResolveStats* stats)
    -> std::expected<std::vector<std::uint64_t>, core::error> {
  using core::error; using core::error_code;
  std::vector<std::uint64_t> offsets;
  for (const auto& key : keys) {
    auto value = store.get(key);
    if (!value) return std::unexpected(value.error());
    if (!value->has_value()) {
      return std::unexpected(error{error_code::corrupt_index,
                                   "posting list not found for key " + key,
                                   "partition.offset_collector"});
    }
    auto list = segment::decode_posting_list(**value);
    if (!list) return std::unexpected(list.error());
    offsets.insert(offsets.end(), list->begin(), list->end());
    if (stats) ++stats->terms;
  }
  if (stats) stats->offsets += offsets.size();
  return offsets;
}

auto collect_entries(std::span<const std::uint8_t> buffer,
                     std::vector<std::uint64_t> offsets,
                     const TimeRange& range,
                     ResolveStats* stats)
    -> std::expected<std::vector<segment::EntryRef>, core::error> {
  using core::error; using core::error_code;
  // Posting lists are individually sorted but overlap across terms.
  std::sort(offsets.begin(), offsets.end());

  const std::uint64_t size = buffer.size();
  std::vector<segment::EntryRef> entries;
  bool have_prev = false;
  std::uint64_t prev = 0;
  for (const std::uint64_t offset : offsets) {
    // Sorted input: a repeat is always adjacent to its first occurrence.
    if (have_prev && offset == prev) {
      if (stats) ++stats->duplicates;
      continue;
    }
    have_prev = true;
    prev = offset;

    if (offset > size || size - offset < segment::ENTRY_LENGTH_SIZE) {
      return std::unexpected(error{error_code::data_integrity,
                                   "entry offset " + std::to_string(offset) + " out of range",
                                   "partition.offset_collector"});
    }
    const std::uint64_t length = core::load_le64(buffer.data() + offset);
    const std::uint64_t start = offset + segment::ENTRY_LENGTH_SIZE;
    if (length > size - start) {
      return std::unexpected(error{error_code::data_integrity,
                                   "entry at offset " + std::to_string(offset) + " exceeds segment",
                                   "partition.offset_collector"});
    }
    auto decoded = segment::decode_entry(buffer.subspan(start, length));
    if (!decoded) return std::unexpected(decoded.error());
    if (!range.contains(decoded->ts)) {
      if (stats) ++stats->filtered;
      continue;
    }
    entries.push_back(std::make_shared<const segment::Entry>(std::move(*decoded)));
  }
  if (stats) stats->entries += entries.size();
  return entries;
}

} // namespace logvault::partition
