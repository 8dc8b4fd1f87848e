#include "logvault/partition/segment_iterator.hpp"
#include "logvault/partition/keys.hpp"
#include "logvault/partition/term_resolver.hpp"
#include "logvault/segment/segment_file.hpp"

#include <iostream>

namespace logvault::partition {

auto SegmentIterator::open(std::uint64_t segment_id,
                           const std::filesystem::path& partition_path,
                           std::shared_ptr<store::Store> store,
                           const SegmentQuery& query,
                           std::string partition,
                           const SegmentIteratorOptions& options)
    -> std::expected<SegmentIterator, core::error> {
  using core::error; using core::error_code;
  if (!store) {
    return std::unexpected(error{error_code::invalid_argument, "store handle is null", "partition.segment_iterator"});
  }
  const SegmentIteratorOptions opts = options_from_env(options);
  const bool dbg = opts.debug;
  ResolveStats stats{};

  auto keys = resolve_term_keys(query.text, partition_path, segment_id, partition);
  if (!keys) {
    if (dbg) std::cerr << "[SEGMENT][resolve] " << partition << "/" << segment_id
                       << " term resolution failed: " << keys.error().message << std::endl;
    return std::unexpected(keys.error());
  }
  if (dbg) std::cerr << "[SEGMENT][resolve] " << partition << "/" << segment_id
                     << " query='" << query.text << "' keys=" << keys->size() << std::endl;

  auto offsets = fetch_offsets(*store, *keys, &stats);
  if (!offsets) {
    if (dbg) std::cerr << "[SEGMENT][postings] fetch failed: " << offsets.error().message << std::endl;
    return std::unexpected(offsets.error());
  }

  auto buffer = segment::read_segment_file(segment_file_path(partition_path, segment_id),
                                           opts.max_segment_bytes);
  if (!buffer) {
    if (dbg) std::cerr << "[SEGMENT][read] " << buffer.error().message << std::endl;
    return std::unexpected(buffer.error());
  }
  stats.segment_bytes = buffer->size();

  auto entries = collect_entries(*buffer, std::move(*offsets), query.range, &stats);
  if (!entries) {
    if (dbg) std::cerr << "[SEGMENT][collect] " << entries.error().message << std::endl;
    return std::unexpected(entries.error());
  }
  if (dbg) std::cerr << "[SEGMENT][collect] terms=" << stats.terms << " offsets=" << stats.offsets
                     << " duplicates=" << stats.duplicates << " filtered=" << stats.filtered
                     << " entries=" << stats.entries << std::endl;

  return SegmentIterator(segment_id, std::move(partition), std::move(store),
                         std::move(*entries), stats);
}

auto SegmentIterator::open(std::uint64_t segment_id,
                           const std::filesystem::path& partition_path,
                           std::shared_ptr<store::Store> store,
                           std::string query,
                           std::string partition,
                           std::uint64_t start_ts,
                           std::uint64_t end_ts,
                           const SegmentIteratorOptions& options)
    -> std::expected<SegmentIterator, core::error> {
  SegmentQuery q{std::move(query), TimeRange::from_legacy(start_ts, end_ts)};
  return open(segment_id, partition_path, std::move(store), q, std::move(partition), options);
}

auto SegmentIterator::entry() const -> segment::EntryRef {
  const auto i = cursor_.index();
  if (!i) return nullptr;
  return entries_[*i];
}

auto SegmentIterator::next() -> bool {
  return cursor_.advance(entries_.size());
}

} // namespace logvault::partition
