#pragma once

/** \file segment_iterator.hpp
 *  \brief Query one sealed segment and iterate the matching entries.
 *
 * open() runs the whole pipeline synchronously: term resolution, posting-list
 * fetch, full segment read, dedup, decode and timestamp filtering. The result
 * is materialized before open() returns; any failure yields no iterator.
 *
 * Thread-safety: an iterator is not thread-safe. Independent iterators over
 * the same segment may be opened concurrently (all inputs are read-only).
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "logvault/error.hpp"
#include "logvault/partition/iterator.hpp"
#include "logvault/partition/offset_collector.hpp"
#include "logvault/partition/query.hpp"
#include "logvault/store/store.hpp"

namespace logvault::partition {

/** \brief Forward-only cursor over a fixed-length list.
 *
 * Holds either a valid index or "past last"; an empty list starts past last.
 */
class Cursor {
public:
  enum class state : std::uint8_t { at, past_last };

  static auto first_of(std::size_t len) noexcept -> Cursor {
    return len == 0 ? Cursor{state::past_last, 0} : Cursor{state::at, 0};
  }

  auto index() const noexcept -> std::optional<std::size_t> {
    if (state_ == state::past_last) return std::nullopt;
    return index_;
  }

  /** Step forward within a list of `len` elements; false once past the last. */
  auto advance(std::size_t len) noexcept -> bool {
    if (state_ == state::past_last) return false;
    if (index_ + 1 >= len) {
      state_ = state::past_last;
      return false;
    }
    ++index_;
    return true;
  }

  auto current_state() const noexcept -> state { return state_; }

private:
  Cursor(state s, std::size_t i) noexcept : state_(s), index_(i) {}

  state state_;
  std::size_t index_;
};

class SegmentIterator final : public Iterator {
public:
  /** \brief Resolve `query` against segment `segment_id` of `partition`.
   *
   * \param segment_id segment to query
   * \param partition_path directory holding the segment and its term index
   * \param store posting-list store; kept for follow-up lookups
   * \param query text (empty = all entries) and time range
   * \param partition partition name used in posting-list keys
   * \param options size guard and tracing; LOGVAULT_MAX_SEGMENT_BYTES and
   *        LOGVAULT_QUERY_DEBUG override them (see options_from_env)
   * \return iterator positioned on the first match, or the first error hit
   */
  static auto open(std::uint64_t segment_id,
                   const std::filesystem::path& partition_path,
                   std::shared_ptr<store::Store> store,
                   const SegmentQuery& query,
                   std::string partition,
                   const SegmentIteratorOptions& options = {})
      -> std::expected<SegmentIterator, core::error>;

  /** Legacy form: (start_ts, end_ts) == (0, 0) means no time filter. */
  static auto open(std::uint64_t segment_id,
                   const std::filesystem::path& partition_path,
                   std::shared_ptr<store::Store> store,
                   std::string query,
                   std::string partition,
                   std::uint64_t start_ts,
                   std::uint64_t end_ts,
                   const SegmentIteratorOptions& options = {})
      -> std::expected<SegmentIterator, core::error>;

  auto entry() const -> segment::EntryRef override;
  auto next() -> bool override;

  auto entries() const noexcept -> const std::vector<segment::EntryRef>& { return entries_; }
  auto size() const noexcept -> std::size_t { return entries_.size(); }
  auto empty() const noexcept -> bool { return entries_.empty(); }
  auto id() const noexcept -> std::uint64_t { return id_; }
  auto partition() const noexcept -> const std::string& { return partition_; }
  auto store() const noexcept -> const std::shared_ptr<store::Store>& { return store_; }
  auto stats() const noexcept -> const ResolveStats& { return stats_; }

private:
  SegmentIterator(std::uint64_t id, std::string partition, std::shared_ptr<store::Store> store,
                  std::vector<segment::EntryRef> entries, ResolveStats stats)
      : store_(std::move(store)),
        entries_(std::move(entries)),
        id_(id),
        partition_(std::move(partition)),
        cursor_(Cursor::first_of(entries_.size())),  // entries_ is declared before cursor_
        stats_(stats) {}

  std::shared_ptr<store::Store> store_;
  std::vector<segment::EntryRef> entries_;  // must stay ahead of cursor_
  std::uint64_t id_;
  std::string partition_;
  Cursor cursor_;
  ResolveStats stats_;
};

} // namespace logvault::partition
