#pragma once

/** \file query.hpp
 *  \brief Segment query description and iterator options.
 */

#include <cstdint>
#include <string>

namespace logvault::partition {

/** Edit distance used for every fuzzy query. */
constexpr std::uint32_t kFuzzyEditDistance = 2;

/** \brief Inclusive timestamp window, or the explicit "no filter" variant.
 *
 * between(s, e) with s > e matches nothing.
 */
class TimeRange {
public:
  static constexpr auto unbounded() noexcept -> TimeRange { return TimeRange{0, 0, true}; }
  static constexpr auto between(std::uint64_t start, std::uint64_t end) noexcept -> TimeRange {
    return TimeRange{start, end, false};
  }
  /** Legacy (start_ts, end_ts) pair: (0, 0) historically meant "keep everything". */
  static constexpr auto from_legacy(std::uint64_t start, std::uint64_t end) noexcept -> TimeRange {
    return (start == 0 && end == 0) ? unbounded() : between(start, end);
  }

  constexpr auto contains(std::uint64_t ts) const noexcept -> bool {
    return unbounded_ || (start_ <= ts && ts <= end_);
  }
  constexpr auto is_unbounded() const noexcept -> bool { return unbounded_; }
  constexpr auto start() const noexcept -> std::uint64_t { return start_; }
  constexpr auto end() const noexcept -> std::uint64_t { return end_; }

private:
  constexpr TimeRange(std::uint64_t start, std::uint64_t end, bool unbounded) noexcept
      : start_(start), end_(end), unbounded_(unbounded) {}

  std::uint64_t start_;
  std::uint64_t end_;
  bool unbounded_;
};

struct SegmentQuery {
  std::string text;                             /**< empty = every entry */
  TimeRange range{TimeRange::unbounded()};
};

struct SegmentIteratorOptions {
  std::uint64_t max_segment_bytes{0};  /**< refuse larger segment files; 0 = unlimited */
  bool debug{false};                   /**< trace resolution to stderr */
};

/** Apply LOGVAULT_MAX_SEGMENT_BYTES and LOGVAULT_QUERY_DEBUG overrides to `base`.
 *  Malformed numeric values are ignored. */
auto options_from_env(SegmentIteratorOptions base = {}) -> SegmentIteratorOptions;

} // namespace logvault::partition
