#pragma once

/** \file levenshtein.hpp
 *  \brief Bounded edit-distance acceptor used to stream fuzzy matches from a term index.
 *
 * The automaton is simulated one byte at a time so it can be intersected with a
 * byte-labelled trie. Distances are counted in Unicode code points: UTF-8
 * sequences are assembled inside the state before the DP row advances. Bytes
 * that do not form valid UTF-8 count as one symbol each and never equal a
 * query symbol. Matching is case-sensitive.
 *
 * State is the classic DP row (cell i = distance between the query prefix of
 * length i and the input consumed so far), with cells saturated at max+1.
 *
 * Thread-safety: the automaton is immutable after create(); states are values.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>
#include <vector>

#include "logvault/error.hpp"

namespace logvault::index {

class LevenshteinAutomaton {
public:
  static constexpr std::uint32_t kMaxDistance = 4;
  static constexpr std::size_t kMaxQueryChars = 256;

  struct State {
    std::vector<std::uint8_t> row;  /**< saturated DP row, size = query chars + 1 */
    std::uint32_t pending_cp{0};    /**< partially assembled code point */
    std::uint8_t pending_left{0};   /**< continuation bytes still expected */
  };

  /** \brief Build an automaton for `query` accepting words within `max_distance` edits.
   *
   * \return automaton, or invalid_argument when the query is not UTF-8, is longer
   *         than kMaxQueryChars code points, or max_distance exceeds kMaxDistance
   */
  static auto create(std::string_view query, std::uint32_t max_distance)
      -> std::expected<LevenshteinAutomaton, core::error>;

  auto start() const -> State;

  /** Feed one byte of the candidate word. */
  auto step(const State& s, std::uint8_t byte) const -> State;

  /** True if the bytes fed so far form a word within the distance bound. */
  auto is_match(const State& s) const noexcept -> bool;

  /** False once no continuation can reach the distance bound again (prune). */
  auto can_match(const State& s) const noexcept -> bool;

  auto max_distance() const noexcept -> std::uint32_t { return max_distance_; }
  auto query_chars() const noexcept -> std::size_t { return query_.size(); }

private:
  LevenshteinAutomaton(std::vector<std::uint32_t> query, std::uint32_t max_distance)
      : query_(std::move(query)), max_distance_(max_distance) {}

  void advance_row(State& s, std::uint32_t symbol) const;

  std::vector<std::uint32_t> query_;  // code points
  std::uint32_t max_distance_{};
};

/** \brief Bounded edit distance over code points.
 *
 * The bound is cap = min(max_cost, LevenshteinAutomaton::kMaxDistance). Returns
 * the distance when it is at most cap, otherwise cap + 1. An `a` that is not
 * valid UTF-8 also yields cap + 1.
 */
auto edit_distance(std::string_view a, std::string_view b, std::uint32_t max_cost) -> std::uint32_t;

} // namespace logvault::index
