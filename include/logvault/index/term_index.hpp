#pragma once

/** \file term_index.hpp
 *  \brief Finite-state term set for one segment (exact and fuzzy streaming).
 *
 * The file is an OpenFst acceptor in VectorFst layout over the standard arc
 * type. Each term byte b is the arc label b + 1 (label 0 is epsilon); a term
 * ends in a final state. Writers minimize the trie, so common suffixes share
 * states. Loading rejects an FST that is not an acyclic, deterministic
 * acceptor with input-sorted arcs and labels in [1, 256], so traversal always
 * terminates and never follows an arc outside the state table.
 *
 * Terms are streamed in lexicographic byte order.
 *
 * Thread-safety: immutable after load; concurrent queries are safe.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fst/const-fst.h>

#include "logvault/error.hpp"
#include "logvault/index/levenshtein.hpp"

namespace logvault::index {

using TermFst = fst::StdConstFst;

/** Arc label carrying term byte `b`. */
constexpr auto byte_label(std::uint8_t b) noexcept -> fst::StdArc::Label {
  return static_cast<fst::StdArc::Label>(b) + 1;
}

class TermIndex {
public:
  /** \brief Load and validate a term index file.
   *
   * \return index, or not_found / io_failed / data_integrity
   */
  static auto load(const std::filesystem::path& path)
      -> std::expected<TermIndex, core::error>;

  /** \brief Parse and validate an in-memory term index image. */
  static auto from_bytes(std::span<const std::uint8_t> bytes)
      -> std::expected<TermIndex, core::error>;

  auto contains(std::string_view term) const -> bool;

  /** Stream every term. */
  void for_each_term(const std::function<void(std::string_view)>& on_term) const;

  /** Stream every term accepted by the automaton. */
  void search(const LevenshteinAutomaton& automaton,
              const std::function<void(std::string_view)>& on_term) const;

  /** Collecting form of search(). */
  auto fuzzy_terms(const LevenshteinAutomaton& automaton) const -> std::vector<std::string>;

  auto size() const noexcept -> std::size_t { return term_count_; }
  auto empty() const noexcept -> bool { return term_count_ == 0; }
  auto state_count() const noexcept -> std::size_t { return state_count_; }

private:
  TermIndex() = default;

  std::shared_ptr<const TermFst> fst_;
  fst::StdArc::StateId start_{fst::kNoStateId};
  std::size_t state_count_{};
  std::size_t term_count_{};
};

/** \brief Serialize a term set (any order, duplicates collapse) as a minimized acceptor. */
auto build_term_index(std::vector<std::string> terms)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Build and write a term index file. */
auto write_term_index(const std::filesystem::path& path, std::vector<std::string> terms)
    -> std::expected<void, core::error>;

} // namespace logvault::index
