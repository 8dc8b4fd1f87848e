#pragma once

/** \file term_resolver.hpp
 *  \brief Resolve a text query into the posting-list keys to fetch.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "logvault/error.hpp"

namespace logvault::partition {

/** \brief Posting-list keys for `query` against one segment.
 *
 * An empty query yields the single POSTING_LIST_ALL key without opening the
 * term index. Otherwise the segment's term index is loaded and every term
 * within kFuzzyEditDistance of the query (case-sensitive) contributes a key,
 * in lexicographic term order.
 *
 * \return keys, or the term index load / automaton construction error
 */
auto resolve_term_keys(std::string_view query,
                       const std::filesystem::path& partition_path,
                       std::uint64_t segment_id,
                       std::string_view partition)
    -> std::expected<std::vector<std::string>, core::error>;

} // namespace logvault::partition
