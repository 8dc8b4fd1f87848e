#pragma once

/** \file keys.hpp
 *  \brief Naming of posting-list keys and per-segment files inside a partition.
 *
 * Posting-list key: "{SEGMENT_PREFIX}_{partition}_{segment_id}_{term}".
 * Files: "{segment_id}.segment" and "segment_index_{segment_id}.fst".
 */

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace logvault::partition {

constexpr std::string_view SEGMENT_PREFIX = "SEGMENT";
/** Reserved term whose posting list holds every entry in the segment. */
constexpr std::string_view POSTING_LIST_ALL = "$ALL$";

auto posting_list_key(std::string_view partition, std::uint64_t segment_id, std::string_view term)
    -> std::string;

auto segment_file_path(const std::filesystem::path& partition_path, std::uint64_t segment_id)
    -> std::filesystem::path;

auto term_index_path(const std::filesystem::path& partition_path, std::uint64_t segment_id)
    -> std::filesystem::path;

} // namespace logvault::partition
