#pragma once

/** \file segment_file.hpp
 *  \brief Whole-file read of an immutable segment.
 *
 * Segments are read once per query; there is no random-access reader.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <vector>

#include "logvault/error.hpp"

namespace logvault::segment {

/** \brief Read a segment file fully into memory.
 *
 * \param path segment file path
 * \param max_bytes refuse files larger than this (0 = unlimited)
 * \return file bytes, or not_found / io_failed / resource_exhausted
 */
auto read_segment_file(const std::filesystem::path& path, std::uint64_t max_bytes = 0)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace logvault::segment
