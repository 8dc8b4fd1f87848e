#include "logvault/segment/segment_file.hpp"

#include <fstream>
#include <new>
#include <system_error>

namespace logvault::segment {

auto read_segment_file(const std::filesystem::path& path, std::uint64_t max_bytes)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return std::unexpected(error{error_code::not_found, "segment file not found: " + path.string(), "segment.file"});
    }
    return std::unexpected(error{error_code::io_failed, "segment stat failed: " + path.string(), "segment.file"});
  }
  if (max_bytes != 0 && size > max_bytes) {
    return std::unexpected(error{error_code::resource_exhausted, "segment exceeds max_segment_bytes", "segment.file"});
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) {
    return std::unexpected(error{error_code::io_failed, "segment open failed: " + path.string(), "segment.file"});
  }
  std::vector<std::uint8_t> buffer;
  try {
    buffer.resize(static_cast<std::size_t>(size));
  } catch (const std::bad_alloc&) {
    return std::unexpected(error{error_code::resource_exhausted, "segment too large to buffer", "segment.file"});
  }
  if (size > 0) {
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(size));
    if (in.gcount() != static_cast<std::streamsize>(size)) {
      return std::unexpected(error{error_code::io_eof, "short read on segment", "segment.file"});
    }
  }
  return buffer;
}

} // namespace logvault::segment
