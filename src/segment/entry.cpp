#include "logvault/segment/entry.hpp"
#include "logvault/core/bytes.hpp"

namespace logvault::segment {

auto decode_entry(std::span<const std::uint8_t> payload)
    -> std::expected<Entry, core::error> {
  using core::error; using core::error_code;
  if (payload.size() < ENTRY_TIMESTAMP_SIZE) {
    return std::unexpected(error{error_code::data_integrity, "entry shorter than timestamp", "segment.entry"});
  }
  Entry e;
  e.ts = core::load_le64(payload.data());
  const auto line = payload.subspan(ENTRY_TIMESTAMP_SIZE);
  e.line.assign(line.begin(), line.end());
  return e;
}

} // namespace logvault::segment
