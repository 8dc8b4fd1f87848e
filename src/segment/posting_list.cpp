#include "logvault/segment/posting_list.hpp"

#include <new>
#include <stdexcept>

#include <roaring/roaring64map.hh>

namespace logvault::segment {

auto decode_posting_list(std::span<const std::uint8_t> bytes)
    -> std::expected<std::vector<std::uint64_t>, core::error> {
  using core::error; using core::error_code;
  if (bytes.empty()) {
    return std::unexpected(error{error_code::data_integrity, "empty posting list", "segment.posting_list"});
  }
  try {
    const auto bitmap = roaring::Roaring64Map::readSafe(
        reinterpret_cast<const char*>(bytes.data()), bytes.size());
    std::vector<std::uint64_t> offsets(bitmap.cardinality());
    if (!offsets.empty()) bitmap.toUint64Array(offsets.data());
    return offsets;
  } catch (const std::bad_alloc&) {
    return std::unexpected(error{error_code::resource_exhausted, "posting list too large", "segment.posting_list"});
  } catch (const std::exception& e) {
    // readSafe reports truncation and bad cookies by throwing
    return std::unexpected(error{error_code::data_integrity,
                                 std::string("malformed posting list: ") + e.what(),
                                 "segment.posting_list"});
  }
}

auto encode_posting_list(std::span<const std::uint64_t> offsets)
    -> std::vector<std::uint8_t> {
  roaring::Roaring64Map bitmap;
  bitmap.addMany(offsets.size(), offsets.data());
  bitmap.runOptimize();
  std::vector<std::uint8_t> out(bitmap.getSizeInBytes(/*portable=*/true));
  bitmap.write(reinterpret_cast<char*>(out.data()), /*portable=*/true);
  return out;
}

} // namespace logvault::segment
