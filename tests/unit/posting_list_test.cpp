#include <catch2/catch_all.hpp>
#include <logvault/segment/posting_list.hpp>

#include <vector>

using namespace logvault;

TEST_CASE("posting list decodes ascending unique offsets", "[segment][posting_list]") {
  const std::vector<std::uint64_t> offsets{4096, 0, 17, 1ull << 40, 17};
  auto bytes = segment::encode_posting_list(offsets);
  auto dec = segment::decode_posting_list(bytes);
  REQUIRE(dec.has_value());
  REQUIRE(*dec == std::vector<std::uint64_t>{0, 17, 4096, 1ull << 40});
}

TEST_CASE("empty posting list is valid once encoded", "[segment][posting_list]") {
  auto bytes = segment::encode_posting_list({});
  REQUIRE_FALSE(bytes.empty());
  auto dec = segment::decode_posting_list(bytes);
  REQUIRE(dec.has_value());
  REQUIRE(dec->empty());
}

TEST_CASE("truncated or empty posting list bytes are data_integrity", "[segment][posting_list][safety]") {
  REQUIRE(segment::decode_posting_list(std::span<const std::uint8_t>{}).error().code
          == core::error_code::data_integrity);

  const std::vector<std::uint64_t> offsets{1, 2, 3, 100000};
  auto bytes = segment::encode_posting_list(offsets);
  bytes.resize(bytes.size() / 2);
  auto dec = segment::decode_posting_list(bytes);
  REQUIRE_FALSE(dec.has_value());
  REQUIRE(dec.error().code == core::error_code::data_integrity);
}
