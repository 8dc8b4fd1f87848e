#include <logvault/error.hpp>
#include <catch2/catch_all.hpp>

#include <cstring>

TEST_CASE("error codes stable subset", "[errors]") {
  using logvault::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::corrupt_index) == 3002u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
  REQUIRE(static_cast<unsigned>(error_code::invalid_argument) == 9002u);
}

TEST_CASE("error code names", "[errors]") {
  using logvault::core::error_code;
  using logvault::core::to_string;
  REQUIRE(std::strcmp(to_string(error_code::corrupt_index), "corrupt_index") == 0);
  REQUIRE(std::strcmp(to_string(error_code::resource_exhausted), "resource_exhausted") == 0);
}
