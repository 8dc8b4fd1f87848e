#include <cstdint>
#include <cstddef>
#include <span>

#include "logvault/segment/posting_list.hpp"

// Fuzzer: arbitrary bytes into the posting-list decoder.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
  using namespace logvault::segment;
  try {
    (void)decode_posting_list(std::span<const std::uint8_t>{data, size});
  } catch (...) {
    // Never propagate exceptions out of the fuzzer
  }
  return 0;
}
