#include "tests/support/segment_fixture.hpp"

#include "logvault/core/bytes.hpp"
#include "logvault/index/term_index.hpp"
#include "logvault/partition/keys.hpp"
#include "logvault/segment/posting_list.hpp"

#include <fstream>
#include <random>
#include <stdexcept>

namespace test_support {

std::vector<std::uint8_t> encode_segment(const std::vector<TestRecord>& records,
                                         std::vector<std::uint64_t>* offsets) {
  std::vector<std::uint8_t> out;
  for (const auto& r : records) {
    if (offsets) offsets->push_back(out.size());
    logvault::core::append_le64(out, 8 + r.line.size());
    logvault::core::append_le64(out, r.ts);
    out.insert(out.end(), r.line.begin(), r.line.end());
  }
  return out;
}

PartitionFixture::PartitionFixture(std::string partition)
    : partition_(std::move(partition)),
      store_(std::make_shared<logvault::store::MemoryStore>()) {
  std::random_device rd;
  dir_ = std::filesystem::temp_directory_path() /
         ("logvault_" + partition_ + "_" + std::to_string(rd()) + std::to_string(rd()));
  std::filesystem::create_directories(dir_);
}

PartitionFixture::~PartitionFixture() {
  std::error_code ec;
  std::filesystem::remove_all(dir_, ec);
}

std::vector<std::uint64_t> PartitionFixture::write_segment(std::uint64_t id,
                                                           const std::vector<TestRecord>& records) {
  std::vector<std::uint64_t> offsets;
  write_raw_segment(id, encode_segment(records, &offsets));
  return offsets;
}

void PartitionFixture::write_raw_segment(std::uint64_t id, const std::vector<std::uint8_t>& bytes) {
  std::ofstream out(logvault::partition::segment_file_path(dir_, id), std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out.good()) throw std::runtime_error("fixture: segment write failed");
}

void PartitionFixture::write_terms(std::uint64_t id, std::vector<std::string> terms) {
  auto r = logvault::index::write_term_index(logvault::partition::term_index_path(dir_, id), std::move(terms));
  if (!r) throw std::runtime_error("fixture: " + r.error().message);
}

void PartitionFixture::put_posting_list(std::uint64_t id, std::string_view term,
                                        const std::vector<std::uint64_t>& offsets) {
  store_->put(logvault::partition::posting_list_key(partition_, id, term),
              logvault::segment::encode_posting_list(offsets));
}

void PartitionFixture::put_all_list(std::uint64_t id, const std::vector<std::uint64_t>& offsets) {
  put_posting_list(id, logvault::partition::POSTING_LIST_ALL, offsets);
}

} // namespace test_support
