#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "logvault/store/memory_store.hpp"

namespace test_support {

struct TestRecord {
  std::uint64_t ts;
  std::string line;
};

// Segment image in the ingestion layout: [u64 len][u64 ts][line]... (little-endian).
// Offsets of each record's length field are appended to `offsets` when non-null.
std::vector<std::uint8_t> encode_segment(const std::vector<TestRecord>& records,
                                         std::vector<std::uint64_t>* offsets = nullptr);

// Throwaway partition directory plus an in-memory posting-list store.
// The directory is removed on destruction.
class PartitionFixture {
public:
  explicit PartitionFixture(std::string partition = "app");
  ~PartitionFixture();
  PartitionFixture(const PartitionFixture&) = delete;
  PartitionFixture& operator=(const PartitionFixture&) = delete;

  const std::filesystem::path& path() const { return dir_; }
  const std::string& partition() const { return partition_; }
  std::shared_ptr<logvault::store::MemoryStore> store() const { return store_; }

  // Writes "{id}.segment" and returns record offsets.
  std::vector<std::uint64_t> write_segment(std::uint64_t id, const std::vector<TestRecord>& records);
  void write_raw_segment(std::uint64_t id, const std::vector<std::uint8_t>& bytes);
  void write_terms(std::uint64_t id, std::vector<std::string> terms);
  void put_posting_list(std::uint64_t id, std::string_view term, const std::vector<std::uint64_t>& offsets);
  void put_all_list(std::uint64_t id, const std::vector<std::uint64_t>& offsets);

private:
  std::filesystem::path dir_;
  std::string partition_;
  std::shared_ptr<logvault::store::MemoryStore> store_;
};

} // namespace test_support
