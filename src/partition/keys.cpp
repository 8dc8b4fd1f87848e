#include "logvault/partition/keys.hpp"

namespace logvault::partition {

auto posting_list_key(std::string_view partition, std::uint64_t segment_id, std::string_view term)
    -> std::string {
  const auto id = std::to_string(segment_id);
  std::string key;
  key.reserve(SEGMENT_PREFIX.size() + partition.size() + id.size() + term.size() + 3);
  key.append(SEGMENT_PREFIX).push_back('_');
  key.append(partition).push_back('_');
  key.append(id).push_back('_');
  key.append(term);
  return key;
}

auto segment_file_path(const std::filesystem::path& partition_path, std::uint64_t segment_id)
    -> std::filesystem::path {
  return partition_path / (std::to_string(segment_id) + ".segment");
}

auto term_index_path(const std::filesystem::path& partition_path, std::uint64_t segment_id)
    -> std::filesystem::path {
  return partition_path / ("segment_index_" + std::to_string(segment_id) + ".fst");
}

} // namespace logvault::partition
