#include "logvault/partition/term_resolver.hpp"
#include "logvault/index/levenshtein.hpp"
#include "logvault/index/term_index.hpp"
#include "logvault/partition/keys.hpp"
#include "logvault/partition/query.hpp"

namespace logvault::partition {

auto resolve_term_keys(std::string_view query,
                       const std::filesystem::path& partition_path,
                       std::uint64_t segment_id,
                       std::string_view partition)
    -> std::expected<std::vector<std::string>, core::error> {
  std::vector<std::string> keys;
  if (query.empty()) {
    keys.push_back(posting_list_key(partition, segment_id, POSTING_LIST_ALL));
    return keys;
  }

  auto terms = index::TermIndex::load(term_index_path(partition_path, segment_id));
  if (!terms) return std::unexpected(terms.error());

  auto fuzzy = index::LevenshteinAutomaton::create(query, kFuzzyEditDistance);
  if (!fuzzy) return std::unexpected(fuzzy.error());

  terms->search(*fuzzy, [&](std::string_view term) {
    keys.push_back(posting_list_key(partition, segment_id, term));
  });
  return keys;
}

} // namespace logvault::partition
