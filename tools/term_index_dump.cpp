// Print the terms of a segment term index, or the fuzzy matches for a query.
//
// usage: term_index_dump <segment_index_N.fst> [query] [distance]

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

#include "logvault/error.hpp"
#include "logvault/index/levenshtein.hpp"
#include "logvault/index/term_index.hpp"
#include "logvault/partition/query.hpp"

namespace {

int fail(const logvault::core::error& e) {
  std::cerr << "[term_index_dump] " << logvault::core::to_string(e.code)
            << " (" << static_cast<int>(e.code) << "): " << e.message << std::endl;
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  using namespace logvault;
  if (argc < 2 || argc > 4) {
    std::cerr << "usage: " << argv[0] << " <segment_index_N.fst> [query] [distance]" << std::endl;
    return 2;
  }

  auto index = index::TermIndex::load(argv[1]);
  if (!index) return fail(index.error());
  std::cerr << "[term_index_dump] terms=" << index->size() << " states=" << index->state_count() << std::endl;

  if (argc == 2) {
    index->for_each_term([](std::string_view t) { std::cout << t << '\n'; });
    return 0;
  }

  std::uint32_t distance = partition::kFuzzyEditDistance;
  if (argc == 4) {
    char* end = nullptr;
    const unsigned long v = std::strtoul(argv[3], &end, 10);
    if (end == argv[3] || *end != '\0' || v > index::LevenshteinAutomaton::kMaxDistance) {
      std::cerr << "invalid distance: " << argv[3] << std::endl;
      return 2;
    }
    distance = static_cast<std::uint32_t>(v);
  }

  auto automaton = index::LevenshteinAutomaton::create(argv[2], distance);
  if (!automaton) return fail(automaton.error());
  std::size_t hits = 0;
  index->search(*automaton, [&](std::string_view t) {
    std::cout << t << '\n';
    ++hits;
  });
  std::cerr << "[term_index_dump] matches=" << hits << std::endl;
  return 0;
}
