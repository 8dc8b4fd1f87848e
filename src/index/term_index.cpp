#include "logvault/index/term_index.hpp"

#include <algorithm>
#include <fstream>
#include <limits>
#include <new>
#include <sstream>
#include <system_error>
#include <utility>

#include <fst/arcsort.h>
#include <fst/matcher.h>
#include <fst/minimize.h>
#include <fst/vector-fst.h>

namespace logvault::index {

namespace {

using Arc = fst::StdArc;
using StateId = Arc::StateId;

constexpr const char* kSource = "term_index";
constexpr Arc::Label kMaxLabel = 256;

auto corrupt(const std::string& what) -> std::unexpected<core::error> {
  return std::unexpected(core::error{core::error_code::data_integrity, what, "index.term_index"});
}

auto is_final(const TermFst& f, StateId s) -> bool {
  return f.Final(s) != Arc::Weight::Zero();
}

auto arcs_of(const TermFst& f, StateId s) -> std::span<const Arc> {
  fst::ArcIteratorData<Arc> data;
  f.InitArcIterator(s, &data);
  return {data.arcs, data.narcs};
}

auto saturating_add(std::size_t a, std::size_t b) -> std::size_t {
  return (a > std::numeric_limits<std::size_t>::max() - b) ? std::numeric_limits<std::size_t>::max() : a + b;
}

// Every arc must be a byte label on an acceptor, strictly ascending per state
// (sorted and deterministic) and point at an existing state.
auto check_arcs(const fst::StdVectorFst& raw) -> std::expected<void, core::error> {
  const StateId n = raw.NumStates();
  for (fst::StateIterator<fst::StdVectorFst> siter(raw); !siter.Done(); siter.Next()) {
    Arc::Label prev = 0;
    for (fst::ArcIterator<fst::StdVectorFst> aiter(raw, siter.Value()); !aiter.Done(); aiter.Next()) {
      const Arc& arc = aiter.Value();
      if (arc.ilabel != arc.olabel) return corrupt("term index is not an acceptor");
      if (arc.ilabel < 1 || arc.ilabel > kMaxLabel) return corrupt("arc label outside byte range");
      if (arc.ilabel <= prev) return corrupt("arcs not sorted or not deterministic");
      if (arc.nextstate < 0 || arc.nextstate >= n) return corrupt("arc target out of range");
      prev = arc.ilabel;
    }
  }
  const StateId start = raw.Start();
  if (start != fst::kNoStateId && (start < 0 || start >= n)) return corrupt("start state out of range");
  return {};
}

// Number of accepted terms reachable from `start`; fails on a cycle. Header
// properties are not trusted for acyclicity.
auto count_terms(const TermFst& f, StateId start) -> std::expected<std::size_t, core::error> {
  if (start == fst::kNoStateId) return std::size_t{0};
  enum : std::uint8_t { kWhite = 0, kGrey = 1, kBlack = 2 };
  const auto n = static_cast<std::size_t>(f.NumStates());
  std::vector<std::uint8_t> color(n, kWhite);
  std::vector<std::size_t> paths(n, 0);

  struct Frame { StateId state; std::span<const Arc> arcs; std::size_t next; };
  std::vector<Frame> stack;
  color[start] = kGrey;
  stack.push_back({start, arcs_of(f, start), 0});
  while (!stack.empty()) {
    auto& top = stack.back();
    if (top.next < top.arcs.size()) {
      const StateId target = top.arcs[top.next++].nextstate;
      if (color[target] == kGrey) return corrupt("term index contains a cycle");
      if (color[target] == kWhite) {
        color[target] = kGrey;
        stack.push_back({target, arcs_of(f, target), 0});
      }
      continue;
    }
    std::size_t total = is_final(f, top.state) ? 1 : 0;
    for (const Arc& arc : top.arcs) total = saturating_add(total, paths[arc.nextstate]);
    paths[top.state] = total;
    color[top.state] = kBlack;
    stack.pop_back();
  }
  return paths[start];
}

} // namespace

auto TermIndex::from_bytes(std::span<const std::uint8_t> bytes)
    -> std::expected<TermIndex, core::error> {
  std::istringstream strm(std::string(bytes.begin(), bytes.end()), std::ios::in | std::ios::binary);
  fst::FstHeader hdr;
  if (!hdr.Read(strm, kSource, /*rewind=*/true)) return corrupt("term index header unreadable");
  if (hdr.FstType() != "vector") return corrupt("unexpected fst type: " + hdr.FstType());
  if (hdr.ArcType() != Arc::Type()) return corrupt("unexpected arc type: " + hdr.ArcType());
  // Every state takes at least one byte; reject counts the image cannot hold before allocating.
  if (hdr.NumStates() > static_cast<std::int64_t>(bytes.size())) return corrupt("state count exceeds file size");

  std::unique_ptr<fst::StdVectorFst> raw;
  try {
    raw.reset(fst::StdVectorFst::Read(strm, fst::FstReadOptions(kSource)));
  } catch (const std::bad_alloc&) {
    return std::unexpected(core::error{core::error_code::resource_exhausted, "term index too large", "index.term_index"});
  }
  if (!raw) return corrupt("term index body unreadable");
  if (auto ok = check_arcs(*raw); !ok) return std::unexpected(ok.error());

  TermIndex idx;
  idx.fst_ = std::make_shared<const TermFst>(*raw);
  idx.start_ = idx.fst_->Start();
  idx.state_count_ = static_cast<std::size_t>(idx.fst_->NumStates());
  auto terms = count_terms(*idx.fst_, idx.start_);
  if (!terms) return std::unexpected(terms.error());
  idx.term_count_ = *terms;
  return idx;
}

auto TermIndex::load(const std::filesystem::path& path)
    -> std::expected<TermIndex, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return std::unexpected(error{error_code::not_found, "term index not found: " + path.string(), "index.term_index"});
    }
    return std::unexpected(error{error_code::io_failed, "term index stat failed: " + path.string(), "index.term_index"});
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) {
    return std::unexpected(error{error_code::io_failed, "term index open failed: " + path.string(), "index.term_index"});
  }
  std::vector<std::uint8_t> bytes;
  try {
    bytes.resize(static_cast<std::size_t>(size));
  } catch (const std::bad_alloc&) {
    return std::unexpected(error{error_code::resource_exhausted, "term index too large", "index.term_index"});
  }
  if (size > 0) {
    in.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(size));
    if (in.gcount() != static_cast<std::streamsize>(size)) {
      return std::unexpected(error{error_code::io_eof, "short read on term index", "index.term_index"});
    }
  }
  return from_bytes(bytes);
}

auto TermIndex::contains(std::string_view term) const -> bool {
  if (start_ == fst::kNoStateId) return false;
  fst::SortedMatcher<TermFst> matcher(*fst_, fst::MATCH_INPUT);
  StateId s = start_;
  for (char c : term) {
    matcher.SetState(s);
    if (!matcher.Find(byte_label(static_cast<std::uint8_t>(c)))) return false;
    s = matcher.Value().nextstate;
  }
  return is_final(*fst_, s);
}

void TermIndex::for_each_term(const std::function<void(std::string_view)>& on_term) const {
  if (start_ == fst::kNoStateId) return;
  // Explicit stack: depth is bounded by the longest term, not by the call stack.
  struct Frame { std::span<const Arc> arcs; std::size_t next; };
  std::vector<Frame> stack;
  std::string term;
  if (is_final(*fst_, start_)) on_term(term);
  stack.push_back({arcs_of(*fst_, start_), 0});
  while (!stack.empty()) {
    auto& top = stack.back();
    if (top.next == top.arcs.size()) {
      stack.pop_back();
      if (!stack.empty()) term.pop_back();
      continue;
    }
    const Arc& arc = top.arcs[top.next++];
    term.push_back(static_cast<char>(arc.ilabel - 1));
    if (is_final(*fst_, arc.nextstate)) on_term(term);
    stack.push_back({arcs_of(*fst_, arc.nextstate), 0});
  }
}

void TermIndex::search(const LevenshteinAutomaton& automaton,
                       const std::function<void(std::string_view)>& on_term) const {
  if (start_ == fst::kNoStateId) return;
  // Product walk of the term acceptor and the Levenshtein acceptor; a branch is
  // cut as soon as the Levenshtein side can no longer accept.
  struct Frame {
    std::span<const Arc> arcs;
    std::size_t next;
    LevenshteinAutomaton::State state;
  };
  std::vector<Frame> stack;
  std::string term;
  auto root_state = automaton.start();
  if (is_final(*fst_, start_) && automaton.is_match(root_state)) on_term(term);
  stack.push_back({arcs_of(*fst_, start_), 0, std::move(root_state)});
  while (!stack.empty()) {
    auto& top = stack.back();
    if (top.next == top.arcs.size()) {
      stack.pop_back();
      if (!stack.empty()) term.pop_back();
      continue;
    }
    const Arc& arc = top.arcs[top.next++];
    const auto byte = static_cast<std::uint8_t>(arc.ilabel - 1);
    auto child_state = automaton.step(top.state, byte);
    if (!automaton.can_match(child_state)) continue;
    term.push_back(static_cast<char>(byte));
    if (is_final(*fst_, arc.nextstate) && automaton.is_match(child_state)) on_term(term);
    stack.push_back({arcs_of(*fst_, arc.nextstate), 0, std::move(child_state)});
  }
}

auto TermIndex::fuzzy_terms(const LevenshteinAutomaton& automaton) const -> std::vector<std::string> {
  std::vector<std::string> out;
  search(automaton, [&](std::string_view t) { out.emplace_back(t); });
  return out;
}

auto build_term_index(std::vector<std::string> terms)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::sort(terms.begin(), terms.end());
  terms.erase(std::unique(terms.begin(), terms.end()), terms.end());

  // Sorted insertion: a shared prefix always continues through the last arc added.
  fst::StdVectorFst trie;
  const StateId root = trie.AddState();
  trie.SetStart(root);
  for (const auto& term : terms) {
    StateId s = root;
    for (char c : term) {
      const Arc::Label label = byte_label(static_cast<std::uint8_t>(c));
      StateId next = fst::kNoStateId;
      if (const auto narcs = trie.NumArcs(s); narcs > 0) {
        fst::ArcIterator<fst::StdVectorFst> last(trie, s);
        last.Seek(narcs - 1);
        if (last.Value().ilabel == label) next = last.Value().nextstate;
      }
      if (next == fst::kNoStateId) {
        next = trie.AddState();
        trie.AddArc(s, Arc(label, label, Arc::Weight::One(), next));
      }
      s = next;
    }
    trie.SetFinal(s, Arc::Weight::One());
  }
  if (!terms.empty()) fst::Minimize(&trie);
  fst::ArcSort(&trie, fst::ILabelCompare<Arc>());

  std::ostringstream out(std::ios::out | std::ios::binary);
  if (!trie.Write(out, fst::FstWriteOptions(kSource))) {
    return std::unexpected(core::error{core::error_code::internal, "term index serialization failed", "index.term_index"});
  }
  const std::string image = out.str();
  return std::vector<std::uint8_t>(image.begin(), image.end());
}

auto write_term_index(const std::filesystem::path& path, std::vector<std::string> terms)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto bytes = build_term_index(std::move(terms));
  if (!bytes) return std::unexpected(bytes.error());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.good()) {
    return std::unexpected(error{error_code::io_failed, "term index create failed: " + path.string(), "index.term_index"});
  }
  out.write(reinterpret_cast<const char*>(bytes->data()), static_cast<std::streamsize>(bytes->size()));
  out.flush();
  if (!out.good()) {
    return std::unexpected(error{error_code::io_failed, "term index write failed: " + path.string(), "index.term_index"});
  }
  return {};
}

} // namespace logvault::index
