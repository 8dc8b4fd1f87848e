#include "logvault/index/levenshtein.hpp"

#include <algorithm>
#include <optional>

namespace logvault::index {

namespace {

// Marks bytes that are not part of any valid UTF-8 sequence; beyond the Unicode range.
constexpr std::uint32_t kInvalidSymbolBase = 0x110000u;

// Number of continuation bytes announced by a lead byte; nullopt for a non-lead byte.
auto utf8_continuations(std::uint8_t lead) -> std::optional<std::uint8_t> {
  if (lead < 0x80) return 0;
  if ((lead & 0xE0) == 0xC0 && lead >= 0xC2) return 1;
  if ((lead & 0xF0) == 0xE0) return 2;
  if ((lead & 0xF8) == 0xF0 && lead <= 0xF4) return 3;
  return std::nullopt;
}

auto decode_utf8(std::string_view s) -> std::optional<std::vector<std::uint32_t>> {
  static constexpr std::uint32_t kMinForLength[4] = {0, 0x80u, 0x800u, 0x10000u};
  std::vector<std::uint32_t> out;
  out.reserve(s.size());
  std::size_t i = 0;
  while (i < s.size()) {
    const auto lead = static_cast<std::uint8_t>(s[i]);
    const auto more = utf8_continuations(lead);
    if (!more || *more > s.size() - i - 1) return std::nullopt;
    std::uint32_t cp = (*more == 0) ? lead : (lead & (0x3Fu >> *more));
    for (std::uint8_t k = 1; k <= *more; ++k) {
      const auto c = static_cast<std::uint8_t>(s[i + k]);
      if ((c & 0xC0) != 0x80) return std::nullopt;
      cp = (cp << 6) | (c & 0x3Fu);
    }
    if (cp < kMinForLength[*more] || cp > 0x10FFFFu || (cp >= 0xD800u && cp <= 0xDFFFu)) {
      return std::nullopt;
    }
    out.push_back(cp);
    i += 1 + *more;
  }
  return out;
}

} // namespace

auto LevenshteinAutomaton::create(std::string_view query, std::uint32_t max_distance)
    -> std::expected<LevenshteinAutomaton, core::error> {
  using core::error; using core::error_code;
  if (max_distance > kMaxDistance) {
    return std::unexpected(error{error_code::invalid_argument, "edit distance too large", "index.levenshtein"});
  }
  auto cps = decode_utf8(query);
  if (!cps) {
    return std::unexpected(error{error_code::invalid_argument, "query is not valid UTF-8", "index.levenshtein"});
  }
  if (cps->size() > kMaxQueryChars) {
    return std::unexpected(error{error_code::invalid_argument, "query exceeds automaton limit", "index.levenshtein"});
  }
  return LevenshteinAutomaton(std::move(*cps), max_distance);
}

auto LevenshteinAutomaton::start() const -> State {
  State s;
  s.row.resize(query_.size() + 1);
  const auto cap = static_cast<std::uint8_t>(max_distance_ + 1);
  for (std::size_t i = 0; i < s.row.size(); ++i) {
    s.row[i] = static_cast<std::uint8_t>(std::min<std::size_t>(i, cap));
  }
  return s;
}

void LevenshteinAutomaton::advance_row(State& s, std::uint32_t symbol) const {
  const auto cap = static_cast<std::uint8_t>(max_distance_ + 1);
  std::vector<std::uint8_t> next(s.row.size());
  next[0] = static_cast<std::uint8_t>(std::min<int>(s.row[0] + 1, cap));
  for (std::size_t i = 1; i < next.size(); ++i) {
    const int cost = (query_[i - 1] == symbol) ? 0 : 1;
    const int v = std::min({s.row[i] + 1, next[i - 1] + 1, s.row[i - 1] + cost});
    next[i] = static_cast<std::uint8_t>(std::min<int>(v, cap));
  }
  s.row = std::move(next);
}

auto LevenshteinAutomaton::step(const State& s, std::uint8_t byte) const -> State {
  State n = s;
  if (n.pending_left > 0) {
    if ((byte & 0xC0) == 0x80) {
      n.pending_cp = (n.pending_cp << 6) | (byte & 0x3Fu);
      if (--n.pending_left == 0) {
        advance_row(n, n.pending_cp);
        n.pending_cp = 0;
      }
      return n;
    }
    // Truncated sequence: the bytes seen so far count as one invalid symbol.
    advance_row(n, kInvalidSymbolBase + n.pending_cp);
    n.pending_cp = 0;
    n.pending_left = 0;
  }
  const auto more = utf8_continuations(byte);
  if (!more) {
    advance_row(n, kInvalidSymbolBase + byte);
  } else if (*more == 0) {
    advance_row(n, byte);
  } else {
    n.pending_cp = byte & (0x3Fu >> *more);
    n.pending_left = *more;
  }
  return n;
}

auto LevenshteinAutomaton::is_match(const State& s) const noexcept -> bool {
  return s.pending_left == 0 && s.row.back() <= max_distance_;
}

auto LevenshteinAutomaton::can_match(const State& s) const noexcept -> bool {
  // A pending sequence will consume at least one more symbol; the row minimum
  // is still a lower bound on any completion.
  return *std::min_element(s.row.begin(), s.row.end()) <= max_distance_;
}

auto edit_distance(std::string_view a, std::string_view b, std::uint32_t max_cost) -> std::uint32_t {
  const std::uint32_t cap = std::min(max_cost, LevenshteinAutomaton::kMaxDistance);
  auto automaton = LevenshteinAutomaton::create(a, cap);
  if (!automaton) return cap + 1;
  auto s = automaton->start();
  for (char c : b) {
    s = automaton->step(s, static_cast<std::uint8_t>(c));
    if (!automaton->can_match(s)) return cap + 1;
  }
  if (s.pending_left != 0) return cap + 1;
  return std::min<std::uint32_t>(s.row.back(), cap + 1);
}

} // namespace logvault::index
