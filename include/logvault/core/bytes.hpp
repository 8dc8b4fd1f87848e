#pragma once

/** \file bytes.hpp
 *  \brief Little-endian load/store helpers for on-disk layouts.
 *
 * Callers are responsible for bounds; these helpers never check.
 */

#include <cstdint>
#include <cstring>
#include <vector>

namespace logvault::core {

inline auto load_le64(const std::uint8_t* p) -> std::uint64_t {
  std::uint64_t v;
  std::memcpy(&v, p, 8);
  return v;
}

inline void append_le64(std::vector<std::uint8_t>& out, std::uint64_t v) {
  const auto n = out.size(); out.resize(n + 8); std::memcpy(out.data() + n, &v, 8);
}

} // namespace logvault::core
