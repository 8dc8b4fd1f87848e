#include "logvault/core/platform_utils.hpp"

#include <charconv>
#include <system_error>

namespace logvault::core {

std::optional<std::uint64_t> env_u64(const char* name) noexcept {
    auto v = safe_getenv(name);
    if (!v || v->empty()) return std::nullopt;
    std::uint64_t out = 0;
    const char* first = v->data();
    const char* last = v->data() + v->size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

} // namespace logvault::core
