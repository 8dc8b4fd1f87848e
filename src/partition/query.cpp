#include "logvault/partition/query.hpp"
#include "logvault/core/platform_utils.hpp"

namespace logvault::partition {

auto options_from_env(SegmentIteratorOptions base) -> SegmentIteratorOptions {
  if (auto v = core::env_u64("LOGVAULT_MAX_SEGMENT_BYTES")) base.max_segment_bytes = *v;
  if (core::safe_getenv("LOGVAULT_QUERY_DEBUG")) base.debug = core::env_flag("LOGVAULT_QUERY_DEBUG");
  return base;
}

} // namespace logvault::partition
