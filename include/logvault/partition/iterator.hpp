#pragma once

/** \file iterator.hpp
 *  \brief Pull-based forward iteration over decoded entries.
 *
 * Protocol: entry() reads the current entry without consuming it; next()
 * advances and returns false once the iterator moves past the last entry.
 * Exhaustion is terminal. Neither call fails.
 */

#include "logvault/segment/entry.hpp"

namespace logvault::partition {

class Iterator {
public:
  virtual ~Iterator() = default;

  /** Current entry, or nullptr once exhausted. */
  virtual auto entry() const -> segment::EntryRef = 0;

  /** Advance; false when no entry remains under the cursor. */
  virtual auto next() -> bool = 0;
};

} // namespace logvault::partition
