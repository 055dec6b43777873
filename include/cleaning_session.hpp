#pragma once

#include "change_log.hpp"
#include "dataset.hpp"

namespace scrub {

/**
 * Caller-owned state of one cleaning run: the dataset as loaded, the
 * current snapshot and the change log. Sessions are independent of each
 * other; the engine keeps no state between calls.
 */
class CleaningSession {
public:
  explicit CleaningSession(Dataset dataset);

  const Dataset &original() const noexcept { return original_; }
  const Dataset &current() const noexcept { return current_; }
  const ChangeLog &changeLog() const noexcept { return changeLog_; }

  // Replace the current snapshot and record the entry that produced it
  void commit(Dataset next, ChangeLogEntry entry);

  // Record a failed operation; the current snapshot is kept
  void recordFailure(ChangeLogEntry entry);

  // Back to the original dataset with an empty change log
  void reset();

private:
  Dataset original_;
  Dataset current_;
  ChangeLog changeLog_;
};

} // namespace scrub
