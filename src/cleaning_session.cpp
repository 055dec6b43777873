#include "cleaning_session.hpp"
#include "component_logger.hpp"

namespace scrub {

CleaningSession::CleaningSession(Dataset dataset)
    : original_(dataset), current_(std::move(dataset)) {}

void CleaningSession::commit(Dataset next, ChangeLogEntry entry) {
  entry.status = EntryStatus::APPLIED;
  current_ = std::move(next);
  changeLog_.append(std::move(entry));
}

void CleaningSession::recordFailure(ChangeLogEntry entry) {
  entry.status = EntryStatus::FAILED;
  entry.rowsAfter = entry.rowsBefore;
  changeLog_.append(std::move(entry));
}

void CleaningSession::reset() {
  ComponentLogger<CleaningSession>::debug(
      "Resetting session, discarding {} change log entries", changeLog_.size());
  current_ = original_;
  changeLog_ = ChangeLog{};
}

} // namespace scrub
