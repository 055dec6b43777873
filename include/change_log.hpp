#pragma once

#include "operation.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace scrub {

enum class EntryStatus { APPLIED, FAILED };

std::string entryStatusToString(EntryStatus status);

struct ChangeLogEntry {
  OperationKind kind = OperationKind::REMOVE_DUPLICATES;
  std::string summary;
  size_t rowsBefore = 0;
  size_t rowsAfter = 0;
  size_t affected = 0;
  EntryStatus status = EntryStatus::APPLIED;
  std::vector<std::string> notes;
  double durationMs = 0.0;

  nlohmann::json toJson() const;
};

// Append-only record of the operations run on a session, in order
class ChangeLog {
public:
  void append(ChangeLogEntry entry);

  const std::vector<ChangeLogEntry> &entries() const noexcept {
    return entries_;
  }
  size_t size() const noexcept { return entries_.size(); }
  bool empty() const noexcept { return entries_.empty(); }
  size_t failedCount() const;

  nlohmann::json toJson() const;

private:
  std::vector<ChangeLogEntry> entries_;
};

} // namespace scrub
