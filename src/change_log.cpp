#include "change_log.hpp"
#include <algorithm>

namespace scrub {

std::string entryStatusToString(EntryStatus status) {
  return status == EntryStatus::FAILED ? "FAILED" : "APPLIED";
}

nlohmann::json ChangeLogEntry::toJson() const {
  nlohmann::json json;
  json["operation"] = operationKindToString(kind);
  json["status"] = entryStatusToString(status);
  json["summary"] = summary;
  json["rows_before"] = rowsBefore;
  json["rows_after"] = rowsAfter;
  json["affected"] = affected;
  json["notes"] = notes;
  json["duration_ms"] = durationMs;
  return json;
}

void ChangeLog::append(ChangeLogEntry entry) {
  entries_.push_back(std::move(entry));
}

size_t ChangeLog::failedCount() const {
  return static_cast<size_t>(
      std::count_if(entries_.begin(), entries_.end(), [](const auto &e) {
        return e.status == EntryStatus::FAILED;
      }));
}

nlohmann::json ChangeLog::toJson() const {
  nlohmann::json json = nlohmann::json::array();
  for (const auto &entry : entries_) {
    json.push_back(entry.toJson());
  }
  return json;
}

} // namespace scrub
