#include "duplicate_remover.hpp"
#include "component_logger.hpp"
#include <set>

namespace scrub {

DuplicateRemover::DuplicateRemover(RemoveDuplicatesParams params)
    : params_(params) {}

OperationOutcome
DuplicateRemover::transform(const Dataset &subset,
                            const ColumnSelection &columns) const {
  OperationOutcome outcome;

  std::vector<ColumnIndex> keys = columns.indices;
  if (keys.empty()) {
    if (columns.explicitScope) {
      outcome.notes.push_back(
          "No requested column exists, comparing all columns");
    }
    for (ColumnIndex i = 0; i < subset.columnCount(); ++i) {
      keys.push_back(i);
    }
  }

  std::set<std::vector<CellValue>> seen;
  std::vector<RowPosition> kept;
  kept.reserve(subset.rowCount());

  for (RowPosition row = 0; row < subset.rowCount(); ++row) {
    std::vector<CellValue> key;
    key.reserve(keys.size());
    for (ColumnIndex c : keys) {
      key.push_back(subset.cell(row, c));
    }
    if (seen.insert(std::move(key)).second) {
      kept.push_back(row);
    }
  }

  size_t removed = subset.rowCount() - kept.size();
  ComponentLogger<DuplicateRemover>::debug(
      "Compared {} rows on {} key columns, {} duplicates", subset.rowCount(),
      keys.size(), removed);

  outcome.dataset = subset.selectRows(kept);
  outcome.affected = removed;
  outcome.summary = std::to_string(removed) + " duplicate rows removed";
  outcome.touchedColumns = std::move(keys);
  return outcome;
}

} // namespace scrub
