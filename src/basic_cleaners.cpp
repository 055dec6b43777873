#include "basic_cleaners.hpp"
#include "component_logger.hpp"
#include "string_utils.hpp"

namespace scrub {

WhitespaceTrimmer::WhitespaceTrimmer(TrimWhitespaceParams params)
    : params_(params) {}

OperationOutcome
WhitespaceTrimmer::transform(const Dataset &subset,
                             const ColumnSelection &columns) const {
  OperationOutcome outcome;
  outcome.dataset = subset;
  Dataset &data = outcome.dataset;

  for (ColumnIndex column : columns.indices) {
    size_t changed = 0;
    for (RowPosition row = 0; row < data.rowCount(); ++row) {
      const auto *text = std::get_if<std::string>(&data.cell(row, column));
      if (text == nullptr) {
        continue;
      }
      auto trimmed = string_utils::trim(*text);
      if (trimmed.size() != text->size()) {
        data.setCell(row, column, std::string(trimmed));
        ++changed;
      }
    }
    if (changed > 0) {
      ComponentLogger<WhitespaceTrimmer>::debug(
          "Trimmed {} cells in column '{}'", changed,
          data.column(column).name);
      outcome.touchedColumns.push_back(column);
    }
    outcome.affected += changed;
  }

  outcome.summary = std::to_string(outcome.affected) + " cells trimmed";
  return outcome;
}

EmptyRowRemover::EmptyRowRemover(RemoveEmptyRowsParams params)
    : params_(params) {}

OperationOutcome EmptyRowRemover::transform(const Dataset &subset) const {
  std::vector<RowPosition> kept;
  kept.reserve(subset.rowCount());
  for (RowPosition row = 0; row < subset.rowCount(); ++row) {
    if (!subset.rowIsEmpty(row)) {
      kept.push_back(row);
    }
  }

  OperationOutcome outcome;
  outcome.dataset = subset.selectRows(kept);
  outcome.affected = subset.rowCount() - kept.size();
  outcome.summary = std::to_string(outcome.affected) + " empty rows removed";
  for (ColumnIndex i = 0; i < subset.columnCount(); ++i) {
    outcome.touchedColumns.push_back(i);
  }

  if (outcome.affected > 0) {
    ComponentLogger<EmptyRowRemover>::debug("Removed {} empty rows",
                                            outcome.affected);
  }
  return outcome;
}

} // namespace scrub
