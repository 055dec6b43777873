#include "dataset_summary.hpp"
#include <set>

namespace scrub {

nlohmann::json ColumnSummary::toJson() const {
  return {{"name", name},
          {"type", columnTypeToString(type)},
          {"missing", missing},
          {"distinct", distinct}};
}

DatasetSummary DatasetSummary::of(const Dataset &dataset) {
  DatasetSummary summary;
  summary.rows = dataset.rowCount();
  summary.columns = dataset.columnCount();

  for (ColumnIndex i = 0; i < dataset.columnCount(); ++i) {
    const Column &col = dataset.column(i);
    std::set<CellValue> distinct;
    size_t missing = 0;
    for (const auto &cell : col.cells) {
      if (isMissing(cell)) {
        ++missing;
      } else {
        distinct.insert(cell);
      }
    }
    summary.missingCells += missing;
    summary.columnSummaries.push_back(
        ColumnSummary{col.name, col.type, missing, distinct.size()});
  }
  return summary;
}

nlohmann::json DatasetSummary::toJson() const {
  nlohmann::json json;
  json["rows"] = rows;
  json["columns"] = columns;
  json["missing_cells"] = missingCells;
  json["column_summaries"] = nlohmann::json::array();
  for (const auto &column : columnSummaries) {
    json["column_summaries"].push_back(column.toJson());
  }
  return json;
}

SummaryDiff SummaryDiff::between(const DatasetSummary &before,
                                 const DatasetSummary &after) {
  SummaryDiff diff;
  diff.rowsRemoved = static_cast<long long>(before.rows) -
                     static_cast<long long>(after.rows);
  diff.missingResolved = static_cast<long long>(before.missingCells) -
                         static_cast<long long>(after.missingCells);

  for (const auto &previous : before.columnSummaries) {
    for (const auto &current : after.columnSummaries) {
      if (current.name == previous.name && current.type != previous.type) {
        diff.typeChanges.push_back(previous.name + ": " +
                                   columnTypeToString(previous.type) + " -> " +
                                   columnTypeToString(current.type));
      }
    }
  }
  return diff;
}

nlohmann::json SummaryDiff::toJson() const {
  return {{"rows_removed", rowsRemoved},
          {"missing_resolved", missingResolved},
          {"type_changes", typeChanges}};
}

} // namespace scrub
