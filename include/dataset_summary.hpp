#pragma once

#include "dataset.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace scrub {

struct ColumnSummary {
  std::string name;
  ColumnType type = ColumnType::TEXT;
  size_t missing = 0;
  size_t distinct = 0; // distinct present values

  nlohmann::json toJson() const;
};

// Shape and missing-value statistics shown before and after cleaning
struct DatasetSummary {
  size_t rows = 0;
  size_t columns = 0;
  size_t missingCells = 0;
  std::vector<ColumnSummary> columnSummaries;

  static DatasetSummary of(const Dataset &dataset);
  nlohmann::json toJson() const;
};

struct SummaryDiff {
  long long rowsRemoved = 0;
  long long missingResolved = 0; // negative when cleaning introduced missing
  std::vector<std::string> typeChanges; // "name: before -> after"

  static SummaryDiff between(const DatasetSummary &before,
                             const DatasetSummary &after);
  nlohmann::json toJson() const;
};

} // namespace scrub
