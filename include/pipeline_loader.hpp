#pragma once

#include "change_log.hpp"
#include "dataset.hpp"
#include "dataset_summary.hpp"
#include "operation.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace scrub {

// A dataset and the ordered operations to run on it
struct CleaningJob {
  Dataset dataset;
  std::vector<OperationDescriptor> operations;
};

/**
 * Reads cleaning jobs from JSON and writes results back.
 *
 * Job layout:
 * {
 *   "dataset": {
 *     "columns": [{"name": "age", "type": "numeric", "values": [1, null]}],
 *     "row_ids": [10, 11]                       (optional, default 0..n-1)
 *   },
 *   "operations": [
 *     {"kind": "handle_missing", "method": "fill_mean",
 *      "columns": ["age"], "rows": [10]}
 *   ]
 * }
 *
 * A null value is a missing cell. Column type "auto" (the default) infers
 * the type from the values. Every malformed document raises a
 * ValidationException.
 */
class PipelineLoader {
public:
  static CleaningJob loadFile(const std::string &path);
  static CleaningJob parseString(const std::string &text);
  static CleaningJob parse(const nlohmann::json &document);

  static Dataset parseDataset(const nlohmann::json &json);
  static OperationDescriptor parseOperation(const nlohmann::json &json,
                                            size_t index);
  static CellValue parseCell(const nlohmann::json &value, ColumnType type);

  static nlohmann::json cellToJson(const CellValue &cell);
  static nlohmann::json datasetToJson(const Dataset &dataset);
  static nlohmann::json resultToJson(const Dataset &dataset,
                                     const ChangeLog &changeLog,
                                     const DatasetSummary &before,
                                     const DatasetSummary &after);
};

} // namespace scrub
