#include "missing_value_handler.hpp"
#include "component_logger.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>

namespace scrub {

using HandlerLogger = ComponentLogger<MissingValueHandler>;

MissingValueHandler::MissingValueHandler(HandleMissingParams params)
    : params_(std::move(params)) {}

OperationOutcome
MissingValueHandler::transform(const Dataset &subset,
                               const ColumnSelection &columns) const {
  if (params_.method == MissingValueMethod::FILL_CONSTANT &&
      isMissing(params_.constant)) {
    throw ValidationException(ErrorCode::INVALID_PARAMETER,
                              "fill_constant requires a non-null value",
                              "value", "null");
  }

  const std::string method = missingValueMethodToString(params_.method);

  if (columns.empty()) {
    OperationOutcome outcome;
    outcome.dataset = subset;
    outcome.summary = "0 missing values resolved (" + method + ")";
    outcome.notes.push_back("No columns in scope");
    return outcome;
  }

  if (params_.method == MissingValueMethod::DROP) {
    return dropRows(subset, columns.indices);
  }

  OperationOutcome outcome;
  outcome.dataset = subset;
  Dataset &data = outcome.dataset;

  for (ColumnIndex column : columns.indices) {
    size_t filled = 0;

    switch (params_.method) {
    case MissingValueMethod::FILL_FORWARD:
      filled = fillNeighbours(data, column, true);
      break;
    case MissingValueMethod::FILL_BACKWARD:
      filled = fillNeighbours(data, column, false);
      break;
    default: {
      auto value = fillValueFor(data, column, outcome.notes);
      if (!value) {
        continue;
      }
      for (RowPosition row = 0; row < data.rowCount(); ++row) {
        if (isMissing(data.cell(row, column))) {
          data.setCell(row, column, *value);
          ++filled;
        }
      }
      break;
    }
    }

    if (filled > 0) {
      HandlerLogger::debug("Filled {} cells in column '{}' using {}", filled,
                           data.column(column).name, method);
    }
    outcome.affected += filled;
    outcome.touchedColumns.push_back(column);
  }

  outcome.summary =
      std::to_string(outcome.affected) + " missing values resolved (" +
      method + ")";
  return outcome;
}

OperationOutcome
MissingValueHandler::dropRows(const Dataset &subset,
                              const std::vector<ColumnIndex> &columns) const {
  std::vector<RowPosition> kept;
  kept.reserve(subset.rowCount());
  for (RowPosition row = 0; row < subset.rowCount(); ++row) {
    bool hasMissing =
        std::any_of(columns.begin(), columns.end(), [&](ColumnIndex c) {
          return isMissing(subset.cell(row, c));
        });
    if (!hasMissing) {
      kept.push_back(row);
    }
  }

  OperationOutcome outcome;
  outcome.dataset = subset.selectRows(kept);
  outcome.affected = subset.rowCount() - kept.size();
  outcome.summary = std::to_string(outcome.affected) +
                    " rows with missing values dropped";
  outcome.touchedColumns = columns;
  return outcome;
}

size_t MissingValueHandler::fillNeighbours(Dataset &data, ColumnIndex column,
                                           bool forward) const {
  size_t filled = 0;
  std::optional<CellValue> last;
  const size_t rows = data.rowCount();

  for (size_t step = 0; step < rows; ++step) {
    RowPosition row = forward ? step : rows - 1 - step;
    const CellValue &cell = data.cell(row, column);
    if (!isMissing(cell)) {
      last = cell;
    } else if (last) {
      data.setCell(row, column, *last);
      ++filled;
    }
  }
  return filled;
}

std::optional<CellValue>
MissingValueHandler::fillValueFor(const Dataset &data, ColumnIndex column,
                                  std::vector<std::string> &notes) const {
  const Column &col = data.column(column);

  if (params_.method == MissingValueMethod::FILL_CONSTANT) {
    return params_.constant;
  }

  if (params_.method == MissingValueMethod::FILL_MODE) {
    auto value = mode(col.cells);
    if (!value) {
      notes.push_back("Column '" + col.name +
                      "' has no values to take the mode of, left missing");
    }
    return value;
  }

  // fill_mean / fill_median
  if (col.type != ColumnType::NUMERIC) {
    notes.push_back("Column '" + col.name + "' skipped: " +
                    missingValueMethodToString(params_.method) +
                    " needs a numeric column");
    HandlerLogger::debug("Skipping non-numeric column '{}'", col.name);
    return std::nullopt;
  }

  std::vector<double> values;
  for (const auto &cell : col.cells) {
    if (const double *number = std::get_if<double>(&cell)) {
      values.push_back(*number);
    }
  }

  auto statistic = params_.method == MissingValueMethod::FILL_MEAN
                       ? mean(values)
                       : median(std::move(values));
  if (!statistic) {
    notes.push_back("Column '" + col.name +
                    "' has no values to compute from, left missing");
    return std::nullopt;
  }
  if (!std::isfinite(*statistic)) {
    notes.push_back("Column '" + col.name +
                    "' statistic is not finite, left missing");
    HandlerLogger::warn("Non-finite {} for column '{}'",
                        missingValueMethodToString(params_.method), col.name);
    return std::nullopt;
  }
  return CellValue{*statistic};
}

std::optional<double>
MissingValueHandler::mean(const std::vector<double> &values) {
  if (values.empty()) {
    return std::nullopt;
  }
  double sum = std::accumulate(values.begin(), values.end(), 0.0);
  return sum / static_cast<double>(values.size());
}

std::optional<double> MissingValueHandler::median(std::vector<double> values) {
  if (values.empty()) {
    return std::nullopt;
  }
  std::sort(values.begin(), values.end());
  size_t mid = values.size() / 2;
  if (values.size() % 2 == 1) {
    return values[mid];
  }
  return (values[mid - 1] + values[mid]) / 2.0;
}

std::optional<CellValue>
MissingValueHandler::mode(const std::vector<CellValue> &cells) {
  std::map<CellValue, size_t> counts;
  for (const auto &cell : cells) {
    if (!isMissing(cell)) {
      ++counts[cell];
    }
  }

  std::optional<CellValue> best;
  size_t bestCount = 0;
  // Ascending order, so the first maximum is the smallest tied value
  for (const auto &[value, count] : counts) {
    if (count > bestCount) {
      best = value;
      bestCount = count;
    }
  }
  return best;
}

} // namespace scrub
