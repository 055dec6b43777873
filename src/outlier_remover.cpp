#include "outlier_remover.hpp"
#include "component_logger.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace scrub {

using OutlierLogger = ComponentLogger<OutlierRemover>;

OutlierRemover::OutlierRemover(RemoveOutliersParams params,
                               EngineConfig config)
    : params_(params), config_(std::move(config)) {}

double OutlierRemover::quantile(const std::vector<double> &sorted, double p) {
  if (sorted.empty()) {
    return 0.0;
  }
  double h = static_cast<double>(sorted.size() - 1) * p;
  auto lo = static_cast<size_t>(std::floor(h));
  if (lo + 1 >= sorted.size()) {
    return sorted.back();
  }
  return sorted[lo] + (h - static_cast<double>(lo)) *
                          (sorted[lo + 1] - sorted[lo]);
}

std::optional<OutlierBounds>
OutlierRemover::boundsFor(const Dataset &subset, ColumnIndex column) const {
  std::vector<double> values;
  for (const auto &cell : subset.column(column).cells) {
    if (const double *number = std::get_if<double>(&cell)) {
      values.push_back(*number);
    }
  }
  if (values.empty()) {
    return std::nullopt;
  }

  if (params_.method == OutlierMethod::IQR) {
    std::sort(values.begin(), values.end());
    double q1 = quantile(values, 0.25);
    double q3 = quantile(values, 0.75);
    double spread = config_.iqrMultiplier * (q3 - q1);
    if (!std::isfinite(q1 - spread) || !std::isfinite(q3 + spread)) {
      return std::nullopt;
    }
    return OutlierBounds{column, q1 - spread, q3 + spread};
  }

  double n = static_cast<double>(values.size());
  double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
  double squares = 0.0;
  for (double v : values) {
    squares += (v - mean) * (v - mean);
  }
  double stddev = std::sqrt(squares / n);
  // Overflowing statistics flag nothing, like a zero deviation
  if (!std::isfinite(mean) || !std::isfinite(stddev) || stddev == 0.0) {
    return std::nullopt;
  }
  double spread = config_.zscoreThreshold * stddev;
  return OutlierBounds{column, mean - spread, mean + spread};
}

OperationOutcome
OutlierRemover::transform(const Dataset &subset,
                          const ColumnSelection &columns) const {
  OperationOutcome outcome;

  std::vector<OutlierBounds> bounds;
  for (ColumnIndex column : columns.indices) {
    const Column &col = subset.column(column);
    if (col.type != ColumnType::NUMERIC) {
      if (columns.explicitScope) {
        outcome.notes.push_back("Column '" + col.name +
                                "' skipped: not a numeric column");
        OutlierLogger::debug("Skipping {} column '{}'",
                             columnTypeToString(col.type), col.name);
      }
      continue;
    }
    if (auto b = boundsFor(subset, column)) {
      OutlierLogger::debug("Column '{}' accepts [{}, {}]", col.name, b->lower,
                           b->upper);
      bounds.push_back(*b);
    }
    outcome.touchedColumns.push_back(column);
  }

  std::vector<RowPosition> kept;
  kept.reserve(subset.rowCount());
  for (RowPosition row = 0; row < subset.rowCount(); ++row) {
    bool outlier = std::any_of(
        bounds.begin(), bounds.end(), [&](const OutlierBounds &b) {
          const double *number = std::get_if<double>(&subset.cell(row, b.column));
          return number != nullptr && !b.accepts(*number);
        });
    if (!outlier) {
      kept.push_back(row);
    }
  }

  outcome.dataset = subset.selectRows(kept);
  outcome.affected = subset.rowCount() - kept.size();
  outcome.summary = std::to_string(outcome.affected) +
                    " outlier rows removed (" +
                    outlierMethodToString(params_.method) + ")";
  return outcome;
}

} // namespace scrub
