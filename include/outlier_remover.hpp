#pragma once

#include "config_manager.hpp"
#include "operation.hpp"
#include "scope_resolver.hpp"
#include <optional>
#include <vector>

namespace scrub {

// Closed interval of accepted values for one column
struct OutlierBounds {
  ColumnIndex column = 0;
  double lower = 0.0;
  double upper = 0.0;

  bool accepts(double value) const noexcept {
    return value >= lower && value <= upper;
  }
};

/**
 * Removes rows holding an outlier in any selected NUMERIC column.
 *
 * Bounds for every column are computed from the untouched subset before any
 * row is removed, then all columns are checked in a single pass, so the
 * result does not depend on column order.
 */
class OutlierRemover {
public:
  OutlierRemover(RemoveOutliersParams params, EngineConfig config);

  OperationOutcome transform(const Dataset &subset,
                             const ColumnSelection &columns) const;

  // Linear interpolation between closest ranks; values must be sorted
  static double quantile(const std::vector<double> &sorted, double p);

  std::optional<OutlierBounds> boundsFor(const Dataset &subset,
                                         ColumnIndex column) const;

private:
  RemoveOutliersParams params_;
  EngineConfig config_;
};

} // namespace scrub
