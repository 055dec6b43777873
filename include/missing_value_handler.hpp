#pragma once

#include "operation.hpp"
#include "scope_resolver.hpp"
#include <optional>
#include <vector>

namespace scrub {

/**
 * Resolves missing cells in the selected columns.
 *
 * Statistics and neighbour fills only ever see the in-scope subset, so a
 * value outside the row scope never supplies a fill. fill_mean and
 * fill_median apply to NUMERIC columns only; other columns are skipped and
 * noted. A column without any present value stays missing.
 */
class MissingValueHandler {
public:
  explicit MissingValueHandler(HandleMissingParams params);

  /**
   * @throws ValidationException (INVALID_PARAMETER) for fill_constant
   *         without a value.
   */
  OperationOutcome transform(const Dataset &subset,
                             const ColumnSelection &columns) const;

  static std::optional<double> mean(const std::vector<double> &values);
  static std::optional<double> median(std::vector<double> values);

  // Most frequent present cell; ties go to the smallest cell
  static std::optional<CellValue> mode(const std::vector<CellValue> &cells);

private:
  HandleMissingParams params_;

  OperationOutcome dropRows(const Dataset &subset,
                            const std::vector<ColumnIndex> &columns) const;
  size_t fillNeighbours(Dataset &data, ColumnIndex column, bool forward) const;
  std::optional<CellValue> fillValueFor(const Dataset &data,
                                        ColumnIndex column,
                                        std::vector<std::string> &notes) const;
};

} // namespace scrub
