#pragma once

#include "cell_value.hpp"
#include "type_definitions.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scrub {

struct Column {
  std::string name;
  ColumnType type = ColumnType::TEXT;
  std::vector<CellValue> cells;

  bool operator==(const Column &other) const = default;
};

/**
 * In-memory table of named, typed columns with a stable row identifier per
 * row. Copies are independent snapshots; cleaning operations never modify a
 * Dataset they were handed, they build a new one.
 *
 * Invariants (checked by validate()):
 *  - every column holds rowCount() cells
 *  - row identifiers are unique
 *  - column names are unique
 */
class Dataset {
public:
  Dataset() = default;

  // Row identifiers default to 0..n-1
  explicit Dataset(std::vector<Column> columns);
  Dataset(std::vector<Column> columns, RowIdList rowIds);

  size_t rowCount() const noexcept { return rowIds_.size(); }
  size_t columnCount() const noexcept { return columns_.size(); }

  // True when there is nothing to clean: no columns or no rows
  bool empty() const noexcept { return columns_.empty() || rowIds_.empty(); }

  const std::vector<Column> &columns() const noexcept { return columns_; }
  const Column &column(ColumnIndex index) const;
  const RowIdList &rowIds() const noexcept { return rowIds_; }
  std::vector<std::string> columnNames() const;

  std::optional<ColumnIndex> findColumn(std::string_view name) const;
  std::optional<RowPosition> findRow(RowId id) const;

  const CellValue &cell(RowPosition row, ColumnIndex column) const;
  void setCell(RowPosition row, ColumnIndex column, CellValue value);
  void setColumnType(ColumnIndex column, ColumnType type);

  /**
   * Re-derives the logical type of a column from its present cells, keeping
   * @p fallback when every cell is missing.
   */
  void refreshColumnType(ColumnIndex column, ColumnType fallback);

  std::vector<ColumnIndex> columnsOfType(ColumnType type) const;

  // New snapshot holding only the given positions, in the given order
  Dataset selectRows(const std::vector<RowPosition> &positions) const;

  size_t missingCount() const;
  size_t missingCount(ColumnIndex column) const;

  // Every column of the row holds the missing marker
  bool rowIsEmpty(RowPosition row) const;

  /**
   * @throws ValidationException (SHAPE_MISMATCH) when an invariant is broken.
   */
  void validate() const;

  bool operator==(const Dataset &other) const = default;

private:
  std::vector<Column> columns_;
  RowIdList rowIds_;
};

} // namespace scrub
