#include "dataset.hpp"
#include "exceptions.hpp"
#include <algorithm>
#include <numeric>

namespace scrub {

Dataset::Dataset(std::vector<Column> columns) : columns_(std::move(columns)) {
  size_t rows = columns_.empty() ? 0 : columns_.front().cells.size();
  rowIds_.resize(rows);
  std::iota(rowIds_.begin(), rowIds_.end(), RowId{0});
  validate();
}

Dataset::Dataset(std::vector<Column> columns, RowIdList rowIds)
    : columns_(std::move(columns)), rowIds_(std::move(rowIds)) {
  validate();
}

const Column &Dataset::column(ColumnIndex index) const {
  if (index >= columns_.size()) {
    throw ValidationException(ErrorCode::UNKNOWN_COLUMN,
                              "Column index out of range",
                              "column", std::to_string(index));
  }
  return columns_[index];
}

std::vector<std::string> Dataset::columnNames() const {
  std::vector<std::string> names;
  names.reserve(columns_.size());
  for (const auto &col : columns_) {
    names.push_back(col.name);
  }
  return names;
}

std::optional<ColumnIndex> Dataset::findColumn(std::string_view name) const {
  for (ColumnIndex i = 0; i < columns_.size(); ++i) {
    if (columns_[i].name == name) {
      return i;
    }
  }
  return std::nullopt;
}

std::optional<RowPosition> Dataset::findRow(RowId id) const {
  auto it = std::find(rowIds_.begin(), rowIds_.end(), id);
  if (it == rowIds_.end()) {
    return std::nullopt;
  }
  return static_cast<RowPosition>(std::distance(rowIds_.begin(), it));
}

const CellValue &Dataset::cell(RowPosition row, ColumnIndex column) const {
  return this->column(column).cells.at(row);
}

void Dataset::setCell(RowPosition row, ColumnIndex column, CellValue value) {
  if (column >= columns_.size()) {
    throw ValidationException(ErrorCode::UNKNOWN_COLUMN,
                              "Column index out of range",
                              "column", std::to_string(column));
  }
  columns_[column].cells.at(row) = std::move(value);
}

void Dataset::setColumnType(ColumnIndex column, ColumnType type) {
  if (column >= columns_.size()) {
    throw ValidationException(ErrorCode::UNKNOWN_COLUMN,
                              "Column index out of range",
                              "column", std::to_string(column));
  }
  columns_[column].type = type;
}

void Dataset::refreshColumnType(ColumnIndex column, ColumnType fallback) {
  if (column >= columns_.size()) {
    throw ValidationException(ErrorCode::UNKNOWN_COLUMN,
                              "Column index out of range",
                              "column", std::to_string(column));
  }
  columns_[column].type = inferColumnType(columns_[column].cells, fallback);
}

std::vector<ColumnIndex> Dataset::columnsOfType(ColumnType type) const {
  std::vector<ColumnIndex> result;
  for (ColumnIndex i = 0; i < columns_.size(); ++i) {
    if (columns_[i].type == type) {
      result.push_back(i);
    }
  }
  return result;
}

Dataset Dataset::selectRows(const std::vector<RowPosition> &positions) const {
  Dataset result;
  result.rowIds_.reserve(positions.size());
  for (RowPosition pos : positions) {
    result.rowIds_.push_back(rowIds_.at(pos));
  }

  result.columns_.reserve(columns_.size());
  for (const auto &col : columns_) {
    Column copy{col.name, col.type, {}};
    copy.cells.reserve(positions.size());
    for (RowPosition pos : positions) {
      copy.cells.push_back(col.cells[pos]);
    }
    result.columns_.push_back(std::move(copy));
  }
  return result;
}

size_t Dataset::missingCount() const {
  size_t total = 0;
  for (ColumnIndex i = 0; i < columns_.size(); ++i) {
    total += missingCount(i);
  }
  return total;
}

size_t Dataset::missingCount(ColumnIndex column) const {
  const auto &cells = this->column(column).cells;
  return static_cast<size_t>(
      std::count_if(cells.begin(), cells.end(),
                    [](const CellValue &c) { return isMissing(c); }));
}

bool Dataset::rowIsEmpty(RowPosition row) const {
  return std::all_of(columns_.begin(), columns_.end(), [row](const Column &c) {
    return isMissing(c.cells.at(row));
  });
}

void Dataset::validate() const {
  StringSet names;
  for (const auto &col : columns_) {
    if (col.cells.size() != rowIds_.size()) {
      throw ValidationException(
          ErrorCode::SHAPE_MISMATCH,
          "Column '" + col.name + "' has " + std::to_string(col.cells.size()) +
              " cells, expected " + std::to_string(rowIds_.size()),
          "column", col.name);
    }
    if (!names.insert(col.name).second) {
      throw ValidationException(ErrorCode::SHAPE_MISMATCH,
                                "Duplicate column name '" + col.name + "'",
                                "column", col.name);
    }
  }

  RowIdSet seen;
  seen.reserve(rowIds_.size());
  for (RowId id : rowIds_) {
    if (!seen.insert(id).second) {
      throw ValidationException(ErrorCode::SHAPE_MISMATCH,
                                "Duplicate row identifier " +
                                    std::to_string(id),
                                "row_id", std::to_string(id));
    }
  }
}

} // namespace scrub
