#include "scope_resolver.hpp"
#include "component_logger.hpp"
#include "exceptions.hpp"
#include "string_utils.hpp"
#include <algorithm>
#include <unordered_map>

namespace scrub {

bool ColumnSelection::contains(ColumnIndex index) const {
  return std::find(indices.begin(), indices.end(), index) != indices.end();
}

ScopeResolver::ScopeResolver(ScopePolicy policy) : policy_(policy) {}

ResolvedScope ScopeResolver::resolve(const Dataset &dataset,
                                     const Scope &scope) const {
  ResolvedScope resolved;

  if (scope.columns.isAll()) {
    resolved.columns.indices.resize(dataset.columnCount());
    for (ColumnIndex i = 0; i < dataset.columnCount(); ++i) {
      resolved.columns.indices[i] = i;
    }
  } else {
    resolved.columns.explicitScope = true;
    for (const auto &name : *scope.columns.names) {
      auto index = dataset.findColumn(name);
      if (!index) {
        if (policy_ == ScopePolicy::STRICT) {
          throw ValidationException(ErrorCode::UNKNOWN_COLUMN,
                                    "Unknown column in scope: " + name,
                                    "columns", name);
        }
        resolved.ignoredColumns.push_back(name);
        continue;
      }
      if (!resolved.columns.contains(*index)) {
        resolved.columns.indices.push_back(*index);
      }
    }
    std::sort(resolved.columns.indices.begin(),
              resolved.columns.indices.end());
  }

  if (scope.rows.isAll()) {
    resolved.rows.resize(dataset.rowCount());
    for (RowPosition i = 0; i < dataset.rowCount(); ++i) {
      resolved.rows[i] = i;
    }
  } else {
    resolved.allRows = false;
    const auto &wanted = *scope.rows.ids;
    const auto &ids = dataset.rowIds();
    RowIdSet present;
    present.reserve(wanted.size());
    for (RowPosition i = 0; i < ids.size(); ++i) {
      if (wanted.count(ids[i]) > 0) {
        resolved.rows.push_back(i);
        present.insert(ids[i]);
      }
    }
    for (RowId id : wanted) {
      if (present.count(id) == 0) {
        resolved.ignoredRowIds.push_back(id);
      }
    }
    std::sort(resolved.ignoredRowIds.begin(), resolved.ignoredRowIds.end());
  }

  if (!resolved.ignoredColumns.empty()) {
    SCOPE_LOG_WARN("Ignoring unknown columns in scope: {}",
                   string_utils::join(resolved.ignoredColumns, ", "));
  }
  if (!resolved.ignoredRowIds.empty()) {
    SCOPE_LOG_DEBUG("Ignoring {} stale row identifiers",
                    resolved.ignoredRowIds.size());
  }

  return resolved;
}

Partition ScopeResolver::split(const Dataset &dataset,
                               const ResolvedScope &scope) const {
  if (scope.allRows) {
    return Partition{dataset, dataset.selectRows({})};
  }

  std::vector<bool> inScope(dataset.rowCount(), false);
  for (RowPosition pos : scope.rows) {
    inScope.at(pos) = true;
  }

  std::vector<RowPosition> rest;
  rest.reserve(dataset.rowCount() - scope.rows.size());
  for (RowPosition i = 0; i < dataset.rowCount(); ++i) {
    if (!inScope[i]) {
      rest.push_back(i);
    }
  }

  return Partition{dataset.selectRows(scope.rows), dataset.selectRows(rest)};
}

Dataset ScopeResolver::merge(const Dataset &original,
                             const Partition &partition,
                             const Dataset &transformed,
                             const std::vector<ColumnIndex> &touchedColumns)
    const {
  if (transformed.columnNames() != original.columnNames()) {
    throw OperationException(ErrorCode::DATA_INTEGRITY_ERROR,
                             "Transformed subset changed the column layout",
                             "merge");
  }

  const auto &scopedIds = partition.inScope.rowIds();
  RowIdSet inScope(scopedIds.begin(), scopedIds.end());

  std::unordered_map<RowId, RowPosition> transformedRows;
  transformedRows.reserve(transformed.rowCount());
  for (RowPosition i = 0; i < transformed.rowCount(); ++i) {
    RowId id = transformed.rowIds()[i];
    if (inScope.count(id) == 0) {
      throw OperationException(ErrorCode::DATA_INTEGRITY_ERROR,
                               "Transformed subset holds row " +
                                   std::to_string(id) +
                                   " that was not in scope",
                               "merge");
    }
    transformedRows.emplace(id, i);
  }

  std::unordered_map<RowId, RowPosition> untouchedRows;
  untouchedRows.reserve(partition.outOfScope.rowCount());
  for (RowPosition i = 0; i < partition.outOfScope.rowCount(); ++i) {
    untouchedRows.emplace(partition.outOfScope.rowIds()[i], i);
  }

  // (source, position) per output row, in original order
  std::vector<std::pair<const Dataset *, RowPosition>> sources;
  RowIdList ids;
  sources.reserve(original.rowCount());
  ids.reserve(original.rowCount());
  for (RowId id : original.rowIds()) {
    if (auto it = untouchedRows.find(id); it != untouchedRows.end()) {
      sources.emplace_back(&partition.outOfScope, it->second);
    } else if (auto tr = transformedRows.find(id);
               tr != transformedRows.end()) {
      sources.emplace_back(&transformed, tr->second);
    } else {
      continue;
    }
    ids.push_back(id);
  }

  std::vector<Column> columns;
  columns.reserve(original.columnCount());
  for (ColumnIndex c = 0; c < original.columnCount(); ++c) {
    Column merged{original.column(c).name, original.column(c).type, {}};
    merged.cells.reserve(sources.size());
    for (const auto &[source, pos] : sources) {
      merged.cells.push_back(source->cell(pos, c));
    }
    columns.push_back(std::move(merged));
  }

  Dataset result(std::move(columns), std::move(ids));
  for (ColumnIndex c : touchedColumns) {
    result.refreshColumnType(c, transformed.column(c).type);
  }
  return result;
}

} // namespace scrub
