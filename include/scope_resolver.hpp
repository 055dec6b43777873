#pragma once

#include "config_manager.hpp"
#include "dataset.hpp"
#include "operation.hpp"
#include <string>
#include <vector>

namespace scrub {

// Columns an operation may alter, as indices into the dataset (dataset order)
struct ColumnSelection {
  std::vector<ColumnIndex> indices;
  // False when the caller asked for every column
  bool explicitScope = false;

  bool contains(ColumnIndex index) const;
  bool empty() const noexcept { return indices.empty(); }
};

struct ResolvedScope {
  ColumnSelection columns;
  std::vector<RowPosition> rows; // in-scope positions, dataset order
  bool allRows = true;
  std::vector<std::string> ignoredColumns;
  RowIdList ignoredRowIds;
};

// In-scope rows and the untouched remainder, both with every column
struct Partition {
  Dataset inScope;
  Dataset outOfScope;
};

/**
 * Restricts an operation to a (ColumnSet, RowSet) selection.
 *
 * An operation receives split(...).inScope, returns a transformed copy of
 * it, and merge(...) recombines that with the out-of-scope rows in the
 * original row order. Rows dropped by the operation simply do not appear in
 * the transformed subset.
 */
class ScopeResolver {
public:
  explicit ScopeResolver(ScopePolicy policy = ScopePolicy::PERMISSIVE);

  /**
   * Unknown row identifiers are always ignored. Unknown column names are
   * ignored under PERMISSIVE.
   * @throws ValidationException (UNKNOWN_COLUMN) for an unknown column name
   *         under STRICT.
   */
  ResolvedScope resolve(const Dataset &dataset, const Scope &scope) const;

  Partition split(const Dataset &dataset, const ResolvedScope &scope) const;

  /**
   * Rebuilds the full dataset. Row order follows @p original; the logical
   * type is re-derived for @p touchedColumns only.
   * @throws OperationException (DATA_INTEGRITY_ERROR) when @p transformed
   *         has different columns or rows that were never in scope.
   */
  Dataset merge(const Dataset &original, const Partition &partition,
                const Dataset &transformed,
                const std::vector<ColumnIndex> &touchedColumns) const;

  ScopePolicy getPolicy() const noexcept { return policy_; }

private:
  ScopePolicy policy_;
};

} // namespace scrub
