#pragma once

#include "operation.hpp"
#include "scope_resolver.hpp"

namespace scrub {

// Strips leading and trailing whitespace from text cells. Idempotent.
class WhitespaceTrimmer {
public:
  explicit WhitespaceTrimmer(TrimWhitespaceParams params = {});

  OperationOutcome transform(const Dataset &subset,
                             const ColumnSelection &columns) const;

private:
  TrimWhitespaceParams params_;
};

// Drops rows where every column is missing. Column scope does not apply.
class EmptyRowRemover {
public:
  explicit EmptyRowRemover(RemoveEmptyRowsParams params = {});

  OperationOutcome transform(const Dataset &subset) const;

private:
  RemoveEmptyRowsParams params_;
};

} // namespace scrub
