#pragma once

#include "operation.hpp"
#include "scope_resolver.hpp"

namespace scrub {

/**
 * Keeps the first occurrence of every distinct key tuple. The key is the
 * selected columns, or every column when the selection is empty.
 */
class DuplicateRemover {
public:
  explicit DuplicateRemover(RemoveDuplicatesParams params = {});

  OperationOutcome transform(const Dataset &subset,
                             const ColumnSelection &columns) const;

private:
  RemoveDuplicatesParams params_;
};

} // namespace scrub
