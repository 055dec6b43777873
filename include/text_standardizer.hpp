#pragma once

#include "operation.hpp"
#include "scope_resolver.hpp"
#include <string>
#include <string_view>

namespace scrub {

/**
 * Applies the configured text steps, in order, to every text cell of the
 * selected TEXT and MIXED columns. Other cells pass through unchanged.
 */
class TextStandardizer {
public:
  explicit TextStandardizer(StandardizeTextParams params);

  OperationOutcome transform(const Dataset &subset,
                             const ColumnSelection &columns) const;

  std::string standardize(std::string_view text) const;

private:
  StandardizeTextParams params_;
};

} // namespace scrub
