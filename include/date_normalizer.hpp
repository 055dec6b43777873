#pragma once

#include "config_manager.hpp"
#include "operation.hpp"
#include "scope_resolver.hpp"
#include <string>

namespace scrub {

/**
 * Rewrites date-like cells into one textual format.
 *
 * Without an explicit column scope the columns are auto-detected: DATE
 * columns, plus TEXT/MIXED columns where strictly more than half of the
 * first date_sample_size present values match YYYY-MM-DD, MM/DD/YYYY or
 * MM-DD-YYYY. Cells that fail to parse become missing.
 */
class DateNormalizer {
public:
  DateNormalizer(NormalizeDatesParams params, EngineConfig config);

  OperationOutcome transform(const Dataset &subset,
                             const ColumnSelection &columns) const;

  bool looksLikeDateColumn(const Column &column) const;

  const std::string &getFormat() const noexcept { return format_; }

private:
  EngineConfig config_;
  std::string format_;
};

} // namespace scrub
