#pragma once

#include "operation.hpp"
#include "scope_resolver.hpp"
#include <optional>

namespace scrub {

/**
 * Coerces named columns to a target type. Values that cannot be coerced
 * become missing. An absent column, or one whose present values all fail,
 * produces a warning note and does not stop the remaining conversions.
 */
class TypeConverter {
public:
  explicit TypeConverter(ConvertTypesParams params);

  OperationOutcome transform(const Dataset &subset,
                             const ColumnSelection &columns) const;

  // Missing in, missing out; std::nullopt when the value cannot be coerced
  static std::optional<CellValue> convert(const CellValue &cell,
                                          ConversionTarget target);

private:
  ConvertTypesParams params_;
};

} // namespace scrub
