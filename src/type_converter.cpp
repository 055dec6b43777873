#include "type_converter.hpp"
#include "component_logger.hpp"
#include "date_parser.hpp"
#include "exceptions.hpp"

namespace scrub {

using ConverterLogger = ComponentLogger<TypeConverter>;

TypeConverter::TypeConverter(ConvertTypesParams params)
    : params_(std::move(params)) {
  if (params_.targets.empty()) {
    throw ValidationException(ErrorCode::INVALID_PARAMETER,
                              "convert_types requires at least one target",
                              "targets", "{}");
  }
}

std::optional<CellValue> TypeConverter::convert(const CellValue &cell,
                                                ConversionTarget target) {
  if (isMissing(cell)) {
    return cell;
  }

  switch (target) {
  case ConversionTarget::TEXT:
    return CellValue{cellToString(cell)};

  case ConversionTarget::NUMERIC:
    if (isNumber(cell)) {
      return cell;
    }
    if (const bool *flag = std::get_if<bool>(&cell)) {
      return CellValue{*flag ? 1.0 : 0.0};
    }
    if (const auto *text = std::get_if<std::string>(&cell)) {
      if (auto number = parseNumber(*text)) {
        return CellValue{*number};
      }
    }
    return std::nullopt;

  case ConversionTarget::DATE: {
    if (std::holds_alternative<Date>(cell)) {
      return cell;
    }
    if (std::holds_alternative<bool>(cell)) {
      return std::nullopt;
    }
    if (auto date = parseDate(cellToString(cell))) {
      return CellValue{*date};
    }
    return std::nullopt;
  }

  case ConversionTarget::BOOLEAN:
    if (std::holds_alternative<bool>(cell)) {
      return cell;
    }
    if (const double *number = std::get_if<double>(&cell)) {
      if (*number == 1.0) {
        return CellValue{true};
      }
      if (*number == 0.0) {
        return CellValue{false};
      }
      return std::nullopt;
    }
    if (const auto *text = std::get_if<std::string>(&cell)) {
      if (auto flag = parseBoolean(*text)) {
        return CellValue{*flag};
      }
    }
    return std::nullopt;
  }
  return std::nullopt;
}

OperationOutcome
TypeConverter::transform(const Dataset &subset,
                         const ColumnSelection &columns) const {
  OperationOutcome outcome;
  outcome.dataset = subset;
  Dataset &data = outcome.dataset;

  size_t converted = 0;
  size_t failed = 0;

  for (const auto &[name, target] : params_.targets) {
    auto column = data.findColumn(name);
    if (!column) {
      outcome.notes.push_back("Warning: column '" + name +
                              "' not found, conversion skipped");
      ConverterLogger::warn("Column '{}' not found, conversion skipped", name);
      continue;
    }
    if (columns.explicitScope && !columns.contains(*column)) {
      outcome.notes.push_back("Column '" + name +
                              "' is outside the column scope, skipped");
      continue;
    }

    size_t present = 0;
    size_t columnFailed = 0;
    for (RowPosition row = 0; row < data.rowCount(); ++row) {
      const CellValue &cell = data.cell(row, *column);
      if (isMissing(cell)) {
        continue;
      }
      ++present;
      auto result = convert(cell, target);
      if (!result) {
        data.setCell(row, *column, Missing{});
        ++columnFailed;
        continue;
      }
      if (*result != cell) {
        ++outcome.affected;
        data.setCell(row, *column, std::move(*result));
      }
    }

    if (present > 0 && columnFailed == present) {
      outcome.notes.push_back("Warning: no value in column '" + name +
                              "' could be converted to " +
                              conversionTargetToString(target));
      ConverterLogger::warn("No value in column '{}' could be converted to {}",
                            name, conversionTargetToString(target));
    } else if (columnFailed > 0) {
      outcome.notes.push_back(std::to_string(columnFailed) + " values in '" +
                              name + "' could not be converted to " +
                              conversionTargetToString(target));
    }

    converted += present - columnFailed;
    failed += columnFailed;
    outcome.affected += columnFailed;
    data.setColumnType(*column, toColumnType(target));
    outcome.touchedColumns.push_back(*column);
  }

  outcome.summary = std::to_string(converted) + " values converted, " +
                    std::to_string(failed) + " set to missing";
  return outcome;
}

} // namespace scrub
