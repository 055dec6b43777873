#include "cell_value.hpp"
#include "date_parser.hpp"
#include "string_utils.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

namespace scrub {

ColumnType cellKind(const CellValue &cell) noexcept {
  switch (cell.index()) {
  case 1:
    return ColumnType::BOOLEAN;
  case 2:
    return ColumnType::NUMERIC;
  case 3:
    return ColumnType::DATE;
  case 4:
    return ColumnType::TEXT;
  default:
    return ColumnType::MIXED;
  }
}

ColumnType inferColumnType(const std::vector<CellValue> &cells,
                           ColumnType fallback) {
  std::optional<ColumnType> seen;
  for (const auto &cell : cells) {
    if (isMissing(cell)) {
      continue;
    }
    ColumnType kind = cellKind(cell);
    if (!seen) {
      seen = kind;
    } else if (*seen != kind) {
      return ColumnType::MIXED;
    }
  }
  return seen.value_or(fallback);
}

std::string columnTypeToString(ColumnType type) {
  switch (type) {
  case ColumnType::NUMERIC:
    return "numeric";
  case ColumnType::TEXT:
    return "text";
  case ColumnType::DATE:
    return "date";
  case ColumnType::BOOLEAN:
    return "boolean";
  case ColumnType::MIXED:
    return "mixed";
  }
  return "mixed";
}

std::optional<ColumnType> parseColumnType(std::string_view name) {
  std::string lowered = string_utils::to_lower(string_utils::trim(name));
  if (lowered == "numeric" || lowered == "number") {
    return ColumnType::NUMERIC;
  }
  if (lowered == "text" || lowered == "string") {
    return ColumnType::TEXT;
  }
  if (lowered == "date") {
    return ColumnType::DATE;
  }
  if (lowered == "boolean" || lowered == "bool") {
    return ColumnType::BOOLEAN;
  }
  if (lowered == "mixed") {
    return ColumnType::MIXED;
  }
  return std::nullopt;
}

std::string formatNumber(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value > 0 ? "inf" : "-inf";
  }
  if (value == std::floor(value) && std::fabs(value) < 1e15) {
    return std::to_string(static_cast<long long>(value));
  }

  char buffer[32];
  for (int precision = 15; precision <= 17; ++precision) {
    std::snprintf(buffer, sizeof(buffer), "%.*g", precision, value);
    if (std::strtod(buffer, nullptr) == value) {
      break;
    }
  }
  return buffer;
}

std::string cellToString(const CellValue &cell) {
  switch (cell.index()) {
  case 1:
    return std::get<bool>(cell) ? "true" : "false";
  case 2:
    return formatNumber(std::get<double>(cell));
  case 3:
    return formatDate(std::get<Date>(cell), "%Y-%m-%d");
  case 4:
    return std::get<std::string>(cell);
  default:
    return "";
  }
}

std::optional<double> parseNumber(std::string_view text) {
  auto trimmed = string_utils::trim(text);
  if (trimmed.empty()) {
    return std::nullopt;
  }

  std::string value(trimmed);
  try {
    size_t consumed = 0;
    double parsed = std::stod(value, &consumed);
    if (consumed != value.size() || !std::isfinite(parsed)) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<bool> parseBoolean(std::string_view text) {
  std::string lowered = string_utils::to_lower(string_utils::trim(text));
  if (lowered == "true" || lowered == "yes" || lowered == "y" ||
      lowered == "t" || lowered == "1") {
    return true;
  }
  if (lowered == "false" || lowered == "no" || lowered == "n" ||
      lowered == "f" || lowered == "0") {
    return false;
  }
  return std::nullopt;
}

} // namespace scrub
