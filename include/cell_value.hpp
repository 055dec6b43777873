#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scrub {

enum class ColumnType { NUMERIC, TEXT, DATE, BOOLEAN, MIXED };

// Distinguished absence-of-value marker, never equal to "" or 0
struct Missing {
  friend auto operator<=>(const Missing &, const Missing &) = default;
};

struct Date {
  int year = 1970;
  int month = 1;
  int day = 1;

  friend auto operator<=>(const Date &, const Date &) = default;
};

// Alternative order doubles as the cross-kind ordering used for
// deterministic tie-breaks: missing < boolean < number < date < text.
using CellValue = std::variant<Missing, bool, double, Date, std::string>;

inline bool isMissing(const CellValue &cell) noexcept {
  return std::holds_alternative<Missing>(cell);
}

inline bool isText(const CellValue &cell) noexcept {
  return std::holds_alternative<std::string>(cell);
}

inline bool isNumber(const CellValue &cell) noexcept {
  return std::holds_alternative<double>(cell);
}

/**
 * Column type matching a single non-missing cell; MIXED for a missing one.
 */
ColumnType cellKind(const CellValue &cell) noexcept;

/**
 * Derives a column type from its cells. Missing cells are ignored; a column
 * with no present cells keeps @p fallback.
 */
ColumnType inferColumnType(const std::vector<CellValue> &cells,
                           ColumnType fallback);

std::string columnTypeToString(ColumnType type);
std::optional<ColumnType> parseColumnType(std::string_view name);

// Shortest round-trippable decimal form; integral values print without a
// fractional part.
std::string formatNumber(double value);

// Display form of a cell. Missing renders as an empty string.
std::string cellToString(const CellValue &cell);

// Strict numeric parse of a whole string (surrounding whitespace allowed).
std::optional<double> parseNumber(std::string_view text);

// true/false, yes/no, y/n, t/f, 1/0, case-insensitive
std::optional<bool> parseBoolean(std::string_view text);

} // namespace scrub
