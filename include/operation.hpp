#pragma once

#include "cell_value.hpp"
#include "dataset.hpp"
#include "type_definitions.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace scrub {

// Order matches the alternatives of OperationParams
enum class OperationKind {
  REMOVE_DUPLICATES = 0,
  HANDLE_MISSING = 1,
  STANDARDIZE_TEXT = 2,
  NORMALIZE_DATES = 3,
  REMOVE_OUTLIERS = 4,
  TRIM_WHITESPACE = 5,
  REMOVE_EMPTY_ROWS = 6,
  CONVERT_TYPES = 7
};

enum class MissingValueMethod {
  DROP,
  FILL_FORWARD,
  FILL_BACKWARD,
  FILL_MEAN,
  FILL_MEDIAN,
  FILL_MODE,
  FILL_CONSTANT
};

enum class TextStep { LOWERCASE, UPPERCASE, TITLECASE, TRIM, STRIP_SPECIAL };

enum class OutlierMethod { IQR, ZSCORE };

enum class ConversionTarget { NUMERIC, TEXT, DATE, BOOLEAN };

struct RemoveDuplicatesParams {};

struct HandleMissingParams {
  MissingValueMethod method = MissingValueMethod::DROP;
  CellValue constant; // fill_constant only
};

struct StandardizeTextParams {
  std::vector<TextStep> steps{TextStep::LOWERCASE, TextStep::TRIM};
};

struct NormalizeDatesParams {
  std::string format; // empty = engine default
};

struct RemoveOutliersParams {
  OutlierMethod method = OutlierMethod::IQR;
};

struct TrimWhitespaceParams {};

struct RemoveEmptyRowsParams {};

struct ConvertTypesParams {
  std::vector<std::pair<std::string, ConversionTarget>> targets;
};

using OperationParams =
    std::variant<RemoveDuplicatesParams, HandleMissingParams,
                 StandardizeTextParams, NormalizeDatesParams,
                 RemoveOutliersParams, TrimWhitespaceParams,
                 RemoveEmptyRowsParams, ConvertTypesParams>;

// Explicit column list or every column when unset
struct ColumnScope {
  std::optional<std::vector<std::string>> names;

  static ColumnScope all() { return {}; }
  static ColumnScope of(std::vector<std::string> columns) {
    return ColumnScope{std::move(columns)};
  }
  bool isAll() const noexcept { return !names.has_value(); }
};

// Explicit row identifier set or every row when unset
struct RowScope {
  std::optional<RowIdSet> ids;

  static RowScope all() { return {}; }
  static RowScope of(RowIdSet rows) { return RowScope{std::move(rows)}; }
  bool isAll() const noexcept { return !ids.has_value(); }
};

struct Scope {
  ColumnScope columns;
  RowScope rows;
};

/**
 * One requested cleaning step. Applied once against the current snapshot
 * and then discarded.
 */
struct OperationDescriptor {
  OperationParams params;
  Scope scope;

  OperationKind kind() const noexcept {
    return static_cast<OperationKind>(params.index());
  }
};

// Result of running one operation over an in-scope subset
struct OperationOutcome {
  Dataset dataset;
  std::string summary;
  size_t affected = 0; // cells changed or rows removed
  std::vector<std::string> notes;
  std::vector<ColumnIndex> touchedColumns;
};

std::string operationKindToString(OperationKind kind);
std::optional<OperationKind> parseOperationKind(std::string_view name);

std::string missingValueMethodToString(MissingValueMethod method);
std::optional<MissingValueMethod> parseMissingValueMethod(std::string_view name);

std::string textStepToString(TextStep step);
std::optional<TextStep> parseTextStep(std::string_view name);

std::string outlierMethodToString(OutlierMethod method);
std::optional<OutlierMethod> parseOutlierMethod(std::string_view name);

std::string conversionTargetToString(ConversionTarget target);
std::optional<ConversionTarget> parseConversionTarget(std::string_view name);
ColumnType toColumnType(ConversionTarget target) noexcept;

} // namespace scrub
