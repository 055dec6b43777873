#include "operation.hpp"
#include "string_utils.hpp"
#include <array>

namespace scrub {

namespace {

template <typename Enum, size_t N>
std::optional<Enum>
lookup(const std::array<std::pair<const char *, Enum>, N> &table,
       std::string_view name) {
  std::string lowered = string_utils::to_lower(string_utils::trim(name));
  for (const auto &[label, value] : table) {
    if (lowered == label) {
      return value;
    }
  }
  return std::nullopt;
}

constexpr std::array<std::pair<const char *, OperationKind>, 8> kKinds = {{
    {"remove_duplicates", OperationKind::REMOVE_DUPLICATES},
    {"handle_missing", OperationKind::HANDLE_MISSING},
    {"standardize_text", OperationKind::STANDARDIZE_TEXT},
    {"normalize_dates", OperationKind::NORMALIZE_DATES},
    {"remove_outliers", OperationKind::REMOVE_OUTLIERS},
    {"trim_whitespace", OperationKind::TRIM_WHITESPACE},
    {"remove_empty_rows", OperationKind::REMOVE_EMPTY_ROWS},
    {"convert_types", OperationKind::CONVERT_TYPES},
}};

constexpr std::array<std::pair<const char *, MissingValueMethod>, 7>
    kMissingMethods = {{
        {"drop", MissingValueMethod::DROP},
        {"fill_forward", MissingValueMethod::FILL_FORWARD},
        {"fill_backward", MissingValueMethod::FILL_BACKWARD},
        {"fill_mean", MissingValueMethod::FILL_MEAN},
        {"fill_median", MissingValueMethod::FILL_MEDIAN},
        {"fill_mode", MissingValueMethod::FILL_MODE},
        {"fill_constant", MissingValueMethod::FILL_CONSTANT},
    }};

constexpr std::array<std::pair<const char *, TextStep>, 5> kTextSteps = {{
    {"lowercase", TextStep::LOWERCASE},
    {"uppercase", TextStep::UPPERCASE},
    {"titlecase", TextStep::TITLECASE},
    {"trim", TextStep::TRIM},
    {"strip_special_characters", TextStep::STRIP_SPECIAL},
}};

constexpr std::array<std::pair<const char *, OutlierMethod>, 2>
    kOutlierMethods = {{
        {"iqr", OutlierMethod::IQR},
        {"zscore", OutlierMethod::ZSCORE},
    }};

constexpr std::array<std::pair<const char *, ConversionTarget>, 4>
    kConversionTargets = {{
        {"numeric", ConversionTarget::NUMERIC},
        {"text", ConversionTarget::TEXT},
        {"date", ConversionTarget::DATE},
        {"boolean", ConversionTarget::BOOLEAN},
    }};

template <typename Enum, size_t N>
std::string
labelOf(const std::array<std::pair<const char *, Enum>, N> &table,
        Enum value) {
  for (const auto &[label, candidate] : table) {
    if (candidate == value) {
      return label;
    }
  }
  return "unknown";
}

} // namespace

std::string operationKindToString(OperationKind kind) {
  return labelOf(kKinds, kind);
}

std::optional<OperationKind> parseOperationKind(std::string_view name) {
  return lookup(kKinds, name);
}

std::string missingValueMethodToString(MissingValueMethod method) {
  return labelOf(kMissingMethods, method);
}

std::optional<MissingValueMethod>
parseMissingValueMethod(std::string_view name) {
  return lookup(kMissingMethods, name);
}

std::string textStepToString(TextStep step) {
  return labelOf(kTextSteps, step);
}

std::optional<TextStep> parseTextStep(std::string_view name) {
  // Short alias accepted alongside the full name
  if (string_utils::iequals(string_utils::trim(name), "strip_special")) {
    return TextStep::STRIP_SPECIAL;
  }
  return lookup(kTextSteps, name);
}

std::string outlierMethodToString(OutlierMethod method) {
  return labelOf(kOutlierMethods, method);
}

std::optional<OutlierMethod> parseOutlierMethod(std::string_view name) {
  return lookup(kOutlierMethods, name);
}

std::string conversionTargetToString(ConversionTarget target) {
  return labelOf(kConversionTargets, target);
}

std::optional<ConversionTarget> parseConversionTarget(std::string_view name) {
  return lookup(kConversionTargets, name);
}

ColumnType toColumnType(ConversionTarget target) noexcept {
  switch (target) {
  case ConversionTarget::NUMERIC:
    return ColumnType::NUMERIC;
  case ConversionTarget::DATE:
    return ColumnType::DATE;
  case ConversionTarget::BOOLEAN:
    return ColumnType::BOOLEAN;
  case ConversionTarget::TEXT:
    break;
  }
  return ColumnType::TEXT;
}

} // namespace scrub
