#include "text_standardizer.hpp"
#include "component_logger.hpp"
#include "exceptions.hpp"
#include "string_utils.hpp"

namespace scrub {

namespace {

bool holdsText(ColumnType type) {
  return type == ColumnType::TEXT || type == ColumnType::MIXED;
}

} // namespace

TextStandardizer::TextStandardizer(StandardizeTextParams params)
    : params_(std::move(params)) {
  if (params_.steps.empty()) {
    throw ValidationException(ErrorCode::INVALID_PARAMETER,
                              "standardize_text requires at least one step",
                              "steps", "[]");
  }
}

std::string TextStandardizer::standardize(std::string_view text) const {
  std::string value(text);
  for (TextStep step : params_.steps) {
    switch (step) {
    case TextStep::LOWERCASE:
      value = string_utils::to_lower(value);
      break;
    case TextStep::UPPERCASE:
      value = string_utils::to_upper(value);
      break;
    case TextStep::TITLECASE:
      value = string_utils::to_title(value);
      break;
    case TextStep::TRIM:
      value = std::string(string_utils::trim(value));
      break;
    case TextStep::STRIP_SPECIAL:
      value = string_utils::strip_special(value);
      break;
    }
  }
  return value;
}

OperationOutcome
TextStandardizer::transform(const Dataset &subset,
                            const ColumnSelection &columns) const {
  OperationOutcome outcome;
  outcome.dataset = subset;
  Dataset &data = outcome.dataset;

  for (ColumnIndex column : columns.indices) {
    const Column &col = data.column(column);
    if (!holdsText(col.type)) {
      if (columns.explicitScope) {
        outcome.notes.push_back("Column '" + col.name +
                                "' skipped: not a text column");
        ComponentLogger<TextStandardizer>::debug(
            "Skipping {} column '{}'", columnTypeToString(col.type), col.name);
      }
      continue;
    }

    size_t changed = 0;
    for (RowPosition row = 0; row < data.rowCount(); ++row) {
      const auto *text = std::get_if<std::string>(&data.cell(row, column));
      if (text == nullptr) {
        continue;
      }
      std::string result = standardize(*text);
      if (result != *text) {
        data.setCell(row, column, std::move(result));
        ++changed;
      }
    }
    outcome.affected += changed;
    outcome.touchedColumns.push_back(column);
  }

  if (columns.explicitScope && columns.empty()) {
    outcome.notes.push_back("No columns in scope");
  }

  outcome.summary =
      std::to_string(outcome.affected) + " text cells standardized";
  return outcome;
}

} // namespace scrub
