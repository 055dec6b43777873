#include "date_normalizer.hpp"
#include "component_logger.hpp"
#include "date_parser.hpp"

namespace scrub {

using DateLogger = ComponentLogger<DateNormalizer>;

DateNormalizer::DateNormalizer(NormalizeDatesParams params,
                               EngineConfig config)
    : config_(std::move(config)),
      format_(params.format.empty() ? config_.defaultDateFormat
                                    : std::move(params.format)) {}

bool DateNormalizer::looksLikeDateColumn(const Column &column) const {
  if (column.type == ColumnType::DATE) {
    return true;
  }
  if (column.type != ColumnType::TEXT && column.type != ColumnType::MIXED) {
    return false;
  }

  const size_t limit = static_cast<size_t>(config_.dateSampleSize);
  size_t sampled = 0;
  size_t matching = 0;
  for (const auto &cell : column.cells) {
    if (sampled == limit) {
      break;
    }
    if (isMissing(cell)) {
      continue;
    }
    ++sampled;
    if (const auto *text = std::get_if<std::string>(&cell);
        text != nullptr && matchesDatePattern(*text)) {
      ++matching;
    }
  }
  return sampled > 0 && matching * 2 > sampled;
}

OperationOutcome
DateNormalizer::transform(const Dataset &subset,
                          const ColumnSelection &columns) const {
  OperationOutcome outcome;
  outcome.dataset = subset;
  Dataset &data = outcome.dataset;

  size_t reformatted = 0;
  size_t degraded = 0;

  for (ColumnIndex column : columns.indices) {
    const Column &col = data.column(column);
    if (columns.explicitScope) {
      if (col.type == ColumnType::NUMERIC || col.type == ColumnType::BOOLEAN) {
        outcome.notes.push_back("Column '" + col.name +
                                "' skipped: not a date or text column");
        DateLogger::debug("Skipping {} column '{}'",
                          columnTypeToString(col.type), col.name);
        continue;
      }
    } else if (!looksLikeDateColumn(col)) {
      continue;
    }

    DateLogger::debug("Normalizing column '{}' to '{}'", col.name, format_);
    for (RowPosition row = 0; row < data.rowCount(); ++row) {
      const CellValue &cell = data.cell(row, column);
      if (isMissing(cell)) {
        continue;
      }

      std::optional<Date> date;
      if (const auto *value = std::get_if<Date>(&cell)) {
        date = *value;
      } else if (const auto *text = std::get_if<std::string>(&cell)) {
        date = parseDate(*text);
      } else {
        date = parseDate(cellToString(cell));
      }

      if (date) {
        data.setCell(row, column, formatDate(*date, format_));
        ++reformatted;
      } else {
        data.setCell(row, column, Missing{});
        ++degraded;
      }
    }
    outcome.touchedColumns.push_back(column);
  }

  if (outcome.touchedColumns.empty()) {
    outcome.notes.push_back("No date columns found");
  }

  outcome.affected = reformatted + degraded;
  outcome.summary = std::to_string(reformatted) + " dates normalized, " +
                    std::to_string(degraded) + " invalid dates set to missing";
  return outcome;
}

} // namespace scrub
