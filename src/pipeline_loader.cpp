#include "pipeline_loader.hpp"
#include "component_logger.hpp"
#include "date_parser.hpp"
#include "exceptions.hpp"
#include <fstream>

namespace scrub {

namespace {

ValidationException malformed(const std::string &field,
                              const std::string &reason) {
  return createValidationError(field, "", reason);
}

ValidationException badParameter(const std::string &field,
                                 const std::string &value,
                                 const std::string &reason) {
  return ValidationException(ErrorCode::INVALID_PARAMETER, reason, field,
                             value);
}

ColumnScope parseColumnScope(const nlohmann::json &json) {
  auto it = json.find("columns");
  if (it == json.end() || it->is_null()) {
    return ColumnScope::all();
  }
  if (!it->is_array()) {
    throw malformed("columns", "Operation 'columns' must be an array");
  }
  std::vector<std::string> names;
  for (const auto &name : *it) {
    names.push_back(name.get<std::string>());
  }
  return ColumnScope::of(std::move(names));
}

RowScope parseRowScope(const nlohmann::json &json) {
  auto it = json.find("rows");
  if (it == json.end() || it->is_null()) {
    return RowScope::all();
  }
  if (!it->is_array()) {
    throw malformed("rows", "Operation 'rows' must be an array");
  }
  RowIdSet ids;
  for (const auto &id : *it) {
    ids.insert(id.get<RowId>());
  }
  return RowScope::of(std::move(ids));
}

std::string stringParam(const nlohmann::json &json, const std::string &key,
                        const std::string &defaultValue) {
  auto it = json.find(key);
  if (it == json.end() || it->is_null()) {
    return defaultValue;
  }
  return it->get<std::string>();
}

OperationParams parseParams(OperationKind kind, const nlohmann::json &json) {
  switch (kind) {
  case OperationKind::REMOVE_DUPLICATES:
    return RemoveDuplicatesParams{};

  case OperationKind::HANDLE_MISSING: {
    HandleMissingParams params;
    std::string method = stringParam(json, "method", "drop");
    auto parsed = parseMissingValueMethod(method);
    if (!parsed) {
      throw badParameter("method", method, "Unknown missing-value method");
    }
    params.method = *parsed;
    if (auto it = json.find("value"); it != json.end()) {
      params.constant = PipelineLoader::parseCell(*it, ColumnType::MIXED);
    }
    if (params.method == MissingValueMethod::FILL_CONSTANT &&
        isMissing(params.constant)) {
      throw badParameter("value", "null", "fill_constant requires a value");
    }
    return params;
  }

  case OperationKind::STANDARDIZE_TEXT: {
    StandardizeTextParams params;
    if (auto it = json.find("steps"); it != json.end() && !it->is_null()) {
      if (!it->is_array() || it->empty()) {
        throw badParameter("steps", it->dump(),
                           "'steps' must be a non-empty array");
      }
      params.steps.clear();
      for (const auto &step : *it) {
        std::string name = step.get<std::string>();
        auto parsed = parseTextStep(name);
        if (!parsed) {
          throw badParameter("steps", name, "Unknown text step");
        }
        params.steps.push_back(*parsed);
      }
    }
    return params;
  }

  case OperationKind::NORMALIZE_DATES:
    return NormalizeDatesParams{stringParam(json, "format", "")};

  case OperationKind::REMOVE_OUTLIERS: {
    std::string method = stringParam(json, "method", "iqr");
    auto parsed = parseOutlierMethod(method);
    if (!parsed) {
      throw badParameter("method", method, "Unknown outlier method");
    }
    return RemoveOutliersParams{*parsed};
  }

  case OperationKind::TRIM_WHITESPACE:
    return TrimWhitespaceParams{};

  case OperationKind::REMOVE_EMPTY_ROWS:
    return RemoveEmptyRowsParams{};

  case OperationKind::CONVERT_TYPES: {
    auto it = json.find("targets");
    if (it == json.end() || !it->is_object() || it->empty()) {
      throw badParameter("targets", it == json.end() ? "" : it->dump(),
                         "'targets' must be a non-empty object");
    }
    ConvertTypesParams params;
    for (const auto &[column, type] : it->items()) {
      std::string name = type.get<std::string>();
      auto target = parseConversionTarget(name);
      if (!target) {
        throw badParameter("targets", name, "Unknown conversion target");
      }
      params.targets.emplace_back(column, *target);
    }
    return params;
  }
  }

  throw malformed("kind", "Unsupported operation kind");
}

} // namespace

CleaningJob PipelineLoader::loadFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ScrubException(ErrorCode::FILE_ERROR,
                         "Cannot open job file: " + path, {{"path", path}});
  }

  PIPELINE_LOG_INFO("Loading job from {}", path);
  nlohmann::json document;
  try {
    file >> document;
  } catch (const nlohmann::json::parse_error &e) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Job file is not valid JSON: " +
                                  std::string(e.what()),
                              "path", path);
  }
  return parse(document);
}

CleaningJob PipelineLoader::parseString(const std::string &text) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throw ValidationException(ErrorCode::INVALID_INPUT,
                              "Job is not valid JSON: " +
                                  std::string(e.what()));
  }
  return parse(document);
}

CleaningJob PipelineLoader::parse(const nlohmann::json &document) {
  if (!document.is_object()) {
    throw malformed("job", "Job document must be a JSON object");
  }
  if (!document.contains("dataset")) {
    throw malformed("dataset", "Job document has no 'dataset'");
  }

  CleaningJob job;
  job.dataset = parseDataset(document.at("dataset"));

  if (auto it = document.find("operations"); it != document.end()) {
    if (!it->is_array()) {
      throw malformed("operations", "'operations' must be an array");
    }
    for (size_t i = 0; i < it->size(); ++i) {
      job.operations.push_back(parseOperation((*it)[i], i));
    }
  }

  PIPELINE_LOG_INFO("Loaded job: {} rows, {} columns, {} operations",
                    job.dataset.rowCount(), job.dataset.columnCount(),
                    job.operations.size());
  return job;
}

Dataset PipelineLoader::parseDataset(const nlohmann::json &json) {
  if (!json.is_object() || !json.contains("columns") ||
      !json.at("columns").is_array()) {
    throw malformed("dataset.columns", "Dataset needs a 'columns' array");
  }

  try {
    std::vector<Column> columns;
    for (const auto &entry : json.at("columns")) {
      Column column;
      column.name = entry.at("name").get<std::string>();

      std::string typeName = "auto";
      if (auto it = entry.find("type"); it != entry.end() && !it->is_null()) {
        typeName = it->get<std::string>();
      }
      std::optional<ColumnType> declared;
      if (typeName != "auto") {
        declared = parseColumnType(typeName);
        if (!declared) {
          throw badParameter("type", typeName,
                             "Unknown column type for '" + column.name + "'");
        }
      }

      const auto &values = entry.at("values");
      if (!values.is_array()) {
        throw malformed("values",
                        "Column '" + column.name + "' values must be an array");
      }
      size_t degraded = 0;
      for (const auto &value : values) {
        column.cells.push_back(
            parseCell(value, declared.value_or(ColumnType::MIXED)));
        if (!value.is_null() && isMissing(column.cells.back())) {
          ++degraded;
        }
      }
      if (degraded > 0) {
        PIPELINE_LOG_WARN("{} values in column '{}' are not {} and were set "
                          "to missing",
                          degraded, column.name, typeName);
      }
      column.type = declared ? *declared
                             : inferColumnType(column.cells, ColumnType::TEXT);
      columns.push_back(std::move(column));
    }

    if (auto it = json.find("row_ids"); it != json.end() && !it->is_null()) {
      return Dataset(std::move(columns), it->get<RowIdList>());
    }
    return Dataset(std::move(columns));
  } catch (const nlohmann::json::exception &e) {
    throw malformed("dataset", "Malformed dataset: " + std::string(e.what()));
  }
}

OperationDescriptor PipelineLoader::parseOperation(const nlohmann::json &json,
                                                   size_t index) {
  const std::string field = "operations[" + std::to_string(index) + "]";
  if (!json.is_object()) {
    throw malformed(field, "Operation must be a JSON object");
  }

  try {
    std::string kindName = json.at("kind").get<std::string>();
    auto kind = parseOperationKind(kindName);
    if (!kind) {
      throw badParameter(field + ".kind", kindName, "Unknown operation kind");
    }

    OperationDescriptor descriptor{parseParams(*kind, json),
                                   Scope{parseColumnScope(json),
                                         parseRowScope(json)}};
    PIPELINE_LOG_DEBUG("Parsed {} as {}", field, kindName);
    return descriptor;
  } catch (const nlohmann::json::exception &e) {
    throw malformed(field, "Malformed operation: " + std::string(e.what()));
  }
}

CellValue PipelineLoader::parseCell(const nlohmann::json &value,
                                    ColumnType type) {
  if (value.is_null()) {
    return Missing{};
  }
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number()) {
    return value.get<double>();
  }
  if (value.is_string()) {
    std::string text = value.get<std::string>();
    // Text in a declared column is coerced; failures become missing
    switch (type) {
    case ColumnType::NUMERIC:
      if (auto number = parseNumber(text)) {
        return *number;
      }
      return Missing{};
    case ColumnType::BOOLEAN:
      if (auto flag = parseBoolean(text)) {
        return *flag;
      }
      return Missing{};
    case ColumnType::DATE:
      if (auto date = parseDate(text)) {
        return *date;
      }
      return Missing{};
    default:
      return text;
    }
  }
  throw malformed("value", "Cell values must be scalars, got: " + value.dump());
}

nlohmann::json PipelineLoader::cellToJson(const CellValue &cell) {
  switch (cell.index()) {
  case 1:
    return std::get<bool>(cell);
  case 2:
    return std::get<double>(cell);
  case 3:
    return cellToString(cell);
  case 4:
    return std::get<std::string>(cell);
  default:
    return nullptr;
  }
}

nlohmann::json PipelineLoader::datasetToJson(const Dataset &dataset) {
  nlohmann::json json;
  json["columns"] = nlohmann::json::array();
  for (const auto &column : dataset.columns()) {
    nlohmann::json values = nlohmann::json::array();
    for (const auto &cell : column.cells) {
      values.push_back(cellToJson(cell));
    }
    json["columns"].push_back({{"name", column.name},
                               {"type", columnTypeToString(column.type)},
                               {"values", std::move(values)}});
  }
  json["row_ids"] = dataset.rowIds();
  return json;
}

nlohmann::json PipelineLoader::resultToJson(const Dataset &dataset,
                                            const ChangeLog &changeLog,
                                            const DatasetSummary &before,
                                            const DatasetSummary &after) {
  return {{"dataset", datasetToJson(dataset)},
          {"change_log", changeLog.toJson()},
          {"before", before.toJson()},
          {"after", after.toJson()},
          {"diff", SummaryDiff::between(before, after).toJson()}};
}

} // namespace scrub
