#include "cleaning_engine.hpp"
#include "basic_cleaners.hpp"
#include "component_logger.hpp"
#include "date_normalizer.hpp"
#include "duplicate_remover.hpp"
#include "exceptions.hpp"
#include "missing_value_handler.hpp"
#include "outlier_remover.hpp"
#include "text_standardizer.hpp"
#include "type_converter.hpp"
#include <chrono>

namespace scrub {

CleaningEngine::CleaningEngine(EngineConfig config)
    : config_(std::move(config)), resolver_(config_.scopePolicy) {}

OperationOutcome
CleaningEngine::dispatch(const OperationDescriptor &operation,
                         const Dataset &subset,
                         const ColumnSelection &columns) const {
  const auto &params = operation.params;

  switch (operation.kind()) {
  case OperationKind::REMOVE_DUPLICATES:
    return DuplicateRemover(std::get<RemoveDuplicatesParams>(params))
        .transform(subset, columns);
  case OperationKind::HANDLE_MISSING:
    return MissingValueHandler(std::get<HandleMissingParams>(params))
        .transform(subset, columns);
  case OperationKind::STANDARDIZE_TEXT:
    return TextStandardizer(std::get<StandardizeTextParams>(params))
        .transform(subset, columns);
  case OperationKind::NORMALIZE_DATES:
    return DateNormalizer(std::get<NormalizeDatesParams>(params), config_)
        .transform(subset, columns);
  case OperationKind::REMOVE_OUTLIERS:
    return OutlierRemover(std::get<RemoveOutliersParams>(params), config_)
        .transform(subset, columns);
  case OperationKind::TRIM_WHITESPACE:
    return WhitespaceTrimmer(std::get<TrimWhitespaceParams>(params))
        .transform(subset, columns);
  case OperationKind::REMOVE_EMPTY_ROWS:
    return EmptyRowRemover(std::get<RemoveEmptyRowsParams>(params))
        .transform(subset);
  case OperationKind::CONVERT_TYPES:
    return TypeConverter(std::get<ConvertTypesParams>(params))
        .transform(subset, columns);
  }

  throw createOperationError(ErrorCode::OPERATION_FAILED, "dispatch",
                             "Unsupported operation kind");
}

OperationOutcome
CleaningEngine::apply(const Dataset &dataset,
                      const OperationDescriptor &operation) const {
  ResolvedScope scope = resolver_.resolve(dataset, operation.scope);
  Partition partition = resolver_.split(dataset, scope);

  OperationOutcome outcome =
      dispatch(operation, partition.inScope, scope.columns);
  outcome.dataset = resolver_.merge(dataset, partition, outcome.dataset,
                                    outcome.touchedColumns);

  for (const auto &name : scope.ignoredColumns) {
    outcome.notes.push_back("Unknown column '" + name + "' ignored");
  }
  if (!scope.ignoredRowIds.empty()) {
    outcome.notes.push_back(std::to_string(scope.ignoredRowIds.size()) +
                            " unknown row identifiers ignored");
  }
  return outcome;
}

void CleaningEngine::run(
    CleaningSession &session,
    const std::vector<OperationDescriptor> &operations) const {
  const Dataset &start = session.current();
  if (start.empty()) {
    throw ValidationException(
        ErrorCode::EMPTY_DATASET,
        "Dataset has " + std::to_string(start.columnCount()) +
            " columns and " + std::to_string(start.rowCount()) +
            " rows, nothing to clean",
        "dataset");
  }

  ENGINE_LOG_INFO("Running {} operations on {} rows x {} columns",
                  operations.size(), start.rowCount(), start.columnCount());

  for (const auto &operation : operations) {
    const std::string kind = operationKindToString(operation.kind());

    ChangeLogEntry entry;
    entry.kind = operation.kind();
    entry.rowsBefore = session.current().rowCount();

    auto began = std::chrono::steady_clock::now();
    try {
      OperationOutcome outcome = apply(session.current(), operation);
      entry.durationMs = std::chrono::duration<double, std::milli>(
                             std::chrono::steady_clock::now() - began)
                             .count();
      entry.summary = outcome.summary;
      entry.rowsAfter = outcome.dataset.rowCount();
      entry.affected = outcome.affected;
      entry.notes = std::move(outcome.notes);

      ENGINE_LOG_INFO("{}: {}", kind, entry.summary);
      for (const auto &note : entry.notes) {
        ENGINE_LOG_DEBUG("{}: {}", kind, note);
      }
      EngineLogger::logPerformance(kind, entry.durationMs,
                                   {{"rows_before",
                                     std::to_string(entry.rowsBefore)},
                                    {"rows_after",
                                     std::to_string(entry.rowsAfter)}});

      session.commit(std::move(outcome.dataset), std::move(entry));
    } catch (const ScrubException &e) {
      EngineLogger::errorWithContext(kind + " failed: " + e.toLogString(),
                                     {{"error_code",
                                       errorCodeToString(e.getCode())},
                                      {"category",
                                       getErrorCategory(e.getCode())}});
      entry.summary = "Failed: " + e.getMessage();
      session.recordFailure(std::move(entry));
    } catch (const std::exception &e) {
      ENGINE_LOG_ERROR("{} failed: {}", kind, e.what());
      entry.summary = std::string("Failed: ") + e.what();
      session.recordFailure(std::move(entry));
    }
  }

  const ChangeLog &log = session.changeLog();
  ENGINE_LOG_INFO("Finished: {} rows remain, {} of {} operations failed",
                  session.current().rowCount(), log.failedCount(),
                  operations.size());
}

CleaningResult
CleaningEngine::run(const Dataset &dataset,
                    const std::vector<OperationDescriptor> &operations) const {
  CleaningSession session(dataset);
  run(session, operations);
  return CleaningResult{session.current(), session.changeLog()};
}

} // namespace scrub
