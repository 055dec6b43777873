#pragma once

#include "change_log.hpp"
#include "cleaning_session.hpp"
#include "config_manager.hpp"
#include "operation.hpp"
#include "scope_resolver.hpp"
#include <vector>

namespace scrub {

struct CleaningResult {
  Dataset dataset;
  ChangeLog changeLog;
};

/**
 * Applies scoped cleaning operations to a dataset.
 *
 * The engine never mutates the dataset it is given. Operations in a batch
 * run strictly in order, each one seeing the output of the previous one. A
 * failing operation is recorded as FAILED and the batch continues from the
 * state before it.
 */
class CleaningEngine {
public:
  explicit CleaningEngine(EngineConfig config = {});

  /**
   * Runs one operation against @p dataset: resolve the scope, split,
   * transform the in-scope rows, merge. The outcome holds the full merged
   * dataset.
   * @throws ScrubException subclasses for invalid scopes or parameters.
   */
  OperationOutcome apply(const Dataset &dataset,
                         const OperationDescriptor &operation) const;

  /**
   * @throws ValidationException (EMPTY_DATASET) before any operation runs
   *         when the session dataset has no columns or no rows.
   */
  void run(CleaningSession &session,
           const std::vector<OperationDescriptor> &operations) const;

  CleaningResult run(const Dataset &dataset,
                     const std::vector<OperationDescriptor> &operations) const;

  const EngineConfig &getConfig() const noexcept { return config_; }

private:
  EngineConfig config_;
  ScopeResolver resolver_;

  OperationOutcome dispatch(const OperationDescriptor &operation,
                            const Dataset &subset,
                            const ColumnSelection &columns) const;
};

} // namespace scrub
