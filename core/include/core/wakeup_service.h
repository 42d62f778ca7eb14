#pragma once

#include "core/clock.h"
#include "core/error.h"
#include "core/fan_out.h"
#include "core/history_log.h"
#include "core/result.h"
#include "core/task_registry.h"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wake::core {

class ILogger;

/// Result of one fan-out as seen by the caller.
struct RunSummary {
  std::size_t succeeded = 0;
  std::size_t failed = 0;
  std::vector<HistoryRecord> records;
};

/// Ad-hoc run that is not tied to a task.
struct ManualTestRequest {
  std::vector<std::string> accounts;
  std::vector<std::string> capabilities;
  std::optional<std::string> prompt;
  std::optional<double> max_output_tokens; // nullopt = first enabled task's
};

inline constexpr const char *kManualTestTaskName = "Run test";

/// One-line summary of a task's trigger, e.g. "Daily at 08:00, 12:00".
std::string describe(const Schedule &schedule);
std::string describe(const WakeTask &task);

/// WakeupService: drives fan-outs for the three trigger paths.
///
///   - run_task / run_manual_test   explicit runs
///   - tick                         timer for Scheduled and Crontab tasks
///   - notify_quota_reset           external quota-reset signal
///
/// Each run folds its report into the history log. Task runs also stamp
/// last_run_at. Fan-outs run on the calling thread.
class WakeupService {
public:
  WakeupService(std::shared_ptr<TaskRegistry> registry,
                std::shared_ptr<HistoryLog> history,
                std::shared_ptr<FanOutExecutor> executor,
                std::shared_ptr<IClock> clock,
                std::shared_ptr<ILogger> logger);

  /// Run one task now. The trigger source follows the task's mode.
  Result<RunSummary, WakeError> run_task(const std::string &task_id,
                                         TriggerType trigger_type);

  Result<RunSummary, WakeError> run_manual_test(const ManualTestRequest &request);

  /// Fire every enabled Scheduled or Crontab task with a run in
  /// (previous tick, now], then any queued quota-reset runs that are due.
  /// The first call only records the time. Returns the number of tasks run.
  std::size_t tick();

  /// Fire or queue enabled quota-reset tasks for a reset at `reset_at`.
  /// Returns the number of tasks run immediately.
  std::size_t notify_quota_reset(Timestamp reset_at);

  [[nodiscard]] std::optional<Timestamp> next_run(const WakeTask &task) const;

  /// Quota-reset runs waiting for tick().
  [[nodiscard]] std::size_t pending_quota_runs() const;

private:
  Result<RunSummary, WakeError> run(const WakeTask &task,
                                    TriggerType trigger_type);

  std::shared_ptr<TaskRegistry> registry_;
  std::shared_ptr<HistoryLog> history_;
  std::shared_ptr<FanOutExecutor> executor_;
  std::shared_ptr<IClock> clock_;
  std::shared_ptr<ILogger> logger_;

  struct PendingRun {
    std::string task_id;
    Timestamp fire_at;
  };

  mutable std::mutex mutex_;
  std::optional<Timestamp> last_tick_;
  std::vector<PendingRun> pending_;
};

} // namespace wake::core
