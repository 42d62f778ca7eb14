#pragma once

#include "core/clock.h"
#include "core/durable_store.h"
#include "core/error.h"
#include "core/result.h"
#include "core/task.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wake::core {

class ILogger;

inline constexpr const char *kDefaultTaskName = "Default wake task";

/// Point every task's selections back at available targets.
///
/// A selection is filtered to the available ids; when nothing survives, the
/// first available id is substituted. An empty availability list leaves that
/// dimension untouched. Returns the repaired list; tasks whose selections
/// are already valid come back unchanged.
std::vector<WakeTask>
repair_selections(std::vector<WakeTask> tasks,
                  const std::vector<std::string> &available_accounts,
                  const std::vector<std::string> &available_capabilities);

/// Owns the set of wake tasks and the global wake switch.
///
/// Mutations are applied in memory first, then written behind to the store.
/// A failed write is logged and never rolls the in-memory change back.
/// Validation failures are returned before anything changes.
class TaskRegistry {
public:
  TaskRegistry(StoreHandle tasks_store, StoreHandle switch_store,
               std::shared_ptr<IClock> clock, std::shared_ptr<ILogger> logger);

  /// Restore tasks and the switch. Seeds one enabled default task when no
  /// task list has ever been stored.
  void load();

  Result<WakeTask, WakeError> create(TaskDraft draft);

  /// Replace name, enabled flag and schedule; id, created_at and
  /// last_run_at are preserved.
  Result<WakeTask, WakeError> update(const std::string &task_id,
                                     TaskDraft draft);

  Result<void, WakeError> remove(const std::string &task_id);
  Result<void, WakeError> set_enabled(const std::string &task_id, bool enabled);

  /// Only touches last_run_at.
  Result<void, WakeError> record_run(const std::string &task_id, Timestamp at);

  /// Apply repair_selections() to the registry. Returns the number of tasks
  /// that changed; persists only when that is non-zero.
  std::size_t
  repair_selections(const std::vector<std::string> &available_accounts,
                    const std::vector<std::string> &available_capabilities);

  [[nodiscard]] std::vector<WakeTask> tasks() const;
  [[nodiscard]] std::optional<WakeTask> find(const std::string &task_id) const;
  [[nodiscard]] std::optional<WakeTask> first_enabled() const;

  [[nodiscard]] bool wakeup_enabled() const;
  void set_wakeup_enabled(bool enabled);

  using ChangeCallback = std::function<void(const std::vector<WakeTask> &tasks)>;

  /// Register an observer, invoked after every change with a snapshot.
  void on_change(ChangeCallback cb);

private:
  Result<TaskDraft, WakeError> validate_draft(TaskDraft draft) const;
  void persist_locked();
  void notify(const std::vector<WakeTask> &snapshot);

  StoreHandle tasks_store_;
  StoreHandle switch_store_;
  std::shared_ptr<IClock> clock_;
  std::shared_ptr<ILogger> logger_;

  mutable std::mutex mutex_;
  std::vector<WakeTask> tasks_;
  bool wakeup_enabled_ = false;
  std::vector<ChangeCallback> callbacks_;
};

} // namespace wake::core
