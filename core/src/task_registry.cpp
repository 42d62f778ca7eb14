#include "core/task_registry.h"

#include "core/codec.h"
#include "core/id.h"
#include "core/logger.h"

#include <algorithm>

namespace wake::core {

namespace {

/// Keep the ids present in `available`; fall back to its first entry.
bool repair_list(std::vector<std::string> &selected,
                 const std::vector<std::string> &available) {
  if (available.empty()) {
    return false;
  }
  std::vector<std::string> kept;
  for (const auto &id : selected) {
    if (std::find(available.begin(), available.end(), id) != available.end()) {
      kept.push_back(id);
    }
  }
  if (kept.empty()) {
    kept.push_back(available.front());
  }
  if (kept == selected) {
    return false;
  }
  selected = std::move(kept);
  return true;
}

std::string trim(const std::string &text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

} // namespace

std::vector<WakeTask>
repair_selections(std::vector<WakeTask> tasks,
                  const std::vector<std::string> &available_accounts,
                  const std::vector<std::string> &available_capabilities) {
  for (auto &task : tasks) {
    repair_list(task.schedule.selected_accounts, available_accounts);
    repair_list(task.schedule.selected_capabilities, available_capabilities);
  }
  return tasks;
}

TaskRegistry::TaskRegistry(StoreHandle tasks_store, StoreHandle switch_store,
                           std::shared_ptr<IClock> clock,
                           std::shared_ptr<ILogger> logger)
    : tasks_store_(std::move(tasks_store)),
      switch_store_(std::move(switch_store)), clock_(std::move(clock)),
      logger_(std::move(logger)) {}

void TaskRegistry::load() {
  std::vector<WakeTask> loaded;
  bool seed_default = false;

  auto raw = tasks_store_.read();
  if (raw.is_err()) {
    if (logger_) {
      logger_->warn("registry", "registry", "load_failed",
                    raw.error().internal_message);
    }
  } else if (!raw.value().has_value()) {
    seed_default = true;
  } else {
    auto decoded = decode_tasks(*raw.value());
    if (decoded.is_err()) {
      if (logger_) {
        logger_->warn("registry", "registry", "load_failed",
                      decoded.error().internal_message);
      }
    } else {
      loaded = std::move(decoded).value();
    }
  }

  if (seed_default) {
    WakeTask task;
    task.id = generate_id();
    task.name = kDefaultTaskName;
    task.enabled = true;
    task.created_at = clock_->now();
    task.schedule = normalize(Schedule{});
    loaded.push_back(std::move(task));
  }

  bool enabled = false;
  auto raw_switch = switch_store_.read();
  if (raw_switch.is_ok() && raw_switch.value().has_value()) {
    enabled = *raw_switch.value() == "true";
  } else if (raw_switch.is_err() && logger_) {
    logger_->warn("registry", "registry", "load_failed",
                  raw_switch.error().internal_message);
  }

  std::vector<WakeTask> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_ = std::move(loaded);
    wakeup_enabled_ = enabled;
    if (seed_default) {
      persist_locked();
    }
    snapshot = tasks_;
  }
  if (logger_) {
    logger_->info("registry", "registry", "tasks_loaded",
                  "count=" + std::to_string(snapshot.size()) +
                      " wakeup_enabled=" + (enabled ? "true" : "false"));
  }
  notify(snapshot);
}

Result<TaskDraft, WakeError> TaskRegistry::validate_draft(TaskDraft draft) const {
  draft.name = trim(draft.name);
  if (draft.name.empty()) {
    return Result<TaskDraft, WakeError>::Err(
        WakeError::Validation("Task name is required"));
  }
  draft.schedule = normalize(std::move(draft.schedule));
  auto valid = validate(draft.schedule);
  if (valid.is_err()) {
    return Result<TaskDraft, WakeError>::Err(valid.error());
  }
  return Result<TaskDraft, WakeError>::Ok(std::move(draft));
}

Result<WakeTask, WakeError> TaskRegistry::create(TaskDraft draft) {
  auto checked = validate_draft(std::move(draft));
  if (checked.is_err()) {
    return Result<WakeTask, WakeError>::Err(checked.error());
  }

  WakeTask task;
  task.id = generate_id();
  task.name = checked.value().name;
  task.enabled = checked.value().enabled;
  task.created_at = clock_->now();
  task.schedule = std::move(checked).value().schedule;

  std::vector<WakeTask> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.insert(tasks_.begin(), task);
    persist_locked();
    snapshot = tasks_;
  }
  if (logger_) {
    logger_->info("registry", "registry", "task_created",
                  "id=" + task.id + " name=" + task.name + " mode=" +
                      to_string(trigger_mode(task.schedule)));
  }
  notify(snapshot);
  return Result<WakeTask, WakeError>::Ok(std::move(task));
}

Result<WakeTask, WakeError> TaskRegistry::update(const std::string &task_id,
                                                 TaskDraft draft) {
  auto checked = validate_draft(std::move(draft));
  if (checked.is_err()) {
    return Result<WakeTask, WakeError>::Err(checked.error());
  }

  WakeTask updated;
  std::vector<WakeTask> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const WakeTask &t) { return t.id == task_id; });
    if (it == tasks_.end()) {
      return Result<WakeTask, WakeError>::Err(
          WakeError::NotFound("task " + task_id));
    }
    it->name = checked.value().name;
    it->enabled = checked.value().enabled;
    it->schedule = std::move(checked).value().schedule;
    updated = *it;
    persist_locked();
    snapshot = tasks_;
  }
  if (logger_) {
    logger_->info("registry", "registry", "task_updated",
                  "id=" + task_id + " mode=" +
                      to_string(trigger_mode(updated.schedule)));
  }
  notify(snapshot);
  return Result<WakeTask, WakeError>::Ok(std::move(updated));
}

Result<void, WakeError> TaskRegistry::remove(const std::string &task_id) {
  std::vector<WakeTask> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const WakeTask &t) { return t.id == task_id; });
    if (it == tasks_.end()) {
      return Result<void, WakeError>::Err(
          WakeError::NotFound("task " + task_id));
    }
    tasks_.erase(it);
    persist_locked();
    snapshot = tasks_;
  }
  if (logger_) {
    logger_->info("registry", "registry", "task_removed", "id=" + task_id);
  }
  notify(snapshot);
  return Result<void, WakeError>::Ok();
}

Result<void, WakeError> TaskRegistry::set_enabled(const std::string &task_id,
                                                  bool enabled) {
  std::vector<WakeTask> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const WakeTask &t) { return t.id == task_id; });
    if (it == tasks_.end()) {
      return Result<void, WakeError>::Err(
          WakeError::NotFound("task " + task_id));
    }
    if (it->enabled == enabled) {
      return Result<void, WakeError>::Ok();
    }
    it->enabled = enabled;
    persist_locked();
    snapshot = tasks_;
  }
  notify(snapshot);
  return Result<void, WakeError>::Ok();
}

Result<void, WakeError> TaskRegistry::record_run(const std::string &task_id,
                                                 Timestamp at) {
  std::vector<WakeTask> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const WakeTask &t) { return t.id == task_id; });
    if (it == tasks_.end()) {
      return Result<void, WakeError>::Err(
          WakeError::NotFound("task " + task_id));
    }
    it->last_run_at = at;
    persist_locked();
    snapshot = tasks_;
  }
  notify(snapshot);
  return Result<void, WakeError>::Ok();
}

std::size_t TaskRegistry::repair_selections(
    const std::vector<std::string> &available_accounts,
    const std::vector<std::string> &available_capabilities) {
  std::size_t changed = 0;
  std::vector<WakeTask> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto repaired = core::repair_selections(tasks_, available_accounts,
                                            available_capabilities);
    for (std::size_t i = 0; i < repaired.size(); ++i) {
      if (repaired[i].schedule != tasks_[i].schedule) {
        ++changed;
      }
    }
    if (changed == 0) {
      return 0;
    }
    tasks_ = std::move(repaired);
    persist_locked();
    snapshot = tasks_;
  }
  if (logger_) {
    logger_->info("registry", "registry", "selections_repaired",
                  "tasks=" + std::to_string(changed));
  }
  notify(snapshot);
  return changed;
}

std::vector<WakeTask> TaskRegistry::tasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_;
}

std::optional<WakeTask> TaskRegistry::find(const std::string &task_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(tasks_.begin(), tasks_.end(),
                         [&](const WakeTask &t) { return t.id == task_id; });
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return *it;
}

std::optional<WakeTask> TaskRegistry::first_enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = std::find_if(tasks_.begin(), tasks_.end(),
                         [](const WakeTask &t) { return t.enabled; });
  if (it == tasks_.end()) {
    return std::nullopt;
  }
  return *it;
}

bool TaskRegistry::wakeup_enabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return wakeup_enabled_;
}

void TaskRegistry::set_wakeup_enabled(bool enabled) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (wakeup_enabled_ == enabled) {
      return;
    }
    wakeup_enabled_ = enabled;
    auto written = switch_store_.write(enabled ? "true" : "false");
    if (written.is_err() && logger_) {
      logger_->warn("registry", "registry", "persist_failed",
                    written.error().internal_message);
    }
  }
  if (logger_) {
    logger_->info("registry", "registry", "wakeup_switch",
                  enabled ? "enabled" : "disabled");
  }
}

void TaskRegistry::on_change(ChangeCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(cb));
}

void TaskRegistry::persist_locked() {
  auto written = tasks_store_.write(encode_tasks(tasks_));
  if (written.is_err() && logger_) {
    logger_->warn("registry", "registry", "persist_failed",
                  written.error().internal_message);
  }
}

void TaskRegistry::notify(const std::vector<WakeTask> &snapshot) {
  std::vector<ChangeCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = callbacks_;
  }
  for (auto &cb : callbacks) {
    if (cb) {
      cb(snapshot);
    }
  }
}

} // namespace wake::core
