#include "core/wakeup_service.h"

#include "core/id.h"
#include "core/logger.h"
#include "core/recurrence.h"

#include <algorithm>

namespace wake::core {

namespace {

const char *const kWeekdayNames[] = {"Sun", "Mon", "Tue", "Wed",
                                     "Thu", "Fri", "Sat"};

std::string join_times(const std::vector<WallTime> &times) {
  std::string out;
  for (const auto &t : times) {
    if (!out.empty()) {
      out += ", ";
    }
    out += to_string(t);
  }
  return out;
}

TriggerSource source_for(TriggerMode mode) {
  switch (mode) {
  case TriggerMode::Scheduled:
    return TriggerSource::Scheduled;
  case TriggerMode::Crontab:
    return TriggerSource::Crontab;
  case TriggerMode::QuotaReset:
    return TriggerSource::QuotaReset;
  }
  return TriggerSource::Scheduled;
}

RunSummary summarize(const FanOutReport &report,
                     std::vector<HistoryRecord> records) {
  RunSummary summary;
  summary.succeeded = report.succeeded();
  summary.failed = report.failed();
  summary.records = std::move(records);
  return summary;
}

} // namespace

std::string describe(const Schedule &schedule) {
  if (const auto *cron = std::get_if<CrontabTrigger>(&schedule.trigger)) {
    return "Cron: " + cron->expression;
  }
  if (const auto *reset = std::get_if<QuotaResetTrigger>(&schedule.trigger)) {
    if (!reset->time_window_enabled) {
      return "On quota reset";
    }
    return "On quota reset within " + to_string(reset->window_start) + "-" +
           to_string(reset->window_end) + ", otherwise at " +
           join_times(reset->fallback_times);
  }

  const auto &trigger = std::get<ScheduledTrigger>(schedule.trigger);
  switch (trigger.repeat_mode) {
  case RepeatMode::Daily:
    return "Daily at " + join_times(trigger.daily_times);
  case RepeatMode::Weekly: {
    std::string days;
    for (int d : trigger.weekly_days) {
      if (d < 0 || d > 6) {
        continue;
      }
      if (!days.empty()) {
        days += ", ";
      }
      days += kWeekdayNames[d];
    }
    return "Weekly on " + days + " at " + join_times(trigger.weekly_times);
  }
  case RepeatMode::Interval:
    return "Every " + std::to_string(trigger.interval_hours) + "h from " +
           to_string(trigger.interval_start) + " to " +
           to_string(trigger.interval_end);
  }
  return {};
}

std::string describe(const WakeTask &task) { return describe(task.schedule); }

WakeupService::WakeupService(std::shared_ptr<TaskRegistry> registry,
                             std::shared_ptr<HistoryLog> history,
                             std::shared_ptr<FanOutExecutor> executor,
                             std::shared_ptr<IClock> clock,
                             std::shared_ptr<ILogger> logger)
    : registry_(std::move(registry)), history_(std::move(history)),
      executor_(std::move(executor)), clock_(std::move(clock)),
      logger_(std::move(logger)) {}

Result<RunSummary, WakeError>
WakeupService::run_task(const std::string &task_id, TriggerType trigger_type) {
  auto task = registry_->find(task_id);
  if (!task) {
    return Result<RunSummary, WakeError>::Err(
        WakeError::NotFound("task " + task_id));
  }
  return run(*task, trigger_type);
}

Result<RunSummary, WakeError> WakeupService::run(const WakeTask &task,
                                                 TriggerType trigger_type) {
  const std::string trace_id = generate_id();
  const auto started = clock_->now();
  if (logger_) {
    logger_->info(trace_id, "wakeup", "task_run",
                  "id=" + task.id + " name=" + task.name +
                      " trigger=" + to_string(trigger_type));
  }

  WakePayload payload;
  payload.prompt = task.schedule.custom_prompt;
  payload.max_output_tokens = task.schedule.max_output_tokens;

  auto report = executor_->execute(task.schedule.selected_accounts,
                                   task.schedule.selected_capabilities,
                                   payload, trace_id);
  if (report.is_err()) {
    if (logger_) {
      logger_->warn(trace_id, "wakeup", "task_run_rejected",
                    report.error().internal_message);
    }
    return Result<RunSummary, WakeError>::Err(report.error());
  }

  RunContext ctx;
  ctx.trigger_type = trigger_type;
  ctx.trigger_source = source_for(trigger_mode(task.schedule));
  ctx.task_name = task.name;
  ctx.prompt = task.schedule.custom_prompt;
  ctx.timestamp = started;

  auto records = to_history_records(report.value(), ctx);
  history_->append(records);

  auto stamped = registry_->record_run(task.id, started);
  if (stamped.is_err() && logger_) {
    // Task removed while its fan-out was in flight.
    logger_->warn(trace_id, "wakeup", "record_run_failed",
                  stamped.error().internal_message);
  }

  return Result<RunSummary, WakeError>::Ok(
      summarize(report.value(), std::move(records)));
}

Result<RunSummary, WakeError>
WakeupService::run_manual_test(const ManualTestRequest &request) {
  const std::string trace_id = generate_id();
  const auto started = clock_->now();

  WakePayload payload;
  if (request.prompt) {
    const auto begin = request.prompt->find_first_not_of(" \t\r\n");
    if (begin != std::string::npos) {
      const auto end = request.prompt->find_last_not_of(" \t\r\n");
      payload.prompt = request.prompt->substr(begin, end - begin + 1);
    }
  }
  payload.max_output_tokens =
      resolve_max_output_tokens(request.max_output_tokens, registry_->tasks());

  if (logger_) {
    logger_->info(trace_id, "wakeup", "manual_test",
                  "accounts=" + std::to_string(request.accounts.size()) +
                      " capabilities=" +
                      std::to_string(request.capabilities.size()));
  }

  auto report = executor_->execute(request.accounts, request.capabilities,
                                   payload, trace_id);
  if (report.is_err()) {
    return Result<RunSummary, WakeError>::Err(report.error());
  }

  RunContext ctx;
  ctx.trigger_type = TriggerType::Manual;
  ctx.trigger_source = TriggerSource::Manual;
  ctx.task_name = std::string(kManualTestTaskName);
  ctx.prompt = payload.prompt;
  ctx.timestamp = started;

  auto records = to_history_records(report.value(), ctx);
  history_->append(records);
  return Result<RunSummary, WakeError>::Ok(
      summarize(report.value(), std::move(records)));
}

std::size_t WakeupService::tick() {
  const auto now = clock_->now();
  Timestamp previous;
  std::vector<std::string> due_resets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_tick_) {
      last_tick_ = now;
      return 0;
    }
    previous = *last_tick_;
    last_tick_ = now;

    auto split = std::stable_partition(
        pending_.begin(), pending_.end(),
        [now](const PendingRun &p) { return p.fire_at > now; });
    for (auto it = split; it != pending_.end(); ++it) {
      due_resets.push_back(it->task_id);
    }
    pending_.erase(split, pending_.end());
  }

  if (!registry_->wakeup_enabled()) {
    if (logger_) {
      for (const auto &task_id : due_resets) {
        logger_->warn("", "wakeup", "quota_reset_dropped",
                      "id=" + task_id + " wakeup disabled");
      }
    }
    return 0;
  }

  std::size_t fired = 0;
  for (const auto &task : registry_->tasks()) {
    if (!task.enabled ||
        trigger_mode(task.schedule) == TriggerMode::QuotaReset) {
      continue;
    }
    auto runs = next_runs(task.schedule, previous, 1);
    if (runs.empty() || runs.front() > now) {
      continue;
    }
    auto result = run(task, TriggerType::Auto);
    if (result.is_err() && logger_) {
      logger_->warn("", "wakeup", "auto_run_failed",
                    "id=" + task.id + " " + result.error().user_message);
    }
    ++fired;
  }

  for (const auto &task_id : due_resets) {
    auto task = registry_->find(task_id);
    if (!task || !task->enabled) {
      continue;
    }
    auto result = run(*task, TriggerType::Auto);
    if (result.is_err() && logger_) {
      logger_->warn("", "wakeup", "auto_run_failed",
                    "id=" + task_id + " " + result.error().user_message);
    }
    ++fired;
  }
  return fired;
}

std::size_t WakeupService::notify_quota_reset(Timestamp reset_at) {
  if (!registry_->wakeup_enabled()) {
    if (logger_) {
      logger_->info("", "wakeup", "quota_reset_ignored", "wakeup disabled");
    }
    return 0;
  }

  const auto now = clock_->now();
  std::size_t fired = 0;
  for (const auto &task : registry_->tasks()) {
    const auto *trigger =
        std::get_if<QuotaResetTrigger>(&task.schedule.trigger);
    if (!task.enabled || trigger == nullptr) {
      continue;
    }
    auto fire_at = quota_reset_fire_time(*trigger, reset_at);
    if (!fire_at) {
      if (logger_) {
        logger_->warn("", "wakeup", "quota_reset_unscheduled",
                      "id=" + task.id + " no fallback time");
      }
      continue;
    }
    if (*fire_at <= now) {
      auto result = run(task, TriggerType::Auto);
      if (result.is_err() && logger_) {
        logger_->warn("", "wakeup", "auto_run_failed",
                      "id=" + task.id + " " + result.error().user_message);
      }
      ++fired;
      continue;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(pending_.begin(), pending_.end(),
                           [&](const PendingRun &p) { return p.task_id == task.id; });
    if (it != pending_.end()) {
      it->fire_at = *fire_at;
    } else {
      pending_.push_back(PendingRun{task.id, *fire_at});
    }
    if (logger_) {
      logger_->info("", "wakeup", "quota_reset_queued",
                    "id=" + task.id + " at_ms=" +
                        std::to_string(to_epoch_ms(*fire_at)));
    }
  }
  return fired;
}

std::optional<Timestamp> WakeupService::next_run(const WakeTask &task) const {
  auto runs = next_runs(task.schedule, clock_->now(), 1);
  if (runs.empty()) {
    return std::nullopt;
  }
  return runs.front();
}

std::size_t WakeupService::pending_quota_runs() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

} // namespace wake::core
