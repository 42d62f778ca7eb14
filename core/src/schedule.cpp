#include "core/schedule.h"

#include "core/cron_expression.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <string>

namespace wake::core {

namespace {

std::string trim(const std::string &text) {
  auto begin = text.begin();
  auto end = text.end();
  while (begin != end && std::isspace(static_cast<unsigned char>(*begin))) {
    ++begin;
  }
  while (end != begin && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
    --end;
  }
  return std::string(begin, end);
}

bool all_digits(const std::string &text) {
  return !text.empty() &&
         std::all_of(text.begin(), text.end(), [](char c) {
           return std::isdigit(static_cast<unsigned char>(c)) != 0;
         });
}

void sort_unique(std::vector<WallTime> &times) {
  std::sort(times.begin(), times.end());
  times.erase(std::unique(times.begin(), times.end()), times.end());
}

} // namespace

Result<WallTime, WakeError> parse_wall_time(const std::string &text) {
  const std::string trimmed = trim(text);
  const auto colon = trimmed.find(':');
  if (colon == std::string::npos) {
    return Result<WallTime, WakeError>::Err(
        WakeError::Validation("Invalid time (expected HH:MM): " + text));
  }

  const std::string hour_text = trimmed.substr(0, colon);
  const std::string minute_text = trimmed.substr(colon + 1);
  if (hour_text.size() > 2 || minute_text.size() != 2 ||
      !all_digits(hour_text) || !all_digits(minute_text)) {
    return Result<WallTime, WakeError>::Err(
        WakeError::Validation("Invalid time (expected HH:MM): " + text));
  }

  WallTime time{std::stoi(hour_text), std::stoi(minute_text)};
  if (time.hour > 23 || time.minute > 59) {
    return Result<WallTime, WakeError>::Err(
        WakeError::Validation("Time out of range: " + text));
  }
  return Result<WallTime, WakeError>::Ok(time);
}

std::string to_string(const WallTime &time) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", time.hour, time.minute);
  return buf;
}

const char *to_string(RepeatMode mode) {
  switch (mode) {
  case RepeatMode::Daily:
    return "daily";
  case RepeatMode::Weekly:
    return "weekly";
  case RepeatMode::Interval:
    return "interval";
  }
  return "daily";
}

const char *to_string(TriggerMode mode) {
  switch (mode) {
  case TriggerMode::Scheduled:
    return "scheduled";
  case TriggerMode::Crontab:
    return "crontab";
  case TriggerMode::QuotaReset:
    return "quota_reset";
  }
  return "scheduled";
}

bool operator==(const ScheduledTrigger &a, const ScheduledTrigger &b) {
  return a.repeat_mode == b.repeat_mode && a.daily_times == b.daily_times &&
         a.weekly_days == b.weekly_days && a.weekly_times == b.weekly_times &&
         a.interval_hours == b.interval_hours &&
         a.interval_start == b.interval_start &&
         a.interval_end == b.interval_end;
}

bool operator==(const QuotaResetTrigger &a, const QuotaResetTrigger &b) {
  return a.time_window_enabled == b.time_window_enabled &&
         a.window_start == b.window_start && a.window_end == b.window_end &&
         a.fallback_times == b.fallback_times;
}

bool operator==(const Schedule &a, const Schedule &b) {
  return a.trigger == b.trigger && a.selected_accounts == b.selected_accounts &&
         a.selected_capabilities == b.selected_capabilities &&
         a.custom_prompt == b.custom_prompt &&
         a.max_output_tokens == b.max_output_tokens;
}

TriggerMode trigger_mode(const Schedule &schedule) {
  if (std::holds_alternative<CrontabTrigger>(schedule.trigger)) {
    return TriggerMode::Crontab;
  }
  if (std::holds_alternative<QuotaResetTrigger>(schedule.trigger)) {
    return TriggerMode::QuotaReset;
  }
  return TriggerMode::Scheduled;
}

Schedule normalize(Schedule schedule) {
  if (auto *scheduled = std::get_if<ScheduledTrigger>(&schedule.trigger)) {
    if (scheduled->daily_times.empty()) {
      scheduled->daily_times = {{8, 0}};
    }
    sort_unique(scheduled->daily_times);

    auto &days = scheduled->weekly_days;
    days.erase(std::remove_if(days.begin(), days.end(),
                              [](int d) { return d < 0 || d > 6; }),
               days.end());
    if (days.empty()) {
      days = {1, 2, 3, 4, 5};
    }
    std::sort(days.begin(), days.end());
    days.erase(std::unique(days.begin(), days.end()), days.end());

    if (scheduled->weekly_times.empty()) {
      scheduled->weekly_times = {{8, 0}};
    }
    sort_unique(scheduled->weekly_times);

    if (scheduled->interval_hours <= 0) {
      scheduled->interval_hours = 4;
    } else if (scheduled->interval_hours > kMaxIntervalHours) {
      scheduled->interval_hours = kMaxIntervalHours;
    }
  } else if (auto *cron = std::get_if<CrontabTrigger>(&schedule.trigger)) {
    cron->expression = trim(cron->expression);
  } else if (auto *reset = std::get_if<QuotaResetTrigger>(&schedule.trigger)) {
    if (reset->fallback_times.empty()) {
      reset->fallback_times = {{7, 0}};
    }
    sort_unique(reset->fallback_times);
  }

  if (schedule.custom_prompt) {
    std::string prompt = trim(*schedule.custom_prompt);
    if (prompt.empty()) {
      schedule.custom_prompt.reset();
    } else {
      schedule.custom_prompt = std::move(prompt);
    }
  }
  if (schedule.max_output_tokens < 0) {
    schedule.max_output_tokens = 0;
  }
  return schedule;
}

Result<void, WakeError> validate(const Schedule &schedule) {
  if (schedule.selected_accounts.empty()) {
    return Result<void, WakeError>::Err(
        WakeError::Validation("At least one account must be selected"));
  }
  if (schedule.selected_capabilities.empty()) {
    return Result<void, WakeError>::Err(
        WakeError::Validation("At least one capability must be selected"));
  }
  if (const auto *scheduled = std::get_if<ScheduledTrigger>(&schedule.trigger)) {
    if (scheduled->repeat_mode == RepeatMode::Interval &&
        (scheduled->interval_hours <= 0 ||
         scheduled->interval_hours > kMaxIntervalHours)) {
      return Result<void, WakeError>::Err(WakeError::Validation(
          "Interval hours must be between 1 and " +
          std::to_string(kMaxIntervalHours)));
    }
  }
  if (const auto *cron = std::get_if<CrontabTrigger>(&schedule.trigger)) {
    if (trim(cron->expression).empty()) {
      return Result<void, WakeError>::Err(
          WakeError::Validation("Crontab expression is required"));
    }
    auto parsed = CronExpression::parse(cron->expression);
    if (parsed.is_err()) {
      return Result<void, WakeError>::Err(parsed.error());
    }
  }
  return Result<void, WakeError>::Ok();
}

std::vector<Capability> default_capabilities() {
  return {{"codex-hourly", "5h Window"}, {"codex-weekly", "Weekly Window"}};
}

} // namespace wake::core
