#include "core/recurrence.h"

#include "core/cron_expression.h"

#include <algorithm>
#include <ctime>

namespace wake::core {

namespace {

constexpr int kDailyHorizonDays = 7;
constexpr int kWeeklyHorizonDays = 14;
constexpr int kIntervalHorizonDays = 7;
constexpr int kFallbackHorizonDays = 2;

std::tm to_local_tm(Timestamp ts) {
  const std::time_t secs = std::chrono::system_clock::to_time_t(
      std::chrono::time_point_cast<std::chrono::system_clock::duration>(ts));
  std::tm tm{};
  localtime_r(&secs, &tm);
  return tm;
}

Timestamp from_local_tm(std::tm tm) {
  tm.tm_isdst = -1;
  const std::time_t secs = std::mktime(&tm);
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::from_time_t(secs));
}

std::vector<WallTime> sorted_times(std::vector<WallTime> times) {
  std::sort(times.begin(), times.end());
  times.erase(std::unique(times.begin(), times.end()), times.end());
  return times;
}

} // namespace

Timestamp local_time_on_day(Timestamp base, int day_offset, WallTime time) {
  std::tm tm = to_local_tm(base);
  tm.tm_mday += day_offset;
  tm.tm_hour = time.hour;
  tm.tm_min = time.minute;
  tm.tm_sec = 0;
  return from_local_tm(tm);
}

int local_weekday(Timestamp base, int day_offset) {
  std::tm tm = to_local_tm(base);
  tm.tm_mday += day_offset;
  tm.tm_hour = 12; // away from any DST gap
  tm.tm_min = 0;
  tm.tm_sec = 0;
  tm.tm_isdst = -1;
  std::mktime(&tm);
  return tm.tm_wday;
}

WallTime local_wall_time(Timestamp ts) {
  const std::tm tm = to_local_tm(ts);
  return WallTime{tm.tm_hour, tm.tm_min};
}

std::vector<Timestamp> next_runs(const ScheduledTrigger &trigger, Timestamp now,
                                 std::size_t count) {
  std::vector<Timestamp> results;
  if (count == 0) {
    return results;
  }

  auto accept = [&](Timestamp candidate) {
    if (candidate > now) {
      results.push_back(candidate);
    }
    return results.size() >= count;
  };

  switch (trigger.repeat_mode) {
  case RepeatMode::Daily: {
    const auto times = sorted_times(trigger.daily_times);
    for (int day = 0; day < kDailyHorizonDays; ++day) {
      for (const auto &time : times) {
        if (accept(local_time_on_day(now, day, time))) {
          return results;
        }
      }
    }
    break;
  }
  case RepeatMode::Weekly: {
    const auto times = sorted_times(trigger.weekly_times);
    for (int day = 0; day < kWeeklyHorizonDays; ++day) {
      const int weekday = local_weekday(now, day);
      if (std::find(trigger.weekly_days.begin(), trigger.weekly_days.end(),
                    weekday) == trigger.weekly_days.end()) {
        continue;
      }
      for (const auto &time : times) {
        if (accept(local_time_on_day(now, day, time))) {
          return results;
        }
      }
    }
    break;
  }
  case RepeatMode::Interval: {
    const int step = trigger.interval_hours > 0 ? trigger.interval_hours : 4;
    const int last = trigger.interval_end.hour;
    for (int day = 0; day < kIntervalHorizonDays; ++day) {
      for (int hour = trigger.interval_start.hour; hour <= last;) {
        if (accept(local_time_on_day(
                now, day, WallTime{hour, trigger.interval_start.minute}))) {
          return results;
        }
        if (last - hour < step) {
          break;
        }
        hour += step;
      }
    }
    break;
  }
  }

  return results;
}

std::vector<Timestamp> next_runs(const Schedule &schedule, Timestamp now,
                                 std::size_t count) {
  if (const auto *scheduled = std::get_if<ScheduledTrigger>(&schedule.trigger)) {
    return next_runs(*scheduled, now, count);
  }
  if (const auto *cron = std::get_if<CrontabTrigger>(&schedule.trigger)) {
    return cron_next_runs(cron->expression, now, count);
  }
  return {};
}

std::optional<Timestamp> quota_reset_fire_time(const QuotaResetTrigger &trigger,
                                               Timestamp reset_at) {
  if (!trigger.time_window_enabled) {
    return reset_at;
  }

  const int at = local_wall_time(reset_at).minutes_of_day();
  const int start = trigger.window_start.minutes_of_day();
  const int end = trigger.window_end.minutes_of_day();
  const bool inside = start <= end ? (at >= start && at < end)
                                   : (at >= start || at < end);
  if (inside) {
    return reset_at;
  }

  const auto fallbacks = sorted_times(trigger.fallback_times);
  for (int day = 0; day < kFallbackHorizonDays; ++day) {
    for (const auto &time : fallbacks) {
      const Timestamp candidate = local_time_on_day(reset_at, day, time);
      if (candidate > reset_at) {
        return candidate;
      }
    }
  }
  return std::nullopt;
}

} // namespace wake::core
