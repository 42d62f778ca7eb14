#pragma once

#include "core/error.h"
#include "core/result.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wake::core {

// ---- Wall-clock time of day ----

struct WallTime {
  int hour = 0;   // 0-23
  int minute = 0; // 0-59

  [[nodiscard]] int minutes_of_day() const { return hour * 60 + minute; }

  friend bool operator==(const WallTime &a, const WallTime &b) {
    return a.hour == b.hour && a.minute == b.minute;
  }
  friend bool operator!=(const WallTime &a, const WallTime &b) {
    return !(a == b);
  }
  friend bool operator<(const WallTime &a, const WallTime &b) {
    return a.minutes_of_day() < b.minutes_of_day();
  }
};

/// Parse "H:MM" or "HH:MM" (surrounding whitespace ignored).
Result<WallTime, WakeError> parse_wall_time(const std::string &text);

/// Canonical zero-padded "HH:MM".
std::string to_string(const WallTime &time);

// ---- Trigger modes ----

enum class RepeatMode { Daily, Weekly, Interval };

enum class TriggerMode { Scheduled, Crontab, QuotaReset };

const char *to_string(RepeatMode mode);
const char *to_string(TriggerMode mode);

/// Calendar recurrence on the local wall clock.
struct ScheduledTrigger {
  RepeatMode repeat_mode = RepeatMode::Daily;
  std::vector<WallTime> daily_times{{8, 0}};
  std::vector<int> weekly_days{1, 2, 3, 4, 5}; // 0 = Sunday
  std::vector<WallTime> weekly_times{{8, 0}};
  int interval_hours = 4;
  WallTime interval_start{7, 0};
  WallTime interval_end{22, 0};

  friend bool operator==(const ScheduledTrigger &a, const ScheduledTrigger &b);
};

/// Five-field cron expression; only minute and hour are evaluated.
struct CrontabTrigger {
  std::string expression;

  friend bool operator==(const CrontabTrigger &a, const CrontabTrigger &b) {
    return a.expression == b.expression;
  }
};

/// Fired by an external quota-reset signal. When the time window is enabled
/// and the reset lands outside it, the run is moved to the next fallback time.
struct QuotaResetTrigger {
  bool time_window_enabled = false;
  WallTime window_start{9, 0};
  WallTime window_end{18, 0};
  std::vector<WallTime> fallback_times{{7, 0}};

  friend bool operator==(const QuotaResetTrigger &a,
                         const QuotaResetTrigger &b);
};

using Trigger = std::variant<ScheduledTrigger, CrontabTrigger, QuotaResetTrigger>;

inline constexpr const char *kDefaultCapability = "codex-hourly";

/// Largest meaningful interval step: one run per day at interval_start.
inline constexpr int kMaxIntervalHours = 24;

/// Recurrence rule plus target selection and call payload of one task.
struct Schedule {
  Trigger trigger = ScheduledTrigger{};
  std::vector<std::string> selected_accounts;
  std::vector<std::string> selected_capabilities{kDefaultCapability};
  std::optional<std::string> custom_prompt;
  int max_output_tokens = 0; // 0 = let the callee decide

  friend bool operator==(const Schedule &a, const Schedule &b);
  friend bool operator!=(const Schedule &a, const Schedule &b) {
    return !(a == b);
  }
};

TriggerMode trigger_mode(const Schedule &schedule);

/// Fill every empty list with its default, sort and deduplicate times and
/// weekdays, and clean up optional text. Never drops a valid explicit value.
/// normalize(normalize(s)) == normalize(s).
Schedule normalize(Schedule schedule);

/// Reject schedules that cannot be run: empty selections, or a crontab
/// trigger whose expression does not parse.
Result<void, WakeError> validate(const Schedule &schedule);

/// A capability the remote service can wake.
struct Capability {
  std::string id;
  std::string display_name;
};

/// Built-in catalog used when no catalog is supplied by a collaborator.
std::vector<Capability> default_capabilities();

} // namespace wake::core
