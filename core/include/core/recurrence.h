#pragma once

#include "core/clock.h"
#include "core/schedule.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace wake::core {

/// Local wall-clock instant `day_offset` calendar days after the day of
/// `base`, at `time` with zero seconds.
Timestamp local_time_on_day(Timestamp base, int day_offset, WallTime time);

/// Day of week (0 = Sunday) of `day_offset` days after the day of `base`.
int local_weekday(Timestamp base, int day_offset);

/// Wall-clock time of day of `ts`.
WallTime local_wall_time(Timestamp ts);

/// Up to `count` run instants strictly after `now`, strictly increasing.
///
///   Daily    - every configured time on each of the next 7 days (today
///              included).
///   Weekly   - configured times on matching weekdays within 14 days.
///   Interval - hours from interval_start stepping by interval_hours up to
///              interval_end's hour inclusive, at interval_start's minute,
///              on each of the next 7 days.
///
/// The lists are expected to be normalized.
std::vector<Timestamp> next_runs(const ScheduledTrigger &trigger, Timestamp now,
                                 std::size_t count);

/// Dispatch on the trigger mode. Quota-reset triggers have no computed
/// runs; an unparsable crontab yields nothing.
std::vector<Timestamp> next_runs(const Schedule &schedule, Timestamp now,
                                 std::size_t count);

/// When a quota-reset task fires for a reset signalled at `reset_at`.
///
/// Without a time window, or when the reset's wall time lies within
/// [window_start, window_end), the task fires at `reset_at`. A window whose
/// end precedes its start wraps midnight. Otherwise the run moves to the
/// earliest fallback time strictly after `reset_at` (searching two days);
/// nullopt if there is none.
std::optional<Timestamp> quota_reset_fire_time(const QuotaResetTrigger &trigger,
                                               Timestamp reset_at);

} // namespace wake::core
