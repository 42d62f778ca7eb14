#include <gtest/gtest.h>

#include "core/recurrence.h"
#include "test_support.h"

#include <limits>

using namespace wake::core;
using wake::test::local_time;
using wake::test::local_tm;

// 2024-01-15 is a Monday.

TEST(Recurrence, IntervalStartsAtWindowAndStepsByHours) {
  ScheduledTrigger trigger;
  trigger.repeat_mode = RepeatMode::Interval;
  trigger.interval_hours = 4;
  trigger.interval_start = {7, 0};
  trigger.interval_end = {22, 0};

  const auto now = local_time(2024, 1, 15, 6, 0);
  const auto runs = next_runs(trigger, now, 10);
  ASSERT_EQ(runs.size(), 10u);
  EXPECT_EQ(runs[0], local_time(2024, 1, 15, 7, 0));
  EXPECT_EQ(runs[1], local_time(2024, 1, 15, 11, 0));
  EXPECT_EQ(runs[2], local_time(2024, 1, 15, 15, 0));
  EXPECT_EQ(runs[3], local_time(2024, 1, 15, 19, 0));
  EXPECT_EQ(runs[4], local_time(2024, 1, 16, 7, 0));
  for (const auto &run : runs) {
    EXPECT_LE(local_tm(run).tm_hour, 22);
    EXPECT_GT(run, now);
  }
}

TEST(Recurrence, IntervalIncludesEndHour) {
  ScheduledTrigger trigger;
  trigger.repeat_mode = RepeatMode::Interval;
  trigger.interval_hours = 5;
  trigger.interval_start = {7, 30};
  trigger.interval_end = {22, 0};

  const auto runs = next_runs(trigger, local_time(2024, 1, 15, 18, 0), 1);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0], local_time(2024, 1, 15, 22, 30));
}

TEST(Recurrence, OversizedIntervalRunsOncePerDayAtStart) {
  for (int step : {25, std::numeric_limits<int>::max()}) {
    ScheduledTrigger trigger;
    trigger.repeat_mode = RepeatMode::Interval;
    trigger.interval_hours = step;
    trigger.interval_start = {7, 0};
    trigger.interval_end = {22, 0};

    const auto runs = next_runs(trigger, local_time(2024, 1, 15, 6, 0), 5);
    ASSERT_EQ(runs.size(), 5u) << step;
    for (int i = 0; i < 5; ++i) {
      EXPECT_EQ(runs[i], local_time(2024, 1, 15 + i, 7, 0)) << step;
    }

    Schedule schedule;
    schedule.trigger = trigger;
    EXPECT_EQ(std::get<ScheduledTrigger>(normalize(schedule).trigger).interval_hours,
              kMaxIntervalHours);
  }
}

TEST(Recurrence, DailyPicksEarliestTimeStrictlyAfterNow) {
  ScheduledTrigger trigger;
  trigger.daily_times = {{8, 0}, {12, 0}};

  auto runs = next_runs(trigger, local_time(2024, 1, 15, 9, 0), 2);
  ASSERT_EQ(runs.size(), 2u);
  EXPECT_EQ(runs[0], local_time(2024, 1, 15, 12, 0));
  EXPECT_EQ(runs[1], local_time(2024, 1, 16, 8, 0));

  runs = next_runs(trigger, local_time(2024, 1, 15, 12, 0), 1);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0], local_time(2024, 1, 16, 8, 0));
}

TEST(Recurrence, DailyHorizonIsSevenDays) {
  ScheduledTrigger trigger;
  trigger.daily_times = {{8, 0}};
  const auto runs = next_runs(trigger, local_time(2024, 1, 15, 7, 0), 100);
  EXPECT_EQ(runs.size(), 7u);
  for (std::size_t i = 1; i < runs.size(); ++i) {
    EXPECT_LT(runs[i - 1], runs[i]);
  }
}

TEST(Recurrence, WeeklyMatchesConfiguredWeekdays) {
  ScheduledTrigger trigger;
  trigger.repeat_mode = RepeatMode::Weekly;
  trigger.weekly_days = {1, 3}; // Mon, Wed
  trigger.weekly_times = {{8, 0}};

  const auto runs = next_runs(trigger, local_time(2024, 1, 15, 10, 0), 3);
  ASSERT_EQ(runs.size(), 3u);
  EXPECT_EQ(runs[0], local_time(2024, 1, 17, 8, 0));
  EXPECT_EQ(runs[1], local_time(2024, 1, 22, 8, 0));
  EXPECT_EQ(runs[2], local_time(2024, 1, 24, 8, 0));
}

TEST(Recurrence, ScheduleDispatchesOnMode) {
  const auto now = local_time(2024, 1, 15, 10, 0);

  Schedule cron;
  cron.trigger = CrontabTrigger{"0 9 * * *"};
  auto runs = next_runs(cron, now, 1);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0], local_time(2024, 1, 16, 9, 0));

  Schedule broken;
  broken.trigger = CrontabTrigger{"nonsense"};
  EXPECT_TRUE(next_runs(broken, now, 3).empty());

  Schedule reset;
  reset.trigger = QuotaResetTrigger{};
  EXPECT_TRUE(next_runs(reset, now, 3).empty());
}

TEST(QuotaResetFireTime, NoWindowFiresAtReset) {
  QuotaResetTrigger trigger;
  const auto reset_at = local_time(2024, 1, 15, 3, 17);
  EXPECT_EQ(quota_reset_fire_time(trigger, reset_at), reset_at);
}

TEST(QuotaResetFireTime, InsideWindowFiresAtReset) {
  QuotaResetTrigger trigger;
  trigger.time_window_enabled = true;
  trigger.window_start = {9, 0};
  trigger.window_end = {18, 0};

  const auto reset_at = local_time(2024, 1, 15, 9, 0);
  EXPECT_EQ(quota_reset_fire_time(trigger, reset_at), reset_at);
}

TEST(QuotaResetFireTime, OutsideWindowMovesToNextFallback) {
  QuotaResetTrigger trigger;
  trigger.time_window_enabled = true;
  trigger.window_start = {9, 0};
  trigger.window_end = {18, 0};
  trigger.fallback_times = {{7, 0}, {20, 0}};

  // Window end is exclusive.
  EXPECT_EQ(quota_reset_fire_time(trigger, local_time(2024, 1, 15, 18, 0)),
            local_time(2024, 1, 15, 20, 0));
  EXPECT_EQ(quota_reset_fire_time(trigger, local_time(2024, 1, 15, 21, 0)),
            local_time(2024, 1, 16, 7, 0));
}

TEST(QuotaResetFireTime, WindowMayWrapMidnight) {
  QuotaResetTrigger trigger;
  trigger.time_window_enabled = true;
  trigger.window_start = {22, 0};
  trigger.window_end = {6, 0};
  trigger.fallback_times = {{7, 0}};

  const auto late = local_time(2024, 1, 15, 23, 30);
  EXPECT_EQ(quota_reset_fire_time(trigger, late), late);
  const auto early = local_time(2024, 1, 15, 2, 0);
  EXPECT_EQ(quota_reset_fire_time(trigger, early), early);
  EXPECT_EQ(quota_reset_fire_time(trigger, local_time(2024, 1, 15, 12, 0)),
            local_time(2024, 1, 16, 7, 0));
}
