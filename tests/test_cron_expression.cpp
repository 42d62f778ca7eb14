#include <gtest/gtest.h>

#include "core/cron_expression.h"
#include "test_support.h"

using namespace wake::core;
using wake::test::local_time;
using wake::test::local_tm;

// 2024-01-15 is a Monday.

TEST(CronExpression, DailyNineAmAfterItPassedIsTomorrow) {
  const auto now = local_time(2024, 1, 15, 10, 0);
  const auto runs = cron_next_runs("0 9 * * *", now, 1);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0], local_time(2024, 1, 16, 9, 0));
  EXPECT_EQ(local_tm(runs[0]).tm_wday, 2);
}

TEST(CronExpression, FewerThanFiveFieldsYieldsNothing) {
  const auto now = local_time(2024, 1, 15, 10, 0);
  EXPECT_TRUE(cron_next_runs("0 9 * *", now, 5).empty());
  EXPECT_TRUE(cron_next_runs("", now, 5).empty());

  auto parsed = CronExpression::parse("0 9");
  ASSERT_TRUE(parsed.is_err());
  EXPECT_EQ(parsed.error().category, ErrorCategory::Validation);
}

TEST(CronExpression, StarStepStartsAtZero) {
  auto parsed = CronExpression::parse("*/15 * * * *");
  ASSERT_TRUE(parsed.is_ok());
  EXPECT_EQ(parsed.value().minutes(), (std::vector<int>{0, 15, 30, 45}));
  EXPECT_EQ(parsed.value().hours().size(), 24u);
}

TEST(CronExpression, RangeStepStartsAtRangeStart) {
  auto parsed = CronExpression::parse("10-50/20 8 * * *");
  ASSERT_TRUE(parsed.is_ok());
  EXPECT_EQ(parsed.value().minutes(), (std::vector<int>{10, 30, 50}));

  auto open = CronExpression::parse("5/20 8 * * *");
  ASSERT_TRUE(open.is_ok());
  EXPECT_EQ(open.value().minutes(), (std::vector<int>{5, 25, 45}));
}

TEST(CronExpression, ListsAndRangesCombine) {
  auto parsed = CronExpression::parse("0,30 9,17-18 * * *");
  ASSERT_TRUE(parsed.is_ok());
  EXPECT_EQ(parsed.value().minutes(), (std::vector<int>{0, 30}));
  EXPECT_EQ(parsed.value().hours(), (std::vector<int>{9, 17, 18}));
}

TEST(CronExpression, RejectsOutOfRangeAndGarbage) {
  for (const char *bad :
       {"60 * * * *", "0 24 * * *", "0 0 32 * *", "0 0 * 13 *", "0 0 * * 8",
        "*/0 * * * *", "a * * * *", "5-1 * * * *", "0,,5 * * * *"}) {
    EXPECT_TRUE(CronExpression::parse(bad).is_err()) << bad;
  }
}

TEST(CronExpression, DayFieldsAreAcceptedButNotEvaluated) {
  // Sunday-only in day-of-week, still fires on Monday.
  const auto now = local_time(2024, 1, 15, 6, 0);
  const auto runs = cron_next_runs("30 7 * * 0", now, 1);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0], local_time(2024, 1, 15, 7, 30));
}

TEST(CronExpression, RunsAreStrictlyAfterNowAndAscending) {
  const auto now = local_time(2024, 1, 15, 9, 0);
  const auto runs = cron_next_runs("0 9,12 * * *", now, 4);
  ASSERT_EQ(runs.size(), 4u);
  EXPECT_EQ(runs[0], local_time(2024, 1, 15, 12, 0));
  EXPECT_EQ(runs[1], local_time(2024, 1, 16, 9, 0));
  for (std::size_t i = 1; i < runs.size(); ++i) {
    EXPECT_LT(runs[i - 1], runs[i]);
  }
}

TEST(CronExpression, SearchStopsAtSevenDays) {
  const auto now = local_time(2024, 1, 15, 10, 0);
  const auto runs = cron_next_runs("0 9 * * *", now, 50);
  EXPECT_EQ(runs.size(), 6u);
}
