#pragma once

#include "core/clock.h"
#include "core/error.h"
#include "core/result.h"

#include <cstddef>
#include <string>
#include <vector>

namespace wake::core {

/// Minimal five-field cron expression ("m h dom mon dow").
///
/// All five fields are parsed and range-checked, but only the minute and
/// hour fields take part in evaluation: a valid expression fires every day
/// at each matching hour/minute. Day-of-month, month and day-of-week are
/// accepted and ignored.
///
/// Field grammar: comma-separated items, each `*`, `n` or `a-b`, optionally
/// followed by `/step`. A stepped item starts at its own lower bound, so
/// `10-50/20` yields 10, 30, 50 and `*/15` yields 0, 15, 30, 45.
class CronExpression {
public:
  CronExpression() = default;

  /// Fewer than five whitespace-separated fields, or any field that does not
  /// parse, is a Validation error. Extra trailing fields are ignored.
  static Result<CronExpression, WakeError> parse(const std::string &text);

  [[nodiscard]] const std::string &text() const { return text_; }

  /// Matching minutes (0-59) and hours (0-23), ascending and unique.
  [[nodiscard]] const std::vector<int> &minutes() const { return minutes_; }
  [[nodiscard]] const std::vector<int> &hours() const { return hours_; }

  /// Up to `count` instants strictly after `now`, ascending, found by
  /// scanning today and the following six calendar days.
  [[nodiscard]] std::vector<Timestamp> next_runs(Timestamp now,
                                                 std::size_t count) const;

private:
  std::string text_;
  std::vector<int> minutes_;
  std::vector<int> hours_;
};

/// Convenience wrapper: empty result when `expression` does not parse.
std::vector<Timestamp> cron_next_runs(const std::string &expression,
                                      Timestamp now, std::size_t count);

} // namespace wake::core
