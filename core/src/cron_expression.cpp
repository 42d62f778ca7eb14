#include "core/cron_expression.h"

#include "core/recurrence.h"

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>
#include <sstream>

namespace wake::core {

namespace {

constexpr int kCronHorizonDays = 7;

struct FieldSpec {
  const char *name;
  int min;
  int max;
};

constexpr FieldSpec kFields[] = {
    {"minute", 0, 59}, {"hour", 0, 23},   {"day-of-month", 1, 31},
    {"month", 1, 12},  {"day-of-week", 0, 7},
};

std::optional<int> parse_number(const std::string &text) {
  if (text.empty() || text.size() > 4 ||
      !std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    return std::nullopt;
  }
  return std::stoi(text);
}

std::vector<std::string> split(const std::string &text, char sep) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream iss(text);
  while (std::getline(iss, current, sep)) {
    parts.push_back(current);
  }
  if (!text.empty() && text.back() == sep) {
    parts.emplace_back();
  }
  return parts;
}

/// Expand one field into its matching values; nullopt on a syntax or range
/// error.
std::optional<std::vector<int>> parse_field(const std::string &field,
                                            const FieldSpec &spec) {
  std::set<int> values;
  for (const auto &item : split(field, ',')) {
    std::string base = item;
    int step = 1;
    bool stepped = false;

    const auto slash = item.find('/');
    if (slash != std::string::npos) {
      auto parsed_step = parse_number(item.substr(slash + 1));
      if (!parsed_step || *parsed_step <= 0) {
        return std::nullopt;
      }
      step = *parsed_step;
      stepped = true;
      base = item.substr(0, slash);
    }

    int lo = 0;
    int hi = 0;
    if (base == "*") {
      lo = spec.min;
      hi = spec.max;
    } else if (const auto dash = base.find('-'); dash != std::string::npos) {
      auto a = parse_number(base.substr(0, dash));
      auto b = parse_number(base.substr(dash + 1));
      if (!a || !b || *a > *b) {
        return std::nullopt;
      }
      lo = *a;
      hi = *b;
    } else {
      auto n = parse_number(base);
      if (!n) {
        return std::nullopt;
      }
      lo = *n;
      hi = stepped ? spec.max : *n;
    }

    if (lo < spec.min || hi > spec.max) {
      return std::nullopt;
    }
    for (int v = lo; v <= hi; v += step) {
      values.insert(v);
    }
  }

  if (values.empty()) {
    return std::nullopt;
  }
  return std::vector<int>(values.begin(), values.end());
}

} // namespace

Result<CronExpression, WakeError>
CronExpression::parse(const std::string &text) {
  std::istringstream iss(text);
  std::vector<std::string> fields;
  std::string field;
  while (iss >> field) {
    fields.push_back(field);
  }

  if (fields.size() < 5) {
    return Result<CronExpression, WakeError>::Err(WakeError::Validation(
        "Crontab expression needs 5 fields: '" + text + "'"));
  }

  CronExpression expr;
  for (std::size_t i = 0; i < 5; ++i) {
    auto values = parse_field(fields[i], kFields[i]);
    if (!values) {
      return Result<CronExpression, WakeError>::Err(WakeError::Validation(
          std::string("Invalid crontab ") + kFields[i].name + " field: '" +
          fields[i] + "'"));
    }
    if (i == 0) {
      expr.minutes_ = std::move(*values);
    } else if (i == 1) {
      expr.hours_ = std::move(*values);
    }
  }

  std::ostringstream canonical;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    canonical << (i ? " " : "") << fields[i];
  }
  expr.text_ = canonical.str();
  return Result<CronExpression, WakeError>::Ok(std::move(expr));
}

std::vector<Timestamp> CronExpression::next_runs(Timestamp now,
                                                 std::size_t count) const {
  std::vector<Timestamp> results;
  for (int day = 0; day < kCronHorizonDays && results.size() < count; ++day) {
    for (int hour : hours_) {
      for (int minute : minutes_) {
        const Timestamp candidate =
            local_time_on_day(now, day, WallTime{hour, minute});
        if (candidate <= now) {
          continue;
        }
        results.push_back(candidate);
        if (results.size() >= count) {
          return results;
        }
      }
    }
  }
  return results;
}

std::vector<Timestamp> cron_next_runs(const std::string &expression,
                                      Timestamp now, std::size_t count) {
  auto parsed = CronExpression::parse(expression);
  if (parsed.is_err()) {
    return {};
  }
  return parsed.value().next_runs(now, count);
}

} // namespace wake::core
