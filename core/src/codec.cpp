#include "core/codec.h"

#include "core/id.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

namespace wake::core {

using nlohmann::json;

namespace {

std::optional<std::string> get_string(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

/// Integral value of a numeric field; nullopt when it is missing, not
/// finite, or outside the int64 range.
std::optional<std::int64_t> get_int(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return std::nullopt;
  }
  if (it->is_number_float()) {
    const double v = it->get<double>();
    // 2^63 is exactly representable; anything at or beyond it is not.
    if (!std::isfinite(v) || v < -9223372036854775808.0 ||
        v >= 9223372036854775808.0) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(v);
  }
  if (it->is_number_unsigned()) {
    const auto v = it->get<std::uint64_t>();
    if (v > static_cast<std::uint64_t>(
                std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(v);
  }
  return it->get<std::int64_t>();
}

std::optional<int> get_int32(const json &j, const char *key) {
  auto v = get_int(j, key);
  if (!v || *v < std::numeric_limits<int>::min() ||
      *v > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(*v);
}

bool get_bool(const json &j, const char *key, bool fallback) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_boolean()) {
    return fallback;
  }
  return it->get<bool>();
}

std::optional<WallTime> get_time(const json &j, const char *key) {
  auto text = get_string(j, key);
  if (!text) {
    return std::nullopt;
  }
  auto parsed = parse_wall_time(*text);
  if (parsed.is_err()) {
    return std::nullopt;
  }
  return parsed.value();
}

/// Malformed entries are skipped; normalize() refills an emptied list.
std::vector<WallTime> get_times(const json &j, const char *key) {
  std::vector<WallTime> times;
  auto it = j.find(key);
  if (it == j.end() || !it->is_array()) {
    return times;
  }
  for (const auto &item : *it) {
    if (!item.is_string()) {
      continue;
    }
    auto parsed = parse_wall_time(item.get<std::string>());
    if (parsed.is_ok()) {
      times.push_back(parsed.value());
    }
  }
  return times;
}

std::vector<std::string> get_strings(const json &j, const char *key) {
  std::vector<std::string> values;
  auto it = j.find(key);
  if (it == j.end() || !it->is_array()) {
    return values;
  }
  for (const auto &item : *it) {
    if (item.is_string()) {
      values.push_back(item.get<std::string>());
    }
  }
  return values;
}

json times_to_json(const std::vector<WallTime> &times) {
  json arr = json::array();
  for (const auto &t : times) {
    arr.push_back(to_string(t));
  }
  return arr;
}

RepeatMode parse_repeat_mode(const std::optional<std::string> &text) {
  if (text && *text == "weekly") {
    return RepeatMode::Weekly;
  }
  if (text && *text == "interval") {
    return RepeatMode::Interval;
  }
  return RepeatMode::Daily;
}

json encode_task(const WakeTask &task) {
  json j = {{"id", task.id},
            {"name", task.name},
            {"enabled", task.enabled},
            {"createdAt", to_epoch_ms(task.created_at)},
            {"schedule", encode_schedule(task.schedule)}};
  if (task.last_run_at) {
    j["lastRunAt"] = to_epoch_ms(*task.last_run_at);
  }
  return j;
}

json encode_record(const HistoryRecord &r) {
  json j = {{"id", r.id},
            {"timestamp", to_epoch_ms(r.timestamp)},
            {"triggerType", to_string(r.trigger_type)},
            {"triggerSource", to_string(r.trigger_source)},
            {"accountId", r.target.account_id},
            {"capabilityId", r.target.capability_id},
            {"success", r.success}};
  if (r.task_name) {
    j["taskName"] = *r.task_name;
  }
  if (r.prompt) {
    j["prompt"] = *r.prompt;
  }
  if (r.message) {
    j["message"] = *r.message;
  }
  if (r.duration_ms) {
    j["durationMs"] = *r.duration_ms;
  }
  return j;
}

} // namespace

json encode_schedule(const Schedule &schedule) {
  json j = {{"selectedAccounts", schedule.selected_accounts},
            {"selectedCapabilities", schedule.selected_capabilities},
            {"maxOutputTokens", schedule.max_output_tokens},
            {"wakeOnReset", false}};
  if (schedule.custom_prompt) {
    j["customPrompt"] = *schedule.custom_prompt;
  }

  if (const auto *s = std::get_if<ScheduledTrigger>(&schedule.trigger)) {
    j["repeatMode"] = to_string(s->repeat_mode);
    j["dailyTimes"] = times_to_json(s->daily_times);
    j["weeklyDays"] = s->weekly_days;
    j["weeklyTimes"] = times_to_json(s->weekly_times);
    j["intervalHours"] = s->interval_hours;
    j["intervalStartTime"] = to_string(s->interval_start);
    j["intervalEndTime"] = to_string(s->interval_end);
  } else if (const auto *c = std::get_if<CrontabTrigger>(&schedule.trigger)) {
    j["crontab"] = c->expression;
  } else if (const auto *q = std::get_if<QuotaResetTrigger>(&schedule.trigger)) {
    j["wakeOnReset"] = true;
    j["timeWindowEnabled"] = q->time_window_enabled;
    j["timeWindowStart"] = to_string(q->window_start);
    j["timeWindowEnd"] = to_string(q->window_end);
    j["fallbackTimes"] = times_to_json(q->fallback_times);
  }
  return j;
}

Schedule decode_schedule(const json &j) {
  Schedule schedule;
  if (!j.is_object()) {
    return normalize(schedule);
  }

  const auto crontab = get_string(j, "crontab");
  if (get_bool(j, "wakeOnReset", false)) {
    QuotaResetTrigger q;
    q.time_window_enabled = get_bool(j, "timeWindowEnabled", false);
    q.window_start = get_time(j, "timeWindowStart").value_or(WallTime{9, 0});
    q.window_end = get_time(j, "timeWindowEnd").value_or(WallTime{18, 0});
    q.fallback_times = get_times(j, "fallbackTimes");
    schedule.trigger = q;
  } else if (crontab && crontab->find_first_not_of(" \t\r\n") !=
                            std::string::npos) {
    schedule.trigger = CrontabTrigger{*crontab};
  } else {
    ScheduledTrigger s;
    s.repeat_mode = parse_repeat_mode(get_string(j, "repeatMode"));
    s.daily_times = get_times(j, "dailyTimes");
    s.weekly_days.clear();
    if (auto it = j.find("weeklyDays"); it != j.end() && it->is_array()) {
      for (const auto &d : *it) {
        if (d.is_number_integer()) {
          s.weekly_days.push_back(d.get<int>());
        }
      }
    }
    s.weekly_times = get_times(j, "weeklyTimes");
    s.interval_hours = get_int32(j, "intervalHours").value_or(4);
    s.interval_start = get_time(j, "intervalStartTime").value_or(WallTime{7, 0});
    s.interval_end = get_time(j, "intervalEndTime").value_or(WallTime{22, 0});
    schedule.trigger = s;
  }

  schedule.selected_accounts = get_strings(j, "selectedAccounts");
  if (j.contains("selectedCapabilities")) {
    schedule.selected_capabilities = get_strings(j, "selectedCapabilities");
  } else if (j.contains("selectedModels")) {
    schedule.selected_capabilities = get_strings(j, "selectedModels");
  }
  schedule.custom_prompt = get_string(j, "customPrompt");
  schedule.max_output_tokens = get_int32(j, "maxOutputTokens").value_or(0);
  return normalize(schedule);
}

std::string encode_tasks(const std::vector<WakeTask> &tasks) {
  json arr = json::array();
  for (const auto &task : tasks) {
    arr.push_back(encode_task(task));
  }
  return arr.dump();
}

Result<std::vector<WakeTask>, WakeError> decode_tasks(const std::string &text) {
  using R = Result<std::vector<WakeTask>, WakeError>;
  const json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_array()) {
    return R::Err(WakeError::Persistence("Stored task list is not a JSON array"));
  }

  std::vector<WakeTask> tasks;
  for (const auto &item : doc) {
    if (!item.is_object()) {
      continue;
    }
    auto id = get_string(item, "id");
    if (!id || id->empty()) {
      continue;
    }
    WakeTask task;
    task.id = *id;
    task.name = get_string(item, "name").value_or("");
    task.enabled = get_bool(item, "enabled", true);
    task.created_at = from_epoch_ms(get_int(item, "createdAt").value_or(0));
    if (auto last = get_int(item, "lastRunAt")) {
      task.last_run_at = from_epoch_ms(*last);
    }
    auto schedule = item.find("schedule");
    task.schedule = decode_schedule(schedule != item.end() ? *schedule : json());
    tasks.push_back(std::move(task));
  }
  return R::Ok(std::move(tasks));
}

std::string encode_history(const std::vector<HistoryRecord> &records) {
  json arr = json::array();
  for (const auto &r : records) {
    arr.push_back(encode_record(r));
  }
  return arr.dump();
}

Result<std::vector<HistoryRecord>, WakeError>
decode_history(const std::string &text) {
  using R = Result<std::vector<HistoryRecord>, WakeError>;
  const json doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_array()) {
    return R::Err(WakeError::Persistence("Stored history is not a JSON array"));
  }

  std::vector<HistoryRecord> records;
  for (const auto &item : doc) {
    if (!item.is_object()) {
      continue;
    }
    auto timestamp = get_int(item, "timestamp");
    if (!timestamp) {
      continue;
    }
    HistoryRecord r;
    r.id = get_string(item, "id").value_or("");
    if (r.id.empty()) {
      r.id = generate_id();
    }
    r.timestamp = from_epoch_ms(*timestamp);
    r.trigger_type = parse_trigger_type(get_string(item, "triggerType").value_or(""))
                         .value_or(TriggerType::Manual);
    r.trigger_source =
        parse_trigger_source(get_string(item, "triggerSource").value_or(""))
            .value_or(TriggerSource::Manual);
    r.task_name = get_string(item, "taskName");
    r.target.account_id = get_string(item, "accountId")
                              .value_or(get_string(item, "accountEmail").value_or(""));
    r.target.capability_id = get_string(item, "capabilityId")
                                 .value_or(get_string(item, "modelId").value_or(""));
    r.prompt = get_string(item, "prompt");
    r.success = get_bool(item, "success", false);
    r.message = get_string(item, "message");
    r.duration_ms = get_int(item, "durationMs");
    if (!r.duration_ms) {
      r.duration_ms = get_int(item, "duration");
    }
    records.push_back(std::move(r));
  }
  return R::Ok(std::move(records));
}

} // namespace wake::core
