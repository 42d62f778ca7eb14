#include "core/history_log.h"

#include "core/codec.h"
#include "core/id.h"
#include "core/logger.h"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace wake::core {

const char *to_string(TriggerType type) {
  switch (type) {
  case TriggerType::Manual:
    return "manual";
  case TriggerType::Auto:
    return "auto";
  }
  return "manual";
}

const char *to_string(TriggerSource source) {
  switch (source) {
  case TriggerSource::Scheduled:
    return "scheduled";
  case TriggerSource::Crontab:
    return "crontab";
  case TriggerSource::QuotaReset:
    return "quota_reset";
  case TriggerSource::Manual:
    return "manual";
  }
  return "manual";
}

std::optional<TriggerType> parse_trigger_type(const std::string &text) {
  if (text == "manual") {
    return TriggerType::Manual;
  }
  if (text == "auto") {
    return TriggerType::Auto;
  }
  return std::nullopt;
}

std::optional<TriggerSource> parse_trigger_source(const std::string &text) {
  if (text == "scheduled") {
    return TriggerSource::Scheduled;
  }
  if (text == "crontab") {
    return TriggerSource::Crontab;
  }
  if (text == "quota_reset") {
    return TriggerSource::QuotaReset;
  }
  if (text == "manual") {
    return TriggerSource::Manual;
  }
  return std::nullopt;
}

bool operator==(const HistoryRecord &a, const HistoryRecord &b) {
  return a.id == b.id && a.timestamp == b.timestamp &&
         a.trigger_type == b.trigger_type &&
         a.trigger_source == b.trigger_source && a.task_name == b.task_name &&
         a.target == b.target && a.prompt == b.prompt &&
         a.success == b.success && a.message == b.message &&
         a.duration_ms == b.duration_ms;
}

std::string format_wake_message(const std::string &capability_id,
                                const WakeSuccess &success) {
  auto reply = success.reply;
  reply.erase(0, reply.find_first_not_of(" \t\r\n"));
  reply.erase(reply.find_last_not_of(" \t\r\n") + 1);
  if (reply.empty()) {
    reply = "(no reply)";
  }

  std::vector<std::string> details;
  details.push_back(std::to_string(success.duration_ms) + " ms");
  if (success.usage &&
      (success.usage->prompt_tokens || success.usage->total_tokens)) {
    auto field = [](const std::optional<int> &v) {
      return v ? std::to_string(*v) : std::string("?");
    };
    details.push_back("tokens " + field(success.usage->prompt_tokens) + "/" +
                      field(success.usage->completion_tokens) + "/" +
                      field(success.usage->total_tokens));
  }
  if (success.trace_id && !success.trace_id->empty()) {
    details.push_back("trace " + *success.trace_id);
  }

  std::ostringstream oss;
  oss << capability_id << ": " << reply << " (";
  for (std::size_t i = 0; i < details.size(); ++i) {
    oss << (i ? ", " : "") << details[i];
  }
  oss << ")";
  return oss.str();
}

std::vector<HistoryRecord> to_history_records(const FanOutReport &report,
                                              const RunContext &ctx) {
  std::vector<HistoryRecord> records;
  records.reserve(report.outcomes.size());
  for (const auto &outcome : report.outcomes) {
    HistoryRecord r;
    r.id = generate_id();
    r.timestamp = ctx.timestamp;
    r.trigger_type = ctx.trigger_type;
    r.trigger_source = ctx.trigger_source;
    r.task_name = ctx.task_name;
    r.target = outcome.target;
    r.prompt = ctx.prompt.value_or(kDefaultPrompt);
    r.success = outcome.succeeded();
    r.duration_ms = outcome.duration_ms();
    if (const auto *ok = std::get_if<WakeSuccess>(&outcome.result)) {
      r.message = format_wake_message(outcome.target.capability_id, *ok);
    } else {
      const auto &reason = std::get<WakeFailure>(outcome.result).reason;
      r.message = reason.user_message.empty() ? reason.internal_message
                                              : reason.user_message;
    }
    records.push_back(std::move(r));
  }
  return records;
}

HistoryLog::HistoryLog(StoreHandle store, std::shared_ptr<ILogger> logger,
                       std::size_t capacity)
    : store_(std::move(store)), logger_(std::move(logger)),
      capacity_(capacity) {}

void HistoryLog::load() {
  std::vector<HistoryRecord> loaded;
  auto raw = store_.read();
  if (raw.is_err()) {
    if (logger_) {
      logger_->warn("history", "history", "load_failed",
                    raw.error().internal_message);
    }
  } else if (raw.value().has_value()) {
    auto decoded = decode_history(*raw.value());
    if (decoded.is_err()) {
      if (logger_) {
        logger_->warn("history", "history", "load_failed",
                      decoded.error().internal_message);
      }
    } else {
      loaded = std::move(decoded).value();
    }
  }

  std::stable_sort(loaded.begin(), loaded.end(),
                   [](const HistoryRecord &a, const HistoryRecord &b) {
                     return a.timestamp > b.timestamp;
                   });
  if (loaded.size() > capacity_) {
    loaded.resize(capacity_);
  }

  std::vector<HistoryRecord> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    records_ = std::move(loaded);
    snapshot = records_;
  }
  notify(snapshot);
}

std::size_t HistoryLog::append(std::vector<HistoryRecord> records) {
  if (records.empty()) {
    return 0;
  }

  std::vector<HistoryRecord> snapshot;
  std::size_t added = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_set<std::string> known;
    for (const auto &r : records_) {
      known.insert(r.id);
    }

    std::vector<HistoryRecord> merged;
    merged.reserve(records.size() + records_.size());
    for (auto &r : records) {
      if (known.insert(r.id).second) {
        merged.push_back(std::move(r));
      }
    }
    added = merged.size();
    if (added == 0) {
      return 0;
    }

    merged.insert(merged.end(), records_.begin(), records_.end());
    std::stable_sort(merged.begin(), merged.end(),
                     [](const HistoryRecord &a, const HistoryRecord &b) {
                       return a.timestamp > b.timestamp;
                     });
    if (merged.size() > capacity_) {
      merged.resize(capacity_);
    }
    records_ = std::move(merged);
    snapshot = records_;
    persist_locked(snapshot);
  }

  if (logger_) {
    logger_->info("history", "history", "history_updated",
                  "added=" + std::to_string(added) +
                      " total=" + std::to_string(snapshot.size()));
  }
  notify(snapshot);
  return added;
}

void HistoryLog::clear() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
    persist_locked(records_);
  }
  if (logger_) {
    logger_->info("history", "history", "history_cleared", "");
  }
  notify({});
}

std::vector<HistoryRecord> HistoryLog::records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

std::size_t HistoryLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

void HistoryLog::on_change(ChangeCallback cb) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(cb));
}

// Writes are issued under the lock so the store sees snapshots in order.
void HistoryLog::persist_locked(const std::vector<HistoryRecord> &snapshot) {
  auto written = store_.write(encode_history(snapshot));
  if (written.is_err() && logger_) {
    logger_->warn("history", "history", "persist_failed",
                  written.error().internal_message);
  }
}

void HistoryLog::notify(const std::vector<HistoryRecord> &snapshot) {
  std::vector<ChangeCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks = callbacks_;
  }
  for (auto &cb : callbacks) {
    if (cb) {
      cb(snapshot);
    }
  }
}

} // namespace wake::core
