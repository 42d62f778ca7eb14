#pragma once

#include "core/clock.h"
#include "core/durable_store.h"
#include "core/fan_out.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace wake::core {

class ILogger;

enum class TriggerType { Manual, Auto };

enum class TriggerSource { Scheduled, Crontab, QuotaReset, Manual };

const char *to_string(TriggerType type);
const char *to_string(TriggerSource source);
std::optional<TriggerType> parse_trigger_type(const std::string &text);
std::optional<TriggerSource> parse_trigger_source(const std::string &text);

/// Audit entry for one settled wake call. Immutable once created.
struct HistoryRecord {
  std::string id;
  Timestamp timestamp{};
  TriggerType trigger_type = TriggerType::Manual;
  TriggerSource trigger_source = TriggerSource::Manual;
  std::optional<std::string> task_name;
  WakeTarget target;
  std::optional<std::string> prompt;
  bool success = false;
  std::optional<std::string> message;
  std::optional<std::int64_t> duration_ms;

  friend bool operator==(const HistoryRecord &a, const HistoryRecord &b);
};

inline constexpr std::size_t kHistoryCapacity = 100;
inline constexpr const char *kDefaultPrompt = "hi";

/// How one fan-out was triggered, stamped onto every record it produces.
struct RunContext {
  TriggerType trigger_type = TriggerType::Manual;
  TriggerSource trigger_source = TriggerSource::Manual;
  std::optional<std::string> task_name;
  std::optional<std::string> prompt; // nullopt = kDefaultPrompt
  Timestamp timestamp{};
};

/// "<capability>: <reply> (<n> ms, tokens p/c/t, trace x)"
std::string format_wake_message(const std::string &capability_id,
                                const WakeSuccess &success);

/// One record per outcome, sharing ctx.timestamp, each with a fresh id.
std::vector<HistoryRecord> to_history_records(const FanOutReport &report,
                                              const RunContext &ctx);

/// Bounded, newest-first log of wake outcomes backed by a durable store.
///
/// The store is the source of truth on load() and a write-behind target on
/// every change. Persistence failures are logged and never undo the
/// in-memory state.
class HistoryLog {
public:
  HistoryLog(StoreHandle store, std::shared_ptr<ILogger> logger,
             std::size_t capacity = kHistoryCapacity);

  /// Replace the in-memory log with the stored one. Records without a valid
  /// timestamp are dropped. A read failure leaves the log empty.
  void load();

  /// Merge records not already present (by id), newest first, truncated to
  /// capacity. Returns how many were added.
  std::size_t append(std::vector<HistoryRecord> records);

  /// Drop every record. Confirmation is the caller's business.
  void clear();

  [[nodiscard]] std::vector<HistoryRecord> records() const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }

  using ChangeCallback =
      std::function<void(const std::vector<HistoryRecord> &records)>;

  /// Register an observer, invoked after every change with a snapshot.
  void on_change(ChangeCallback cb);

private:
  void persist_locked(const std::vector<HistoryRecord> &snapshot);
  void notify(const std::vector<HistoryRecord> &snapshot);

  StoreHandle store_;
  std::shared_ptr<ILogger> logger_;
  std::size_t capacity_;

  mutable std::mutex mutex_;
  std::vector<HistoryRecord> records_;
  std::vector<ChangeCallback> callbacks_;
};

} // namespace wake::core
