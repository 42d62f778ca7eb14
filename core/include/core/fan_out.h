#pragma once

#include "core/clock.h"
#include "core/error.h"
#include "core/result.h"
#include "core/task.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wake::core {

class ILogger;

/// One (account, capability) cell of the call matrix.
struct WakeTarget {
  std::string account_id;
  std::string capability_id;

  friend bool operator==(const WakeTarget &a, const WakeTarget &b) {
    return a.account_id == b.account_id && a.capability_id == b.capability_id;
  }
};

/// Call payload shared by every cell of one fan-out.
struct WakePayload {
  std::optional<std::string> prompt; // nullopt = callee default
  int max_output_tokens = 0;         // 0 = no explicit limit
};

struct UsageStats {
  std::optional<int> prompt_tokens;
  std::optional<int> completion_tokens;
  std::optional<int> total_tokens;
};

/// What the wake service returns for one successful call.
struct WakeReply {
  std::string reply;
  std::optional<UsageStats> usage;
  std::optional<std::string> trace_id;
  std::optional<std::string> response_id;
  std::optional<std::int64_t> duration_ms; // Callee-measured, preferred
};

/// Remote capability that performs a single wake call. Must be safe to call
/// from several threads at once. Timeouts are the implementation's concern.
class IRemoteCaller {
public:
  virtual ~IRemoteCaller() = default;

  virtual Result<WakeReply, WakeError> invoke(const WakeTarget &target,
                                              const WakePayload &payload) = 0;
};

struct WakeSuccess {
  std::string reply;
  std::optional<UsageStats> usage;
  std::optional<std::string> trace_id;
  std::int64_t duration_ms = 0;
};

struct WakeFailure {
  WakeError reason;
  std::int64_t duration_ms = 0;
};

/// Settled result of one matrix cell.
struct WakeOutcome {
  WakeTarget target;
  Timestamp started_at{};
  std::variant<WakeSuccess, WakeFailure> result;

  [[nodiscard]] bool succeeded() const {
    return std::holds_alternative<WakeSuccess>(result);
  }
  [[nodiscard]] std::int64_t duration_ms() const;
};

/// All outcomes of one fan-out, in matrix order (account-major).
struct FanOutReport {
  std::vector<WakeOutcome> outcomes;

  [[nodiscard]] std::size_t succeeded() const;
  [[nodiscard]] std::size_t failed() const;
};

/// Cartesian product of accounts x capabilities, account-major.
std::vector<WakeTarget> build_targets(const std::vector<std::string> &accounts,
                                      const std::vector<std::string> &capabilities);

inline constexpr std::size_t kDefaultMaxParallel = 16;

/// Issues one remote call per target concurrently and waits for all of them
/// to settle. A failing call never cancels or delays its siblings. At most
/// `max_parallel` calls are in flight; the rest wait for a free worker.
class FanOutExecutor {
public:
  FanOutExecutor(std::shared_ptr<IRemoteCaller> caller,
                 std::shared_ptr<IClock> clock,
                 std::shared_ptr<ILogger> logger,
                 std::size_t max_parallel = kDefaultMaxParallel);

  /// Validation error (nothing dispatched) when either selection is empty.
  Result<FanOutReport, WakeError>
  execute(const std::vector<std::string> &accounts,
          const std::vector<std::string> &capabilities,
          const WakePayload &payload, const std::string &trace_id = {});

private:
  WakeOutcome run_one(const WakeTarget &target, const WakePayload &payload);

  std::shared_ptr<IRemoteCaller> caller_;
  std::shared_ptr<IClock> clock_;
  std::shared_ptr<ILogger> logger_;
  std::size_t max_parallel_;
};

/// Output-token limit for a call: floor of `requested` if finite and
/// positive, else the first enabled task's configured limit, else 0.
int resolve_max_output_tokens(std::optional<double> requested,
                              const std::vector<WakeTask> &tasks);

} // namespace wake::core
