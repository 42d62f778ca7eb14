#pragma once

#include "core/clock.h"
#include "core/fan_out.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace wake::core {

class ILogger;

inline constexpr const char *kSkippedDuplicateReply =
    "Skipped duplicate wakeup request (recently executed for this account).";

/// IRemoteCaller decorator that lets at most one real call per account
/// through within `window`. A suppressed call succeeds with
/// kSkippedDuplicateReply. A failed call releases the account so a retry is
/// not suppressed.
class DuplicateWakeGuard final : public IRemoteCaller {
public:
  DuplicateWakeGuard(std::shared_ptr<IRemoteCaller> inner,
                     std::shared_ptr<IClock> clock,
                     std::chrono::milliseconds window,
                     std::shared_ptr<ILogger> logger = nullptr);

  Result<WakeReply, WakeError> invoke(const WakeTarget &target,
                                      const WakePayload &payload) override;

private:
  bool try_reserve(const std::string &account_id, Timestamp now);
  void release(const std::string &account_id, Timestamp reserved_at);

  std::shared_ptr<IRemoteCaller> inner_;
  std::shared_ptr<IClock> clock_;
  std::chrono::milliseconds window_;
  std::shared_ptr<ILogger> logger_;

  std::mutex mutex_;
  std::unordered_map<std::string, Timestamp> last_call_;
};

} // namespace wake::core
