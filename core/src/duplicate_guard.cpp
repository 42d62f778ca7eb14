#include "core/duplicate_guard.h"

#include "core/logger.h"

namespace wake::core {

DuplicateWakeGuard::DuplicateWakeGuard(std::shared_ptr<IRemoteCaller> inner,
                                       std::shared_ptr<IClock> clock,
                                       std::chrono::milliseconds window,
                                       std::shared_ptr<ILogger> logger)
    : inner_(std::move(inner)), clock_(std::move(clock)), window_(window),
      logger_(std::move(logger)) {}

Result<WakeReply, WakeError>
DuplicateWakeGuard::invoke(const WakeTarget &target,
                           const WakePayload &payload) {
  const auto now = clock_->now();
  if (!try_reserve(target.account_id, now)) {
    if (logger_) {
      logger_->info("", "duplicate_guard", "duplicate_skipped",
                    "account=" + target.account_id +
                        " capability=" + target.capability_id);
    }
    WakeReply reply;
    reply.reply = kSkippedDuplicateReply;
    reply.duration_ms = 0;
    return Result<WakeReply, WakeError>::Ok(std::move(reply));
  }

  try {
    auto result = inner_->invoke(target, payload);
    if (result.is_err()) {
      release(target.account_id, now);
    }
    return result;
  } catch (...) {
    release(target.account_id, now);
    throw;
  }
}

bool DuplicateWakeGuard::try_reserve(const std::string &account_id,
                                     Timestamp now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = last_call_.find(account_id);
  if (it != last_call_.end() && now - it->second < window_) {
    return false;
  }
  last_call_[account_id] = now;
  return true;
}

void DuplicateWakeGuard::release(const std::string &account_id,
                                 Timestamp reserved_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = last_call_.find(account_id);
  // A later reservation belongs to another call.
  if (it != last_call_.end() && it->second == reserved_at) {
    last_call_.erase(it);
  }
}

} // namespace wake::core
