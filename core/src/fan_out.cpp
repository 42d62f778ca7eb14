#include "core/fan_out.h"

#include "core/logger.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <system_error>
#include <thread>

namespace wake::core {

std::int64_t WakeOutcome::duration_ms() const {
  if (const auto *ok = std::get_if<WakeSuccess>(&result)) {
    return ok->duration_ms;
  }
  return std::get<WakeFailure>(result).duration_ms;
}

std::size_t FanOutReport::succeeded() const {
  return static_cast<std::size_t>(
      std::count_if(outcomes.begin(), outcomes.end(),
                    [](const WakeOutcome &o) { return o.succeeded(); }));
}

std::size_t FanOutReport::failed() const {
  return outcomes.size() - succeeded();
}

std::vector<WakeTarget>
build_targets(const std::vector<std::string> &accounts,
              const std::vector<std::string> &capabilities) {
  std::vector<WakeTarget> targets;
  targets.reserve(accounts.size() * capabilities.size());
  for (const auto &account : accounts) {
    for (const auto &capability : capabilities) {
      targets.push_back(WakeTarget{account, capability});
    }
  }
  return targets;
}

FanOutExecutor::FanOutExecutor(std::shared_ptr<IRemoteCaller> caller,
                               std::shared_ptr<IClock> clock,
                               std::shared_ptr<ILogger> logger,
                               std::size_t max_parallel)
    : caller_(std::move(caller)), clock_(std::move(clock)),
      logger_(std::move(logger)),
      max_parallel_(std::max<std::size_t>(max_parallel, 1)) {}

Result<FanOutReport, WakeError>
FanOutExecutor::execute(const std::vector<std::string> &accounts,
                        const std::vector<std::string> &capabilities,
                        const WakePayload &payload,
                        const std::string &trace_id) {
  if (accounts.empty()) {
    return Result<FanOutReport, WakeError>::Err(
        WakeError::Validation("Select at least one account"));
  }
  if (capabilities.empty()) {
    return Result<FanOutReport, WakeError>::Err(
        WakeError::Validation("Select at least one capability"));
  }
  if (!caller_) {
    return Result<FanOutReport, WakeError>::Err(
        WakeError::Internal("FanOutExecutor has no remote caller"));
  }

  const auto targets = build_targets(accounts, capabilities);
  if (logger_) {
    logger_->info(trace_id, "fan_out", "fanout_start",
                  "actions=" + std::to_string(targets.size()));
  }

  // One slot per action; each slot is written by exactly one worker.
  FanOutReport report;
  report.outcomes.resize(targets.size());
  std::atomic<std::size_t> next{0};
  auto drain = [this, &report, &targets, &payload, &next]() {
    for (std::size_t i = next++; i < targets.size(); i = next++) {
      report.outcomes[i] = run_one(targets[i], payload);
    }
  };

  const std::size_t parallel = std::min(targets.size(), max_parallel_);
  std::vector<std::thread> workers;
  workers.reserve(parallel);
  try {
    for (std::size_t i = 0; i < parallel; ++i) {
      workers.emplace_back(drain);
    }
  } catch (const std::system_error &e) {
    // Started workers keep draining the queue.
    if (logger_) {
      logger_->warn(trace_id, "fan_out", "worker_start_failed",
                    "started=" + std::to_string(workers.size()) + " " +
                        e.what());
    }
  }
  if (workers.empty()) {
    drain();
  }
  for (auto &w : workers) {
    if (w.joinable()) {
      w.join();
    }
  }

  if (logger_) {
    for (const auto &outcome : report.outcomes) {
      if (const auto *failure = std::get_if<WakeFailure>(&outcome.result)) {
        logger_->warn(trace_id, "fan_out", "action_failed",
                      "account=" + outcome.target.account_id +
                          " capability=" + outcome.target.capability_id +
                          " error=" + failure->reason.internal_message);
      }
    }
    logger_->info(trace_id, "fan_out", "fanout_done",
                  "succeeded=" + std::to_string(report.succeeded()) +
                      " failed=" + std::to_string(report.failed()));
  }
  return Result<FanOutReport, WakeError>::Ok(std::move(report));
}

WakeOutcome FanOutExecutor::run_one(const WakeTarget &target,
                                    const WakePayload &payload) {
  WakeOutcome outcome;
  outcome.target = target;
  outcome.started_at = clock_ ? clock_->now()
                              : std::chrono::time_point_cast<std::chrono::milliseconds>(
                                    std::chrono::system_clock::now());
  const auto started = std::chrono::steady_clock::now();
  auto elapsed_ms = [&started]() {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)
            .count());
  };

  try {
    auto result = caller_->invoke(target, payload);
    if (result.is_ok()) {
      const WakeReply &reply = result.value();
      WakeSuccess success;
      success.reply = reply.reply;
      success.usage = reply.usage;
      success.trace_id = reply.trace_id;
      success.duration_ms = reply.duration_ms.value_or(elapsed_ms());
      outcome.result = std::move(success);
    } else {
      outcome.result = WakeFailure{result.error(), elapsed_ms()};
    }
  } catch (const std::exception &e) {
    outcome.result = WakeFailure{WakeError::Remote(e.what()), elapsed_ms()};
  } catch (...) {
    outcome.result = WakeFailure{
        WakeError::Remote("Wake call failed with an unknown error"),
        elapsed_ms()};
  }
  return outcome;
}

int resolve_max_output_tokens(std::optional<double> requested,
                              const std::vector<WakeTask> &tasks) {
  if (requested && std::isfinite(*requested) && *requested > 0) {
    return static_cast<int>(std::floor(std::min(
        *requested, static_cast<double>(std::numeric_limits<int>::max()))));
  }
  const auto enabled =
      std::find_if(tasks.begin(), tasks.end(),
                   [](const WakeTask &task) { return task.enabled; });
  if (enabled != tasks.end() && enabled->schedule.max_output_tokens > 0) {
    return enabled->schedule.max_output_tokens;
  }
  return 0;
}

} // namespace wake::core
