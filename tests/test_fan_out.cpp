#include <gtest/gtest.h>

#include "core/fan_out.h"
#include "test_support.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace wake::core;
using wake::test::FixedClock;
using wake::test::RecordingLogger;

namespace {

/// Fails for one account, succeeds for the rest, and records every call.
class ScriptedCaller : public IRemoteCaller {
public:
  explicit ScriptedCaller(std::string failing_account = {})
      : failing_account_(std::move(failing_account)) {}

  Result<WakeReply, WakeError> invoke(const WakeTarget &target,
                                      const WakePayload &payload) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      calls_.push_back(target);
      payloads_.push_back(payload);
    }
    if (target.account_id == failing_account_) {
      return Result<WakeReply, WakeError>::Err(
          WakeError::Remote("account " + target.account_id + " rejected"));
    }
    WakeReply reply;
    reply.reply = "awake " + target.account_id;
    reply.duration_ms = 250;
    return Result<WakeReply, WakeError>::Ok(std::move(reply));
  }

  std::vector<WakeTarget> calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
  }
  std::vector<WakePayload> payloads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return payloads_;
  }

private:
  std::string failing_account_;
  mutable std::mutex mutex_;
  std::vector<WakeTarget> calls_;
  std::vector<WakePayload> payloads_;
};

class ThrowingCaller : public IRemoteCaller {
public:
  Result<WakeReply, WakeError> invoke(const WakeTarget &target,
                                      const WakePayload &) override {
    if (target.capability_id == "boom") {
      throw std::runtime_error("transport exploded");
    }
    return Result<WakeReply, WakeError>::Ok(WakeReply{"ok", {}, {}, {}, {}});
  }
};

/// Succeeds only once `expected` calls are in flight at the same time.
class RendezvousCaller : public IRemoteCaller {
public:
  explicit RendezvousCaller(std::size_t expected) : expected_(expected) {}

  Result<WakeReply, WakeError> invoke(const WakeTarget &,
                                      const WakePayload &) override {
    std::unique_lock<std::mutex> lock(mutex_);
    ++arrived_;
    cv_.notify_all();
    const bool all_arrived = cv_.wait_for(lock, std::chrono::seconds(5), [this] {
      return arrived_ >= expected_;
    });
    if (!all_arrived) {
      return Result<WakeReply, WakeError>::Err(WakeError::Remote("ran alone"));
    }
    return Result<WakeReply, WakeError>::Ok(WakeReply{"ok", {}, {}, {}, {}});
  }

private:
  std::size_t expected_;
  std::size_t arrived_ = 0;
  std::mutex mutex_;
  std::condition_variable cv_;
};

/// Tracks the largest number of calls in flight at once.
class InFlightCountingCaller : public IRemoteCaller {
public:
  Result<WakeReply, WakeError> invoke(const WakeTarget &target,
                                      const WakePayload &) override {
    const int now_in_flight = ++in_flight_;
    int seen = peak_.load();
    while (now_in_flight > seen && !peak_.compare_exchange_weak(seen, now_in_flight)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    --in_flight_;
    return Result<WakeReply, WakeError>::Ok(
        WakeReply{target.account_id + "/" + target.capability_id, {}, {}, {}, {}});
  }

  int peak() const { return peak_.load(); }

private:
  std::atomic<int> in_flight_{0};
  std::atomic<int> peak_{0};
};

std::shared_ptr<FixedClock> make_clock() {
  return std::make_shared<FixedClock>(from_epoch_ms(1700000000000));
}

} // namespace

TEST(FanOut, TargetsAreAccountMajor) {
  const auto targets = build_targets({"a1", "a2"}, {"c1", "c2"});
  ASSERT_EQ(targets.size(), 4u);
  EXPECT_EQ(targets[0], (WakeTarget{"a1", "c1"}));
  EXPECT_EQ(targets[1], (WakeTarget{"a1", "c2"}));
  EXPECT_EQ(targets[2], (WakeTarget{"a2", "c1"}));
  EXPECT_EQ(targets[3], (WakeTarget{"a2", "c2"}));
}

TEST(FanOut, OneFailureDoesNotHideTheOtherSuccess) {
  auto caller = std::make_shared<ScriptedCaller>("a1");
  auto logger = std::make_shared<RecordingLogger>();
  FanOutExecutor executor(caller, make_clock(), logger);

  auto report = executor.execute({"a1", "a2"}, {"c1"}, WakePayload{});
  ASSERT_TRUE(report.is_ok());
  EXPECT_EQ(caller->calls().size(), 2u);
  EXPECT_EQ(report.value().succeeded(), 1u);
  EXPECT_EQ(report.value().failed(), 1u);

  const auto &outcomes = report.value().outcomes;
  ASSERT_EQ(outcomes.size(), 2u);
  EXPECT_EQ(outcomes[0].target, (WakeTarget{"a1", "c1"}));
  EXPECT_FALSE(outcomes[0].succeeded());
  EXPECT_EQ(std::get<WakeFailure>(outcomes[0].result).reason.category,
            ErrorCategory::Remote);
  EXPECT_TRUE(outcomes[1].succeeded());
  EXPECT_EQ(std::get<WakeSuccess>(outcomes[1].result).reply, "awake a2");
  EXPECT_EQ(outcomes[1].duration_ms(), 250);

  EXPECT_TRUE(logger->saw("fanout_start"));
  EXPECT_TRUE(logger->saw("action_failed"));
  EXPECT_TRUE(logger->saw("fanout_done"));
}

TEST(FanOut, EmptySelectionIsRejectedBeforeDispatch) {
  auto caller = std::make_shared<ScriptedCaller>();
  FanOutExecutor executor(caller, make_clock(), nullptr);

  auto no_accounts = executor.execute({}, {"c1"}, WakePayload{});
  ASSERT_TRUE(no_accounts.is_err());
  EXPECT_EQ(no_accounts.error().category, ErrorCategory::Validation);

  auto no_caps = executor.execute({"a1"}, {}, WakePayload{});
  ASSERT_TRUE(no_caps.is_err());
  EXPECT_EQ(no_caps.error().category, ErrorCategory::Validation);

  EXPECT_TRUE(caller->calls().empty());
}

TEST(FanOut, PayloadReachesEveryCall) {
  auto caller = std::make_shared<ScriptedCaller>();
  FanOutExecutor executor(caller, make_clock(), nullptr);

  WakePayload payload;
  payload.prompt = "ping";
  payload.max_output_tokens = 16;
  ASSERT_TRUE(executor.execute({"a1"}, {"c1", "c2", "c3"}, payload).is_ok());

  const auto payloads = caller->payloads();
  ASSERT_EQ(payloads.size(), 3u);
  for (const auto &p : payloads) {
    EXPECT_EQ(p.prompt, std::string("ping"));
    EXPECT_EQ(p.max_output_tokens, 16);
  }
}

TEST(FanOut, ThrownExceptionBecomesThatActionsFailure) {
  FanOutExecutor executor(std::make_shared<ThrowingCaller>(), make_clock(),
                          nullptr);
  auto report = executor.execute({"a1"}, {"boom", "fine"}, WakePayload{});
  ASSERT_TRUE(report.is_ok());
  EXPECT_EQ(report.value().failed(), 1u);
  EXPECT_EQ(report.value().succeeded(), 1u);
  EXPECT_FALSE(report.value().outcomes[0].succeeded());
  EXPECT_TRUE(report.value().outcomes[1].succeeded());
}

TEST(FanOut, ActionsRunConcurrently) {
  FanOutExecutor executor(std::make_shared<RendezvousCaller>(4), make_clock(),
                          nullptr);
  auto report = executor.execute({"a1", "a2"}, {"c1", "c2"}, WakePayload{});
  ASSERT_TRUE(report.is_ok());
  EXPECT_EQ(report.value().succeeded(), 4u);
}

TEST(FanOut, ParallelismIsBoundedAndEveryActionSettles) {
  auto caller = std::make_shared<InFlightCountingCaller>();
  FanOutExecutor executor(caller, make_clock(), nullptr, 2);
  auto report = executor.execute({"a1", "a2", "a3"}, {"c1", "c2"}, WakePayload{});

  ASSERT_TRUE(report.is_ok());
  const auto &outcomes = report.value().outcomes;
  ASSERT_EQ(outcomes.size(), 6u);
  EXPECT_EQ(report.value().succeeded(), 6u);
  EXPECT_LE(caller->peak(), 2);
  EXPECT_GE(caller->peak(), 1);
  for (const auto &outcome : outcomes) {
    ASSERT_TRUE(outcome.succeeded());
    EXPECT_EQ(std::get<WakeSuccess>(outcome.result).reply,
              outcome.target.account_id + "/" + outcome.target.capability_id);
  }
}

TEST(FanOut, ZeroParallelismStillRunsEveryAction) {
  auto caller = std::make_shared<InFlightCountingCaller>();
  FanOutExecutor executor(caller, make_clock(), nullptr, 0);
  auto report = executor.execute({"a1"}, {"c1", "c2"}, WakePayload{});
  ASSERT_TRUE(report.is_ok());
  EXPECT_EQ(report.value().succeeded(), 2u);
  EXPECT_EQ(caller->peak(), 1);
}

TEST(FanOut, NullCallerIsInternalError) {
  FanOutExecutor executor(nullptr, make_clock(), nullptr);
  auto report = executor.execute({"a1"}, {"c1"}, WakePayload{});
  ASSERT_TRUE(report.is_err());
  EXPECT_EQ(report.error().category, ErrorCategory::Internal);
}

TEST(MaxOutputTokens, RequestedValueIsFloored) {
  EXPECT_EQ(resolve_max_output_tokens(12.9, {}), 12);
  EXPECT_EQ(resolve_max_output_tokens(1e30, {}),
            std::numeric_limits<int>::max());
}

TEST(MaxOutputTokens, FallsBackToFirstEnabledTask) {
  WakeTask disabled;
  disabled.enabled = false;
  disabled.schedule.max_output_tokens = 10;
  WakeTask enabled;
  enabled.schedule.max_output_tokens = 32;
  WakeTask later;
  later.schedule.max_output_tokens = 99;
  const std::vector<WakeTask> tasks = {disabled, enabled, later};

  EXPECT_EQ(resolve_max_output_tokens(std::nullopt, tasks), 32);
  EXPECT_EQ(resolve_max_output_tokens(0.0, tasks), 32);
  EXPECT_EQ(resolve_max_output_tokens(-5.0, tasks), 32);
  EXPECT_EQ(resolve_max_output_tokens(std::numeric_limits<double>::quiet_NaN(),
                                      tasks),
            32);
  EXPECT_EQ(resolve_max_output_tokens(std::nullopt, {disabled}), 0);
}

TEST(MaxOutputTokens, UnusableRequestWithoutTasksIsZero) {
  EXPECT_EQ(resolve_max_output_tokens(std::nullopt, {}), 0);
  EXPECT_EQ(resolve_max_output_tokens(-3.0, {}), 0);
  EXPECT_EQ(resolve_max_output_tokens(std::numeric_limits<double>::infinity(), {}),
            0);
}
