#include <gtest/gtest.h>

#include "core/codec.h"
#include "core/task_registry.h"
#include "test_support.h"

#include <memory>

using namespace wake::core;
using wake::test::FixedClock;
using wake::test::local_time;
using wake::test::MemoryStore;
using wake::test::RecordingLogger;

namespace {

class TaskRegistryTest : public ::testing::Test {
protected:
  std::shared_ptr<MemoryStore> store_ = std::make_shared<MemoryStore>();
  std::shared_ptr<FixedClock> clock_ =
      std::make_shared<FixedClock>(local_time(2024, 1, 15, 9, 0));
  std::shared_ptr<RecordingLogger> logger_ = std::make_shared<RecordingLogger>();

  std::unique_ptr<TaskRegistry> make_registry() {
    return std::make_unique<TaskRegistry>(
        StoreHandle(store_, "wakeup.tasks", "agtools.wakeup.tasks"),
        StoreHandle(store_, "wakeup.enabled", "agtools.wakeup.enabled"),
        clock_, logger_);
  }

  static TaskDraft draft(const std::string &name) {
    TaskDraft d;
    d.name = name;
    d.schedule.selected_accounts = {"acct-1"};
    return d;
  }
};

} // namespace

TEST_F(TaskRegistryTest, SeedsDefaultTaskOnlyWhenNothingStored) {
  auto registry = make_registry();
  registry->load();
  ASSERT_EQ(registry->tasks().size(), 1u);
  const auto seeded = registry->tasks().front();
  EXPECT_EQ(seeded.name, kDefaultTaskName);
  EXPECT_TRUE(seeded.enabled);
  EXPECT_EQ(seeded.created_at, clock_->now());
  EXPECT_TRUE(store_->contains("wakeup.tasks"));

  auto reloaded = make_registry();
  reloaded->load();
  ASSERT_EQ(reloaded->tasks().size(), 1u);
  EXPECT_EQ(reloaded->tasks().front().id, seeded.id);
}

TEST_F(TaskRegistryTest, StoredEmptyListIsNotReseeded) {
  store_->put("wakeup.tasks", "[]");
  auto registry = make_registry();
  registry->load();
  EXPECT_TRUE(registry->tasks().empty());
  EXPECT_FALSE(registry->first_enabled().has_value());
}

TEST_F(TaskRegistryTest, LoadsFromLegacyKey) {
  WakeTask legacy;
  legacy.id = "legacy-1";
  legacy.name = "from before";
  legacy.schedule.selected_accounts = {"acct-1"};
  store_->put("agtools.wakeup.tasks", encode_tasks({legacy}));
  store_->put("agtools.wakeup.enabled", "true");

  auto registry = make_registry();
  registry->load();
  ASSERT_EQ(registry->tasks().size(), 1u);
  EXPECT_EQ(registry->tasks().front().id, "legacy-1");
  EXPECT_TRUE(registry->wakeup_enabled());
  EXPECT_FALSE(store_->contains("agtools.wakeup.tasks"));
  EXPECT_FALSE(store_->contains("agtools.wakeup.enabled"));
}

TEST_F(TaskRegistryTest, CreateInsertsAtFront) {
  auto registry = make_registry();
  auto first = registry->create(draft("first"));
  clock_->advance(std::chrono::minutes(1));
  auto second = registry->create(draft("  second  "));
  ASSERT_TRUE(first.is_ok());
  ASSERT_TRUE(second.is_ok());

  EXPECT_NE(first.value().id, second.value().id);
  EXPECT_EQ(second.value().name, "second");
  EXPECT_EQ(second.value().created_at, clock_->now());

  const auto tasks = registry->tasks();
  ASSERT_EQ(tasks.size(), 2u);
  EXPECT_EQ(tasks[0].id, second.value().id);
  EXPECT_EQ(tasks[1].id, first.value().id);
}

TEST_F(TaskRegistryTest, InvalidDraftsChangeNothing) {
  auto registry = make_registry();
  ASSERT_TRUE(registry->create(draft("keep")).is_ok());
  const int writes_before = store_->writes();

  TaskDraft blank_name = draft("   ");
  TaskDraft no_accounts = draft("x");
  no_accounts.schedule.selected_accounts.clear();
  TaskDraft no_caps = draft("x");
  no_caps.schedule.selected_capabilities.clear();
  TaskDraft bad_cron = draft("x");
  bad_cron.schedule.trigger = CrontabTrigger{"0 9 * *"};

  for (const auto &d : {blank_name, no_accounts, no_caps, bad_cron}) {
    auto created = registry->create(d);
    ASSERT_TRUE(created.is_err()) << d.name;
    EXPECT_EQ(created.error().category, ErrorCategory::Validation);
  }
  EXPECT_EQ(registry->tasks().size(), 1u);
  EXPECT_EQ(store_->writes(), writes_before);
}

TEST_F(TaskRegistryTest, DraftScheduleIsNormalized) {
  auto registry = make_registry();
  TaskDraft d = draft("interval");
  ScheduledTrigger trigger;
  trigger.repeat_mode = RepeatMode::Interval;
  trigger.interval_hours = 0;
  d.schedule.trigger = trigger;

  auto created = registry->create(d);
  ASSERT_TRUE(created.is_ok());
  EXPECT_EQ(std::get<ScheduledTrigger>(created.value().schedule.trigger)
                .interval_hours,
            4);
}

TEST_F(TaskRegistryTest, UpdateKeepsIdentityAndRunStamp) {
  auto registry = make_registry();
  auto created = registry->create(draft("before"));
  ASSERT_TRUE(created.is_ok());
  const auto id = created.value().id;
  const auto stamp = local_time(2024, 1, 15, 8, 0);
  ASSERT_TRUE(registry->record_run(id, stamp).is_ok());

  clock_->advance(std::chrono::hours(2));
  TaskDraft edit = draft("after");
  edit.enabled = false;
  edit.schedule.trigger = CrontabTrigger{"0 9 * * *"};
  auto updated = registry->update(id, edit);
  ASSERT_TRUE(updated.is_ok());

  EXPECT_EQ(updated.value().id, id);
  EXPECT_EQ(updated.value().name, "after");
  EXPECT_FALSE(updated.value().enabled);
  EXPECT_EQ(updated.value().created_at, created.value().created_at);
  EXPECT_EQ(updated.value().last_run_at, std::optional<Timestamp>(stamp));
  EXPECT_EQ(trigger_mode(updated.value().schedule), TriggerMode::Crontab);
}

TEST_F(TaskRegistryTest, UnknownIdsAreNotFound) {
  auto registry = make_registry();
  EXPECT_EQ(registry->update("nope", draft("x")).error().category,
            ErrorCategory::NotFound);
  EXPECT_EQ(registry->remove("nope").error().category, ErrorCategory::NotFound);
  EXPECT_EQ(registry->set_enabled("nope", true).error().category,
            ErrorCategory::NotFound);
  EXPECT_EQ(registry->record_run("nope", clock_->now()).error().category,
            ErrorCategory::NotFound);
  EXPECT_FALSE(registry->find("nope").has_value());
}

TEST_F(TaskRegistryTest, RemoveAndToggle) {
  auto registry = make_registry();
  auto a = registry->create(draft("a")).value();
  auto b = registry->create(draft("b")).value();

  ASSERT_TRUE(registry->set_enabled(b.id, false).is_ok());
  ASSERT_TRUE(registry->first_enabled().has_value());
  EXPECT_EQ(registry->first_enabled()->id, a.id);

  ASSERT_TRUE(registry->remove(a.id).is_ok());
  EXPECT_FALSE(registry->first_enabled().has_value());
  EXPECT_EQ(registry->tasks().size(), 1u);

  auto persisted = decode_tasks(store_->value("wakeup.tasks"));
  ASSERT_TRUE(persisted.is_ok());
  ASSERT_EQ(persisted.value().size(), 1u);
  EXPECT_EQ(persisted.value()[0].id, b.id);
  EXPECT_FALSE(persisted.value()[0].enabled);
}

TEST_F(TaskRegistryTest, RepairIsNoOpWhenSelectionsAreValid) {
  auto registry = make_registry();
  TaskDraft d = draft("valid");
  d.schedule.selected_accounts = {"acct-1", "acct-2"};
  ASSERT_TRUE(registry->create(d).is_ok());
  const auto before = registry->tasks();
  const int writes_before = store_->writes();

  EXPECT_EQ(registry->repair_selections({"acct-1", "acct-2", "acct-3"},
                                        {"codex-hourly", "codex-weekly"}),
            0u);
  EXPECT_EQ(registry->tasks(), before);
  EXPECT_EQ(store_->writes(), writes_before);
}

TEST_F(TaskRegistryTest, RepairFiltersOrFallsBackToFirstAvailable) {
  auto registry = make_registry();
  TaskDraft partial = draft("partial");
  partial.schedule.selected_accounts = {"gone", "acct-2"};
  TaskDraft orphan = draft("orphan");
  orphan.schedule.selected_accounts = {"gone"};
  orphan.schedule.selected_capabilities = {"retired"};
  const auto p = registry->create(partial).value();
  const auto o = registry->create(orphan).value();

  EXPECT_EQ(registry->repair_selections({"acct-1", "acct-2"}, {"codex-hourly"}),
            2u);
  EXPECT_EQ(registry->find(p.id)->schedule.selected_accounts,
            (std::vector<std::string>{"acct-2"}));
  EXPECT_EQ(registry->find(o.id)->schedule.selected_accounts,
            (std::vector<std::string>{"acct-1"}));
  EXPECT_EQ(registry->find(o.id)->schedule.selected_capabilities,
            (std::vector<std::string>{"codex-hourly"}));
}

TEST_F(TaskRegistryTest, RepairLeavesDimensionWithNoAvailabilityAlone) {
  WakeTask task;
  task.id = "t";
  task.schedule.selected_accounts = {"gone"};
  task.schedule.selected_capabilities = {"retired"};

  const auto repaired = repair_selections({task}, {}, {"codex-weekly"});
  ASSERT_EQ(repaired.size(), 1u);
  EXPECT_EQ(repaired[0].schedule.selected_accounts,
            (std::vector<std::string>{"gone"}));
  EXPECT_EQ(repaired[0].schedule.selected_capabilities,
            (std::vector<std::string>{"codex-weekly"}));
}

TEST_F(TaskRegistryTest, WakeupSwitchPersists) {
  auto registry = make_registry();
  EXPECT_FALSE(registry->wakeup_enabled());
  registry->set_wakeup_enabled(true);
  EXPECT_EQ(store_->value("wakeup.enabled"), "true");

  auto reloaded = make_registry();
  reloaded->load();
  EXPECT_TRUE(reloaded->wakeup_enabled());
}

TEST_F(TaskRegistryTest, PersistenceFailureIsLoggedNotReturned) {
  auto registry = make_registry();
  store_->fail_writes(true);
  auto created = registry->create(draft("still here"));
  ASSERT_TRUE(created.is_ok());
  EXPECT_EQ(registry->tasks().size(), 1u);
  EXPECT_TRUE(logger_->saw("persist_failed"));
}

TEST_F(TaskRegistryTest, ObserversSeeEveryMutation) {
  auto registry = make_registry();
  std::vector<std::size_t> sizes;
  registry->on_change([&sizes](const std::vector<WakeTask> &tasks) {
    sizes.push_back(tasks.size());
  });

  auto a = registry->create(draft("a")).value();
  ASSERT_TRUE(registry->create(draft("b")).is_ok());
  ASSERT_TRUE(registry->record_run(a.id, clock_->now()).is_ok());
  ASSERT_TRUE(registry->remove(a.id).is_ok());
  EXPECT_EQ(sizes, (std::vector<std::size_t>{1, 2, 2, 1}));
}
