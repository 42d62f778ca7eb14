#include "core/clock.h"
#include "core/duplicate_guard.h"
#include "core/durable_store.h"
#include "core/fan_out.h"
#include "core/history_log.h"
#include "core/logger.h"
#include "core/recurrence.h"
#include "core/schedule.h"
#include "core/task_registry.h"
#include "core/wakeup_service.h"
#include "infra/config.h"
#include "infra/curl_http_client.h"
#include "infra/file_store.h"
#include "infra/logger.h"
#include "infra/path_service.h"
#include "infra/remote_caller.h"

#include <chrono>
#include <csignal>
#include <exception>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace wake;

constexpr const char *kTasksKey = "wakeup.tasks";
constexpr const char *kLegacyTasksKey = "agtools.wakeup.tasks";
constexpr const char *kSwitchKey = "wakeup.enabled";
constexpr const char *kLegacySwitchKey = "agtools.wakeup.enabled";
constexpr const char *kHistoryKey = "wakeup.history";

volatile std::sig_atomic_t g_stop = 0;
volatile std::sig_atomic_t g_quota_reset = 0;

void handle_stop(int) { g_stop = 1; }
void handle_quota_reset(int) { g_quota_reset = 1; }

void print_usage() {
  std::cerr
      << "usage: wakeup_scheduler <command> [options]\n"
         "\n"
         "commands:\n"
         "  run                    tick until SIGINT/SIGTERM; SIGUSR1 signals "
         "a quota reset\n"
         "  list                   tasks with trigger summary and next run\n"
         "  history                recorded wake outcomes, newest first\n"
         "  clear-history          drop every history record\n"
         "  enable | disable       global wake switch\n"
         "  test --account A [--account B] [--capability C] [--prompt P] "
         "[--max-tokens N]\n"
         "  run-task <id>          run one task now\n"
         "  add --name N --account A [--capability C] [--daily HH:MM] "
         "[--cron EXPR] [--on-reset] [--prompt P] [--max-tokens N]\n"
         "  remove <id>            delete a task\n"
         "  repair --account A [--capability C]  point selections at "
         "available targets\n";
}

std::string format_local(core::Timestamp ts) {
  const std::time_t t = std::chrono::system_clock::to_time_t(ts);
  std::tm local{};
  localtime_r(&t, &local);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
  return buf;
}

/// Repeated "--flag value" options after the command word.
struct Options {
  std::vector<std::string> accounts;
  std::vector<std::string> capabilities;
  std::vector<std::string> daily_times;
  std::optional<std::string> name;
  std::optional<std::string> prompt;
  std::optional<std::string> cron;
  std::optional<std::string> max_tokens;
  bool on_reset = false;
  std::vector<std::string> positional;
};

bool parse_options(int argc, char *argv[], int first, Options &out) {
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    auto next = [&](std::string &value) {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return false;
      }
      value = argv[++i];
      return true;
    };
    std::string value;
    if (arg == "--on-reset") {
      out.on_reset = true;
    } else if (arg == "--account" || arg == "--capability" ||
               arg == "--daily" || arg == "--name" || arg == "--prompt" ||
               arg == "--cron" || arg == "--max-tokens") {
      if (!next(value)) {
        return false;
      }
      if (arg == "--account") {
        out.accounts.push_back(value);
      } else if (arg == "--capability") {
        out.capabilities.push_back(value);
      } else if (arg == "--daily") {
        out.daily_times.push_back(value);
      } else if (arg == "--name") {
        out.name = value;
      } else if (arg == "--prompt") {
        out.prompt = value;
      } else if (arg == "--cron") {
        out.cron = value;
      } else {
        out.max_tokens = value;
      }
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "unknown option " << arg << "\n";
      return false;
    } else {
      out.positional.push_back(arg);
    }
  }
  return true;
}

std::vector<std::string> default_capability_ids() {
  std::vector<std::string> ids;
  for (const auto &cap : core::default_capabilities()) {
    ids.push_back(cap.id);
  }
  return ids;
}

int report_error(const core::WakeError &error) {
  std::cerr << "error (" << core::to_string(error.category)
            << "): " << error.user_message << "\n";
  return 1;
}

int print_summary(const core::Result<core::RunSummary, core::WakeError> &result) {
  if (result.is_err()) {
    return report_error(result.error());
  }
  const auto &summary = result.value();
  for (const auto &record : summary.records) {
    std::cout << (record.success ? "ok   " : "fail ") << record.target.account_id
              << " " << record.target.capability_id << " "
              << record.message.value_or("") << "\n";
  }
  std::cout << summary.succeeded << " succeeded, " << summary.failed
            << " failed\n";
  return summary.failed == 0 ? 0 : 2;
}

/// Object graph of one process.
struct App {
  std::shared_ptr<core::ILogger> logger;
  infra::AppConfig config;
  std::shared_ptr<core::WriteBehindStore> store;
  std::shared_ptr<core::IClock> clock;
  std::shared_ptr<core::TaskRegistry> registry;
  std::shared_ptr<core::HistoryLog> history;
  std::shared_ptr<core::WakeupService> service;
};

App build_app() {
  App app;
  app.logger = std::shared_ptr<core::ILogger>(
      infra::create_console_logger(infra::log_level_from_environment()));

  auto paths = infra::PathService::create();
  app.config = infra::AppConfig::from_environment(*paths, app.logger);

  app.store = std::make_shared<core::WriteBehindStore>(
      std::make_shared<infra::FileDurableStore>(app.config.data_dir),
      app.logger);
  app.clock = core::create_system_clock();

  app.registry = std::make_shared<core::TaskRegistry>(
      core::StoreHandle(app.store, kTasksKey, kLegacyTasksKey, app.logger),
      core::StoreHandle(app.store, kSwitchKey, kLegacySwitchKey, app.logger),
      app.clock, app.logger);
  app.history = std::make_shared<core::HistoryLog>(
      core::StoreHandle(app.store, kHistoryKey, {}, app.logger), app.logger);

  auto http = std::make_shared<infra::CurlHttpClient>();
  auto caller = std::make_shared<infra::HttpRemoteCaller>(
      http, app.config.api_base_url, app.config.request_timeout, app.logger);
  auto guarded = std::make_shared<core::DuplicateWakeGuard>(
      caller, app.clock, app.config.duplicate_window, app.logger);
  auto executor =
      std::make_shared<core::FanOutExecutor>(guarded, app.clock, app.logger);

  app.service = std::make_shared<core::WakeupService>(
      app.registry, app.history, executor, app.clock, app.logger);

  app.registry->load();
  app.history->load();
  return app;
}

int run_daemon(App &app) {
  std::signal(SIGINT, handle_stop);
  std::signal(SIGTERM, handle_stop);
  std::signal(SIGUSR1, handle_quota_reset);

  app.logger->info("startup", "app", "daemon_start",
                   "data_dir=" + app.config.data_dir +
                       " api=" + app.config.api_base_url + " tick_ms=" +
                       std::to_string(app.config.tick_interval.count()));

  app.service->tick();
  while (!g_stop) {
    std::this_thread::sleep_for(app.config.tick_interval);
    if (g_quota_reset) {
      g_quota_reset = 0;
      app.service->notify_quota_reset(app.clock->now());
    }
    app.service->tick();
  }

  app.logger->info("shutdown", "app", "daemon_stop", "flushing store");
  return 0;
}

int list_tasks(App &app) {
  std::cout << "wakeup " << (app.registry->wakeup_enabled() ? "enabled" : "disabled")
            << "\n";
  for (const auto &task : app.registry->tasks()) {
    std::cout << task.id << "  " << (task.enabled ? "[on]  " : "[off] ")
              << task.name << "\n    " << core::describe(task) << "\n";
    if (auto next = app.service->next_run(task)) {
      std::cout << "    next: " << format_local(*next) << "\n";
    }
    if (task.last_run_at) {
      std::cout << "    last: " << format_local(*task.last_run_at) << "\n";
    }
  }
  return 0;
}

int show_history(App &app) {
  for (const auto &record : app.history->records()) {
    std::cout << format_local(record.timestamp) << "  "
              << core::to_string(record.trigger_type) << "/"
              << core::to_string(record.trigger_source) << "  "
              << (record.success ? "ok   " : "fail ")
              << record.target.account_id << " "
              << record.target.capability_id;
    if (record.task_name) {
      std::cout << "  (" << *record.task_name << ")";
    }
    std::cout << "\n    " << record.message.value_or("") << "\n";
  }
  return 0;
}

std::optional<double> parse_max_tokens(const Options &opts) {
  if (!opts.max_tokens) {
    return std::nullopt;
  }
  char *end = nullptr;
  const double value = std::strtod(opts.max_tokens->c_str(), &end);
  if (end == opts.max_tokens->c_str() || *end != 0) {
    return std::nullopt;
  }
  return value;
}

int add_task(App &app, const Options &opts) {
  core::TaskDraft draft;
  draft.name = opts.name.value_or("");
  draft.schedule.selected_accounts = opts.accounts;
  if (!opts.capabilities.empty()) {
    draft.schedule.selected_capabilities = opts.capabilities;
  }
  draft.schedule.custom_prompt = opts.prompt;
  draft.schedule.max_output_tokens =
      core::resolve_max_output_tokens(parse_max_tokens(opts), {});

  if (opts.on_reset) {
    draft.schedule.trigger = core::QuotaResetTrigger{};
  } else if (opts.cron) {
    draft.schedule.trigger = core::CrontabTrigger{*opts.cron};
  } else {
    core::ScheduledTrigger trigger;
    if (!opts.daily_times.empty()) {
      trigger.daily_times.clear();
      for (const auto &text : opts.daily_times) {
        auto time = core::parse_wall_time(text);
        if (time.is_err()) {
          return report_error(time.error());
        }
        trigger.daily_times.push_back(time.value());
      }
    }
    draft.schedule.trigger = trigger;
  }

  auto created = app.registry->create(std::move(draft));
  if (created.is_err()) {
    return report_error(created.error());
  }
  std::cout << created.value().id << "\n";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2) {
    print_usage();
    return 64;
  }
  const std::string command = argv[1];
  if (command == "-h" || command == "--help" || command == "help") {
    print_usage();
    return 0;
  }

  Options opts;
  if (!parse_options(argc, argv, 2, opts)) {
    print_usage();
    return 64;
  }

  App app;
  try {
    app = build_app();
  } catch (const std::exception &e) {
    std::cerr << "startup failed: " << e.what() << "\n";
    return 1;
  }
  int rc = 0;

  if (command == "run") {
    rc = run_daemon(app);
  } else if (command == "list") {
    rc = list_tasks(app);
  } else if (command == "history") {
    rc = show_history(app);
  } else if (command == "clear-history") {
    app.history->clear();
  } else if (command == "enable" || command == "disable") {
    app.registry->set_wakeup_enabled(command == "enable");
  } else if (command == "test") {
    core::ManualTestRequest request;
    request.accounts = opts.accounts;
    request.capabilities = opts.capabilities.empty()
                               ? std::vector<std::string>{core::kDefaultCapability}
                               : opts.capabilities;
    request.prompt = opts.prompt;
    request.max_output_tokens = parse_max_tokens(opts);
    rc = print_summary(app.service->run_manual_test(request));
  } else if (command == "run-task") {
    if (opts.positional.empty()) {
      print_usage();
      rc = 64;
    } else {
      rc = print_summary(
          app.service->run_task(opts.positional.front(), core::TriggerType::Manual));
    }
  } else if (command == "add") {
    rc = add_task(app, opts);
  } else if (command == "remove") {
    if (opts.positional.empty()) {
      print_usage();
      rc = 64;
    } else {
      auto removed = app.registry->remove(opts.positional.front());
      rc = removed.is_err() ? report_error(removed.error()) : 0;
    }
  } else if (command == "repair") {
    const auto capabilities =
        opts.capabilities.empty() ? default_capability_ids() : opts.capabilities;
    const auto changed = app.registry->repair_selections(opts.accounts, capabilities);
    std::cout << changed << " task(s) repaired\n";
  } else {
    std::cerr << "unknown command " << command << "\n";
    print_usage();
    rc = 64;
  }

  app.store->flush();
  if (app.store->failure_count() > 0 && rc == 0) {
    rc = 3;
  }
  return rc;
}
