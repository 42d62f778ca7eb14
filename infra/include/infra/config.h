#pragma once

#include <chrono>
#include <memory>
#include <string>

namespace wake::core {
class ILogger;
}

namespace wake::infra {

class PathService;

/// Runtime settings, read once at startup from WAKE_* environment variables.
struct AppConfig {
  std::string api_base_url = "http://127.0.0.1:8765";
  std::string data_dir;
  std::chrono::milliseconds request_timeout{120000};
  std::chrono::milliseconds tick_interval{1000};
  std::chrono::milliseconds duplicate_window{8000};
  std::string log_level = "info";

  /// Invalid numeric values keep their default and log config_invalid.
  static AppConfig from_environment(const PathService &paths,
                                    const std::shared_ptr<core::ILogger> &logger);
};

/// WAKE_LOG_LEVEL, or "info". Read before a logger exists.
std::string log_level_from_environment();

/// Parse a decimal environment variable. Unset or empty yields `fallback`;
/// anything non-numeric or out of range logs config_invalid and yields
/// `fallback`.
int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger);

} // namespace wake::infra
