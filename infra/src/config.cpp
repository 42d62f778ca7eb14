#include "infra/config.h"

#include "core/logger.h"
#include "infra/path_service.h"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace wake::infra {

int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  char *end = nullptr;
  errno = 0;
  const long value = std::strtol(raw, &end, 10);
  const bool valid = end && *end == 0 && errno == 0 && value <= INT_MAX &&
                     (allow_zero ? value >= 0 : value > 0);
  if (!valid) {
    if (logger) {
      logger->warn("startup", "config", "config_invalid",
                   std::string("Invalid value for ") + name + "=" + raw +
                       ", fallback=" + std::to_string(fallback));
    }
    return fallback;
  }

  return static_cast<int>(value);
}

std::string log_level_from_environment() {
  const char *raw = std::getenv("WAKE_LOG_LEVEL");
  if (!raw || raw[0] == 0) {
    return "info";
  }
  return raw;
}

AppConfig AppConfig::from_environment(const PathService &paths,
                                      const std::shared_ptr<core::ILogger> &logger) {
  AppConfig config;

  const char *api_base = std::getenv("WAKE_API_BASE_URL");
  if (api_base && api_base[0] != '\0') {
    config.api_base_url = api_base;
  }

  const char *data_dir = std::getenv("WAKE_DATA_DIR");
  config.data_dir =
      data_dir && data_dir[0] != '\0' ? std::string(data_dir) : paths.data_dir();

  config.request_timeout = std::chrono::milliseconds(parse_env_int(
      "WAKE_REQUEST_TIMEOUT_MS",
      static_cast<int>(config.request_timeout.count()), false, logger));
  config.tick_interval = std::chrono::milliseconds(parse_env_int(
      "WAKE_TICK_MS", static_cast<int>(config.tick_interval.count()), false,
      logger));
  config.duplicate_window = std::chrono::milliseconds(parse_env_int(
      "WAKE_DUPLICATE_WINDOW_MS",
      static_cast<int>(config.duplicate_window.count()), true, logger));
  config.log_level = log_level_from_environment();

  return config;
}

} // namespace wake::infra
