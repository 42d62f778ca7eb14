#include "infra/path_service.h"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

#include <stdexcept>
#include <string>

namespace wake::infra {

namespace {

constexpr const char *kAppDir = "wakeup_scheduler";

std::string home_dir() {
  const char *home = std::getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    return std::string(home);
  }
  passwd *pw = getpwuid(getuid());
  if (pw != nullptr && pw->pw_dir != nullptr) {
    return std::string(pw->pw_dir);
  }
  throw std::runtime_error("Unable to resolve HOME directory");
}

/// $<xdg_var>/wakeup_scheduler, else ~/<fallback>/wakeup_scheduler.
std::string xdg_dir(const char *xdg_var, const char *fallback) {
  const char *xdg = std::getenv(xdg_var);
  if (xdg != nullptr && xdg[0] != '\0') {
    return std::string(xdg) + "/" + kAppDir;
  }
  return home_dir() + "/" + fallback + "/" + kAppDir;
}

class PathServiceUnix final : public PathService {
public:
  [[nodiscard]] std::string config_dir() const override {
#ifdef __APPLE__
    return home_dir() + "/Library/Application Support/" + kAppDir;
#else
    return xdg_dir("XDG_CONFIG_HOME", ".config");
#endif
  }

  [[nodiscard]] std::string cache_dir() const override {
#ifdef __APPLE__
    return home_dir() + "/Library/Caches/" + kAppDir;
#else
    return xdg_dir("XDG_CACHE_HOME", ".cache");
#endif
  }

  [[nodiscard]] std::string data_dir() const override {
#ifdef __APPLE__
    return home_dir() + "/Library/Application Support/" + kAppDir + "/data";
#else
    return xdg_dir("XDG_DATA_HOME", ".local/share");
#endif
  }
};

} // namespace

std::unique_ptr<PathService> PathService::create() {
  return std::make_unique<PathServiceUnix>();
}

} // namespace wake::infra
