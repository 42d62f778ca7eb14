#pragma once

#include <memory>
#include <string>

namespace wake::infra {

/// Per-user directories of the scheduler, resolved from the platform's
/// conventions at call time.
class PathService {
public:
  virtual ~PathService() = default;

  [[nodiscard]] virtual std::string config_dir() const = 0;
  [[nodiscard]] virtual std::string cache_dir() const = 0;
  [[nodiscard]] virtual std::string data_dir() const = 0;

  static std::unique_ptr<PathService> create();
};

} // namespace wake::infra
