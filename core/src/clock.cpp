#include "core/clock.h"

namespace wake::core {

namespace {

class SystemClock final : public IClock {
public:
  Timestamp now() const override {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
  }
};

} // namespace

std::shared_ptr<IClock> create_system_clock() {
  return std::make_shared<SystemClock>();
}

} // namespace wake::core
