#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

namespace wake::core {

/// Wall-clock instant with millisecond resolution. Everything persisted or
/// compared by the scheduler uses this type so stored values round-trip
/// exactly.
using Timestamp =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

inline std::int64_t to_epoch_ms(Timestamp ts) {
  return ts.time_since_epoch().count();
}

inline Timestamp from_epoch_ms(std::int64_t ms) {
  return Timestamp(std::chrono::milliseconds(ms));
}

/// Injectable time source.
class IClock {
public:
  virtual ~IClock() = default;
  [[nodiscard]] virtual Timestamp now() const = 0;
};

std::shared_ptr<IClock> create_system_clock();

} // namespace wake::core
