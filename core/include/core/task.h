#pragma once

#include "core/clock.h"
#include "core/schedule.h"

#include <optional>
#include <string>

namespace wake::core {

/// A named, persisted wake trigger. Owned exclusively by TaskRegistry.
struct WakeTask {
  std::string id; // Opaque unique id
  std::string name;
  bool enabled = true;
  Timestamp created_at{};
  std::optional<Timestamp> last_run_at;
  Schedule schedule;

  friend bool operator==(const WakeTask &a, const WakeTask &b) {
    return a.id == b.id && a.name == b.name && a.enabled == b.enabled &&
           a.created_at == b.created_at && a.last_run_at == b.last_run_at &&
           a.schedule == b.schedule;
  }
};

/// What a collaborator submits to create or edit a task.
struct TaskDraft {
  std::string name;
  bool enabled = true;
  Schedule schedule;
};

} // namespace wake::core
