#pragma once

#include <string>

namespace wake::core {

/// Random version-4 style identifier for tasks and history records.
std::string generate_id();

} // namespace wake::core
