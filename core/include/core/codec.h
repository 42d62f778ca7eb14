#pragma once

#include "core/error.h"
#include "core/history_log.h"
#include "core/result.h"
#include "core/task.h"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <vector>

namespace wake::core {

// JSON persistence of tasks and history records.
//
// Field names are camelCase. Decoding is lenient: absent or malformed
// fields take their defaults, so legacy documents load and are then
// normalized. Only a document that is not JSON at all (or not an array)
// is an error.

nlohmann::json encode_schedule(const Schedule &schedule);
Schedule decode_schedule(const nlohmann::json &j);

std::string encode_tasks(const std::vector<WakeTask> &tasks);
Result<std::vector<WakeTask>, WakeError> decode_tasks(const std::string &text);

std::string encode_history(const std::vector<HistoryRecord> &records);
Result<std::vector<HistoryRecord>, WakeError>
decode_history(const std::string &text);

} // namespace wake::core
