#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace wake::infra {

/// spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
///
/// `level` is one of trace, debug, info, warn, error, critical, off;
/// anything else means info.
std::unique_ptr<core::ILogger> create_console_logger(const std::string &level = "info");

} // namespace wake::infra
