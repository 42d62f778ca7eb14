#include "infra/http_client.h"

namespace wake::infra {

wake::core::WakeError make_http_error(
    HttpErrorCode code,
    const std::string &user_message,
    const std::string &internal_message,
    bool retryable
) {
  wake::core::ErrorCategory category = wake::core::ErrorCategory::Unknown;
  switch (code) {
  case HttpErrorCode::NETWORK_ERROR:
    category = wake::core::ErrorCategory::Network;
    break;
  case HttpErrorCode::TIMEOUT:
    category = wake::core::ErrorCategory::Timeout;
    break;
  case HttpErrorCode::SERVER_ERROR:
  case HttpErrorCode::RATE_LIMIT:
  case HttpErrorCode::CLIENT_ERROR:
  case HttpErrorCode::PARSE_ERROR:
    category = wake::core::ErrorCategory::Remote;
    break;
  case HttpErrorCode::UNKNOWN:
    category = wake::core::ErrorCategory::Unknown;
    break;
  }

  std::map<std::string, std::string> details = {
      {"http_error_code", std::to_string(static_cast<int>(code))}};

  return wake::core::WakeError(category, static_cast<int>(code), retryable,
                               user_message, internal_message, details);
}

} // namespace wake::infra
