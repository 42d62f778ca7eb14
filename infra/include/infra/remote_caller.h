#pragma once

#include "core/fan_out.h"
#include "infra/http_client.h"

#include <chrono>
#include <memory>
#include <string>

namespace wake::core {
class ILogger;
}

namespace wake::infra {

/// IRemoteCaller over the wake service's HTTP API.
///
/// POST {base_url}/v1/wakeup
///   request  {"accountId", "capabilityId", "prompt"?, "maxOutputTokens"?}
///   response {"reply", "promptTokens"?, "completionTokens"?, "totalTokens"?,
///             "traceId"?, "responseId"?, "durationMs"?}
///
/// An error response whose body carries {"error": "..."} surfaces that text
/// as the user message.
class HttpRemoteCaller final : public core::IRemoteCaller {
public:
  HttpRemoteCaller(std::shared_ptr<IHttpClient> http, std::string base_url,
                   std::chrono::milliseconds timeout,
                   std::shared_ptr<core::ILogger> logger = nullptr);

  core::Result<core::WakeReply, core::WakeError>
  invoke(const core::WakeTarget &target,
         const core::WakePayload &payload) override;

  [[nodiscard]] const std::string &endpoint() const { return endpoint_; }

private:
  std::shared_ptr<IHttpClient> http_;
  std::string endpoint_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<core::ILogger> logger_;
};

/// Build the request body for one wake call.
std::string encode_wake_request(const core::WakeTarget &target,
                                const core::WakePayload &payload);

/// Parse a wake response body. PARSE_ERROR when it is not a JSON object
/// with a string "reply".
core::Result<core::WakeReply, core::WakeError>
decode_wake_response(const std::string &body);

} // namespace wake::infra
