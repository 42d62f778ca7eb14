#include "infra/remote_caller.h"

#include "core/logger.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>

namespace wake::infra {

using nlohmann::json;

namespace {

std::optional<double> get_finite(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return std::nullopt;
  }
  const double v = it->get<double>();
  if (!std::isfinite(v)) {
    return std::nullopt;
  }
  return v;
}

/// Out-of-range counts are dropped rather than wrapped.
std::optional<int> get_int(const json &j, const char *key) {
  auto v = get_finite(j, key);
  if (!v || *v < std::numeric_limits<int>::min() ||
      *v > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(*v);
}

std::optional<std::string> get_string(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::string strip_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace

std::string encode_wake_request(const core::WakeTarget &target,
                                const core::WakePayload &payload) {
  json body = {{"accountId", target.account_id},
               {"capabilityId", target.capability_id}};
  if (payload.prompt) {
    body["prompt"] = *payload.prompt;
  }
  if (payload.max_output_tokens > 0) {
    body["maxOutputTokens"] = payload.max_output_tokens;
  }
  return body.dump();
}

core::Result<core::WakeReply, core::WakeError>
decode_wake_response(const std::string &body) {
  using R = core::Result<core::WakeReply, core::WakeError>;

  const json j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return R::Err(make_http_error(HttpErrorCode::PARSE_ERROR,
                                  "Unexpected response from wake service.",
                                  "response body is not a JSON object"));
  }
  auto reply = get_string(j, "reply");
  if (!reply) {
    return R::Err(make_http_error(HttpErrorCode::PARSE_ERROR,
                                  "Unexpected response from wake service.",
                                  "response has no string 'reply'"));
  }

  core::WakeReply out;
  out.reply = std::move(*reply);

  core::UsageStats usage;
  usage.prompt_tokens = get_int(j, "promptTokens");
  usage.completion_tokens = get_int(j, "completionTokens");
  usage.total_tokens = get_int(j, "totalTokens");
  if (usage.prompt_tokens || usage.completion_tokens || usage.total_tokens) {
    out.usage = usage;
  }
  out.trace_id = get_string(j, "traceId");
  out.response_id = get_string(j, "responseId");
  if (auto ms = get_finite(j, "durationMs");
      ms && *ms >= -9223372036854775808.0 && *ms < 9223372036854775808.0) {
    out.duration_ms = static_cast<std::int64_t>(*ms);
  }
  return R::Ok(std::move(out));
}

HttpRemoteCaller::HttpRemoteCaller(std::shared_ptr<IHttpClient> http,
                                   std::string base_url,
                                   std::chrono::milliseconds timeout,
                                   std::shared_ptr<core::ILogger> logger)
    : http_(std::move(http)),
      endpoint_(strip_trailing_slash(std::move(base_url)) + "/v1/wakeup"),
      timeout_(timeout), logger_(std::move(logger)) {}

core::Result<core::WakeReply, core::WakeError>
HttpRemoteCaller::invoke(const core::WakeTarget &target,
                         const core::WakePayload &payload) {
  using R = core::Result<core::WakeReply, core::WakeError>;

  HttpRequest request;
  request.url = endpoint_;
  request.headers["Content-Type"] = "application/json";
  request.headers["Accept"] = "application/json";
  request.body = encode_wake_request(target, payload);
  request.timeout = timeout_;

  auto response = http_->post(request);
  if (response.is_err()) {
    auto error = response.error();
    auto body = error.details.find("body");
    if (body != error.details.end()) {
      const json j = json::parse(body->second, nullptr, false);
      if (!j.is_discarded() && j.is_object()) {
        if (auto message = get_string(j, "error")) {
          error.user_message = *message;
        }
      }
    }
    if (logger_) {
      logger_->warn("", "remote_caller", "wake_call_failed",
                    "account=" + target.account_id +
                        " capability=" + target.capability_id + " " +
                        error.internal_message);
    }
    return R::Err(std::move(error));
  }

  auto decoded = decode_wake_response(response.value().body);
  if (decoded.is_ok()) {
    auto &reply = decoded.value();
    if (!reply.duration_ms) {
      reply.duration_ms = response.value().elapsed_ms.count();
    }
    if (!reply.trace_id) {
      auto header = response.value().headers.find("x-trace-id");
      if (header != response.value().headers.end()) {
        reply.trace_id = header->second;
      }
    }
  }
  return decoded;
}

} // namespace wake::infra
