#pragma once
#include "core/error.h"
#include "core/result.h"
#include <chrono>
#include <map>
#include <string>

namespace wake::infra {

enum class HttpMethod {
    GET,
    POST
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string trace_id;  // Sent as X-Trace-Id when non-empty
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    int status_code = 0;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds elapsed_ms{0};
};

// Transport failure classes, copied into WakeError::details["http_error_code"].
enum class HttpErrorCode {
    NETWORK_ERROR = 1001,    // DNS failure, refused connection, broken socket
    TIMEOUT = 1002,
    SERVER_ERROR = 1004,     // 5xx
    CLIENT_ERROR = 1005,     // 4xx except 429
    RATE_LIMIT = 1006,       // 429
    PARSE_ERROR = 1007,      // Body is not the expected JSON
    UNKNOWN = 1999
};

wake::core::WakeError make_http_error(
    HttpErrorCode code,
    const std::string& user_message,
    const std::string& internal_message,
    bool retryable = false
);

/// Synchronous HTTP transport. Implementations must allow concurrent
/// execute() calls from different threads.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual wake::core::Result<HttpResponse, wake::core::WakeError> get(
        const HttpRequest& request
    ) {
        HttpRequest req = request;
        req.method = HttpMethod::GET;
        return execute(req);
    }

    virtual wake::core::Result<HttpResponse, wake::core::WakeError> post(
        const HttpRequest& request
    ) {
        HttpRequest req = request;
        req.method = HttpMethod::POST;
        return execute(req);
    }

    virtual wake::core::Result<HttpResponse, wake::core::WakeError> execute(
        const HttpRequest& request
    ) = 0;
};

} // namespace wake::infra
