#pragma once

#include "infra/http_client.h"
#include <cstddef>
#include <string>

namespace wake::infra {

/// libcurl-backed HttpClient.
/// Each execute() uses its own easy handle, so concurrent calls from the
/// fan-out threads do not serialize on one another.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override = default;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    wake::core::Result<HttpResponse, wake::core::WakeError> execute(
        const HttpRequest& request
    ) override;

private:
    HttpErrorCode classify_curl_error(int curl_code) const;

    static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t header_callback(char* ptr, size_t size, size_t nitems, void* userdata);
};

} // namespace wake::infra
