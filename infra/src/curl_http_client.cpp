#include "infra/curl_http_client.h"
#include <curl/curl.h>
#include <chrono>
#include <memory>
#include <stdexcept>

namespace wake::infra {

namespace {
    // One-time libcurl global initialization, done before any thread starts.
    struct CurlGlobalInit {
        CurlGlobalInit() { curl_global_init(CURL_GLOBAL_ALL); }
        ~CurlGlobalInit() { curl_global_cleanup(); }
    };
    static CurlGlobalInit g_curl_init;

    struct EasyDeleter {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };
    using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;

    struct SlistDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };
    using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

    std::string trim(const std::string& text) {
        const auto begin = text.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return {};
        }
        const auto end = text.find_last_not_of(" \t\r\n");
        return text.substr(begin, end - begin + 1);
    }

    constexpr std::size_t kMaxErrorBody = 512;
}

CurlHttpClient::CurlHttpClient() {
    // Fail at construction rather than on the first fan-out.
    EasyHandle probe(curl_easy_init());
    if (!probe) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

size_t CurlHttpClient::write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    size_t total_size = size * nmemb;
    buffer->append(ptr, total_size);
    return total_size;
}

size_t CurlHttpClient::header_callback(char* ptr, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    const size_t total_size = size * nitems;
    const std::string line(ptr, total_size);
    const auto colon = line.find(':');
    if (colon != std::string::npos) {
        std::string key = trim(line.substr(0, colon));
        for (auto& c : key) {
            if (c >= 'A' && c <= 'Z') {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        (*headers)[key] = trim(line.substr(colon + 1));
    }
    return total_size;
}

HttpErrorCode CurlHttpClient::classify_curl_error(int curl_code) const {
    switch (curl_code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return HttpErrorCode::NETWORK_ERROR;

        case CURLE_OPERATION_TIMEDOUT:
            return HttpErrorCode::TIMEOUT;

        default:
            return HttpErrorCode::UNKNOWN;
    }
}

wake::core::Result<HttpResponse, wake::core::WakeError> CurlHttpClient::execute(
    const HttpRequest& request
) {
    using Result = wake::core::Result<HttpResponse, wake::core::WakeError>;

    EasyHandle curl(curl_easy_init());
    if (!curl) {
        return Result::Err(make_http_error(HttpErrorCode::UNKNOWN,
                                           "Request failed.",
                                           "curl_easy_init returned null"));
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    long timeout_ms = static_cast<long>(request.timeout.count());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms / 2);

    if (request.method == HttpMethod::POST) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                         static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }

    HeaderList headers;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        headers.reset(curl_slist_append(headers.release(), header.c_str()));
    }
    if (!request.trace_id.empty()) {
        std::string header = "X-Trace-Id: " + request.trace_id;
        headers.reset(curl_slist_append(headers.release(), header.c_str()));
    }
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    std::string response_buffer;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &CurlHttpClient::write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);

    std::map<std::string, std::string> response_headers;
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &CurlHttpClient::header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response_headers);

    auto start_time = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl.get());
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (res != CURLE_OK) {
        HttpErrorCode error_code = classify_curl_error(res);
        std::string user_message;
        switch (error_code) {
            case HttpErrorCode::NETWORK_ERROR:
                user_message = "Network error occurred. Please check your connection.";
                break;
            case HttpErrorCode::TIMEOUT:
                user_message = "Request timed out. Please try again.";
                break;
            default:
                user_message = "Unknown error occurred.";
                break;
        }

        std::string internal_message = "CURL error: " + std::string(curl_easy_strerror(res)) +
                                       " (code: " + std::to_string(res) + ")";
        return Result::Err(make_http_error(error_code, user_message, internal_message,
                                           error_code != HttpErrorCode::UNKNOWN));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code >= 400) {
        HttpErrorCode error_code = HttpErrorCode::CLIENT_ERROR;
        std::string user_message = "Invalid request. Please check your parameters.";
        bool retryable = false;
        if (http_code >= 500) {
            error_code = HttpErrorCode::SERVER_ERROR;
            user_message = "Server error occurred. Please try again later.";
            retryable = true;
        } else if (http_code == 429) {
            error_code = HttpErrorCode::RATE_LIMIT;
            user_message = "Too many requests. Please slow down.";
            retryable = true;
        }
        auto error = make_http_error(error_code, user_message,
                                     "HTTP " + std::to_string(http_code) + " response",
                                     retryable);
        error.details["status_code"] = std::to_string(http_code);
        error.details["body"] = response_buffer.substr(0, kMaxErrorBody);
        return Result::Err(std::move(error));
    }

    HttpResponse response;
    response.status_code = static_cast<int>(http_code);
    response.headers = std::move(response_headers);
    response.body = std::move(response_buffer);
    response.elapsed_ms = elapsed_ms;
    return Result::Ok(std::move(response));
}

} // namespace wake::infra
