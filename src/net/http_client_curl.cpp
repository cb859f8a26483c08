#include <ragloop/net/http_client.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <mutex>
#include <string_view>

namespace ragloop::net {

namespace {

std::once_flag curlInitFlag;

// cURL write callback
size_t writeCallback(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const std::stop_token*>(clientp);
    return stop->stop_requested() ? 1 : 0;
}

class CurlHandle {
public:
    CurlHandle() : curl_(curl_easy_init()) {}
    ~CurlHandle() {
        if (curl_)
            curl_easy_cleanup(curl_);
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() const { return curl_; }
    explicit operator bool() const { return curl_ != nullptr; }

private:
    CURL* curl_;
};

class HeaderListGuard {
public:
    HeaderListGuard() = default;
    ~HeaderListGuard() {
        if (list_)
            curl_slist_free_all(list_);
    }
    HeaderListGuard(const HeaderListGuard&) = delete;
    HeaderListGuard& operator=(const HeaderListGuard&) = delete;

    void append(const std::string& line) { list_ = curl_slist_append(list_, line.c_str()); }
    curl_slist* get() const { return list_; }

private:
    curl_slist* list_ = nullptr;
};

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

} // namespace

CurlHttpTransport::CurlHttpTransport(HttpClientConfig config) : config_(std::move(config)) {
    std::call_once(curlInitFlag, []() { curl_global_init(CURL_GLOBAL_ALL); });
}

Result<HttpResponse> CurlHttpTransport::post(const HttpRequest& request, std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "request cancelled before start"};
    }

    CurlHandle curl;
    if (!curl) {
        return Error{ErrorCode::NetworkError, "Failed to initialize cURL"};
    }

    HttpResponse response;
    HeaderListGuard headers;
    headers.append("Content-Type: application/json");
    headers.append("Accept: application/json");
    for (const auto& [name, value] : request.headers) {
        headers.append(name + ": " + value);
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connectTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &stop);

    if (!config_.verifyTls) {
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 0L);
    }

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return makeCurlError(rc, "POST " + request.url);
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

ErrorCode statusToErrorCode(long status) noexcept {
    if (status == 400 || status == 422)
        return ErrorCode::InvalidArgument;
    if (status == 401 || status == 403)
        return ErrorCode::PermissionDenied;
    if (status == 404)
        return ErrorCode::NotFound;
    if (status == 408 || status == 504)
        return ErrorCode::Timeout;
    if (status == 429)
        return ErrorCode::ResourceExhausted;
    if (status >= 500)
        return ErrorCode::NetworkError;
    return ErrorCode::Unknown;
}

bool isRetryableStatus(long status) noexcept {
    return status == 429 || status == 502 || status == 503 || status == 504;
}

bool isRetryableError(const Error& error) noexcept {
    return error.code == ErrorCode::NetworkError;
}

} // namespace ragloop::net
