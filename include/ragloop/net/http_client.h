#pragma once

#include <ragloop/core/types.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace ragloop::net {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string url;
    std::string body;
    HeaderList headers;
    std::chrono::milliseconds timeout{20000};
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief Bounded exponential backoff for transient failures
 */
struct RetryPolicy {
    int maxRetries = 2;
    std::chrono::milliseconds initialBackoff{250};
    double multiplier = 2.0;
};

struct HttpClientConfig {
    std::string userAgent = "ragloop/1.0";
    std::chrono::milliseconds connectTimeout{5000};
    bool verifyTls = true;
    RetryPolicy retry;
};

/**
 * @brief Single-shot POST transport
 *
 * Returns the HTTP status and body for any completed exchange (including 4xx/5xx); errors are
 * reserved for transport failures, timeouts, and cancellation through `stop`.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual Result<HttpResponse> post(const HttpRequest& request, std::stop_token stop) = 0;
};

/**
 * @brief libcurl transport; one easy handle per request, safe to share across threads
 */
class CurlHttpTransport : public IHttpTransport {
public:
    explicit CurlHttpTransport(HttpClientConfig config = {});

    Result<HttpResponse> post(const HttpRequest& request, std::stop_token stop) override;

private:
    HttpClientConfig config_;
};

// Map an HTTP status >= 400 to an error code
ErrorCode statusToErrorCode(long status) noexcept;

// Statuses and transport errors worth retrying
bool isRetryableStatus(long status) noexcept;
bool isRetryableError(const Error& error) noexcept;

/**
 * @brief JSON-over-HTTP client with retry/backoff on transient failures
 */
class JsonHttpClient {
public:
    JsonHttpClient(std::shared_ptr<IHttpTransport> transport, RetryPolicy retry = {});

    Result<nlohmann::json> postJson(const std::string& url, const nlohmann::json& body,
                                    const HeaderList& headers, std::chrono::milliseconds timeout,
                                    std::stop_token stop) const;

private:
    std::shared_ptr<IHttpTransport> transport_;
    RetryPolicy retry_;
};

} // namespace ragloop::net
