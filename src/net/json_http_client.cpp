#include <ragloop/core/text_utils.h>
#include <ragloop/net/http_client.h>

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <mutex>

namespace ragloop::net {

namespace {

// Sleep for `delay` unless `stop` fires first; false when interrupted
bool interruptibleSleep(std::chrono::milliseconds delay, std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock lock(m);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

} // namespace

JsonHttpClient::JsonHttpClient(std::shared_ptr<IHttpTransport> transport, RetryPolicy retry)
    : transport_(std::move(transport)), retry_(retry) {}

Result<nlohmann::json> JsonHttpClient::postJson(const std::string& url, const nlohmann::json& body,
                                                const HeaderList& headers,
                                                std::chrono::milliseconds timeout,
                                                std::stop_token stop) const {
    if (!transport_) {
        return Error{ErrorCode::NotInitialized, "HTTP transport not configured"};
    }

    HttpRequest request;
    request.url = url;
    request.headers = headers;
    request.timeout = timeout;
    try {
        request.body = body.dump();
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidArgument,
                     std::string("Failed to serialize request body: ") + e.what()};
    }

    auto backoff = retry_.initialBackoff;
    for (int attempt = 0;; ++attempt) {
        const bool canRetry = attempt < retry_.maxRetries;
        auto resp = transport_->post(request, stop);

        if (!resp) {
            if (canRetry && isRetryableError(resp.error()) && !stop.stop_requested()) {
                spdlog::debug("[HttpClient] {} failed ({}), retrying in {} ms", url,
                              resp.error().message, backoff.count());
            } else {
                return resp.error();
            }
        } else if (resp.value().status >= 400) {
            const long status = resp.value().status;
            if (!(canRetry && isRetryableStatus(status))) {
                return Error{statusToErrorCode(status),
                             "HTTP " + std::to_string(status) + " from " + url + ": " +
                                 text::truncateUtf8(resp.value().body, 200)};
            }
            spdlog::debug("[HttpClient] {} returned HTTP {}, retrying in {} ms", url, status,
                          backoff.count());
        } else {
            auto parsed =
                nlohmann::json::parse(resp.value().body, nullptr, /*allow_exceptions=*/false);
            if (parsed.is_discarded()) {
                return Error{ErrorCode::InvalidData, "Response from " + url + " is not JSON"};
            }
            return parsed;
        }

        if (!interruptibleSleep(backoff, stop)) {
            return Error{ErrorCode::OperationCancelled, "request cancelled during backoff"};
        }
        backoff = std::chrono::milliseconds(
            static_cast<long long>(static_cast<double>(backoff.count()) * retry_.multiplier));
    }
}

} // namespace ragloop::net
