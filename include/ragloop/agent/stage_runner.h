#pragma once

#include <ragloop/core/types.h>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <type_traits>
#include <utility>

namespace ragloop::agent {

inline constexpr std::chrono::milliseconds kStagePollInterval{10};

namespace detail {
template <typename R> struct ResultValue;
template <typename T> struct ResultValue<Result<T>> {
    using type = T;
};
} // namespace detail

/**
 * @brief A stage call running on an executor, with its own deadline and stop source
 *
 * `await` returns the stage's result, Error{Timeout} when the deadline passes first, or
 * Error{OperationCancelled} when the caller's token fires first. In both failure cases the
 * stage's stop source is triggered so the call can abort; a stage that is destroyed before its
 * result was collected is stopped the same way.
 */
template <typename T> class PendingStage {
public:
    using Clock = std::chrono::steady_clock;

    PendingStage(std::string name, std::future<Result<T>> future,
                 std::shared_ptr<std::stop_source> stopSource, std::chrono::milliseconds timeout)
        : name_(std::move(name)), future_(std::move(future)), stopSource_(std::move(stopSource)),
          started_(Clock::now()), timeout_(timeout) {}

    PendingStage(PendingStage&&) noexcept = default;
    PendingStage& operator=(PendingStage&&) noexcept = default;
    PendingStage(const PendingStage&) = delete;
    PendingStage& operator=(const PendingStage&) = delete;

    ~PendingStage() {
        if (stopSource_ && !collected_) {
            stopSource_->request_stop();
        }
    }

    Result<T> await(std::stop_token callerStop) {
        collected_ = true;
        const bool bounded = timeout_.count() > 0;
        const auto deadline = started_ + timeout_;
        while (true) {
            if (callerStop.stop_requested()) {
                stopSource_->request_stop();
                return Error{ErrorCode::OperationCancelled, name_ + " cancelled"};
            }
            auto slice = kStagePollInterval;
            if (bounded) {
                auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
                slice = std::clamp(remaining, std::chrono::milliseconds(0), kStagePollInterval);
            }
            if (future_.wait_for(slice) == std::future_status::ready) {
                try {
                    return future_.get();
                } catch (const std::exception& e) {
                    return Error{ErrorCode::InternalError, name_ + " threw: " + e.what()};
                }
            }
            if (bounded && Clock::now() >= deadline) {
                stopSource_->request_stop();
                return Error{ErrorCode::Timeout, name_ + " timed out after " +
                                                     std::to_string(timeout_.count()) + " ms"};
            }
        }
    }

    std::chrono::milliseconds elapsed() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
    }

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
    std::future<Result<T>> future_;
    std::shared_ptr<std::stop_source> stopSource_;
    Clock::time_point started_;
    std::chrono::milliseconds timeout_;
    bool collected_ = false;
};

/**
 * @brief Post `fn(stop_token)` to `executor`; a timeout of zero waits indefinitely
 *
 * `fn` must return Result<T> and own (or share) everything it touches: an abandoned stage may
 * still be running after the caller has moved on.
 */
template <typename Fn>
auto launchStage(const boost::asio::any_io_executor& executor, std::string name,
                 std::chrono::milliseconds timeout, Fn fn)
    -> PendingStage<typename detail::ResultValue<std::invoke_result_t<Fn&, std::stop_token>>::type> {
    using R = std::invoke_result_t<Fn&, std::stop_token>;
    using T = typename detail::ResultValue<R>::type;

    auto stopSource = std::make_shared<std::stop_source>();
    auto task = std::make_shared<std::packaged_task<R()>>(
        [fn = std::move(fn), token = stopSource->get_token()]() mutable { return fn(token); });
    auto future = task->get_future();
    boost::asio::post(executor, [task]() { (*task)(); });
    return PendingStage<T>(std::move(name), std::move(future), std::move(stopSource), timeout);
}

} // namespace ragloop::agent
