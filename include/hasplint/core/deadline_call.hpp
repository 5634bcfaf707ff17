/**
 * @file deadline_call.hpp
 * @brief hasplint source file.
 */

#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace hpl {

/**
 * @brief Result of a call bounded by a deadline.
 */
template <typename T>
struct DeadlineOutcome {
    std::optional<T> value;
    bool timedOut = false;
    /// Exception text when the call threw.
    std::string error;
};

/**
 * @brief In-flight call whose result can be awaited until a deadline.
 *
 * The callable runs on its own detached thread and owns everything it
 * captures, so an expired call may finish later without touching the caller.
 * Capture collaborators by shared_ptr, never by reference.
 */
template <typename T>
class DeadlineCall {
public:
    /**
     * @brief Launch @p fn. A launch failure (e.g. no thread available) is
     * reported by await() instead of being thrown here.
     */
    template <typename Fn>
    static DeadlineCall start(Fn fn, std::chrono::milliseconds timeout) {
        auto promise = std::make_shared<std::promise<T>>();
        DeadlineCall call;
        call.future_ = promise->get_future();
        call.deadline_ = std::chrono::steady_clock::now() + timeout;
        try {
            std::thread([promise, fn = std::move(fn)]() mutable {
                try {
                    promise->set_value(fn());
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            }).detach();
        } catch (const std::exception& ex) {
            call.startError_ = std::string("call could not be started: ") + ex.what();
        }
        return call;
    }

    bool started() const noexcept { return startError_.empty(); }

    DeadlineOutcome<T> await() {
        DeadlineOutcome<T> outcome;
        if (!startError_.empty()) {
            outcome.error = startError_;
            return outcome;
        }
        if (future_.wait_until(deadline_) == std::future_status::timeout) {
            outcome.timedOut = true;
            return outcome;
        }
        try {
            outcome.value = future_.get();
        } catch (const std::exception& ex) {
            outcome.error = ex.what();
        } catch (...) {
            outcome.error = "unknown exception";
        }
        return outcome;
    }

private:
    std::future<T> future_;
    std::chrono::steady_clock::time_point deadline_{};
    std::string startError_;
};

} // namespace hpl
