#ifndef SVCLINK_COMMON_REPEATER_HPP
#define SVCLINK_COMMON_REPEATER_HPP

#include <functional>
#include "common/RetryPolicy.hpp"
#include "common/Backoff.hpp"
#include "common/Jitter.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <type_traits>
#include <expected>
#include <optional>
#include <string>
#include <atomic>
#include <chrono>

namespace svclink {

class Repeater {
public:
    using RetryHook = std::function<void(const std::string& op, int attempt, std::chrono::microseconds delay, const Error& error)>;

    Repeater(const RetryPolicy p, std::atomic<bool>& sc, RetryHook hook = {});

    // Runs operation until it succeeds, fails permanently or runs out of attempts.
    template<typename F>
    std::invoke_result_t<F&> attempt(const std::string& op, const std::string& endpoint, F&& operation) {
        std::optional<Error> last;
        for (int i = 1; i <= policy.maxAttempts; ++i) {
            if (stopCalls.load(std::memory_order_acquire)) {
                return std::unexpected {Error{ErrorCode::Cancelled, "Repeater stopped"}};
            }
            auto result = operation();
            if (result.has_value()) {
                if (i > 1) {
                    spdlog::info("Operation {} succeeded on attempt {}", op, i);
                }
                return result;
            }
            if (!isRetriable(result.error())) {
                return result;
            }
            last = result.error();
            if (i == policy.maxAttempts) {
                break;
            }
            auto delay = nextDelay(i);
            notifyRetry(op, i, delay, result.error());
            if (!sleep(delay)) {
                return std::unexpected {Error{ErrorCode::Cancelled, "Repeater stopped"}};
            }
        }
        return std::unexpected {Error::maxRetriesExceeded(op, endpoint, policy.maxAttempts, last.value())};
    }

    // Jittered delay after the given failed attempt, clamped to maxDelay.
    [[nodiscard]] std::chrono::microseconds nextDelay(int attempt);
    [[nodiscard]] const RetryPolicy& retryPolicy() const;
    void stop() noexcept;
private:
    bool sleep(std::chrono::microseconds delay) const;
    void notifyRetry(const std::string& op, int attempt, std::chrono::microseconds delay, const Error& error) const;

    RetryPolicy policy;
    Backoff backoff;
    Jitter jitter;
    std::atomic<bool>& stopCalls;
    RetryHook onRetry;
};

} // namespace svclink

#endif // SVCLINK_COMMON_REPEATER_HPP
