#include "common/Backoff.hpp"
#include "common/RetryPolicy.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace svclink {

Backoff::Backoff(const RetryPolicy p)
    : policy {p} {}

std::chrono::microseconds Backoff::delay(int attempt) const {
    if (attempt < 1) {
        throw std::invalid_argument("Attempt must be >= 1.");
    }
    const auto initial = static_cast<double>(policy.initialDelay.count());
    double d = initial;
    switch (policy.strategy) {
        case BackoffStrategy::Exponential:
            d = initial * std::pow(2.0, attempt - 1);
            break;
        case BackoffStrategy::Linear:
            d = initial * attempt;
            break;
        case BackoffStrategy::Constant:
            break;
    }
    // Saturate instead of overflowing the representation for very late attempts.
    constexpr auto limit = static_cast<double>(std::numeric_limits<std::chrono::microseconds::rep>::max() / 2);
    spdlog::debug("Backoff: strategy {}, attempt {}, delay: {}us", toString(policy.strategy), attempt, d);
    return std::chrono::microseconds(static_cast<std::chrono::microseconds::rep>(std::min(d, limit)));
}

} // namespace svclink
