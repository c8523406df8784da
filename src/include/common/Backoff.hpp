#ifndef SVCLINK_COMMON_BACKOFF_HPP
#define SVCLINK_COMMON_BACKOFF_HPP

#include "common/RetryPolicy.hpp"
#include <chrono>

namespace svclink {

class Backoff {
public:
    explicit Backoff(const RetryPolicy p);
    // Base delay after the given failed attempt (1-indexed), before jitter and clamping.
    [[nodiscard]] std::chrono::microseconds delay(int attempt) const;
private:
    RetryPolicy policy;
};

} // namespace svclink

#endif // SVCLINK_COMMON_BACKOFF_HPP
