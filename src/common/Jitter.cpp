#include "common/Jitter.hpp"
#include <chrono>
#include <stdexcept>
#include <random>
#include <mutex>
#include <cmath>
#include "common/Util.hpp"

namespace svclink {

Jitter::Jitter() : rng(random_generator()) {}

std::chrono::microseconds Jitter::jitter(const std::chrono::microseconds v) {
    if (v < std::chrono::microseconds(0)) {
        throw std::invalid_argument("Negative duration is not supported");
    }
    const auto base = static_cast<double>(v.count());
    std::uniform_real_distribution<double> dist(0.1, 0.3);
    double fraction = 0.0;
    {
        std::lock_guard lock {m};
        fraction = dist(rng);
    }
    return v + std::chrono::microseconds(std::llround(base * fraction));
}

} // namespace svclink
