/*
 * SVCLINK resilient service-to-service calls through an API gateway.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef SVCLINK_COMMON_JITTER_HPP
#define SVCLINK_COMMON_JITTER_HPP

#include <random>
#include <chrono>
#include <mutex>

namespace svclink {

// Adds a uniformly drawn 10% to 30% of the input on top of it.
class Jitter {
public:
    Jitter();
    std::chrono::microseconds jitter(const std::chrono::microseconds v);
private:
    std::mutex m;
    std::mt19937 rng;
};

} // namespace svclink

#endif // SVCLINK_COMMON_JITTER_HPP
