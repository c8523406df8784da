// SPDX-License-Identifier: AGPL-3.0-or-later
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
#include <csignal>
#include <chrono>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "cache/InMemoryCacheStore.hpp"
#include "server/CacheStoreServer.hpp"

using svclink::InMemoryCacheStore;
using svclink::CacheStoreServer;

namespace {

volatile std::sig_atomic_t stopRequested = 0;

void onSignal(int /*signal*/) {
    stopRequested = 1;
}

} // namespace

int main(int argc, char** argv) {
    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/svclink.txt", 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "svclink", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);

    const std::string listenAddress {argc > 1 ? argv[1] : "0.0.0.0:50051"};

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    int result = 0;
    try {
        InMemoryCacheStore store {};
        CacheStoreServer server {listenAddress, store, std::chrono::seconds{2}};
        spdlog::info("svclink cache server ready on {}", server.address());
        while (stopRequested == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100L});
        }
        spdlog::info("Shutting down cache server");
        server.shutdown();
    } catch (const std::exception& e) {
        spdlog::error("Cache server failed: {}", e.what());
        result = 1;
    }
    spdlog::shutdown();
    return result;
}
