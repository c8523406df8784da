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
#ifndef SVCLINK_COMMON_ERROR_HPP
#define SVCLINK_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <memory>
#include <chrono>
#include <optional>
#include <functional>
#include <type_traits>
#include <unordered_set>
#include <proto/error.pb.h>

namespace svclink {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    ServiceUnavailable = 2,
    CircuitOpen = 3,
    GatewayError = 4,
    ClientError = 5,
    InvalidResponse = 6,
    MaxRetriesExceeded = 7,
    ServiceDiscovery = 8,
    InvalidConfiguration = 9,
    KeyNotFound = 10,
    Timeout = 11,
    Internal = 12,
    Cancelled = 13,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::string service;
    std::string endpoint;
    // HTTP status of the response that produced the error, 0 when none was received.
    int status;
    int attempts;
    std::string type;
    std::string correlationId;
    // Last underlying failure for MaxRetriesExceeded.
    std::shared_ptr<const Error> cause;

    Error(const ErrorCode& c, std::string w);
    explicit Error(const ErrorCode& c);
    explicit Error(const proto::ErrorDetails& details);

    static Error circuitOpen(const std::string& service, const std::string& circuit);
    static Error serviceUnavailable(const std::string& service, const std::string& reason, int status = 0);
    static Error gatewayError(const std::string& type, const std::string& message, const std::optional<std::string>& correlationId, int status);
    static Error clientError(int status, const std::string& text);
    static Error maxRetriesExceeded(const std::string& service, const std::string& endpoint, int attempts, const Error& last);
    static Error invalidConfiguration(const std::string& key, const std::string& value, const std::string& message = {});
    static Error timeout(const std::string& service, const std::string& endpoint, std::chrono::milliseconds after);
};

std::ostream& operator<<(std::ostream& os, const Error& error);

extern const std::unordered_set<ErrorCode, ErrorCodeHash> nonRetriableErrorCodes;

// 4xx responses other than 429 are permanent.
bool isRetriable(const Error& error);

} // namespace svclink

#endif // SVCLINK_COMMON_ERROR_HPP
