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
#ifndef SVCLINK_CLIENT_HTTP_TRANSPORT_HPP
#define SVCLINK_CLIENT_HTTP_TRANSPORT_HPP

#include "common/Error.hpp"
#include <chrono>
#include <expected>
#include <map>
#include <optional>
#include <string>

namespace svclink {

using Headers = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method;
    std::string url;
    Headers headers;
    std::map<std::string, std::string> query;
    std::optional<std::string> body;
    std::chrono::milliseconds timeout;
};

struct HttpResponse {
    int status;
    std::string body;
};

// Sends one request and returns whatever status the peer answered with.
// Connection failures are reported as ServiceUnavailable and an expired
// timeout as Timeout.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::expected<HttpResponse, Error> send(const HttpRequest& request) = 0;
};

} // namespace svclink

#endif // SVCLINK_CLIENT_HTTP_TRANSPORT_HPP
