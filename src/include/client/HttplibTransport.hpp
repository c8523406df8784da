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
#ifndef SVCLINK_CLIENT_HTTPLIB_TRANSPORT_HPP
#define SVCLINK_CLIENT_HTTPLIB_TRANSPORT_HPP

#include "client/HttpTransport.hpp"
#include "common/Error.hpp"
#include <expected>
#include <optional>
#include <string>

namespace svclink {

struct UrlParts {
    // scheme://host[:port]
    std::string base;
    // Starts with '/'.
    std::string path;
};

// Splits an absolute http(s) URL; empty when there is no scheme or host.
std::optional<UrlParts> splitUrl(const std::string& url);

// HttpTransport over cpp-httplib. Every send opens its own connection, so one
// instance may be shared by concurrent callers. The request timeout bounds the
// connect, the write and the read separately.
class HttplibTransport : public HttpTransport {
public:
    std::expected<HttpResponse, Error> send(const HttpRequest& request) override;
};

} // namespace svclink

#endif // SVCLINK_CLIENT_HTTPLIB_TRANSPORT_HPP
