#include "client/HttplibTransport.hpp"
#include "common/Error.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <optional>
#include <string>

namespace svclink {

std::optional<UrlParts> splitUrl(const std::string& url) {
    const auto scheme = url.find("://");
    if (scheme == std::string::npos || scheme == 0) {
        return std::nullopt;
    }
    const auto hostStart = scheme + 3;
    const auto pathStart = url.find('/', hostStart);
    if (pathStart == hostStart || hostStart == url.size()) {
        return std::nullopt;
    }
    if (pathStart == std::string::npos) {
        return UrlParts {url, "/"};
    }
    return UrlParts {url.substr(0, pathStart), url.substr(pathStart)};
}

std::expected<HttpResponse, Error> HttplibTransport::send(const HttpRequest& request) {
    auto parts = splitUrl(request.url);
    if (!parts.has_value()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Malformed URL '" + request.url + "'"}};
    }
    httplib::Client client {parts.value().base};
    if (!client.is_valid()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Unsupported URL '" + request.url + "'"}};
    }
    client.set_connection_timeout(request.timeout);
    client.set_read_timeout(request.timeout);
    client.set_write_timeout(request.timeout);

    httplib::Request req;
    req.method = request.method;
    const httplib::Params params(request.query.begin(), request.query.end());
    req.path = httplib::append_query_params(parts.value().path, params);
    for (const auto& [name, value] : request.headers) {
        req.set_header(name, value);
    }
    if (request.body.has_value()) {
        req.body = request.body.value();
    }

    const auto started = std::chrono::steady_clock::now();
    auto result = client.send(req);
    if (!result) {
        const auto err = result.error();
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        spdlog::debug("{} {} failed after {} ms: {}", request.method, request.url, elapsed.count(), httplib::to_string(err));
        // httplib reports an expired socket timeout as a plain connect, read or write
        // error; poll may wake slightly early, hence the slack.
        const bool ioError = err == httplib::Error::Connection || err == httplib::Error::Read || err == httplib::Error::Write;
        if (ioError && elapsed >= request.timeout - request.timeout / 10) {
            return std::unexpected {Error {ErrorCode::Timeout, "Request to " + request.url + " timed out after " + std::to_string(request.timeout.count()) + " ms"}};
        }
        return std::unexpected {Error {ErrorCode::ServiceUnavailable, "Could not reach " + parts.value().base + ": " + httplib::to_string(err)}};
    }
    return HttpResponse {result->status, result->body};
}

} // namespace svclink
