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
#ifndef FAKE_TRANSPORT_HPP
#define FAKE_TRANSPORT_HPP

#include "client/HttpTransport.hpp"
#include "common/Error.hpp"
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Scripted HttpTransport. Queued replies are served first, in order; after
// that the handler answers, and without a handler every call gets 200 "{}".
class FakeTransport : public svclink::HttpTransport {
public:
    using Reply = std::expected<svclink::HttpResponse, svclink::Error>;
    using Handler = std::function<Reply(const svclink::HttpRequest&)>;

    void enqueue(Reply reply) {
        std::lock_guard lock {m};
        replies.push_back(std::move(reply));
    }

    void enqueue(int status, std::string body) {
        enqueue(svclink::HttpResponse {status, std::move(body)});
    }

    void onRequest(Handler h) {
        std::lock_guard lock {m};
        handler = std::move(h);
    }

    Reply send(const svclink::HttpRequest& request) override {
        Handler h;
        {
            std::lock_guard lock {m};
            sent.push_back(request);
            if (!replies.empty()) {
                auto reply = std::move(replies.front());
                replies.pop_front();
                return reply;
            }
            h = handler;
        }
        if (h) {
            return h(request);
        }
        return svclink::HttpResponse {200, "{}"};
    }

    std::vector<svclink::HttpRequest> requests() const {
        std::lock_guard lock {m};
        return sent;
    }

    std::size_t count() const {
        std::lock_guard lock {m};
        return sent.size();
    }

    // Requests whose URL contains the fragment.
    std::size_t count(const std::string& fragment) const {
        std::lock_guard lock {m};
        std::size_t n = 0;
        for (const auto& r : sent) {
            if (r.url.find(fragment) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }
private:
    mutable std::mutex m;
    std::deque<Reply> replies;
    Handler handler;
    std::vector<svclink::HttpRequest> sent;
};

#endif // FAKE_TRANSPORT_HPP
