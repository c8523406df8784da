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
#include "common/Util.hpp"
#include <algorithm>
#include <random>
#include <string_view>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <openssl/evp.h>

std::array<uint8_t, 16> generate_uuid_v7() {
    thread_local auto rng = random_generator<>();
    auto dist = std::uniform_int_distribution<unsigned int>{0, 255};

    std::array<uint8_t, 16> uuid{};

    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    auto timestamp = static_cast<uint64_t>(ms);

    // 48-bit big-endian millisecond timestamp
    uuid[0] = static_cast<uint8_t>((timestamp >> 40) & 0xFF);
    uuid[1] = static_cast<uint8_t>((timestamp >> 32) & 0xFF);
    uuid[2] = static_cast<uint8_t>((timestamp >> 24) & 0xFF);
    uuid[3] = static_cast<uint8_t>((timestamp >> 16) & 0xFF);
    uuid[4] = static_cast<uint8_t>((timestamp >> 8) & 0xFF);
    uuid[5] = static_cast<uint8_t>(timestamp & 0xFF);

    for (size_t i = 6; i < 16; ++i) {
        uuid[i] = static_cast<uint8_t>(dist(rng));
    }

    // Version 7
    uuid[6] = (uuid[6] & 0x0F) | 0x70;
    // RFC 9562 variant
    uuid[8] = (uuid[8] & 0x3F) | 0x80;

    return uuid;
}

std::string uuid_v7_to_string(const std::array<uint8_t, 16>& uuid) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(36);
    for (size_t i = 0; i < uuid.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            result.push_back('-');
        }
        result.push_back(digits[uuid[i] >> 4]);
        result.push_back(digits[uuid[i] & 0x0F]);
    }
    return result;
}

std::string svclink_generate_request_id() {
    return uuid_v7_to_string(generate_uuid_v7());
}

std::string svclink_md5_hex(std::string_view data) {
    const std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx {EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw std::runtime_error("MD5 digest failed");
    }
    static constexpr char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i) {
        result.push_back(digits[digest[i] >> 4]);
        result.push_back(digits[digest[i] & 0x0F]);
    }
    return result;
}
