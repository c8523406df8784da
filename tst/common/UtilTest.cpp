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
#include <gtest/gtest.h>
#include <set>
#include <string>
#include "common/Util.hpp"

TEST(UtilTest, RequestIdIsCanonicalUuidV7) {
    const auto id = svclink_generate_request_id();
    ASSERT_EQ(id.size(), 36U);
    EXPECT_EQ(id[8], '-');
    EXPECT_EQ(id[13], '-');
    EXPECT_EQ(id[18], '-');
    EXPECT_EQ(id[23], '-');
    EXPECT_EQ(id[14], '7');
    EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
}

TEST(UtilTest, RequestIdsAreUnique) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(svclink_generate_request_id());
    }
    EXPECT_EQ(ids.size(), 1000U);
}

TEST(UtilTest, Md5KnownDigests) {
    EXPECT_EQ(svclink_md5_hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(svclink_md5_hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
}
