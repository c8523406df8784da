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
#include <gtest/gtest.h>
#include "common/Error.hpp"
#include <expected>
#include <stdexcept>
#include <tuple>
#include "common/ErrorConverter.hpp"
#include <grpcpp/support/status.h>

using svclink::ErrorCode;
using svclink::Error;
using svclink::toGrpcStatusCode;
using svclink::toGrpcStatus;
using svclink::toError;
using svclink::toExpected;

TEST(ErrorConverterTest, ToGrpcStatusCodeMapping) {
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::KeyNotFound), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::InvalidArg), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::ServiceUnavailable), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Timeout), grpc::StatusCode::DEADLINE_EXCEEDED);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Cancelled), grpc::StatusCode::CANCELLED);
    EXPECT_EQ(toGrpcStatusCode(ErrorCode::Unknown), grpc::StatusCode::UNKNOWN);
}

TEST(ErrorConverterTest, DetailsSurviveTheRoundTrip) {
    auto err = Error::serviceUnavailable("orders", "down", 503);
    err.endpoint = "/api/orders";
    const grpc::Status status = toGrpcStatus(err);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_EQ(status.error_message(), err.what);
    const Error back = toError(status);
    EXPECT_EQ(back.code, ErrorCode::ServiceUnavailable);
    EXPECT_EQ(back.what, err.what);
    EXPECT_EQ(back.service, "orders");
    EXPECT_EQ(back.endpoint, "/api/orders");
    EXPECT_EQ(back.status, 503);
}

TEST(ErrorConverterTest, ToGrpcStatusFromExpected) {
    const std::expected<int, Error> ok = 42;
    const std::expected<int, Error> err = std::unexpected(Error(ErrorCode::InvalidArg, "bad arg"));
    EXPECT_EQ(toGrpcStatus(ok).error_code(), grpc::StatusCode::OK);
    const grpc::Status status = toGrpcStatus(err);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
    EXPECT_EQ(status.error_message(), "bad arg");
}

TEST(ErrorConverterTest, ToErrorWithoutDetailsFallsBackOnStatusCode) {
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::NOT_FOUND, "nf")).code, ErrorCode::KeyNotFound);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "inv")).code, ErrorCode::InvalidArg);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::UNAVAILABLE, "unavail")).code, ErrorCode::ServiceUnavailable);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::DEADLINE_EXCEEDED, "late")).code, ErrorCode::Timeout);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::CANCELLED, "gone")).code, ErrorCode::Cancelled);
    EXPECT_EQ(toError(grpc::Status(grpc::StatusCode::INTERNAL, "oops")).code, ErrorCode::Internal);
    const Error unknown = toError(grpc::Status(grpc::StatusCode::UNKNOWN, "unk"));
    EXPECT_EQ(unknown.code, ErrorCode::Unknown);
    EXPECT_EQ(unknown.what, "unk");
}

TEST(ErrorConverterTest, ToErrorRejectsOk) {
    EXPECT_THROW(std::ignore = toError(grpc::Status::OK), std::logic_error);
}

TEST(ErrorConverterTest, ToExpectedValueAndError) {
    const grpc::Status ok(grpc::StatusCode::OK, "");
    const grpc::Status err(grpc::StatusCode::INVALID_ARGUMENT, "bad");
    auto v = toExpected(ok, 123);
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v.value(), 123);
    auto e = toExpected(err, 123);
    ASSERT_FALSE(e.has_value());
    EXPECT_EQ(e.error().code, ErrorCode::InvalidArg);
    EXPECT_TRUE(toExpected(ok).has_value());
}
