/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include <gtest/gtest.h>
#include "omp/internal/errors.hpp"

using namespace omp::internal;

TEST(ErrorCodes, FixedTable) {
    EXPECT_STREQ(code_for_status(400), "bad_request");
    EXPECT_STREQ(code_for_status(401), "unauthorized");
    EXPECT_STREQ(code_for_status(403), "forbidden");
    EXPECT_STREQ(code_for_status(404), "not_found");
    EXPECT_STREQ(code_for_status(405), "method_not_allowed");
    EXPECT_STREQ(code_for_status(409), "conflict");
    EXPECT_STREQ(code_for_status(413), "payload_too_large");
    EXPECT_STREQ(code_for_status(422), "unprocessable_entity");
    EXPECT_STREQ(code_for_status(429), "rate_limited");
    EXPECT_STREQ(code_for_status(500), "internal_error");
    EXPECT_STREQ(code_for_status(503), "unavailable");
    EXPECT_STREQ(code_for_status(418), "error");
}

TEST(ErrorBody, Shape) {
    EXPECT_EQ(make_error_body(401, "no valid signature"),
              R"({"error":{"code":"unauthorized","message":"no valid signature","status":401}})");
}

TEST(ErrorBody, MessageIsEscaped) {
    EXPECT_EQ(make_error_body(400, "bad \"label\""),
              R"({"error":{"code":"bad_request","message":"bad \"label\"","status":400}})");
}

TEST(ErrorResponse, StatusLineAndType) {
    auto r = make_error(429, "Rate limit exceeded");
    EXPECT_EQ(r.status_code, 429);
    EXPECT_EQ(r.status_text, "Too Many Requests");
    EXPECT_EQ(r.content_type, "application/json");
}
