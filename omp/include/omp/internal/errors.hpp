/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#pragma once
#include <string>
#include "omp/http_response.hpp"

namespace omp::internal {

// Stable machine-readable code for an HTTP status ("bad_request", ...).
const char* code_for_status(int status);

// Reason phrase for the status line.
const char* reason_phrase(int status);

// {"error":{"code":"...","message":"...","status":N}}
std::string make_error_body(int status, const std::string& message);

omp::HttpResponse make_response(int status, std::string body);
omp::HttpResponse make_error(int status, const std::string& message);

} // namespace omp::internal
