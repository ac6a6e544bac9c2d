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
#include <unordered_map>
#include "omp/http_request.hpp"

namespace omp::internal {

using HeaderMap = std::unordered_map<std::string, std::string>;

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, omp::HttpRequest& r);

// Parse "Name: value" lines separated by CRLF. A repeated header name
// (compared case-insensitively) is folded into one value joined by ", ".
void parse_header_lines(const std::string& block, HeaderMap& out);

// Case-insensitive header lookup
std::string hdr_ci(const HeaderMap& H, const char* name);
std::string hdr_ci(const omp::HttpRequest& R, const char* name);

} // namespace omp::internal
