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
#include <vector>
#include "omp/http_request.hpp"

namespace omp::internal {

struct BaseOptions {
    // Externally visible base URL (reverse proxy), e.g. "https://api.example.com/".
    // Empty = "{scheme}://{Host header or listener authority}/".
    std::string public_base_url;
};

// base_url as the server renders it; always ends with '/'.
std::string rendered_base_url(const omp::HttpRequest& R, const BaseOptions& opt);

// "{METHOD} {base_url without trailing slash}{path}" - tried before the full list.
std::string fast_path_base(const omp::HttpRequest& R, const BaseOptions& opt);

/**
 * Every "{METHOD} {URL}" rendering a client may legitimately have signed,
 * most authoritative first, without duplicates:
 *   1. listener tuple          scheme://listener_host[:port]path
 *   2. composed                base_url (no trailing '/') + path
 *   3. absolute URL            scheme://authority path[?query]
 *   4. raw concatenation       base_url + path  (doubled slash)
 *   5. Host header             scheme://Host path, plus default-port
 *                              stripped / added variants
 *   6. trailing-slash twin of each of the above
 * Pure function of its inputs.
 */
std::vector<std::string> candidate_bases(const omp::HttpRequest& R, const BaseOptions& opt);

} // namespace omp::internal
