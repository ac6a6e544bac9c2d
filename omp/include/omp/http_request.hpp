/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>

namespace omp {

// Plain HTTP request structure as produced by our parser.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // "/objects"
    std::string query;    // "a=1&b=2"
    std::string httpver;  // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers;
    std::string body;

    // Listener side of the connection (filled by the server, not the client).
    std::string   scheme = "http";
    std::string   server_host;      // local address the request arrived on
    std::uint16_t server_port = 0;  // 0 = unknown
};

} // namespace omp
