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
#include <cstdint>

namespace omp {

// Public client configuration. Per-instance; thread-safe at call level.
struct ClientConfig {
    // Endpoint
    std::string   host = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string   base_path = "";   // optional path prefix, e.g. "/api"

    // Signing. An empty seed sends unsigned requests.
    std::string keyid = "sig1";
    std::string seed_b64u;          // 32-byte Ed25519 seed, base64url
    std::string label = "sig1";     // Signature-Input / Signature label

    // Timeouts
    int connect_timeout_sec = 5;   // TCP connect timeout
    int io_timeout_sec      = 10;  // recv/send timeout
    int ka_max              = 100; // max requests per connection before re-open

    // Logging (empty = stdout only)
    std::string log_file;
};

} // namespace omp
