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
#include <utility>
#include <cstddef>
#include <cstdint>
#include "omp/types.hpp"

namespace omp {

struct ServerConfig {
    // Core
    std::string host = "0.0.0.0";
    uint16_t    port = 8080;

    // Externally visible base URL when running behind a reverse proxy,
    // e.g. "https://api.example.com/". Empty = derive from Host / listener.
    std::string public_base_url;

    // Signatures
    SignatureMode sig_mode = SignatureMode::Off;
    std::string   sig_keys_file;                                  // "keyid value" lines
    std::vector<std::pair<std::string, std::string>> sig_keys;    // keyid -> encoded key
    std::string   sig_default_keyid;
    std::string   sig_default_pub;

    // Limits
    size_t max_body = 5u * 1024 * 1024;
    int    rate_limit_per_min = 60;   // per client IP, 0 = disabled

    // Keep-alive
    int  ka_timeout_sec = 5;
    int  ka_max         = 100;

    std::string log_file;
    bool        quiet = false;   // redirect stdout/stderr to /dev/null

    // ---- Redis key source (bulk-loaded at startup) ----
    bool key_use_redis = false;
    struct {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;
        std::string password;
        std::string key_prefix = "omp:sigkey:";
        int         timeout_ms = 200;
    } redis;
};

// Overlay OMP_* environment variables onto cfg. Returns false and fills err
// on the first invalid value.
bool apply_env(ServerConfig& cfg, std::string& err);

// Overlay "--flag value" arguments (argv[0] is skipped). Returns false and
// fills err on an unknown flag, a missing value or an invalid value.
bool apply_args(ServerConfig& cfg, int argc, const char* const* argv, std::string& err);

} // namespace omp
