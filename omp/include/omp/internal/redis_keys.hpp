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
#include <utility>
#include <vector>

// hiredis types live in the global namespace; include the header here
#include <hiredis/hiredis.h>

namespace omp::internal {

/**
 * Redis source of encoded public keys, stored as <prefix><keyid> strings.
 * Used once at setup to bulk-load named keys; nothing here runs while
 * requests are being verified.
 */
class RedisKeySource {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;                     // SELECT db
        std::string password;                     // optional
        std::string key_prefix = "omp:sigkey:";   // key = key_prefix + keyid
        int         timeout_ms = 200;             // connect + command timeout
    };

    explicit RedisKeySource(Options opt);

    // Collect every "<prefix>*" string value as (keyid, value). Returns false
    // on connection or protocol errors; out is then left empty.
    bool fetch_all(std::vector<std::pair<std::string, std::string>>& out) const;

private:
    Options _opt;

    ::redisContext* connect() const;
    bool auth_and_select(::redisContext* ctx) const;
};

// Escape glob metacharacters so a key prefix can be used in SCAN MATCH.
std::string redis_match_pattern(const std::string& prefix);

} // namespace omp::internal
