/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/server_config.hpp"
#include "omp/internal/utils.hpp"

#include <cstdlib>
#include <climits>
#include <cerrno>

namespace omp {

namespace {

const char* env_or_null(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return nullptr;
    return v;
}

bool parse_long(const std::string& s, long lo, long hi, long& out) {
    const std::string t = internal::trim_copy(s);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || !end || *end != '\0') return false;
    if (v < lo || v > hi) return false;
    out = v;
    return true;
}

} // namespace

bool apply_env(ServerConfig& cfg, std::string& err) {
    long n = 0;

    if (const char* v = env_or_null("OMP_SERVER_HOST")) cfg.host = v;

    if (const char* v = env_or_null("OMP_SERVER_PORT")) {
        if (!parse_long(v, 1, 65535, n)) {
            err = std::string("OMP_SERVER_PORT: invalid port '") + v + "'";
            return false;
        }
        cfg.port = static_cast<uint16_t>(n);
    }

    if (const char* v = env_or_null("OMP_SIG_MODE")) {
        if (!parse_signature_mode(v, cfg.sig_mode)) {
            err = std::string("OMP_SIG_MODE: unknown mode '") + v + "' (off|permissive|strict)";
            return false;
        }
    }

    if (const char* v = env_or_null("OMP_SIG_KEYID"))       cfg.sig_default_keyid = v;
    if (const char* v = env_or_null("OMP_SIG_ED25519_PUB")) cfg.sig_default_pub = v;
    if (const char* v = env_or_null("OMP_SIG_KEYS_FILE"))   cfg.sig_keys_file = v;
    if (const char* v = env_or_null("OMP_PUBLIC_BASE_URL")) cfg.public_base_url = v;

    if (const char* v = env_or_null("OMP_MAX_PAYLOAD_MB")) {
        if (!parse_long(v, 1, 4096, n)) {
            err = std::string("OMP_MAX_PAYLOAD_MB: invalid size '") + v + "'";
            return false;
        }
        cfg.max_body = static_cast<size_t>(n) * 1024 * 1024;
    }

    if (const char* v = env_or_null("OMP_RATE_LIMIT")) {
        if (!parse_long(v, 0, INT_MAX, n)) {
            err = std::string("OMP_RATE_LIMIT: invalid value '") + v + "'";
            return false;
        }
        cfg.rate_limit_per_min = static_cast<int>(n);
    }

    if (const char* v = env_or_null("OMP_LOG_FILE")) cfg.log_file = v;

    return true;
}

bool apply_args(ServerConfig& cfg, int argc, const char* const* argv, std::string& err) {
    auto to_int = [](const char* s, long lo, long hi, int& out) {
        long v = 0;
        if (!parse_long(s, lo, hi, v)) return false;
        out = static_cast<int>(v);
        return true;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        const bool has = (i + 1 < argc);
        int n = 0;
        bool ok = true;

        if (a == "--host" && has) cfg.host = argv[++i];
        else if (a == "--port" && has) { ok = to_int(argv[++i], 1, 65535, n); cfg.port = static_cast<uint16_t>(n); }
        else if (a == "--mode" && has) ok = parse_signature_mode(argv[++i], cfg.sig_mode);
        else if (a == "--keyid" && has) cfg.sig_default_keyid = argv[++i];
        else if (a == "--pub" && has) cfg.sig_default_pub = argv[++i];
        else if (a == "--sig_key" && has) {
            const std::string kv = argv[++i];
            const std::size_t eq = kv.find('=');
            ok = (eq != std::string::npos && eq > 0 && eq + 1 < kv.size());
            if (ok) cfg.sig_keys.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        }
        else if (a == "--sig_keys_file" && has) cfg.sig_keys_file = argv[++i];
        else if (a == "--public_base_url" && has) cfg.public_base_url = argv[++i];
        else if (a == "--max_payload_mb" && has) { ok = to_int(argv[++i], 1, 4096, n); cfg.max_body = static_cast<size_t>(n) * 1024 * 1024; }
        else if (a == "--rate_limit" && has) ok = to_int(argv[++i], 0, INT_MAX, cfg.rate_limit_per_min);
        else if (a == "--ka_timeout" && has) ok = to_int(argv[++i], 1, 3600, cfg.ka_timeout_sec);
        else if (a == "--ka_max" && has) ok = to_int(argv[++i], 1, 100000, cfg.ka_max);
        else if (a == "--log_file" && has) cfg.log_file = argv[++i];
        else if (a == "--quiet" && has) { ok = to_int(argv[++i], 0, 1, n); cfg.quiet = (n != 0); }

        // Redis key source flags
        else if (a == "--key_redis" && has) { ok = to_int(argv[++i], 0, 1, n); cfg.key_use_redis = (n != 0); }
        else if (a == "--redis_host" && has) cfg.redis.host = argv[++i];
        else if (a == "--redis_port" && has) ok = to_int(argv[++i], 1, 65535, cfg.redis.port);
        else if (a == "--redis_db" && has)   ok = to_int(argv[++i], 0, 1024, cfg.redis.db);
        else if (a == "--redis_password" && has) cfg.redis.password = argv[++i];
        else if (a == "--redis_prefix" && has)   cfg.redis.key_prefix = argv[++i];
        else if (a == "--redis_timeout_ms" && has) ok = to_int(argv[++i], 1, 60000, cfg.redis.timeout_ms);

        else {
            err = "unknown option or missing value: " + a;
            return false;
        }

        if (!ok) {
            err = "invalid value for " + a + ": " + argv[i];
            return false;
        }
    }
    return true;
}

} // namespace omp
