/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <cstdint>
#include "omp/server_config.hpp"
#include "omp/signature_settings.hpp"
#include "omp/internal/key_resolver.hpp"
#include "omp/internal/verifier.hpp"
#include "omp/internal/policy.hpp"
#include "omp/internal/ratelimit.hpp"
#include "omp/internal/api.hpp"

namespace omp {

// Signature-gated HTTP/1.1 server
class Server {
public:
    // Loads keys from cfg; throws std::runtime_error on unusable key config.
    // remote_keys replaces the Redis fetch when cfg.key_use_redis is set.
    explicit Server(const ServerConfig& cfg, internal::KeyFetch remote_keys = {});
    ~Server();

    // Blocking run: create socket, listen and accept.
    void run();

    // Sets the stop flag and shuts the listening socket down.
    void stop();

    // Port actually bound (differs from cfg.port when that is 0); 0 before listen.
    std::uint16_t port() const { return _bound_port.load(); }

    // Runtime mode switch and key registration.
    SignatureSettings& settings() { return _settings; }
    internal::KeyResolver& keys() { return _keys; }

    // Direct dispatch, no socket involved.
    const internal::ApiHandler& api() const { return _api; }

private:
    ServerConfig _cfg;
    SignatureSettings _settings;
    internal::KeyResolver _keys;
    internal::SignatureVerifier _verifier;
    internal::SignaturePolicy _policy;
    internal::ApiHandler _api;
    internal::TokenBucketMap _ip_rl;
    std::atomic<bool> _stop{false};
    std::atomic<int>  _listen_fd{-1};
    std::atomic<std::uint16_t> _bound_port{0};
    std::atomic<int>  _active_conns{0};

    void load_keys(const internal::KeyFetch& remote_keys);
    void serve_plain();

    // helpers
    int create_listen_socket();
};

} // namespace omp
