/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/server.hpp"
#include "omp/log.hpp"
#include "omp/internal/redis_keys.hpp"

#include <stdexcept>
#include <string>
#include <cstring>
#include <cstdio>
#include <cerrno>
#include <thread>
#include <chrono>

#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace omp::internal {

// Handles a single plain HTTP connection (keep-alive is managed inside).
void handle_connection_plain(int fd,
                             const omp::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const ApiHandler& api,
                             TokenBucketMap& ip_rl);

} // namespace omp::internal

namespace omp {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

static std::uint16_t bound_port(int s, std::uint16_t fallback) {
    sockaddr_storage ss{};
    socklen_t sl = sizeof(ss);
    if (::getsockname(s, reinterpret_cast<sockaddr*>(&ss), &sl) != 0) return fallback;
    if (ss.ss_family == AF_INET)  return ntohs(reinterpret_cast<const sockaddr_in*>(&ss)->sin_port);
    if (ss.ss_family == AF_INET6) return ntohs(reinterpret_cast<const sockaddr_in6*>(&ss)->sin6_port);
    return fallback;
}

// ---------- Server impl ----------

Server::Server(const ServerConfig& cfg, internal::KeyFetch remote_keys)
    : _cfg(cfg),
      _settings(cfg.sig_mode),
      _verifier(_keys, internal::BaseOptions{cfg.public_base_url}),
      _policy(_settings, _verifier),
      _api(_cfg, _settings, _policy)
{
    if (!_cfg.log_file.empty()) set_log_file(_cfg.log_file);
    load_keys(remote_keys);
}

Server::~Server() {
    stop();
    // Connection threads are detached but borrow this object.
    while (_active_conns.load() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void Server::load_keys(const internal::KeyFetch& remote_keys) {
    for (const auto& kv : _cfg.sig_keys) {
        if (!_keys.add_named_key(kv.first, kv.second)) {
            throw std::runtime_error("invalid public key for keyid '" + kv.first + "'");
        }
    }

    if (!_cfg.sig_keys_file.empty() && !_keys.load_file(_cfg.sig_keys_file)) {
        throw std::runtime_error("failed to load keys file: " + _cfg.sig_keys_file);
    }

    if (_cfg.key_use_redis) {
        internal::KeyFetch fetch = remote_keys;
        if (!fetch) {
            internal::RedisKeySource::Options ropt;
            ropt.host       = _cfg.redis.host;
            ropt.port       = _cfg.redis.port;
            ropt.db         = _cfg.redis.db;
            ropt.password   = _cfg.redis.password;
            ropt.key_prefix = _cfg.redis.key_prefix;
            ropt.timeout_ms = _cfg.redis.timeout_ms;
            internal::RedisKeySource src(ropt);
            fetch = [src](internal::KeyEntries& out) { return src.fetch_all(out); };
        }
        const std::string where = "redis " + _cfg.redis.host + ":" + std::to_string(_cfg.redis.port);
        if (!_keys.load_from(fetch, where)) {
            throw std::runtime_error("failed to load keys from " + where);
        }
    }

    if (!_cfg.sig_default_pub.empty()) {
        if (_cfg.sig_default_keyid.empty()) {
            throw std::runtime_error("default public key given without a keyid");
        }
        if (!_keys.set_default_key(_cfg.sig_default_keyid, _cfg.sig_default_pub)) {
            throw std::runtime_error("invalid default public key (need 32 bytes hex/base64url/base64)");
        }
    }

    if (_cfg.sig_mode == SignatureMode::Strict &&
        _keys.named_size() == 0 && _cfg.sig_default_pub.empty()) {
        omp::log_line("[WARN] strict mode without configured keys: only registered keys will verify");
    }
}

void Server::stop() {
    _stop.store(true, std::memory_order_relaxed);
    const int fd = _listen_fd.exchange(-1);
    if (fd >= 0) {
        // Unblocks accept(); serve_plain() owns the close.
        ::shutdown(fd, SHUT_RDWR);
    }
}

int Server::create_listen_socket() {
    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags    = AI_PASSIVE;

    addrinfo* res = nullptr;
    const std::string port = std::to_string(_cfg.port);
    const char* node = _cfg.host.empty() ? nullptr : _cfg.host.c_str();
    int rc = ::getaddrinfo(node, port.c_str(), &hints, &res);
    if (rc != 0 || !res) {
        omp::log_line(std::string("[FATAL] getaddrinfo(") + _cfg.host + ") failed: " + gai_strerror(rc));
        throw std::runtime_error("getaddrinfo() failed");
    }

    int srv = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (srv < 0) {
        ::freeaddrinfo(res);
        omp::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    if (::bind(srv, res->ai_addr, res->ai_addrlen) < 0) {
        omp::log_line(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::freeaddrinfo(res);
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    ::freeaddrinfo(res);

    if (::listen(srv, 512) < 0) {
        omp::log_line(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }
    return srv;
}

void Server::run() {
    omp::log_line("[INFO] OMPGate server starting...");
    omp::log_line(std::string("[INFO] Signature mode: ") + to_string(_settings.mode()));
    omp::log_line("[INFO] Listen: " + _cfg.host + ":" + std::to_string(_cfg.port));
    if (!_cfg.public_base_url.empty()) {
        omp::log_line("[INFO] Public base URL: " + _cfg.public_base_url);
    }
    omp::log_line("[INFO] Keys: named=" + std::to_string(_keys.named_size()) +
                  (_cfg.sig_default_keyid.empty() ? std::string() : " default=" + _cfg.sig_default_keyid));
    if (_cfg.rate_limit_per_min > 0) {
        omp::log_line("[INFO] RL-IP: " + std::to_string(_cfg.rate_limit_per_min) + "/min");
    }
    omp::log_line("[INFO] Max body: " + std::to_string(_cfg.max_body) + " bytes");
    omp::log_line("[INFO] KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                  "s, KA max=" + std::to_string(_cfg.ka_max));

    serve_plain();
}

void Server::serve_plain() {
    int srv = create_listen_socket();
    _listen_fd.store(srv);
    _bound_port.store(bound_port(srv, _cfg.port));
    omp::log_line("[INFO] Listening HTTP on " + _cfg.host + ":" + std::to_string(port()));

    auto last_prune = std::chrono::steady_clock::now();
    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (_stop.load(std::memory_order_relaxed)) break;
            // transient error; continue
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        const auto now = std::chrono::steady_clock::now();
        if (now - last_prune > std::chrono::minutes(5)) {
            _ip_rl.prune(std::chrono::minutes(5));
            last_prune = now;
        }

        // Detach a per-connection handler; it will manage the fd lifetime.
        _active_conns.fetch_add(1);
        std::thread([this, fd, peer]() {
            internal::handle_connection_plain(fd, this->_cfg, peer, this->_api, this->_ip_rl);
            this->_active_conns.fetch_sub(1);
        }).detach();
    }

    ::close(srv);
    omp::log_line("[INFO] Listener closed");
}

} // namespace omp
