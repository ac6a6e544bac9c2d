/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/server_config.hpp"
#include "omp/http_request.hpp"
#include "omp/http_response.hpp"
#include "omp/internal/api.hpp"
#include "omp/internal/errors.hpp"
#include "omp/internal/http_parser.hpp"
#include "omp/internal/ratelimit.hpp"
#include "omp/internal/utils.hpp"
#include "omp/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <algorithm>

namespace omp::internal {

namespace {

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

enum class RecvStatus { Ok, Closed, BadRequest, HeadersTooLarge, BodyTooLarge };

// --- HTTP/1.1 keep-alive helpers ---

bool is_http11(const std::string& ver) {
    return ver == "HTTP/1.1";
}

bool should_keep_alive(const omp::HttpRequest& R) {
    std::string conn = lower_copy(hdr_ci(R, "Connection"));
    if (is_http11(R.httpver)) {
        return (conn != "close");
    } else {
        return (conn == "keep-alive");
    }
}

// --- I/O helpers ---

bool send_all(int fd, const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

bool send_http_resp(int fd,
                    const omp::ServerConfig& cfg,
                    const omp::HttpResponse& resp,
                    bool keep_alive)
{
    std::ostringstream oss;
    oss << "HTTP/1.1 " << resp.status_code << " "
        << (resp.status_text.empty() ? reason_phrase(resp.status_code) : resp.status_text.c_str())
        << "\r\n";
    oss << "Content-Type: " << resp.content_type << "\r\n";
    for (const auto& kv : resp.headers) {
        oss << kv.first << ": " << kv.second << "\r\n";
    }
    oss << "Content-Length: " << resp.body.size() << "\r\n";
    if (keep_alive) {
        oss << "Connection: keep-alive\r\n";
        oss << "Keep-Alive: timeout=" << cfg.ka_timeout_sec
            << ", max=" << cfg.ka_max << "\r\n";
    } else {
        oss << "Connection: close\r\n";
    }
    oss << "\r\n";
    const std::string h = oss.str();
    if (!send_all(fd, h.data(), h.size())) return false;
    return send_all(fd, resp.body.data(), resp.body.size());
}

// Stop sending, then read off what the client already queued so that close()
// does not reset the connection before the error response is read.
void linger_close(int fd) {
    ::shutdown(fd, SHUT_WR);
    char buf[4096];
    std::size_t drained = 0;
    while (drained < 1024 * 1024) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        drained += static_cast<std::size_t>(n);
    }
}

// Local address of the accepted socket: the listener tuple used when
// rebuilding the URL a client signed.
void fill_listener(int fd, omp::HttpRequest& R) {
    sockaddr_storage ss{};
    socklen_t sl = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &sl) != 0) return;
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
        R.server_port = ntohs(a->sin_port);
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
        R.server_port = ntohs(a->sin6_port);
    } else {
        return;
    }
    R.server_host = buf;
}

RecvStatus recv_http_request(int fd,
                             const omp::ServerConfig& cfg,
                             omp::HttpRequest& R)
{
    // Read headers
    std::string req;
    req.reserve(4096);
    char buf[4096];
    while (true) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return RecvStatus::Closed;
        req.append(buf, buf + n);
        if (req.find("\r\n\r\n") != std::string::npos) break;
        if (req.size() > kMaxHeaderBytes) return RecvStatus::HeadersTooLarge;
    }
    std::size_t hdr_end = req.find("\r\n\r\n");
    if (hdr_end > kMaxHeaderBytes) return RecvStatus::HeadersTooLarge;
    std::string hdrs = req.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    std::string first = hdrs.substr(0, line_end);
    if (!parse_request_line(first, R)) return RecvStatus::BadRequest;

    R.headers.clear();
    if (line_end != std::string::npos) {
        parse_header_lines(hdrs.substr(line_end + 2), R.headers);
    }
    R.scheme = "http";
    fill_listener(fd, R);

    std::size_t content_len = 0;
    const std::string cl = trim_copy(hdr_ci(R, "Content-Length"));
    if (!cl.empty()) {
        errno = 0;
        char* end = nullptr;
        unsigned long long v = std::strtoull(cl.c_str(), &end, 10);
        if (errno != 0 || !end || *end != '\0' || cl[0] == '-') return RecvStatus::BadRequest;
        if (v > cfg.max_body) return RecvStatus::BodyTooLarge;
        content_len = static_cast<std::size_t>(v);
    }

    R.body.clear();
    if (hdr_end + 4 < req.size()) {
        const char* p = req.data() + hdr_end + 4;
        std::size_t have = req.size() - (hdr_end + 4);
        R.body.assign(p, p + std::min(have, content_len));
    }
    while (R.body.size() < content_len) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return RecvStatus::Closed;
        std::size_t need = content_len - R.body.size();
        R.body.append(buf, buf + std::min<std::size_t>(static_cast<std::size_t>(n), need));
    }
    return RecvStatus::Ok;
}

} // namespace

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const omp::ServerConfig& cfg,
                             const std::string& peer_ip,
                             const ApiHandler& api,
                             TokenBucketMap& ip_rl)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    int served = 0;
    while (served < cfg.ka_max) {
        omp::HttpRequest R;
        const RecvStatus st = recv_http_request(fd, cfg, R);
        if (st == RecvStatus::Closed) break;
        if (st != RecvStatus::Ok) {
            // The rest of the stream cannot be trusted; answer and close.
            const int sc = (st == RecvStatus::BodyTooLarge) ? 413
                         : (st == RecvStatus::HeadersTooLarge) ? 431 : 400;
            const char* msg = (st == RecvStatus::BodyTooLarge) ? "Payload too large"
                            : (st == RecvStatus::HeadersTooLarge) ? "Request headers too large"
                            : "Malformed HTTP request";
            omp::log_line("[" + std::to_string(sc) + "] ip=" + peer_ip + " reason=" + msg);
            if (send_http_resp(fd, cfg, make_error(sc, msg), false)) linger_close(fd);
            break;
        }

        bool ka = should_keep_alive(R) && (served + 1 < cfg.ka_max);

        if (!ip_rl.allow_per_minute(peer_ip, cfg.rate_limit_per_min)) {
            omp::log_line(std::string("[429] ip=") + peer_ip + " reason=IP_RATE_LIMIT");
            if (!send_http_resp(fd, cfg, make_error(429, "Rate limit exceeded"), ka)) break;
            ++served;
            if (!ka) break;
            continue;
        }

        const omp::HttpResponse resp = api.handle(R, peer_ip);
        if (!send_http_resp(fd, cfg, resp, ka)) break;
        ++served;
        if (!ka) break;
    }
    ::close(fd);
}

} // namespace omp::internal
