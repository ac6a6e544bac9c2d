/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/http_low.hpp"
#include "omp/internal/http_parser.hpp"
#include "omp/internal/utils.hpp"
#include "omp/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <fcntl.h>
#include <poll.h>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <algorithm>

namespace omp::internal {

TcpConn::~TcpConn() { close(); }

bool TcpConn::open(const omp::ClientConfig& cfg) {
    close();

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    int rc = getaddrinfo(cfg.host.c_str(), std::to_string(cfg.port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        omp::log_line(std::string("[TCP] getaddrinfo failed: ") + gai_strerror(rc));
        return false;
    }

    const int connect_timeout_ms = std::max(1, cfg.connect_timeout_sec) * 1000;

    int s_ok = -1;
    for (auto* p = res; p; p = p->ai_next) {
        int s = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
        if (s < 0) continue;

        // Non-blocking for a bounded-time connect
        int flags = fcntl(s, F_GETFL, 0);
        if (flags < 0 || fcntl(s, F_SETFL, flags | O_NONBLOCK) < 0) { ::close(s); continue; }

        int ret = ::connect(s, p->ai_addr, p->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) { ::close(s); continue; }
        if (ret < 0) {
            pollfd pfd{};
            pfd.fd     = s;
            pfd.events = POLLOUT;
            int pr = ::poll(&pfd, 1, connect_timeout_ms);
            if (pr <= 0 || !(pfd.revents & POLLOUT)) { ::close(s); continue; }

            int soerr = 0;
            socklen_t slen = sizeof(soerr);
            if (getsockopt(s, SOL_SOCKET, SO_ERROR, &soerr, &slen) < 0 || soerr != 0) {
                ::close(s);
                continue;
            }
        }

        // Back to blocking mode; SO_*TIMEO bounds each I/O call
        (void)fcntl(s, F_SETFL, flags);

        int one = 1;
        setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        timeval tv{cfg.io_timeout_sec, 0};
        setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        s_ok = s;
        break;
    }
    freeaddrinfo(res);

    if (s_ok < 0) {
        omp::log_line("[TCP] connect to " + cfg.host + ":" + std::to_string(cfg.port) +
                      " failed (timed out or refused)");
        return false;
    }
    _fd = s_ok;
    return true;
}

void TcpConn::close() {
    if (_fd >= 0) { ::close(_fd); _fd = -1; }
}

bool TcpConn::send_all(const char* d, std::size_t len) {
    std::size_t off = 0;
    while (off < len) {
        ssize_t n = ::send(_fd, d + off, len - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

bool TcpConn::recv_some(std::string& out, std::size_t max_chunk) {
    char buf[4096];
    ssize_t n = ::recv(_fd, buf, std::min(sizeof(buf), max_chunk), 0);
    if (n <= 0) return false;
    out.append(buf, buf + n);
    return true;
}

bool TcpConn::recv_until(std::string& out, const std::string& delim, std::size_t max_total) {
    while (out.find(delim) == std::string::npos) {
        if (!recv_some(out, 4096)) return false;
        if (out.size() > max_total) return false;
    }
    return true;
}

bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers)
{
    std::size_t hdr_end = head_and_maybe_body.find("\r\n\r\n");
    if (hdr_end == std::string::npos) return false;
    hdr_end_off = hdr_end + 4;

    const std::string hdrs = head_and_maybe_body.substr(0, hdr_end);
    std::size_t line_end = hdrs.find("\r\n");
    const std::string status = hdrs.substr(0, line_end);

    // "HTTP/1.1 200 OK"
    std::size_t sp1 = status.find(' ');
    if (sp1 == std::string::npos || status.compare(0, 5, "HTTP/") != 0) return false;
    std::size_t sp2 = status.find(' ', sp1 + 1);
    const std::string code = status.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
    if (code.size() != 3 || !std::all_of(code.begin(), code.end(),
                                               [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
    status_code = std::atoi(code.c_str());
    status_text = (sp2 == std::string::npos) ? std::string() : status.substr(sp2 + 1);

    headers.clear();
    if (line_end != std::string::npos) {
        parse_header_lines(hdrs.substr(line_end + 2), headers);
    }
    return true;
}

} // namespace omp::internal
