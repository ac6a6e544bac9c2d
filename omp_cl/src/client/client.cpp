/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/client.hpp"
#include "omp/signer.hpp"
#include "omp/log.hpp"

#include "omp/internal/utils.hpp"
#include "omp/internal/http_parser.hpp"
#include "omp/internal/time.hpp"
#include "omp/internal/http_low.hpp"

#include <sstream>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <memory>

namespace omp {

namespace {

std::string host_header(const ClientConfig& cfg) {
    std::string h = cfg.host;
    if (h.find(':') != std::string::npos && h.front() != '[') h = "[" + h + "]";
    if (cfg.port != 80) h += ":" + std::to_string(cfg.port);
    return h;
}

} // namespace

struct Client::Impl {
    ClientConfig cfg;
    std::unique_ptr<RequestSigner> signer;   // null = unsigned requests

    // Keep-alive state
    std::mutex mtx;
    std::unique_ptr<internal::TcpConn> plain;
    int served_on_conn = 0;

    explicit Impl(const ClientConfig& c) : cfg(c) {
        if (!cfg.log_file.empty()) omp::set_log_file(cfg.log_file);
        if (!cfg.seed_b64u.empty()) {
            signer = std::make_unique<RequestSigner>(
                RequestSigner::from_seed_b64u(cfg.seed_b64u, cfg.keyid));
            internal::secure_wipe(cfg.seed_b64u);
        }
    }

    ~Impl() {
        std::lock_guard<std::mutex> lk(mtx);
        close_conn_locked();
    }

    void close_conn_locked() {
        if (plain) {
            plain->close();
            plain.reset();
        }
        served_on_conn = 0;
    }

    bool ensure_conn_locked() {
        if (plain && served_on_conn < cfg.ka_max) return true;
        close_conn_locked();
        plain = std::make_unique<internal::TcpConn>();
        if (!plain->open(cfg)) { plain.reset(); return false; }
        return true;
    }

    bool recv_response_locked(HttpResponse& out) {
        std::string head;
        if (!plain->recv_until(head, "\r\n\r\n", (1u<<20))) return false;

        std::size_t hdr_end_off = 0;
        if (!internal::parse_http_response(head, hdr_end_off, out.status_code,
                                           out.status_text, out.headers)) {
            return false;
        }
        out.content_type = internal::hdr_ci(out.headers, "Content-Type");

        const std::string cl = internal::trim_copy(internal::hdr_ci(out.headers, "Content-Length"));
        if (cl.empty()) return false;
        errno = 0;
        char* end = nullptr;
        unsigned long long content_len = std::strtoull(cl.c_str(), &end, 10);
        if (errno != 0 || !end || *end != '\0') return false;

        out.body.clear();
        if (hdr_end_off < head.size()) {
            const std::size_t have = head.size() - hdr_end_off;
            out.body.assign(head, hdr_end_off, std::min<std::size_t>(have, content_len));
        }
        while (out.body.size() < content_len) {
            const std::size_t need = content_len - out.body.size();
            if (!plain->recv_some(out.body, need)) return false;
        }

        const std::string conn = internal::lower_copy(internal::hdr_ci(out.headers, "Connection"));
        ++served_on_conn;
        if (conn == "close" || served_on_conn >= cfg.ka_max) {
            close_conn_locked();
        }
        return true;
    }
};

Client::Client(const ClientConfig& cfg)
    : _p(std::make_unique<Client::Impl>(cfg)) {}

Client::~Client() = default;

std::string Client::url_for(const std::string& path) const {
    return "http://" + host_header(_p->cfg) + _p->cfg.base_path + path;
}

bool Client::request(const std::string& method,
                     const std::string& path,
                     const std::string& body,
                     const std::unordered_map<std::string, std::string>& extra_headers,
                     HttpResponse& out)
{
    const std::string m = internal::upper_copy(method);
    const std::string full_path = _p->cfg.base_path + path;

    SignedHeaders sh;
    if (_p->signer) {
        if (!_p->signer->sign_headers(m, url_for(path), omp::unix_now(), _p->cfg.label, sh)) {
            omp::log_line("[CLIENT] signing failed");
            return false;
        }
    }

    std::ostringstream req;
    req << m << " " << full_path << " HTTP/1.1\r\n";
    req << "Host: " << host_header(_p->cfg) << "\r\n";
    if (_p->signer) {
        req << "Signature-Input: " << sh.signature_input << "\r\n";
        req << "Signature: " << sh.signature << "\r\n";
    }
    for (const auto& kv : extra_headers) {
        req << kv.first << ": " << kv.second << "\r\n";
    }
    req << "Content-Length: " << body.size() << "\r\n";
    req << "Connection: keep-alive\r\n\r\n";
    req << body;
    const std::string wire = req.str();

    std::lock_guard<std::mutex> lk(_p->mtx);
    // A reused connection may have been closed by the server; retry once on a fresh one.
    for (int attempt = 0; attempt < 2; ++attempt) {
        const bool reused = (_p->plain != nullptr);
        if (!_p->ensure_conn_locked()) return false;
        if (_p->plain->send_all(wire.data(), wire.size()) && _p->recv_response_locked(out)) {
            return true;
        }
        _p->close_conn_locked();
        if (!reused) break;
    }
    omp::log_line("[CLIENT] request " + m + " " + full_path + " failed");
    return false;
}

} // namespace omp
