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
#include <unordered_map>
#include <cstddef>
#include "omp/client_config.hpp"

namespace omp::internal {

// RAII TCP connection with timeouts and basic send/recv helpers.
class TcpConn {
public:
    TcpConn() = default;
    ~TcpConn();

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    // Open TCP connection to cfg.host:cfg.port with timeouts.
    bool open(const omp::ClientConfig& cfg);

    void close();
    int  fd() const { return _fd; }

    bool send_all(const char* d, std::size_t len);
    bool recv_some(std::string& out, std::size_t max_chunk);
    bool recv_until(std::string& out, const std::string& delim, std::size_t max_total = (1u<<20));

private:
    int _fd = -1;
};

// Parse the status line and headers of an HTTP/1.1 response.
// hdr_end_off receives the offset of the first body byte.
bool parse_http_response(const std::string& head_and_maybe_body,
                         std::size_t& hdr_end_off,
                         int& status_code,
                         std::string& status_text,
                         std::unordered_map<std::string,std::string>& headers);

} // namespace omp::internal
