/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/http_parser.hpp"
#include "omp/internal/utils.hpp"
#include <sstream>
#include <strings.h> // strcasecmp

namespace omp::internal {

bool parse_request_line(const std::string& line, omp::HttpRequest& r) {
    std::istringstream iss(line);
    std::string target;
    if (!(iss >> r.method >> target >> r.httpver)) return false;
    std::string extra;
    if (iss >> extra) return false;
    if (r.httpver.compare(0, 5, "HTTP/") != 0) return false;
    if (target.empty() || target[0] != '/') return false;

    const std::size_t q = target.find('?');
    if (q == std::string::npos) {
        r.path = target;
        r.query.clear();
    } else {
        r.path  = target.substr(0, q);
        r.query = target.substr(q + 1);
    }
    return true;
}

void parse_header_lines(const std::string& block, HeaderMap& out) {
    out.clear();
    std::size_t pos = 0;
    while (pos < block.size()) {
        std::size_t next = block.find("\r\n", pos);
        if (next == std::string::npos) next = block.size();
        std::string line = block.substr(pos, next - pos);
        pos = next + 2;
        std::size_t c = line.find(':');
        if (c == std::string::npos) continue;
        std::string k = line.substr(0, c), v = line.substr(c + 1);
        trim_inplace(k);
        trim_inplace(v);
        if (k.empty()) continue;
        // Fold repeats regardless of spelling; the first spelling is kept.
        auto it = out.find(k);
        if (it == out.end()) {
            for (it = out.begin(); it != out.end(); ++it) {
                if (strcasecmp(it->first.c_str(), k.c_str()) == 0) break;
            }
        }
        if (it == out.end()) {
            out.emplace(std::move(k), std::move(v));
        } else if (!v.empty()) {
            if (!it->second.empty()) it->second += ", ";
            it->second += v;
        }
    }
}

std::string hdr_ci(const HeaderMap& H, const char* name){
    auto it = H.find(name);
    if (it != H.end()) return it->second;
    for (const auto& kv : H){
        if (strcasecmp(kv.first.c_str(), name)==0) return kv.second;
    }
    return {};
}

std::string hdr_ci(const omp::HttpRequest& R, const char* name) {
    return hdr_ci(R.headers, name);
}

} // namespace omp::internal
