/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/canonical_base.hpp"
#include "omp/internal/http_parser.hpp"
#include "omp/internal/utils.hpp"

#include <unordered_set>

namespace omp::internal {

namespace {

std::uint16_t default_port(const std::string& scheme) {
    if (scheme == "http")  return 80;
    if (scheme == "https") return 443;
    return 0;
}

// "host", "host:8080", "[::1]:8080" -> does it carry an explicit port?
bool host_has_port(const std::string& host) {
    if (!host.empty() && host[0] == '[') {
        const std::size_t rb = host.find(']');
        return rb != std::string::npos && rb + 1 < host.size() && host[rb + 1] == ':';
    }
    return host.find(':') != std::string::npos;
}

std::string listener_authority(const omp::HttpRequest& R) {
    if (R.server_host.empty()) return {};
    std::string host = R.server_host;
    if (host.find(':') != std::string::npos && host[0] != '[') {
        host = "[" + host + "]"; // bare IPv6 literal
    }
    if (R.server_port == 0 || R.server_port == default_port(R.scheme)) return host;
    return host + ":" + std::to_string(R.server_port);
}

std::string scheme_of(const omp::HttpRequest& R) {
    return R.scheme.empty() ? std::string("http") : lower_copy(R.scheme);
}

std::string strip_trailing_slashes(std::string s) {
    while (!s.empty() && s.back() == '/') s.pop_back();
    return s;
}

} // namespace

std::string rendered_base_url(const omp::HttpRequest& R, const BaseOptions& opt) {
    if (!opt.public_base_url.empty()) {
        std::string b = opt.public_base_url;
        if (b.back() != '/') b.push_back('/');
        return b;
    }
    std::string authority = hdr_ci(R, "Host");
    if (authority.empty()) authority = listener_authority(R);
    return scheme_of(R) + "://" + authority + "/";
}

std::string fast_path_base(const omp::HttpRequest& R, const BaseOptions& opt) {
    return upper_copy(R.method) + " " + strip_trailing_slashes(rendered_base_url(R, opt)) + R.path;
}

std::vector<std::string> candidate_bases(const omp::HttpRequest& R, const BaseOptions& opt) {
    const std::string method = upper_copy(R.method);
    const std::string scheme = scheme_of(R);
    const std::string& path  = R.path;
    const std::string host   = hdr_ci(R, "Host");

    std::vector<std::string> urls;

    const std::string listener = listener_authority(R);
    if (!listener.empty()) {
        urls.push_back(scheme + "://" + listener + path);
    }

    const std::string base_url = rendered_base_url(R, opt);
    urls.push_back(strip_trailing_slashes(base_url) + path);

    {
        const std::string authority = host.empty() ? listener : host;
        if (!authority.empty()) {
            std::string abs = scheme + "://" + authority + path;
            if (!R.query.empty()) abs += "?" + R.query;
            urls.push_back(std::move(abs));
        }
    }

    urls.push_back(base_url + path);

    if (!host.empty()) {
        urls.push_back(scheme + "://" + host + path);
        const std::uint16_t dp = default_port(scheme);
        if (dp != 0) {
            const std::string dp_suffix = ":" + std::to_string(dp);
            if (host.size() > dp_suffix.size() &&
                host.compare(host.size() - dp_suffix.size(), dp_suffix.size(), dp_suffix) == 0) {
                urls.push_back(scheme + "://" + host.substr(0, host.size() - dp_suffix.size()) + path);
            }
            if (!host_has_port(host)) {
                urls.push_back(scheme + "://" + host + dp_suffix + path);
            }
        }
    }

    // Dedupe in priority order, then append each candidate's trailing-slash twin.
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const std::string& u : urls) {
        std::string b = method + " " + u;
        if (seen.insert(b).second) out.push_back(std::move(b));
    }
    const std::size_t primary = out.size();
    for (std::size_t i = 0; i < primary; ++i) {
        const std::string& s = out[i];
        std::string twin = (s.back() == '/') ? strip_trailing_slashes(s) : s + "/";
        if (seen.insert(twin).second) out.push_back(std::move(twin));
    }
    return out;
}

} // namespace omp::internal
