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
#include <stdexcept>
#include "omp/http_request.hpp"
#include "omp/internal/ed25519.hpp"
#include "omp/internal/utils.hpp"

namespace omp::test {

// Deterministic 32-byte seeds: bytes first, first+1, ...
inline std::string seed_from(unsigned char first) {
    std::string s(omp::internal::kEd25519KeyLen, '\0');
    for (std::size_t i = 0; i < s.size(); ++i) s[i] = static_cast<char>(first + i);
    return s;
}

inline std::string b64u(const std::string& bin) {
    return omp::internal::base64_encode(reinterpret_cast<const unsigned char*>(bin.data()),
                                        bin.size(), /*url_safe=*/true, /*pad=*/false);
}

inline omp::internal::PublicKey public_key(const std::string& seed) {
    omp::internal::PublicKey pk{};
    if (!omp::internal::ed25519_public_from_seed(seed, pk)) {
        throw std::runtime_error("test: cannot derive public key");
    }
    return pk;
}

inline std::string public_key_b64u(const std::string& seed) {
    const auto pk = public_key(seed);
    return omp::internal::base64_encode(pk.data(), pk.size(), true, false);
}

inline std::string sign_b64u(const std::string& seed, const std::string& base) {
    std::string sig;
    if (!omp::internal::ed25519_sign(seed, base, sig)) {
        throw std::runtime_error("test: signing failed");
    }
    return b64u(sig);
}

// Request as the plain listener would hand it over.
inline omp::HttpRequest make_request(const std::string& method,
                                     const std::string& path,
                                     const std::string& host = "testserver",
                                     const std::string& server_host = "testserver",
                                     std::uint16_t server_port = 80)
{
    omp::HttpRequest R;
    R.method = method;
    R.path = path;
    R.httpver = "HTTP/1.1";
    R.scheme = "http";
    if (!host.empty()) R.headers["Host"] = host;
    R.server_host = server_host;
    R.server_port = server_port;
    return R;
}

inline std::string sig_input(const std::string& label, const std::string& keyid,
                             long long created = 1618884473)
{
    return label + "=();created=" + std::to_string(created) + ";keyid=\"" + keyid + "\"";
}

inline std::string sig_value(const std::string& label, const std::string& sig_b64u) {
    return label + "=:" + sig_b64u + ":";
}

} // namespace omp::test
