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
#include <cstdint>

namespace omp {

struct SignedHeaders {
    std::string signature_input;   // value of Signature-Input
    std::string signature;         // value of Signature
};

/**
 * Client half of the request-signature scheme.
 *
 * Signs the base "{METHOD} {url}" with Ed25519 and renders the two headers:
 *   Signature-Input: <label>=();created=<unix>;keyid="<keyid>"
 *   Signature:       <label>=:<base64url signature>:
 *
 * The constructor throws std::runtime_error if the seed is not 32 bytes.
 */
class RequestSigner {
public:
    RequestSigner(const std::string& seed32, std::string keyid);

    // seed as unpadded (or padded) base64url, the form --gen-key prints
    static RequestSigner from_seed_b64u(const std::string& seed_b64u, const std::string& keyid);

    ~RequestSigner();

    RequestSigner(const RequestSigner&) = delete;
    RequestSigner& operator=(const RequestSigner&) = delete;
    RequestSigner(RequestSigner&&) = default;
    RequestSigner& operator=(RequestSigner&&) = default;

    const std::string& keyid() const { return _keyid; }
    std::string public_key_b64u() const;

    // Raw signature over base, base64url without padding.
    bool sign_base(const std::string& base, std::string& sig_b64u) const;

    // url is the absolute URL the server will reconstruct,
    // e.g. "http://testserver/objects".
    bool sign_headers(const std::string& method,
                      const std::string& url,
                      std::int64_t created,
                      const std::string& label,
                      SignedHeaders& out) const;

private:
    std::string _seed;
    std::string _keyid;
    std::string _pub_b64u;
};

// 32 fresh random bytes (OpenSSL RAND_bytes).
bool generate_seed(std::string& seed32);

} // namespace omp
