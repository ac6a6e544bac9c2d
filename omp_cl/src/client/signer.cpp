/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/signer.hpp"
#include "omp/internal/ed25519.hpp"
#include "omp/internal/utils.hpp"

#include <stdexcept>
#include <utility>
#include <openssl/rand.h>

namespace omp {

RequestSigner::RequestSigner(const std::string& seed32, std::string keyid)
    : _seed(seed32), _keyid(std::move(keyid))
{
    if (_seed.size() != internal::kEd25519KeyLen) {
        internal::secure_wipe(_seed);
        throw std::runtime_error("signing seed must be 32 bytes");
    }
    if (_keyid.empty()) {
        internal::secure_wipe(_seed);
        throw std::runtime_error("keyid must not be empty");
    }
    internal::PublicKey pub{};
    if (!internal::ed25519_public_from_seed(_seed, pub)) {
        internal::secure_wipe(_seed);
        throw std::runtime_error("cannot derive Ed25519 public key");
    }
    _pub_b64u = internal::base64_encode(pub.data(), pub.size(), /*url_safe=*/true, /*pad=*/false);
}

RequestSigner RequestSigner::from_seed_b64u(const std::string& seed_b64u, const std::string& keyid) {
    std::string seed;
    if (!internal::base64_decode(internal::trim_copy(seed_b64u), seed, /*url_safe=*/true) ||
        seed.size() != internal::kEd25519KeyLen) {
        internal::secure_wipe(seed);
        throw std::runtime_error("seed must be base64url of 32 bytes");
    }
    RequestSigner s(seed, keyid);
    internal::secure_wipe(seed);
    return s;
}

RequestSigner::~RequestSigner() {
    internal::secure_wipe(_seed);
}

std::string RequestSigner::public_key_b64u() const {
    return _pub_b64u;
}

bool RequestSigner::sign_base(const std::string& base, std::string& sig_b64u) const {
    std::string sig;
    if (!internal::ed25519_sign(_seed, base, sig)) return false;
    sig_b64u = internal::base64_encode(reinterpret_cast<const unsigned char*>(sig.data()),
                                       sig.size(), /*url_safe=*/true, /*pad=*/false);
    return true;
}

bool RequestSigner::sign_headers(const std::string& method,
                                 const std::string& url,
                                 std::int64_t created,
                                 const std::string& label,
                                 SignedHeaders& out) const
{
    std::string sig_b64u;
    if (!sign_base(internal::upper_copy(method) + " " + url, sig_b64u)) return false;
    out.signature_input = label + "=();created=" + std::to_string(created) +
                          ";keyid=\"" + _keyid + "\"";
    out.signature = label + "=:" + sig_b64u + ":";
    return true;
}

bool generate_seed(std::string& seed32) {
    seed32.assign(internal::kEd25519KeyLen, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&seed32[0]),
                   static_cast<int>(seed32.size())) != 1) {
        seed32.clear();
        return false;
    }
    return true;
}

} // namespace omp
