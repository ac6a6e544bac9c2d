/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/ed25519.hpp"
#include <openssl/evp.h>
#include <memory>

namespace omp::internal {

namespace {

using PkeyPtr  = std::unique_ptr<EVP_PKEY, void(*)(EVP_PKEY*)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, void(*)(EVP_MD_CTX*)>;

PkeyPtr make_private(const std::string& seed32) {
    EVP_PKEY* k = nullptr;
    if (seed32.size() == kEd25519KeyLen) {
        k = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                         reinterpret_cast<const unsigned char*>(seed32.data()),
                                         seed32.size());
    }
    return PkeyPtr(k, EVP_PKEY_free);
}

} // namespace

bool ed25519_verify(const PublicKey& pub, const std::string& msg, const std::string& sig) {
    if (sig.size() != kEd25519SigLen) return false;

    PkeyPtr pkey(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, pub.data(), pub.size()),
                 EVP_PKEY_free);
    if (!pkey) return false;

    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) return false;

    // EdDSA hashes internally: no digest, one-shot DigestVerify.
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) return false;
    const int rc = EVP_DigestVerify(ctx.get(),
                                    reinterpret_cast<const unsigned char*>(sig.data()), sig.size(),
                                    reinterpret_cast<const unsigned char*>(msg.data()), msg.size());
    return rc == 1;
}

bool ed25519_sign(const std::string& seed32, const std::string& msg, std::string& out_sig) {
    PkeyPtr pkey = make_private(seed32);
    if (!pkey) return false;

    MdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) return false;
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) != 1) return false;

    std::size_t sig_len = kEd25519SigLen;
    out_sig.assign(kEd25519SigLen, '\0');
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(&out_sig[0]), &sig_len,
                       reinterpret_cast<const unsigned char*>(msg.data()), msg.size()) != 1) {
        out_sig.clear();
        return false;
    }
    out_sig.resize(sig_len);
    return sig_len == kEd25519SigLen;
}

bool ed25519_public_from_seed(const std::string& seed32, PublicKey& out) {
    PkeyPtr pkey = make_private(seed32);
    if (!pkey) return false;
    std::size_t len = out.size();
    if (EVP_PKEY_get_raw_public_key(pkey.get(), out.data(), &len) != 1) return false;
    return len == out.size();
}

} // namespace omp::internal
