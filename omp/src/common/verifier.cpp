/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/verifier.hpp"
#include "omp/internal/utils.hpp"

#include <utility>

namespace omp::internal {

const char* to_string(FailureKind k) {
    switch (k) {
        case FailureKind::None:         return "none";
        case FailureKind::Malformed:    return "malformed";
        case FailureKind::UnknownKey:   return "unknown_key";
        case FailureKind::BadSignature: return "bad_signature";
    }
    return "none";
}

std::vector<std::string> check_syntax(const SignatureInputMap& si, const SignatureMap& sigs) {
    std::vector<std::string> common;
    for (const auto& kv : si) {
        if (sigs.count(kv.first)) common.push_back(kv.first);
    }
    if (common.empty()) {
        throw MalformedSignature("signature label mismatch");
    }
    for (const std::string& label : common) {
        if (si.at(label).keyid.empty()) {
            throw MalformedSignature("missing keyid for label " + label);
        }
    }
    return common;
}

SignatureVerifier::SignatureVerifier(const KeyResolver& keys, BaseOptions opt)
    : _keys(keys), _opt(std::move(opt))
{}

bool SignatureVerifier::verify_one(const omp::HttpRequest& R,
                                   const std::string& keyid,
                                   const std::string& sig_b64u,
                                   FailureKind* why) const
{
    auto fail = [&](FailureKind k) {
        if (why) *why = k;
        return false;
    };

    // URL-safe is canonical; the standard alphabet is also accepted.
    std::string sig;
    if (!base64_decode(sig_b64u, sig, /*url_safe=*/true) &&
        !base64_decode(sig_b64u, sig, /*url_safe=*/false)) {
        return fail(FailureKind::BadSignature);
    }

    PublicKey key{};
    if (!_keys.resolve(keyid, key)) {
        return fail(FailureKind::UnknownKey);
    }

    // The fast path is one of the candidates; try it first, skip it later.
    const std::string fast = fast_path_base(R, _opt);
    if (ed25519_verify(key, fast, sig)) return true;

    for (const std::string& base : candidate_bases(R, _opt)) {
        if (base == fast) continue;
        if (ed25519_verify(key, base, sig)) return true;
    }
    return fail(FailureKind::BadSignature);
}

VerificationOutcome SignatureVerifier::verify_all(const omp::HttpRequest& R,
                                                  const SignatureInputMap& si,
                                                  const SignatureMap& sigs) const
{
    VerificationOutcome vo;

    std::vector<std::string> labels;
    try {
        labels = check_syntax(si, sigs);
    } catch (const MalformedSignature& e) {
        vo.failure = FailureKind::Malformed;
        vo.reason  = e.what();
        return vo;
    }

    bool any_key_resolved = false;
    for (const std::string& label : labels) {
        FailureKind why = FailureKind::None;
        if (verify_one(R, si.at(label).keyid, sigs.at(label), &why)) {
            vo.accepted      = true;
            vo.matched_label = label;
            return vo;
        }
        if (why != FailureKind::UnknownKey) any_key_resolved = true;
    }

    vo.failure = any_key_resolved ? FailureKind::BadSignature : FailureKind::UnknownKey;
    vo.reason  = "no valid signature";
    return vo;
}

VerificationOutcome SignatureVerifier::verify_request(const omp::HttpRequest& R,
                                                      const std::string& sig_input_hdr,
                                                      const std::string& sig_hdr) const
{
    SignatureInputMap si;
    SignatureMap sigs;
    try {
        si   = parse_signature_input(sig_input_hdr);
        sigs = parse_signature(sig_hdr);
    } catch (const MalformedSignature& e) {
        VerificationOutcome vo;
        vo.failure = FailureKind::Malformed;
        vo.reason  = e.what();
        return vo;
    }
    return verify_all(R, si, sigs);
}

} // namespace omp::internal
