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
#include <vector>
#include "omp/http_request.hpp"
#include "omp/internal/canonical_base.hpp"
#include "omp/internal/key_resolver.hpp"
#include "omp/internal/sig_headers.hpp"

namespace omp::internal {

enum class FailureKind { None, Malformed, UnknownKey, BadSignature };

const char* to_string(FailureKind k);

struct VerificationOutcome {
    bool        accepted = false;
    std::string matched_label;              // set when accepted
    FailureKind failure = FailureKind::None;
    std::string reason;                     // human-readable, safe to return to clients
};

// Labels present in both headers. Throws MalformedSignature when there are
// none, or when any of them lacks a keyid. Never does crypto.
std::vector<std::string> check_syntax(const SignatureInputMap& si, const SignatureMap& sigs);

/**
 * Ed25519 verification of Signature-Input / Signature pairs.
 * Stateless apart from the references it holds; safe to share across threads.
 */
class SignatureVerifier {
public:
    SignatureVerifier(const KeyResolver& keys, BaseOptions opt);

    // One label: decode, resolve keyid, try every candidate base. Never throws.
    // On false, *why (if given) says UnknownKey or BadSignature.
    bool verify_one(const omp::HttpRequest& R,
                    const std::string& keyid,
                    const std::string& sig_b64u,
                    FailureKind* why = nullptr) const;

    // Any one verifying label accepts the request.
    VerificationOutcome verify_all(const omp::HttpRequest& R,
                                   const SignatureInputMap& si,
                                   const SignatureMap& sigs) const;

    // Parse both headers, then verify_all(). Grammar errors come back as
    // FailureKind::Malformed rather than as exceptions.
    VerificationOutcome verify_request(const omp::HttpRequest& R,
                                       const std::string& sig_input_hdr,
                                       const std::string& sig_hdr) const;

private:
    const KeyResolver& _keys;
    BaseOptions _opt;
};

} // namespace omp::internal
