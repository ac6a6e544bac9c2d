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
#include "omp/http_request.hpp"
#include "omp/signature_settings.hpp"
#include "omp/internal/verifier.hpp"

namespace omp::internal {

struct PolicyDecision {
    bool        proceed = true;
    int         status  = 0;    // 400 / 401 when !proceed
    std::string code;           // "bad_request" / "unauthorized"
    std::string message;
};

/**
 * Mode-aware gate in front of protected routes.
 *
 *   off        - always proceed
 *   permissive - no headers: proceed; one header: 400; both: syntax check
 *                only (400 on error), cryptography is skipped
 *   strict     - missing header: 401; syntax error: 400; proceed only if at
 *                least one signature verifies, else 401
 *
 * The mode is read from the injected settings on every call.
 */
class SignaturePolicy {
public:
    SignaturePolicy(const omp::SignatureSettings& settings, const SignatureVerifier& verifier);

    PolicyDecision evaluate(const omp::HttpRequest& R) const;

private:
    const omp::SignatureSettings& _settings;
    const SignatureVerifier& _verifier;

    PolicyDecision evaluate_permissive(const std::string& si_hdr, const std::string& sig_hdr) const;
    PolicyDecision evaluate_strict(const omp::HttpRequest& R,
                                   const std::string& si_hdr, const std::string& sig_hdr) const;
};

} // namespace omp::internal
