/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/policy.hpp"
#include "omp/internal/errors.hpp"
#include "omp/internal/http_parser.hpp"
#include "omp/log.hpp"

namespace omp::internal {

namespace {

PolicyDecision reject(int status, const std::string& message) {
    PolicyDecision d;
    d.proceed = false;
    d.status  = status;
    d.code    = code_for_status(status);
    d.message = message;
    return d;
}

} // namespace

SignaturePolicy::SignaturePolicy(const omp::SignatureSettings& settings,
                                 const SignatureVerifier& verifier)
    : _settings(settings), _verifier(verifier)
{}

PolicyDecision SignaturePolicy::evaluate(const omp::HttpRequest& R) const {
    const omp::SignatureMode mode = _settings.mode();
    if (mode == omp::SignatureMode::Off) return {};

    const std::string si_hdr  = hdr_ci(R, "Signature-Input");
    const std::string sig_hdr = hdr_ci(R, "Signature");

    if (mode == omp::SignatureMode::Permissive) {
        return evaluate_permissive(si_hdr, sig_hdr);
    }
    return evaluate_strict(R, si_hdr, sig_hdr);
}

PolicyDecision SignaturePolicy::evaluate_permissive(const std::string& si_hdr,
                                                    const std::string& sig_hdr) const
{
    if (si_hdr.empty() && sig_hdr.empty()) return {};
    if (si_hdr.empty() || sig_hdr.empty()) {
        return reject(400, "Signature headers required together");
    }
    try {
        const auto labels = check_syntax(parse_signature_input(si_hdr), parse_signature(sig_hdr));
        omp::log_line("[SIG][WARN] permissive mode: syntax ok, signature not verified (labels=" +
                      std::to_string(labels.size()) + ")");
        return {};
    } catch (const MalformedSignature& e) {
        return reject(400, e.what());
    } catch (const std::exception&) {
        return reject(400, "Malformed signature");
    }
}

PolicyDecision SignaturePolicy::evaluate_strict(const omp::HttpRequest& R,
                                                const std::string& si_hdr,
                                                const std::string& sig_hdr) const
{
    if (si_hdr.empty() || sig_hdr.empty()) {
        return reject(401, "Missing required signature");
    }
    try {
        const VerificationOutcome vo = _verifier.verify_request(R, si_hdr, sig_hdr);
        if (vo.accepted) {
            omp::log_line("[SIG] verified label=" + vo.matched_label);
            return {};
        }
        if (vo.failure == FailureKind::Malformed) {
            return reject(400, vo.reason);
        }
        omp::log_line(std::string("[SIG] rejected: ") + to_string(vo.failure));
        return reject(401, vo.reason);
    } catch (const std::exception& e) {
        // Fail closed on anything unexpected.
        omp::log_line(std::string("[SIG] verification fault: ") + e.what());
        return reject(401, "invalid signature");
    }
}

} // namespace omp::internal
