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

namespace omp {

// Signature enforcement level:
//   Off        - headers are ignored
//   Permissive - headers optional, syntax-checked when present, no crypto
//   Strict     - headers required, at least one signature must verify
enum class SignatureMode {
    Off,
    Permissive,
    Strict
};

// Case-insensitive, whitespace-tolerant. Returns false on unknown names.
bool parse_signature_mode(const std::string& s, SignatureMode& out);

const char* to_string(SignatureMode m);

} // namespace omp
