/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/types.hpp"
#include "omp/internal/utils.hpp"

namespace omp {

bool parse_signature_mode(const std::string& s, SignatureMode& out) {
    const std::string m = internal::lower_copy(internal::trim_copy(s));
    if (m == "off")        { out = SignatureMode::Off;        return true; }
    if (m == "permissive") { out = SignatureMode::Permissive; return true; }
    if (m == "strict")     { out = SignatureMode::Strict;     return true; }
    return false;
}

const char* to_string(SignatureMode m) {
    switch (m) {
        case SignatureMode::Off:        return "off";
        case SignatureMode::Permissive: return "permissive";
        case SignatureMode::Strict:     return "strict";
    }
    return "off";
}

} // namespace omp
