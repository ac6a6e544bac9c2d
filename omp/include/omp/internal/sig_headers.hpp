/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#pragma once
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace omp::internal {

// Header syntax/structure violation. Always maps to HTTP 400.
class MalformedSignature : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One item of Signature-Input, e.g.  sig1=();created=1618884473;keyid="k1"
struct SignatureInputEntry {
    std::string  label;
    std::string  keyid;                       // empty = absent
    bool         has_created = false;
    std::int64_t created = 0;                 // parsed, not enforced
    std::map<std::string, std::string> params; // every parameter, quotes stripped
};

using SignatureInputMap = std::map<std::string, SignatureInputEntry>;
using SignatureMap      = std::map<std::string, std::string>; // label -> base64url

// Only an empty covered-component list "()" is supported.
// Both throw MalformedSignature; neither touches any state.
SignatureInputMap parse_signature_input(const std::string& header);
SignatureMap      parse_signature(const std::string& header);

} // namespace omp::internal
