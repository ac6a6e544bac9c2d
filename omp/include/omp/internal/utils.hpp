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
#include <cstddef>
#include <cstdint>

namespace omp::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);
std::string trim_copy(std::string s);

// Hex helpers
int  hexval(char c);
bool hex_to_bytes(const std::string& hex, std::string& out);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// Base64 (RFC 4648). Decoders accept missing padding and ignore embedded
// whitespace; url_safe selects the "-_" alphabet instead of "+/".
bool base64_decode(const std::string& in, std::string& out, bool url_safe);
std::string base64_encode(const unsigned char* p, std::size_t n, bool url_safe, bool pad);

// Upper / lower
std::string upper_copy(std::string s);
std::string lower_copy(std::string s);

// Split on `sep` outside of double quotes and parentheses. Pieces are trimmed;
// empty pieces are dropped.
std::vector<std::string> split_top_level(const std::string& s, char sep);

// Escape for embedding inside a JSON string literal.
std::string json_escape(const std::string& s);

// Securely wipe string contents
void secure_wipe(std::string& s);

} // namespace omp::internal
