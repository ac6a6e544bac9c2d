/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#pragma once
#include <array>
#include <string>
#include <cstddef>

namespace omp::internal {

constexpr std::size_t kEd25519KeyLen = 32;
constexpr std::size_t kEd25519SigLen = 64;

using PublicKey = std::array<unsigned char, kEd25519KeyLen>;

// Verify a detached Ed25519 signature (raw 64 bytes) over msg.
// Any OpenSSL failure counts as "does not verify".
bool ed25519_verify(const PublicKey& pub, const std::string& msg, const std::string& sig);

// Sign msg with the private key derived from a 32-byte seed.
bool ed25519_sign(const std::string& seed32, const std::string& msg, std::string& out_sig);

// Derive the public key belonging to a 32-byte seed.
bool ed25519_public_from_seed(const std::string& seed32, PublicKey& out);

} // namespace omp::internal
