/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#pragma once
#include <atomic>
#include "omp/types.hpp"

namespace omp {

// Owned, injectable holder of the signature mode. The server keeps one and
// hands it to the policy by reference; set_mode() is visible to every
// subsequent request.
class SignatureSettings {
public:
    explicit SignatureSettings(SignatureMode m = SignatureMode::Off) : _mode(m) {}

    SignatureMode mode() const { return _mode.load(std::memory_order_acquire); }
    void set_mode(SignatureMode m) { _mode.store(m, std::memory_order_release); }

    SignatureSettings(const SignatureSettings&) = delete;
    SignatureSettings& operator=(const SignatureSettings&) = delete;

private:
    std::atomic<SignatureMode> _mode;
};

} // namespace omp
