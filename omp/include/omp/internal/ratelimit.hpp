/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#pragma once
#include <unordered_map>
#include <string>
#include <chrono>
#include <mutex>

namespace omp::internal {

// Token buckets keyed by client IP. Each bucket holds up to `burst` tokens
// and refills continuously at `rate` tokens per second.
class TokenBucketMap {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucketMap() = default;

    // Returns true if the request is allowed. rate <= 0 or burst <= 0 disables.
    bool allow(const std::string& key, double rate, double burst);
    bool allow_at(const std::string& key, double rate, double burst, Clock::time_point now);

    // n requests per minute: rate n/60 per second, burst n.
    bool allow_per_minute(const std::string& key, int per_min);

    // Drop buckets idle for longer than max_idle.
    void prune(Clock::duration max_idle);

    size_t size() const;

private:
    struct Bucket {
        double tokens = 0.0;
        Clock::time_point last{};
        bool init = false;
    };

    mutable std::mutex _mtx;
    std::unordered_map<std::string, Bucket> _buckets;
};

} // namespace omp::internal
