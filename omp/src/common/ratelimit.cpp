/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/ratelimit.hpp"
#include <algorithm>

namespace omp::internal {

bool TokenBucketMap::allow(const std::string& key, double rate, double burst) {
    return allow_at(key, rate, burst, Clock::now());
}

bool TokenBucketMap::allow_at(const std::string& key, double rate, double burst,
                              Clock::time_point now)
{
    if (rate <= 0.0 || burst <= 0.0) return true;
    std::lock_guard<std::mutex> lk(_mtx);
    auto& b = _buckets[key];
    if (!b.init) {
        b.tokens = burst;
        b.last   = now;
        b.init   = true;
    }
    if (now > b.last) {
        double elapsed = std::chrono::duration<double>(now - b.last).count();
        b.last   = now;
        b.tokens = std::min(burst, b.tokens + elapsed * rate);
    }
    if (b.tokens >= 1.0) {
        b.tokens -= 1.0;
        return true;
    }
    return false;
}

bool TokenBucketMap::allow_per_minute(const std::string& key, int per_min) {
    if (per_min <= 0) return true;
    return allow(key, per_min / 60.0, static_cast<double>(per_min));
}

void TokenBucketMap::prune(Clock::duration max_idle) {
    const auto now = Clock::now();
    std::lock_guard<std::mutex> lk(_mtx);
    for (auto it = _buckets.begin(); it != _buckets.end(); ) {
        if (now - it->second.last > max_idle) it = _buckets.erase(it);
        else ++it;
    }
}

size_t TokenBucketMap::size() const {
    std::lock_guard<std::mutex> lk(_mtx);
    return _buckets.size();
}

} // namespace omp::internal
