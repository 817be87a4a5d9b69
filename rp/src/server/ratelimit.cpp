/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */

#include "rp/internal/ratelimit.hpp"
#include <algorithm>

namespace rp::internal {

bool TokenBucketMap::allow(const std::string& key, double rate, double burst) {
    if (rate <= 0.0 || burst <= 0.0) return true;
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _buckets.find(key);
    if (it == _buckets.end()) {
        it = _buckets.emplace(key, Bucket{burst, now}).first;
    }
    Bucket& b = it->second;
    const double elapsed = std::chrono::duration<double>(now - b.last).count();
    b.last   = now;
    b.tokens = std::min(burst, b.tokens + elapsed * rate);
    if (b.tokens < 1.0) return false;
    b.tokens -= 1.0;
    return true;
}

std::size_t TokenBucketMap::sweep(int idle_sec) {
    const auto cutoff = std::chrono::steady_clock::now() - std::chrono::seconds(idle_sec);
    std::lock_guard<std::mutex> lk(_mtx);
    std::size_t dropped = 0;
    for (auto it = _buckets.begin(); it != _buckets.end();) {
        if (it->second.last < cutoff) {
            it = _buckets.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

std::size_t TokenBucketMap::size() {
    std::lock_guard<std::mutex> lk(_mtx);
    return _buckets.size();
}

} // namespace rp::internal
