/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rp::internal {

// Token buckets keyed by peer IP or node id.
class TokenBucketMap {
public:
    TokenBucketMap() = default;

    // True if one request fits under (rate/sec, burst). rate or burst <= 0 disables.
    bool allow(const std::string& key, double rate, double burst);

    // Drop buckets untouched for idle_sec. Returns how many went.
    std::size_t sweep(int idle_sec);

    std::size_t size();

private:
    struct Bucket {
        double tokens = 0.0;
        std::chrono::steady_clock::time_point last{};
    };

    std::mutex _mtx;
    std::unordered_map<std::string, Bucket> _buckets;
};

} // namespace rp::internal
