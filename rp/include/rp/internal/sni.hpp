/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include "rp/types.hpp"

namespace rp::internal {

// Camouflage-domain source. Implementations must answer fast (local lookup).
class SniProvider {
public:
    virtual ~SniProvider() = default;
    virtual std::string best_sni(const rp::Node& node) = 0;
};

// Per-node pin, else the node's own override, else a fixed fallback.
class PinnedSniProvider : public SniProvider {
public:
    explicit PinnedSniProvider(std::string fallback = "www.google.com")
        : _fallback(std::move(fallback)) {}

    void pin(int64_t node_id, const std::string& sni);

    std::string best_sni(const rp::Node& node) override;

private:
    std::mutex _mtx;
    std::map<int64_t, std::string> _pinned;
    std::string _fallback;
};

// Provider answer, except that a generic fallback loses to the node's own
// SNI override or domain.
std::string choose_sni(SniProvider& provider, const rp::Node& node);

} // namespace rp::internal
