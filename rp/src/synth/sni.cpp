/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/sni.hpp"
#include "rp/internal/utils.hpp"

namespace rp::internal {

void PinnedSniProvider::pin(int64_t node_id, const std::string& sni) {
    std::lock_guard<std::mutex> lk(_mtx);
    _pinned[node_id] = sni;
}

std::string PinnedSniProvider::best_sni(const rp::Node& node) {
    {
        std::lock_guard<std::mutex> lk(_mtx);
        auto it = _pinned.find(node.id);
        if (it != _pinned.end() && !it->second.empty()) return it->second;
    }
    const std::string own = trim_copy(node.reality_sni);
    if (!own.empty()) return own;
    return _fallback;
}

static bool is_generic_fallback(const std::string& sni) {
    return sni.empty() || sni == "www.google.com" || sni == "drive.google.com";
}

std::string choose_sni(SniProvider& provider, const rp::Node& node) {
    std::string sni = trim_copy(provider.best_sni(node));
    if (is_generic_fallback(sni)) {
        const std::string own = trim_copy(node.reality_sni);
        if (!own.empty()) return own;
        const std::string domain = trim_copy(node.domain);
        if (!domain.empty()) return domain;
    }
    if (sni.empty()) sni = "www.google.com";
    return sni;
}

} // namespace rp::internal
