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
#include <set>
#include "rp/internal/store.hpp"

namespace rp::internal {

// Swap if inverted, clamp both ends to [1, 65535].
void normalize_port_range(int& start, int& end);

// Uniform random probing inside [start, end] (normalized) against `used`.
// Returns false when no free port was hit within max_probes draws.
bool probe_free_port(const std::set<int>& used, int start, int end, int max_probes, int& out);

/**
 * Picks a listen port for a node. Used ports are re-read from the store on
 * every call; the store's (node, port) uniqueness check closes the
 * remaining race.
 */
class PortAllocator {
public:
    static constexpr int kMaxProbes = 100;

    explicit PortAllocator(Store& store) : _store(store) {}

    // Throws rp::PortExhaustion.
    int allocate(int64_t node_id, int start, int end, const std::set<int>& also_exclude = {});

private:
    Store& _store;
};

} // namespace rp::internal
