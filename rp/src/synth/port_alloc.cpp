/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/port_alloc.hpp"
#include "rp/internal/utils.hpp"
#include "rp/errors.hpp"
#include "rp/log.hpp"

#include <algorithm>

namespace rp::internal {

void normalize_port_range(int& start, int& end) {
    if (start > end) std::swap(start, end);
    start = std::clamp(start, 1, 65535);
    end = std::clamp(end, 1, 65535);
}

bool probe_free_port(const std::set<int>& used, int start, int end, int max_probes, int& out) {
    normalize_port_range(start, end);
    for (int i = 0; i < max_probes; ++i) {
        int candidate = 0;
        if (!random_between(start, end, candidate)) return false;
        if (!used.count(candidate)) {
            out = candidate;
            return true;
        }
    }
    return false;
}

int PortAllocator::allocate(int64_t node_id, int start, int end, const std::set<int>& also_exclude) {
    normalize_port_range(start, end);

    std::set<int> used(also_exclude.begin(), also_exclude.end());
    for (const auto& ib : _store.inbounds_for_node(node_id)) {
        used.insert(ib.listen_port);
    }

    int port = 0;
    if (!probe_free_port(used, start, end, kMaxProbes, port)) {
        rp::log_line("[PORT] node=" + std::to_string(node_id) + " exhausted range " +
                     std::to_string(start) + "-" + std::to_string(end) +
                     " used=" + std::to_string(used.size()));
        throw rp::PortExhaustion(node_id, start, end);
    }
    return port;
}

} // namespace rp::internal
