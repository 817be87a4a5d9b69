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
#include <string>
#include <vector>
#include "rp/types.hpp"
#include "rp/internal/store.hpp"
#include "rp/internal/port_alloc.hpp"
#include "rp/internal/sni.hpp"

namespace rp::internal {

inline constexpr const char* kDefaultGroupName = "Default";

// Deterministic inbound tag for a template: "tpl_<id>".
std::string template_tag(int64_t template_id);

// Baseline VLESS + Reality template bootstrapped into the Default group.
rp::InboundTemplate default_reality_template(int64_t group_id);

bool template_uses_reality(const rp::InboundTemplate& tpl);
bool inbound_uses_reality(const rp::Inbound& ib);

// Which templates apply to a node (union over its groups, ordered by id).
class TemplateResolver {
public:
    explicit TemplateResolver(Store& store) : _store(store) {}

    // Bootstraps the baseline template when the node sits in the Default
    // group and no group of it has any active template.
    std::vector<rp::InboundTemplate> resolve(const rp::Node& node);

private:
    Store& _store;
};

/**
 * Turns a (node, template) pair into a stored Inbound. Idempotent: the tag
 * is derived from the template, an in-range port is kept, and placeholder
 * values that must not drift (uuid, AmneziaWG server keys) are stable.
 */
class EndpointMaterializer {
public:
    static constexpr int kMaxUpsertAttempts = 3;

    EndpointMaterializer(Store& store, SniProvider& sni, PortAllocator& ports)
        : _store(store), _sni(sni), _ports(ports) {}

    // May heal and persist the node's Reality keys first.
    // Throws rp::PortExhaustion, rp::SynthError (storage failure).
    rp::Inbound materialize(rp::Node& node, const rp::InboundTemplate& tpl, int64_t now);

    // New port + fresh SNI for a template-backed inbound. False if the
    // inbound is unknown or not template-backed.
    bool rotate(int64_t inbound_id, int64_t now, rp::Inbound& out);

    // Rotate every inbound of the node whose template interval has elapsed.
    // A failed rotation is logged and the rest still run.
    std::size_t rotate_due(const rp::Node& node, int64_t now);

private:
    Store& _store;
    SniProvider& _sni;
    PortAllocator& _ports;

    rp::Inbound commit(rp::Node& node, const rp::InboundTemplate& tpl,
                       const rp::Inbound* existing, int port, int64_t rotated_at);
    std::string finalize_stream(const rp::Node& node, const std::string& text, const std::string& sni);
    std::string finalize_amneziawg(const std::string& text, const rp::Inbound* existing);
};

} // namespace rp::internal
