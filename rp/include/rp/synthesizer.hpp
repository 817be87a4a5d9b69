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
#include <optional>
#include <string>
#include <json/json.h>
#include "rp/errors.hpp"
#include "rp/types.hpp"
#include "rp/internal/singbox.hpp"
#include "rp/internal/sni.hpp"
#include "rp/internal/store.hpp"
#include "rp/internal/validator.hpp"

namespace rp {

struct SynthOptions {
    // Unset: read setting "relay_auth_mode" from storage at the start of
    // every synthesis (absent -> Dual).
    std::optional<RelayAuthMode> relay_auth_mode;
    internal::BuildOptions build;
};

// Engine document for one node, keyed by a content hash.
struct Document {
    Json::Value root;
    std::string text;   // compact, sorted keys
    std::string hash;   // hex SHA-256 of text
};

/**
 * Top-level per-node pipeline:
 *   rotate due endpoints -> heal keys -> resolve templates -> materialize
 *   -> inject subscribers and relay clients -> resolve relay outbound
 *   -> assemble -> validate.
 *
 * Stateless between calls; concurrent calls for different nodes share
 * nothing but the store. Same-node calls converge (tag-keyed upserts).
 */
class Synthesizer {
public:
    Synthesizer(internal::Store& store, internal::SniProvider& sni,
                internal::ConfigValidator& validator, SynthOptions opt = {});

    // Throws NodeNotFound, PortExhaustion, ValidationError.
    Document synthesize(int64_t node_id);

    // Materialize every active template of the group on every member,
    // then notify each member. Per-pair failures are logged.
    // Returns the number of endpoints materialized.
    std::size_t sync_group(int64_t group_id);

    // New port + SNI for one template-backed inbound, then notify its node.
    bool rotate_inbound(int64_t inbound_id);

    // Mode in effect for the next synthesis.
    RelayAuthMode relay_mode();

private:
    internal::Store& _store;
    internal::SniProvider& _sni;
    internal::ConfigValidator& _validator;
    SynthOptions _opt;
};

} // namespace rp
