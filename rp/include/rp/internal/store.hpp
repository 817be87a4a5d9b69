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

namespace rp::internal {

enum class UpsertResult {
    Inserted,
    Updated,
    PortConflict,   // another inbound of the node holds the listen port
    Failed
};

/**
 * Read/write surface the synthesis engine needs from persistence.
 * Implementations must be safe to call from several threads; the engine
 * serializes nothing itself. Uniqueness of (node, listen_port) is enforced
 * here, not by callers.
 */
class Store {
public:
    virtual ~Store() = default;

    // ---- nodes ----
    virtual bool get_node(int64_t id, rp::Node& out) = 0;
    virtual bool find_node_by_token(const std::string& token, rp::Node& out) = 0;
    virtual bool update_node(const rp::Node& node) = 0;
    // Enabled nodes whose relay_id points at target_id.
    virtual std::vector<rp::Node> relay_clients(int64_t target_id) = 0;

    // ---- groups ----
    virtual std::vector<int64_t> node_groups(int64_t node_id) = 0;
    virtual std::vector<int64_t> group_nodes(int64_t group_id) = 0;
    virtual bool find_group_by_name(const std::string& name, rp::NodeGroup& out) = 0;

    // ---- templates ----
    // Active templates of the group, ordered by id.
    virtual std::vector<rp::InboundTemplate> templates_for_group(int64_t group_id) = 0;
    virtual bool get_template(int64_t id, rp::InboundTemplate& out) = 0;
    // Inserts tpl (assigning tpl.id) unless tpl.group_id already has an
    // active template; then tpl becomes the lowest-id one and created is
    // false. Concurrent callers for one group converge on one template.
    virtual bool create_template_if_absent(rp::InboundTemplate& tpl, bool& created) = 0;

    // ---- inbounds ----
    virtual std::vector<rp::Inbound> inbounds_for_node(int64_t node_id) = 0;
    virtual bool find_inbound(int64_t node_id, const std::string& tag, rp::Inbound& out) = 0;
    virtual bool get_inbound(int64_t id, rp::Inbound& out) = 0;
    // Keyed by (node_id, tag). Fills ib.id on insert.
    virtual UpsertResult upsert_inbound(rp::Inbound& ib) = 0;

    // ---- plans / subscriptions ----
    // Plans linked to the inbound directly, to its node, or to a group of its node.
    virtual std::vector<int64_t> linked_plans(int64_t node_id, int64_t inbound_id) = 0;
    // Active only, de-duplicated, ordered by subscription id.
    virtual std::vector<rp::ActiveSubscription> active_subscriptions(const std::vector<int64_t>& plan_ids) = 0;

    // ---- settings / events ----
    virtual bool get_setting(const std::string& key, std::string& out) = 0;
    virtual void notify_node_update(int64_t node_id) = 0;
};

} // namespace rp::internal
