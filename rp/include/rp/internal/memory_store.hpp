/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#pragma once
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <json/json.h>
#include "rp/internal/store.hpp"

namespace rp::internal {

/**
 * In-process fleet store. Backs the file mode of the panel server and the
 * tests. Loaded from / saved to a JSON fleet snapshot:
 *   { "nodes":[...], "groups":[...], "group_members":[{group_id,node_id}],
 *     "templates":[...], "inbounds":[...], "plan_inbounds":[{plan_id,inbound_id}],
 *     "plan_nodes":[{plan_id,node_id}], "plan_groups":[{plan_id,group_id}],
 *     "subscriptions":[...], "settings":{...} }
 */
class MemoryStore : public Store {
public:
    MemoryStore() = default;

    bool init_file(const std::string& path);
    bool save_file(const std::string& path);
    // Write the snapshot back after every mutation.
    void set_persist_path(const std::string& path);

    bool load_snapshot(const Json::Value& root, std::string& err);
    Json::Value snapshot();

    // ---- seeding ----
    void put_node(const rp::Node& n);
    void put_group(const rp::NodeGroup& g);
    void add_group_member(int64_t group_id, int64_t node_id);
    void put_template(const rp::InboundTemplate& t);
    void put_inbound(const rp::Inbound& ib);
    void link_plan_inbound(int64_t plan_id, int64_t inbound_id);
    void link_plan_node(int64_t plan_id, int64_t node_id);
    void link_plan_group(int64_t plan_id, int64_t group_id);
    void put_subscription(const rp::Subscription& s);
    void set_setting(const std::string& key, const std::string& value);

    // Node ids passed to notify_node_update, in call order.
    std::vector<int64_t> notified();

    // ---- Store ----
    bool get_node(int64_t id, rp::Node& out) override;
    bool find_node_by_token(const std::string& token, rp::Node& out) override;
    bool update_node(const rp::Node& node) override;
    std::vector<rp::Node> relay_clients(int64_t target_id) override;

    std::vector<int64_t> node_groups(int64_t node_id) override;
    std::vector<int64_t> group_nodes(int64_t group_id) override;
    bool find_group_by_name(const std::string& name, rp::NodeGroup& out) override;

    std::vector<rp::InboundTemplate> templates_for_group(int64_t group_id) override;
    bool get_template(int64_t id, rp::InboundTemplate& out) override;
    bool create_template_if_absent(rp::InboundTemplate& tpl, bool& created) override;

    std::vector<rp::Inbound> inbounds_for_node(int64_t node_id) override;
    bool find_inbound(int64_t node_id, const std::string& tag, rp::Inbound& out) override;
    bool get_inbound(int64_t id, rp::Inbound& out) override;
    UpsertResult upsert_inbound(rp::Inbound& ib) override;

    std::vector<int64_t> linked_plans(int64_t node_id, int64_t inbound_id) override;
    std::vector<rp::ActiveSubscription> active_subscriptions(const std::vector<int64_t>& plan_ids) override;

    bool get_setting(const std::string& key, std::string& out) override;
    void notify_node_update(int64_t node_id) override;

private:
    std::mutex _mtx;
    std::string _persist_path;

    std::map<int64_t, rp::Node>            _nodes;
    std::map<int64_t, rp::NodeGroup>       _groups;
    std::set<std::pair<int64_t, int64_t>>  _members;        // (group, node)
    std::map<int64_t, rp::InboundTemplate> _templates;
    std::map<int64_t, rp::Inbound>         _inbounds;
    std::set<std::pair<int64_t, int64_t>>  _plan_inbounds;  // (plan, inbound)
    std::set<std::pair<int64_t, int64_t>>  _plan_nodes;     // (plan, node)
    std::set<std::pair<int64_t, int64_t>>  _plan_groups;    // (plan, group)
    std::map<int64_t, rp::Subscription>    _subs;
    std::map<std::string, std::string>     _settings;
    std::vector<int64_t>                   _notified;

    Json::Value snapshot_unlocked() const;
    void persist_unlocked();
};

} // namespace rp::internal
