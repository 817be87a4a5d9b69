/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/memory_store.hpp"
#include "rp/internal/json_codec.hpp"
#include "rp/log.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace rp::internal {

/* ---------------- snapshot file ---------------- */

static Json::Value pair_array(const std::set<std::pair<int64_t, int64_t>>& s,
                              const char* first, const char* second) {
    Json::Value arr(Json::arrayValue);
    for (const auto& p : s) {
        Json::Value e(Json::objectValue);
        e[first] = Json::Int64(p.first);
        e[second] = Json::Int64(p.second);
        arr.append(e);
    }
    return arr;
}

static bool read_pairs(const Json::Value& arr, const char* first, const char* second,
                       std::set<std::pair<int64_t, int64_t>>& out) {
    if (arr.isNull()) return true;
    if (!arr.isArray()) return false;
    for (const auto& e : arr) {
        if (!e.isObject() || !e[first].isIntegral() || !e[second].isIntegral()) return false;
        out.emplace(e[first].asInt64(), e[second].asInt64());
    }
    return true;
}

bool MemoryStore::init_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        rp::log_line("[STORE] failed to open fleet file: " + path);
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    Json::Value root;
    std::string err;
    if (!parse_json(ss.str(), root, err)) {
        rp::log_line("[STORE] fleet file is not valid JSON: " + err);
        return false;
    }
    if (!load_snapshot(root, err)) {
        rp::log_line("[STORE] fleet file rejected: " + err);
        return false;
    }
    std::lock_guard<std::mutex> lk(_mtx);
    rp::log_line("[STORE] file backend initialized: nodes=" + std::to_string(_nodes.size()) +
                 " templates=" + std::to_string(_templates.size()) +
                 " inbounds=" + std::to_string(_inbounds.size()) +
                 " subscriptions=" + std::to_string(_subs.size()));
    return true;
}

bool MemoryStore::save_file(const std::string& path) {
    Json::Value root;
    {
        std::lock_guard<std::mutex> lk(_mtx);
        root = snapshot_unlocked();
    }
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.good()) {
            rp::log_line("[STORE] cannot write " + tmp);
            return false;
        }
        out << write_json(root, true) << '\n';
        if (!out.good()) return false;
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        rp::log_line("[STORE] cannot replace " + path);
        return false;
    }
    return true;
}

void MemoryStore::set_persist_path(const std::string& path) {
    std::lock_guard<std::mutex> lk(_mtx);
    _persist_path = path;
}

void MemoryStore::persist_unlocked() {
    if (_persist_path.empty()) return;
    const std::string tmp = _persist_path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.good()) {
            rp::log_line("[STORE] persist failed: cannot open " + tmp);
            return;
        }
        out << write_json(snapshot_unlocked(), true) << '\n';
    }
    if (std::rename(tmp.c_str(), _persist_path.c_str()) != 0) {
        rp::log_line("[STORE] persist failed: cannot replace " + _persist_path);
    }
}

bool MemoryStore::load_snapshot(const Json::Value& root, std::string& err) {
    if (!root.isObject()) { err = "top level must be an object"; return false; }

    std::map<int64_t, rp::Node> nodes;
    std::map<int64_t, rp::NodeGroup> groups;
    std::map<int64_t, rp::InboundTemplate> templates;
    std::map<int64_t, rp::Inbound> inbounds;
    std::map<int64_t, rp::Subscription> subs;
    std::set<std::pair<int64_t, int64_t>> members, pi, pn, pg;
    std::map<std::string, std::string> settings;

    for (const auto& v : root["nodes"]) {
        rp::Node n;
        if (!node_from_json(v, n)) { err = "bad node record"; return false; }
        nodes[n.id] = n;
    }
    for (const auto& v : root["groups"]) {
        rp::NodeGroup g;
        if (!group_from_json(v, g)) { err = "bad group record"; return false; }
        groups[g.id] = g;
    }
    for (const auto& v : root["templates"]) {
        rp::InboundTemplate t;
        if (!template_from_json(v, t)) { err = "bad template record"; return false; }
        templates[t.id] = t;
    }
    for (const auto& v : root["inbounds"]) {
        rp::Inbound ib;
        if (!inbound_from_json(v, ib)) { err = "bad inbound record"; return false; }
        inbounds[ib.id] = ib;
    }
    for (const auto& v : root["subscriptions"]) {
        rp::Subscription s;
        if (!subscription_from_json(v, s)) { err = "bad subscription record"; return false; }
        subs[s.id] = s;
    }
    if (!read_pairs(root["group_members"], "group_id", "node_id", members) ||
        !read_pairs(root["plan_inbounds"], "plan_id", "inbound_id", pi) ||
        !read_pairs(root["plan_nodes"], "plan_id", "node_id", pn) ||
        !read_pairs(root["plan_groups"], "plan_id", "group_id", pg)) {
        err = "bad link table";
        return false;
    }
    const Json::Value& st = root["settings"];
    if (st.isObject()) {
        for (const auto& k : st.getMemberNames()) {
            if (st[k].isString()) settings[k] = st[k].asString();
        }
    }

    std::lock_guard<std::mutex> lk(_mtx);
    _nodes.swap(nodes);
    _groups.swap(groups);
    _templates.swap(templates);
    _inbounds.swap(inbounds);
    _subs.swap(subs);
    _members.swap(members);
    _plan_inbounds.swap(pi);
    _plan_nodes.swap(pn);
    _plan_groups.swap(pg);
    _settings.swap(settings);
    return true;
}

Json::Value MemoryStore::snapshot() {
    std::lock_guard<std::mutex> lk(_mtx);
    return snapshot_unlocked();
}

Json::Value MemoryStore::snapshot_unlocked() const {
    Json::Value root(Json::objectValue);
    root["nodes"] = Json::Value(Json::arrayValue);
    for (const auto& kv : _nodes) root["nodes"].append(node_to_json(kv.second));
    root["groups"] = Json::Value(Json::arrayValue);
    for (const auto& kv : _groups) root["groups"].append(group_to_json(kv.second));
    root["templates"] = Json::Value(Json::arrayValue);
    for (const auto& kv : _templates) root["templates"].append(template_to_json(kv.second));
    root["inbounds"] = Json::Value(Json::arrayValue);
    for (const auto& kv : _inbounds) root["inbounds"].append(inbound_to_json(kv.second));
    root["subscriptions"] = Json::Value(Json::arrayValue);
    for (const auto& kv : _subs) root["subscriptions"].append(subscription_to_json(kv.second));
    root["group_members"] = pair_array(_members, "group_id", "node_id");
    root["plan_inbounds"] = pair_array(_plan_inbounds, "plan_id", "inbound_id");
    root["plan_nodes"] = pair_array(_plan_nodes, "plan_id", "node_id");
    root["plan_groups"] = pair_array(_plan_groups, "plan_id", "group_id");
    root["settings"] = Json::Value(Json::objectValue);
    for (const auto& kv : _settings) root["settings"][kv.first] = kv.second;
    return root;
}

/* ---------------- seeding ---------------- */

void MemoryStore::put_node(const rp::Node& n) {
    std::lock_guard<std::mutex> lk(_mtx);
    _nodes[n.id] = n;
}

void MemoryStore::put_group(const rp::NodeGroup& g) {
    std::lock_guard<std::mutex> lk(_mtx);
    _groups[g.id] = g;
}

void MemoryStore::add_group_member(int64_t group_id, int64_t node_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    _members.emplace(group_id, node_id);
}

void MemoryStore::put_template(const rp::InboundTemplate& t) {
    std::lock_guard<std::mutex> lk(_mtx);
    _templates[t.id] = t;
}

void MemoryStore::put_inbound(const rp::Inbound& ib) {
    std::lock_guard<std::mutex> lk(_mtx);
    _inbounds[ib.id] = ib;
}

void MemoryStore::link_plan_inbound(int64_t plan_id, int64_t inbound_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    _plan_inbounds.emplace(plan_id, inbound_id);
}

void MemoryStore::link_plan_node(int64_t plan_id, int64_t node_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    _plan_nodes.emplace(plan_id, node_id);
}

void MemoryStore::link_plan_group(int64_t plan_id, int64_t group_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    _plan_groups.emplace(plan_id, group_id);
}

void MemoryStore::put_subscription(const rp::Subscription& s) {
    std::lock_guard<std::mutex> lk(_mtx);
    _subs[s.id] = s;
}

void MemoryStore::set_setting(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(_mtx);
    _settings[key] = value;
}

std::vector<int64_t> MemoryStore::notified() {
    std::lock_guard<std::mutex> lk(_mtx);
    return _notified;
}

/* ---------------- nodes ---------------- */

bool MemoryStore::get_node(int64_t id, rp::Node& out) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _nodes.find(id);
    if (it == _nodes.end()) return false;
    out = it->second;
    return true;
}

bool MemoryStore::find_node_by_token(const std::string& token, rp::Node& out) {
    if (token.empty()) return false;
    std::lock_guard<std::mutex> lk(_mtx);
    for (const auto& kv : _nodes) {
        if (kv.second.join_token && *kv.second.join_token == token) {
            out = kv.second;
            return true;
        }
    }
    return false;
}

bool MemoryStore::update_node(const rp::Node& node) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _nodes.find(node.id);
    if (it == _nodes.end()) return false;
    it->second = node;
    persist_unlocked();
    return true;
}

std::vector<rp::Node> MemoryStore::relay_clients(int64_t target_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<rp::Node> out;
    for (const auto& kv : _nodes) {
        const rp::Node& n = kv.second;
        if (n.enabled && n.relay_id && *n.relay_id == target_id) out.push_back(n);
    }
    return out;
}

/* ---------------- groups ---------------- */

std::vector<int64_t> MemoryStore::node_groups(int64_t node_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<int64_t> out;
    for (const auto& m : _members) {
        if (m.second == node_id) out.push_back(m.first);
    }
    return out;
}

std::vector<int64_t> MemoryStore::group_nodes(int64_t group_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<int64_t> out;
    for (const auto& m : _members) {
        if (m.first == group_id) out.push_back(m.second);
    }
    return out;
}

bool MemoryStore::find_group_by_name(const std::string& name, rp::NodeGroup& out) {
    std::lock_guard<std::mutex> lk(_mtx);
    for (const auto& kv : _groups) {
        if (kv.second.name == name) {
            out = kv.second;
            return true;
        }
    }
    return false;
}

/* ---------------- templates ---------------- */

std::vector<rp::InboundTemplate> MemoryStore::templates_for_group(int64_t group_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<rp::InboundTemplate> out;
    for (const auto& kv : _templates) {
        if (kv.second.group_id == group_id && kv.second.active) out.push_back(kv.second);
    }
    return out;
}

bool MemoryStore::get_template(int64_t id, rp::InboundTemplate& out) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _templates.find(id);
    if (it == _templates.end()) return false;
    out = it->second;
    return true;
}

bool MemoryStore::create_template_if_absent(rp::InboundTemplate& tpl, bool& created) {
    std::lock_guard<std::mutex> lk(_mtx);
    created = false;
    for (const auto& kv : _templates) {
        if (kv.second.group_id == tpl.group_id && kv.second.active) {
            tpl = kv.second;
            return true;
        }
    }
    created = true;
    tpl.id = _templates.empty() ? 1 : _templates.rbegin()->first + 1;
    _templates[tpl.id] = tpl;
    persist_unlocked();
    return true;
}

/* ---------------- inbounds ---------------- */

std::vector<rp::Inbound> MemoryStore::inbounds_for_node(int64_t node_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    std::vector<rp::Inbound> out;
    for (const auto& kv : _inbounds) {
        if (kv.second.node_id == node_id) out.push_back(kv.second);
    }
    return out;
}

bool MemoryStore::find_inbound(int64_t node_id, const std::string& tag, rp::Inbound& out) {
    std::lock_guard<std::mutex> lk(_mtx);
    for (const auto& kv : _inbounds) {
        if (kv.second.node_id == node_id && kv.second.tag == tag) {
            out = kv.second;
            return true;
        }
    }
    return false;
}

bool MemoryStore::get_inbound(int64_t id, rp::Inbound& out) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _inbounds.find(id);
    if (it == _inbounds.end()) return false;
    out = it->second;
    return true;
}

UpsertResult MemoryStore::upsert_inbound(rp::Inbound& ib) {
    std::lock_guard<std::mutex> lk(_mtx);
    rp::Inbound* existing = nullptr;
    for (auto& kv : _inbounds) {
        rp::Inbound& cur = kv.second;
        if (cur.node_id != ib.node_id) continue;
        if (cur.tag == ib.tag) {
            existing = &cur;
        } else if (cur.listen_port == ib.listen_port) {
            return UpsertResult::PortConflict;
        }
    }
    if (existing) {
        ib.id = existing->id;
        *existing = ib;
        persist_unlocked();
        return UpsertResult::Updated;
    }
    ib.id = _inbounds.empty() ? 1 : _inbounds.rbegin()->first + 1;
    _inbounds[ib.id] = ib;
    persist_unlocked();
    return UpsertResult::Inserted;
}

/* ---------------- plans / subscriptions ---------------- */

std::vector<int64_t> MemoryStore::linked_plans(int64_t node_id, int64_t inbound_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    std::set<int64_t> plans;
    for (const auto& p : _plan_inbounds) {
        if (p.second == inbound_id) plans.insert(p.first);
    }
    for (const auto& p : _plan_nodes) {
        if (p.second == node_id) plans.insert(p.first);
    }
    for (const auto& p : _plan_groups) {
        if (_members.count({p.second, node_id})) plans.insert(p.first);
    }
    return std::vector<int64_t>(plans.begin(), plans.end());
}

std::vector<rp::ActiveSubscription> MemoryStore::active_subscriptions(const std::vector<int64_t>& plan_ids) {
    std::lock_guard<std::mutex> lk(_mtx);
    const std::set<int64_t> wanted(plan_ids.begin(), plan_ids.end());
    std::vector<rp::ActiveSubscription> out;
    for (const auto& kv : _subs) {
        const rp::Subscription& s = kv.second;
        if (s.status != rp::SubscriptionStatus::Active || !wanted.count(s.plan_id)) continue;
        out.push_back(rp::ActiveSubscription{s.id, s.secret, s.subscriber_id});
    }
    return out;
}

/* ---------------- settings / events ---------------- */

bool MemoryStore::get_setting(const std::string& key, std::string& out) {
    std::lock_guard<std::mutex> lk(_mtx);
    auto it = _settings.find(key);
    if (it == _settings.end()) return false;
    out = it->second;
    return true;
}

void MemoryStore::notify_node_update(int64_t node_id) {
    std::lock_guard<std::mutex> lk(_mtx);
    _notified.push_back(node_id);
    rp::log_line("[STORE] node_events:" + std::to_string(node_id) + " update");
}

} // namespace rp::internal
