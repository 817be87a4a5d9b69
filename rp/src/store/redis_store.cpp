/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/redis_store.hpp"
#include "rp/internal/json_codec.hpp"
#include "rp/log.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstring>
#include <set>

namespace rp::internal {

static bool to_i64(const std::string& s, int64_t& out) {
    try {
        std::size_t pos = 0;
        out = std::stoll(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

static std::string id_s(int64_t v) { return std::to_string(v); }

RedisStore::RedisStore() = default;

RedisStore::~RedisStore() {
    // Close Redis connections (if any)
    for (auto& c : _pool) {
        if (c.ctx) {
            redisFree(c.ctx);
            c.ctx = nullptr;
            c.valid = false;
        }
    }
}

/* ---------------- connection pool ---------------- */

bool RedisStore::init(const Options& opt) {
    _opt = opt;
    _prefix = opt.key_prefix;
    if (_opt.pool_size <= 0) _opt.pool_size = 1;

    _pool.resize(_opt.pool_size);

    std::size_t up = 0;
    for (size_t i = 0; i < _pool.size(); ++i) {
        if (redis_connect_one(i)) ++up;
    }
    if (up == 0) {
        rp::log_line("[STORE][redis] no connection could be established to " +
                     _opt.host + ":" + std::to_string(_opt.port));
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(_pool_mtx);
        for (size_t i = 0; i < _pool.size(); ++i) _free.push_back(i);
    }
    rp::log_line("[STORE] redis backend initialized: pool=" + std::to_string(_pool.size()) +
                 " host=" + _opt.host + ":" + std::to_string(_opt.port) +
                 " db=" + std::to_string(_opt.db) +
                 " prefix=" + _prefix);
    return true;
}

bool RedisStore::redis_connect_one(size_t idx) {
    if (idx >= _pool.size()) return false;

    timeval tv{};
    tv.tv_sec  = _opt.timeout_ms / 1000;
    tv.tv_usec = (_opt.timeout_ms % 1000) * 1000;

    ::redisContext* ctx = redisConnectWithTimeout(_opt.host.c_str(), _opt.port, tv);
    if (!ctx || ctx->err) {
        if (ctx) {
            rp::log_line(std::string("[STORE][redis] connect error: ") + ctx->errstr);
            redisFree(ctx);
        } else {
            rp::log_line("[STORE][redis] connect error: NULL context");
        }
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }
    (void)redisSetTimeout(ctx, tv);

    if (!redis_auth_and_select(ctx)) {
        redisFree(ctx);
        _pool[idx].ctx = nullptr;
        _pool[idx].valid = false;
        return false;
    }

    _pool[idx].ctx = ctx;
    _pool[idx].valid = true;
    return true;
}

bool RedisStore::redis_auth_and_select(::redisContext* ctx) {
    if (!_opt.password.empty()) {
        redisReply* r = (redisReply*)redisCommand(ctx, "AUTH %s", _opt.password.c_str());
        if (!r) {
            rp::log_line("[STORE][redis] AUTH failed: no reply");
            return false;
        }
        bool ok = (r->type != REDIS_REPLY_ERROR);
        if (!ok) {
            rp::log_line(std::string("[STORE][redis] AUTH error: ") + (r->str ? r->str : ""));
        }
        freeReplyObject(r);
        if (!ok) return false;
    }
    if (_opt.db != 0) {
        redisReply* r = (redisReply*)redisCommand(ctx, "SELECT %d", _opt.db);
        if (!r) {
            rp::log_line("[STORE][redis] SELECT failed: no reply");
            return false;
        }
        bool ok = (r->type != REDIS_REPLY_ERROR);
        if (!ok) {
            rp::log_line(std::string("[STORE][redis] SELECT error: ") + (r->str ? r->str : ""));
        }
        freeReplyObject(r);
        if (!ok) return false;
    }
    return true;
}

void RedisStore::redis_close_one(size_t idx) {
    if (idx >= _pool.size()) return;
    if (_pool[idx].ctx) {
        redisFree(_pool[idx].ctx);
        _pool[idx].ctx = nullptr;
    }
    _pool[idx].valid = false;
}

bool RedisStore::Slot::acquire() {
    if (have) return true;
    std::unique_lock<std::mutex> lk(store._pool_mtx);
    store._pool_cv.wait(lk, [&]{ return !store._free.empty(); });
    idx = store._free.front();
    store._free.pop_front();
    have = true;
    return true;
}

void RedisStore::Slot::release() {
    if (!have) return;
    {
        std::lock_guard<std::mutex> lk(store._pool_mtx);
        store._free.push_back(idx);
    }
    store._pool_cv.notify_one();
    idx = (size_t)-1;
    have = false;
}

::redisContext* RedisStore::Slot::ctx() {
    // Ensure connected; the slot is exclusively owned by this thread until release().
    auto& c = store._pool[idx];
    if (!c.valid || !c.ctx || c.ctx->err) {
        store.redis_close_one(idx);
        (void)store.redis_connect_one(idx);
    }
    return store._pool[idx].ctx;
}

redisReply* RedisStore::command(const char* fmt, ...) {
    Slot slot(*this);
    if (!slot.acquire()) return nullptr;
    ::redisContext* c = slot.ctx();
    if (!c) return nullptr;

    va_list ap;
    va_start(ap, fmt);
    redisReply* r = (redisReply*)redisvCommand(c, fmt, ap);
    va_end(ap);

    if (!r) {
        // Connection likely broken; next acquire will reconnect
        rp::log_line(std::string("[STORE][redis] command failed: ") + (c->errstr[0] ? c->errstr : "no reply"));
        return nullptr;
    }
    if (r->type == REDIS_REPLY_ERROR) {
        rp::log_line(std::string("[STORE][redis] error: ") + (r->str ? r->str : ""));
        freeReplyObject(r);
        return nullptr;
    }
    return r;
}

/* ---------------- command helpers ---------------- */

bool RedisStore::cmd_get(const std::string& key, std::string& out, bool& found) {
    redisReply* r = command("GET %s", key.c_str());
    if (!r) return false;
    found = (r->type == REDIS_REPLY_STRING && r->str);
    if (found) out.assign(r->str, r->len);
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_set(const std::string& key, const std::string& value) {
    redisReply* r = command("SET %s %b", key.c_str(), value.data(), value.size());
    if (!r) return false;
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_set_nx(const std::string& key, const std::string& value, bool& claimed) {
    redisReply* r = command("SET %s %b NX", key.c_str(), value.data(), value.size());
    if (!r) return false;
    claimed = (r->type == REDIS_REPLY_STATUS);
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_del(const std::string& key) {
    redisReply* r = command("DEL %s", key.c_str());
    if (!r) return false;
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_members(const std::string& key, std::vector<std::string>& out) {
    redisReply* r = command("SMEMBERS %s", key.c_str());
    if (!r) return false;
    out.clear();
    if (r->type == REDIS_REPLY_ARRAY) {
        for (size_t i = 0; i < r->elements; ++i) {
            const redisReply* e = r->element[i];
            if (e && e->type == REDIS_REPLY_STRING) out.emplace_back(e->str, e->len);
        }
    }
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_set_add(const std::string& key, const std::string& member) {
    redisReply* r = command("SADD %s %b", key.c_str(), member.data(), member.size());
    if (!r) return false;
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_set_rem(const std::string& key, const std::string& member) {
    redisReply* r = command("SREM %s %b", key.c_str(), member.data(), member.size());
    if (!r) return false;
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_hget(const std::string& key, const std::string& field, std::string& out, bool& found) {
    redisReply* r = command("HGET %s %b", key.c_str(), field.data(), field.size());
    if (!r) return false;
    found = (r->type == REDIS_REPLY_STRING && r->str);
    if (found) out.assign(r->str, r->len);
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_hset(const std::string& key, const std::string& field, const std::string& value) {
    redisReply* r = command("HSET %s %b %b", key.c_str(), field.data(), field.size(),
                            value.data(), value.size());
    if (!r) return false;
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_hvals(const std::string& key, std::vector<std::string>& out) {
    redisReply* r = command("HVALS %s", key.c_str());
    if (!r) return false;
    out.clear();
    if (r->type == REDIS_REPLY_ARRAY) {
        for (size_t i = 0; i < r->elements; ++i) {
            const redisReply* e = r->element[i];
            if (e && e->type == REDIS_REPLY_STRING) out.emplace_back(e->str, e->len);
        }
    }
    freeReplyObject(r);
    return true;
}

bool RedisStore::cmd_incr(const std::string& key, int64_t& out) {
    redisReply* r = command("INCR %s", key.c_str());
    if (!r) return false;
    bool ok = (r->type == REDIS_REPLY_INTEGER);
    if (ok) out = (int64_t)r->integer;
    freeReplyObject(r);
    return ok;
}

bool RedisStore::cmd_publish(const std::string& channel, const std::string& message) {
    redisReply* r = command("PUBLISH %s %b", channel.c_str(), message.data(), message.size());
    if (!r) return false;
    freeReplyObject(r);
    return true;
}

bool RedisStore::load_json(const std::string& key, Json::Value& out) {
    std::string raw;
    bool found = false;
    if (!cmd_get(key, raw, found) || !found) return false;
    std::string err;
    if (!parse_json(raw, out, err)) {
        rp::log_line("[STORE][redis] corrupt record " + key + ": " + err);
        return false;
    }
    return true;
}

bool RedisStore::store_json(const std::string& key, const Json::Value& v) {
    return cmd_set(key, write_json(v));
}

/* ---------------- nodes ---------------- */

bool RedisStore::get_node(int64_t id, rp::Node& out) {
    Json::Value v;
    return load_json(k("node:" + id_s(id)), v) && node_from_json(v, out);
}

bool RedisStore::find_node_by_token(const std::string& token, rp::Node& out) {
    if (token.empty()) return false;
    std::string raw;
    bool found = false;
    if (!cmd_get(k("node_token:" + token), raw, found) || !found) return false;
    int64_t id = 0;
    if (!to_i64(raw, id)) return false;
    if (!get_node(id, out)) return false;
    // Index may lag a token rotation.
    return out.join_token && *out.join_token == token;
}

bool RedisStore::update_node(const rp::Node& node) {
    rp::Node old;
    const bool had_old = get_node(node.id, old);
    if (!store_json(k("node:" + id_s(node.id)), node_to_json(node))) return false;
    if (!cmd_set_add(k("nodes"), id_s(node.id))) return false;

    if (had_old && old.join_token && old.join_token != node.join_token) {
        (void)cmd_del(k("node_token:" + *old.join_token));
    }
    if (node.join_token && !node.join_token->empty()) {
        if (!cmd_set(k("node_token:" + *node.join_token), id_s(node.id))) return false;
    }
    if (had_old && old.relay_id && old.relay_id != node.relay_id) {
        (void)cmd_set_rem(k("relay_clients:" + id_s(*old.relay_id)), id_s(node.id));
    }
    if (node.relay_id) {
        if (!cmd_set_add(k("relay_clients:" + id_s(*node.relay_id)), id_s(node.id))) return false;
    }
    return true;
}

std::vector<rp::Node> RedisStore::relay_clients(int64_t target_id) {
    std::vector<rp::Node> out;
    std::vector<std::string> ids;
    if (!cmd_members(k("relay_clients:" + id_s(target_id)), ids)) return out;
    std::set<int64_t> sorted;
    for (const auto& s : ids) {
        int64_t id = 0;
        if (to_i64(s, id)) sorted.insert(id);
    }
    for (int64_t id : sorted) {
        rp::Node n;
        if (!get_node(id, n)) continue;
        if (n.enabled && n.relay_id && *n.relay_id == target_id) out.push_back(n);
    }
    return out;
}

/* ---------------- groups ---------------- */

std::vector<int64_t> RedisStore::node_groups(int64_t node_id) {
    std::vector<std::string> ids;
    std::set<int64_t> sorted;
    if (cmd_members(k("node_groups:" + id_s(node_id)), ids)) {
        for (const auto& s : ids) {
            int64_t id = 0;
            if (to_i64(s, id)) sorted.insert(id);
        }
    }
    return std::vector<int64_t>(sorted.begin(), sorted.end());
}

std::vector<int64_t> RedisStore::group_nodes(int64_t group_id) {
    std::vector<std::string> ids;
    std::set<int64_t> sorted;
    if (cmd_members(k("group_members:" + id_s(group_id)), ids)) {
        for (const auto& s : ids) {
            int64_t id = 0;
            if (to_i64(s, id)) sorted.insert(id);
        }
    }
    return std::vector<int64_t>(sorted.begin(), sorted.end());
}

bool RedisStore::find_group_by_name(const std::string& name, rp::NodeGroup& out) {
    std::string raw;
    bool found = false;
    if (!cmd_get(k("group_name:" + name), raw, found) || !found) return false;
    int64_t id = 0;
    if (!to_i64(raw, id)) return false;
    Json::Value v;
    return load_json(k("group:" + id_s(id)), v) && group_from_json(v, out);
}

/* ---------------- templates ---------------- */

std::vector<rp::InboundTemplate> RedisStore::templates_for_group(int64_t group_id) {
    std::vector<rp::InboundTemplate> out;
    std::vector<std::string> ids;
    if (!cmd_members(k("group_templates:" + id_s(group_id)), ids)) return out;
    std::set<int64_t> sorted;
    for (const auto& s : ids) {
        int64_t id = 0;
        if (to_i64(s, id)) sorted.insert(id);
    }
    for (int64_t id : sorted) {
        rp::InboundTemplate t;
        if (get_template(id, t) && t.active && t.group_id == group_id) out.push_back(t);
    }
    return out;
}

bool RedisStore::get_template(int64_t id, rp::InboundTemplate& out) {
    Json::Value v;
    return load_json(k("template:" + id_s(id)), v) && template_from_json(v, out);
}

bool RedisStore::create_template_if_absent(rp::InboundTemplate& tpl, bool& created) {
    created = false;
    const std::vector<rp::InboundTemplate> have = templates_for_group(tpl.group_id);
    if (!have.empty()) {
        tpl = have.front();
        return true;
    }

    // The record is written before the claim so a losing caller can always
    // read the winner's template.
    int64_t id = 0;
    if (!cmd_incr(k("seq:template"), id)) return false;
    rp::InboundTemplate mine = tpl;
    mine.id = id;
    if (!store_json(k("template:" + id_s(id)), template_to_json(mine))) return false;

    const std::string claim_key = k("group_bootstrap:" + id_s(tpl.group_id));
    bool claimed = false;
    if (!cmd_set_nx(claim_key, id_s(id), claimed)) {
        (void)cmd_del(k("template:" + id_s(id)));
        return false;
    }
    if (claimed) {
        if (!cmd_set_add(k("group_templates:" + id_s(tpl.group_id)), id_s(id))) return false;
        tpl = mine;
        created = true;
        return true;
    }

    (void)cmd_del(k("template:" + id_s(id)));
    std::string raw;
    bool found = false;
    int64_t winner = 0;
    if (!cmd_get(claim_key, raw, found) || !found || !to_i64(raw, winner)) return false;
    rp::InboundTemplate existing;
    if (!get_template(winner, existing) || !existing.active) {
        rp::log_line("[STORE] group " + id_s(tpl.group_id) + " bootstrap template " + raw +
                     " is gone or inactive");
        return false;
    }
    tpl = existing;
    return true;
}

/* ---------------- inbounds ---------------- */

std::vector<rp::Inbound> RedisStore::inbounds_for_node(int64_t node_id) {
    std::vector<rp::Inbound> out;
    std::vector<std::string> ids;
    if (!cmd_hvals(k("node_inbounds:" + id_s(node_id)), ids)) return out;
    std::set<int64_t> sorted;
    for (const auto& s : ids) {
        int64_t id = 0;
        if (to_i64(s, id)) sorted.insert(id);
    }
    for (int64_t id : sorted) {
        rp::Inbound ib;
        if (get_inbound(id, ib) && ib.node_id == node_id) out.push_back(ib);
    }
    return out;
}

bool RedisStore::find_inbound(int64_t node_id, const std::string& tag, rp::Inbound& out) {
    std::string raw;
    bool found = false;
    if (!cmd_hget(k("node_inbounds:" + id_s(node_id)), tag, raw, found) || !found) return false;
    int64_t id = 0;
    return to_i64(raw, id) && get_inbound(id, out);
}

bool RedisStore::get_inbound(int64_t id, rp::Inbound& out) {
    Json::Value v;
    return load_json(k("inbound:" + id_s(id)), v) && inbound_from_json(v, out);
}

UpsertResult RedisStore::upsert_inbound(rp::Inbound& ib) {
    rp::Inbound old;
    const bool have_old = find_inbound(ib.node_id, ib.tag, old);

    const std::string port_key = k("port:" + id_s(ib.node_id) + ":" + std::to_string(ib.listen_port));
    if (!have_old || old.listen_port != ib.listen_port) {
        bool claimed = false;
        if (!cmd_set_nx(port_key, ib.tag, claimed)) return UpsertResult::Failed;
        if (!claimed) {
            std::string holder;
            bool found = false;
            if (!cmd_get(port_key, holder, found)) return UpsertResult::Failed;
            if (!found) {
                // Claim vanished between the two calls; one more try.
                if (!cmd_set_nx(port_key, ib.tag, claimed)) return UpsertResult::Failed;
                if (!claimed) return UpsertResult::PortConflict;
            } else if (holder != ib.tag) {
                return UpsertResult::PortConflict;
            }
        }
    }

    if (have_old) {
        ib.id = old.id;
    } else {
        int64_t id = 0;
        if (!cmd_incr(k("seq:inbound"), id)) return UpsertResult::Failed;
        ib.id = id;
    }
    if (!store_json(k("inbound:" + id_s(ib.id)), inbound_to_json(ib))) return UpsertResult::Failed;
    if (!cmd_hset(k("node_inbounds:" + id_s(ib.node_id)), ib.tag, id_s(ib.id))) return UpsertResult::Failed;

    if (have_old && old.listen_port != ib.listen_port) {
        const std::string old_key = k("port:" + id_s(ib.node_id) + ":" + std::to_string(old.listen_port));
        std::string holder;
        bool found = false;
        if (cmd_get(old_key, holder, found) && found && holder == ib.tag) {
            (void)cmd_del(old_key);
        }
    }
    return have_old ? UpsertResult::Updated : UpsertResult::Inserted;
}

/* ---------------- plans / subscriptions ---------------- */

std::vector<int64_t> RedisStore::linked_plans(int64_t node_id, int64_t inbound_id) {
    std::set<int64_t> plans;
    auto collect = [&](const std::string& key) {
        std::vector<std::string> ids;
        if (!cmd_members(key, ids)) return;
        for (const auto& s : ids) {
            int64_t id = 0;
            if (to_i64(s, id)) plans.insert(id);
        }
    };
    collect(k("plan_inbounds:" + id_s(inbound_id)));
    collect(k("plan_nodes:" + id_s(node_id)));
    for (int64_t gid : node_groups(node_id)) {
        collect(k("plan_groups:" + id_s(gid)));
    }
    return std::vector<int64_t>(plans.begin(), plans.end());
}

std::vector<rp::ActiveSubscription> RedisStore::active_subscriptions(const std::vector<int64_t>& plan_ids) {
    std::set<int64_t> sub_ids;
    for (int64_t pid : plan_ids) {
        std::vector<std::string> ids;
        if (!cmd_members(k("plan_subs:" + id_s(pid)), ids)) continue;
        for (const auto& s : ids) {
            int64_t id = 0;
            if (to_i64(s, id)) sub_ids.insert(id);
        }
    }
    std::vector<rp::ActiveSubscription> out;
    for (int64_t sid : sub_ids) {
        Json::Value v;
        rp::Subscription s;
        if (!load_json(k("sub:" + id_s(sid)), v) || !subscription_from_json(v, s)) continue;
        if (s.status != rp::SubscriptionStatus::Active) continue;
        out.push_back(rp::ActiveSubscription{s.id, s.secret, s.subscriber_id});
    }
    return out;
}

/* ---------------- settings / events ---------------- */

bool RedisStore::get_setting(const std::string& key, std::string& out) {
    bool found = false;
    return cmd_get(k("setting:" + key), out, found) && found;
}

void RedisStore::notify_node_update(int64_t node_id) {
    if (!cmd_publish("node_events:" + id_s(node_id), R"({"update":true})")) {
        rp::log_line("[STORE][redis] publish failed for node " + id_s(node_id));
    }
}

/* ---------------- snapshot import ---------------- */

bool RedisStore::import_snapshot(const Json::Value& root, std::string& err) {
    if (!root.isObject()) { err = "top level must be an object"; return false; }

    int64_t max_tpl = 0, max_ib = 0;
    for (const auto& v : root["nodes"]) {
        rp::Node n;
        if (!node_from_json(v, n)) { err = "bad node record"; return false; }
        if (!update_node(n)) { err = "write failed"; return false; }
    }
    for (const auto& v : root["groups"]) {
        rp::NodeGroup g;
        if (!group_from_json(v, g)) { err = "bad group record"; return false; }
        if (!store_json(k("group:" + id_s(g.id)), group_to_json(g)) ||
            !cmd_set(k("group_name:" + g.name), id_s(g.id))) {
            err = "write failed";
            return false;
        }
    }
    for (const auto& v : root["group_members"]) {
        const int64_t gid = json_i64(v, "group_id"), nid = json_i64(v, "node_id");
        if (!cmd_set_add(k("group_members:" + id_s(gid)), id_s(nid)) ||
            !cmd_set_add(k("node_groups:" + id_s(nid)), id_s(gid))) {
            err = "write failed";
            return false;
        }
    }
    for (const auto& v : root["templates"]) {
        rp::InboundTemplate t;
        if (!template_from_json(v, t)) { err = "bad template record"; return false; }
        if (!store_json(k("template:" + id_s(t.id)), template_to_json(t)) ||
            !cmd_set_add(k("group_templates:" + id_s(t.group_id)), id_s(t.id))) {
            err = "write failed";
            return false;
        }
        max_tpl = std::max(max_tpl, t.id);
    }
    for (const auto& v : root["inbounds"]) {
        rp::Inbound ib;
        if (!inbound_from_json(v, ib)) { err = "bad inbound record"; return false; }
        if (!store_json(k("inbound:" + id_s(ib.id)), inbound_to_json(ib)) ||
            !cmd_hset(k("node_inbounds:" + id_s(ib.node_id)), ib.tag, id_s(ib.id)) ||
            !cmd_set(k("port:" + id_s(ib.node_id) + ":" + std::to_string(ib.listen_port)), ib.tag)) {
            err = "write failed";
            return false;
        }
        max_ib = std::max(max_ib, ib.id);
    }
    struct Link { const char* table; const char* target; const char* key; };
    const Link links[] = {
        {"plan_inbounds", "inbound_id", "plan_inbounds:"},
        {"plan_nodes",    "node_id",    "plan_nodes:"},
        {"plan_groups",   "group_id",   "plan_groups:"},
    };
    for (const auto& l : links) {
        for (const auto& v : root[l.table]) {
            const int64_t pid = json_i64(v, "plan_id"), tid = json_i64(v, l.target);
            if (!cmd_set_add(k(std::string(l.key) + id_s(tid)), id_s(pid))) {
                err = "write failed";
                return false;
            }
        }
    }
    for (const auto& v : root["subscriptions"]) {
        rp::Subscription s;
        if (!subscription_from_json(v, s)) { err = "bad subscription record"; return false; }
        if (!store_json(k("sub:" + id_s(s.id)), subscription_to_json(s)) ||
            !cmd_set_add(k("plan_subs:" + id_s(s.plan_id)), id_s(s.id))) {
            err = "write failed";
            return false;
        }
    }
    const Json::Value& st = root["settings"];
    if (st.isObject()) {
        for (const auto& key : st.getMemberNames()) {
            if (st[key].isString() && !cmd_set(k("setting:" + key), st[key].asString())) {
                err = "write failed";
                return false;
            }
        }
    }

    // Keep sequences ahead of imported ids.
    const std::pair<const char*, int64_t> seqs[] = {{"seq:template", max_tpl}, {"seq:inbound", max_ib}};
    for (const auto& sq : seqs) {
        std::string raw;
        bool found = false;
        int64_t cur = 0;
        if (!cmd_get(k(sq.first), raw, found)) { err = "read failed"; return false; }
        if (found) (void)to_i64(raw, cur);
        if (sq.second > cur && !cmd_set(k(sq.first), std::to_string(sq.second))) {
            err = "write failed";
            return false;
        }
    }
    rp::log_line("[STORE][redis] snapshot imported: templates<=" + std::to_string(max_tpl) +
                 " inbounds<=" + std::to_string(max_ib));
    return true;
}

} // namespace rp::internal
