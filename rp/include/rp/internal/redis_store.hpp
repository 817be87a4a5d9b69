/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#pragma once
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <json/json.h>

// hiredis types live in the global namespace; include the header here
#include <hiredis/hiredis.h>

#include "rp/internal/store.hpp"

namespace rp::internal {

/**
 * Redis-backed fleet store over a hiredis connection pool.
 * Records are JSON strings; relations are sets / hashes. The
 * (node, listen_port) uniqueness constraint is a SET NX claim on
 * <prefix>port:<node>:<port>, so several panel processes can share it.
 * Node updates are announced on the "node_events:<id>" channel.
 */
class RedisStore : public Store {
public:
    struct Options {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;                 // SELECT db
        std::string password;                 // optional
        std::string key_prefix = "rp:";
        int         pool_size  = 8;           // number of hiredis connections
        int         timeout_ms = 200;         // connect + command timeout
    };

    RedisStore();
    ~RedisStore() override;

    RedisStore(const RedisStore&) = delete;
    RedisStore& operator=(const RedisStore&) = delete;

    bool init(const Options& opt);

    // Load a fleet snapshot (same shape as MemoryStore) into Redis.
    bool import_snapshot(const Json::Value& root, std::string& err);

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
    struct RedisConn { ::redisContext* ctx = nullptr; bool valid = false; };
    std::vector<RedisConn> _pool;
    std::deque<size_t>     _free;
    std::mutex             _pool_mtx;
    std::condition_variable _pool_cv;

    Options     _opt{};
    std::string _prefix = "rp:";

    bool redis_connect_one(size_t idx);
    void redis_close_one(size_t idx);
    bool redis_auth_and_select(::redisContext* ctx);

    // RAII slot guard for pool index
    class Slot {
    public:
        explicit Slot(RedisStore& s) : store(s) {}
        ~Slot() { release(); }
        bool acquire();
        void release();
        ::redisContext* ctx();
    private:
        RedisStore& store;
        size_t idx = (size_t)-1;
        bool have = false;
    };

    // printf-style command on a pooled connection. Caller frees the reply.
    // Returns nullptr (logged) on transport or server error.
    redisReply* command(const char* fmt, ...);

    // Command helpers. Each returns false on transport / server error.
    bool cmd_get(const std::string& key, std::string& out, bool& found);
    bool cmd_set(const std::string& key, const std::string& value);
    bool cmd_set_nx(const std::string& key, const std::string& value, bool& claimed);
    bool cmd_del(const std::string& key);
    bool cmd_members(const std::string& key, std::vector<std::string>& out);
    bool cmd_set_add(const std::string& key, const std::string& member);
    bool cmd_set_rem(const std::string& key, const std::string& member);
    bool cmd_hget(const std::string& key, const std::string& field, std::string& out, bool& found);
    bool cmd_hset(const std::string& key, const std::string& field, const std::string& value);
    bool cmd_hvals(const std::string& key, std::vector<std::string>& out);
    bool cmd_incr(const std::string& key, int64_t& out);
    bool cmd_publish(const std::string& channel, const std::string& message);

    // Typed record loaders.
    bool load_json(const std::string& key, Json::Value& out);
    bool store_json(const std::string& key, const Json::Value& v);

    std::string k(const std::string& suffix) const { return _prefix + suffix; }
};

} // namespace rp::internal
