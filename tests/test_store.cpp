#include "rp/internal/json_codec.hpp"
#include "rp/internal/memory_store.hpp"

#include "test_fleet.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

namespace {

using namespace rp::internal;

const char* kFleet = R"({
  "nodes": [
    {"id": 1, "name": "ams-1", "ip": "198.51.100.1", "join_token": "tok-ams", "block_ads": true},
    {"id": 2, "name": "fra-1", "ip": "198.51.100.2", "join_token": "tok-fra",
     "is_relay": true, "relay_id": 1},
    {"id": 3, "name": "old", "ip": "198.51.100.3", "enabled": false, "relay_id": 1}
  ],
  "groups": [{"id": 1, "name": "Default"}, {"id": 2, "name": "eu"}],
  "group_members": [{"group_id": 1, "node_id": 1}, {"group_id": 2, "node_id": 1},
                    {"group_id": 2, "node_id": 2}],
  "templates": [
    {"id": 4, "name": "trojan", "protocol": "trojan", "group_id": 2,
     "port_range_start": 20000, "port_range_end": 20100},
    {"id": 3, "name": "ss", "protocol": "ss", "group_id": 2, "is_active": false}
  ],
  "inbounds": [
    {"id": 7, "node_id": 1, "tag": "manual", "protocol": "hy2", "listen_port": 8443,
     "settings": "{\"users\":[]}"}
  ],
  "plan_groups": [{"plan_id": 1, "group_id": 2}],
  "subscriptions": [
    {"id": 1, "plan_id": 1, "subscriber_id": 42, "secret": "s-1", "status": "active"},
    {"id": 2, "plan_id": 1, "subscriber_id": 43, "secret": "s-2", "status": "expired"},
    {"id": 3, "plan_id": 1, "subscriber_id": 44, "secret": "s-3"}
  ],
  "settings": {"relay_auth_mode": "v1"}
})";

std::string temp_path(const char* stem) {
    return std::string("/tmp/") + stem + "-" + std::to_string(::getpid()) + ".json";
}

void load(MemoryStore& store) {
    Json::Value root;
    std::string err;
    assert(parse_json(kFleet, root, err));
    assert(store.load_snapshot(root, err));
}

void snapshot_queries() {
    MemoryStore store;
    load(store);

    rp::Node n;
    assert(store.get_node(1, n));
    assert(n.block_ads && !n.block_porn);
    assert(store.find_node_by_token("tok-fra", n) && n.id == 2);
    assert(!store.find_node_by_token("tok-fr", n));
    assert(!store.find_node_by_token("", n));

    // Disabled node 3 is not a relay client.
    const auto clients = store.relay_clients(1);
    assert(clients.size() == 1 && clients[0].id == 2);

    assert(store.node_groups(1).size() == 2);
    assert(store.group_nodes(2).size() == 2);
    rp::NodeGroup g;
    assert(store.find_group_by_name("Default", g) && g.id == 1);

    const auto templates = store.templates_for_group(2);
    assert(templates.size() == 1 && templates[0].id == 4);

    const auto plans = store.linked_plans(1, 7);
    assert(plans.size() == 1 && plans[0] == 1);
    const auto subs = store.active_subscriptions(plans);
    assert(subs.size() == 1);
    assert(subs[0].subscription_id == 1 && subs[0].subscriber_id == 42 && subs[0].secret == "s-1");

    std::string mode;
    assert(store.get_setting("relay_auth_mode", mode) && mode == "v1");
    assert(!store.get_setting("missing", mode));
}

void upsert_is_keyed_by_tag() {
    MemoryStore store;
    load(store);

    rp::Inbound ib = rp_test::make_inbound(0, 1, "tpl_4", rp::Protocol::Trojan, 20001, "{}");
    assert(store.upsert_inbound(ib) == UpsertResult::Inserted);
    assert(ib.id == 8);

    rp::Inbound clash = rp_test::make_inbound(0, 1, "tpl_9", rp::Protocol::Trojan, 8443, "{}");
    assert(store.upsert_inbound(clash) == UpsertResult::PortConflict);

    // Same port on a different node is fine.
    rp::Inbound other = rp_test::make_inbound(0, 2, "tpl_4", rp::Protocol::Trojan, 8443, "{}");
    assert(store.upsert_inbound(other) == UpsertResult::Inserted);

    ib.listen_port = 20002;
    assert(store.upsert_inbound(ib) == UpsertResult::Updated);
    rp::Inbound back;
    assert(store.find_inbound(1, "tpl_4", back));
    assert(back.id == 8 && back.listen_port == 20002);

    // Group 2 already has an active template: it is returned, nothing is added.
    rp::InboundTemplate t = rp_test::make_template(0, 2, rp::Protocol::Vless, "{}", "{}");
    bool created = true;
    assert(store.create_template_if_absent(t, created));
    assert(!created && t.id == 4 && t.protocol == rp::Protocol::Trojan);

    rp::InboundTemplate d = rp_test::make_template(0, 1, rp::Protocol::Vless, "{}", "{}");
    assert(store.create_template_if_absent(d, created));
    assert(created && d.id == 5);
    rp::InboundTemplate again = rp_test::make_template(0, 1, rp::Protocol::Vless, "{}", "{}");
    assert(store.create_template_if_absent(again, created));
    assert(!created && again.id == 5);
    assert(store.templates_for_group(1).size() == 1);
}

void file_backend_persists_mutations() {
    const std::string path = temp_path("rp-test-fleet");
    {
        std::ofstream out(path);
        out << kFleet;
    }

    {
        MemoryStore store;
        assert(store.init_file(path));
        store.set_persist_path(path);

        rp::Node n;
        assert(store.get_node(1, n));
        n.reality_sni = "www.apple.com";
        assert(store.update_node(n));
        rp::Inbound ib = rp_test::make_inbound(0, 1, "tpl_4", rp::Protocol::Trojan, 20001, "{}");
        assert(store.upsert_inbound(ib) == UpsertResult::Inserted);
    }

    MemoryStore reloaded;
    assert(reloaded.init_file(path));
    rp::Node n;
    assert(reloaded.get_node(1, n));
    assert(n.reality_sni == "www.apple.com");
    assert(n.join_token && *n.join_token == "tok-ams");
    rp::Inbound ib;
    assert(reloaded.find_inbound(1, "tpl_4", ib));
    assert(ib.listen_port == 20001);
    assert(reloaded.inbounds_for_node(1).size() == 2);

    std::remove(path.c_str());
}

void bad_files_are_rejected() {
    MemoryStore store;
    assert(!store.init_file("/nonexistent/fleet.json"));

    Json::Value root;
    std::string err;
    assert(parse_json(R"({"nodes":[{"name":"no id"}]})", root, err));
    assert(!store.load_snapshot(root, err));
    assert(err == "bad node record");

    assert(parse_json(R"({"templates":[{"id":1,"protocol":"wireguard"}]})", root, err));
    assert(!store.load_snapshot(root, err));

    assert(!parse_json("{nope", root, err));
    assert(!err.empty());
}

void notifications_are_recorded() {
    MemoryStore store;
    store.notify_node_update(3);
    store.notify_node_update(1);
    const auto n = store.notified();
    assert(n.size() == 2 && n[0] == 3 && n[1] == 1);
}

} // namespace

int main() {
    rp_test::quiet_logs();

    snapshot_queries();
    upsert_is_keyed_by_tag();
    file_backend_persists_mutations();
    bad_files_are_rejected();
    notifications_are_recorded();
    return 0;
}
