#include "rp/internal/injector.hpp"
#include "rp/internal/keys.hpp"

#include "test_fleet.hpp"

#include <cassert>
#include <string>
#include <variant>

namespace {

using namespace rp::internal;

const char* kWsStream = R"({"network":"ws","security":"none","ws_settings":{"path":"/v"}})";

// Node 1, plan 1 linked to inbound 10; one active and one pending subscription.
void seed(MemoryStore& store, rp::Protocol p, const std::string& stream) {
    store.put_node(rp_test::make_node(1, "10.0.0.1"));
    store.put_inbound(rp_test::make_inbound(10, 1, "tpl_1", p, 443, "{}", stream));
    store.link_plan_inbound(1, 10);
    rp_test::add_subscription(store, 1, 1, 100, rp_test::kSecretA);
    rp_test::add_subscription(store, 2, 1, 101, rp_test::kSecretB, rp::SubscriptionStatus::Pending);
}

Endpoint load(MemoryStore& store, int64_t inbound_id) {
    rp::Inbound ib;
    assert(store.get_inbound(inbound_id, ib));
    Endpoint ep;
    std::string err;
    assert(load_endpoint(ib, ep, err));
    return ep;
}

void vless_flow_depends_on_transport() {
    {
        MemoryStore store;
        seed(store, rp::Protocol::Vless, rp_test::kRealityStream);
        Endpoint ep = load(store, 10);
        UserInjector injector(store);
        assert(injector.inject(ep) == 1);
        const auto& s = std::get<VlessSettings>(ep.settings);
        assert(s.clients.size() == 1);
        assert(s.clients[0].email == "user_1");
        assert(s.clients[0].id == rp_test::kSecretA);
        assert(s.clients[0].flow == "xtls-rprx-vision");
    }
    {
        MemoryStore store;
        seed(store, rp::Protocol::Vless, kWsStream);
        Endpoint ep = load(store, 10);
        UserInjector(store).inject(ep);
        const auto& s = std::get<VlessSettings>(ep.settings);
        assert(s.clients.size() == 1);
        assert(s.clients[0].flow.empty());
    }
}

void password_protocols() {
    const std::string stripped = "6f1c2a0e8b7d4c3e9a510d2f4b6c8e10";
    {
        MemoryStore store;
        seed(store, rp::Protocol::Trojan, "");
        Endpoint ep = load(store, 10);
        UserInjector(store).inject(ep);
        const auto& s = std::get<TrojanSettings>(ep.settings);
        assert(s.users.size() == 1);
        assert(s.users[0].name == "user_1");
        assert(s.users[0].password == rp_test::kSecretA);
    }
    {
        MemoryStore store;
        seed(store, rp::Protocol::Hysteria2, "");
        Endpoint ep = load(store, 10);
        UserInjector(store).inject(ep);
        const auto& s = std::get<Hysteria2Settings>(ep.settings);
        assert(s.users.size() == 1);
        assert(s.users[0].password == stripped);
    }
    {
        MemoryStore store;
        seed(store, rp::Protocol::Tuic, "");
        Endpoint ep = load(store, 10);
        UserInjector(store).inject(ep);
        const auto& s = std::get<TuicSettings>(ep.settings);
        assert(s.users.size() == 1);
        assert(s.users[0].uuid == rp_test::kSecretA);
        assert(s.users[0].password == stripped);
    }
    {
        MemoryStore store;
        seed(store, rp::Protocol::Shadowsocks, "");
        Endpoint ep = load(store, 10);
        UserInjector(store).inject(ep);
        const auto& s = std::get<ShadowsocksSettings>(ep.settings);
        assert(s.users.size() == 1);
        assert(s.users[0].password == stripped);
    }
}

void amneziawg_peers() {
    MemoryStore store;
    seed(store, rp::Protocol::AmneziaWg, "");
    Endpoint ep = load(store, 10);
    UserInjector(store).inject(ep);
    const auto& s = std::get<AmneziaWgSettings>(ep.settings);
    assert(s.peers.size() == 1);
    assert(s.peers[0].name == "user_1");
    assert(s.peers[0].address == "10.10.0.102");

    KeyPair kp;
    assert(derive_deterministic_key(rp_test::kSecretA, kp));
    assert(s.peers[0].public_key == kp.public_key);
    assert(s.peers[0].private_key == kp.private_key);
}

void amneziawg_addresses() {
    assert(amneziawg_client_address(0) == "10.10.0.2");
    assert(amneziawg_client_address(100) == "10.10.0.102");
    assert(amneziawg_client_address(249) == "10.10.0.251");
    assert(amneziawg_client_address(250) == "10.10.0.2");
    assert(amneziawg_client_address(-1) == "10.10.0.251");
}

void plans_resolve_through_node_and_group() {
    MemoryStore store;
    store.put_node(rp_test::make_node(1, "10.0.0.1"));
    store.put_inbound(rp_test::make_inbound(10, 1, "a", rp::Protocol::Trojan, 443, "{}"));
    rp::NodeGroup g;
    g.id = 4;
    g.name = "eu";
    store.put_group(g);
    store.add_group_member(4, 1);
    store.link_plan_node(2, 1);
    store.link_plan_group(3, 4);
    rp_test::add_subscription(store, 5, 2, 100, rp_test::kSecretA);
    rp_test::add_subscription(store, 6, 3, 101, rp_test::kSecretB);
    rp_test::add_subscription(store, 7, 9, 102, "unrelated-plan");

    Endpoint ep = load(store, 10);
    assert(UserInjector(store).inject(ep) == 2);
    const auto& s = std::get<TrojanSettings>(ep.settings);
    assert(s.users.size() == 2);
    assert(s.users[0].name == "user_5");
    assert(s.users[1].name == "user_6");
}

void unlinked_and_disabled_endpoints_stay_empty() {
    MemoryStore store;
    store.put_node(rp_test::make_node(1, "10.0.0.1"));
    store.put_inbound(rp_test::make_inbound(10, 1, "a", rp::Protocol::Trojan, 443, "{}"));
    rp::Inbound off = rp_test::make_inbound(11, 1, "b", rp::Protocol::Trojan, 444, "{}");
    off.enabled = false;
    store.put_inbound(off);
    store.link_plan_inbound(1, 11);
    rp_test::add_subscription(store, 1, 1, 100, rp_test::kSecretA);

    Endpoint unlinked = load(store, 10);
    assert(UserInjector(store).inject(unlinked) == 0);
    assert(user_count(unlinked.settings) == 0);

    Endpoint disabled = load(store, 11);
    assert(UserInjector(store).inject(disabled) == 0);
    assert(user_count(disabled.settings) == 0);
}

void reinjection_replaces_by_name() {
    MemoryStore store;
    store.put_node(rp_test::make_node(1, "10.0.0.1"));
    store.put_inbound(rp_test::make_inbound(
        10, 1, "a", rp::Protocol::Trojan, 443,
        R"({"users":[{"name":"user_1","password":"stale"},{"name":"static","password":"keep"}]})"));
    store.link_plan_inbound(1, 10);
    rp_test::add_subscription(store, 1, 1, 100, rp_test::kSecretA);

    Endpoint ep = load(store, 10);
    UserInjector injector(store);
    injector.inject(ep);
    injector.inject(ep);
    const auto& s = std::get<TrojanSettings>(ep.settings);
    assert(s.users.size() == 2);
    assert(s.users[0].name == "user_1" && s.users[0].password == rp_test::kSecretA);
    assert(s.users[1].name == "static" && s.users[1].password == "keep");
}

void malformed_settings_fail_to_load() {
    rp::Inbound ib = rp_test::make_inbound(1, 1, "bad", rp::Protocol::Vless, 443, R"({"clients":"oops"})");
    Endpoint ep;
    std::string err;
    assert(!load_endpoint(ib, ep, err));
    assert(err.find("settings") == 0);

    ib.settings = "{}";
    ib.stream_settings = "{not json";
    assert(!load_endpoint(ib, ep, err));
    assert(err.find("stream_settings") == 0);
}

} // namespace

int main() {
    rp_test::quiet_logs();

    vless_flow_depends_on_transport();
    password_protocols();
    amneziawg_peers();
    amneziawg_addresses();
    plans_resolve_through_node_and_group();
    unlinked_and_disabled_endpoints_stay_empty();
    reinjection_replaces_by_name();
    malformed_settings_fail_to_load();
    return 0;
}
