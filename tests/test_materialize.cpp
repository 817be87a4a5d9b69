#include "rp/internal/keys.hpp"
#include "rp/internal/protocol.hpp"
#include "rp/internal/templates.hpp"
#include "rp/errors.hpp"

#include "test_fleet.hpp"

#include <algorithm>
#include <cassert>
#include <string>
#include <variant>

namespace {

using namespace rp::internal;

constexpr int64_t kNow = 1700000000;

struct Fixture {
    MemoryStore store;
    PinnedSniProvider sni{"www.google.com"};
    PortAllocator ports{store};
    EndpointMaterializer materializer{store, sni, ports};

    rp::Node node() {
        rp::Node n;
        assert(store.get_node(1, n));
        return n;
    }
};

void materialize_is_idempotent() {
    Fixture f;
    f.store.put_node(rp_test::make_node(1, "10.0.0.1"));
    const rp::InboundTemplate tpl = rp_test::make_template(
        7, 5, rp::Protocol::Trojan, R"({"users":[],"note":"{{uuid}}"})",
        R"({"network":"tcp","security":"tls"})", 20000, 20100);
    f.store.put_template(tpl);

    rp::Node n = f.node();
    const rp::Inbound first = f.materializer.materialize(n, tpl, kNow);
    assert(first.tag == "tpl_7");
    assert(first.listen_port >= 20000 && first.listen_port <= 20100);
    assert(first.template_id && *first.template_id == 7);
    assert(first.last_rotated_at == kNow);

    const rp::Inbound second = f.materializer.materialize(n, tpl, kNow + 60);
    assert(second.id == first.id);
    assert(second.listen_port == first.listen_port);
    assert(second.settings == first.settings);
    assert(second.last_rotated_at == kNow);
    assert(f.store.inbounds_for_node(1).size() == 1);

    // tls without a server name picks up the camouflage domain
    StreamSettings s;
    std::string err;
    assert(parse_stream_settings(second.stream_settings, s, err));
    assert(s.tls && s.tls->server_name == "www.google.com");
}

void out_of_range_port_migrates() {
    Fixture f;
    f.store.put_node(rp_test::make_node(1, "10.0.0.1"));
    rp::InboundTemplate tpl = rp_test::make_template(
        3, 5, rp::Protocol::Trojan, R"({"users":[]})", "", 20000, 20000);
    f.store.put_template(tpl);

    rp::Node n = f.node();
    const rp::Inbound first = f.materializer.materialize(n, tpl, kNow);
    assert(first.listen_port == 20000);

    tpl.port_range_start = 31010;
    tpl.port_range_end = 31000;   // inverted on purpose
    const rp::Inbound moved = f.materializer.materialize(n, tpl, kNow);
    assert(moved.id == first.id);
    assert(moved.listen_port >= 31000 && moved.listen_port <= 31010);
}

void exhaustion_propagates() {
    Fixture f;
    f.store.put_node(rp_test::make_node(1, "10.0.0.1"));
    f.store.put_inbound(rp_test::make_inbound(1, 1, "manual", rp::Protocol::Trojan, 25000, "{}"));
    const rp::InboundTemplate tpl = rp_test::make_template(
        4, 5, rp::Protocol::Trojan, R"({"users":[]})", "", 25000, 25000);
    f.store.put_template(tpl);

    rp::Node n = f.node();
    bool thrown = false;
    try {
        f.materializer.materialize(n, tpl, kNow);
    } catch (const rp::PortExhaustion&) {
        thrown = true;
    }
    assert(thrown);
    assert(f.store.inbounds_for_node(1).size() == 1);
}

void default_group_bootstraps_reality_template() {
    Fixture f;
    f.store.put_node(rp_test::make_node(1, "10.0.0.1"));
    rp::NodeGroup def;
    def.id = 1;
    def.name = kDefaultGroupName;
    f.store.put_group(def);
    f.store.add_group_member(1, 1);

    TemplateResolver resolver(f.store);
    rp::Node n = f.node();
    const auto templates = resolver.resolve(n);
    assert(templates.size() == 1);
    const rp::InboundTemplate& tpl = templates.front();
    assert(tpl.protocol == rp::Protocol::Vless);
    assert(tpl.group_id == 1);
    assert(template_uses_reality(tpl));

    // Second resolve finds the stored template instead of creating another.
    const auto again = resolver.resolve(n);
    assert(again.size() == 1 && again.front().id == tpl.id);

    const rp::Inbound ib = f.materializer.materialize(n, tpl, kNow);
    assert(ib.listen_port == 10000);

    // Keys were healed and persisted before rendering.
    const rp::Node stored = f.node();
    assert(is_valid_private_key(stored.reality_priv));
    assert(stored.short_id.size() == 16);

    StreamSettings s;
    std::string err;
    assert(parse_stream_settings(ib.stream_settings, s, err));
    assert(s.security == "reality");
    assert(s.reality);
    assert(s.reality->private_key == stored.reality_priv);
    assert(s.reality->server_names.size() == 1 && s.reality->server_names[0] == "drive.google.com");
    assert(std::find(s.reality->short_ids.begin(), s.reality->short_ids.end(), stored.short_id) !=
           s.reality->short_ids.end());
}

void node_outside_default_gets_nothing() {
    Fixture f;
    f.store.put_node(rp_test::make_node(1, "10.0.0.1"));
    rp::NodeGroup def;
    def.id = 1;
    def.name = kDefaultGroupName;
    f.store.put_group(def);

    TemplateResolver resolver(f.store);
    assert(resolver.resolve(f.node()).empty());
}

void node_sni_override_wins() {
    Fixture f;
    rp::Node seeded = rp_test::make_node(1, "10.0.0.1");
    seeded.reality_sni = "www.apple.com";
    f.store.put_node(seeded);
    const rp::InboundTemplate tpl = rp_test::make_template(
        9, 5, rp::Protocol::Vless, R"({"clients":[]})", rp_test::kRealityStream, 21000, 21100);
    f.store.put_template(tpl);

    rp::Node n = f.node();
    const rp::Inbound ib = f.materializer.materialize(n, tpl, kNow);
    StreamSettings s;
    std::string err;
    assert(parse_stream_settings(ib.stream_settings, s, err));
    assert(s.reality);
    assert(s.reality->server_names.size() == 1 && s.reality->server_names[0] == "www.apple.com");
    assert(s.reality->dest == "www.apple.com:443");
    assert(s.reality->private_key == n.reality_priv);
}

void sni_selection() {
    PinnedSniProvider sni("www.google.com");
    rp::Node n = rp_test::make_node(1, "10.0.0.1");
    assert(choose_sni(sni, n) == "www.google.com");

    n.domain = "edge.example.net";
    assert(choose_sni(sni, n) == "edge.example.net");

    // A generic answer loses to the node's own override.
    n.reality_sni = "www.apple.com";
    assert(choose_sni(sni, n) == "www.apple.com");

    sni.pin(1, "cdn.example.org");
    assert(choose_sni(sni, n) == "cdn.example.org");
    sni.pin(1, "drive.google.com");
    assert(choose_sni(sni, n) == "www.apple.com");
}

void pinned_sni_reaches_the_endpoint() {
    Fixture f;
    f.store.put_node(rp_test::make_node(1, "10.0.0.1"));
    f.sni.pin(1, "cdn.example.org");
    const rp::InboundTemplate tpl = rp_test::make_template(
        13, 5, rp::Protocol::Trojan, R"({"users":[]})",
        R"({"network":"tcp","security":"tls","tls_settings":{"server_name":"{{ pool_sni }}"}})",
        23000, 23100);
    f.store.put_template(tpl);

    rp::Node n = f.node();
    const rp::Inbound ib = f.materializer.materialize(n, tpl, kNow);
    StreamSettings s;
    std::string err;
    assert(parse_stream_settings(ib.stream_settings, s, err));
    assert(s.tls && s.tls->server_name == "cdn.example.org");
}

void amneziawg_server_keys_survive_rematerialization() {
    Fixture f;
    f.store.put_node(rp_test::make_node(1, "10.0.0.1"));
    const rp::InboundTemplate tpl = rp_test::make_template(
        11, 5, rp::Protocol::AmneziaWg, R"({"mtu":1380})", "", 51000, 51100);
    f.store.put_template(tpl);

    rp::Node n = f.node();
    const rp::Inbound first = f.materializer.materialize(n, tpl, kNow);
    ProtocolSettings ps;
    std::string err;
    assert(parse_protocol_settings(rp::Protocol::AmneziaWg, first.settings, ps, err));
    const AmneziaWgSettings a = std::get<AmneziaWgSettings>(ps);
    assert(a.private_key.size() == 44);
    assert(!a.public_key.empty());
    assert(a.mtu == 1380);
    assert(a.jc >= 3 && a.jc <= 10);
    assert(a.jmin >= 40 && a.jmin <= 100);
    assert(a.jmax >= 500 && a.jmax <= 1000);

    const rp::Inbound second = f.materializer.materialize(n, tpl, kNow);
    assert(parse_protocol_settings(rp::Protocol::AmneziaWg, second.settings, ps, err));
    const AmneziaWgSettings b = std::get<AmneziaWgSettings>(ps);
    assert(b.private_key == a.private_key);
    assert(b.public_key == a.public_key);
    assert(b.jc == a.jc && b.h1 == a.h1 && b.h4 == a.h4);
}

void rotation_moves_port_and_stamps_time() {
    Fixture f;
    f.store.put_node(rp_test::make_node(1, "10.0.0.1"));
    rp::InboundTemplate tpl = rp_test::make_template(
        12, 5, rp::Protocol::Trojan, R"({"users":[]})", "", 22000, 22001);
    tpl.rotation_interval_hours = 1;
    f.store.put_template(tpl);

    rp::Node n = f.node();
    const rp::Inbound first = f.materializer.materialize(n, tpl, kNow);

    // Not due yet.
    assert(f.materializer.rotate_due(n, kNow + 1800) == 0);

    assert(f.materializer.rotate_due(n, kNow + 3600) == 1);
    rp::Inbound after;
    assert(f.store.get_inbound(first.id, after));
    assert(after.listen_port != first.listen_port);
    assert(after.listen_port == 22000 || after.listen_port == 22001);
    assert(after.last_rotated_at == kNow + 3600);

    rp::Inbound out;
    assert(!f.materializer.rotate(9999, kNow, out));
}

// Every upsert of one tag loses the port race.
class ContendedStore : public MemoryStore {
public:
    UpsertResult upsert_inbound(rp::Inbound& ib) override {
        if (ib.tag == contended) return UpsertResult::PortConflict;
        return MemoryStore::upsert_inbound(ib);
    }
    std::string contended;
};

void failed_rotation_does_not_block_the_rest() {
    ContendedStore store;
    PinnedSniProvider sni("www.google.com");
    PortAllocator ports(store);
    EndpointMaterializer materializer(store, sni, ports);

    store.put_node(rp_test::make_node(1, "10.0.0.1"));
    rp::InboundTemplate a = rp_test::make_template(
        31, 5, rp::Protocol::Trojan, R"({"users":[]})", "", 24000, 24100);
    rp::InboundTemplate b = rp_test::make_template(
        32, 5, rp::Protocol::Trojan, R"({"users":[]})", "", 25000, 25100);
    a.rotation_interval_hours = 1;
    b.rotation_interval_hours = 1;
    store.put_template(a);
    store.put_template(b);

    rp::Node n;
    assert(store.get_node(1, n));
    const rp::Inbound ia = materializer.materialize(n, a, kNow);
    const rp::Inbound ib = materializer.materialize(n, b, kNow);
    assert(ia.id < ib.id);

    store.contended = "tpl_31";
    assert(materializer.rotate_due(n, kNow + 7200) == 1);

    rp::Inbound after_a, after_b;
    assert(store.get_inbound(ia.id, after_a));
    assert(store.get_inbound(ib.id, after_b));
    assert(after_a.last_rotated_at == kNow);
    assert(after_a.listen_port == ia.listen_port);
    assert(after_b.last_rotated_at == kNow + 7200);
}

} // namespace

int main() {
    rp_test::quiet_logs();

    materialize_is_idempotent();
    out_of_range_port_migrates();
    exhaustion_propagates();
    default_group_bootstraps_reality_template();
    node_outside_default_gets_nothing();
    node_sni_override_wins();
    sni_selection();
    pinned_sni_reaches_the_endpoint();
    amneziawg_server_keys_survive_rematerialization();
    rotation_moves_port_and_stamps_time();
    failed_rotation_does_not_block_the_rest();
    return 0;
}
