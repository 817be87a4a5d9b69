#include "rp/synthesizer.hpp"
#include "rp/internal/json_codec.hpp"
#include "rp/internal/protocol.hpp"
#include "rp/internal/templates.hpp"
#include "rp/internal/utils.hpp"

#include "test_fleet.hpp"

#include <cassert>
#include <map>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

using namespace rp::internal;

class RejectingValidator : public ConfigValidator {
public:
    ValidationResult validate(const std::string&) override {
        ++calls;
        return ValidationResult{ValidationStatus::Failed, "inbounds[0]: bad listen"};
    }
    int calls = 0;
};

const char* kTlsStream = R"({"network":"tcp","security":"tls"})";

// Node 1 in group 5 with a Trojan/TLS and a VLESS/Reality template; plan 1
// covers the group and carries one active subscription.
void seed_edge(MemoryStore& store) {
    store.put_node(rp_test::make_node(1, "10.0.0.1", "edge-token"));
    rp::NodeGroup g;
    g.id = 5;
    g.name = "edge";
    store.put_group(g);
    store.add_group_member(5, 1);
    store.put_template(rp_test::make_template(1, 5, rp::Protocol::Trojan, R"({"users":[]})",
                                              kTlsStream, 20000, 20100));
    store.put_template(rp_test::make_template(2, 5, rp::Protocol::Vless, R"({"clients":[]})",
                                              rp_test::kRealityStream, 30000, 30100));
    store.link_plan_group(1, 5);
    rp_test::add_subscription(store, 1, 1, 100, rp_test::kSecretA);
}

struct Rig {
    MemoryStore store;
    PinnedSniProvider sni;
    NullValidator validator;
    rp::Synthesizer synth{store, sni, validator};
};

void document_shape_and_hash() {
    Rig r;
    seed_edge(r.store);

    const rp::Document doc = r.synth.synthesize(1);
    assert(doc.text == write_json(doc.root));
    assert(doc.hash == sha256_hex(doc.text));

    const Json::Value& root = doc.root;
    assert(root["log"]["level"].asString() == "info");
    assert(root["inbounds"].size() == 2);
    assert(root["inbounds"][0]["tag"].asString() == "tpl_1");
    assert(root["inbounds"][0]["type"].asString() == "trojan");
    assert(root["inbounds"][0]["tls"]["enabled"].asBool());
    assert(root["inbounds"][1]["tag"].asString() == "tpl_2");
    assert(root["inbounds"][1]["type"].asString() == "vless");
    assert(root["inbounds"][1]["users"][0]["flow"].asString() == "xtls-rprx-vision");
    assert(root["inbounds"][1]["tls"]["reality"]["enabled"].asBool());
    assert(root["inbounds"][1]["tls"]["reality"]["handshake"]["server"].asString() == "www.microsoft.com");
    assert(root["inbounds"][1]["tls"]["reality"]["handshake"]["server_port"].asInt() == 443);

    assert(root["outbounds"].size() == 1);
    assert(root["outbounds"][0]["tag"].asString() == "direct");

    const Json::Value& rules = root["route"]["rules"];
    assert(rules.size() == 1);
    assert(rules[0]["protocol"][0].asString() == "dns");
    assert(rules[0]["outbound"].asString() == "direct");
    assert(!root["route"].isMember("rule_set"));

    assert(root["dns"]["servers"].size() == 2);
    assert(root["dns"]["final"].asString() == "google");
    assert(!root["dns"].isMember("rules"));
    assert(root["experimental"]["clash_api"]["external_controller"].asString() == "127.0.0.1:9090");

    // Nothing changed in between: same bytes, same hash.
    const rp::Document again = r.synth.synthesize(1);
    assert(again.hash == doc.hash);
}

void endpoints_without_users_are_dropped() {
    Rig r;
    seed_edge(r.store);
    // Expire the only subscription.
    rp_test::add_subscription(r.store, 1, 1, 100, rp_test::kSecretA, rp::SubscriptionStatus::Expired);

    const rp::Document doc = r.synth.synthesize(1);
    assert(doc.root["inbounds"].size() == 0);
    // Materialized all the same.
    assert(r.store.inbounds_for_node(1).size() == 2);
}

void malformed_and_disabled_inbounds_are_skipped() {
    Rig r;
    seed_edge(r.store);
    r.store.put_inbound(rp_test::make_inbound(50, 1, "broken", rp::Protocol::Trojan, 40000, "{bad"));
    rp::Inbound off = rp_test::make_inbound(51, 1, "off", rp::Protocol::Trojan, 40001,
                                            R"({"users":[{"name":"x","password":"y"}]})");
    off.enabled = false;
    r.store.put_inbound(off);

    const rp::Document doc = r.synth.synthesize(1);
    assert(doc.root["inbounds"].size() == 2);
    for (const auto& ib : doc.root["inbounds"]) {
        assert(ib["tag"].asString() != "broken");
        assert(ib["tag"].asString() != "off");
    }
}

void oversized_numbers_skip_only_their_endpoint() {
    Rig r;
    seed_edge(r.store);
    r.store.put_inbound(rp_test::make_inbound(52, 1, "hy_fast", rp::Protocol::Hysteria2, 40002,
                                              R"({"users":[],"up_mbps":3000000000})"));
    r.store.put_inbound(rp_test::make_inbound(
        53, 1, "vl_xver", rp::Protocol::Vless, 40003, R"({"clients":[]})",
        R"({"network":"tcp","security":"reality","reality_settings":{"xver":3000000000}})"));
    r.store.put_inbound(rp_test::make_inbound(54, 1, "awg_h1", rp::Protocol::AmneziaWg, 40004,
                                              R"({"private_key":"x","h1":-1})"));

    const rp::Document doc = r.synth.synthesize(1);
    assert(doc.root["inbounds"].size() == 2);
    assert(doc.root["inbounds"][0]["tag"].asString() == "tpl_1");
    assert(doc.root["inbounds"][1]["tag"].asString() == "tpl_2");

    ProtocolSettings ps;
    std::string err;
    assert(!parse_protocol_settings(rp::Protocol::Hysteria2, R"({"up_mbps":3000000000})", ps, err));
    assert(err.find("up_mbps") != std::string::npos);
    assert(parse_protocol_settings(rp::Protocol::Hysteria2, R"({"up_mbps":100.0})", ps, err));
    assert(std::get<Hysteria2Settings>(ps).up_mbps == 100);
}

void masquerade_and_packet_encoding_carry_through() {
    Rig r;
    seed_edge(r.store);
    r.store.put_inbound(rp_test::make_inbound(60, 1, "hy_dir", rp::Protocol::Hysteria2, 40010,
                                              R"({"users":[],"masquerade":"/var/www/decoy"})"));
    r.store.put_inbound(rp_test::make_inbound(61, 1, "hy_url", rp::Protocol::Hysteria2, 40011,
                                              R"({"users":[],"masquerade":"https://example.org"})"));
    r.store.put_inbound(rp_test::make_inbound(62, 1, "vl_pe", rp::Protocol::Vless, 40012,
                                              R"({"clients":[]})",
                                              R"({"network":"ws","packetEncoding":"xudp"})"));

    const rp::Document doc = r.synth.synthesize(1);
    std::map<std::string, Json::Value> by_tag;
    for (const auto& ib : doc.root["inbounds"]) by_tag[ib["tag"].asString()] = ib;
    assert(by_tag.size() == 5);
    assert(by_tag["hy_dir"]["masquerade"].asString() == "file:///var/www/decoy");
    assert(by_tag["hy_url"]["masquerade"].asString() == "https://example.org");
    assert(by_tag["vl_pe"]["packet_encoding"].asString() == "xudp");
    assert(by_tag["vl_pe"]["transport"]["type"].asString() == "ws");
    assert(!by_tag["tpl_2"].isMember("packet_encoding"));
    assert(!by_tag["tpl_1"].isMember("masquerade"));

    // Stored form keeps both as written.
    ProtocolSettings ps;
    std::string err;
    assert(parse_protocol_settings(rp::Protocol::Hysteria2, R"({"masquerade":"/var/www/decoy"})", ps, err));
    assert(dump_protocol_settings(ps)["masquerade"].asString() == "/var/www/decoy");
    StreamSettings s;
    assert(parse_stream_settings(R"({"packet_encoding":"packetaddr"})", s, err));
    assert(s.packet_encoding == "packetaddr");
    assert(dump_stream_settings(s)["packet_encoding"].asString() == "packetaddr");
}

void concurrent_default_bootstrap_converges() {
    Rig r;
    rp::NodeGroup def;
    def.id = 1;
    def.name = kDefaultGroupName;
    r.store.put_group(def);
    const int kNodes = 8;
    for (int i = 1; i <= kNodes; ++i) {
        r.store.put_node(rp_test::make_node(i, "10.0.1." + std::to_string(i)));
        r.store.add_group_member(1, i);
    }

    std::vector<std::thread> workers;
    for (int i = 1; i <= kNodes; ++i) {
        workers.emplace_back([&r, i] { r.synth.synthesize(i); });
    }
    for (auto& w : workers) w.join();

    const auto templates = r.store.templates_for_group(1);
    assert(templates.size() == 1);
    for (int i = 1; i <= kNodes; ++i) {
        // Re-sync must keep working on the single-port default range.
        r.synth.synthesize(i);
        const auto inbounds = r.store.inbounds_for_node(i);
        assert(inbounds.size() == 1);
        assert(inbounds[0].tag == template_tag(templates[0].id));
        assert(inbounds[0].listen_port == 10000);
    }
}

void content_policy_rules() {
    Rig r;
    rp::Node n = rp_test::make_node(1, "10.0.0.1");
    n.block_ads = true;
    n.block_porn = true;
    n.block_torrent = true;
    r.store.put_node(n);

    const rp::Document doc = r.synth.synthesize(1);
    const Json::Value& rules = doc.root["route"]["rules"];
    assert(rules.size() == 5);
    assert(rules[0]["protocol"][0].asString() == "dns");
    assert(rules[1]["protocol"][0].asString() == "bittorrent");
    assert(rules[1]["action"].asString() == "reject");
    assert(rules[2]["rule_set"][0].asString() == kRuleSetP2p);
    assert(rules[3]["rule_set"][0].asString() == kRuleSetAds);
    assert(rules[4]["rule_set"][0].asString() == kRuleSetPorn);
    for (Json::ArrayIndex i = 1; i < rules.size(); ++i) {
        assert(rules[i]["action"].asString() == "reject");
    }

    const Json::Value& sets = doc.root["route"]["rule_set"];
    assert(sets.size() == 3);
    assert(sets[1]["url"].asString() ==
           "https://raw.githubusercontent.com/SagerNet/sing-geosite/rule-set/geosite-category-ads-all.srs");

    const Json::Value& dns = doc.root["dns"];
    assert(dns["servers"].size() == 3);
    assert(dns["servers"][2]["tag"].asString() == "block");
    assert(dns["rules"].size() == 2);
    assert(dns["rules"][0]["server"].asString() == "block");
}

void torrent_only_still_gets_sinkhole() {
    Rig r;
    rp::Node n = rp_test::make_node(1, "10.0.0.1");
    n.block_torrent = true;
    r.store.put_node(n);

    const rp::Document doc = r.synth.synthesize(1);
    assert(doc.root["route"]["rules"].size() == 3);
    assert(doc.root["dns"]["servers"].size() == 3);
    assert(doc.root["dns"]["servers"][2]["tag"].asString() == "block");
    assert(doc.root["dns"]["servers"][2]["server"].asString() == "127.0.0.1");
    assert(!doc.root["dns"].isMember("rules"));

    // No policy at all: no sinkhole.
    n.block_torrent = false;
    r.store.put_node(n);
    assert(r.synth.synthesize(1).root["dns"]["servers"].size() == 2);
}

// Relay 1 -> target 2; target's Shadowsocks listener has no subscribers.
void seed_relay(MemoryStore& store) {
    rp::Node relay = rp_test::make_node(1, "10.0.0.1", "relay-token");
    relay.is_relay = true;
    relay.relay_id = 2;
    store.put_node(relay);
    store.put_node(rp_test::make_node(2, "203.0.113.7", "target-token"));
    store.put_inbound(rp_test::make_inbound(
        20, 2, "ss", rp::Protocol::Shadowsocks, 8443,
        R"({"method":"2022-blake3-aes-128-gcm","password":"c2VydmVyLWtleS0xNmJ5dA=="})"));
}

void relay_wiring_on_both_ends() {
    Rig r;
    seed_relay(r.store);

    const rp::Document relay_doc = r.synth.synthesize(1);
    const Json::Value& outs = relay_doc.root["outbounds"];
    assert(outs.size() == 2);
    assert(outs[1]["tag"].asString() == "relay-out");
    assert(outs[1]["type"].asString() == "shadowsocks");
    assert(outs[1]["server"].asString() == "203.0.113.7");
    assert(outs[1]["server_port"].asInt() == 8443);
    assert(outs[1]["password"].asString() == sha256_hex("relay-token:relay:2"));
    const Json::Value& rules = relay_doc.root["route"]["rules"];
    assert(rules[rules.size() - 1]["outbound"].asString() == "relay-out");

    // Default mode is Dual: derived and legacy credentials both admitted,
    // and they keep the listener alive without any subscriber.
    const rp::Document target_doc = r.synth.synthesize(2);
    assert(target_doc.root["inbounds"].size() == 1);
    const Json::Value& users = target_doc.root["inbounds"][0]["users"];
    assert(users.size() == 2);
    assert(users[0]["name"].asString() == "relay_1");
    assert(users[0]["password"].asString() == sha256_hex("relay-token:relay:2"));
    assert(users[1]["name"].asString() == "relay_1_legacy");
    assert(users[1]["password"].asString() == "relay-token");
}

void stored_mode_is_read_per_synthesis() {
    Rig r;
    seed_relay(r.store);
    assert(r.synth.relay_mode() == rp::RelayAuthMode::Dual);

    r.store.set_setting("relay_auth_mode", "v1");
    assert(r.synth.relay_mode() == rp::RelayAuthMode::V1);
    const rp::Document v1 = r.synth.synthesize(2);
    assert(v1.root["inbounds"][0]["users"].size() == 1);

    r.store.set_setting("relay_auth_mode", "legacy");
    const rp::Document legacy = r.synth.synthesize(1);
    assert(legacy.root["outbounds"][1]["password"].asString() == "relay-token");

    // An explicit override beats the stored value.
    rp::SynthOptions opt;
    opt.relay_auth_mode = rp::RelayAuthMode::V1;
    rp::Synthesizer pinned(r.store, r.sni, r.validator, opt);
    assert(pinned.relay_mode() == rp::RelayAuthMode::V1);
    const rp::Document doc = pinned.synthesize(1);
    assert(doc.root["outbounds"][1]["password"].asString() == sha256_hex("relay-token:relay:2"));
}

void failures_surface_as_errors() {
    Rig r;
    bool thrown = false;
    try {
        r.synth.synthesize(999);
    } catch (const rp::NodeNotFound& e) {
        thrown = true;
        assert(e.node_id() == 999);
    }
    assert(thrown);

    MemoryStore store;
    seed_edge(store);
    PinnedSniProvider sni;
    RejectingValidator reject;
    rp::Synthesizer synth(store, sni, reject);
    thrown = false;
    try {
        synth.synthesize(1);
    } catch (const rp::ValidationError& e) {
        thrown = true;
        assert(e.output() == "inbounds[0]: bad listen");
    }
    assert(thrown);
    assert(reject.calls == 1);
}

void exhausted_template_aborts() {
    Rig r;
    seed_edge(r.store);
    // Occupies the Trojan template's only port.
    r.store.put_template(rp_test::make_template(1, 5, rp::Protocol::Trojan, R"({"users":[]})",
                                                kTlsStream, 20000, 20000));
    r.store.put_inbound(rp_test::make_inbound(60, 1, "manual", rp::Protocol::Trojan, 20000, "{}"));

    bool thrown = false;
    try {
        r.synth.synthesize(1);
    } catch (const rp::PortExhaustion&) {
        thrown = true;
    }
    assert(thrown);
}

void group_sync_and_rotation() {
    Rig r;
    seed_edge(r.store);
    r.store.put_node(rp_test::make_node(3, "10.0.0.3"));
    r.store.add_group_member(5, 3);

    assert(r.synth.sync_group(5) == 4);
    assert(r.store.inbounds_for_node(1).size() == 2);
    assert(r.store.inbounds_for_node(3).size() == 2);
    const auto notified = r.store.notified();
    assert(notified.size() == 2);

    rp::Inbound ib;
    assert(r.store.find_inbound(3, "tpl_1", ib));
    assert(r.synth.rotate_inbound(ib.id));
    assert(r.store.notified().size() == 3);
    assert(r.store.notified().back() == 3);
    assert(!r.synth.rotate_inbound(12345));
}

} // namespace

int main() {
    rp_test::quiet_logs();

    document_shape_and_hash();
    endpoints_without_users_are_dropped();
    malformed_and_disabled_inbounds_are_skipped();
    oversized_numbers_skip_only_their_endpoint();
    masquerade_and_packet_encoding_carry_through();
    concurrent_default_bootstrap_converges();
    content_policy_rules();
    torrent_only_still_gets_sinkhole();
    relay_wiring_on_both_ends();
    stored_mode_is_read_per_synthesis();
    failures_surface_as_errors();
    exhausted_template_aborts();
    group_sync_and_rotation();
    return 0;
}
