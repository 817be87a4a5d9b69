/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/singbox.hpp"
#include "rp/internal/keys.hpp"
#include "rp/internal/utils.hpp"
#include "rp/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <utility>

namespace rp::internal {

std::string normalize_reality_key(const std::string& key) {
    std::string k = trim_copy(key);
    std::string out;
    out.reserve(k.size());
    for (char c : k) {
        if (c == '=') continue;
        if (c == '+') out.push_back('-');
        else if (c == '/') out.push_back('_');
        else out.push_back(c);
    }
    return out;
}

namespace {

Json::Value string_array(const std::vector<std::string>& v) {
    Json::Value a(Json::arrayValue);
    for (const auto& s : v) a.append(s);
    return a;
}

Json::Value default_alpn() {
    Json::Value a(Json::arrayValue);
    a.append("h2");
    a.append("http/1.1");
    return a;
}

// "host:port" -> (host, port); port defaults to 443.
void split_dest(const std::string& dest, std::string& host, int& port) {
    host = dest;
    port = 443;
    const std::size_t colon = dest.rfind(':');
    if (colon == std::string::npos) return;
    host = dest.substr(0, colon);
    const std::string p = dest.substr(colon + 1);
    if (p.empty()) return;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(p.c_str(), &end, 10);
    if (errno == 0 && end && *end == '\0' && v > 0 && v <= 65535) port = static_cast<int>(v);
}

std::string node_sni(const rp::Node& node, const BuildOptions& opt) {
    return node.reality_sni.empty() ? opt.fallback_sni : node.reality_sni;
}

bool reality_tls(const rp::Node& node, const RealitySettings& r, const BuildOptions& opt,
                 Json::Value& tls, std::string& err) {
    const std::string key = normalize_reality_key(r.private_key.empty() ? node.reality_priv
                                                                        : r.private_key);
    if (!is_valid_private_key(key)) {
        err = "unusable reality private key";
        return false;
    }

    tls = Json::Value(Json::objectValue);
    tls["enabled"] = true;
    tls["server_name"] = r.server_names.empty() ? node_sni(node, opt) : r.server_names.front();
    tls["alpn"] = default_alpn();

    Json::Value& reality = tls["reality"];
    reality["enabled"] = true;
    std::string host;
    int port = 443;
    if (r.dest.empty()) host = node_sni(node, opt);
    else split_dest(r.dest, host, port);
    reality["handshake"]["server"] = host;
    reality["handshake"]["server_port"] = port;
    reality["private_key"] = key;

    std::vector<std::string> sids = r.short_ids;
    if (sids.empty() && !node.short_id.empty()) sids.push_back(node.short_id);
    reality["short_id"] = string_array(sids);
    return true;
}

// Certificate-backed TLS. `alpn` overrides both the stored and the default list.
Json::Value cert_tls(const std::optional<TlsSettings>& t, const std::string& default_sni,
                     const BuildOptions& opt, const Json::Value* alpn = nullptr) {
    Json::Value tls(Json::objectValue);
    tls["enabled"] = true;
    tls["server_name"] = (t && !t->server_name.empty()) ? t->server_name : default_sni;
    if (alpn) tls["alpn"] = *alpn;
    else if (t && !t->alpn.empty()) tls["alpn"] = string_array(t->alpn);
    else tls["alpn"] = default_alpn();

    std::string cert = opt.cert_path;
    std::string key = opt.key_path;
    if (t && !t->certificates.empty()) {
        const TlsCertificate& first = t->certificates.front();
        if (!first.certificate_file.empty()) cert = first.certificate_file;
        if (!first.key_file.empty()) key = first.key_file;
    }
    tls["certificate_path"] = cert;
    tls["key_path"] = key;
    return tls;
}

// TLS block for stream-carried protocols (VLESS, Trojan). Null when plain.
bool stream_tls(const rp::Node& node, const StreamSettings& s, const BuildOptions& opt,
                Json::Value& tls, std::string& err) {
    tls = Json::Value();
    if (s.security == "reality") {
        if (!s.reality) {
            err = "security=reality without reality settings";
            return false;
        }
        return reality_tls(node, *s.reality, opt, tls, err);
    }
    if (s.security == "tls") tls = cert_tls(s.tls, opt.fallback_sni, opt);
    return true;
}

Json::Value transport(const StreamSettings& s) {
    Json::Value t;
    const std::string& net = s.network;
    if (net == "ws") {
        t["type"] = "ws";
        t["path"] = s.ws ? s.ws->path : "/";
        if (s.ws && !s.ws->headers.empty()) {
            for (const auto& kv : s.ws->headers) t["headers"][kv.first] = kv.second;
        }
    } else if (net == "httpupgrade" || net == "xhttp" || net == "splithttp") {
        t["type"] = "httpupgrade";
        t["path"] = s.httpupgrade ? s.httpupgrade->path : "/";
        if (s.httpupgrade && !s.httpupgrade->host.empty()) t["host"] = s.httpupgrade->host;
    } else if (net == "grpc") {
        t["type"] = "grpc";
        t["service_name"] = s.grpc ? s.grpc->service_name : "";
    }
    return t;
}

Json::Value password_users(const std::vector<PasswordUser>& users, const char* name_key = "name") {
    Json::Value a(Json::arrayValue);
    for (const auto& u : users) {
        Json::Value j;
        j[name_key] = u.name;
        j["password"] = u.password;
        a.append(j);
    }
    return a;
}

struct TranslateVisitor {
    const rp::Node& node;
    const StreamSettings& stream;
    const BuildOptions& opt;
    Json::Value& out;
    std::string& err;

    bool operator()(const VlessSettings& s) const {
        out["type"] = "vless";
        Json::Value users(Json::arrayValue);
        for (const auto& c : s.clients) {
            Json::Value u;
            u["name"] = c.email;
            u["uuid"] = c.id;
            u["flow"] = c.flow;
            users.append(u);
        }
        out["users"] = users;
        if (!stream.packet_encoding.empty()) out["packet_encoding"] = stream.packet_encoding;
        return with_stream();
    }

    bool operator()(const TrojanSettings& s) const {
        out["type"] = "trojan";
        out["users"] = password_users(s.users);
        return with_stream();
    }

    bool operator()(const Hysteria2Settings& s) const {
        out["type"] = "hysteria2";
        out["users"] = password_users(s.users);
        if (s.up_mbps > 0) out["up_mbps"] = s.up_mbps;
        if (s.down_mbps > 0) out["down_mbps"] = s.down_mbps;
        if (!s.obfs_password.empty()) {
            out["obfs"]["type"] = "salamander";
            out["obfs"]["password"] = s.obfs_password;
        }
        if (!s.masquerade.empty()) {
            const bool local_dir = s.masquerade[0] == '/' && s.masquerade.find("://") == std::string::npos;
            out["masquerade"] = local_dir ? "file://" + s.masquerade : s.masquerade;
        }
        out["tls"] = quic_tls();
        return true;
    }

    bool operator()(const TuicSettings& s) const {
        out["type"] = "tuic";
        Json::Value users(Json::arrayValue);
        for (const auto& u : s.users) {
            Json::Value j;
            j["name"] = u.name;
            j["uuid"] = u.uuid;
            j["password"] = u.password;
            users.append(j);
        }
        out["users"] = users;
        out["congestion_control"] = s.congestion_control;
        out["zero_rtt_handshake"] = s.zero_rtt_handshake;
        out["tls"] = quic_tls();
        return true;
    }

    bool operator()(const NaiveSettings& s) const {
        out["type"] = "naive";
        out["users"] = password_users(s.users, "username");
        // Naive has no plaintext mode.
        if (stream.security == "reality" && stream.reality) {
            Json::Value tls;
            if (!reality_tls(node, *stream.reality, opt, tls, err)) return false;
            out["tls"] = tls;
        } else {
            out["tls"] = cert_tls(stream.tls, node_sni(node, opt), opt);
        }
        return true;
    }

    bool operator()(const ShadowsocksSettings& s) const {
        out["type"] = "shadowsocks";
        out["method"] = s.method;
        if (!s.password.empty()) out["password"] = s.password;
        out["users"] = password_users(s.users);
        return true;
    }

    bool operator()(const AmneziaWgSettings& s) const {
        if (s.private_key.empty()) {
            err = "amneziawg endpoint has no server key";
            return false;
        }
        out["type"] = "wireguard";
        out["private_key"] = s.private_key;
        out["address"] = Json::Value(Json::arrayValue);
        out["address"].append(s.address);
        out["mtu"] = s.mtu;
        Json::Value peers(Json::arrayValue);
        for (const auto& p : s.peers) {
            Json::Value j;
            j["name"] = p.name;
            j["public_key"] = p.public_key;
            j["allowed_ips"] = Json::Value(Json::arrayValue);
            j["allowed_ips"].append(p.address + "/32");
            peers.append(j);
        }
        out["peers"] = peers;
        out["jc"] = s.jc;
        out["jmin"] = s.jmin;
        out["jmax"] = s.jmax;
        out["s1"] = s.s1;
        out["s2"] = s.s2;
        out["h1"] = s.h1;
        out["h2"] = s.h2;
        out["h3"] = s.h3;
        out["h4"] = s.h4;
        return true;
    }

    bool with_stream() const {
        Json::Value tls;
        if (!stream_tls(node, stream, opt, tls, err)) return false;
        if (!tls.isNull()) out["tls"] = tls;
        Json::Value t = transport(stream);
        if (!t.isNull()) out["transport"] = t;
        return true;
    }

    Json::Value quic_tls() const {
        Json::Value h3(Json::arrayValue);
        h3.append("h3");
        return cert_tls(stream.tls, node_sni(node, opt), opt, &h3);
    }
};

Json::Value remote_rule_set(const std::string& tag, const BuildOptions& opt) {
    Json::Value rs;
    rs["tag"] = tag;
    rs["type"] = "remote";
    rs["format"] = "binary";
    rs["url"] = opt.rule_set_base + "/" + tag + ".srs";
    rs["download_detour"] = "direct";
    rs["update_interval"] = "24h";
    return rs;
}

Json::Value reject_rule_set(const std::string& tag) {
    Json::Value r;
    r["rule_set"] = Json::Value(Json::arrayValue);
    r["rule_set"].append(tag);
    r["action"] = "reject";
    return r;
}

} // namespace

bool translate_inbound(const rp::Node& node, const Endpoint& ep, const BuildOptions& opt,
                       Json::Value& out, std::string& err) {
    if (user_count(ep.settings) == 0) {
        err = "no users";
        return false;
    }
    Json::Value j(Json::objectValue);
    j["tag"] = ep.inbound.tag;
    j["listen"] = ep.inbound.listen_ip.empty() ? "::" : ep.inbound.listen_ip;
    j["listen_port"] = ep.inbound.listen_port;
    if (!std::visit(TranslateVisitor{node, ep.stream, opt, j, err}, ep.settings)) return false;
    out = std::move(j);
    return true;
}

Json::Value build_document(const rp::Node& node, const std::vector<Endpoint>& endpoints,
                           const std::optional<RelayOutbound>& relay, const BuildOptions& opt,
                           std::vector<std::string>* emitted) {
    const std::string who = "node=" + std::to_string(node.id);
    Json::Value doc(Json::objectValue);

    doc["log"]["level"] = opt.log_level;
    doc["log"]["timestamp"] = true;

    // ---- inbounds ----
    Json::Value inbounds(Json::arrayValue);
    for (const auto& ep : endpoints) {
        if (!ep.inbound.enabled) continue;
        Json::Value j;
        std::string err;
        if (!translate_inbound(node, ep, opt, j, err)) {
            rp::log_line("[SYNTH] " + who + " endpoint " + ep.inbound.tag + " dropped: " + err);
            continue;
        }
        inbounds.append(j);
        if (emitted) emitted->push_back(ep.inbound.tag);
    }
    doc["inbounds"] = inbounds;

    // ---- outbounds ----
    Json::Value outbounds(Json::arrayValue);
    Json::Value direct;
    direct["type"] = "direct";
    direct["tag"] = "direct";
    outbounds.append(direct);
    if (relay) {
        Json::Value r;
        r["type"] = "shadowsocks";
        r["tag"] = relay->tag;
        r["server"] = relay->server;
        r["server_port"] = relay->server_port;
        r["method"] = relay->method;
        r["password"] = relay->password;
        outbounds.append(r);
    }
    doc["outbounds"] = outbounds;

    // ---- route + dns ----
    const bool sinkhole = node.block_torrent || node.block_ads || node.block_porn;
    Json::Value rules(Json::arrayValue);
    Json::Value rule_sets(Json::arrayValue);
    Json::Value dns_rules(Json::arrayValue);

    Json::Value dns_rule;
    dns_rule["action"] = "route";
    dns_rule["protocol"] = Json::Value(Json::arrayValue);
    dns_rule["protocol"].append("dns");
    dns_rule["outbound"] = "direct";
    rules.append(dns_rule);

    if (node.block_torrent) {
        Json::Value bt;
        bt["protocol"] = Json::Value(Json::arrayValue);
        bt["protocol"].append("bittorrent");
        bt["action"] = "reject";
        rules.append(bt);
        rule_sets.append(remote_rule_set(kRuleSetP2p, opt));
        rules.append(reject_rule_set(kRuleSetP2p));
    }

    const std::pair<bool, const char*> blocked[] = {
        {node.block_ads, kRuleSetAds},
        {node.block_porn, kRuleSetPorn},
    };
    for (const auto& b : blocked) {
        if (!b.first) continue;
        rule_sets.append(remote_rule_set(b.second, opt));
        Json::Value d;
        d["rule_set"] = Json::Value(Json::arrayValue);
        d["rule_set"].append(b.second);
        d["server"] = "block";
        dns_rules.append(d);
        rules.append(reject_rule_set(b.second));
    }

    if (relay) {
        Json::Value r;
        r["action"] = "route";
        r["outbound"] = relay->tag;
        rules.append(r);
    }

    doc["route"]["rules"] = rules;
    if (!rule_sets.empty()) doc["route"]["rule_set"] = rule_sets;
    doc["route"]["default_domain_resolver"] = "google";

    Json::Value servers(Json::arrayValue);
    Json::Value google;
    google["tag"] = "google";
    google["type"] = "udp";
    google["server"] = opt.dns_resolver;
    servers.append(google);
    Json::Value local;
    local["tag"] = "local";
    local["type"] = "local";
    local["detour"] = "direct";
    servers.append(local);
    if (sinkhole) {
        Json::Value block;
        block["tag"] = "block";
        block["type"] = "udp";
        block["server"] = "127.0.0.1";
        servers.append(block);
    }
    doc["dns"]["servers"] = servers;
    if (!dns_rules.empty()) doc["dns"]["rules"] = dns_rules;
    doc["dns"]["final"] = "google";

    doc["experimental"]["clash_api"]["external_controller"] = opt.clash_api;

    rp::log_line("[SYNTH] " + who + " document: " + std::to_string(inbounds.size()) + " inbound(s), " +
                 (relay ? "relay-out" : "direct only"));
    return doc;
}

} // namespace rp::internal
