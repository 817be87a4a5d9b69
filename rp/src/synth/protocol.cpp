/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/protocol.hpp"
#include "rp/internal/json_codec.hpp"

namespace rp::internal {

namespace {

// First present member among the spellings.
const Json::Value& field(const Json::Value& obj, const char* snake, const char* camel = nullptr) {
    static const Json::Value null_value;
    if (!obj.isObject()) return null_value;
    if (obj.isMember(snake)) return obj[snake];
    if (camel && obj.isMember(camel)) return obj[camel];
    return null_value;
}

std::string str_of(const Json::Value& v, const std::string& def = "") {
    return v.isString() ? v.asString() : def;
}

// Absent or non-numeric keeps `out`; a number that is not an int is an error.
bool int_of(const Json::Value& v, const char* name, int& out, std::string& err) {
    if (!v.isNumeric()) return true;
    if (!v.isInt()) {
        err = std::string(name) + " is not a 32-bit integer";
        return false;
    }
    out = v.asInt();
    return true;
}

bool u32_of(const Json::Value& v, const char* name, uint32_t& out, std::string& err) {
    if (!v.isNumeric()) return true;
    if (!v.isUInt()) {
        err = std::string(name) + " is not an unsigned 32-bit integer";
        return false;
    }
    out = v.asUInt();
    return true;
}

std::vector<std::string> strings_of(const Json::Value& v) {
    std::vector<std::string> out;
    if (v.isArray()) {
        for (const auto& e : v) {
            if (e.isString()) out.push_back(e.asString());
        }
    } else if (v.isString()) {
        out.push_back(v.asString());
    }
    return out;
}

Json::Value strings_to_json(const std::vector<std::string>& v) {
    Json::Value arr(Json::arrayValue);
    for (const auto& s : v) arr.append(s);
    return arr;
}

bool read_root(const std::string& body, Json::Value& root, std::string& err) {
    std::string text = body;
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) text = "{}";
    if (!parse_json(text, root, err)) return false;
    if (!root.isObject()) {
        err = "settings must be a JSON object";
        return false;
    }
    return true;
}

// users[] or xray-style clients[]; name falls back to email / username.
bool read_password_users(const Json::Value& root, std::vector<PasswordUser>& out, std::string& err) {
    const Json::Value& arr = root.isMember("users") ? root["users"] : root["clients"];
    if (arr.isNull()) return true;
    if (!arr.isArray()) {
        err = "users must be an array";
        return false;
    }
    for (const auto& u : arr) {
        if (!u.isObject()) continue;
        PasswordUser pu;
        pu.name = str_of(u["name"]);
        if (pu.name.empty()) pu.name = str_of(u["email"]);
        if (pu.name.empty()) pu.name = str_of(u["username"]);
        pu.password = str_of(u["password"]);
        out.push_back(pu);
    }
    return true;
}

Json::Value password_users_to_json(const std::vector<PasswordUser>& users, const char* name_key) {
    Json::Value arr(Json::arrayValue);
    for (const auto& u : users) {
        Json::Value e(Json::objectValue);
        e[name_key] = u.name;
        e["password"] = u.password;
        arr.append(e);
    }
    return arr;
}

} // namespace

/* ---------------- protocol settings ---------------- */

bool parse_protocol_settings(rp::Protocol p, const std::string& body,
                             ProtocolSettings& out, std::string& err) {
    Json::Value root;
    if (!read_root(body, root, err)) return false;

    switch (p) {
    case rp::Protocol::Vless: {
        VlessSettings s;
        const Json::Value& arr = root["clients"];
        if (!arr.isNull() && !arr.isArray()) { err = "clients must be an array"; return false; }
        for (const auto& c : arr) {
            if (!c.isObject()) continue;
            s.clients.push_back(VlessClient{str_of(c["id"]), str_of(c["email"]), str_of(c["flow"])});
        }
        s.decryption = str_of(root["decryption"], "none");
        out = s;
        return true;
    }
    case rp::Protocol::Hysteria2: {
        Hysteria2Settings s;
        if (!read_password_users(root, s.users, err)) return false;
        if (!int_of(field(root, "up_mbps", "upMbps"), "up_mbps", s.up_mbps, err) ||
            !int_of(field(root, "down_mbps", "downMbps"), "down_mbps", s.down_mbps, err)) {
            return false;
        }
        const Json::Value& obfs = root["obfs"];
        if (obfs.isObject()) s.obfs_password = str_of(obfs["password"]);
        s.masquerade = str_of(root["masquerade"]);
        out = s;
        return true;
    }
    case rp::Protocol::Trojan: {
        TrojanSettings s;
        if (!read_password_users(root, s.users, err)) return false;
        out = s;
        return true;
    }
    case rp::Protocol::Tuic: {
        TuicSettings s;
        const Json::Value& arr = root["users"];
        if (!arr.isNull() && !arr.isArray()) { err = "users must be an array"; return false; }
        for (const auto& u : arr) {
            if (!u.isObject()) continue;
            s.users.push_back(TuicUser{str_of(u["name"]), str_of(u["uuid"]), str_of(u["password"])});
        }
        s.congestion_control = str_of(field(root, "congestion_control", "congestionControl"), "bbr");
        const Json::Value& zr = field(root, "zero_rtt_handshake", "zeroRttHandshake");
        s.zero_rtt_handshake = zr.isBool() && zr.asBool();
        out = s;
        return true;
    }
    case rp::Protocol::Naive: {
        NaiveSettings s;
        if (!read_password_users(root, s.users, err)) return false;
        out = s;
        return true;
    }
    case rp::Protocol::Shadowsocks: {
        ShadowsocksSettings s;
        if (!read_password_users(root, s.users, err)) return false;
        s.method = str_of(root["method"], "chacha20-ietf-poly1305");
        if (s.method.empty()) s.method = "chacha20-ietf-poly1305";
        s.password = str_of(root["password"]);
        out = s;
        return true;
    }
    case rp::Protocol::AmneziaWg: {
        AmneziaWgSettings s;
        s.private_key = str_of(field(root, "private_key", "privateKey"));
        s.public_key = str_of(field(root, "public_key", "publicKey"));
        s.address = str_of(root["address"], "10.10.0.1/24");
        const bool numbers_ok =
            int_of(root["mtu"], "mtu", s.mtu, err) &&
            int_of(root["jc"], "jc", s.jc, err) &&
            int_of(root["jmin"], "jmin", s.jmin, err) &&
            int_of(root["jmax"], "jmax", s.jmax, err) &&
            int_of(root["s1"], "s1", s.s1, err) &&
            int_of(root["s2"], "s2", s.s2, err) &&
            u32_of(root["h1"], "h1", s.h1, err) &&
            u32_of(root["h2"], "h2", s.h2, err) &&
            u32_of(root["h3"], "h3", s.h3, err) &&
            u32_of(root["h4"], "h4", s.h4, err);
        if (!numbers_ok) return false;
        const Json::Value& arr = root["peers"];
        if (!arr.isNull() && !arr.isArray()) { err = "peers must be an array"; return false; }
        for (const auto& pe : arr) {
            if (!pe.isObject()) continue;
            s.peers.push_back(AmneziaWgPeer{str_of(pe["name"]),
                                            str_of(field(pe, "public_key", "publicKey")),
                                            str_of(field(pe, "private_key", "privateKey")),
                                            str_of(pe["address"])});
        }
        out = s;
        return true;
    }
    }
    err = "unknown protocol";
    return false;
}

namespace {

struct DumpVisitor {
    Json::Value operator()(const VlessSettings& s) const {
        Json::Value v(Json::objectValue);
        v["clients"] = Json::Value(Json::arrayValue);
        for (const auto& c : s.clients) {
            Json::Value e(Json::objectValue);
            e["id"] = c.id;
            e["email"] = c.email;
            e["flow"] = c.flow;
            v["clients"].append(e);
        }
        v["decryption"] = s.decryption;
        return v;
    }
    Json::Value operator()(const Hysteria2Settings& s) const {
        Json::Value v(Json::objectValue);
        v["users"] = password_users_to_json(s.users, "name");
        if (s.up_mbps > 0) v["up_mbps"] = s.up_mbps;
        if (s.down_mbps > 0) v["down_mbps"] = s.down_mbps;
        if (!s.obfs_password.empty()) {
            v["obfs"]["type"] = "salamander";
            v["obfs"]["password"] = s.obfs_password;
        }
        if (!s.masquerade.empty()) v["masquerade"] = s.masquerade;
        return v;
    }
    Json::Value operator()(const TrojanSettings& s) const {
        Json::Value v(Json::objectValue);
        v["users"] = password_users_to_json(s.users, "name");
        return v;
    }
    Json::Value operator()(const TuicSettings& s) const {
        Json::Value v(Json::objectValue);
        v["users"] = Json::Value(Json::arrayValue);
        for (const auto& u : s.users) {
            Json::Value e(Json::objectValue);
            e["name"] = u.name;
            e["uuid"] = u.uuid;
            e["password"] = u.password;
            v["users"].append(e);
        }
        v["congestion_control"] = s.congestion_control;
        v["zero_rtt_handshake"] = s.zero_rtt_handshake;
        return v;
    }
    Json::Value operator()(const NaiveSettings& s) const {
        Json::Value v(Json::objectValue);
        v["users"] = password_users_to_json(s.users, "username");
        return v;
    }
    Json::Value operator()(const ShadowsocksSettings& s) const {
        Json::Value v(Json::objectValue);
        v["method"] = s.method;
        if (!s.password.empty()) v["password"] = s.password;
        v["users"] = password_users_to_json(s.users, "name");
        return v;
    }
    Json::Value operator()(const AmneziaWgSettings& s) const {
        Json::Value v(Json::objectValue);
        v["private_key"] = s.private_key;
        v["public_key"] = s.public_key;
        v["address"] = s.address;
        v["mtu"] = s.mtu;
        v["jc"] = s.jc;
        v["jmin"] = s.jmin;
        v["jmax"] = s.jmax;
        v["s1"] = s.s1;
        v["s2"] = s.s2;
        v["h1"] = Json::UInt(s.h1);
        v["h2"] = Json::UInt(s.h2);
        v["h3"] = Json::UInt(s.h3);
        v["h4"] = Json::UInt(s.h4);
        v["peers"] = Json::Value(Json::arrayValue);
        for (const auto& p : s.peers) {
            Json::Value e(Json::objectValue);
            e["name"] = p.name;
            e["public_key"] = p.public_key;
            e["private_key"] = p.private_key;
            e["address"] = p.address;
            v["peers"].append(e);
        }
        return v;
    }
};

struct UserCountVisitor {
    std::size_t operator()(const VlessSettings& s) const       { return s.clients.size(); }
    std::size_t operator()(const Hysteria2Settings& s) const   { return s.users.size(); }
    std::size_t operator()(const TrojanSettings& s) const      { return s.users.size(); }
    std::size_t operator()(const TuicSettings& s) const        { return s.users.size(); }
    std::size_t operator()(const NaiveSettings& s) const       { return s.users.size(); }
    std::size_t operator()(const ShadowsocksSettings& s) const { return s.users.size(); }
    std::size_t operator()(const AmneziaWgSettings& s) const   { return s.peers.size(); }
};

} // namespace

Json::Value dump_protocol_settings(const ProtocolSettings& s) {
    return std::visit(DumpVisitor{}, s);
}

std::size_t user_count(const ProtocolSettings& s) {
    return std::visit(UserCountVisitor{}, s);
}

/* ---------------- stream settings ---------------- */

bool parse_stream_settings(const std::string& body, StreamSettings& out, std::string& err) {
    Json::Value root;
    if (!read_root(body, root, err)) return false;

    StreamSettings s;
    s.network = str_of(root["network"], "tcp");
    if (s.network.empty()) s.network = "tcp";
    s.security = str_of(root["security"], "none");
    if (s.security.empty()) s.security = "none";
    s.packet_encoding = str_of(field(root, "packet_encoding", "packetEncoding"));

    const Json::Value& rs = field(root, "reality_settings", "realitySettings");
    if (rs.isObject()) {
        RealitySettings r;
        r.show = rs["show"].isBool() && rs["show"].asBool();
        if (!int_of(rs["xver"], "xver", r.xver, err)) return false;
        r.dest = str_of(rs["dest"]);
        r.server_names = strings_of(field(rs, "server_names", "serverNames"));
        r.private_key = str_of(field(rs, "private_key", "privateKey"));
        r.public_key = str_of(field(rs, "public_key", "publicKey"));
        r.short_ids = strings_of(field(rs, "short_ids", "shortIds"));
        s.reality = r;
    } else if (!rs.isNull()) {
        err = "reality_settings must be an object";
        return false;
    }

    const Json::Value& ts = field(root, "tls_settings", "tlsSettings");
    if (ts.isObject()) {
        TlsSettings t;
        t.server_name = str_of(field(ts, "server_name", "serverName"));
        t.alpn = strings_of(ts["alpn"]);
        for (const auto& c : ts["certificates"]) {
            if (!c.isObject()) continue;
            TlsCertificate cert;
            cert.certificate_file = str_of(field(c, "certificate_file", "certificateFile"));
            if (cert.certificate_file.empty()) cert.certificate_file = str_of(c["certificate_path"]);
            cert.key_file = str_of(field(c, "key_file", "keyFile"));
            if (cert.key_file.empty()) cert.key_file = str_of(c["key_path"]);
            t.certificates.push_back(cert);
        }
        s.tls = t;
    }

    const Json::Value& ws = field(root, "ws_settings", "wsSettings");
    if (ws.isObject()) {
        WsSettings w;
        w.path = str_of(ws["path"], "/");
        const Json::Value& h = ws["headers"];
        if (h.isObject()) {
            for (const auto& name : h.getMemberNames()) {
                if (h[name].isString()) w.headers[name] = h[name].asString();
            }
        }
        s.ws = w;
    }

    const Json::Value* hu = &field(root, "httpupgrade_settings", "httpupgradeSettings");
    if (!hu->isObject()) hu = &field(root, "xhttp_settings", "xhttpSettings");
    if (!hu->isObject()) hu = &field(root, "splithttp_settings", "splithttpSettings");
    if (hu->isObject()) {
        HttpUpgradeSettings h;
        h.path = str_of((*hu)["path"], "/");
        h.host = str_of((*hu)["host"]);
        s.httpupgrade = h;
    }

    const Json::Value& gs = field(root, "grpc_settings", "grpcSettings");
    if (gs.isObject()) {
        GrpcSettings g;
        g.service_name = str_of(field(gs, "service_name", "serviceName"));
        s.grpc = g;
    }

    out = s;
    return true;
}

Json::Value dump_stream_settings(const StreamSettings& s) {
    Json::Value v(Json::objectValue);
    v["network"] = s.network;
    v["security"] = s.security;
    if (!s.packet_encoding.empty()) v["packet_encoding"] = s.packet_encoding;
    if (s.reality) {
        const RealitySettings& r = *s.reality;
        Json::Value rv(Json::objectValue);
        rv["show"] = r.show;
        rv["xver"] = r.xver;
        rv["dest"] = r.dest;
        rv["server_names"] = strings_to_json(r.server_names);
        rv["private_key"] = r.private_key;
        rv["public_key"] = r.public_key;
        rv["short_ids"] = strings_to_json(r.short_ids);
        v["reality_settings"] = rv;
    }
    if (s.tls) {
        Json::Value tv(Json::objectValue);
        tv["server_name"] = s.tls->server_name;
        tv["alpn"] = strings_to_json(s.tls->alpn);
        tv["certificates"] = Json::Value(Json::arrayValue);
        for (const auto& c : s.tls->certificates) {
            Json::Value cv(Json::objectValue);
            cv["certificate_file"] = c.certificate_file;
            cv["key_file"] = c.key_file;
            tv["certificates"].append(cv);
        }
        v["tls_settings"] = tv;
    }
    if (s.ws) {
        Json::Value wv(Json::objectValue);
        wv["path"] = s.ws->path;
        wv["headers"] = Json::Value(Json::objectValue);
        for (const auto& kv : s.ws->headers) wv["headers"][kv.first] = kv.second;
        v["ws_settings"] = wv;
    }
    if (s.httpupgrade) {
        Json::Value hv(Json::objectValue);
        hv["path"] = s.httpupgrade->path;
        hv["host"] = s.httpupgrade->host;
        v["httpupgrade_settings"] = hv;
    }
    if (s.grpc) {
        Json::Value gv(Json::objectValue);
        gv["service_name"] = s.grpc->service_name;
        v["grpc_settings"] = gv;
    }
    return v;
}

} // namespace rp::internal
