/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/json_codec.hpp"
#include <memory>
#include <sstream>

namespace rp::internal {

bool parse_json(const std::string& text, Json::Value& out, std::string& err) {
    Json::CharReaderBuilder rb;
    rb["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(rb.newCharReader());
    err.clear();
    if (!reader->parse(text.data(), text.data() + text.size(), &out, &err)) {
        if (err.empty()) err = "invalid JSON";
        return false;
    }
    return true;
}

std::string write_json(const Json::Value& v, bool pretty) {
    Json::StreamWriterBuilder b;
    b["indentation"] = pretty ? "  " : "";
    b["emitUTF8"] = true;
    std::unique_ptr<Json::StreamWriter> w(b.newStreamWriter());
    std::ostringstream os;
    w->write(v, &os);
    return os.str();
}

std::string json_str(const Json::Value& obj, const char* key, const std::string& def) {
    if (!obj.isObject()) return def;
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : def;
}

int64_t json_i64(const Json::Value& obj, const char* key, int64_t def) {
    if (!obj.isObject()) return def;
    const Json::Value& v = obj[key];
    if (v.isInt64()) return v.asInt64();
    if (v.isUInt64()) return (int64_t)v.asUInt64();
    if (v.isString()) {
        try { return std::stoll(v.asString()); } catch (const std::exception&) { return def; }
    }
    return def;
}

bool json_bool(const Json::Value& obj, const char* key, bool def) {
    if (!obj.isObject()) return def;
    const Json::Value& v = obj[key];
    if (v.isBool()) return v.asBool();
    if (v.isNumeric()) return v.asDouble() != 0.0;
    return def;
}

/* ---------------- records ---------------- */

Json::Value node_to_json(const rp::Node& n) {
    Json::Value v(Json::objectValue);
    v["id"] = Json::Int64(n.id);
    v["name"] = n.name;
    v["ip"] = n.ip;
    v["enabled"] = n.enabled;
    v["is_relay"] = n.is_relay;
    v["relay_id"] = n.relay_id ? Json::Value(Json::Int64(*n.relay_id)) : Json::Value(Json::nullValue);
    v["reality_priv"] = n.reality_priv;
    v["reality_pub"] = n.reality_pub;
    v["short_id"] = n.short_id;
    v["domain"] = n.domain;
    v["reality_sni"] = n.reality_sni;
    v["block_ads"] = n.block_ads;
    v["block_porn"] = n.block_porn;
    v["block_torrent"] = n.block_torrent;
    v["join_token"] = n.join_token ? Json::Value(*n.join_token) : Json::Value(Json::nullValue);
    return v;
}

bool node_from_json(const Json::Value& v, rp::Node& out) {
    if (!v.isObject() || !v["id"].isIntegral()) return false;
    rp::Node n;
    n.id            = json_i64(v, "id");
    n.name          = json_str(v, "name");
    n.ip            = json_str(v, "ip");
    n.enabled       = json_bool(v, "enabled", true);
    n.is_relay      = json_bool(v, "is_relay");
    if (v["relay_id"].isIntegral()) n.relay_id = v["relay_id"].asInt64();
    n.reality_priv  = json_str(v, "reality_priv");
    n.reality_pub   = json_str(v, "reality_pub");
    n.short_id      = json_str(v, "short_id");
    n.domain        = json_str(v, "domain");
    n.reality_sni   = json_str(v, "reality_sni");
    n.block_ads     = json_bool(v, "block_ads");
    n.block_porn    = json_bool(v, "block_porn");
    n.block_torrent = json_bool(v, "block_torrent");
    if (v["join_token"].isString()) n.join_token = v["join_token"].asString();
    out = std::move(n);
    return true;
}

Json::Value group_to_json(const rp::NodeGroup& g) {
    Json::Value v(Json::objectValue);
    v["id"] = Json::Int64(g.id);
    v["name"] = g.name;
    return v;
}

bool group_from_json(const Json::Value& v, rp::NodeGroup& out) {
    if (!v.isObject() || !v["id"].isIntegral()) return false;
    out.id = json_i64(v, "id");
    out.name = json_str(v, "name");
    return true;
}

Json::Value template_to_json(const rp::InboundTemplate& t) {
    Json::Value v(Json::objectValue);
    v["id"] = Json::Int64(t.id);
    v["name"] = t.name;
    v["protocol"] = rp::protocol_name(t.protocol);
    v["settings_template"] = t.settings_template;
    v["stream_settings_template"] = t.stream_settings_template;
    v["group_id"] = Json::Int64(t.group_id);
    v["port_range_start"] = t.port_range_start;
    v["port_range_end"] = t.port_range_end;
    v["rotation_interval_hours"] = t.rotation_interval_hours;
    v["is_active"] = t.active;
    return v;
}

bool template_from_json(const Json::Value& v, rp::InboundTemplate& out) {
    if (!v.isObject() || !v["id"].isIntegral()) return false;
    rp::InboundTemplate t;
    t.id = json_i64(v, "id");
    t.name = json_str(v, "name");
    if (!rp::protocol_from_string(json_str(v, "protocol"), t.protocol)) return false;
    t.settings_template = json_str(v, "settings_template", "{}");
    t.stream_settings_template = json_str(v, "stream_settings_template", "{}");
    t.group_id = json_i64(v, "group_id");
    t.port_range_start = (int)json_i64(v, "port_range_start", 10000);
    t.port_range_end = (int)json_i64(v, "port_range_end", 60000);
    t.rotation_interval_hours = (int)json_i64(v, "rotation_interval_hours", 0);
    t.active = json_bool(v, "is_active", true);
    out = std::move(t);
    return true;
}

Json::Value inbound_to_json(const rp::Inbound& ib) {
    Json::Value v(Json::objectValue);
    v["id"] = Json::Int64(ib.id);
    v["node_id"] = Json::Int64(ib.node_id);
    v["tag"] = ib.tag;
    v["protocol"] = rp::protocol_name(ib.protocol);
    v["listen_port"] = ib.listen_port;
    v["listen_ip"] = ib.listen_ip;
    v["settings"] = ib.settings;
    v["stream_settings"] = ib.stream_settings;
    v["template_id"] = ib.template_id ? Json::Value(Json::Int64(*ib.template_id))
                                      : Json::Value(Json::nullValue);
    v["enabled"] = ib.enabled;
    v["last_rotated_at"] = Json::Int64(ib.last_rotated_at);
    return v;
}

bool inbound_from_json(const Json::Value& v, rp::Inbound& out) {
    if (!v.isObject() || !v["id"].isIntegral()) return false;
    rp::Inbound ib;
    ib.id = json_i64(v, "id");
    ib.node_id = json_i64(v, "node_id");
    ib.tag = json_str(v, "tag");
    if (!rp::protocol_from_string(json_str(v, "protocol"), ib.protocol)) return false;
    ib.listen_port = (int)json_i64(v, "listen_port");
    ib.listen_ip = json_str(v, "listen_ip", "::");
    ib.settings = json_str(v, "settings", "{}");
    ib.stream_settings = json_str(v, "stream_settings", "{}");
    if (v["template_id"].isIntegral()) ib.template_id = v["template_id"].asInt64();
    ib.enabled = json_bool(v, "enabled", true);
    ib.last_rotated_at = json_i64(v, "last_rotated_at");
    out = std::move(ib);
    return true;
}

Json::Value subscription_to_json(const rp::Subscription& s) {
    Json::Value v(Json::objectValue);
    v["id"] = Json::Int64(s.id);
    v["plan_id"] = Json::Int64(s.plan_id);
    v["subscriber_id"] = Json::Int64(s.subscriber_id);
    v["secret"] = s.secret;
    v["status"] = rp::subscription_status_name(s.status);
    return v;
}

bool subscription_from_json(const Json::Value& v, rp::Subscription& out) {
    if (!v.isObject() || !v["id"].isIntegral()) return false;
    rp::Subscription s;
    s.id = json_i64(v, "id");
    s.plan_id = json_i64(v, "plan_id");
    s.subscriber_id = json_i64(v, "subscriber_id");
    s.secret = json_str(v, "secret");
    if (!rp::subscription_status_from_string(json_str(v, "status", "pending"), s.status)) return false;
    out = std::move(s);
    return true;
}

} // namespace rp::internal
