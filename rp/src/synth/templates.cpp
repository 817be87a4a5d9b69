/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/templates.hpp"
#include "rp/internal/keys.hpp"
#include "rp/internal/placeholder.hpp"
#include "rp/internal/protocol.hpp"
#include "rp/internal/json_codec.hpp"
#include "rp/internal/utils.hpp"
#include "rp/errors.hpp"
#include "rp/log.hpp"

#include <algorithm>
#include <set>

namespace rp::internal {

std::string template_tag(int64_t template_id) {
    return "tpl_" + std::to_string(template_id);
}

rp::InboundTemplate default_reality_template(int64_t group_id) {
    rp::InboundTemplate t;
    t.name = "VLESS Reality";
    t.protocol = rp::Protocol::Vless;
    t.group_id = group_id;
    t.settings_template = R"({"clients":[],"decryption":"none"})";
    t.stream_settings_template =
        R"({"network":"tcp","security":"reality","reality_settings":{"show":false,"xver":0,)"
        R"("dest":"drive.google.com:443","server_names":["drive.google.com"],)"
        R"("private_key":"","short_ids":[""]}})";
    t.port_range_start = 10000;
    t.port_range_end = 10000;
    t.rotation_interval_hours = 0;
    t.active = true;
    return t;
}

static bool text_mentions_reality(const std::string& stream) {
    if (has_placeholder(stream, "reality_private") ||
        has_placeholder(stream, "reality_pbk") ||
        has_placeholder(stream, "reality_sid")) {
        return true;
    }
    return lower_copy(stream).find("\"reality\"") != std::string::npos;
}

bool template_uses_reality(const rp::InboundTemplate& tpl) {
    return text_mentions_reality(tpl.stream_settings_template);
}

bool inbound_uses_reality(const rp::Inbound& ib) {
    StreamSettings s;
    std::string err;
    if (parse_stream_settings(ib.stream_settings, s, err)) {
        return s.security == "reality";
    }
    return text_mentions_reality(ib.stream_settings);
}

/* ---------------- TemplateResolver ---------------- */

std::vector<rp::InboundTemplate> TemplateResolver::resolve(const rp::Node& node) {
    std::vector<rp::InboundTemplate> out;
    std::set<int64_t> seen;
    const std::vector<int64_t> groups = _store.node_groups(node.id);
    for (int64_t gid : groups) {
        for (const auto& t : _store.templates_for_group(gid)) {
            if (t.active && seen.insert(t.id).second) out.push_back(t);
        }
    }

    if (out.empty()) {
        rp::NodeGroup def;
        if (_store.find_group_by_name(kDefaultGroupName, def) &&
            std::find(groups.begin(), groups.end(), def.id) != groups.end()) {
            rp::InboundTemplate t = default_reality_template(def.id);
            bool created = false;
            if (_store.create_template_if_absent(t, created)) {
                if (created) {
                    rp::log_line("[TPL] bootstrapped default template id=" + std::to_string(t.id) +
                                 " group=" + std::to_string(def.id));
                }
                out.push_back(t);
            } else {
                rp::log_line("[TPL] failed to bootstrap default template for group " +
                             std::to_string(def.id));
            }
        }
    }

    std::sort(out.begin(), out.end(),
              [](const rp::InboundTemplate& a, const rp::InboundTemplate& b) { return a.id < b.id; });
    return out;
}

/* ---------------- EndpointMaterializer ---------------- */

rp::Inbound EndpointMaterializer::materialize(rp::Node& node, const rp::InboundTemplate& tpl, int64_t now) {
    int start = tpl.port_range_start, end = tpl.port_range_end;
    normalize_port_range(start, end);

    const std::string tag = template_tag(tpl.id);
    rp::Inbound existing;
    const bool have = _store.find_inbound(node.id, tag, existing);

    int port = 0;
    if (have && existing.listen_port >= start && existing.listen_port <= end) {
        port = existing.listen_port;
    } else {
        port = _ports.allocate(node.id, start, end);
        if (have) {
            rp::log_line("[TPL] node=" + std::to_string(node.id) + " " + tag + " port " +
                         std::to_string(existing.listen_port) + " left range, migrating to " +
                         std::to_string(port));
        }
    }

    // Keys must be final before any placeholder sees them.
    if (template_uses_reality(tpl) && heal_node_keys(node, true)) {
        if (!_store.update_node(node)) {
            rp::log_line("[TPL] node=" + std::to_string(node.id) + " failed to persist healed keys");
        }
    }

    return commit(node, tpl, have ? &existing : nullptr, port,
                  have ? existing.last_rotated_at : now);
}

rp::Inbound EndpointMaterializer::commit(rp::Node& node, const rp::InboundTemplate& tpl,
                                         const rp::Inbound* existing, int port, int64_t rotated_at) {
    int start = tpl.port_range_start, end = tpl.port_range_end;
    normalize_port_range(start, end);

    const std::string tag = template_tag(tpl.id);
    const std::string sni = choose_sni(_sni, node);
    std::set<int> excluded;

    for (int attempt = 1; ; ++attempt) {
        PlaceholderValues v;
        v.port = std::to_string(port);
        v.uuid = stable_uuid(std::to_string(node.id) + ":" + tag);
        v.sni = sni;
        v.domain = node.domain.empty() ? sni : node.domain;
        v.reality_private = node.reality_priv;
        v.reality_pbk = node.reality_pub;
        v.reality_sid = node.short_id;

        std::vector<std::string> unknown;
        std::string settings = render_placeholders(tpl.settings_template, v, &unknown);
        std::string stream = render_placeholders(tpl.stream_settings_template, v, &unknown);
        for (const auto& name : unknown) {
            rp::log_line("[TPL] template=" + std::to_string(tpl.id) + " unknown placeholder {{" + name + "}}");
        }

        rp::Inbound ib;
        ib.node_id = node.id;
        ib.tag = tag;
        ib.protocol = tpl.protocol;
        ib.listen_port = port;
        ib.listen_ip = existing ? existing->listen_ip : "::";
        ib.stream_settings = finalize_stream(node, stream, sni);
        ib.settings = tpl.protocol == rp::Protocol::AmneziaWg ? finalize_amneziawg(settings, existing)
                                                              : settings;
        ib.template_id = tpl.id;
        ib.enabled = existing ? existing->enabled : true;
        ib.last_rotated_at = rotated_at;

        switch (_store.upsert_inbound(ib)) {
        case UpsertResult::Inserted:
            rp::log_line("[TPL] node=" + std::to_string(node.id) + " created " + tag +
                         " port=" + std::to_string(port));
            return ib;
        case UpsertResult::Updated:
            return ib;
        case UpsertResult::PortConflict:
            rp::log_line("[TPL] node=" + std::to_string(node.id) + " " + tag + " port " +
                         std::to_string(port) + " taken concurrently (attempt " +
                         std::to_string(attempt) + ")");
            if (attempt >= kMaxUpsertAttempts) throw rp::PortExhaustion(node.id, start, end);
            excluded.insert(port);
            port = _ports.allocate(node.id, start, end, excluded);
            break;
        case UpsertResult::Failed:
            throw rp::SynthError("failed to store inbound " + tag + " for node " + std::to_string(node.id));
        }
    }
}

std::string EndpointMaterializer::finalize_stream(const rp::Node& node, const std::string& text,
                                                  const std::string& sni) {
    StreamSettings s;
    std::string err;
    if (!parse_stream_settings(text, s, err)) {
        rp::log_line("[TPL] node=" + std::to_string(node.id) + " stream settings kept raw: " + err);
        return text;
    }

    if (s.security == "reality") {
        if (!s.reality) s.reality = RealitySettings{};
        RealitySettings& r = *s.reality;
        if (r.private_key.empty()) r.private_key = node.reality_priv;
        if (r.public_key.empty()) r.public_key = node.reality_pub;
        if (!node.short_id.empty() &&
            std::find(r.short_ids.begin(), r.short_ids.end(), node.short_id) == r.short_ids.end()) {
            r.short_ids.push_back(node.short_id);
        }
        const std::string own = trim_copy(node.reality_sni);
        if (!own.empty()) {
            r.server_names = {own};
            r.dest = own + ":443";
        } else if (r.server_names.empty()) {
            r.server_names = {sni};
            if (r.dest.empty()) r.dest = sni + ":443";
        }
    } else if (s.security == "tls") {
        if (!s.tls) s.tls = TlsSettings{};
        if (s.tls->server_name.empty()) s.tls->server_name = node.domain.empty() ? sni : node.domain;
    }
    return write_json(dump_stream_settings(s));
}

std::string EndpointMaterializer::finalize_amneziawg(const std::string& text, const rp::Inbound* existing) {
    ProtocolSettings ps;
    std::string err;
    if (!parse_protocol_settings(rp::Protocol::AmneziaWg, text, ps, err)) {
        rp::log_line("[TPL] amneziawg settings kept raw: " + err);
        return text;
    }
    AmneziaWgSettings& a = std::get<AmneziaWgSettings>(ps);

    AmneziaWgSettings prev;
    if (existing) {
        ProtocolSettings old;
        std::string old_err;
        if (parse_protocol_settings(rp::Protocol::AmneziaWg, existing->settings, old, old_err)) {
            prev = std::get<AmneziaWgSettings>(old);
        }
    }

    if (a.private_key.empty()) {
        if (!prev.private_key.empty()) {
            a.private_key = prev.private_key;
            a.public_key = prev.public_key;
        } else {
            KeyPair kp;
            if (generate_wireguard_keypair(kp)) {
                a.private_key = kp.private_key;
                a.public_key = kp.public_key;
            } else {
                rp::log_line("[TPL] amneziawg server key generation failed");
            }
        }
    }
    if (a.public_key.empty() && !a.private_key.empty()) {
        std::string pub;
        if (public_key_from_private(a.private_key, pub)) a.public_key = pub;
    }

    if (a.jc == 0) {
        if (prev.jc != 0) {
            a.jc = prev.jc; a.jmin = prev.jmin; a.jmax = prev.jmax;
            a.s1 = prev.s1; a.s2 = prev.s2;
            a.h1 = prev.h1; a.h2 = prev.h2; a.h3 = prev.h3; a.h4 = prev.h4;
        } else {
            bool ok = random_between(3, 10, a.jc) &&
                      random_between(40, 100, a.jmin) &&
                      random_between(500, 1000, a.jmax) &&
                      random_between(20, 100, a.s1) &&
                      random_between(20, 100, a.s2) &&
                      random_u32(a.h1) && random_u32(a.h2) && random_u32(a.h3) && random_u32(a.h4);
            if (!ok) rp::log_line("[TPL] amneziawg obfuscation parameters incomplete (RNG failure)");
        }
    }

    // Peers are injected per synthesis, never stored.
    a.peers.clear();
    return write_json(dump_protocol_settings(ps));
}

bool EndpointMaterializer::rotate(int64_t inbound_id, int64_t now, rp::Inbound& out) {
    rp::Inbound ib;
    if (!_store.get_inbound(inbound_id, ib)) {
        rp::log_line("[TPL] rotate: inbound " + std::to_string(inbound_id) + " not found");
        return false;
    }
    if (!ib.template_id) {
        rp::log_line("[TPL] rotate: inbound " + std::to_string(inbound_id) + " is not template-backed");
        return false;
    }
    rp::InboundTemplate tpl;
    rp::Node node;
    if (!_store.get_template(*ib.template_id, tpl) || !_store.get_node(ib.node_id, node)) {
        rp::log_line("[TPL] rotate: inbound " + std::to_string(inbound_id) + " lost its template or node");
        return false;
    }

    int port = ib.listen_port;
    try {
        port = _ports.allocate(node.id, tpl.port_range_start, tpl.port_range_end);
    } catch (const rp::PortExhaustion&) {
        rp::log_line("[TPL] rotate: no spare port for " + ib.tag + ", keeping " + std::to_string(port));
    }

    out = commit(node, tpl, &ib, port, now);
    rp::log_line("[TPL] rotated " + ib.tag + " on node " + std::to_string(node.id) + ": port " +
                 std::to_string(ib.listen_port) + " -> " + std::to_string(out.listen_port));
    return true;
}

std::size_t EndpointMaterializer::rotate_due(const rp::Node& node, int64_t now) {
    std::size_t rotated = 0;
    for (const auto& ib : _store.inbounds_for_node(node.id)) {
        if (!ib.template_id) continue;
        rp::InboundTemplate tpl;
        if (!_store.get_template(*ib.template_id, tpl) || tpl.rotation_interval_hours <= 0) continue;
        if (now - ib.last_rotated_at < int64_t(tpl.rotation_interval_hours) * 3600) continue;
        rp::Inbound out;
        try {
            if (rotate(ib.id, now, out)) ++rotated;
        } catch (const rp::SynthError& e) {
            rp::log_line("[TPL] rotate: " + ib.tag + " on node " + std::to_string(node.id) +
                         " skipped: " + e.what());
        }
    }
    return rotated;
}

} // namespace rp::internal
