/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/synthesizer.hpp"
#include "rp/internal/injector.hpp"
#include "rp/internal/json_codec.hpp"
#include "rp/internal/keys.hpp"
#include "rp/internal/port_alloc.hpp"
#include "rp/internal/relay.hpp"
#include "rp/internal/templates.hpp"
#include "rp/internal/utils.hpp"
#include "rp/log.hpp"

#include <ctime>

namespace rp {

using namespace rp::internal;

Synthesizer::Synthesizer(Store& store, SniProvider& sni, ConfigValidator& validator, SynthOptions opt)
    : _store(store), _sni(sni), _validator(validator), _opt(std::move(opt)) {}

RelayAuthMode Synthesizer::relay_mode() {
    if (_opt.relay_auth_mode) return *_opt.relay_auth_mode;
    std::string s;
    if (!_store.get_setting("relay_auth_mode", s)) return RelayAuthMode::Dual;
    return relay_auth_mode_from_setting(s);
}

Document Synthesizer::synthesize(int64_t node_id) {
    Node node;
    if (!_store.get_node(node_id, node)) throw NodeNotFound(node_id);

    const std::string who = "node=" + std::to_string(node.id);
    const RelayAuthMode mode = relay_mode();
    const int64_t now = static_cast<int64_t>(std::time(nullptr));

    PortAllocator ports(_store);
    EndpointMaterializer materializer(_store, _sni, ports);
    TemplateResolver resolver(_store);

    const std::size_t rotated = materializer.rotate_due(node, now);
    if (rotated > 0) rp::log_line("[SYNTH] " + who + " rotated " + std::to_string(rotated) + " endpoint(s)");

    // 1) keys
    bool uses_reality = false;
    for (const auto& ib : _store.inbounds_for_node(node.id)) {
        if (inbound_uses_reality(ib)) {
            uses_reality = true;
            break;
        }
    }
    if (heal_node_keys(node, uses_reality)) {
        rp::log_line("[KEYS] " + who + " reality material healed");
        if (!_store.update_node(node)) {
            rp::log_line("[KEYS] " + who + " failed to persist healed keys");
        }
    }

    // 2) templates -> endpoints. Exhaustion aborts.
    for (const auto& tpl : resolver.resolve(node)) {
        materializer.materialize(node, tpl, now);
    }

    // 3) users
    UserInjector injector(_store);
    RelayResolver relay(_store, mode);
    const std::vector<PasswordUser> relay_users = relay.relay_client_users(node);

    std::vector<Endpoint> endpoints;
    for (const auto& ib : _store.inbounds_for_node(node.id)) {
        if (!ib.enabled) continue;
        Endpoint ep;
        std::string err;
        if (!load_endpoint(ib, ep, err)) {
            rp::log_line("[SYNTH] " + who + " endpoint " + ib.tag + " skipped: " + err);
            continue;
        }
        injector.inject(ep);
        if (!relay_users.empty() && add_relay_users(ep, relay_users)) {
            rp::log_line("[RELAY] " + who + " " + ib.tag + " admits " +
                         std::to_string(relay_users.size()) + " relay user(s)");
        }
        endpoints.push_back(std::move(ep));
    }

    // 4) relay outbound
    std::optional<RelayOutbound> outbound;
    RelayOutbound ro;
    if (relay.resolve_outbound(node, ro)) outbound = ro;

    // 5) assemble + gate
    Document doc;
    doc.root = build_document(node, endpoints, outbound, _opt.build);
    doc.text = write_json(doc.root);

    ValidationResult vr = _validator.validate(doc.text);
    if (vr.status == ValidationStatus::Failed) {
        rp::log_line("[SYNTH] " + who + " validation failed; document withheld");
        throw ValidationError(vr.output);
    }

    doc.hash = sha256_hex(doc.text);
    rp::log_line("[SYNTH] " + who + " hash=" + doc.hash.substr(0, 12) +
                 " validation=" + validation_status_name(vr.status) +
                 " relay_mode=" + relay_auth_mode_name(mode));
    return doc;
}

std::size_t Synthesizer::sync_group(int64_t group_id) {
    const std::vector<InboundTemplate> templates = _store.templates_for_group(group_id);
    const std::vector<int64_t> members = _store.group_nodes(group_id);
    const int64_t now = static_cast<int64_t>(std::time(nullptr));

    PortAllocator ports(_store);
    EndpointMaterializer materializer(_store, _sni, ports);

    std::size_t done = 0;
    for (int64_t nid : members) {
        Node node;
        if (!_store.get_node(nid, node)) {
            rp::log_line("[TPL] sync group=" + std::to_string(group_id) + " member " +
                         std::to_string(nid) + " not found");
            continue;
        }
        for (const auto& tpl : templates) {
            try {
                materializer.materialize(node, tpl, now);
                ++done;
            } catch (const SynthError& e) {
                rp::log_line("[TPL] sync node=" + std::to_string(nid) + " template=" +
                             std::to_string(tpl.id) + " failed: " + e.what());
            }
        }
        _store.notify_node_update(nid);
    }
    rp::log_line("[TPL] sync group=" + std::to_string(group_id) + ": " + std::to_string(done) +
                 " endpoint(s) on " + std::to_string(members.size()) + " node(s)");
    return done;
}

bool Synthesizer::rotate_inbound(int64_t inbound_id) {
    PortAllocator ports(_store);
    EndpointMaterializer materializer(_store, _sni, ports);
    Inbound out;
    if (!materializer.rotate(inbound_id, static_cast<int64_t>(std::time(nullptr)), out)) return false;
    _store.notify_node_update(out.node_id);
    return true;
}

} // namespace rp
