/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/relay.hpp"
#include "rp/internal/utils.hpp"
#include "rp/log.hpp"

namespace rp::internal {

std::string derive_relay_password(const std::string& token, int64_t target_id) {
    return sha256_hex(trim_copy(token) + ":relay:" + std::to_string(target_id));
}

std::vector<PasswordUser> relay_users_for_client(const rp::Node& client, int64_t target_id,
                                                 rp::RelayAuthMode mode) {
    std::vector<PasswordUser> out;
    const std::string token = client.join_token ? trim_copy(*client.join_token) : std::string();
    if (token.empty()) return out;

    const std::string name = "relay_" + std::to_string(client.id);
    switch (mode) {
    case rp::RelayAuthMode::Legacy:
        out.push_back(PasswordUser{name, token});
        break;
    case rp::RelayAuthMode::V1:
        out.push_back(PasswordUser{name, derive_relay_password(token, target_id)});
        break;
    case rp::RelayAuthMode::Dual:
        out.push_back(PasswordUser{name, derive_relay_password(token, target_id)});
        out.push_back(PasswordUser{name + "_legacy", token});
        break;
    }
    return out;
}

bool RelayResolver::resolve_outbound(const rp::Node& relay, RelayOutbound& out) {
    const std::string who = "node=" + std::to_string(relay.id);
    if (!relay.is_relay || !relay.relay_id) return false;

    const std::string token = relay.join_token ? trim_copy(*relay.join_token) : std::string();
    if (token.empty()) {
        rp::log_line("[RELAY] " + who + " has no join token; relay wiring skipped");
        return false;
    }

    rp::Node target;
    if (!_store.get_node(*relay.relay_id, target)) {
        rp::log_line("[RELAY] " + who + " target " + std::to_string(*relay.relay_id) +
                     " not found; relay wiring skipped");
        return false;
    }

    const rp::Inbound* best = nullptr;
    const std::vector<rp::Inbound> inbounds = _store.inbounds_for_node(target.id);
    for (const auto& ib : inbounds) {
        if (!ib.enabled || ib.protocol != rp::Protocol::Shadowsocks) continue;
        if (!best || ib.listen_port < best->listen_port) best = &ib;
    }
    if (!best) {
        rp::log_line("[RELAY] " + who + " target " + std::to_string(target.id) +
                     " exposes no shadowsocks listener; relay wiring skipped");
        return false;
    }

    std::string method = "chacha20-ietf-poly1305";
    ProtocolSettings ps;
    std::string err;
    if (parse_protocol_settings(rp::Protocol::Shadowsocks, best->settings, ps, err)) {
        method = std::get<ShadowsocksSettings>(ps).method;
    } else {
        rp::log_line("[RELAY] " + who + " target listener " + best->tag +
                     " has unreadable settings (" + err + "); assuming " + method);
    }

    out = RelayOutbound{};
    out.server = target.ip;
    out.server_port = best->listen_port;
    out.method = method;
    // Derived form is authoritative under Dual as well.
    out.password = (_mode == rp::RelayAuthMode::Legacy) ? token
                                                        : derive_relay_password(token, target.id);
    rp::log_line("[RELAY] " + who + " -> " + target.ip + ":" + std::to_string(out.server_port) +
                 " mode=" + rp::relay_auth_mode_name(_mode));
    return true;
}

std::vector<PasswordUser> RelayResolver::relay_client_users(const rp::Node& target) {
    std::vector<PasswordUser> out;
    for (const auto& client : _store.relay_clients(target.id)) {
        std::vector<PasswordUser> users = relay_users_for_client(client, target.id, _mode);
        if (users.empty()) {
            rp::log_line("[RELAY] relay client " + std::to_string(client.id) + " of node " +
                         std::to_string(target.id) + " has no join token; not admitted");
            continue;
        }
        out.insert(out.end(), users.begin(), users.end());
    }
    return out;
}

} // namespace rp::internal
