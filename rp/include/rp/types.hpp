/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace rp {

// Wire protocol of an inbound. One storage shape, seven payload shapes.
enum class Protocol {
    Vless,
    Hysteria2,
    Trojan,
    Tuic,
    Naive,
    Shadowsocks,
    AmneziaWg
};

const char* protocol_name(Protocol p);
bool protocol_from_string(const std::string& s, Protocol& out);

// Fleet-wide relay credential migration switch.
//   Legacy = raw join token, V1 = per-hop derived, Dual = derived outbound,
//   both accepted inbound.
enum class RelayAuthMode {
    Legacy,
    V1,
    Dual
};

const char* relay_auth_mode_name(RelayAuthMode m);
// Unknown or empty values map to Dual.
RelayAuthMode relay_auth_mode_from_setting(const std::string& s);

enum class SubscriptionStatus {
    Active,
    Pending,
    Expired
};

const char* subscription_status_name(SubscriptionStatus s);
bool subscription_status_from_string(const std::string& s, SubscriptionStatus& out);

struct Node {
    int64_t     id = 0;
    std::string name;
    std::string ip;
    bool        enabled = true;

    // Relay chain
    bool                   is_relay = false;
    std::optional<int64_t> relay_id;

    // Reality material (base64url, no padding) + 16-hex short id
    std::string reality_priv;
    std::string reality_pub;
    std::string short_id;
    std::string domain;
    std::string reality_sni;   // SNI override

    // Content policy
    bool block_ads     = false;
    bool block_porn    = false;
    bool block_torrent = false;

    // Node auth + relay seed
    std::optional<std::string> join_token;
};

struct NodeGroup {
    int64_t     id = 0;
    std::string name;
};

struct InboundTemplate {
    int64_t     id = 0;
    std::string name;
    Protocol    protocol = Protocol::Vless;
    std::string settings_template;         // JSON with {{placeholders}}
    std::string stream_settings_template;  // JSON with {{placeholders}}
    int64_t     group_id = 0;
    int         port_range_start = 10000;
    int         port_range_end   = 60000;
    int         rotation_interval_hours = 0;  // 0 = never
    bool        active = true;
};

// Materialized (node, template) endpoint.
struct Inbound {
    int64_t     id = 0;
    int64_t     node_id = 0;
    std::string tag;
    Protocol    protocol = Protocol::Vless;
    int         listen_port = 0;
    std::string listen_ip = "::";
    std::string settings;         // JSON, placeholders resolved
    std::string stream_settings;  // JSON, placeholders resolved
    std::optional<int64_t> template_id;
    bool        enabled = true;
    int64_t     last_rotated_at = 0;  // unix seconds
};

struct Subscription {
    int64_t            id = 0;
    int64_t            plan_id = 0;
    int64_t            subscriber_id = 0;  // messenger user id
    std::string        secret;             // UUID-shaped
    SubscriptionStatus status = SubscriptionStatus::Pending;
};

// Projection handed to the injector.
struct ActiveSubscription {
    int64_t     subscription_id = 0;
    std::string secret;
    int64_t     subscriber_id = 0;
};

} // namespace rp
