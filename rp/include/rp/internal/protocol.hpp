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
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <json/json.h>
#include "rp/types.hpp"

namespace rp::internal {

/* ---------------- per-protocol settings ---------------- */

struct VlessClient {
    std::string id;
    std::string email;
    std::string flow;
};

struct VlessSettings {
    std::vector<VlessClient> clients;
    std::string decryption = "none";
};

// name + password; shared by Hysteria2, Trojan, Naive and Shadowsocks users.
struct PasswordUser {
    std::string name;
    std::string password;
};

struct Hysteria2Settings {
    std::vector<PasswordUser> users;
    int up_mbps = 0;
    int down_mbps = 0;
    std::string obfs_password;   // salamander, empty = off
    std::string masquerade;      // URL; a bare "/path" means a local directory
};

struct TrojanSettings {
    std::vector<PasswordUser> users;
};

struct TuicUser {
    std::string name;
    std::string uuid;
    std::string password;
};

struct TuicSettings {
    std::vector<TuicUser> users;
    std::string congestion_control = "bbr";
    bool zero_rtt_handshake = false;
};

struct NaiveSettings {
    std::vector<PasswordUser> users;
};

struct ShadowsocksSettings {
    std::string method = "chacha20-ietf-poly1305";
    std::string password;        // server key (2022 multi-user)
    std::vector<PasswordUser> users;
};

struct AmneziaWgPeer {
    std::string name;
    std::string public_key;
    std::string private_key;     // client side, shipped for client export
    std::string address;         // 10.10.0.x
};

struct AmneziaWgSettings {
    std::string private_key;     // server
    std::string public_key;
    std::string address = "10.10.0.1/24";
    int mtu = 1420;
    int jc = 0, jmin = 0, jmax = 0, s1 = 0, s2 = 0;
    uint32_t h1 = 0, h2 = 0, h3 = 0, h4 = 0;
    std::vector<AmneziaWgPeer> peers;
};

using ProtocolSettings = std::variant<
    VlessSettings,
    Hysteria2Settings,
    TrojanSettings,
    TuicSettings,
    NaiveSettings,
    ShadowsocksSettings,
    AmneziaWgSettings>;

/* ---------------- stream settings ---------------- */

struct RealitySettings {
    bool show = false;
    int  xver = 0;
    std::string dest;                       // host:port
    std::vector<std::string> server_names;
    std::string private_key;
    std::string public_key;
    std::vector<std::string> short_ids;
};

struct TlsCertificate {
    std::string certificate_file;
    std::string key_file;
};

struct TlsSettings {
    std::string server_name;
    std::vector<std::string> alpn;
    std::vector<TlsCertificate> certificates;
};

struct WsSettings {
    std::string path;
    std::map<std::string, std::string> headers;
};

struct HttpUpgradeSettings {
    std::string path;
    std::string host;
};

struct GrpcSettings {
    std::string service_name;
};

struct StreamSettings {
    std::string network  = "tcp";
    std::string security = "none";
    std::string packet_encoding;   // VLESS UDP framing (xudp, packetaddr), empty = engine default
    std::optional<TlsSettings>         tls;
    std::optional<RealitySettings>     reality;
    std::optional<WsSettings>          ws;
    std::optional<HttpUpgradeSettings> httpupgrade;
    std::optional<GrpcSettings>        grpc;
};

// Empty body = defaults. Both snake_case and camelCase keys are accepted.
bool parse_protocol_settings(rp::Protocol p, const std::string& body,
                             ProtocolSettings& out, std::string& err);
bool parse_stream_settings(const std::string& body, StreamSettings& out, std::string& err);

Json::Value dump_protocol_settings(const ProtocolSettings& s);
Json::Value dump_stream_settings(const StreamSettings& s);

// Users (or peers) currently carried by the settings.
std::size_t user_count(const ProtocolSettings& s);

} // namespace rp::internal
