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
#include <string>
#include <vector>
#include "rp/types.hpp"
#include "rp/internal/protocol.hpp"
#include "rp/internal/store.hpp"

namespace rp::internal {

inline constexpr const char* kRelayOutboundTag = "relay-out";

// hex(SHA-256(trim(token) ":relay:" decimal(target_id))). Binds the secret
// to one hop.
std::string derive_relay_password(const std::string& token, int64_t target_id);

struct RelayOutbound {
    std::string tag = kRelayOutboundTag;
    std::string server;
    int         server_port = 0;
    std::string method;
    std::string password;
};

// Users a target must accept from one relay client under `mode`.
std::vector<PasswordUser> relay_users_for_client(const rp::Node& client, int64_t target_id,
                                                 rp::RelayAuthMode mode);

/**
 * Both ends of a relay hop. The mode is fixed per instance; build one per
 * synthesis. Gaps (no token, no target listener) are logged and yield
 * "no wiring", never an error.
 */
class RelayResolver {
public:
    RelayResolver(Store& store, rp::RelayAuthMode mode) : _store(store), _mode(mode) {}

    rp::RelayAuthMode mode() const { return _mode; }

    // Outbound on relay node `relay` toward its target.
    bool resolve_outbound(const rp::Node& relay, RelayOutbound& out);

    // Users to add to every Shadowsocks listener of `target`.
    std::vector<PasswordUser> relay_client_users(const rp::Node& target);

private:
    Store& _store;
    rp::RelayAuthMode _mode;
};

} // namespace rp::internal
