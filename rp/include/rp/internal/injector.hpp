/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#pragma once
#include <string>
#include <vector>
#include "rp/types.hpp"
#include "rp/internal/protocol.hpp"
#include "rp/internal/store.hpp"

namespace rp::internal {

// A stored inbound with its bodies parsed into the typed shapes.
struct Endpoint {
    rp::Inbound      inbound;
    ProtocolSettings settings;
    StreamSettings   stream;
};

// False (err filled) when either stored body is malformed.
bool load_endpoint(const rp::Inbound& ib, Endpoint& out, std::string& err);

// "xtls-rprx-vision" for raw TCP under reality/tls, else "".
std::string vless_flow(const StreamSettings& stream);

// 10.10.0.<(id % 250) + 2>; .0/.1 stay reserved.
std::string amneziawg_client_address(int64_t subscriber_id);

// Maps subscriptions onto the endpoint's user list. Users already present
// under the same name are replaced.
void apply_subscriptions(Endpoint& ep, const std::vector<rp::ActiveSubscription>& subs);

// Appends relay-client users to a Shadowsocks endpoint (no-op otherwise).
// Returns false if the endpoint is not Shadowsocks.
bool add_relay_users(Endpoint& ep, const std::vector<PasswordUser>& users);

class UserInjector {
public:
    explicit UserInjector(Store& store) : _store(store) {}

    // Looks up linked plans and their active subscriptions, then applies
    // them. Disabled or unlinked endpoints are left untouched.
    // Returns the number of subscriptions applied.
    std::size_t inject(Endpoint& ep);

private:
    Store& _store;
};

} // namespace rp::internal
