/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/injector.hpp"
#include "rp/internal/keys.hpp"
#include "rp/internal/utils.hpp"
#include "rp/log.hpp"

#include <algorithm>

namespace rp::internal {

bool load_endpoint(const rp::Inbound& ib, Endpoint& out, std::string& err) {
    Endpoint ep;
    ep.inbound = ib;
    if (!parse_protocol_settings(ib.protocol, ib.settings, ep.settings, err)) {
        err = "settings: " + err;
        return false;
    }
    if (!parse_stream_settings(ib.stream_settings, ep.stream, err)) {
        err = "stream_settings: " + err;
        return false;
    }
    out = std::move(ep);
    return true;
}

std::string vless_flow(const StreamSettings& stream) {
    if (stream.network == "tcp" && (stream.security == "reality" || stream.security == "tls")) {
        return "xtls-rprx-vision";
    }
    return "";
}

std::string amneziawg_client_address(int64_t subscriber_id) {
    // Known ceiling: more than 250 subscribers on one endpoint collide.
    const int64_t host = ((subscriber_id % 250) + 250) % 250 + 2;
    return "10.10.0." + std::to_string(host);
}

namespace {

std::string user_name(int64_t subscription_id) {
    return "user_" + std::to_string(subscription_id);
}

std::string strip_hyphens(const std::string& s) {
    return replace_all(s, "-", "");
}

template <typename T, typename NameOf>
void upsert_by_name(std::vector<T>& users, T user, NameOf name_of) {
    auto it = std::find_if(users.begin(), users.end(),
                           [&](const T& u) { return name_of(u) == name_of(user); });
    if (it != users.end()) *it = std::move(user);
    else users.push_back(std::move(user));
}

struct InjectVisitor {
    const std::vector<rp::ActiveSubscription>& subs;
    const StreamSettings& stream;
    int64_t inbound_id;

    void operator()(VlessSettings& s) const {
        const std::string flow = vless_flow(stream);
        for (const auto& sub : subs) {
            upsert_by_name(s.clients, VlessClient{sub.secret, user_name(sub.subscription_id), flow},
                           [](const VlessClient& c) { return c.email; });
        }
    }
    void operator()(Hysteria2Settings& s) const { add_stripped(s.users); }
    void operator()(TrojanSettings& s) const {
        for (const auto& sub : subs) {
            upsert_by_name(s.users, PasswordUser{user_name(sub.subscription_id), sub.secret},
                           [](const PasswordUser& u) { return u.name; });
        }
    }
    void operator()(TuicSettings& s) const {
        for (const auto& sub : subs) {
            upsert_by_name(s.users,
                           TuicUser{user_name(sub.subscription_id), sub.secret, strip_hyphens(sub.secret)},
                           [](const TuicUser& u) { return u.name; });
        }
    }
    void operator()(NaiveSettings& s) const { add_stripped(s.users); }
    void operator()(ShadowsocksSettings& s) const { add_stripped(s.users); }
    void operator()(AmneziaWgSettings& s) const {
        for (const auto& sub : subs) {
            KeyPair kp;
            if (!derive_deterministic_key(sub.secret, kp)) {
                rp::log_line("[INJECT] inbound=" + std::to_string(inbound_id) +
                             " client key derivation failed for " + user_name(sub.subscription_id));
                continue;
            }
            upsert_by_name(s.peers,
                           AmneziaWgPeer{user_name(sub.subscription_id), kp.public_key, kp.private_key,
                                         amneziawg_client_address(sub.subscriber_id)},
                           [](const AmneziaWgPeer& p) { return p.name; });
        }
    }

    void add_stripped(std::vector<PasswordUser>& users) const {
        for (const auto& sub : subs) {
            upsert_by_name(users, PasswordUser{user_name(sub.subscription_id), strip_hyphens(sub.secret)},
                           [](const PasswordUser& u) { return u.name; });
        }
    }
};

} // namespace

void apply_subscriptions(Endpoint& ep, const std::vector<rp::ActiveSubscription>& subs) {
    std::visit(InjectVisitor{subs, ep.stream, ep.inbound.id}, ep.settings);
}

bool add_relay_users(Endpoint& ep, const std::vector<PasswordUser>& users) {
    auto* ss = std::get_if<ShadowsocksSettings>(&ep.settings);
    if (!ss) return false;
    for (const auto& u : users) {
        upsert_by_name(ss->users, u, [](const PasswordUser& x) { return x.name; });
    }
    return true;
}

std::size_t UserInjector::inject(Endpoint& ep) {
    const rp::Inbound& ib = ep.inbound;
    if (!ib.enabled) return 0;

    const std::vector<int64_t> plans = _store.linked_plans(ib.node_id, ib.id);
    if (plans.empty()) {
        rp::log_line("[INJECT] inbound=" + std::to_string(ib.id) + " (" + ib.tag + ") has no linked plans");
        return 0;
    }
    const std::vector<rp::ActiveSubscription> subs = _store.active_subscriptions(plans);
    apply_subscriptions(ep, subs);
    return subs.size();
}

} // namespace rp::internal
