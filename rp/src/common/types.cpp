/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/types.hpp"
#include "rp/internal/utils.hpp"

namespace rp {

const char* protocol_name(Protocol p) {
    switch (p) {
    case Protocol::Vless:       return "vless";
    case Protocol::Hysteria2:   return "hysteria2";
    case Protocol::Trojan:      return "trojan";
    case Protocol::Tuic:        return "tuic";
    case Protocol::Naive:       return "naive";
    case Protocol::Shadowsocks: return "shadowsocks";
    case Protocol::AmneziaWg:   return "amneziawg";
    }
    return "unknown";
}

bool protocol_from_string(const std::string& s, Protocol& out) {
    const std::string v = internal::lower_copy(internal::trim_copy(s));
    if (v == "vless")                      { out = Protocol::Vless; return true; }
    if (v == "hysteria2" || v == "hy2")    { out = Protocol::Hysteria2; return true; }
    if (v == "trojan")                     { out = Protocol::Trojan; return true; }
    if (v == "tuic")                       { out = Protocol::Tuic; return true; }
    if (v == "naive")                      { out = Protocol::Naive; return true; }
    if (v == "shadowsocks" || v == "ss")   { out = Protocol::Shadowsocks; return true; }
    if (v == "amneziawg" || v == "awg")    { out = Protocol::AmneziaWg; return true; }
    return false;
}

const char* relay_auth_mode_name(RelayAuthMode m) {
    switch (m) {
    case RelayAuthMode::Legacy: return "legacy";
    case RelayAuthMode::V1:     return "v1";
    case RelayAuthMode::Dual:   return "dual";
    }
    return "dual";
}

RelayAuthMode relay_auth_mode_from_setting(const std::string& s) {
    const std::string v = internal::lower_copy(internal::trim_copy(s));
    if (v == "legacy") return RelayAuthMode::Legacy;
    if (v == "v1" || v == "hashed" || v == "derived") return RelayAuthMode::V1;
    return RelayAuthMode::Dual;
}

const char* subscription_status_name(SubscriptionStatus s) {
    switch (s) {
    case SubscriptionStatus::Active:  return "active";
    case SubscriptionStatus::Pending: return "pending";
    case SubscriptionStatus::Expired: return "expired";
    }
    return "pending";
}

bool subscription_status_from_string(const std::string& s, SubscriptionStatus& out) {
    const std::string v = internal::lower_copy(internal::trim_copy(s));
    if (v == "active")  { out = SubscriptionStatus::Active; return true; }
    if (v == "pending") { out = SubscriptionStatus::Pending; return true; }
    if (v == "expired") { out = SubscriptionStatus::Expired; return true; }
    return false;
}

} // namespace rp
