/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#pragma once
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "rp/types.hpp"
#include "rp/internal/injector.hpp"
#include "rp/internal/relay.hpp"

namespace rp::internal {

inline constexpr const char* kRuleSetAds  = "geosite-category-ads-all";
inline constexpr const char* kRuleSetPorn = "geosite-category-porn";
inline constexpr const char* kRuleSetP2p  = "geosite-category-p2p";

struct BuildOptions {
    std::string dns_resolver = "8.8.8.8";
    std::string clash_api    = "127.0.0.1:9090";
    std::string cert_path    = "/etc/sing-box/certs/cert.pem";
    std::string key_path     = "/etc/sing-box/certs/key.pem";
    std::string fallback_sni = "www.google.com";
    std::string log_level    = "info";
    std::string rule_set_base =
        "https://raw.githubusercontent.com/SagerNet/sing-geosite/rule-set";
};

// Trim, map the standard alphabet onto the url-safe one, drop '=' padding.
std::string normalize_reality_key(const std::string& key);

// One engine inbound object. False (err filled) when the endpoint carries
// no users or its Reality key is unusable; such endpoints must not ship.
bool translate_inbound(const rp::Node& node, const Endpoint& ep, const BuildOptions& opt,
                       Json::Value& out, std::string& err);

// Full engine document for a node. Endpoints that fail translation are
// logged and left out. `emitted` (optional) receives the inbound tags
// that made it into the document.
Json::Value build_document(const rp::Node& node, const std::vector<Endpoint>& endpoints,
                           const std::optional<RelayOutbound>& relay, const BuildOptions& opt,
                           std::vector<std::string>* emitted = nullptr);

} // namespace rp::internal
