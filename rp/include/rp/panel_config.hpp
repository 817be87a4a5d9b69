/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace rp {

struct PanelConfig {
    // Listener
    uint16_t port = 8080;

    // TLS (enabled when both files are set)
    bool        tls_enabled = false;
    std::string tls_cert_file;
    std::string tls_key_file;

    size_t max_body = 64 * 1024;

    // Error redaction
    bool redact_errors = false;

    // Rate limits (0 = off)
    double rl_ip_rate    = 0.0;
    double rl_ip_burst   = 0.0;
    double rl_node_rate  = 0.0;
    double rl_node_burst = 0.0;
    int    rl_idle_sec   = 600;   // buckets idle this long are dropped

    // Keep-alive
    int ka_timeout_sec = 5;
    int ka_max         = 100;

    // ---- fleet storage ----
    // File backend; with store_use_redis=true the file only seeds Redis at boot
    std::string fleet_file;
    bool        fleet_persist = true;   // write mutations back to fleet_file

    bool store_use_redis = false;
    struct {
        std::string host = "127.0.0.1";
        int         port = 6379;
        int         db   = 0;
        std::string password;
        std::string key_prefix = "rp:";
        int         pool_size  = 8;
        int         timeout_ms = 200;
    } redis;

    // ---- synthesis ----
    std::string relay_auth_mode;   // legacy|v1|dual; empty = stored setting
    std::string dns_resolver = "8.8.8.8";
    std::string clash_api    = "127.0.0.1:9090";
    std::string engine_cert  = "/etc/sing-box/certs/cert.pem";
    std::string engine_key   = "/etc/sing-box/certs/key.pem";
    std::string fallback_sni = "www.google.com";

    // ---- validator ----
    bool        validate = true;
    std::string checker_bin = "sing-box";
    int         checker_timeout_ms = 5000;
    std::string checker_tmp_dir = "/tmp";
};

} // namespace rp
