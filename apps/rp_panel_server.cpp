// SPDX-License-Identifier: Apache-2.0
// Part of RelayPlane (RP) project.
// apps/rp_panel_server.cpp

#include "rp/server.hpp"
#include "rp/panel_config.hpp"
#include "rp/log.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>   // dup2, STDOUT_FILENO, STDERR_FILENO
#include <fcntl.h>    // open

// Silences all console output by redirecting stdout/stderr to /dev/null.
static void make_process_quiet() {
    int nullfd = ::open("/dev/null", O_WRONLY);
    if (nullfd >= 0) {
        (void)::dup2(nullfd, STDOUT_FILENO);
        (void)::dup2(nullfd, STDERR_FILENO);
        ::close(nullfd);
    }
}

static void usage(const char* argv0) {
    std::cerr <<
      "Usage:\n  " << argv0
      << " --port <n> [--fleet_file <snapshot.json>] [--fleet_persist 0|1]\n"
         "  [--tls_cert <crt> --tls_key <key>]\n"
         "  [--redact_errors 0|1] [--max_body <bytes>]\n"
         "  [--rl_ip_rate <r> --rl_ip_burst <b>] [--rl_node_rate <r> --rl_node_burst <b>]\n"
         "  [--ka_timeout <sec>] [--ka_max <n>]\n"
         "  Synthesis:\n"
         "    [--relay_auth_mode legacy|v1|dual] [--dns <ip>] [--clash_api <host:port>]\n"
         "    [--engine_cert <path>] [--engine_key <path>] [--fallback_sni <host>]\n"
         "  Validator:\n"
         "    [--validate 0|1] [--checker <bin>] [--checker_timeout_ms 5000] [--tmp_dir /tmp]\n"
         "  Redis fleet backend:\n"
         "    --store_redis 1 "
         "[--redis_host 127.0.0.1] [--redis_port 6379] [--redis_db 0]\n"
         "    [--redis_password ****] [--redis_prefix rp:] [--redis_pool 8]\n"
         "    [--redis_timeout_ms 200]\n"
         "  [--log_file rp.log] [--quiet 0|1]\n";
}

int main(int argc, char** argv) {
    rp::PanelConfig cfg;
    bool quiet = false;
    std::string log_file;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--port" && i+1 < argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if (a == "--fleet_file" && i+1 < argc) cfg.fleet_file = argv[++i];
            else if (a == "--fleet_persist" && i+1 < argc) cfg.fleet_persist = (std::stoi(argv[++i]) != 0);
            else if (a == "--tls_cert" && i+1 < argc) cfg.tls_cert_file = argv[++i];
            else if (a == "--tls_key"  && i+1 < argc) cfg.tls_key_file  = argv[++i];
            else if (a == "--redact_errors" && i+1 < argc) cfg.redact_errors = (std::stoi(argv[++i]) != 0);
            else if (a == "--max_body" && i+1 < argc) cfg.max_body = (size_t)std::stoul(argv[++i]);
            else if (a == "--rl_ip_rate" && i+1 < argc) cfg.rl_ip_rate = std::stod(argv[++i]);
            else if (a == "--rl_ip_burst" && i+1 < argc) cfg.rl_ip_burst = std::stod(argv[++i]);
            else if (a == "--rl_node_rate" && i+1 < argc) cfg.rl_node_rate = std::stod(argv[++i]);
            else if (a == "--rl_node_burst" && i+1 < argc) cfg.rl_node_burst = std::stod(argv[++i]);
            else if (a == "--ka_timeout" && i+1 < argc) cfg.ka_timeout_sec = std::stoi(argv[++i]);
            else if (a == "--ka_max" && i+1 < argc) cfg.ka_max = std::stoi(argv[++i]);
            else if (a == "--quiet" && i+1 < argc) quiet = (std::stoi(argv[++i]) != 0);
            else if (a == "--log_file" && i+1 < argc) log_file = argv[++i];

            // Synthesis
            else if (a == "--relay_auth_mode" && i+1 < argc) cfg.relay_auth_mode = argv[++i];
            else if (a == "--dns" && i+1 < argc) cfg.dns_resolver = argv[++i];
            else if (a == "--clash_api" && i+1 < argc) cfg.clash_api = argv[++i];
            else if (a == "--engine_cert" && i+1 < argc) cfg.engine_cert = argv[++i];
            else if (a == "--engine_key" && i+1 < argc) cfg.engine_key = argv[++i];
            else if (a == "--fallback_sni" && i+1 < argc) cfg.fallback_sni = argv[++i];

            // Validator
            else if (a == "--validate" && i+1 < argc) cfg.validate = (std::stoi(argv[++i]) != 0);
            else if (a == "--checker" && i+1 < argc) cfg.checker_bin = argv[++i];
            else if (a == "--checker_timeout_ms" && i+1 < argc) cfg.checker_timeout_ms = std::stoi(argv[++i]);
            else if (a == "--tmp_dir" && i+1 < argc) cfg.checker_tmp_dir = argv[++i];

            // Redis backend flags
            else if (a == "--store_redis" && i+1 < argc) cfg.store_use_redis = (std::stoi(argv[++i]) != 0);
            else if (a == "--redis_host" && i+1 < argc) cfg.redis.host = argv[++i];
            else if (a == "--redis_port" && i+1 < argc) cfg.redis.port = std::stoi(argv[++i]);
            else if (a == "--redis_db" && i+1 < argc)   cfg.redis.db = std::stoi(argv[++i]);
            else if (a == "--redis_password" && i+1<argc) cfg.redis.password = argv[++i];
            else if (a == "--redis_prefix" && i+1<argc)   cfg.redis.key_prefix = argv[++i];
            else if (a == "--redis_pool" && i+1<argc)     cfg.redis.pool_size = std::stoi(argv[++i]);
            else if (a == "--redis_timeout_ms" && i+1<argc) cfg.redis.timeout_ms = std::stoi(argv[++i]);

            else { usage(argv[0]); return 2; }
        }
    } catch (const std::exception&) {
        usage(argv[0]);
        return 2;
    }

    // Apply quiet mode before any logging can occur.
    if (quiet) {
        make_process_quiet();
    }
    if (!log_file.empty()) {
        rp::set_log_file(log_file);
    }

    if (!cfg.tls_cert_file.empty() || !cfg.tls_key_file.empty()) {
        if (cfg.tls_cert_file.empty() || cfg.tls_key_file.empty()) {
            std::cerr << "TLS requires both --tls_cert and --tls_key\n";
            return 2;
        }
        cfg.tls_enabled = true;
    }

    if (!cfg.relay_auth_mode.empty()) {
        const std::string m = cfg.relay_auth_mode;
        if (m != "legacy" && m != "v1" && m != "hashed" && m != "derived" && m != "dual") {
            std::cerr << "--relay_auth_mode must be legacy, v1 or dual\n";
            return 2;
        }
    }

    if (!cfg.store_use_redis && cfg.fleet_file.empty()) {
        std::cerr << "Either --fleet_file (file backend) or --store_redis 1 (Redis backend) must be provided\n";
        return 2;
    }

    try {
        rp::Server srv(cfg);
        srv.run();  // blocking
    } catch (const std::exception& e) {
        // Note: if --quiet 1 is used, this message is suppressed as well.
        std::cerr << "[FATAL] exception: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
