/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */

#include "rp/server.hpp"
#include "rp/internal/json_codec.hpp"
#include "rp/internal/memory_store.hpp"
#include "rp/internal/redis_store.hpp"
#include "rp/log.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>

// Per-connection handlers provided by http_* modules.
namespace rp::internal {

// Handles a single plain HTTP connection (keep-alive is managed inside).
void handle_connection_plain(int fd,
                             const rp::PanelConfig& cfg,
                             const std::string& peer_ip,
                             rp::internal::NodeApi& api,
                             rp::internal::TokenBucketMap& ip_rl);

// Handles a single HTTPS connection (keep-alive is managed inside).
void handle_connection_tls(int fd,
                           const rp::PanelConfig& cfg,
                           const std::string& peer_ip,
                           rp::internal::TlsContext& tls,
                           rp::internal::NodeApi& api,
                           rp::internal::TokenBucketMap& ip_rl);

} // namespace rp::internal

namespace rp {

// ---------- small socket helpers (internal) ----------

static int set_reuseaddr(int s) { int o = 1; return ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &o, sizeof(o)); }
static int set_nodelay (int s)  { int o = 1; return ::setsockopt(s, IPPROTO_TCP, TCP_NODELAY, &o, sizeof(o)); }

static std::string sockaddr_to_ip(const sockaddr_storage& ss) {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (ss.ss_family == AF_INET) {
        const sockaddr_in* a = reinterpret_cast<const sockaddr_in*>(&ss);
        inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf));
    } else if (ss.ss_family == AF_INET6) {
        const sockaddr_in6* a = reinterpret_cast<const sockaddr_in6*>(&ss);
        inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf));
    } else {
        std::snprintf(buf, sizeof(buf), "unknown");
    }
    return std::string(buf);
}

static internal::BuildOptions build_options(const PanelConfig& cfg) {
    internal::BuildOptions b;
    b.dns_resolver = cfg.dns_resolver;
    b.clash_api    = cfg.clash_api;
    b.cert_path    = cfg.engine_cert;
    b.key_path     = cfg.engine_key;
    b.fallback_sni = cfg.fallback_sni;
    return b;
}

// ---------- Server impl ----------

Server::Server(const PanelConfig& cfg)
    : _cfg(cfg), _sni(cfg.fallback_sni)
{
    // --- Fleet storage (file or Redis) ---
    if (_cfg.store_use_redis) {
        internal::RedisStore::Options ropt;
        ropt.host       = _cfg.redis.host;
        ropt.port       = _cfg.redis.port;
        ropt.db         = _cfg.redis.db;
        ropt.password   = _cfg.redis.password;
        ropt.key_prefix = _cfg.redis.key_prefix;
        ropt.pool_size  = _cfg.redis.pool_size;
        ropt.timeout_ms = _cfg.redis.timeout_ms;

        auto rs = std::make_unique<internal::RedisStore>();
        if (!rs->init(ropt)) {
            throw std::runtime_error("Store: failed to init Redis backend");
        }
        // A fleet file next to Redis seeds it once at boot.
        if (!_cfg.fleet_file.empty()) {
            std::ifstream in(_cfg.fleet_file);
            std::stringstream ss;
            ss << in.rdbuf();
            Json::Value root;
            std::string err;
            if (!in.good() || !internal::parse_json(ss.str(), root, err) ||
                !rs->import_snapshot(root, err)) {
                throw std::runtime_error("Store: failed to import " + _cfg.fleet_file + ": " + err);
            }
            rp::log_line("[STORE] imported " + _cfg.fleet_file + " into Redis");
        }
        _store = std::move(rs);
    } else {
        if (_cfg.fleet_file.empty()) {
            throw std::runtime_error("Store: fleet_file is required when Redis is disabled");
        }
        auto ms = std::make_unique<internal::MemoryStore>();
        if (!ms->init_file(_cfg.fleet_file)) {
            throw std::runtime_error("Store: failed to load fleet_file");
        }
        if (_cfg.fleet_persist) ms->set_persist_path(_cfg.fleet_file);
        _store = std::move(ms);
    }

    // --- Synthesis pipeline ---
    if (_cfg.validate) {
        _validator = std::make_unique<internal::EngineValidator>(
            _cfg.checker_bin, _cfg.checker_timeout_ms, _cfg.checker_tmp_dir);
    } else {
        _validator = std::make_unique<internal::NullValidator>();
    }

    SynthOptions sopt;
    sopt.build = build_options(_cfg);
    if (!_cfg.relay_auth_mode.empty()) {
        sopt.relay_auth_mode = relay_auth_mode_from_setting(_cfg.relay_auth_mode);
    }
    _synth = std::make_unique<Synthesizer>(*_store, _sni, *_validator, sopt);
    _api = std::make_unique<internal::NodeApi>(_cfg, *_store, *_synth);

    if (_cfg.tls_enabled) {
        _tls = std::make_unique<internal::TlsContext>(_cfg);
    }

    _rl_gc_thread = std::thread(&Server::rl_gc_loop, this);
}

Server::~Server() {
    stop();
    if (_rl_gc_thread.joinable()) {
        _rl_gc_thread.join();
    }
}

void Server::stop() {
    _stop.store(true, std::memory_order_relaxed);
    // Unblocks accept().
    int fd = _listen_fd.exchange(-1);
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

int Server::create_listen_socket() {
    int srv = ::socket(AF_INET, SOCK_STREAM, 0);
    if (srv < 0) {
        rp::log_line(std::string("[FATAL] socket() failed: ") + std::strerror(errno));
        throw std::runtime_error("socket() failed");
    }
    (void)set_reuseaddr(srv);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(_cfg.port);

    if (bind(srv, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        rp::log_line(std::string("[FATAL] bind() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("bind() failed");
    }
    if (listen(srv, 512) < 0) {
        rp::log_line(std::string("[FATAL] listen() failed: ") + std::strerror(errno));
        ::close(srv);
        throw std::runtime_error("listen() failed");
    }
    _listen_fd.store(srv);
    return srv;
}

void Server::run() {
    rp::log_line("[INFO] RelayPlane panel starting...");
    rp::log_line("[INFO] Port: " + std::to_string(_cfg.port) + (_tls ? " (TLS)" : ""));
    if (_cfg.store_use_redis) {
        rp::log_line(std::string("[INFO] Fleet store: REDIS host=") + _cfg.redis.host +
                     ":" + std::to_string(_cfg.redis.port) +
                     " db=" + std::to_string(_cfg.redis.db) +
                     " prefix=" + _cfg.redis.key_prefix);
    } else {
        rp::log_line("[INFO] Fleet store: FILE " + _cfg.fleet_file +
                     (_cfg.fleet_persist ? " (persist)" : " (read-only)"));
    }
    rp::log_line(std::string("[INFO] Relay auth mode: ") + relay_auth_mode_name(_synth->relay_mode()) +
                 (_cfg.relay_auth_mode.empty() ? " (stored setting)" : " (override)"));
    if (_cfg.validate) {
        rp::log_line("[INFO] Validator: " + _cfg.checker_bin + " timeout=" +
                     std::to_string(_cfg.checker_timeout_ms) + "ms");
    } else {
        rp::log_line("[INFO] Validator: DISABLED");
    }
    if (_cfg.redact_errors) {
        rp::log_line("[INFO] Error redaction: ENABLED");
    }
    if (_cfg.rl_ip_rate > 0.0 && _cfg.rl_ip_burst > 0.0) {
        rp::log_line("[INFO] RL-IP: rate=" + std::to_string(_cfg.rl_ip_rate) +
                     " burst=" + std::to_string(_cfg.rl_ip_burst));
    }
    if (_cfg.rl_node_rate > 0.0 && _cfg.rl_node_burst > 0.0) {
        rp::log_line("[INFO] RL-Node: rate=" + std::to_string(_cfg.rl_node_rate) +
                     " burst=" + std::to_string(_cfg.rl_node_burst));
    }
    rp::log_line("[INFO] KA timeout=" + std::to_string(_cfg.ka_timeout_sec) +
                 "s, KA max=" + std::to_string(_cfg.ka_max));

    if (_tls) {
        serve_tls();
    } else {
        serve_plain();
    }
}

void Server::rl_gc_loop() {
    const int idle = std::max(1, _cfg.rl_idle_sec);
    auto next = std::chrono::steady_clock::now() + std::chrono::seconds(idle);
    while (!_stop.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() < next) continue;
        next = std::chrono::steady_clock::now() + std::chrono::seconds(idle);
        _ip_rl.sweep(idle);
        _api->node_limiter().sweep(idle);
    }
}

void Server::serve_plain() {
    int srv = create_listen_socket();
    rp::log_line(std::string("[INFO] Listening HTTP on :") + std::to_string(_cfg.port));

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            // transient error; continue
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        // Detach a per-connection handler; it will manage the fd lifetime.
        std::thread([this, fd, peer]() {
            internal::handle_connection_plain(fd, this->_cfg, peer, *this->_api, this->_ip_rl);
        }).detach();
    }

    ::close(srv);
}

void Server::serve_tls() {
    int srv = create_listen_socket();
    rp::log_line(std::string("[INFO] Listening HTTPS on :") + std::to_string(_cfg.port));

    while (!_stop.load(std::memory_order_relaxed)) {
        sockaddr_storage cli{};
        socklen_t cl = sizeof(cli);
        int fd = ::accept(srv, reinterpret_cast<sockaddr*>(&cli), &cl);
        if (fd < 0) {
            if (errno == EINTR) continue;
            continue;
        }
        (void)set_nodelay(fd);
        std::string peer = sockaddr_to_ip(cli);

        // Handler owns the fd and the SSL shutdown.
        std::thread([this, fd, peer]() {
            internal::handle_connection_tls(fd, this->_cfg, peer, *this->_tls, *this->_api,
                                            this->_ip_rl);
        }).detach();
    }

    ::close(srv);
}

} // namespace rp
