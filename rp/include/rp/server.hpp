/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */

#pragma once
#include <atomic>
#include <memory>
#include <thread>
#include "rp/panel_config.hpp"
#include "rp/synthesizer.hpp"
#include "rp/internal/node_api.hpp"
#include "rp/internal/ratelimit.hpp"
#include "rp/internal/sni.hpp"
#include "rp/internal/store.hpp"
#include "rp/internal/tls_ctx.hpp"
#include "rp/internal/validator.hpp"

namespace rp {

// Node config HTTP(S) server.
class Server {
public:
    explicit Server(const PanelConfig& cfg);
    ~Server();

    // Blocking run: create socket, listen and accept.
    void run();

    void stop();

private:
    PanelConfig _cfg;
    std::unique_ptr<internal::Store> _store;
    internal::PinnedSniProvider _sni;
    std::unique_ptr<internal::ConfigValidator> _validator;
    std::unique_ptr<Synthesizer> _synth;
    std::unique_ptr<internal::NodeApi> _api;
    internal::TokenBucketMap _ip_rl;
    std::unique_ptr<internal::TlsContext> _tls;
    std::atomic<bool> _stop{false};
    std::atomic<int> _listen_fd{-1};
    std::thread _rl_gc_thread;

    void rl_gc_loop();
    void serve_plain();
    void serve_tls();

    int create_listen_socket();
};

} // namespace rp
