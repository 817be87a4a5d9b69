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
#include "rp/http_request.hpp"
#include "rp/panel_config.hpp"
#include "rp/synthesizer.hpp"
#include "rp/internal/ratelimit.hpp"
#include "rp/internal/store.hpp"

namespace rp::internal {

/**
 * Request router shared by the plain and TLS listeners.
 *   GET /health
 *   GET /api/v2/node/config   (Authorization: [Bearer ]<join_token>)
 * Never throws: synthesis failures become 500 with a reason code.
 */
class NodeApi {
public:
    NodeApi(const rp::PanelConfig& cfg, Store& store, rp::Synthesizer& synth)
        : _cfg(cfg), _store(store), _synth(synth) {}

    rp::HttpResponse handle(const rp::HttpRequest& r, const std::string& peer_ip);

    TokenBucketMap& node_limiter() { return _node_rl; }

private:
    const rp::PanelConfig& _cfg;
    Store& _store;
    rp::Synthesizer& _synth;
    TokenBucketMap _node_rl;

    rp::HttpResponse node_config(const rp::HttpRequest& r, const std::string& peer_ip);
    rp::HttpResponse error(int status, const char* reason, const std::string& code) const;
};

} // namespace rp::internal
