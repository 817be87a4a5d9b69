/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */

#include "rp/internal/node_api.hpp"
#include "rp/internal/http_parser.hpp"
#include "rp/internal/json_codec.hpp"
#include "rp/internal/utils.hpp"
#include "rp/log.hpp"

namespace rp::internal {

rp::HttpResponse NodeApi::error(int status, const char* reason, const std::string& code) const {
    rp::HttpResponse resp;
    resp.status = status;
    resp.reason = reason;
    if (_cfg.redact_errors) resp.body = R"({"status":"ERROR"})";
    else resp.body = std::string(R"({"status":"ERROR","reason":")") + code + R"("})";
    return resp;
}

rp::HttpResponse NodeApi::handle(const rp::HttpRequest& r, const std::string& peer_ip) {
    if (r.method != "GET") {
        return error(405, "Method Not Allowed", "ONLY_GET");
    }
    if (r.path == "/health") {
        rp::HttpResponse resp;
        resp.body = R"({"status":"OK"})";
        return resp;
    }
    if (r.path == "/api/v2/node/config") {
        return node_config(r, peer_ip);
    }
    return error(404, "Not Found", "NOT_FOUND");
}

rp::HttpResponse NodeApi::node_config(const rp::HttpRequest& r, const std::string& peer_ip) {
    std::string token = hdr_ci(r, "Authorization");
    trim_inplace(token);
    const std::string scheme = lower_copy(token.substr(0, 7));
    if (scheme == "bearer" || scheme == "bearer ") {
        token = token.substr(6);
        trim_inplace(token);
    }
    if (token.empty()) {
        rp::log_line("[401] ip=" + peer_ip + " reason=MISSING_TOKEN");
        return error(401, "Unauthorized", "MISSING_TOKEN");
    }

    rp::Node node;
    if (!_store.find_node_by_token(token, node)) {
        rp::log_line("[401] ip=" + peer_ip + " reason=INVALID_TOKEN");
        return error(401, "Unauthorized", "INVALID_TOKEN");
    }
    const std::string nid = std::to_string(node.id);
    if (!node.enabled) {
        rp::log_line("[403] ip=" + peer_ip + " node=" + nid + " reason=NODE_DISABLED");
        return error(403, "Forbidden", "NODE_DISABLED");
    }
    if (!_node_rl.allow(nid, _cfg.rl_node_rate, _cfg.rl_node_burst)) {
        rp::log_line("[429] ip=" + peer_ip + " node=" + nid + " reason=NODE_RATE_LIMIT");
        return error(429, "Too Many Requests", "RATE_LIMIT");
    }

    // A failed synthesis is reported, never papered over with a stale config.
    try {
        rp::Document doc = _synth.synthesize(node.id);
        Json::Value body;
        body["hash"] = doc.hash;
        body["content"] = doc.root;
        rp::HttpResponse resp;
        resp.body = write_json(body);
        rp::log_line("[200] ip=" + peer_ip + " node=" + nid + " hash=" + doc.hash.substr(0, 12));
        return resp;
    } catch (const rp::PortExhaustion& e) {
        rp::log_line("[500] node=" + nid + " reason=PORT_EXHAUSTION " + e.what());
        return error(500, "Internal Server Error", "PORT_EXHAUSTION");
    } catch (const rp::ValidationError& e) {
        rp::log_line("[500] node=" + nid + " reason=VALIDATION_FAILED " + e.output());
        return error(500, "Internal Server Error", "VALIDATION_FAILED");
    } catch (const std::exception& e) {
        rp::log_line("[500] node=" + nid + " reason=SYNTH_FAILED " + e.what());
        return error(500, "Internal Server Error", "SYNTH_FAILED");
    }
}

} // namespace rp::internal
