/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */

#include "rp/panel_config.hpp"
#include "rp/http_request.hpp"
#include "rp/internal/http_parser.hpp"
#include "rp/internal/node_api.hpp"
#include "rp/internal/ratelimit.hpp"
#include "rp/log.hpp"

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <algorithm>

namespace rp::internal {

// --- I/O helpers ---

static bool send_all(int fd, const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n <= 0) return false;
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// Bytes past the current request (pipelining) stay in `pending`.
static bool recv_http_request(int fd, const rp::PanelConfig& cfg, std::string& pending,
                              rp::HttpRequest& R)
{
    char buf[2048];
    std::size_t hdr_end;
    while ((hdr_end = pending.find("\r\n\r\n")) == std::string::npos) {
        if (pending.size() > kMaxHeadBytes) return false;
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        pending.append(buf, buf + n);
    }
    if (!parse_request_head(pending.substr(0, hdr_end), R)) return false;

    std::size_t len = 0;
    if (!content_length(R, cfg.max_body, len)) return false;
    pending.erase(0, hdr_end + 4);

    while (pending.size() < len) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        pending.append(buf, buf + n);
    }
    R.body = pending.substr(0, len);
    pending.erase(0, len);
    return true;
}

// --- Exported entry point for server.cpp ---

void handle_connection_plain(int fd,
                             const rp::PanelConfig& cfg,
                             const std::string& peer_ip,
                             rp::internal::NodeApi& api,
                             rp::internal::TokenBucketMap& ip_rl)
{
    // Per-connection kernel timeouts
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    std::string pending;
    int served = 0;
    while (served < cfg.ka_max) {
        rp::HttpRequest R;
        if (!recv_http_request(fd, cfg, pending, R)) break;
        ++served;

        bool ka = should_keep_alive(R) && served < cfg.ka_max;
        rp::HttpResponse resp;
        if (!ip_rl.allow(peer_ip, cfg.rl_ip_rate, cfg.rl_ip_burst)) {
            rp::log_line(std::string("[429] ip=") + peer_ip + " reason=IP_RATE_LIMIT");
            resp.status = 429;
            resp.reason = "Too Many Requests";
            resp.body = cfg.redact_errors ? R"({"status":"ERROR"})"
                                          : R"({"status":"ERROR","reason":"RATE_LIMIT"})";
        } else {
            resp = api.handle(R, peer_ip);
        }

        if (!send_all(fd, format_response(cfg, resp, ka))) break;
        if (!ka) break;
    }
    ::close(fd);
}

} // namespace rp::internal
