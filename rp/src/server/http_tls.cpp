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
#include "rp/internal/tls_ctx.hpp"
#include "rp/log.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/types.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <algorithm>

namespace rp::internal {

// --- TLS I/O helpers ---

static bool ssl_send_all(SSL* ssl, const std::string& data) {
    std::size_t off = 0;
    while (off < data.size()) {
        int n = SSL_write(ssl, data.data() + off, static_cast<int>(data.size() - off));
        if (n <= 0) {
            (void)SSL_get_error(ssl, n);
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

static bool recv_http_request_ssl(SSL* ssl, const rp::PanelConfig& cfg, std::string& pending,
                                  rp::HttpRequest& R)
{
    char buf[2048];
    std::size_t hdr_end;
    while ((hdr_end = pending.find("\r\n\r\n")) == std::string::npos) {
        if (pending.size() > kMaxHeadBytes) return false;
        int n = SSL_read(ssl, buf, sizeof(buf));
        if (n <= 0) {
            (void)SSL_get_error(ssl, n);
            return false;
        }
        pending.append(buf, buf + n);
    }
    if (!parse_request_head(pending.substr(0, hdr_end), R)) return false;

    std::size_t len = 0;
    if (!content_length(R, cfg.max_body, len)) return false;
    pending.erase(0, hdr_end + 4);

    while (pending.size() < len) {
        int n = SSL_read(ssl, buf, sizeof(buf));
        if (n <= 0) {
            (void)SSL_get_error(ssl, n);
            return false;
        }
        pending.append(buf, buf + n);
    }
    R.body = pending.substr(0, len);
    pending.erase(0, len);
    return true;
}

// --- Exported entry point for server.cpp ---

void handle_connection_tls(int fd,
                           const rp::PanelConfig& cfg,
                           const std::string& peer_ip,
                           rp::internal::TlsContext& tls,
                           rp::internal::NodeApi& api,
                           rp::internal::TokenBucketMap& ip_rl)
{
    // Timeouts first so a stalled handshake cannot pin the thread.
    timeval tv{cfg.ka_timeout_sec, 0};
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    SSL* ssl = SSL_new(tls.ctx());
    if (!ssl) { ::close(fd); return; }
    SSL_set_fd(ssl, fd);

    if (SSL_accept(ssl) <= 0) {
        ERR_clear_error();
        SSL_free(ssl);
        ::close(fd);
        return;
    }

    std::string pending;
    int served = 0;
    while (served < cfg.ka_max) {
        rp::HttpRequest R;
        if (!recv_http_request_ssl(ssl, cfg, pending, R)) break;
        ++served;

        bool ka = should_keep_alive(R) && served < cfg.ka_max;
        rp::HttpResponse resp;
        if (!ip_rl.allow(peer_ip, cfg.rl_ip_rate, cfg.rl_ip_burst)) {
            rp::log_line(std::string("[429] TLS ip=") + peer_ip + " reason=IP_RATE_LIMIT");
            resp.status = 429;
            resp.reason = "Too Many Requests";
            resp.body = cfg.redact_errors ? R"({"status":"ERROR"})"
                                          : R"({"status":"ERROR","reason":"RATE_LIMIT"})";
        } else {
            resp = api.handle(R, peer_ip);
        }

        if (!ssl_send_all(ssl, format_response(cfg, resp, ka))) break;
        if (!ka) break;
    }

    SSL_shutdown(ssl);
    SSL_free(ssl);
    ::close(fd);
}

} // namespace rp::internal
