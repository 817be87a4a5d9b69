/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */

#include "rp/internal/tls_ctx.hpp"
#include "rp/log.hpp"

#include <stdexcept>
#include <openssl/err.h>

namespace rp::internal {

TlsContext::TlsContext(const rp::PanelConfig& cfg) {
    _ctx = SSL_CTX_new(TLS_server_method());
    if (!_ctx) {
        throw std::runtime_error("SSL_CTX_new failed: " + drain_errors("SSL_CTX_new"));
    }

    if (!SSL_CTX_set_min_proto_version(_ctx, TLS1_2_VERSION)) {
        drain_errors("set_min_proto");
    }

    std::string fail;
    if (SSL_CTX_use_certificate_chain_file(_ctx, cfg.tls_cert_file.c_str()) != 1) {
        fail = "certificate " + cfg.tls_cert_file + ": " + drain_errors("use_certificate_chain_file");
    } else if (SSL_CTX_use_PrivateKey_file(_ctx, cfg.tls_key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
        fail = "private key " + cfg.tls_key_file + ": " + drain_errors("use_privatekey_file");
    } else if (SSL_CTX_check_private_key(_ctx) != 1) {
        fail = "key does not match certificate: " + drain_errors("check_private_key");
    }
    if (!fail.empty()) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
        throw std::runtime_error("TLS: " + fail);
    }

    SSL_CTX_set_session_cache_mode(_ctx, SSL_SESS_CACHE_SERVER);
    const unsigned char sid_ctx[] = "rp_panel_sid_ctx_v1";
    SSL_CTX_set_session_id_context(_ctx, sid_ctx, (unsigned int)sizeof(sid_ctx));
}

TlsContext::~TlsContext() {
    if (_ctx) {
        SSL_CTX_free(_ctx);
        _ctx = nullptr;
    }
}

std::string TlsContext::drain_errors(const char* where) {
    std::string last;
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        last = buf;
        rp::log_line(std::string("[TLS] error at ") + where + ": " + buf);
    }
    return last;
}

} // namespace rp::internal
