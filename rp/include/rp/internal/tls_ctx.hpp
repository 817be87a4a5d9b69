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
#include <openssl/ssl.h>
#include "rp/panel_config.hpp"

namespace rp::internal {

// RAII over the listener's SSL_CTX. Throws std::runtime_error if the
// certificate or key cannot be loaded.
class TlsContext {
public:
    explicit TlsContext(const rp::PanelConfig& cfg);
    ~TlsContext();

    SSL_CTX* ctx() const { return _ctx; }

    TlsContext(const TlsContext&) = delete;
    TlsContext& operator=(const TlsContext&) = delete;

private:
    SSL_CTX* _ctx = nullptr;

    // Logs and clears the OpenSSL error queue; returns the last message.
    std::string drain_errors(const char* where);
};

} // namespace rp::internal
