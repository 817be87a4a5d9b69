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
#include <string>
#include "rp/http_request.hpp"
#include "rp/panel_config.hpp"

namespace rp::internal {

// Upper bound on the request head; longer heads are dropped.
inline constexpr std::size_t kMaxHeadBytes = 64 * 1024;

// Parse "GET /path?x=1 HTTP/1.1"
bool parse_request_line(const std::string& line, rp::HttpRequest& r);

// Parse everything before "\r\n\r\n": request line + headers.
bool parse_request_head(const std::string& head, rp::HttpRequest& r);

// Content-Length of a parsed head; false on garbage or > max_body.
bool content_length(const rp::HttpRequest& r, std::size_t max_body, std::size_t& out);

// Case-insensitive header lookup
std::string hdr_ci(const rp::HttpRequest& r, const char* name);

bool should_keep_alive(const rp::HttpRequest& r);

// Status line + headers + body, ready for the wire.
std::string format_response(const rp::PanelConfig& cfg, const rp::HttpResponse& resp, bool keep_alive);

} // namespace rp::internal
