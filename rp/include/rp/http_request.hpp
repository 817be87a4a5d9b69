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
#include <unordered_map>

namespace rp {

struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // "/api/v2/node/config"
    std::string query;    // "a=1&b=2"
    std::string httpver;  // "HTTP/1.1"
    std::unordered_map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    int         status = 200;
    std::string reason = "OK";
    std::string body;
    std::string content_type = "application/json";
};

} // namespace rp
