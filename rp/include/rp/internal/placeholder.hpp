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
#include <vector>

namespace rp::internal {

struct PlaceholderValues {
    std::string port;
    std::string uuid;
    std::string sni;
    std::string domain;
    std::string reality_private;
    std::string reality_pbk;
    std::string reality_sid;
};

// Textual substitution before any JSON parsing. Names match
// case-insensitively, inner whitespace ignored; "pool_sni" is an alias of "sni".
std::string render_placeholders(const std::string& text, const PlaceholderValues& values,
                                std::vector<std::string>* unknown = nullptr);

// True if `text` still carries {{name}} (same matching rules).
bool has_placeholder(const std::string& text, const std::string& name);

} // namespace rp::internal
