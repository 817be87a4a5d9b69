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
#include <json/json.h>
#include "rp/types.hpp"

namespace rp::internal {

// Parse JSON text. On failure returns false and fills err.
bool parse_json(const std::string& text, Json::Value& out, std::string& err);

// Compact (no whitespace) unless pretty. Object keys come out sorted.
std::string write_json(const Json::Value& v, bool pretty = false);

// Lenient field readers (missing or wrong type -> default).
std::string json_str(const Json::Value& obj, const char* key, const std::string& def = "");
int64_t     json_i64(const Json::Value& obj, const char* key, int64_t def = 0);
bool        json_bool(const Json::Value& obj, const char* key, bool def = false);

// Record codecs, shared by the snapshot file and the Redis backend.
Json::Value node_to_json(const rp::Node& n);
bool node_from_json(const Json::Value& v, rp::Node& out);

Json::Value group_to_json(const rp::NodeGroup& g);
bool group_from_json(const Json::Value& v, rp::NodeGroup& out);

Json::Value template_to_json(const rp::InboundTemplate& t);
bool template_from_json(const Json::Value& v, rp::InboundTemplate& out);

Json::Value inbound_to_json(const rp::Inbound& ib);
bool inbound_from_json(const Json::Value& v, rp::Inbound& out);

Json::Value subscription_to_json(const rp::Subscription& s);
bool subscription_from_json(const Json::Value& v, rp::Subscription& out);

} // namespace rp::internal
