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
#include <cstdint>
#include <cstddef>

namespace rp::internal {

// Trim spaces from both sides (in-place).
void trim_inplace(std::string& s);
std::string trim_copy(std::string s);

// Hex helpers
int  hexval(char c);
std::string bytes_to_hex(const unsigned char* p, std::size_t n);

// SHA-256 (uses OpenSSL from .cpp)
std::string sha256_hex(const std::string& data);
std::string sha256_raw(const std::string& data);

// Base64. The url variant emits no padding; decoders reject '=' where noted.
std::string base64_encode(const unsigned char* p, std::size_t n);
std::string base64url_encode_nopad(const unsigned char* p, std::size_t n);
bool base64_decode(const std::string& in, std::string& out);
// Accepts both alphabets, no padding.
bool base64_decode_nopad(const std::string& in, std::string& out);

std::string lower_copy(std::string s);

// Replace every occurrence of `from` in `s`.
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Securely wipe string contents
void secure_wipe(std::string& s);

// CSPRNG helpers (RAND_bytes). Empty / false on RNG failure.
std::string random_hex(std::size_t n_bytes);
bool random_u32(uint32_t& out);
// Uniform in [lo, hi]; lo <= hi required.
bool random_between(int lo, int hi, int& out);

// UUID-shaped string derived from seed.
std::string stable_uuid(const std::string& seed);

} // namespace rp::internal
