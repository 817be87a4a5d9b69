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
#include "rp/types.hpp"

namespace rp::internal {

struct RealityKeys {
    std::string private_key;  // base64url, no padding
    std::string public_key;   // base64url, no padding
    std::string short_id;     // 16 hex chars
};

struct KeyPair {
    std::string private_key;
    std::string public_key;
};

// Salt appended to the seed for deterministic client keys.
inline constexpr const char* kDeterministicKeySalt = "amneziawg-key-salt";

// Fresh X25519 pair for Reality + 8-byte hex short id.
bool generate_reality_keypair(RealityKeys& out);

// Fresh X25519 pair, standard base64 with padding (WireGuard format).
bool generate_wireguard_keypair(KeyPair& out);

// SHA-256(seed || salt), clamped into an X25519 scalar. Same seed, same pair.
bool derive_deterministic_key(const std::string& seed, KeyPair& out);

// X25519 public key for a base64/base64url private key.
// Output keeps the input alphabet (url-safe no-pad unless the input is padded).
bool public_key_from_private(const std::string& private_key, std::string& out_public);

// Unpadded base64 (either alphabet) of exactly 32 bytes.
bool is_valid_private_key(const std::string& key);

// Lazily repairs the node's Reality material. Trims stray whitespace; when
// the private key is invalid and `uses_reality` is set, regenerates all
// three fields. Returns true if the node changed and must be persisted.
bool heal_node_keys(rp::Node& node, bool uses_reality);

} // namespace rp::internal
