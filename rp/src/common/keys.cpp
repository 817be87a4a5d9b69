/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/keys.hpp"
#include "rp/internal/utils.hpp"
#include "rp/log.hpp"

#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/crypto.h>
#include <memory>

namespace rp::internal {

namespace {

struct PkeyDeleter { void operator()(EVP_PKEY* p) const { EVP_PKEY_free(p); } };
struct PkeyCtxDeleter { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

void log_openssl_error(const char* where) {
    unsigned long e;
    while ((e = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        rp::log_line(std::string("[KEYS] openssl error at ") + where + ": " + buf);
    }
}

bool x25519_generate(unsigned char priv[32], unsigned char pub[32]) {
    PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_X25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        log_openssl_error("keygen_init");
        return false;
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        log_openssl_error("keygen");
        return false;
    }
    PkeyPtr key(raw);
    std::size_t plen = 32, qlen = 32;
    if (EVP_PKEY_get_raw_private_key(key.get(), priv, &plen) != 1 || plen != 32 ||
        EVP_PKEY_get_raw_public_key(key.get(), pub, &qlen) != 1 || qlen != 32) {
        log_openssl_error("get_raw_key");
        return false;
    }
    return true;
}

bool x25519_public(const unsigned char priv[32], unsigned char pub[32]) {
    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_X25519, nullptr, priv, 32));
    if (!key) {
        log_openssl_error("new_raw_private_key");
        return false;
    }
    std::size_t qlen = 32;
    if (EVP_PKEY_get_raw_public_key(key.get(), pub, &qlen) != 1 || qlen != 32) {
        log_openssl_error("get_raw_public_key");
        return false;
    }
    return true;
}

} // namespace

bool generate_reality_keypair(RealityKeys& out) {
    unsigned char priv[32], pub[32];
    if (!x25519_generate(priv, pub)) return false;
    const std::string sid = random_hex(8);
    if (sid.empty()) {
        OPENSSL_cleanse(priv, sizeof(priv));
        return false;
    }
    out.private_key = base64url_encode_nopad(priv, sizeof(priv));
    out.public_key  = base64url_encode_nopad(pub, sizeof(pub));
    out.short_id    = sid;
    OPENSSL_cleanse(priv, sizeof(priv));
    return true;
}

bool generate_wireguard_keypair(KeyPair& out) {
    unsigned char priv[32], pub[32];
    if (!x25519_generate(priv, pub)) return false;
    out.private_key = base64_encode(priv, sizeof(priv));
    out.public_key  = base64_encode(pub, sizeof(pub));
    OPENSSL_cleanse(priv, sizeof(priv));
    return true;
}

bool derive_deterministic_key(const std::string& seed, KeyPair& out) {
    std::string d = sha256_raw(seed + kDeterministicKeySalt);
    unsigned char priv[32], pub[32];
    for (std::size_t i = 0; i < 32; ++i) priv[i] = (unsigned char)d[i];
    secure_wipe(d);

    priv[0]  &= 248;
    priv[31] &= 127;
    priv[31] |= 64;

    if (!x25519_public(priv, pub)) {
        OPENSSL_cleanse(priv, sizeof(priv));
        return false;
    }
    out.private_key = base64_encode(priv, sizeof(priv));
    out.public_key  = base64_encode(pub, sizeof(pub));
    OPENSSL_cleanse(priv, sizeof(priv));
    return true;
}

bool public_key_from_private(const std::string& private_key, std::string& out_public) {
    std::string raw;
    const bool padded = !private_key.empty() && private_key.back() == '=';
    bool ok = padded ? base64_decode(private_key, raw) : base64_decode_nopad(private_key, raw);
    if (!ok || raw.size() != 32) {
        secure_wipe(raw);
        return false;
    }
    unsigned char pub[32];
    ok = x25519_public(reinterpret_cast<const unsigned char*>(raw.data()), pub);
    secure_wipe(raw);
    if (!ok) return false;
    out_public = padded ? base64_encode(pub, sizeof(pub))
                        : base64url_encode_nopad(pub, sizeof(pub));
    return true;
}

bool is_valid_private_key(const std::string& key) {
    if (key.size() < 43) return false;
    std::string raw;
    const bool ok = base64_decode_nopad(key, raw) && raw.size() == 32;
    secure_wipe(raw);
    return ok;
}

bool heal_node_keys(rp::Node& node, bool uses_reality) {
    bool changed = false;
    std::string trimmed = trim_copy(node.reality_priv);
    if (trimmed != node.reality_priv) {
        node.reality_priv = trimmed;
        changed = true;
    }
    if (!uses_reality) return changed;

    if (is_valid_private_key(node.reality_priv)) {
        if (node.reality_pub.empty()) {
            std::string pub;
            if (public_key_from_private(node.reality_priv, pub)) {
                node.reality_pub = pub;
                changed = true;
            }
        }
        return changed;
    }

    RealityKeys fresh;
    if (!generate_reality_keypair(fresh)) {
        rp::log_line("[KEYS] node=" + std::to_string(node.id) +
                     " reality key regeneration failed; keeping stored material");
        return changed;
    }
    node.reality_priv = fresh.private_key;
    node.reality_pub  = fresh.public_key;
    node.short_id     = fresh.short_id;
    rp::log_line("[KEYS] node=" + std::to_string(node.id) + " reality keys regenerated");
    return true;
}

} // namespace rp::internal
