#include "rp/internal/keys.hpp"
#include "rp/internal/utils.hpp"

#include "test_fleet.hpp"

#include <cassert>
#include <cstring>
#include <string>

namespace {

using namespace rp::internal;

bool is_hex(const std::string& s) {
    for (char c : s) {
        if (hexval(c) < 0) return false;
    }
    return true;
}

void reality_pair_is_well_formed() {
    RealityKeys k;
    assert(generate_reality_keypair(k));
    assert(k.private_key.size() == 43);
    assert(k.public_key.size() == 43);
    assert(k.private_key.find('=') == std::string::npos);
    assert(k.private_key.find('+') == std::string::npos);
    assert(k.private_key.find('/') == std::string::npos);
    assert(k.short_id.size() == 16);
    assert(is_hex(k.short_id));
    assert(is_valid_private_key(k.private_key));

    std::string pub;
    assert(public_key_from_private(k.private_key, pub));
    assert(pub == k.public_key);

    RealityKeys other;
    assert(generate_reality_keypair(other));
    assert(other.private_key != k.private_key);
}

void wireguard_pair_uses_padded_base64() {
    KeyPair kp;
    assert(generate_wireguard_keypair(kp));
    assert(kp.private_key.size() == 44);
    assert(kp.public_key.size() == 44);
    assert(kp.private_key.back() == '=');

    std::string pub;
    assert(public_key_from_private(kp.private_key, pub));
    assert(pub == kp.public_key);
}

void deterministic_key_is_stable_and_clamped() {
    KeyPair a, b, c;
    assert(derive_deterministic_key(rp_test::kSecretA, a));
    assert(derive_deterministic_key(rp_test::kSecretA, b));
    assert(derive_deterministic_key(rp_test::kSecretB, c));
    assert(a.private_key == b.private_key);
    assert(a.public_key == b.public_key);
    assert(a.private_key != c.private_key);

    std::string raw;
    assert(base64_decode(a.private_key, raw));
    assert(raw.size() == 32);
    const unsigned char first = static_cast<unsigned char>(raw[0]);
    const unsigned char last = static_cast<unsigned char>(raw[31]);
    assert((first & 7) == 0);
    assert((last & 128) == 0);
    assert((last & 64) == 64);

    std::string expected = sha256_raw(std::string(rp_test::kSecretA) + kDeterministicKeySalt);
    assert(std::memcmp(expected.data() + 1, raw.data() + 1, 30) == 0);
}

void invalid_keys_are_rejected() {
    assert(!is_valid_private_key(""));
    assert(!is_valid_private_key("short"));
    assert(!is_valid_private_key(std::string(43, '!')));
    // 33 bytes once decoded
    assert(!is_valid_private_key(std::string(44, 'A')));

    std::string pub;
    assert(!public_key_from_private("not-a-key", pub));
}

void heal_regenerates_broken_material() {
    rp::Node n = rp_test::make_node(1, "10.0.0.1");
    n.reality_priv = "garbage";
    assert(heal_node_keys(n, true));
    assert(is_valid_private_key(n.reality_priv));
    assert(n.reality_pub.size() == 43);
    assert(n.short_id.size() == 16);

    // Healthy material is left alone.
    const rp::Node before = n;
    assert(!heal_node_keys(n, true));
    assert(n.reality_priv == before.reality_priv);
    assert(n.short_id == before.short_id);
}

void heal_trims_and_fills_missing_public_key() {
    RealityKeys k;
    assert(generate_reality_keypair(k));

    rp::Node n = rp_test::make_node(2, "10.0.0.2");
    n.reality_priv = "  " + k.private_key + "\n";
    n.short_id = "0123456789abcdef";
    assert(heal_node_keys(n, true));
    assert(n.reality_priv == k.private_key);
    assert(n.reality_pub == k.public_key);
    assert(n.short_id == "0123456789abcdef");
}

void heal_without_reality_only_trims() {
    rp::Node n = rp_test::make_node(3, "10.0.0.3");
    n.reality_priv = "broken";
    assert(!heal_node_keys(n, false));
    assert(n.reality_priv == "broken");

    n.reality_priv = " broken ";
    assert(heal_node_keys(n, false));
    assert(n.reality_priv == "broken");
    assert(n.reality_pub.empty());
}

} // namespace

int main() {
    rp_test::quiet_logs();

    reality_pair_is_well_formed();
    wireguard_pair_uses_padded_base64();
    deterministic_key_is_stable_and_clamped();
    invalid_keys_are_rejected();
    heal_regenerates_broken_material();
    heal_trims_and_fills_missing_public_key();
    heal_without_reality_only_trims();
    return 0;
}
