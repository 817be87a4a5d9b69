#include "rp/internal/placeholder.hpp"

#include "test_fleet.hpp"

#include <cassert>
#include <string>
#include <vector>

namespace {

using namespace rp::internal;

PlaceholderValues sample_values() {
    PlaceholderValues v;
    v.port = "443";
    v.uuid = rp_test::kSecretA;
    v.sni = "www.example.com";
    v.domain = "node.example.net";
    v.reality_private = "PRIV";
    v.reality_pbk = "PUB";
    v.reality_sid = "0123456789abcdef";
    return v;
}

void known_names_are_substituted() {
    const PlaceholderValues v = sample_values();
    const std::string out = render_placeholders(
        R"({"port":{{port}},"sni":"{{sni}}","key":"{{reality_private}}","sid":"{{reality_sid}}"})", v);
    assert(out == R"({"port":443,"sni":"www.example.com","key":"PRIV","sid":"0123456789abcdef"})");
}

void names_match_loosely() {
    const PlaceholderValues v = sample_values();
    assert(render_placeholders("{{ PORT }}", v) == "443");
    assert(render_placeholders("{{Domain}}", v) == "node.example.net");
    assert(render_placeholders("{{pool_sni}}", v) == "www.example.com");
    assert(render_placeholders("{{ Pool_SNI }}", v) == "www.example.com");
}

void unknown_names_are_kept_and_reported() {
    const PlaceholderValues v = sample_values();
    std::vector<std::string> unknown;
    const std::string out = render_placeholders("a {{nope}} b {{uuid}} {{ Other }}", v, &unknown);
    assert(out == std::string("a {{nope}} b ") + rp_test::kSecretA + " {{ Other }}");
    assert(unknown.size() == 2);
    assert(unknown[0] == "nope");
    assert(unknown[1] == "other");
}

void unterminated_braces_are_left_alone() {
    const PlaceholderValues v = sample_values();
    assert(render_placeholders("{{port", v) == "{{port");
    assert(render_placeholders("plain text", v) == "plain text");
    assert(render_placeholders("", v).empty());
}

void placeholder_detection() {
    assert(has_placeholder(R"({"k":"{{ Reality_Private }}"})", "reality_private"));
    assert(has_placeholder("{{pool_sni}}", "sni"));
    assert(!has_placeholder("{{port}}", "uuid"));
    assert(!has_placeholder("reality_private", "reality_private"));
}

} // namespace

int main() {
    rp_test::quiet_logs();

    known_names_are_substituted();
    names_match_loosely();
    unknown_names_are_kept_and_reported();
    unterminated_braces_are_left_alone();
    placeholder_detection();
    return 0;
}
