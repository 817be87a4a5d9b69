/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/utils.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include <openssl/sha.h>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <openssl/evp.h>

namespace rp::internal {

void trim_inplace(std::string& s) {
    std::size_t a = 0;
    while (a < s.size() && std::isspace((unsigned char)s[a])) ++a;
    std::size_t b = s.size();
    while (b > a && std::isspace((unsigned char)s[b-1])) --b;
    if (a > 0 || b < s.size()) s.assign(s.begin()+a, s.begin()+b);
}

std::string trim_copy(std::string s) {
    trim_inplace(s);
    return s;
}

int hexval(char c){
    if(c>='0'&&c<='9')return c-'0';
    if(c>='a'&&c<='f')return 10+(c-'a');
    if(c>='A'&&c<='F')return 10+(c-'A');
    return -1;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

std::string sha256_hex(const std::string& data) {
    unsigned char d[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)data.data(), data.size(), d);
    return bytes_to_hex(d, SHA256_DIGEST_LENGTH);
}

std::string sha256_raw(const std::string& data) {
    unsigned char d[SHA256_DIGEST_LENGTH];
    SHA256((const unsigned char*)data.data(), data.size(), d);
    return std::string(reinterpret_cast<const char*>(d), SHA256_DIGEST_LENGTH);
}

/* ---------------- base64 ---------------- */

std::string base64_encode(const unsigned char* p, std::size_t n) {
    std::string out;
    out.resize(4 * ((n + 2) / 3) + 1);
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), p, (int)n);
    out.resize(len > 0 ? (std::size_t)len : 0);
    return out;
}

std::string base64url_encode_nopad(const unsigned char* p, std::size_t n) {
    std::string s = base64_encode(p, n);
    while (!s.empty() && s.back() == '=') s.pop_back();
    for (char& c : s) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return s;
}

bool base64_decode(const std::string& in, std::string& out) {
    out.clear();
    if (in.empty()) return true;
    if (in.size() % 4) return false;
    std::size_t pad = 0;
    if (in[in.size()-1] == '=') ++pad;
    if (in[in.size()-2] == '=') ++pad;
    std::vector<unsigned char> buf(in.size() / 4 * 3 + 1);
    int len = EVP_DecodeBlock(buf.data(), reinterpret_cast<const unsigned char*>(in.data()), (int)in.size());
    if (len < 0 || (std::size_t)len < pad) return false;
    out.assign(reinterpret_cast<const char*>(buf.data()), (std::size_t)len - pad);
    return true;
}

bool base64_decode_nopad(const std::string& in, std::string& out) {
    if (in.find('=') != std::string::npos) return false;
    std::string s = in;
    for (char& c : s) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        else if (!std::isalnum((unsigned char)c) && c != '+' && c != '/') return false;
    }
    if (s.size() % 4 == 1) return false;
    while (s.size() % 4) s.push_back('=');
    return base64_decode(s, out);
}

/* ---------------- strings ---------------- */

std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(&s[0], s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

/* ---------------- randomness ---------------- */

std::string random_hex(std::size_t n_bytes){
    std::string b; b.resize(n_bytes);
    if (RAND_bytes((unsigned char*)&b[0], (int)b.size()) != 1) return {};
    return bytes_to_hex((const unsigned char*)b.data(), b.size());
}

bool random_u32(uint32_t& out) {
    unsigned char b[4];
    if (RAND_bytes(b, sizeof(b)) != 1) return false;
    out = (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16) | (uint32_t(b[2]) << 8) | uint32_t(b[3]);
    return true;
}

bool random_between(int lo, int hi, int& out) {
    if (lo > hi) return false;
    const uint64_t span = uint64_t(int64_t(hi) - int64_t(lo)) + 1;
    // Rejection sampling keeps the draw uniform.
    const uint64_t limit = (uint64_t(1) << 32) - ((uint64_t(1) << 32) % span);
    for (int i = 0; i < 64; ++i) {
        uint32_t r = 0;
        if (!random_u32(r)) return false;
        if (r < limit) {
            out = (int)(int64_t(lo) + int64_t(r % span));
            return true;
        }
    }
    return false;
}

static std::string format_uuid(unsigned char* b) {
    b[6] = (unsigned char)((b[6] & 0x0F) | 0x40);
    b[8] = (unsigned char)((b[8] & 0x3F) | 0x80);
    std::string h = bytes_to_hex(b, 16);
    return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" +
           h.substr(16, 4) + "-" + h.substr(20, 12);
}

std::string stable_uuid(const std::string& seed) {
    std::string d = sha256_raw(seed);
    return format_uuid(reinterpret_cast<unsigned char*>(&d[0]));
}

} // namespace rp::internal
