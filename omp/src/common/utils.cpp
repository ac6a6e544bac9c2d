/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/utils.hpp"
#include <cctype>
#include <cstdio>
#include <openssl/evp.h>
#include <openssl/crypto.h>

namespace omp::internal {

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

bool hex_to_bytes(const std::string& hex, std::string& out){
    if(hex.size() % 2) return false;
    out.clear(); out.reserve(hex.size()/2);
    for(std::size_t i=0;i<hex.size(); i+=2){
        int h=hexval(hex[i]); int l=hexval(hex[i+1]);
        if(h<0 || l<0) return false;
        out.push_back((char)((h<<4)|l));
    }
    return true;
}

std::string bytes_to_hex(const unsigned char* p, std::size_t n){
    static const char* H="0123456789abcdef";
    std::string s; s.resize(n*2);
    for(std::size_t i=0;i<n;++i){ s[2*i]=H[p[i]>>4]; s[2*i+1]=H[p[i]&0xF]; }
    return s;
}

bool base64_decode(const std::string& in, std::string& out, bool url_safe) {
    // Normalize to the standard alphabet with padding; EVP_DecodeBlock does the rest.
    std::string s;
    s.reserve(in.size() + 3);
    std::size_t pad = 0;
    for (char c : in) {
        if (std::isspace((unsigned char)c)) continue;
        if (c == '=') { ++pad; continue; }
        if (pad) return false; // data after padding
        if (std::isalnum((unsigned char)c)) { s.push_back(c); continue; }
        if (url_safe) {
            if (c == '-') { s.push_back('+'); continue; }
            if (c == '_') { s.push_back('/'); continue; }
        } else {
            if (c == '+' || c == '/') { s.push_back(c); continue; }
        }
        return false;
    }
    if (pad > 2) return false;
    const std::size_t rem = s.size() % 4;
    if (rem == 1) return false;
    const std::size_t missing = rem ? 4 - rem : 0;
    if (pad && pad != missing) return false;
    s.append(missing, '=');

    out.clear();
    if (s.empty()) return true;
    out.resize(s.size() / 4 * 3);
    const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(s.data()),
                                  static_cast<int>(s.size()));
    if (n < 0) { out.clear(); return false; }
    // EVP_DecodeBlock counts the zero bytes that padding stands for.
    out.resize(static_cast<std::size_t>(n) - missing);
    return true;
}

std::string base64_encode(const unsigned char* p, std::size_t n, bool url_safe, bool pad) {
    std::string out;
    out.resize(4 * ((n + 2) / 3) + 1);
    const int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), p, static_cast<int>(n));
    out.resize(static_cast<std::size_t>(len));
    if (url_safe) {
        for (char& c : out) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
    }
    if (!pad) {
        while (!out.empty() && out.back() == '=') out.pop_back();
    }
    return out;
}

std::string upper_copy(std::string s){
    for(char& c: s) c = (char)std::toupper((unsigned char)c);
    return s;
}
std::string lower_copy(std::string s){
    for(char& c: s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::vector<std::string> split_top_level(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::string cur;
    bool in_quotes = false;
    int depth = 0;
    for (char c : s) {
        if (c == '"') in_quotes = !in_quotes;
        else if (!in_quotes && c == '(') ++depth;
        else if (!in_quotes && c == ')' && depth > 0) --depth;

        if (c == sep && !in_quotes && depth == 0) {
            trim_inplace(cur);
            if (!cur.empty()) parts.push_back(std::move(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    trim_inplace(cur);
    if (!cur.empty()) parts.push_back(std::move(cur));
    return parts;
}

std::string json_escape(const std::string& s) {
    std::string o;
    o.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"':  o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n";  break;
            case '\r': o += "\\r";  break;
            case '\t': o += "\\t";  break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    o += buf;
                } else {
                    o.push_back((char)c);
                }
        }
    }
    return o;
}

void secure_wipe(std::string& s){
    if(!s.empty()){
        OPENSSL_cleanse(&s[0], s.size());
        s.clear();
        s.shrink_to_fit();
    }
}

} // namespace omp::internal
