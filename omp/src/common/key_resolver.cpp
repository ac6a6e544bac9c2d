/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/key_resolver.hpp"
#include "omp/internal/utils.hpp"
#include "omp/log.hpp"

#include <cstring>
#include <fstream>
#include <sstream>

namespace omp::internal {

namespace {

bool decode_as(KeyEncoding enc, const std::string& s, std::string& bin) {
    switch (enc) {
        case KeyEncoding::Hex:       return hex_to_bytes(s, bin);
        case KeyEncoding::Base64Url: return base64_decode(s, bin, /*url_safe=*/true);
        case KeyEncoding::Base64:    return base64_decode(s, bin, /*url_safe=*/false);
    }
    return false;
}

} // namespace

bool decode_public_key(const std::string& text, PublicKey& out, KeyEncoding* used) {
    const std::string s = trim_copy(text);
    if (s.empty()) return false;

    static const KeyEncoding kChain[] = {
        KeyEncoding::Hex, KeyEncoding::Base64Url, KeyEncoding::Base64
    };
    for (KeyEncoding enc : kChain) {
        std::string bin;
        if (decode_as(enc, s, bin) && bin.size() == out.size()) {
            std::memcpy(out.data(), bin.data(), out.size());
            if (used) *used = enc;
            return true;
        }
    }
    return false;
}

bool KeyResolver::resolve(const std::string& keyid, PublicKey& out) const {
    if (keyid.empty()) return false;

    {
        std::lock_guard<std::mutex> lk(_reg_mtx);
        auto it = _registry.find(keyid);
        if (it != _registry.end()) { out = it->second; return true; }
    }
    {
        std::lock_guard<std::mutex> lk(_named_mtx);
        auto it = _named.find(keyid);
        if (it != _named.end()) { out = it->second; return true; }
    }
    {
        std::lock_guard<std::mutex> lk(_def_mtx);
        if (!_default_keyid.empty() && _default_keyid == keyid) {
            out = _default_key;
            return true;
        }
    }
    return false;
}

void KeyResolver::register_key(const std::string& keyid, const PublicKey& key) {
    if (keyid.empty()) return;
    std::lock_guard<std::mutex> lk(_reg_mtx);
    _registry[keyid] = key;
}

bool KeyResolver::register_key(const std::string& keyid, const std::string& encoded) {
    PublicKey k{};
    if (keyid.empty() || !decode_public_key(encoded, k)) return false;
    register_key(keyid, k);
    return true;
}

bool KeyResolver::unregister_key(const std::string& keyid) {
    std::lock_guard<std::mutex> lk(_reg_mtx);
    return _registry.erase(keyid) > 0;
}

bool KeyResolver::add_named_key(const std::string& keyid, const std::string& encoded) {
    PublicKey k{};
    if (keyid.empty() || !decode_public_key(encoded, k)) return false;
    std::lock_guard<std::mutex> lk(_named_mtx);
    _named[keyid] = k;
    return true;
}

bool KeyResolver::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        omp::log_line(std::string("[AUTH] failed to open key file: ") + path);
        return false;
    }
    KeyEntries entries;
    size_t line_no = 0;
    for (std::string line; std::getline(in, line); ) {
        ++line_no;
        trim_inplace(line);
        if (line.empty() || line[0] == '#') continue;
        std::istringstream iss(line);
        std::string kid, value, extra;
        if (!(iss >> kid >> value) || (iss >> extra)) {
            omp::log_line("[AUTH] bad line " + std::to_string(line_no) + " in " + path);
            return false;
        }
        entries.emplace_back(std::move(kid), std::move(value));
    }
    return load_entries(entries, path);
}

bool KeyResolver::load_entries(const KeyEntries& entries, const std::string& source) {
    std::unordered_map<std::string, PublicKey> tmp;
    for (const auto& kv : entries) {
        PublicKey k{};
        if (kv.first.empty() || !decode_public_key(kv.second, k)) {
            omp::log_line("[AUTH] bad public key for keyid '" + kv.first + "' in " + source);
            return false;
        }
        tmp[kv.first] = k;
    }
    {
        std::lock_guard<std::mutex> lk(_named_mtx);
        for (auto& kv : tmp) _named[kv.first] = kv.second;
    }
    omp::log_line("[AUTH] keys loaded: " + std::to_string(tmp.size()) + " entries from " + source);
    return true;
}

bool KeyResolver::load_from(const KeyFetch& fetch, const std::string& source) {
    KeyEntries entries;
    if (!fetch || !fetch(entries)) {
        omp::log_line("[AUTH] failed to fetch keys from " + source);
        return false;
    }
    return load_entries(entries, source);
}

bool KeyResolver::set_default_key(const std::string& keyid, const std::string& encoded) {
    PublicKey k{};
    if (keyid.empty() || !decode_public_key(encoded, k)) return false;
    std::lock_guard<std::mutex> lk(_def_mtx);
    _default_keyid = keyid;
    _default_key = k;
    return true;
}

void KeyResolver::clear_default_key() {
    std::lock_guard<std::mutex> lk(_def_mtx);
    _default_keyid.clear();
    _default_key.fill(0);
}

size_t KeyResolver::registry_size() const {
    std::lock_guard<std::mutex> lk(_reg_mtx);
    return _registry.size();
}

size_t KeyResolver::named_size() const {
    std::lock_guard<std::mutex> lk(_named_mtx);
    return _named.size();
}

} // namespace omp::internal
