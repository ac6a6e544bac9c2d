/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#pragma once
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "omp/internal/ed25519.hpp"

namespace omp::internal {

// Encodings tried, in this order, when turning configured text into a key.
enum class KeyEncoding { Hex, Base64Url, Base64 };

// Decode key text (hex, URL-safe base64 or standard base64, padding optional)
// into exactly 32 bytes. Returns false if no encoding yields 32 bytes.
bool decode_public_key(const std::string& text, PublicKey& out, KeyEncoding* used = nullptr);

/**
 * Maps a keyid to an Ed25519 public key.
 *
 * Lookup order (first hit wins, exact keyid match):
 *   1. registry      - register_key()
 *   2. named entries - add_named_key(), load_file(), load_from()
 *   3. default pair  - set_default_key(), only for that exact keyid
 *
 * Only the requested keyid is ever consulted; there is no fallback scan.
 * resolve() never leaves the process. All members are safe to call
 * concurrently.
 */
using KeyEntries = std::vector<std::pair<std::string, std::string>>;   // keyid, encoded key
using KeyFetch   = std::function<bool(KeyEntries&)>;

class KeyResolver {
public:
    KeyResolver() = default;

    KeyResolver(const KeyResolver&) = delete;
    KeyResolver& operator=(const KeyResolver&) = delete;

    bool resolve(const std::string& keyid, PublicKey& out) const;

    // ---- registry ----
    void register_key(const std::string& keyid, const PublicKey& key);
    bool register_key(const std::string& keyid, const std::string& encoded);
    bool unregister_key(const std::string& keyid);

    // ---- named configuration entries ----
    bool add_named_key(const std::string& keyid, const std::string& encoded);

    // "keyid value" per line, '#' comments. All-or-nothing: on any bad line
    // nothing is added and false is returned.
    bool load_file(const std::string& path);

    // Adds decoded entries as named keys. All-or-nothing, like load_file().
    bool load_entries(const KeyEntries& entries, const std::string& source);

    // Pull entries from an external store (e.g. Redis) and load them.
    bool load_from(const KeyFetch& fetch, const std::string& source);

    // ---- default pair ----
    bool set_default_key(const std::string& keyid, const std::string& encoded);
    void clear_default_key();

    size_t registry_size() const;
    size_t named_size() const;

private:
    mutable std::mutex _reg_mtx;
    std::unordered_map<std::string, PublicKey> _registry;

    mutable std::mutex _named_mtx;
    std::unordered_map<std::string, PublicKey> _named;

    mutable std::mutex _def_mtx;
    std::string _default_keyid;
    PublicKey   _default_key{};
};

} // namespace omp::internal
