/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/sig_headers.hpp"
#include "omp/internal/utils.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace omp::internal {

namespace {

// "label=rest" -> (label, rest); both trimmed.
std::pair<std::string, std::string> split_item(const std::string& item, const char* which) {
    const std::size_t eq = item.find('=');
    if (eq == std::string::npos) {
        throw MalformedSignature(std::string("invalid item in ") + which);
    }
    std::string label = trim_copy(item.substr(0, eq));
    if (label.empty()) throw MalformedSignature("missing label");
    return {std::move(label), trim_copy(item.substr(eq + 1))};
}

bool parse_int64(const std::string& s, std::int64_t& out) {
    if (s.empty() || s.size() > 18) return false;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; }))
        return false;
    out = std::stoll(s);
    return true;
}

std::string unquote(std::string v) {
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        v = v.substr(1, v.size() - 2);
    }
    return v;
}

} // namespace

SignatureInputMap parse_signature_input(const std::string& header) {
    if (header.empty() || header.find('=') == std::string::npos) {
        throw MalformedSignature("invalid Signature-Input");
    }

    SignatureInputMap out;
    for (const std::string& item : split_top_level(header, ',')) {
        auto [label, rest] = split_item(item, "Signature-Input");

        if (rest.empty() || rest[0] != '(') {
            throw MalformedSignature("missing covered components");
        }
        const std::size_t close = rest.find(')');
        if (close == std::string::npos) {
            throw MalformedSignature("unterminated covered components");
        }
        if (!trim_copy(rest.substr(1, close - 1)).empty()) {
            throw MalformedSignature("unsupported covered components");
        }

        SignatureInputEntry e;
        e.label = label;
        for (const std::string& seg : split_top_level(rest.substr(close + 1), ';')) {
            const std::size_t eq = seg.find('=');
            if (eq == std::string::npos) throw MalformedSignature("invalid param");
            std::string k = trim_copy(seg.substr(0, eq));
            std::string v = unquote(trim_copy(seg.substr(eq + 1)));
            if (k.empty()) throw MalformedSignature("invalid param");

            if (k == "keyid") {
                e.keyid = v;
            } else if (k == "created") {
                // Not enforced; a non-numeric value stays in params only.
                e.has_created = parse_int64(v, e.created);
                if (!e.has_created) e.created = 0;
            }
            e.params[k] = std::move(v);
        }
        out[label] = std::move(e);
    }
    if (out.empty()) throw MalformedSignature("invalid Signature-Input");
    return out;
}

SignatureMap parse_signature(const std::string& header) {
    if (header.empty() || header.find('=') == std::string::npos) {
        throw MalformedSignature("invalid Signature");
    }

    SignatureMap out;
    for (const std::string& item : split_top_level(header, ',')) {
        auto [label, rest] = split_item(item, "Signature");
        // A lone ":" is an empty value; it fails verification, not parsing.
        if (rest == ":") {
            out[label].clear();
            continue;
        }
        if (rest.size() < 2 || rest.front() != ':' || rest.back() != ':') {
            throw MalformedSignature("invalid signature value");
        }
        out[label] = rest.substr(1, rest.size() - 2);
    }
    if (out.empty()) throw MalformedSignature("invalid Signature");
    return out;
}

} // namespace omp::internal
