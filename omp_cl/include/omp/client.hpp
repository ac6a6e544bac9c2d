/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#pragma once
#include <string>
#include <unordered_map>
#include <memory>
#include "omp/client_config.hpp"
#include "omp/http_response.hpp"

namespace omp {

// HTTP/1.1 client with keep-alive that signs every request when a seed is
// configured.
class Client {
public:
    // Throws std::runtime_error on an unusable seed.
    explicit Client(const ClientConfig& cfg);
    ~Client();

    // Generic request:
    //  method: "GET", "POST", ...
    //  path:   e.g. "/objects" (prefixed by base_path if set)
    //  extra_headers: sent as-is after the generated ones
    bool request(const std::string& method,
                 const std::string& path,
                 const std::string& body,
                 const std::unordered_map<std::string, std::string>& extra_headers,
                 HttpResponse& out);

    // Absolute URL the server is expected to reconstruct for path.
    std::string url_for(const std::string& path) const;

private:
    struct Impl;
    std::unique_ptr<Impl> _p;
};

} // namespace omp
