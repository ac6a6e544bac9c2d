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
#include "omp/http_request.hpp"
#include "omp/http_response.hpp"
#include "omp/server_config.hpp"
#include "omp/signature_settings.hpp"
#include "omp/internal/policy.hpp"

namespace omp::internal {

// Route dispatcher. Transport-agnostic: takes a parsed request, returns the
// response to send. Protected routes (/objects, /objects/...) pass the
// signature policy before reaching the downstream handler.
class ApiHandler {
public:
    ApiHandler(const omp::ServerConfig& cfg,
               const omp::SignatureSettings& settings,
               const SignaturePolicy& policy);

    omp::HttpResponse handle(const omp::HttpRequest& R, const std::string& peer_ip) const;

private:
    const omp::ServerConfig& _cfg;
    const omp::SignatureSettings& _settings;
    const SignaturePolicy& _policy;

    omp::HttpResponse discovery() const;
    omp::HttpResponse objects(const omp::HttpRequest& R, const std::string& peer_ip) const;
};

} // namespace omp::internal
