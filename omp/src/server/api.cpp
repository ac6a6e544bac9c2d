/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/api.hpp"
#include "omp/internal/errors.hpp"
#include "omp/internal/time.hpp"
#include "omp/log.hpp"

#include <sstream>

namespace omp::internal {

namespace {

constexpr const char* kProtocolVersion = "0.1";

bool is_objects_path(const std::string& path) {
    return path == "/objects" || path == "/objects/" || path.rfind("/objects/", 0) == 0;
}

} // namespace

ApiHandler::ApiHandler(const omp::ServerConfig& cfg,
                       const omp::SignatureSettings& settings,
                       const SignaturePolicy& policy)
    : _cfg(cfg), _settings(settings), _policy(policy)
{}

omp::HttpResponse ApiHandler::handle(const omp::HttpRequest& R, const std::string& peer_ip) const {
    if (R.body.size() > _cfg.max_body) {
        omp::log_line(std::string("[413] ip=") + peer_ip + " size=" + std::to_string(R.body.size()));
        return make_error(413, "Payload too large");
    }

    if (R.path == "/health") {
        if (R.method != "GET") return make_error(405, "Method not allowed");
        return make_response(200, R"({"status":"ok"})");
    }

    if (R.path == "/.well-known/omp.json") {
        if (R.method != "GET") return make_error(405, "Method not allowed");
        return discovery();
    }

    if (is_objects_path(R.path)) {
        return objects(R, peer_ip);
    }

    return make_error(404, "Not found");
}

omp::HttpResponse ApiHandler::objects(const omp::HttpRequest& R, const std::string& peer_ip) const {
    const PolicyDecision d = _policy.evaluate(R);
    if (!d.proceed) {
        omp::log_line("[" + std::to_string(d.status) + "] ip=" + peer_ip +
                      " " + R.method + " " + R.path + " reason=" + d.message);
        return make_error(d.status, d.message);
    }

    // Downstream handler: acknowledges the request; storage lives elsewhere.
    if (R.method == "POST" && (R.path == "/objects" || R.path == "/objects/")) {
        std::ostringstream os;
        os << R"({"status":"created","received_bytes":)" << R.body.size() << "}";
        return make_response(201, os.str());
    }
    if (R.method == "GET") {
        return make_response(200, R"({"status":"ok"})");
    }
    return make_error(405, "Method not allowed");
}

omp::HttpResponse ApiHandler::discovery() const {
    std::ostringstream os;
    os << "{"
       << R"("omp_version":")" << kProtocolVersion << R"(",)"
       << R"("transport":["http/1.1"],)"
       << R"("endpoints":{"objects":"/objects","health":"/health"},)"
       << R"("signatures":{"mode":")" << omp::to_string(_settings.mode())
       << R"(","algorithm":"ed25519","headers":["Signature-Input","Signature"]},)"
       << R"("limits":{"max_payload_mb":)" << (_cfg.max_body / (1024 * 1024))
       << R"(,"rate_limit_per_min":)" << _cfg.rate_limit_per_min << "},"
       << R"("server":{"port":)" << _cfg.port
       << R"(,"time":")" << omp::utc_iso8601_now() << R"("})"
       << "}";
    return make_response(200, os.str());
}

} // namespace omp::internal
