/*
 * Part of the OMPGate project.
 *
 * SPDX-FileCopyrightText: 2025 OMPGate contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of OMPGate. See LICENSE for details.
 */

#include "omp/internal/errors.hpp"
#include "omp/internal/utils.hpp"

namespace omp::internal {

const char* code_for_status(int status) {
    switch (status) {
        case 400: return "bad_request";
        case 401: return "unauthorized";
        case 403: return "forbidden";
        case 404: return "not_found";
        case 405: return "method_not_allowed";
        case 409: return "conflict";
        case 413: return "payload_too_large";
        case 422: return "unprocessable_entity";
        case 429: return "rate_limited";
        case 500: return "internal_error";
        case 503: return "unavailable";
        default:  return "error";
    }
}

const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

std::string make_error_body(int status, const std::string& message) {
    return std::string(R"({"error":{"code":")") + code_for_status(status) +
           R"(","message":")" + json_escape(message) +
           R"(","status":)" + std::to_string(status) + "}}";
}

omp::HttpResponse make_response(int status, std::string body) {
    omp::HttpResponse resp;
    resp.status_code = status;
    resp.status_text = reason_phrase(status);
    resp.body = std::move(body);
    return resp;
}

omp::HttpResponse make_error(int status, const std::string& message) {
    return make_response(status, make_error_body(status, message));
}

} // namespace omp::internal
