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

namespace omp {

struct HttpResponse {
    int status_code = 0;
    std::string status_text;
    std::unordered_map<std::string, std::string> headers;
    std::string content_type = "application/json";
    std::string body;
};

} // namespace omp
