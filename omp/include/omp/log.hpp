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

namespace omp {

// Thread-safe logging (to stdout, plus a file once set_log_file() is called).
// An empty path turns file logging off again.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

} // namespace omp
