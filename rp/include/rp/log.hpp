/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#pragma once
#include <string>

namespace rp {

// Thread-safe logging. The file copy carries a UTC timestamp, the stdout
// mirror does not. An empty path turns file output off.
void set_log_file(const std::string& path);
void log_line(const std::string& line);

// Drop the stdout mirror (file output stays).
void set_log_stdout(bool enabled);

} // namespace rp
