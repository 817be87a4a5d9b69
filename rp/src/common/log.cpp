/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/log.hpp"
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

struct LogSink {
    std::mutex    mtx;
    std::ofstream file;
    std::string   path = "rp.log";
    bool          file_failed = false;   // do not retry a path that cannot be opened
    bool          to_stdout = true;
};

LogSink& sink() {
    static LogSink s;
    return s;
}

// "2025-01-31T12:00:00Z "
std::string utc_stamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ ", &tm);
    return std::string(buf, n);
}

void reopen_unlocked(LogSink& s) {
    if (s.file.is_open()) s.file.close();
    s.file_failed = false;
    if (s.path.empty()) return;
    s.file.open(s.path, std::ios::out | std::ios::app);
    if (!s.file.is_open()) {
        s.file_failed = true;
        std::cerr << "[LOG] cannot open " << s.path << ", file logging off\n";
    }
}

} // namespace

namespace rp {

void set_log_file(const std::string& path) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lk(s.mtx);
    s.path = path;
    reopen_unlocked(s);
}

void set_log_stdout(bool enabled) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lk(s.mtx);
    s.to_stdout = enabled;
}

void log_line(const std::string& line) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lk(s.mtx);
    if (!s.file.is_open() && !s.file_failed && !s.path.empty()) reopen_unlocked(s);
    if (s.file.is_open()) {
        s.file << utc_stamp() << line << '\n';
        s.file.flush();
    }
    if (s.to_stdout) {
        std::cout << line << '\n';
    }
}

} // namespace rp
