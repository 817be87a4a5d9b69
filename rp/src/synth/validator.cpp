/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#include "rp/internal/validator.hpp"
#include "rp/log.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace rp::internal {

const char* validation_status_name(ValidationStatus s) {
    switch (s) {
    case ValidationStatus::Passed:  return "passed";
    case ValidationStatus::Skipped: return "skipped";
    case ValidationStatus::Failed:  return "failed";
    }
    return "?";
}

namespace {

bool write_all_fd(int fd, const char* p, std::size_t n) {
    while (n > 0) {
        ssize_t rc = ::write(fd, p, n);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += rc;
        n -= static_cast<std::size_t>(rc);
    }
    return true;
}

// Removes the temp file on every exit path.
class TempFile {
public:
    explicit TempFile(const std::string& dir) {
        _path = dir + "/rp-check-XXXXXX.json";
        _fd = ::mkstemps(&_path[0], 5);
        if (_fd < 0) _path.clear();
    }
    ~TempFile() {
        if (_fd >= 0) ::close(_fd);
        if (!_path.empty()) ::unlink(_path.c_str());
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    bool ok() const { return _fd >= 0; }
    const std::string& path() const { return _path; }

    bool write_and_close(const std::string& data) {
        const bool ok = write_all_fd(_fd, data.data(), data.size());
        const bool closed = ::close(_fd) == 0;
        _fd = -1;
        return ok && closed;
    }

private:
    std::string _path;
    int _fd = -1;
};

void close_fd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

} // namespace

ValidationResult EngineValidator::validate(const std::string& document) {
    TempFile tmp(_tmp_dir);
    if (!tmp.ok()) {
        // Not the document's fault, but nothing was checked either.
        return ValidationResult{ValidationStatus::Failed,
                                std::string("mkstemp failed: ") + std::strerror(errno)};
    }
    if (!tmp.write_and_close(document)) {
        return ValidationResult{ValidationStatus::Failed,
                                std::string("temp write failed: ") + std::strerror(errno)};
    }

    // Built before fork: the child only calls async-signal-safe functions.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(_binary.c_str()));
    argv.push_back(const_cast<char*>("check"));
    argv.push_back(const_cast<char*>("-c"));
    argv.push_back(const_cast<char*>(tmp.path().c_str()));
    argv.push_back(nullptr);

    // Both pipes are CLOEXEC so checkers forked by other threads never hold
    // them; dup2 clears the flag on the child's stdout/stderr.
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};   // child reports exec errno here; closed by a successful exec
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        return ValidationResult{ValidationStatus::Failed,
                                std::string("pipe failed: ") + std::strerror(errno)};
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        const int e = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return ValidationResult{ValidationStatus::Failed,
                                std::string("pipe failed: ") + std::strerror(e)};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return ValidationResult{ValidationStatus::Failed,
                                std::string("fork failed: ") + std::strerror(e)};
    }
    if (pid == 0) {
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::execvp(argv[0], argv.data());

        int e = errno;
        ssize_t rc = ::write(err_pipe[1], &e, sizeof(e));
        (void)rc;
        ::_exit(127);
    }

    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);

    int exec_errno = 0;
    ssize_t got;
    do {
        got = ::read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(err_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        ::waitpid(pid, nullptr, 0);
        close_fd(out_pipe[0]);
        std::string why = "cannot run " + _binary + ": " + std::strerror(exec_errno);
        rp::log_line("[VALIDATE] WARNING " + why + "; config not checked");
        return ValidationResult{ValidationStatus::Skipped, why};
    }

    // Collect output until EOF or deadline.
    std::string output;
    bool timed_out = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(_timeout_ms);
    char buf[4096];
    for (;;) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (left <= 0) {
            timed_out = true;
            break;
        }
        struct pollfd pfd{out_pipe[0], POLLIN, 0};
        int pr = ::poll(&pfd, 1, static_cast<int>(left));
        if (pr < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (pr == 0) continue;
        ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        output.append(buf, static_cast<std::size_t>(n));
    }
    close_fd(out_pipe[0]);

    if (timed_out) ::kill(pid, SIGKILL);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) break;
    }

    if (timed_out) {
        rp::log_line("[VALIDATE] checker timed out after " + std::to_string(_timeout_ms) + " ms");
        return ValidationResult{ValidationStatus::Failed,
                                "checker timed out after " + std::to_string(_timeout_ms) + " ms\n" + output};
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return ValidationResult{ValidationStatus::Passed, output};
    }

    const int code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    rp::log_line("[VALIDATE] checker rejected config (exit " + std::to_string(code) + ")");
    if (output.empty()) output = "exit " + std::to_string(code);
    return ValidationResult{ValidationStatus::Failed, output};
}

} // namespace rp::internal
