#include "rp/internal/validator.hpp"

#include "test_fleet.hpp"

#include <cassert>
#include <chrono>
#include <fstream>
#include <string>
#include <thread>
#include <sys/stat.h>
#include <unistd.h>

namespace {

using namespace rp::internal;

// Executable /bin/sh script under the temp dir; removed on scope exit.
class Script {
public:
    explicit Script(const std::string& body) {
        _path = "/tmp/rp-test-checker-" + std::to_string(::getpid()) + "-" + std::to_string(_seq++);
        std::ofstream f(_path);
        f << "#!/bin/sh\n" << body << "\n";
        f.close();
        assert(::chmod(_path.c_str(), 0700) == 0);
    }
    ~Script() { ::unlink(_path.c_str()); }
    const std::string& path() const { return _path; }

private:
    static int _seq;
    std::string _path;
};

int Script::_seq = 0;

bool file_exists(const std::string& p) {
    struct stat st;
    return ::stat(p.c_str(), &st) == 0;
}

void null_validator_skips() {
    NullValidator v;
    const ValidationResult r = v.validate("{}");
    assert(r.status == ValidationStatus::Skipped);
    assert(std::string(validation_status_name(r.status)) == "skipped");
}

void missing_binary_is_skipped() {
    EngineValidator v("/nonexistent/sing-box", 1000);
    const ValidationResult r = v.validate("{}");
    assert(r.status == ValidationStatus::Skipped);
    assert(r.output.find("/nonexistent/sing-box") != std::string::npos);
}

void exit_status_decides() {
    EngineValidator ok("/bin/true", 2000);
    assert(ok.validate("{}").status == ValidationStatus::Passed);

    EngineValidator bad("/bin/false", 2000);
    const ValidationResult r = bad.validate("{}");
    assert(r.status == ValidationStatus::Failed);
    assert(r.output == "exit 1");
}

void checker_sees_the_document() {
    // Arguments arrive as: check -c <file>
    Script s("[ \"$1\" = check ] && [ \"$2\" = -c ] || exit 3\necho \"$3\"\ncat \"$3\"");
    EngineValidator v(s.path(), 2000);
    const ValidationResult r = v.validate(R"({"log":{"level":"info"}})");
    assert(r.status == ValidationStatus::Passed);

    const std::size_t nl = r.output.find('\n');
    assert(nl != std::string::npos);
    const std::string tmp = r.output.substr(0, nl);
    assert(tmp.find("/tmp/rp-check-") == 0);
    assert(r.output.substr(nl + 1) == R"({"log":{"level":"info"}})");
    assert(!file_exists(tmp));
}

void rejection_carries_output() {
    Script s("echo 'decode config: unknown field \"bogus\"' >&2\nexit 1");
    EngineValidator v(s.path(), 2000);
    const ValidationResult r = v.validate("{\"bogus\":1}");
    assert(r.status == ValidationStatus::Failed);
    assert(r.output.find("unknown field") != std::string::npos);
}

void slow_checker_times_out() {
    Script s("exec sleep 10");
    EngineValidator v(s.path(), 200);
    const ValidationResult r = v.validate("{}");
    assert(r.status == ValidationStatus::Failed);
    assert(r.output.find("timed out") != std::string::npos);
}

// Prints how many pipes the checker holds beyond stdout/stderr.
const char* kCountPipes =
    "ls -l /proc/$$/fd > \"$3.fds\"\n"
    "awk '/pipe:/ && $(NF-2) + 0 > 2 { n++ } END { print n + 0 }' \"$3.fds\"\n"
    "rm -f \"$3.fds\"";

void checker_does_not_inherit_other_checks_pipes() {
    Script counter(kCountPipes);
    EngineValidator count_v(counter.path(), 2000);
    const ValidationResult alone = count_v.validate("{}");
    assert(alone.status == ValidationStatus::Passed);

    // A slow check keeps its output pipe open in this process meanwhile.
    Script slow("sleep 2");
    EngineValidator slow_v(slow.path(), 5000);
    ValidationStatus slow_status = ValidationStatus::Failed;
    std::thread busy([&] { slow_status = slow_v.validate("{}").status; });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    const ValidationResult during = count_v.validate("{}");
    busy.join();
    assert(slow_status == ValidationStatus::Passed);
    assert(during.status == ValidationStatus::Passed);
    assert(during.output == alone.output);
}

} // namespace

int main() {
    rp_test::quiet_logs();

    null_validator_skips();
    missing_binary_is_skipped();
    exit_status_decides();
    checker_sees_the_document();
    rejection_carries_output();
    slow_checker_times_out();
    checker_does_not_inherit_other_checks_pipes();
    return 0;
}
