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
#include <utility>

namespace rp::internal {

enum class ValidationStatus {
    Passed,
    Skipped,   // checker not runnable on this host; treated as a pass
    Failed
};

const char* validation_status_name(ValidationStatus s);

struct ValidationResult {
    ValidationStatus status = ValidationStatus::Passed;
    std::string output;   // checker stdout+stderr, or the reason it did not run
};

class ConfigValidator {
public:
    virtual ~ConfigValidator() = default;
    virtual ValidationResult validate(const std::string& document) = 0;
};

// Accepts everything. For hosts that opt out of engine checks.
class NullValidator : public ConfigValidator {
public:
    ValidationResult validate(const std::string&) override {
        return ValidationResult{ValidationStatus::Skipped, "validation disabled"};
    }
};

/**
 * Runs `<binary> check -c <file>` on a private temp copy of the document.
 * exit 0 -> Passed; exec failure (missing binary, no permission) -> Skipped;
 * non-zero exit, signal, or timeout -> Failed.
 */
class EngineValidator : public ConfigValidator {
public:
    explicit EngineValidator(std::string binary = "sing-box", int timeout_ms = 5000,
                             std::string tmp_dir = "/tmp")
        : _binary(std::move(binary)), _timeout_ms(timeout_ms), _tmp_dir(std::move(tmp_dir)) {}

    ValidationResult validate(const std::string& document) override;

private:
    std::string _binary;
    int _timeout_ms;
    std::string _tmp_dir;
};

} // namespace rp::internal
