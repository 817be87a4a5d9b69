/*
 * Part of the RelayPlane (RP) project.
 *
 * SPDX-FileCopyrightText: 2025 RelayPlane contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of RelayPlane (RP). See LICENSE for details.
 */


#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace rp {

// Base of every failure that aborts a node's synthesis.
class SynthError : public std::runtime_error {
public:
    explicit SynthError(const std::string& what) : std::runtime_error(what) {}
};

class NodeNotFound : public SynthError {
public:
    explicit NodeNotFound(int64_t node_id)
        : SynthError("node " + std::to_string(node_id) + " not found"), _node_id(node_id) {}
    int64_t node_id() const { return _node_id; }
private:
    int64_t _node_id;
};

// No free listen port after the probe budget.
class PortExhaustion : public SynthError {
public:
    PortExhaustion(int64_t node_id, int start, int end)
        : SynthError("no free port for node " + std::to_string(node_id) + " in [" +
                     std::to_string(start) + "," + std::to_string(end) + "]"),
          _node_id(node_id), _start(start), _end(end) {}
    int64_t node_id() const { return _node_id; }
    int range_start() const { return _start; }
    int range_end() const { return _end; }
private:
    int64_t _node_id;
    int _start;
    int _end;
};

// The engine's checker ran and rejected the document.
class ValidationError : public SynthError {
public:
    explicit ValidationError(const std::string& checker_output)
        : SynthError("config validation failed: " + checker_output), _output(checker_output) {}
    const std::string& output() const { return _output; }
private:
    std::string _output;
};

} // namespace rp
