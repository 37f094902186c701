#pragma once

/**
 * @file runner.hpp
 * @brief Run a program and capture its output and exit status
 */

#include "shkit/export.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace shkit {

struct RunOptions {
    std::string cwd;                                    // empty: inherit
    std::unordered_map<std::string, std::string> env;  // set on top of the current environment
    bool merge_stderr = true;                           // stderr into output
};

struct RunResult {
    bool ok = false;             // process was started and reaped
    int exit_code = -1;          // 128 + signal for signalled children
    std::string output;
    std::string error_output;    // only when merge_stderr is false
    std::vector<std::string> lines;
    std::string error;
};

// Locate name in the ':' separated path_value. Names containing '/' are
// returned as-is when executable.
SHKIT_API std::optional<std::string> find_program(const std::string& name,
                                                  const std::string& path_value);

// fork/exec argv[0] resolved against the effective PATH (RunOptions::env
// first) and wait for it.
SHKIT_API RunResult run_command(const std::vector<std::string>& argv,
                                const RunOptions& options = RunOptions{});

} // namespace shkit
