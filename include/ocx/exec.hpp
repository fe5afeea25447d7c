#pragma once

#include <map>
#include <string>
#include <vector>

namespace ocx {

// ============================================================================
// Process Execution
// ============================================================================

struct ExecResult {
    bool ok = false;
    int exit_code = -1;
    std::string error;
};

// Run argv[0] (looked up on PATH) in cwd with the current environment plus
// env_overrides, and wait for it. A signal death reports 128 + signal.
ExecResult run_process(const std::vector<std::string>& argv,
                       const std::string& cwd,
                       const std::map<std::string, std::string>& env_overrides);

} // namespace ocx
