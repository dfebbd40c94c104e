#pragma once

#include <string>
#include <vector>

namespace platform {

// Run `program` (looked up on PATH) with stdin and stdout closed, wait for
// it, and return its exit code.
//
//   127  the program could not be started
//   -1   timed out (the child is killed) or died from a signal
//
// timeout_ms <= 0 waits indefinitely. If stderr_log is set the child's
// stderr is appended to that file.
int run_process(const std::string& program,
                const std::vector<std::string>& args,
                int timeout_ms,
                const std::string& stderr_log = "");

} // namespace platform
