#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace cvgen::procutil {

struct ProcResult {
    bool started = false;    // false: the program could not be launched
    bool timed_out = false;  // child was killed at the deadline
    int exit_code = -1;      // valid when started && !timed_out; 128+N if killed by signal N
    std::string output;      // stdout and stderr, merged
    std::string error;       // launch failure description
};

// Runs argv[0] (looked up on PATH) with the given arguments and waits for it,
// capturing stdout+stderr. The child runs in its own process group, and the
// whole group is killed once the timeout expires.
ProcResult run_capture_output(const std::vector<std::string>& argv, std::chrono::milliseconds timeout);

} // namespace cvgen::procutil
