#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace sidecar {

class CancellationToken;

/**
 * Launch description for one child process. Built per call and passed by value
 * semantics into run_process(); nothing here is shared between calls.
 */
struct ProcessSpec {
    std::string program;                 // resolved through PATH when it has no '/'
    std::vector<std::string> args;       // arguments after argv[0]
    std::string working_directory;       // empty: inherit the caller's
    std::vector<std::pair<std::string, std::string>> env;  // overrides on top of the caller's environment
    bool kill_on_parent_death = false;   // PR_SET_PDEATHSIG
};

struct ProcessOutcome {
    int exit_code = -1;
    int term_signal = 0;
    std::string stdout_data;
    std::string stderr_data;

    bool exited_normally() const { return term_signal == 0; }
    bool success() const { return term_signal == 0 && exit_code == 0; }
};

struct RunLimits {
    std::chrono::milliseconds timeout{0};  // 0: wait indefinitely
    const CancellationToken* cancel = nullptr;
};

/**
 * Run the process described by spec to completion.
 *
 * input is written in full to the child's stdin, which is then closed. stdout and
 * stderr are drained concurrently and returned once the child has exited.
 *
 * @throws SidecarError StartFailed when the child cannot be launched or its input
 *         cannot be delivered, Timeout or Cancelled when a limit fires (the child is
 *         killed and reaped before the exception leaves this function).
 */
ProcessOutcome run_process(const ProcessSpec& spec, const std::string& input, const RunLimits& limits = {});

} // namespace sidecar
