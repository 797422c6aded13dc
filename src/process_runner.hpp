// =============================================================================
// Marionette - Hidden Process Runner
// =============================================================================
// Runs external bridge binaries (MuMuManager, ldconsole, adb) without a
// visible console window and with a hard timeout. Every remote-shell call in
// the core goes through a ProcessRunner so tests can script the bridge.
// =============================================================================
#pragma once

#include <string>
#include <vector>
#include "result.hpp"

namespace marionette {

struct ProcessOutput {
    int exit_code = 0;
    std::string output;     // stdout + stderr, trailing whitespace trimmed
};

using ProcessResult = Result<ProcessOutput, ProcessError>;

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Ok whenever the process ran to completion (any exit code).
    // Err for missing executable, spawn failure or timeout.
    virtual ProcessResult run(const std::vector<std::string>& argv, int timeout_ms) = 0;
};

/**
 * Real runner.
 *   Windows: CreateProcessW + CREATE_NO_WINDOW, stdout/stderr through a pipe,
 *            polled with PeekNamedPipe, TerminateProcess on timeout.
 *   Other:   fork/execvp + poll, SIGKILL on timeout.
 */
class HiddenProcessRunner : public ProcessRunner {
public:
    static constexpr size_t MAX_OUTPUT_BYTES = 1024 * 1024;

    ProcessResult run(const std::vector<std::string>& argv, int timeout_ms) override;
};

// Like ProcessRunner::run, but a non-zero exit becomes ProcessError::Kind::NonZeroExit
ProcessResult runChecked(ProcessRunner& runner, const std::vector<std::string>& argv,
                         int timeout_ms);

// Windows command line for argv (CommandLineToArgvW quoting rules)
std::string buildCommandLine(const std::vector<std::string>& argv);

// Short identity for logs: program file name plus at most four leading
// arguments (e.g. "MuMuManager.exe adb -v 2 -c"). The payload is left out.
std::string describeCommand(const std::vector<std::string>& argv);

} // namespace marionette
