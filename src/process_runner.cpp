// =============================================================================
// Marionette - Hidden Process Runner
// =============================================================================
#include "process_runner.hpp"
#include "marionette_log.hpp"

#include <chrono>
#include <cstring>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#else
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace marionette {

namespace {

void trimTrailingWhitespace(std::string& s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
}

void appendCapped(std::string& out, const char* data, size_t len, bool& truncated) {
    if (out.size() >= HiddenProcessRunner::MAX_OUTPUT_BYTES) {
        truncated = true;
        return;
    }
    size_t room = HiddenProcessRunner::MAX_OUTPUT_BYTES - out.size();
    if (len > room) {
        len = room;
        truncated = true;
    }
    out.append(data, len);
}

#ifdef _WIN32
std::wstring widen(const std::string& utf8) {
    if (utf8.empty()) return std::wstring();
    int n = MultiByteToWideChar(CP_UTF8, 0, utf8.data(), (int)utf8.size(), nullptr, 0);
    std::wstring w(n, L'\0');
    MultiByteToWideChar(CP_UTF8, 0, utf8.data(), (int)utf8.size(), w.data(), n);
    return w;
}
#endif

} // namespace

std::string buildCommandLine(const std::vector<std::string>& argv) {
    std::string line;
    for (size_t i = 0; i < argv.size(); i++) {
        const std::string& arg = argv[i];
        if (i > 0) line += ' ';

        if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
            line += arg;
            continue;
        }

        line += '"';
        size_t backslashes = 0;
        for (char c : arg) {
            if (c == '\\') {
                backslashes++;
            } else if (c == '"') {
                line.append(backslashes * 2 + 1, '\\');
                line += '"';
                backslashes = 0;
            } else {
                line.append(backslashes, '\\');
                line += c;
                backslashes = 0;
            }
        }
        // Backslashes before the closing quote must be doubled
        line.append(backslashes * 2, '\\');
        line += '"';
    }
    return line;
}

std::string describeCommand(const std::vector<std::string>& argv) {
    if (argv.empty()) return "(empty)";
    std::string program = argv[0];
    size_t slash = program.find_last_of("\\/");
    if (slash != std::string::npos) program = program.substr(slash + 1);

    std::string desc = program;
    for (size_t i = 1; i < argv.size() && i <= 4; i++) {
        desc += ' ';
        desc += argv[i];
    }
    if (argv.size() > 5) desc += " ...";
    return desc;
}

ProcessResult runChecked(ProcessRunner& runner, const std::vector<std::string>& argv,
                         int timeout_ms) {
    auto result = runner.run(argv, timeout_ms);
    if (result.is_err()) return result;
    if (result.value().exit_code != 0) {
        return ProcessError("exit code " + std::to_string(result.value().exit_code),
                            ProcessError::Kind::NonZeroExit, result.value().exit_code);
    }
    return result;
}

#ifdef _WIN32

namespace {

// Reads whatever is buffered in the pipe without blocking
void drainPipe(HANDLE pipe, std::string& output, bool& truncated) {
    char buffer[4096];
    while (true) {
        DWORD available = 0;
        if (!PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr) || available == 0) return;
        DWORD bytesRead = 0;
        DWORD toRead = (available < sizeof(buffer)) ? available : (DWORD)sizeof(buffer);
        if (!ReadFile(pipe, buffer, toRead, &bytesRead, nullptr) || bytesRead == 0) return;
        appendCapped(output, buffer, bytesRead, truncated);
    }
}

} // namespace

ProcessResult HiddenProcessRunner::run(const std::vector<std::string>& argv, int timeout_ms) {
    if (argv.empty() || argv[0].empty()) {
        return ProcessError("no executable configured", ProcessError::Kind::NotFound);
    }

    SECURITY_ATTRIBUTES sa = {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE hReadPipe = nullptr, hWritePipe = nullptr;
    if (!CreatePipe(&hReadPipe, &hWritePipe, &sa, 0)) {
        return ProcessError("CreatePipe failed", ProcessError::Kind::SpawnFailed,
                            (int)GetLastError());
    }

    // Ensure read handle is not inherited
    SetHandleInformation(hReadPipe, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOW si = {};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES | STARTF_USESHOWWINDOW;
    si.hStdOutput = hWritePipe;
    si.hStdError = hWritePipe;
    si.hStdInput = nullptr;
    si.wShowWindow = SW_HIDE;

    PROCESS_INFORMATION pi = {};
    // UTF-8 -> UTF-16 so CJK text survives the command line
    std::wstring cmd_line = widen(buildCommandLine(argv));

    if (!CreateProcessW(nullptr, cmd_line.data(), nullptr, nullptr, TRUE,
                        CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi)) {
        DWORD err = GetLastError();
        CloseHandle(hWritePipe);
        CloseHandle(hReadPipe);
        if (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND) {
            return ProcessError("executable not found", ProcessError::Kind::NotFound, (int)err);
        }
        return ProcessError("CreateProcess failed", ProcessError::Kind::SpawnFailed, (int)err);
    }
    CloseHandle(hWritePipe);

    std::string output;
    bool truncated = false;
    bool timed_out = false;
    DWORD exit_code = 0;

    // Non-blocking read so an unresponsive bridge cannot hang the caller
    ULONGLONG start_tick = GetTickCount64();
    while (true) {
        DWORD available = 0;
        if (!PeekNamedPipe(hReadPipe, nullptr, 0, nullptr, &available, nullptr)) {
            // Writer side closed: process exited
            break;
        }
        if (available > 0) {
            drainPipe(hReadPipe, output, truncated);
            continue;
        }
        DWORD status = STILL_ACTIVE;
        GetExitCodeProcess(pi.hProcess, &status);
        if (status != STILL_ACTIVE) break;
        if (GetTickCount64() - start_tick > (ULONGLONG)timeout_ms) {
            TerminateProcess(pi.hProcess, 1);
            timed_out = true;
            break;
        }
        Sleep(10);
    }

    // Output written between the last peek and the exit check is still buffered
    if (!timed_out) drainPipe(hReadPipe, output, truncated);

    WaitForSingleObject(pi.hProcess, 1000);
    GetExitCodeProcess(pi.hProcess, &exit_code);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    CloseHandle(hReadPipe);

    if (truncated) {
        MNLOG_WARN("process", "Output of %s truncated (exceeded %zu bytes)",
                   describeCommand(argv).c_str(), MAX_OUTPUT_BYTES);
    }
    if (timed_out) {
        return ProcessError("timed out after " + std::to_string(timeout_ms) + "ms",
                            ProcessError::Kind::Timeout);
    }

    trimTrailingWhitespace(output);
    ProcessOutput out;
    out.exit_code = (int)exit_code;
    out.output = std::move(output);
    return out;
}

#else

ProcessResult HiddenProcessRunner::run(const std::vector<std::string>& argv, int timeout_ms) {
    if (argv.empty() || argv[0].empty()) {
        return ProcessError("no executable configured", ProcessError::Kind::NotFound);
    }

    int out_pipe[2];
    int err_pipe[2];   // reports execvp errno, closed by exec on success
    if (pipe(out_pipe) != 0) {
        return ProcessError("pipe failed", ProcessError::Kind::SpawnFailed, errno);
    }
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return ProcessError("pipe failed", ProcessError::Kind::SpawnFailed, errno);
    }
    fcntl(err_pipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return ProcessError("fork failed", ProcessError::Kind::SpawnFailed, err);
    }
    if (pid == 0) {
        close(out_pipe[0]);
        close(err_pipe[0]);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);
        close(out_pipe[1]);
        execvp(args[0], args.data());
        int err = errno;
        ssize_t ignored = ::write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(err_pipe[1]);

    int exec_errno = 0;
    if (read(err_pipe[0], &exec_errno, sizeof(exec_errno)) == (ssize_t)sizeof(exec_errno)) {
        close(err_pipe[0]);
        close(out_pipe[0]);
        waitpid(pid, nullptr, 0);
        if (exec_errno == ENOENT) {
            return ProcessError("executable not found", ProcessError::Kind::NotFound, exec_errno);
        }
        return ProcessError(std::string("exec failed: ") + std::strerror(exec_errno),
                            ProcessError::Kind::SpawnFailed, exec_errno);
    }
    close(err_pipe[0]);

    std::string output;
    bool truncated = false;
    bool timed_out = false;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            kill(pid, SIGKILL);
            timed_out = true;
            break;
        }
        struct pollfd pfd = {out_pipe[0], POLLIN, 0};
        int rc = poll(&pfd, 1, (int)remaining);
        if (rc < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (rc == 0) continue;
        ssize_t n = read(out_pipe[0], buffer, sizeof(buffer));
        if (n <= 0) break;   // EOF: child closed stdout
        appendCapped(output, buffer, (size_t)n, truncated);
    }
    close(out_pipe[0]);

    int status = 0;
    waitpid(pid, &status, 0);

    if (truncated) {
        MNLOG_WARN("process", "Output of %s truncated (exceeded %zu bytes)",
                   describeCommand(argv).c_str(), MAX_OUTPUT_BYTES);
    }
    if (timed_out) {
        return ProcessError("timed out after " + std::to_string(timeout_ms) + "ms",
                            ProcessError::Kind::Timeout);
    }

    trimTrailingWhitespace(output);
    ProcessOutput out;
    out.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    out.output = std::move(output);
    return out;
}

#endif

} // namespace marionette
