#pragma once
// =============================================================================
// shell_security.hpp
//
// Validation and quoting for everything that ends up on an Android shell
// command line (adb -s <serial> shell ..., <manager> adb -v <i> -c "shell ...").
//
// These functions are the security boundary for remote command execution.
// =============================================================================

#include <string>
#include <cstring>
#include <cctype>

namespace marionette {
namespace security {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r";

// VM indices handed out by emulator managers are small non-negative integers
constexpr int MAX_VM_INDEX = 1024;

/**
 * Validate an ADB device serial.
 * Valid formats:
 *   - Serial number: alphanumeric, may include ':', '.', '-', '_'
 *   - IP:port: xxx.xxx.xxx.xxx:port
 *
 * @param serial  The device serial to validate
 * @return true if valid, false if potentially malicious
 */
inline bool isValidDeviceSerial(const std::string& serial) {
    if (serial.empty() || serial.length() > 64) {
        return false;
    }

    for (char c : serial) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            return false;
        }
    }

    for (char c : serial) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }

    return true;
}

inline bool isValidVmIndex(int index) {
    return index >= 0 && index < MAX_VM_INDEX;
}

/**
 * Backslash-escape shell metacharacters and spaces.
 * Used for `input text`, which takes its argument unquoted.
 *
 * @param arg  Shell argument to escape
 * @return Escaped argument string
 */
inline std::string escapeShellArg(const std::string& arg) {
    std::string escaped;
    escaped.reserve(arg.length() * 2);

    for (char c : arg) {
        if (c == ' ' || std::strchr(SHELL_METACHARACTERS, c) != nullptr) {
            escaped += '\\';
        }
        escaped += c;
    }

    return escaped;
}

/**
 * Wrap an argument in single quotes for a POSIX shell.
 * Embedded single quotes become '\'' so the argument stays one word.
 *
 * @param arg  Shell argument to quote
 * @return Quoted argument, e.g. hello'x -> 'hello'\''x'
 */
inline std::string quoteSingle(const std::string& arg) {
    std::string quoted;
    quoted.reserve(arg.length() + 8);
    quoted += '\'';
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

} // namespace security
} // namespace marionette
