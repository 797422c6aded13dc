// =============================================================================
// Marionette - Result type for recoverable failures
// =============================================================================
// Result<T, E> holds either a value or an error. External process calls,
// manager bridges and text strategies return one instead of throwing, so the
// fallback chains above them decide what happens next.
//
//   Result<std::string> r = bridge.run_shell(index, "input tap 10 20");
//   if (r.is_err()) MNLOG_WARN("remote", "%s", r.error().message.c_str());
//
// Result<void, E> carries only the error; `return {};` is success.
// =============================================================================

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace marionette {

// =============================================================================
// Error types
// =============================================================================

struct Error {
    std::string message;
    int code = 0;

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
    }
};

// Failure running an external binary (manager, console, adb).
// code carries the exit code for NonZeroExit, errno / GetLastError otherwise.
struct ProcessError : Error {
    enum class Kind {
        NotFound,       // executable missing / not configured
        SpawnFailed,    // CreateProcess / fork failed
        Timeout,        // killed after the deadline
        NonZeroExit,    // ran, exit code != 0
        Other
    };
    Kind kind = Kind::Other;

    ProcessError() = default;
    explicit ProcessError(std::string msg, Kind k = Kind::Other, int c = 0)
        : Error(std::move(msg), c), kind(k) {}
};

inline const char* processErrorKindStr(ProcessError::Kind k) {
    switch (k) {
        case ProcessError::Kind::NotFound:    return "not-found";
        case ProcessError::Kind::SpawnFailed: return "spawn-failed";
        case ProcessError::Kind::Timeout:     return "timeout";
        case ProcessError::Kind::NonZeroExit: return "non-zero-exit";
        case ProcessError::Kind::Other:       return "other";
    }
    return "other";
}

// =============================================================================
// Result<T, E>
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Any error convertible to E (ProcessError -> Error slices)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    // Throws std::logic_error on the wrong alternative
    T& value() & {
        if (is_err()) throw std::logic_error("value() on error result: " + error().message);
        return std::get<0>(data_);
    }
    const T& value() const& {
        if (is_err()) throw std::logic_error("value() on error result: " + error().message);
        return std::get<0>(data_);
    }
    T&& value() && {
        if (is_err()) throw std::logic_error("value() on error result: " + error().message);
        return std::get<0>(std::move(data_));
    }

    E& error() & {
        if (is_ok()) throw std::logic_error("error() on ok result");
        return std::get<1>(data_);
    }
    const E& error() const& {
        if (is_ok()) throw std::logic_error("error() on ok result");
        return std::get<1>(data_);
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E>
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() = default;

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return !is_ok(); }
    explicit operator bool() const { return is_ok(); }

    E& error() & {
        if (is_ok()) throw std::logic_error("error() on ok result");
        return std::get<E>(data_);
    }
    const E& error() const& {
        if (is_ok()) throw std::logic_error("error() on ok result");
        return std::get<E>(data_);
    }

private:
    std::variant<std::monostate, E> data_;
};

} // namespace marionette
