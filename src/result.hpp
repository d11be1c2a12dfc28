// =============================================================================
// PeloBridge - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Transport, network and install failures travel as values; nothing is thrown
// across module boundaries.
//
// Usage:
//   Result<std::string> readProp(...) {
//       if (failed) return Err<std::string>(ErrorKind::TransportFailure, "adb exited 1");
//       return Ok(text);
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>

namespace pelo {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorKind {
    Generic,
    NoDeviceDetected,   // empty registry
    TransportFailure,   // non-zero exit or I/O error from the bridge
    DownloadFailure,    // network/TLS error or non-2xx status
    InstallConflict,    // signature mismatch, recoverable by uninstall+retry
    InstallFailure,     // any other non-success install result
    PairingFailure,     // wireless pairing did not complete
    ConnectionTimeout,  // wireless connect did not complete
    NoNetworkAddress,   // device has no WLAN address (handoff)
    ScanFailure,        // discovery/probe error
    Busy,               // another high-level operation is running
    ConfigError
};

inline const char* errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::Generic:           return "Generic";
        case ErrorKind::NoDeviceDetected:  return "NoDeviceDetected";
        case ErrorKind::TransportFailure:  return "TransportFailure";
        case ErrorKind::DownloadFailure:   return "DownloadFailure";
        case ErrorKind::InstallConflict:   return "InstallConflict";
        case ErrorKind::InstallFailure:    return "InstallFailure";
        case ErrorKind::PairingFailure:    return "PairingFailure";
        case ErrorKind::ConnectionTimeout: return "ConnectionTimeout";
        case ErrorKind::NoNetworkAddress:  return "NoNetworkAddress";
        case ErrorKind::ScanFailure:       return "ScanFailure";
        case ErrorKind::Busy:              return "Busy";
        case ErrorKind::ConfigError:       return "ConfigError";
    }
    return "Unknown";
}

struct Error {
    std::string message;
    int code = 0;
    ErrorKind kind = ErrorKind::Generic;
    std::string output;  // raw tool output, when the failure produced any

    Error() = default;
    explicit Error(std::string msg, int c = 0) : message(std::move(msg)), code(c) {}
    explicit Error(const char* msg, int c = 0) : message(msg), code(c) {}
    Error(ErrorKind k, std::string msg, int c = 0)
        : message(std::move(msg)), code(c), kind(k) {}
    Error(ErrorKind k, std::string msg, std::string out, int c)
        : message(std::move(msg)), code(c), kind(k), output(std::move(out)) {}

    bool operator==(const Error& other) const {
        return kind == other.kind && code == other.code && message == other.message;
    }
};

// =============================================================================
// Result<T, E> Type
// =============================================================================

template<typename T, typename E = Error>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}

    // Error constructor (from E or derived)
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(std::in_place_index<1>, E(std::move(error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }

    explicit operator bool() const { return is_ok(); }

    // Access value (throws if error)
    T& value() & {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    const T& value() const& {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(data_);
    }

    T&& value() && {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    // Access error (throws if success)
    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<1>(data_);
    }

    T value_or(T default_value) const& {
        return is_ok() ? std::get<0>(data_) : std::move(default_value);
    }

    T value_or(T default_value) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(default_value);
    }

    std::optional<T> ok() const& {
        if (is_ok()) return std::get<0>(data_);
        return std::nullopt;
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<1>(data_);
        return std::nullopt;
    }

    template<typename F>
    auto map(F&& f) const& -> Result<decltype(f(std::declval<T>())), E> {
        using U = decltype(f(std::declval<T>()));
        if (is_ok()) return Result<U, E>(f(std::get<0>(data_)));
        return Result<U, E>(std::get<1>(data_));
    }

private:
    std::variant<T, E> data_;
};

// =============================================================================
// Result<void, E> Specialization
// =============================================================================

template<typename E>
class Result<void, E> {
public:
    Result() : data_(std::monostate{}) {}

    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E>>>
    Result(Err error) : data_(E(std::move(error))) {}

    bool is_ok() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_err() const { return std::holds_alternative<E>(data_); }
    explicit operator bool() const { return is_ok(); }

    E& error() & {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    const E& error() const& {
        if (is_ok()) throw std::runtime_error("Result is ok, no error");
        return std::get<E>(data_);
    }

    std::optional<E> err() const& {
        if (is_err()) return std::get<E>(data_);
        return std::nullopt;
    }

private:
    std::variant<std::monostate, E> data_;
};

// =============================================================================
// Helper Functions
// =============================================================================

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Result<void, Error> Ok() {
    return Result<void, Error>();
}

template<typename T>
Result<T, Error> Err(ErrorKind kind, std::string message, int code = 0) {
    return Result<T, Error>(Error(kind, std::move(message), code));
}

template<typename T>
Result<T, Error> Err(Error error) {
    return Result<T, Error>(std::move(error));
}

// TRY macro: unwrap result or return its error from the enclosing function
// Usage: auto value = PELO_TRY(some_function());
#define PELO_TRY(expr) \
    ({ \
        auto _result = (expr); \
        if (_result.is_err()) return _result.error(); \
        std::move(_result).value(); \
    })

} // namespace pelo
