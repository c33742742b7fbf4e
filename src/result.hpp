// =============================================================================
// DroidMirror - Result Type for Unified Error Handling
// =============================================================================
// A Result<T, E> type that encapsulates either a success value or an error.
// Every core operation reports failure through it; exceptions are reserved
// for programming errors (accessing the wrong side of a Result).
//
// Usage:
//   Result<AddressRange> r = AddressRange::fromCidr("192.168.1.0/24");
//   if (r.is_err()) {
//       DLOG_ERROR("scan", "%s", r.error().message.c_str());
//   }
// =============================================================================

#pragma once

#include <variant>
#include <string>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace droid {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode {
    Configuration = 1,  // malformed subnet/port/option input
    NotFound,           // selecting an address the registry does not hold
    NoSelection,        // session start without a selected device
    BridgeConnect,      // adb connect step failed
    MirrorLaunch,       // scrcpy launch step failed
    SessionNotActive,   // toggle/stop outside an active session
    ToggleCommand,      // key injection failed
    Busy,               // a scan is already running
    Cancelled,          // operation superseded by a stop request
    Io,                 // process/socket level failure
    Internal
};

inline const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::Configuration:    return "ConfigurationError";
        case ErrorCode::NotFound:         return "NotFoundError";
        case ErrorCode::NoSelection:      return "NoSelectionError";
        case ErrorCode::BridgeConnect:    return "BridgeConnectFailure";
        case ErrorCode::MirrorLaunch:     return "MirrorLaunchFailure";
        case ErrorCode::SessionNotActive: return "SessionNotActiveError";
        case ErrorCode::ToggleCommand:    return "ToggleCommandFailure";
        case ErrorCode::Busy:             return "BusyError";
        case ErrorCode::Cancelled:        return "Cancelled";
        case ErrorCode::Io:               return "IoError";
        case ErrorCode::Internal:         return "InternalError";
    }
    return "UnknownError";
}

struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    // "NoSelectionError: no device selected"
    std::string describe() const {
        return std::string(errorCodeName(code)) + ": " + message;
    }

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message;
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
    template<typename Err, typename = std::enable_if_t<std::is_convertible_v<Err, E> &&
                                                       !std::is_convertible_v<Err, T>>>
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

    void value() const {
        if (is_err()) throw std::runtime_error("Result is error: " + error().message);
    }

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

using VoidResult = Result<void, Error>;

// =============================================================================
// Helper Functions
// =============================================================================

inline VoidResult Ok() {
    return VoidResult();
}

template<typename T>
Result<std::decay_t<T>, Error> Ok(T&& value) {
    return Result<std::decay_t<T>, Error>(std::forward<T>(value));
}

inline Error Err(ErrorCode code, std::string message) {
    return Error(code, std::move(message));
}

} // namespace droid
