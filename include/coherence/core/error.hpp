#pragma once

/// @file error.hpp
/// @brief Error handling types for coherence_core

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <stdexcept>

namespace coherence_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ProtocolError,
    IncompatibleVersion,
    Timeout,
    CapacityExceeded,
    NotConnected,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::IncompatibleVersion: return "IncompatibleVersion";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::CapacityExceeded: return "CapacityExceeded";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Shared memory and framing errors
struct IpcError {
    enum class Kind : std::uint8_t {
        ChannelNotFound,    // No shared memory under that name
        ChannelExists,      // Master found a stale region under that name
        MapFailed,          // shm_open / ftruncate / mmap failure
        DimensionMismatch,  // Master and slave disagree on layout
        ChannelClosed,      // Peer tore the channel down
        FrameDesync,        // Malformed frame, framing lost
        PayloadTooLarge,    // Frame does not fit in one node
    };

    Kind kind;
    std::string message;
    std::string channel;

    [[nodiscard]] static IpcError channel_not_found(const std::string& name) {
        return IpcError{Kind::ChannelNotFound, "Shared memory not found: " + name, name};
    }

    [[nodiscard]] static IpcError channel_exists(const std::string& name) {
        return IpcError{Kind::ChannelExists, "Shared memory already exists: " + name, name};
    }

    [[nodiscard]] static IpcError map_failed(const std::string& name, const std::string& reason) {
        return IpcError{Kind::MapFailed, "Failed to map '" + name + "': " + reason, name};
    }

    [[nodiscard]] static IpcError dimension_mismatch(const std::string& name, const std::string& detail) {
        return IpcError{Kind::DimensionMismatch,
            "Ring buffer '" + name + "' layout mismatch: " + detail, name};
    }

    [[nodiscard]] static IpcError channel_closed(const std::string& name) {
        return IpcError{Kind::ChannelClosed, "Channel closed by peer: " + name, name};
    }

    [[nodiscard]] static IpcError frame_desync(const std::string& name, const std::string& detail) {
        return IpcError{Kind::FrameDesync, "Frame desync on '" + name + "': " + detail, name};
    }

    [[nodiscard]] static IpcError payload_too_large(const std::string& target, std::size_t size, std::size_t capacity) {
        return IpcError{Kind::PayloadTooLarge,
            "Payload for '" + target + "' is " + std::to_string(size) +
            " bytes, node capacity is " + std::to_string(capacity), target};
    }
};

/// Directory and entity errors
struct SceneError {
    enum class Kind : std::uint8_t {
        NotFound,             // No entity under that key
        AlreadyExists,        // Entity key already taken
        NotConnected,         // Operation requires a live connection
        InboundNotSupported,  // Entity is local-to-remote only
        InvalidValue,         // Value does not fit the flat layout
    };

    Kind kind;
    std::string message;
    std::string entity;

    [[nodiscard]] static SceneError not_found(const std::string& kind_name, const std::string& key) {
        return SceneError{Kind::NotFound, kind_name + " not found: " + key, key};
    }

    [[nodiscard]] static SceneError already_exists(const std::string& kind_name, const std::string& key) {
        return SceneError{Kind::AlreadyExists, kind_name + " already exists: " + key, key};
    }

    [[nodiscard]] static SceneError not_connected() {
        return SceneError{Kind::NotConnected, "Not connected", {}};
    }

    [[nodiscard]] static SceneError inbound_not_supported(const std::string& key) {
        return SceneError{Kind::InboundNotSupported,
            "Inbound updates are not supported for '" + key + "'", key};
    }

    [[nodiscard]] static SceneError invalid_value(const std::string& key, const std::string& reason) {
        return SceneError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        IpcError,
        SceneError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(IpcError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(SceneError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Name of the shared memory region or entity the error refers to
    [[nodiscard]] std::string subject() const {
        if (const auto* ipc = as<IpcError>()) {
            return ipc->channel;
        }
        if (const auto* scene = as<SceneError>()) {
            return scene->entity;
        }
        return {};
    }

    /// True when the peer is gone and the session has to be torn down
    [[nodiscard]] bool is_disconnect() const {
        const auto* ipc = as<IpcError>();
        return ipc && ipc->kind == IpcError::Kind::ChannelClosed;
    }

private:
    static ErrorCode to_error_code(IpcError::Kind kind) {
        switch (kind) {
            case IpcError::Kind::ChannelNotFound: return ErrorCode::NotFound;
            case IpcError::Kind::ChannelExists: return ErrorCode::AlreadyExists;
            case IpcError::Kind::MapFailed: return ErrorCode::IOError;
            case IpcError::Kind::DimensionMismatch: return ErrorCode::IncompatibleVersion;
            case IpcError::Kind::ChannelClosed: return ErrorCode::NotConnected;
            case IpcError::Kind::FrameDesync: return ErrorCode::ProtocolError;
            case IpcError::Kind::PayloadTooLarge: return ErrorCode::CapacityExceeded;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(SceneError::Kind kind) {
        switch (kind) {
            case SceneError::Kind::NotFound: return ErrorCode::NotFound;
            case SceneError::Kind::AlreadyExists: return ErrorCode::AlreadyExists;
            case SceneError::Kind::NotConnected: return ErrorCode::NotConnected;
            case SceneError::Kind::InboundNotSupported: return ErrorCode::NotSupported;
            case SceneError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
};

// =============================================================================
// ErrorException
// =============================================================================

/// Exception carrying an Error, for failures that unwind through
/// ring buffer callbacks
class ErrorException : public std::runtime_error {
public:
    explicit ErrorException(Error error)
        : std::runtime_error(error.message())
        , m_error(std::move(error)) {}

    [[nodiscard]] const Error& error() const noexcept { return m_error; }
    [[nodiscard]] ErrorCode code() const noexcept { return m_error.code(); }

private:
    Error m_error;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Value or Error returned by every fallible bridge operation
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw_error();
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw_error();
        }
        return std::move(*m_value);
    }

private:
    void throw_error() const {
        if constexpr (std::is_same_v<E, Error>) {
            throw ErrorException(m_error);
        } else {
            throw std::runtime_error("Result contains error");
        }
    }

    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            if constexpr (std::is_same_v<E, Error>) {
                throw ErrorException(m_error);
            } else {
                throw std::runtime_error("Result contains error");
            }
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// "[Code] [IpcError:Kind] message (channel: name)" for the host's last-error string
[[nodiscard]] std::string format_error(const Error& error);

namespace debug {

/// Count an error reported through the host API
void record_error(const Error& error);

[[nodiscard]] std::uint64_t error_count(ErrorCode code);
[[nodiscard]] std::uint64_t total_error_count();

void reset_error_stats();

} // namespace debug

} // namespace coherence_core
