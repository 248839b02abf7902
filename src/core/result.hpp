/**
 * @file result.hpp
 * @brief Monadic error handling and the error taxonomy for cluster_scaler.
 *
 * Every fallible operation returns Result<T, Error>. Errors carry an
 * ErrorKind tag so callers classify failures by kind, never by message.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace cluster_scaler {

// ─────────────────────────────────────────────
// Error Kinds
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Construction,            ///< Provider could not be built; fatal at startup
    CapabilityUnsupported,   ///< Optional operation absent in this backend
    DataIntegrity,           ///< Cached backend data violates an invariant
    Refresh,                 ///< Backend state could not be refreshed
    Backend,                 ///< Other backend / manager failure
    InvalidArgument,         ///< Caller supplied an out-of-bounds request
    Config                   ///< Configuration could not be loaded
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Construction:          return "construction";
        case ErrorKind::CapabilityUnsupported: return "capability_unsupported";
        case ErrorKind::DataIntegrity:         return "data_integrity";
        case ErrorKind::Refresh:               return "refresh";
        case ErrorKind::Backend:               return "backend";
        case ErrorKind::InvalidArgument:       return "invalid_argument";
        case ErrorKind::Config:                return "config";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a kind tag and a human-readable message.
 */
struct Error {
    ErrorKind kind{ErrorKind::Backend};
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }
};

// ── Error factories ──────────────────────────

[[nodiscard]] inline Error unsupported(std::string_view operation) {
    return Error{ErrorKind::CapabilityUnsupported,
                 std::string{operation} + " is not implemented by this cloud provider"};
}

[[nodiscard]] inline Error integrity_error(std::string msg) {
    return Error{ErrorKind::DataIntegrity, std::move(msg)};
}

[[nodiscard]] inline Error refresh_error(std::string msg) {
    return Error{ErrorKind::Refresh, std::move(msg)};
}

[[nodiscard]] inline Error construction_error(std::string msg) {
    return Error{ErrorKind::Construction, std::move(msg)};
}

[[nodiscard]] inline Error invalid_argument(std::string msg) {
    return Error{ErrorKind::InvalidArgument, std::move(msg)};
}

[[nodiscard]] inline Error config_error(std::string msg) {
    return Error{ErrorKind::Config, std::move(msg)};
}

[[nodiscard]] inline bool is_unsupported(const Error& err) noexcept {
    return err.is(ErrorKind::CapabilityUnsupported);
}

/**
 * @brief Result<T, E> holds either a success value of type T or an error E.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    /// Transform the success value, forwarding the error untouched.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations with no success payload.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

using Status = Result<void>;

/// Successful Status.
[[nodiscard]] inline Status ok() { return Status{}; }

}  // namespace cluster_scaler
