/**
 * @file result.hpp
 * @brief Error values for the client pipeline.
 * @author log_courier contributors
 *
 * Transport faults, encoding failures and configuration mistakes travel as
 * values so that no ordinary logging call throws into caller code. Only
 * value()/error() on the wrong alternative throw, and that is a caller bug.
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

namespace log_courier {

// ─────────────────────────────────────────────
// Error taxonomy
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Connection,      ///< refused, reset, timeout; handled by the connection manager
    Protocol,        ///< a packet failed to encode; the packet is dropped
    Configuration,   ///< malformed descriptor or unresolvable variable
    QueueOverflow    ///< non-blocking enqueue against a full queue
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Connection:    return "connection";
        case ErrorKind::Protocol:      return "protocol";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::QueueOverflow: return "queue_overflow";
    }
    return "unknown";
}

struct Error {
    ErrorKind kind;
    std::string message;

    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    /// Same kind, message prefixed with where it happened ("client.connections: ...").
    [[nodiscard]] Error with_context(std::string_view where) const {
        return Error{kind, std::string(where) + ": " + message};
    }

    bool operator==(const Error&) const = default;
};

[[nodiscard]] inline Error connection_error(std::string msg) {
    return Error{ErrorKind::Connection, std::move(msg)};
}

[[nodiscard]] inline Error protocol_error(std::string msg) {
    return Error{ErrorKind::Protocol, std::move(msg)};
}

[[nodiscard]] inline Error configuration_error(std::string msg) {
    return Error{ErrorKind::Configuration, std::move(msg)};
}

[[nodiscard]] inline Error queue_overflow_error(std::string msg) {
    return Error{ErrorKind::QueueOverflow, std::move(msg)};
}

// ─────────────────────────────────────────────
// Result
// ─────────────────────────────────────────────

template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::in_place_index<1>, std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] T& value() & { return std::get<0>(checked_value()); }
    [[nodiscard]] const T& value() const& { return std::get<0>(checked_value()); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(checked_value())); }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T value_or(T fallback) const& { return has_value() ? value() : fallback; }

    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) return std::forward<F>(func)(value());
        return error();
    }

    /// @p func returns a Result; errors short-circuit.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) return std::forward<F>(func)(value());
        return error();
    }

    /// Rewrite the error, e.g. to add context, leaving a value untouched.
    template <typename F>
    Result map_error(F&& func) && {
        if (has_value()) return std::move(*this);
        return Result(std::forward<F>(func)(std::get<1>(storage_)));
    }

private:
    std::variant<T, E>& checked_value() {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return storage_;
    }
    const std::variant<T, E>& checked_value() const {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return storage_;
    }

    std::variant<T, E> storage_;
};

/// Success carries nothing; a default-constructed Result<void> is success.
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : error_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

    [[nodiscard]] const E& error() const& {
        if (!error_) throw std::logic_error("Result holds a value, not an error");
        return *error_;
    }

    template <typename F>
    Result map_error(F&& func) && {
        if (!error_) return Result{};
        return Result(std::forward<F>(func)(*error_));
    }

private:
    std::optional<E> error_;
};

}  // namespace log_courier
