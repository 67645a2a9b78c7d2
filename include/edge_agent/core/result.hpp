#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace edge_agent {

// ---------------------------------------------------------------------------
// Result<T, E> — either a value or an error. Accessing the wrong side throws
// (std::bad_variant_access / std::bad_optional_access).
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return !IsOk(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& { return std::get<0>(storage_); }
    [[nodiscard]] T Value() && { return std::get<0>(std::move(storage_)); }

    [[nodiscard]] const E& Error() const& { return std::get<1>(storage_); }
    [[nodiscard]] E Error() && { return std::get<1>(std::move(storage_)); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> side, U&& payload)
        : storage_(side, std::forward<U>(payload)) {}

    std::variant<T, E> storage_;
};

// Operations that succeed without a value.
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(std::nullopt); }
    static Result Err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& { return error_.value(); }
    [[nodiscard]] E Error() && { return std::move(error_).value(); }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// Drives the process exit code and the "category" field of --json errors.
enum class ErrorCategory {
    Spawn,
    BrokenPipe,
    MalformedMessage,
    Timeout,
    ServerClosed,
    Protocol,
    ToolNotFound,
    BudgetOverflow,
    Model,
    FileIo,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — shared by transport, session, agent, runtime and config code.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;              // JSON-RPC method or local action
    std::string target;                 // server name, tool name or path
    std::string message;
    std::optional<std::string> detail;  // e.g. JSON-RPC error code and data
    ErrorCategory category = ErrorCategory::Internal;

    /// Protocol error from a JSON-RPC error object (code, message, data).
    static Error FromJsonRpc(const std::string& operation,
                             const std::string& target,
                             int code,
                             const std::string& message,
                             const std::string& data = "");

    [[nodiscard]] int ExitCode() const;
    [[nodiscard]] std::string CategoryName() const;

    /// "operation [target]: message (detail)"
    [[nodiscard]] std::string ToString() const;

    /// {"error":{"category","operation","message","exit_code",...}}
    [[nodiscard]] std::string ToJson() const;
};

} // namespace edge_agent
