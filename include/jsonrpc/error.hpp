#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace jsonrpc {

namespace error {
    constexpr int ParseError     = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int InternalError  = -32603;
} // namespace error

/// Closed set of failure kinds reported by the library.
enum class ErrorKind {
    Parse,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    Internal
};

/// Protocol error code for a kind.
[[nodiscard]] int error_code(ErrorKind kind) noexcept;

/// Whether responses for this kind carry the diagnostic `data` member.
[[nodiscard]] bool carries_data(ErrorKind kind) noexcept;

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message,
          std::optional<std::string> data = std::nullopt,
          nlohmann::json id = nullptr)
        : std::runtime_error(message), kind_(kind),
          data_(std::move(data)), id_(std::move(id)) {}

    ErrorKind kind() const noexcept { return kind_; }
    int code() const noexcept { return error_code(kind_); }

    /// Diagnostic string describing the underlying cause, if any.
    const std::optional<std::string>& data() const noexcept { return data_; }

    /// Id of the request the error belongs to; null when no request was parsed.
    const nlohmann::json& id() const noexcept { return id_; }

private:
    ErrorKind kind_;
    std::optional<std::string> data_;
    nlohmann::json id_;
};

/// The payload is not well-formed JSON.
class ParseError : public Error {
public:
    explicit ParseError(std::string data)
        : Error(ErrorKind::Parse, "Parsing failed, invalid JSON data", std::move(data)) {}
};

/// Well-formed JSON that is not a valid JSON-RPC request.
class InvalidRequestError : public Error {
public:
    explicit InvalidRequestError(std::string data)
        : Error(ErrorKind::InvalidRequest, "Invalid JSON-RPC request", std::move(data)) {}
};

class MethodNotFoundError : public Error {
public:
    MethodNotFoundError(nlohmann::json id, const std::string& name)
        : Error(ErrorKind::MethodNotFound, "Service method not found: " + name,
                std::nullopt, std::move(id)),
          name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class InvalidParamsError : public Error {
public:
    InvalidParamsError(nlohmann::json id, std::string data)
        : Error(ErrorKind::InvalidParams, "Message parameters are invalid",
                std::move(data), std::move(id)) {}
};

/// Explicit internal failure raised by service code.
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message, nlohmann::json id = nullptr)
        : Error(ErrorKind::Internal, message, std::nullopt, std::move(id)) {}
};

} // namespace jsonrpc
