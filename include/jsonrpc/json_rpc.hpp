#pragma once
#include "error.hpp"
#include <cstdint>
#include <exception>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace jsonrpc {

/// Opaque correlation token. Null marks a notification.
using RequestId = nlohmann::json;

struct RpcError {
    int code;
    std::string message;
    std::optional<std::string> data;

    bool operator==(const RpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
    bool operator!=(const RpcError& o) const { return !(*this == o); }
};

void to_json(nlohmann::json& j, const RpcError& e);
void from_json(const nlohmann::json& j, RpcError& e);

/// Classify a failure into the protocol error space.
/// Library errors map through their kind; anything else is an internal error.
[[nodiscard]] RpcError to_rpc_error(const std::exception& e);

class Request {
public:
    Request(RequestId id, std::string method,
            std::optional<nlohmann::json> params = std::nullopt);

    /// Request expecting an answer, with a random non-zero id.
    [[nodiscard]] static Request new_reply(std::string method,
                                           std::optional<nlohmann::json> params = std::nullopt);

    /// Request without an id.
    [[nodiscard]] static Request new_notification(std::string method,
                                                  std::optional<nlohmann::json> params = std::nullopt);

    /// Parse entry points. Throw ParseError or InvalidRequestError.
    [[nodiscard]] static Request from_string(std::string_view payload);
    [[nodiscard]] static Request from_bytes(const std::vector<std::uint8_t>& payload);
    [[nodiscard]] static Request from_stream(std::istream& in);
    [[nodiscard]] static Request from_value(const nlohmann::json& payload);

    const RequestId& id() const noexcept { return id_; }
    const std::string& method() const noexcept { return method_; }
    bool is_notification() const noexcept { return id_.is_null(); }
    bool matches(std::string_view name) const noexcept { return method_ == name; }

    bool has_params() const noexcept { return params_.has_value(); }
    const std::optional<nlohmann::json>& params() const noexcept { return params_; }

    /// Move the parameters out of the request.
    /// Throws InvalidParamsError("No parameters given") once they are gone.
    nlohmann::json take_params();

    /// Take the parameters and convert them to T.
    template <typename T>
    T deserialize() {
        nlohmann::json params = take_params();
        try {
            return params.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw InvalidParamsError(id_, e.what());
        }
    }

    bool operator==(const Request& o) const {
        return id_ == o.id_ && method_ == o.method_ && params_ == o.params_;
    }
    bool operator!=(const Request& o) const { return !(*this == o); }

private:
    RequestId id_;
    std::string method_;
    std::optional<nlohmann::json> params_;
};

class Response {
public:
    [[nodiscard]] static Response success(RequestId id, nlohmann::json result);
    [[nodiscard]] static Response failure(RequestId id, RpcError error);

    /// Successful answer to a request, echoing its id.
    [[nodiscard]] static Response reply(const Request& request, nlohmann::json result);

    /// Error answer to a request. The request id is always echoed.
    [[nodiscard]] static Response from_error(const Request& request, const std::exception& e);

    /// Error answer when no request is available (parse-time failures).
    [[nodiscard]] static Response from_error(const std::exception& e);

    const RequestId& id() const noexcept { return id_; }
    const std::optional<nlohmann::json>& result() const noexcept { return result_; }
    const std::optional<RpcError>& error() const noexcept { return error_; }
    bool is_error() const noexcept { return error_.has_value(); }

    std::optional<nlohmann::json> into_result();
    std::optional<RpcError> into_error();

    bool operator==(const Response& o) const {
        return id_ == o.id_ && result_ == o.result_ && error_ == o.error_;
    }
    bool operator!=(const Response& o) const { return !(*this == o); }

private:
    Response(RequestId id, std::optional<nlohmann::json> result, std::optional<RpcError> error);

    RequestId id_;
    std::optional<nlohmann::json> result_;
    std::optional<RpcError> error_;
};

void to_json(nlohmann::json& j, const Request& r);
void to_json(nlohmann::json& j, const Response& r);

} // namespace jsonrpc
