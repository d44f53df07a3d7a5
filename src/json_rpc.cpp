#include "jsonrpc/json_rpc.hpp"
#include "jsonrpc/codec.hpp"
#include "jsonrpc/version.hpp"
#include <limits>
#include <random>

namespace jsonrpc {

void to_json(nlohmann::json& j, const RpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, RpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data") && !j.at("data").is_null()) {
        e.data = j.at("data").get<std::string>();
    } else {
        e.data.reset();
    }
}

RpcError to_rpc_error(const std::exception& e) {
    if (const auto* err = dynamic_cast<const Error*>(&e)) {
        std::optional<std::string> data;
        if (carries_data(err->kind())) data = err->data();
        return RpcError{err->code(), err->what(), std::move(data)};
    }
    return RpcError{error::InternalError, e.what(), std::nullopt};
}

// ----------- Request -----------

Request::Request(RequestId id, std::string method, std::optional<nlohmann::json> params)
    : id_(std::move(id)), method_(std::move(method)), params_(std::move(params)) {
    if (method_.empty()) throw InvalidRequestError("'method' must not be empty");
}

Request Request::new_reply(std::string method, std::optional<nlohmann::json> params) {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> dist(1, std::numeric_limits<std::uint32_t>::max());
    return Request(RequestId(dist(rng)), std::move(method), std::move(params));
}

Request Request::new_notification(std::string method, std::optional<nlohmann::json> params) {
    return Request(RequestId(nullptr), std::move(method), std::move(params));
}

Request Request::from_string(std::string_view payload) {
    return Codec::parse(payload);
}

Request Request::from_bytes(const std::vector<std::uint8_t>& payload) {
    return Codec::parse(payload);
}

Request Request::from_stream(std::istream& in) {
    return Codec::parse(in);
}

Request Request::from_value(const nlohmann::json& payload) {
    return Codec::parse_value(payload);
}

nlohmann::json Request::take_params() {
    if (!params_) {
        throw InvalidParamsError(id_, "No parameters given");
    }
    nlohmann::json params = std::move(*params_);
    params_.reset();
    return params;
}

// ----------- Response -----------

Response::Response(RequestId id, std::optional<nlohmann::json> result, std::optional<RpcError> error)
    : id_(std::move(id)), result_(std::move(result)), error_(std::move(error)) {
}

Response Response::success(RequestId id, nlohmann::json result) {
    return Response(std::move(id), std::move(result), std::nullopt);
}

Response Response::failure(RequestId id, RpcError error) {
    return Response(std::move(id), std::nullopt, std::move(error));
}

Response Response::reply(const Request& request, nlohmann::json result) {
    return success(request.id(), std::move(result));
}

Response Response::from_error(const Request& request, const std::exception& e) {
    return failure(request.id(), to_rpc_error(e));
}

Response Response::from_error(const std::exception& e) {
    RequestId id = nullptr;
    if (const auto* err = dynamic_cast<const Error*>(&e)) id = err->id();
    return failure(std::move(id), to_rpc_error(e));
}

std::optional<nlohmann::json> Response::into_result() {
    std::optional<nlohmann::json> result = std::move(result_);
    result_.reset();
    return result;
}

std::optional<RpcError> Response::into_error() {
    std::optional<RpcError> error = std::move(error_);
    error_.reset();
    return error;
}

// ----------- JSON mapping -----------

void to_json(nlohmann::json& j, const Request& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (!r.is_notification()) j["id"] = r.id();
    j["method"] = r.method();
    if (r.params()) j["params"] = *r.params();
}

void to_json(nlohmann::json& j, const Response& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id();
    if (r.result()) j["result"] = *r.result();
    if (r.error()) j["error"] = *r.error();
}

} // namespace jsonrpc
