#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace jsonrpc {

class Codec {
public:
    /// Parse raw JSON text into a request.
    /// Throws ParseError on malformed JSON and InvalidRequestError when the
    /// document is not a JSON-RPC 2.0 request.
    [[nodiscard]] static Request parse(std::string_view raw);

    [[nodiscard]] static Request parse(const std::vector<std::uint8_t>& raw);

    /// Reads the stream to its end before parsing.
    [[nodiscard]] static Request parse(std::istream& in);

    /// Validate an already decoded JSON value as a request.
    [[nodiscard]] static Request parse_value(const nlohmann::json& j);

    [[nodiscard]] static std::string serialize(const Request& req);

    /// Serialize a response. A null id is written as `"id":null` unless
    /// omit_null_id is set.
    [[nodiscard]] static std::string serialize(const Response& resp, bool omit_null_id = false);

private:
    static Request parse_object(nlohmann::json j);
};

} // namespace jsonrpc
