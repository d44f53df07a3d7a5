#include "jsonrpc/codec.hpp"
#include "jsonrpc/error.hpp"
#include "jsonrpc/logging.hpp"
#include "jsonrpc/version.hpp"
#include <istream>
#include <iterator>
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace jsonrpc {

namespace {

[[noreturn]] void fail_parse(const std::string& data) {
    LOG4CPLUS_DEBUG(logger(), "Rejected payload: " << data);
    throw ParseError(data);
}

[[noreturn]] void fail_schema(const std::string& data) {
    LOG4CPLUS_DEBUG(logger(), "Rejected request: " << data);
    throw InvalidRequestError(data);
}

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            if (!val.is_null().value()) fail_parse("invalid literal");
            return nlohmann::json(nullptr);
        default:
            fail_parse("unexpected token");
    }
}

nlohmann::json decode(std::string_view raw) {
    if (raw.empty()) {
        fail_parse("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        fail_parse(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    simdjson::ondemand::json_type root_type;
    error = doc.type().get(root_type);
    if (error) {
        fail_parse(std::string("JSON parse error: ") + simdjson::error_message(error));
    }
    if (root_type != simdjson::ondemand::json_type::object) {
        // Well-formed scalars and arrays are schema failures, not syntax failures
        if (nlohmann::json::accept(raw)) {
            fail_schema("Message must be a JSON object");
        }
        fail_parse("JSON parse error: malformed document");
    }

    nlohmann::json j;
    try {
        auto val = doc.get_value();
        if (val.error()) {
            fail_parse(std::string("JSON parse error: ") + simdjson::error_message(val.error()));
        }
        j = simdjson_to_nlohmann(val.value());
    } catch (const simdjson::simdjson_error& e) {
        fail_parse(std::string("JSON parse error: ") + e.what());
    }

    if (!doc.at_end()) {
        fail_parse("JSON parse error: trailing characters after document");
    }
    return j;
}

} // anonymous namespace

Request Codec::parse_object(nlohmann::json j) {
    if (!j.is_object()) {
        fail_schema("Message must be a JSON object");
    }

    // Validate jsonrpc version
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        fail_schema("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        fail_schema("Invalid jsonrpc version, expected '2.0'");
    }

    auto method = j.find("method");
    if (method == j.end()) {
        fail_schema("Missing 'method' field");
    }
    if (!method->is_string()) {
        fail_schema("'method' must be a string");
    }
    std::string name = method->get<std::string>();
    if (name.empty()) {
        fail_schema("'method' must not be empty");
    }

    RequestId id = nullptr;
    auto id_it = j.find("id");
    if (id_it != j.end()) {
        if (id_it->is_structured()) {
            fail_schema("'id' must be a string, number or null");
        }
        id = std::move(*id_it);
    }

    std::optional<nlohmann::json> params;
    auto params_it = j.find("params");
    if (params_it != j.end() && !params_it->is_null()) {
        params = std::move(*params_it);
    }

    return Request(std::move(id), std::move(name), std::move(params));
}

Request Codec::parse(std::string_view raw) {
    return parse_object(decode(raw));
}

Request Codec::parse(const std::vector<std::uint8_t>& raw) {
    return parse(std::string(raw.begin(), raw.end()));
}

Request Codec::parse(std::istream& in) {
    std::string buffer{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) {
        fail_parse("Failed to read from stream");
    }
    return parse(std::string_view(buffer));
}

Request Codec::parse_value(const nlohmann::json& j) {
    return parse_object(j);
}

std::string Codec::serialize(const Request& req) {
    nlohmann::json j;
    to_json(j, req);
    return j.dump();
}

std::string Codec::serialize(const Response& resp, bool omit_null_id) {
    nlohmann::json j;
    to_json(j, resp);
    if (omit_null_id && resp.id().is_null()) j.erase("id");
    return j.dump();
}

} // namespace jsonrpc
