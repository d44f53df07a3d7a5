#include <gtest/gtest.h>
#include "jsonrpc/json_rpc.hpp"
#include "jsonrpc/error.hpp"
#include <nlohmann/json.hpp>
#include <string>

using namespace jsonrpc;

namespace {

struct Point {
    int x = 0;
    int y = 0;
};

void from_json(const nlohmann::json& j, Point& p) {
    p.x = j.at("x").get<int>();
    p.y = j.at("y").get<int>();
}

} // namespace

TEST(Request, NewReplyHasNonZeroId) {
    for (int i = 0; i < 100; ++i) {
        auto req = Request::new_reply("ping");
        ASSERT_TRUE(req.id().is_number_unsigned());
        EXPECT_NE(req.id().get<std::uint64_t>(), 0u);
        EXPECT_FALSE(req.is_notification());
    }
}

TEST(Request, NewNotificationHasNoId) {
    auto req = Request::new_notification("log", nlohmann::json{{"level", "info"}});
    EXPECT_TRUE(req.id().is_null());
    EXPECT_TRUE(req.is_notification());
    EXPECT_TRUE(req.has_params());
}

TEST(Request, EmptyMethodRejected) {
    EXPECT_THROW(Request(1, ""), InvalidRequestError);
    EXPECT_THROW(Request::new_reply(""), InvalidRequestError);
    EXPECT_THROW(Request::new_notification("", nlohmann::json{1, 2}), InvalidRequestError);
    try {
        (void)Request(1, "");
        FAIL() << "expected InvalidRequestError";
    } catch (const InvalidRequestError& e) {
        EXPECT_EQ(e.code(), error::InvalidRequest);
        EXPECT_EQ(e.data(), "'method' must not be empty");
    }
}

TEST(Request, MatchesIsExact) {
    Request req(1, "hello");
    EXPECT_TRUE(req.matches("hello"));
    EXPECT_FALSE(req.matches("Hello"));
    EXPECT_FALSE(req.matches("hello "));
    EXPECT_FALSE(req.matches("hell"));
}

TEST(Request, TakeParamsIsOneShot) {
    Request req(3, "sum", nlohmann::json::array({1, 2}));
    auto params = req.take_params();
    EXPECT_EQ(params, nlohmann::json::array({1, 2}));
    EXPECT_FALSE(req.has_params());

    try {
        (void)req.take_params();
        FAIL() << "expected InvalidParamsError";
    } catch (const InvalidParamsError& e) {
        ASSERT_TRUE(e.data().has_value());
        EXPECT_EQ(*e.data(), "No parameters given");
        EXPECT_EQ(e.id(), 3);
    }
}

TEST(Request, DeserializeTwiceFailsSecondTime) {
    Request req(5, "hello", "world");
    EXPECT_EQ(req.deserialize<std::string>(), "world");

    try {
        (void)req.deserialize<std::string>();
        FAIL() << "expected InvalidParamsError";
    } catch (const InvalidParamsError& e) {
        EXPECT_EQ(e.code(), error::InvalidParams);
        EXPECT_EQ(*e.data(), "No parameters given");
    }
}

TEST(Request, DeserializeWrongShape) {
    Request req(11, "hello", true);
    try {
        (void)req.deserialize<std::string>();
        FAIL() << "expected InvalidParamsError";
    } catch (const InvalidParamsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidParams);
        EXPECT_EQ(e.id(), 11);
        ASSERT_TRUE(e.data().has_value());
        EXPECT_FALSE(e.data()->empty());
    }
    // The failed attempt still consumed the params
    EXPECT_FALSE(req.has_params());
}

TEST(Request, DeserializeUserType) {
    Request req("abc", "move", nlohmann::json{{"x", 3}, {"y", -4}});
    auto p = req.deserialize<Point>();
    EXPECT_EQ(p.x, 3);
    EXPECT_EQ(p.y, -4);
}

TEST(Request, DeserializeUserTypeMissingField) {
    Request req("abc", "move", nlohmann::json{{"x", 3}});
    EXPECT_THROW((void)req.deserialize<Point>(), InvalidParamsError);
}

TEST(Request, Serialize) {
    Request req(1, "tools/list", nlohmann::json{{"cursor", "abc"}});
    nlohmann::json j;
    to_json(j, req);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["method"], "tools/list");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["params"]["cursor"], "abc");
}

TEST(Request, SerializeNotificationOmitsId) {
    auto req = Request::new_notification("notifications/initialized");
    nlohmann::json j;
    to_json(j, req);
    EXPECT_FALSE(j.contains("id"));
    EXPECT_FALSE(j.contains("params"));
}

TEST(Response, ReplyEchoesRequestId) {
    Request req("req-7", "hello");
    auto resp = Response::reply(req, "Hello, world!");
    EXPECT_EQ(resp.id(), "req-7");
    ASSERT_TRUE(resp.result().has_value());
    EXPECT_EQ(*resp.result(), "Hello, world!");
    EXPECT_FALSE(resp.is_error());
}

TEST(Response, WithResult) {
    auto resp = Response::success(42, nlohmann::json{{"ok", true}});
    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 42);
    EXPECT_EQ(j["result"]["ok"], true);
    EXPECT_FALSE(j.contains("error"));
}

TEST(Response, WithError) {
    auto resp = Response::failure(1, RpcError{-32601, "Method not found", std::nullopt});
    nlohmann::json j;
    to_json(j, resp);
    EXPECT_EQ(j["error"]["code"], -32601);
    EXPECT_EQ(j["error"]["message"], "Method not found");
    EXPECT_FALSE(j["error"].contains("data"));
    EXPECT_FALSE(j.contains("result"));
}

TEST(Response, NullResultIsStillAResult) {
    auto resp = Response::success(1, nullptr);
    nlohmann::json j;
    to_json(j, resp);
    ASSERT_TRUE(j.contains("result"));
    EXPECT_TRUE(j["result"].is_null());
}

TEST(Response, FromErrorUsesRequestId) {
    Request req(9, "missing");
    auto resp = Response::from_error(req, MethodNotFoundError(nullptr, "missing"));
    EXPECT_EQ(resp.id(), 9);
    ASSERT_TRUE(resp.error().has_value());
    EXPECT_EQ(resp.error()->code, error::MethodNotFound);
}

TEST(Response, IntoResultMovesPayload) {
    auto resp = Response::success(1, "value");
    auto result = resp.into_result();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, "value");
    EXPECT_FALSE(resp.result().has_value());
}

TEST(Response, IntoError) {
    auto resp = Response::failure(1, RpcError{-32603, "boom", std::nullopt});
    auto err = resp.into_error();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->message, "boom");
    EXPECT_FALSE(resp.is_error());
}

TEST(RpcError, Equality) {
    RpcError e1{-32601, "Not found", std::nullopt};
    RpcError e2{-32601, "Not found", std::nullopt};
    RpcError e3{-32600, "Invalid", std::nullopt};
    RpcError e4{-32601, "Not found", std::string("detail")};
    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
    EXPECT_NE(e1, e4);
}

TEST(RpcError, JsonMapping) {
    RpcError e{-32700, "Parsing failed, invalid JSON data", std::string("EOF")};
    nlohmann::json j = e;
    EXPECT_EQ(j["data"], "EOF");
    EXPECT_EQ(j.get<RpcError>(), e);

    nlohmann::json no_data = {{"code", -32603}, {"message", "x"}};
    auto parsed = no_data.get<RpcError>();
    EXPECT_FALSE(parsed.data.has_value());
}
