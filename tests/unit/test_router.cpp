#include <gtest/gtest.h>
#include "twosum/router.hpp"
#include "twosum/error.hpp"
#include <string>

using namespace twosum;

namespace {

JsonRpcRequest make_request(RequestId id, const std::string& method) {
    JsonRpcRequest req;
    req.id = std::move(id);
    req.method = method;
    return req;
}

} // namespace

TEST(Router, DispatchKnownRequest) {
    Router router;
    bool called = false;
    router.on_request("tools/list", [&called](const nlohmann::json&) -> HandlerResult {
        called = true;
        return nlohmann::json{{"tools", nlohmann::json::array()}};
    });

    auto resp = router.dispatch(make_request(int64_t{1}, "tools/list"));
    EXPECT_TRUE(called);
    EXPECT_FALSE(resp.error.has_value());
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_TRUE(resp.result->contains("tools"));
}

TEST(Router, DispatchUnknownMethod) {
    Router router;

    auto resp = router.dispatch(make_request(int64_t{1}, "unknown/method"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
    EXPECT_NE(resp.error->message.find("unknown/method"), std::string::npos);
    EXPECT_FALSE(resp.result.has_value());
}

TEST(Router, UnknownMethodEchoesStringId) {
    Router router;
    auto resp = router.dispatch(make_request(std::string{"abc"}, "nope"));
    ASSERT_TRUE(resp.id.has_value());
    EXPECT_EQ(std::get<std::string>(*resp.id), "abc");
}

TEST(Router, RequestWithoutIdStillAnswered) {
    Router router;
    JsonRpcRequest req;
    req.method = "nope";

    auto resp = router.dispatch(req);
    EXPECT_FALSE(resp.id.has_value());
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::MethodNotFound);
}

TEST(Router, AbsentParamsArriveAsNull) {
    Router router;
    nlohmann::json seen = "untouched";
    router.on_request("probe", [&seen](const nlohmann::json& params) -> HandlerResult {
        seen = params;
        return nlohmann::json::object();
    });

    (void)router.dispatch(make_request(int64_t{1}, "probe"));
    EXPECT_TRUE(seen.is_null());
}

TEST(Router, ParamsPassedThrough) {
    Router router;
    nlohmann::json seen;
    router.on_request("probe", [&seen](const nlohmann::json& params) -> HandlerResult {
        seen = params;
        return nlohmann::json::object();
    });

    auto req = make_request(int64_t{1}, "probe");
    req.params = nlohmann::json{{"k", "v"}};
    (void)router.dispatch(req);
    EXPECT_EQ(seen["k"], "v");
}

TEST(Router, HandlerThrowsMcpProtocolError) {
    Router router;
    router.on_request("fail", [](const nlohmann::json&) -> HandlerResult {
        throw McpProtocolError(error::InvalidParams, "Bad params");
    });

    auto resp = router.dispatch(make_request(int64_t{1}, "fail"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_EQ(resp.error->message, "Bad params");
}

TEST(Router, HandlerThrowsStdException) {
    Router router;
    router.on_request("fail", [](const nlohmann::json&) -> HandlerResult {
        throw std::runtime_error("internal failure");
    });

    auto resp = router.dispatch(make_request(int64_t{9}, "fail"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InternalError);
    EXPECT_EQ(std::get<int64_t>(*resp.id), 9);
}

TEST(Router, HandlerReturnsError) {
    Router router;
    router.on_request("fail", [](const nlohmann::json&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "Missing required field", std::nullopt};
    });

    auto resp = router.dispatch(make_request(int64_t{1}, "fail"));
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code, error::InvalidParams);
    EXPECT_FALSE(resp.result.has_value());
}

TEST(Router, LaterRegistrationReplacesEarlier) {
    Router router;
    router.on_request("m", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"v", 1}};
    });
    router.on_request("m", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json{{"v", 2}};
    });

    auto resp = router.dispatch(make_request(int64_t{1}, "m"));
    EXPECT_EQ((*resp.result)["v"], 2);
}
