#include <gtest/gtest.h>
#include "streamrpc/router.hpp"
#include "streamrpc/error.hpp"
#include <string>

using namespace streamrpc;

namespace {

CallContext make_ctx() {
    auto record = std::make_shared<CallRecord>("s", RequestId{int64_t{1}}, Clock::now());
    return CallContext(record);
}

std::vector<nlohmann::json> drain(FragmentSource& source) {
    std::vector<nlohmann::json> out;
    while (auto f = source.next()) out.push_back(*f);
    return out;
}

} // namespace

TEST(Router, InvokeCallHandler) {
    Router router;
    router.on_call("echo", [](const nlohmann::json& params, CallContext&) -> HandlerResult {
        return params.at("text");
    });
    auto ctx = make_ctx();
    auto result = router.invoke("echo", {{"text", "hi"}}, ctx);
    ASSERT_TRUE(std::holds_alternative<nlohmann::json>(result));
    EXPECT_EQ(std::get<nlohmann::json>(result), "hi");
}

TEST(Router, InvokeUnknownMethod) {
    Router router;
    auto ctx = make_ctx();
    auto result = router.invoke("missing", nlohmann::json::object(), ctx);
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(result));
    EXPECT_EQ(std::get<JsonRpcError>(result).code, error::MethodNotFound);
}

TEST(Router, HandlerExceptionsBecomeErrors) {
    Router router;
    router.on_call("typed", [](const nlohmann::json&, CallContext&) -> HandlerResult {
        throw HandlerFailure("bad input", error::InvalidParams, nlohmann::json{{"field", "text"}});
    });
    router.on_call("untyped", [](const nlohmann::json&, CallContext&) -> HandlerResult {
        throw std::runtime_error("kaboom");
    });
    auto ctx = make_ctx();

    auto typed = router.invoke("typed", nlohmann::json::object(), ctx);
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(typed));
    EXPECT_EQ(std::get<JsonRpcError>(typed).code, error::InvalidParams);
    EXPECT_EQ((*std::get<JsonRpcError>(typed).data)["field"], "text");

    auto untyped = router.invoke("untyped", nlohmann::json::object(), ctx);
    ASSERT_TRUE(std::holds_alternative<JsonRpcError>(untyped));
    EXPECT_EQ(std::get<JsonRpcError>(untyped).code, error::HandlerFailed);
    EXPECT_EQ(std::get<JsonRpcError>(untyped).message, "kaboom");
}

TEST(Router, InvokeDrainsStreamOnlyMethod) {
    Router router;
    router.on_stream("letters", [](const nlohmann::json&, CallContext&) {
        return std::make_unique<VectorSource>(std::vector<nlohmann::json>{"h", "i"});
    });
    router.on_stream("numbers", [](const nlohmann::json&, CallContext&) {
        return std::make_unique<VectorSource>(std::vector<nlohmann::json>{1, 2});
    });
    auto ctx = make_ctx();

    EXPECT_EQ(std::get<nlohmann::json>(router.invoke("letters", {}, ctx)), "hi");
    EXPECT_EQ(std::get<nlohmann::json>(router.invoke("numbers", {}, ctx)),
              nlohmann::json::array({1, 2}));
}

TEST(Router, OpenStreamPrefersStreamHandler) {
    Router router;
    router.on_call("echo", [](const nlohmann::json&, CallContext&) -> HandlerResult {
        return "whole";
    });
    router.on_stream("echo", [](const nlohmann::json&, CallContext&) {
        return std::make_unique<VectorSource>(std::vector<nlohmann::json>{"pi", "ece"});
    });
    auto ctx = make_ctx();
    auto source = router.open_stream("echo", {}, ctx);
    EXPECT_EQ(drain(*source), (std::vector<nlohmann::json>{"pi", "ece"}));
    EXPECT_EQ(std::get<nlohmann::json>(router.invoke("echo", {}, ctx)), "whole");
}

TEST(Router, OpenStreamWrapsCallOnlyMethod) {
    Router router;
    router.on_call("greeting", [](const nlohmann::json&, CallContext&) -> HandlerResult {
        return "Hello!";
    });
    auto ctx = make_ctx();
    auto source = router.open_stream("greeting", {}, ctx);
    EXPECT_EQ(drain(*source), (std::vector<nlohmann::json>{"Hello!"}));
}

TEST(Router, OpenStreamFailures) {
    Router router;
    router.on_call("fails", [](const nlohmann::json&, CallContext&) -> HandlerResult {
        return JsonRpcError{error::InvalidParams, "nope", std::nullopt};
    });
    auto ctx = make_ctx();
    try {
        (void)router.open_stream("missing", {}, ctx);
        FAIL() << "expected HandlerFailure";
    } catch (const HandlerFailure& e) {
        EXPECT_EQ(e.code, error::MethodNotFound);
    }
    try {
        (void)router.open_stream("fails", {}, ctx);
        FAIL() << "expected HandlerFailure";
    } catch (const HandlerFailure& e) {
        EXPECT_EQ(e.code, error::InvalidParams);
    }
}

TEST(Router, RegistryQueries) {
    Router router;
    router.on_call("a", [](const nlohmann::json&, CallContext&) -> HandlerResult { return 1; });
    router.on_stream("b", [](const nlohmann::json&, CallContext&) {
        return std::make_unique<VectorSource>(std::vector<nlohmann::json>{});
    });
    EXPECT_TRUE(router.has_handler("a"));
    EXPECT_FALSE(router.has_stream_handler("a"));
    EXPECT_TRUE(router.has_stream_handler("b"));
    EXPECT_EQ(router.methods().size(), 2u);

    router.remove("a");
    EXPECT_FALSE(router.has_handler("a"));
    EXPECT_FALSE(router.find("a").has_value());
}

TEST(Router, HandlerSeesCallContext) {
    Router router;
    router.on_call("whoami", [](const nlohmann::json&, CallContext& ctx) -> HandlerResult {
        return nlohmann::json{{"session", ctx.session_id()}, {"cancelled", ctx.cancelled()}};
    });
    auto ctx = make_ctx();
    auto result = std::get<nlohmann::json>(router.invoke("whoami", {}, ctx));
    EXPECT_EQ(result["session"], "s");
    EXPECT_EQ(result["cancelled"], false);
}
