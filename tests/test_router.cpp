#include <memory>
#include <vector>
#include <gtest/gtest.h>
#include "ipc/handlers.hpp"
#include "ipc/router.hpp"
#include "kernel/context.hpp"
#include "kernel/error.hpp"
#include "kernel/kernel.hpp"

using namespace helm::ipc;
using json = nlohmann::json;
namespace kernel = helm::kernel;

namespace {

Frame request(const json& message) {
    return Frame(MessageType::REQUEST, json::to_msgpack(message));
}

Frame call(const Router& router, const std::string& service, const std::string& method,
           const json& body, const json& id = 1) {
    return router.handle(request({{"id", id}, {"service", service}, {"method", method}, {"body", body}}));
}

json decode(const Frame& frame) {
    return json::from_msgpack(frame.payload);
}

} // namespace

// ============================================================================
// Dispatch and error mapping
// ============================================================================

TEST(RouterTest, DispatchesToRegisteredHandler) {
    Router router;
    router.register_handler("echo", "Say", [](const json& body) {
        return json{{"said", body.at("text")}};
    });

    auto frame = call(router, "echo", "Say", {{"text", "hi"}}, 42);
    EXPECT_EQ(frame.type, MessageType::RESPONSE);

    auto reply = decode(frame);
    EXPECT_EQ(reply["id"], 42);
    EXPECT_TRUE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["body"]["said"], "hi");
}

TEST(RouterTest, StringIdsAreEchoed) {
    Router router;
    router.register_handler("echo", "Ping", [](const json&) { return json::object(); });

    auto reply = decode(call(router, "echo", "Ping", json::object(), "req-7"));
    EXPECT_EQ(reply["id"], "req-7");
}

TEST(RouterTest, UnknownMethodIsNotFound) {
    Router router;
    auto frame = call(router, "kernel", "Nope", json::object(), 3);
    EXPECT_EQ(frame.type, MessageType::ERROR);

    auto reply = decode(frame);
    EXPECT_EQ(reply["id"], 3);
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"]["code"], "NOT_FOUND");
    EXPECT_EQ(reply["error"]["message"], "method not found: kernel.Nope");
}

TEST(RouterTest, KernelErrorsKeepTheirCode) {
    Router router;
    router.register_handler("svc", "Validate", [](const json&) -> json {
        throw kernel::validation_error("name is required");
    });
    router.register_handler("svc", "Quota", [](const json&) -> json {
        throw kernel::quota_error("too many calls");
    });

    auto invalid = decode(call(router, "svc", "Validate", json::object()));
    EXPECT_EQ(invalid["error"]["code"], "INVALID_ARGUMENT");
    EXPECT_EQ(invalid["error"]["message"], "name is required");

    auto quota = decode(call(router, "svc", "Quota", json::object()));
    EXPECT_EQ(quota["error"]["code"], "RESOURCE_EXHAUSTED");
}

TEST(RouterTest, MistypedBodyIsInvalidArgument) {
    Router router;
    router.register_handler("svc", "Count", [](const json& body) {
        return json{{"n", body.at("n").get<int>() + 1}};
    });

    auto reply = decode(call(router, "svc", "Count", {{"n", "three"}}));
    EXPECT_EQ(reply["error"]["code"], "INVALID_ARGUMENT");
}

TEST(RouterTest, OtherExceptionsAreInternal) {
    Router router;
    router.register_handler("svc", "Boom", [](const json&) -> json {
        throw std::runtime_error("boom");
    });

    auto reply = decode(call(router, "svc", "Boom", json::object()));
    EXPECT_EQ(reply["error"]["code"], "INTERNAL");
    EXPECT_EQ(reply["error"]["message"], "boom");
}

TEST(RouterTest, NullBodyBecomesEmptyObject) {
    Router router;
    router.register_handler("svc", "Inspect", [](const json& body) {
        return json{{"is_object", body.is_object()}, {"size", body.size()}};
    });

    auto with_null = decode(call(router, "svc", "Inspect", nullptr));
    EXPECT_TRUE(with_null["body"]["is_object"].get<bool>());
    EXPECT_EQ(with_null["body"]["size"], 0);

    auto without = decode(router.handle(request({{"id", 1}, {"service", "svc"}, {"method", "Inspect"}})));
    EXPECT_TRUE(without["body"]["is_object"].get<bool>());
}

TEST(RouterTest, RejectsNonRequestFrames) {
    Router router;
    auto frame = router.handle(Frame(MessageType::RESPONSE, json::to_msgpack(json{{"id", 1}})));
    EXPECT_EQ(frame.type, MessageType::ERROR);

    auto reply = decode(frame);
    EXPECT_TRUE(reply["id"].is_null());
    EXPECT_EQ(reply["error"]["code"], "INVALID_ARGUMENT");
}

TEST(RouterTest, RejectsMalformedPayloads) {
    Router router;

    // 0xc1 is never used in MessagePack
    auto garbage = decode(router.handle(Frame(MessageType::REQUEST, {0xc1, 0x00})));
    EXPECT_TRUE(garbage["id"].is_null());
    EXPECT_EQ(garbage["error"]["code"], "INVALID_ARGUMENT");

    auto not_map = decode(router.handle(request(json::array({1, 2, 3}))));
    EXPECT_EQ(not_map["error"]["code"], "INVALID_ARGUMENT");
    EXPECT_EQ(not_map["error"]["message"], "request must be a map");

    auto no_method = decode(router.handle(request({{"id", 9}, {"service", "kernel"}})));
    EXPECT_EQ(no_method["id"], 9);
    EXPECT_EQ(no_method["error"]["code"], "INVALID_ARGUMENT");
}

TEST(RouterTest, ListsRegisteredMethods) {
    Router router;
    router.register_handler("b", "Two", [](const json&) { return json::object(); });
    router.register_handler("a", "One", [](const json&) { return json::object(); });

    EXPECT_TRUE(router.has_handler("a", "One"));
    EXPECT_FALSE(router.has_handler("a", "Two"));

    auto methods = router.methods();
    ASSERT_EQ(methods.size(), 2u);
    EXPECT_EQ(methods[0].first, "a");
    EXPECT_EQ(methods[1].first, "b");
}

// ============================================================================
// Registered services against a live kernel
// ============================================================================

class ServicesTest : public ::testing::Test {
protected:
    ServicesTest() : kernel_(relaxed()), context_{config_, kernel_} {
        register_all(router_, context_, modules_);
    }

    static kernel::KernelConfig relaxed() {
        kernel::KernelConfig config;
        config.rate_limit = kernel::RateLimitConfig{1000, 10000, 1000};
        return config;
    }

    json ok_body(const std::string& service, const std::string& method, const json& body) {
        auto reply = decode(call(router_, service, method, body));
        EXPECT_TRUE(reply["ok"].get<bool>()) << reply.dump();
        return reply["body"];
    }

    std::string error_code(const std::string& service, const std::string& method, const json& body) {
        auto reply = decode(call(router_, service, method, body));
        EXPECT_FALSE(reply["ok"].get<bool>()) << reply.dump();
        return reply["error"]["code"].get<std::string>();
    }

    kernel::KernelConfig config_;
    kernel::Kernel kernel_;
    kernel::KernelContext context_;
    Router router_;
    std::vector<std::unique_ptr<ServiceModule>> modules_;
};

TEST_F(ServicesTest, RegistersAllFourServices) {
    EXPECT_TRUE(router_.has_handler("kernel", "CreateProcess"));
    EXPECT_TRUE(router_.has_handler("kernel", "GetSystemStatus"));
    EXPECT_TRUE(router_.has_handler("engine", "ExecutePipeline"));
    EXPECT_TRUE(router_.has_handler("engine", "CloneEnvelope"));
    EXPECT_TRUE(router_.has_handler("orchestration", "InitializeSession"));
    EXPECT_TRUE(router_.has_handler("orchestration", "ReportAgentResult"));
    EXPECT_TRUE(router_.has_handler("interrupt", "GetPendingForSession"));
    EXPECT_EQ(router_.methods().size(), 27u);
    EXPECT_EQ(modules_.size(), 4u);
}

TEST_F(ServicesTest, CreateAndGetProcess) {
    auto created = ok_body("kernel", "CreateProcess",
        {{"pid", "p1"}, {"user_id", "alice"}, {"priority", "HIGH"}});
    EXPECT_EQ(created["pid"], "p1");
    EXPECT_EQ(created["state"], "READY");
    EXPECT_EQ(created["priority"], "HIGH");

    auto fetched = ok_body("kernel", "GetProcess", {{"pid", "p1"}});
    EXPECT_EQ(fetched["user_id"], "alice");
    EXPECT_EQ(fetched["state"], "READY");
}

TEST_F(ServicesTest, BodyErrorsMapToCodes) {
    EXPECT_EQ(error_code("kernel", "CreateProcess", {{"user_id", "alice"}}), "INVALID_ARGUMENT");
    EXPECT_EQ(error_code("kernel", "CreateProcess", {{"pid", 17}}), "INVALID_ARGUMENT");
    EXPECT_EQ(error_code("kernel", "CreateProcess", {{"pid", "p1"}, {"priority", "URGENT"}}),
              "INVALID_ARGUMENT");
    EXPECT_EQ(error_code("kernel", "GetProcess", {{"pid", "missing"}}), "NOT_FOUND");
}

TEST_F(ServicesTest, InvalidTransitionIsFailedPrecondition) {
    ok_body("kernel", "CreateProcess", {{"pid", "p1"}, {"user_id", "alice"}});
    ok_body("kernel", "TerminateProcess", {{"pid", "p1"}});

    EXPECT_EQ(error_code("kernel", "TransitionState", {{"pid", "p1"}, {"state", "RUNNING"}}),
              "FAILED_PRECONDITION");
}

TEST_F(ServicesTest, OrchestratesASessionOverTheWire) {
    ok_body("kernel", "CreateProcess", {{"pid", "p1"}, {"user_id", "alice"}, {"session_id", "s1"}});

    json pipeline = {
        {"name", "qa"},
        {"stages", json::array({
            {{"name", "answer"}, {"output_key", "answer"}, {"default_next", "end"}, {"has_llm", true}}
        })}
    };
    auto state = ok_body("orchestration", "InitializeSession",
        {{"pid", "p1"}, {"pipeline", pipeline}, {"envelope", {{"raw_input", "hello"}}}});
    EXPECT_EQ(state["pipeline"], "qa");
    EXPECT_EQ(state["current_stage"], "answer");

    auto next = ok_body("orchestration", "GetNextInstruction", {{"pid", "p1"}});
    EXPECT_EQ(next["kind"], "EXECUTE");
    EXPECT_EQ(next["agent_name"], "answer");

    ok_body("orchestration", "ReportAgentResult", {
        {"pid", "p1"},
        {"agent_name", "answer"},
        {"success", true},
        {"output", {{"text", "hi there"}}},
        {"metrics", {{"llm_calls", 1}, {"tokens_in", 10}, {"tokens_out", 5}}}
    });

    auto done = ok_body("orchestration", "GetNextInstruction", {{"pid", "p1"}});
    EXPECT_EQ(done["kind"], "TERMINATE");
    EXPECT_EQ(done["terminal_reason"], "completed");

    auto process = ok_body("kernel", "GetProcess", {{"pid", "p1"}});
    EXPECT_EQ(process["state"], "TERMINATED");
}

TEST_F(ServicesTest, ReportRejectsNegativeMetrics) {
    ok_body("kernel", "CreateProcess", {{"pid", "p1"}, {"user_id", "alice"}});
    json pipeline = {
        {"name", "qa"},
        {"stages", json::array({{{"name", "answer"}, {"default_next", "end"}}})}
    };
    ok_body("orchestration", "InitializeSession", {{"pid", "p1"}, {"pipeline", pipeline}});

    EXPECT_EQ(error_code("orchestration", "ReportAgentResult",
                         {{"pid", "p1"}, {"agent_name", "answer"}, {"metrics", {{"llm_calls", -1}}}}),
              "INVALID_ARGUMENT");
}

TEST_F(ServicesTest, SessionMethodsNeedPipeline) {
    ok_body("kernel", "CreateProcess", {{"pid", "p1"}, {"user_id", "alice"}});
    EXPECT_EQ(error_code("orchestration", "InitializeSession", {{"pid", "p1"}}), "INVALID_ARGUMENT");
    EXPECT_EQ(error_code("orchestration", "GetNextInstruction", {{"pid", "p1"}}), "NOT_FOUND");
}
