#include "test_helpers.h"
#include <gtest/gtest.h>
#include <codectx/core/context.h>
#include <codectx/core/panic_handler.h>

#include <stdexcept>
#include <thread>

using namespace codectx;
using namespace codectx::core;
using namespace codectx::test;

class PanicHandlerTest : public CodectxTest {
protected:
    void SetUp() override {
        CodectxTest::SetUp();
        handler = std::make_unique<PanicHandler>(logger);
    }

    std::unique_ptr<PanicHandler> handler;
};

TEST_F(PanicHandlerTest, GuardPassesThroughSuccess) {
    int calls = 0;
    auto result = handler->guard(ParseContext{}, "noop", [&] { ++calls; });
    EXPECT_TRUE(result);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(logger->records().empty());
}

TEST_F(PanicHandlerTest, ExceptionBecomesPanicRecovered) {
    auto ctx = ParseContext{}.withFile("lib/main.dart", "dart").withRequestId("req-7");
    auto result =
        handler->guard(ctx, "extract_classes", [] { throw std::runtime_error("boom"); });

    ASSERT_FALSE(result);
    const auto& err = result.error();
    EXPECT_EQ(err.code, ErrorCode::PanicRecovered);
    EXPECT_EQ(err.operation, "extract_classes");
    EXPECT_EQ(err.filePath, "lib/main.dart");
    EXPECT_EQ(err.language, "dart");
    EXPECT_NE(err.message.find("boom"), std::string::npos);
    EXPECT_FALSE(err.stack.empty());
    EXPECT_TRUE(logger->has("error", "panic recovered"));
}

TEST_F(PanicHandlerTest, NonStandardExceptionIsRecovered) {
    auto result = handler->guardResult<int>(ParseContext{}, "walk", []() -> Result<int> {
        throw 17;
    });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::PanicRecovered);
    EXPECT_NE(result.error().message.find("unknown exception"), std::string::npos);
}

TEST_F(PanicHandlerTest, GuardResultForwardsErrors) {
    auto result = handler->guardResult<int>(ParseContext{}, "walk", []() -> Result<int> {
        return Error{ErrorCode::Ast, "nil node"};
    });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Ast);
    EXPECT_TRUE(logger->records().empty());
}

TEST(ParseContextTest, CancellationFromStopTokenAndDeadline) {
    std::stop_source source;
    auto ctx = ParseContext{}.withStopToken(source.get_token());
    EXPECT_FALSE(ctx.isCancelled());
    source.request_stop();
    EXPECT_TRUE(ctx.isCancelled());

    auto expired = ParseContext{}.withDeadline(ParseContext::Clock::now() -
                                               std::chrono::milliseconds(1));
    EXPECT_TRUE(expired.isCancelled());
    EXPECT_FALSE(ParseContext{}.isCancelled());
}

TEST(ParseContextTest, WithFileKeepsOtherKeys) {
    auto ctx = ParseContext{}.withRequestId("r1").withFile("a.swift", "swift");
    EXPECT_EQ(ctx.requestId().value_or(""), "r1");
    EXPECT_EQ(ctx.filePath().value_or(""), "a.swift");
    EXPECT_EQ(ctx.language().value_or(""), "swift");
}
