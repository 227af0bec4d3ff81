#include "test_helpers.h"
#include <gtest/gtest.h>
#include <codectx/core/logger.h>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include <sstream>

using namespace codectx;
using namespace codectx::core;

class SpdlogLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(output);
        sink->set_pattern("%l %v");
        backend = std::make_shared<spdlog::logger>("codectx_test", sink);
        backend->set_level(spdlog::level::trace);
        logger = std::make_unique<SpdlogLogger>(backend);
    }

    std::ostringstream output;
    std::shared_ptr<spdlog::logger> backend;
    std::unique_ptr<SpdlogLogger> logger;
};

TEST_F(SpdlogLoggerTest, FieldsRenderedAsKeyValuePairs) {
    logger->info("parser manager initialized",
                 {{"languages_count", 3}, {"cache_enabled", true}, {"mode", "full"}});
    backend->flush();
    EXPECT_NE(output.str().find("parser manager initialized languages_count=3 cache_enabled=true "
                                "mode=full"),
              std::string::npos);
}

TEST_F(SpdlogLoggerTest, ErrorIncludesRenderedError) {
    logger->error("step failed", Error{ErrorCode::Parsing, "bad input"}.withOperation("cpp.parse"),
                  {{"file_path", "a.cpp"}});
    backend->flush();
    EXPECT_NE(output.str().find("step failed: cpp.parse: parsing: bad input file_path=a.cpp"),
              std::string::npos);
}

TEST_F(SpdlogLoggerTest, LevelFiltersOutput) {
    logger->setLevel("warn");
    logger->debug("hidden");
    logger->info("hidden too");
    logger->warn("shown");
    backend->flush();
    EXPECT_EQ(output.str().find("hidden"), std::string::npos);
    EXPECT_NE(output.str().find("shown"), std::string::npos);
}

TEST_F(SpdlogLoggerTest, LevelNamesFollowSpdlog) {
    logger->setLevel("warning");
    EXPECT_EQ(backend->level(), spdlog::level::warn);
    logger->setLevel("critical");
    EXPECT_EQ(backend->level(), spdlog::level::critical);
    logger->setLevel("trace");
    EXPECT_EQ(backend->level(), spdlog::level::trace);
    logger->setLevel("off");
    EXPECT_EQ(backend->level(), spdlog::level::off);
}

TEST_F(SpdlogLoggerTest, UnknownLevelLeavesLevelUnchanged) {
    logger->setLevel("error");
    logger->setLevel("verbose");
    EXPECT_EQ(backend->level(), spdlog::level::err);
}

TEST(NullLoggerTest, SharedInstanceAcceptsEverything) {
    auto a = makeNullLogger();
    auto b = makeNullLogger();
    EXPECT_EQ(a, b);
    a->debug("x");
    a->error("y", std::nullopt, {{"k", 1}});
}

TEST(FormatFieldsTest, StringsAreNotQuoted) {
    EXPECT_EQ(formatFields({{"path", "a/b.cpp"}, {"count", 2}}), "path=a/b.cpp count=2");
    EXPECT_EQ(formatFields({}), "");
}
