#include <gtest/gtest.h>
#include <codectx/core/types.h>

#include <fmt/format.h>

using namespace codectx;

TEST(ErrorTest, ToStringIncludesOperationKindAndFile) {
    auto err = Error{ErrorCode::Validation, "content is empty"}
                   .withOperation("cpp.parse")
                   .withFile("src/a.cpp", "cpp");
    EXPECT_EQ(err.toString(), "cpp.parse: validation: content is empty (path=src/a.cpp, language=cpp)");
}

TEST(ErrorTest, CauseChainIsRenderedAndWalked) {
    auto inner = Error{ErrorCode::Config, "invalid integer value 'abc'"};
    auto outer = Error{ErrorCode::Config, "invalid value for 'cache.max_size'"}.causedBy(inner);

    EXPECT_EQ(outer.rootCause().message, "invalid integer value 'abc'");
    EXPECT_NE(outer.toString().find(": config: invalid integer value 'abc'"), std::string::npos);
}

TEST(ErrorTest, StableKindTags) {
    EXPECT_STREQ(errorToString(ErrorCode::InvalidFilePath), "invalid_file_path");
    EXPECT_STREQ(errorToString(ErrorCode::UnsupportedLanguage), "unsupported_language");
    EXPECT_STREQ(errorToString(ErrorCode::PanicRecovered), "panic_recovered");
    EXPECT_EQ(fmt::format("{}", ErrorCode::Parsing), "parsing");
}

TEST(ResultTest, ValueAndErrorAccess) {
    Result<int> ok = 42;
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);
    EXPECT_THROW(ok.error(), std::runtime_error);

    Result<int> failed = Error{ErrorCode::NotFound, "missing"};
    ASSERT_FALSE(failed);
    EXPECT_EQ(failed.error().code, ErrorCode::NotFound);
    EXPECT_THROW(failed.value(), std::runtime_error);
}

TEST(ResultTest, VoidSpecialization) {
    Result<void> ok;
    EXPECT_TRUE(ok);

    Result<void> failed = Error{ErrorCode::Cache, "full"};
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error(), ErrorCode::Cache);
}
