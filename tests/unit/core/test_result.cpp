#include <gtest/gtest.h>
#include "psa/core/result.h"
#include <string>

using namespace psa::core;

TEST(ResultTest, SuccessConstruction) {
    auto result = Result<int>::success(42);

    EXPECT_TRUE(result.is_success());
    EXPECT_FALSE(result.is_failure());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, FailureConstruction) {
    auto result = Result<int>::failure(ErrorCode::FILE_NOT_FOUND, "missing");

    EXPECT_FALSE(result.is_success());
    EXPECT_TRUE(result.is_failure());
    EXPECT_EQ(result.error().code, ErrorCode::FILE_NOT_FOUND);
    EXPECT_EQ(result.error().message, "missing");
}

TEST(ResultTest, ValueThrowsOnError) {
    const auto result = Result<int>::failure(ErrorCode::INVALID_ARGUMENT, "bad arg");

    EXPECT_THROW((void)result.value(), std::runtime_error);
}

TEST(ResultTest, ErrorThrowsOnSuccess) {
    const auto result = Result<int>::success(10);

    EXPECT_THROW((void)result.error(), std::runtime_error);
}

TEST(ResultTest, ValueOr) {
    const auto success = Result<int>::success(42);
    const auto failure = Result<int>::failure(ErrorCode::INTERNAL_ERROR, "oops");

    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, MapAndThen) {
    auto mapped = Result<int>::success(10).map([](const int x) { return x * 2; });
    ASSERT_TRUE(mapped.is_success());
    EXPECT_EQ(mapped.value(), 20);

    auto chained = Result<int>::success(3).and_then([](const int x) {
        return x > 5 ? Result<std::string>::success(std::string("big"))
                     : Result<std::string>::failure(ErrorCode::INVALID_ARGUMENT, "small");
    });
    ASSERT_TRUE(chained.is_failure());
    EXPECT_EQ(chained.error().message, "small");
}

TEST(ResultTest, MapPropagatesFailure) {
    auto mapped = Result<int>::failure(ErrorCode::PARSE_ERROR, "invalid")
        .map([](const int x) { return x + 1; });

    ASSERT_TRUE(mapped.is_failure());
    EXPECT_EQ(mapped.error().code, ErrorCode::PARSE_ERROR);
}

TEST(ResultTest, OrElseRecovers) {
    auto recovered = Result<int>::failure(ErrorCode::FILE_READ_ERROR, "unreadable")
        .or_else([](Error) { return Result<int>::success(7); });

    ASSERT_TRUE(recovered.is_success());
    EXPECT_EQ(recovered.value(), 7);

    auto untouched = Result<int>::success(1)
        .or_else([](Error) { return Result<int>::success(7); });
    EXPECT_EQ(untouched.value(), 1);
}

TEST(ResultTest, VoidResult) {
    const auto ok = Ok();
    EXPECT_TRUE(ok.is_success());

    const auto failed = Err(ErrorCode::FILE_WRITE_ERROR, "disk full");
    ASSERT_TRUE(failed.is_failure());
    EXPECT_EQ(failed.error().code, ErrorCode::FILE_WRITE_ERROR);
}

TEST(ErrorTest, SeverityFollowsCode) {
    EXPECT_EQ(make_error(ErrorCode::FILE_PARSE_ERROR, "x").severity, ErrorSeverity::WARNING);
    EXPECT_EQ(make_error(ErrorCode::INTERNAL_ERROR, "x").severity, ErrorSeverity::FATAL);
    EXPECT_EQ(make_error(ErrorCode::INVALID_CONFIG, "x").severity, ErrorSeverity::ERROR);
}

TEST(ErrorTest, ToStringCarriesContext) {
    const auto error = make_error_with_context(ErrorCode::FILE_WRITE_ERROR, "cannot write", "out.json");
    const auto text = error.to_string();

    EXPECT_NE(text.find("File write error"), std::string::npos);
    EXPECT_NE(text.find("cannot write"), std::string::npos);
    EXPECT_NE(text.find("out.json"), std::string::npos);
    EXPECT_FALSE(error.is_fatal());
}

TEST(ErrorTest, ToStringLeadsWithPathAndSeverity) {
    const auto error = make_error_with_context(ErrorCode::FILE_PARSE_ERROR, "syntax error at line 3", "pkg/mod.py");

    EXPECT_EQ(error.to_string(), "pkg/mod.py: warning: Python syntax error: syntax error at line 3");
}

TEST(ErrorTest, ToStringListsHints) {
    const Error error(ErrorCode::INVALID_CONFIG, "unknown cycle mode", {"use dfs or elementary"});

    const auto text = error.to_string();
    EXPECT_EQ(text.rfind("error: Invalid configuration: unknown cycle mode", 0), 0u);
    EXPECT_NE(text.find("\n  hint: use dfs or elementary"), std::string::npos);
    EXPECT_EQ(text.find("raised at"), std::string::npos);
}

TEST(ErrorTest, FatalErrorsShowOrigin) {
    const auto error = make_error(ErrorCode::INTERNAL_ERROR, "broken invariant");

    EXPECT_TRUE(error.is_fatal());
    EXPECT_NE(error.to_string().find("raised at"), std::string::npos);
}
