#include "errors/errors.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace hwenergy::errors;

TEST(ErrorsTest, DefaultErrorIsOk) {
    Error error;
    EXPECT_TRUE(error.ok());
    EXPECT_EQ(error.code, ErrorCode::OK);
}

TEST(ErrorsTest, OnlyTimeoutAndTransportAreRetryable) {
    EXPECT_TRUE(is_retryable(ErrorCode::TIMEOUT));
    EXPECT_TRUE(is_retryable(ErrorCode::TRANSPORT_ERROR));
    EXPECT_FALSE(is_retryable(ErrorCode::API_DISABLED));
    EXPECT_FALSE(is_retryable(ErrorCode::UNEXPECTED_STATUS));
    EXPECT_FALSE(is_retryable(ErrorCode::UNSUPPORTED));
    EXPECT_FALSE(is_retryable(ErrorCode::UNSUPPORTED_API_VERSION));
    EXPECT_FALSE(is_retryable(ErrorCode::INVALID_ARGUMENT));
}

TEST(ErrorsTest, FactoriesCarryTheirContext) {
    auto transport = Error::transport("connect failed", "Connection refused");
    EXPECT_EQ(transport.code, ErrorCode::TRANSPORT_ERROR);
    EXPECT_EQ(transport.cause, "Connection refused");

    auto disabled = Error::api_disabled();
    EXPECT_EQ(disabled.code, ErrorCode::API_DISABLED);
    EXPECT_EQ(disabled.http_status, 403);

    auto status = Error::unexpected_status(500);
    EXPECT_EQ(status.code, ErrorCode::UNEXPECTED_STATUS);
    EXPECT_EQ(status.http_status, 500);

    auto unsupported = Error::unsupported("identify", "Identify is not supported");
    EXPECT_EQ(unsupported.operation, "identify");

    auto version = Error::unsupported_api_version("1", "2");
    EXPECT_EQ(version.expected, "1");
    EXPECT_EQ(version.actual, "2");

    auto invalid = Error::invalid_argument("aad", "too short", std::string("prefix it"));
    EXPECT_EQ(invalid.field, "aad");
    ASSERT_TRUE(invalid.hint.has_value());
    EXPECT_EQ(*invalid.hint, "prefix it");
}

TEST(ErrorsTest, ToStringIncludesCodeMessageCauseAndHint) {
    auto error = Error::transport("Error occurred", "Connection refused");
    EXPECT_EQ(error.to_string(), "TRANSPORT_ERROR: Error occurred (Connection refused)");

    auto invalid = Error::invalid_argument("aad", "bad length", std::string("try 30"));
    EXPECT_EQ(invalid.to_string(), "INVALID_ARGUMENT: bad length [try 30]");
}

TEST(ErrorsTest, ErrorToJsonOmitsEmptyContext) {
    auto j = error_to_json(Error::unexpected_status(404));
    EXPECT_EQ(j["code"], "UNEXPECTED_STATUS");
    EXPECT_EQ(j["http_status"], 404);
    EXPECT_FALSE(j.contains("cause"));
    EXPECT_FALSE(j.contains("hint"));
    EXPECT_FALSE(j.contains("field"));
}

TEST(ErrorsTest, ResultStates) {
    auto success = Result<int>::success(7);
    EXPECT_TRUE(success.ok());
    ASSERT_TRUE(success.value.has_value());
    EXPECT_EQ(*success.value, 7);

    auto empty = Result<int>::not_applicable();
    EXPECT_TRUE(empty.ok());
    EXPECT_FALSE(empty.value.has_value());

    auto failure = Result<int>::failure(Error::timeout("slow"));
    EXPECT_FALSE(failure.ok());
    EXPECT_FALSE(failure.value.has_value());
    EXPECT_EQ(failure.error.code, ErrorCode::TIMEOUT);
}
