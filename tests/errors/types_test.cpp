#include "scanguard/errors/types.hpp"

#include <gtest/gtest.h>

#include <string>
#include <system_error>

using namespace scanguard::errors;

TEST(ErrorTypesTest, StringFormsParseBack) {
    for (auto type : all_source_types()) {
        EXPECT_EQ(parse_source_type(to_string(type)), type);
    }
    for (auto type : all_error_types()) {
        EXPECT_EQ(parse_error_type(to_string(type)), type);
    }
    EXPECT_EQ(parse_severity("critical"), Severity::Critical);
    EXPECT_EQ(parse_retry_strategy("linear"), RetryStrategy::Linear);
}

TEST(ErrorTypesTest, ParsingIsCaseInsensitiveAndRejectsUnknown) {
    EXPECT_EQ(parse_source_type("WebDAV"), SourceType::WebDAV);
    EXPECT_EQ(parse_error_type("PERMISSION_DENIED"), SourceErrorType::PermissionDenied);
    EXPECT_FALSE(parse_source_type("ftp").has_value());
    EXPECT_FALSE(parse_severity("urgent").has_value());
    EXPECT_FALSE(parse_retry_strategy("").has_value());
}

TEST(ErrorTypesTest, PersistedNames) {
    EXPECT_STREQ(to_string(SourceType::GDrive), "gdrive");
    EXPECT_STREQ(to_string(SourceErrorType::XmlParseError), "xml_parse_error");
    EXPECT_STREQ(to_string(Severity::High), "high");
    EXPECT_STREQ(to_string(RetryStrategy::Exponential), "exponential");
}

TEST(ErrorTypesTest, SeverityIsOrdered) {
    EXPECT_LT(Severity::Low, Severity::Medium);
    EXPECT_LT(Severity::Medium, Severity::High);
    EXPECT_LT(Severity::High, Severity::Critical);
}

TEST(SourceErrorTest, DescribeAppendsStatusOnce) {
    EXPECT_EQ(SourceError::from_http(404, "Not Found").describe(), "Not Found (HTTP 404)");
    EXPECT_EQ(SourceError::from_http(404, "HTTP 404 Not Found").describe(), "HTTP 404 Not Found");
    EXPECT_EQ(SourceError("plain").describe(), "plain");
}

TEST(SourceErrorTest, FromErrorCodeKeepsPathAndErrno) {
    const auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    const auto error = SourceError::from_error_code(ec, "/data/missing");

    EXPECT_EQ(error.message, ec.message() + ": /data/missing");
    ASSERT_TRUE(error.os_error.has_value());
    EXPECT_EQ(*error.os_error, ec.value());
    EXPECT_EQ(error.describe(), error.message + " (os error " + std::to_string(ec.value()) + ")");
}

TEST(ErrorClassificationTest, EqualityComparesEveryField) {
    ErrorClassification a;
    a.error_type = SourceErrorType::Timeout;
    a.diagnostic_data = {{"operation", "list"}};
    ErrorClassification b = a;
    EXPECT_EQ(a, b);

    b.retry_delay_seconds = a.retry_delay_seconds + 1;
    EXPECT_NE(a, b);

    b = a;
    b.diagnostic_data["operation"] = "stat";
    EXPECT_NE(a, b);
}
