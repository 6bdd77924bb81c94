#include <gtest/gtest.h>
#include "resilience/error_classifier.hpp"
#include "resilience/error_types.hpp"
#include <filesystem>
#include <new>
#include <stdexcept>
#include <system_error>

using namespace warden::resilience;

class ErrorClassifierTest : public ::testing::Test {
protected:
    static ErrorClassifier::Classification classify(const std::string& message) {
        return ErrorClassifier::classify(std::runtime_error(message));
    }
};

TEST_F(ErrorClassifierTest, KeywordTable) {
    struct Case {
        const char* message;
        ErrorCategory category;
        ErrorSeverity severity;
        DegradationStrategy strategy;
        bool retryable;
    };

    const Case cases[] = {
        {"Validation failed for field path", ErrorCategory::VALIDATION, ErrorSeverity::MEDIUM, DegradationStrategy::FAIL, false},
        {"invalid project root", ErrorCategory::VALIDATION, ErrorSeverity::MEDIUM, DegradationStrategy::FAIL, false},
        {"request timeout after 30s", ErrorCategory::PERFORMANCE, ErrorSeverity::HIGH, DegradationStrategy::RETRY, true},
        {"connect ECONNREFUSED 127.0.0.1:80", ErrorCategory::EXTERNAL, ErrorSeverity::HIGH, DegradationStrategy::CIRCUIT, true},
        {"getaddrinfo ENOTFOUND registry", ErrorCategory::EXTERNAL, ErrorSeverity::HIGH, DegradationStrategy::CIRCUIT, true},
        {"Rate limit exceeded", ErrorCategory::RATE_LIMIT, ErrorSeverity::MEDIUM, DegradationStrategy::RETRY, true},
        {"429 Too Many Requests", ErrorCategory::RATE_LIMIT, ErrorSeverity::MEDIUM, DegradationStrategy::RETRY, true},
        {"permission denied", ErrorCategory::AUTHORIZATION, ErrorSeverity::HIGH, DegradationStrategy::FAIL, false},
        {"401 Unauthorized", ErrorCategory::AUTHORIZATION, ErrorSeverity::HIGH, DegradationStrategy::FAIL, false},
        {"ENOENT: package.json", ErrorCategory::RESOURCE, ErrorSeverity::MEDIUM, DegradationStrategy::FALLBACK, true},
        {"coverage report not found", ErrorCategory::RESOURCE, ErrorSeverity::MEDIUM, DegradationStrategy::FALLBACK, true},
        {"spawn failed: ENOMEM", ErrorCategory::SYSTEM, ErrorSeverity::CRITICAL, DegradationStrategy::FAIL, false},
        {"EMFILE: too many open files", ErrorCategory::SYSTEM, ErrorSeverity::CRITICAL, DegradationStrategy::FAIL, false},
        {"something odd happened", ErrorCategory::EXECUTION, ErrorSeverity::MEDIUM, DegradationStrategy::RETRY, true},
    };

    for (const auto& c : cases) {
        const auto result = classify(c.message);
        EXPECT_EQ(result.category, c.category) << c.message;
        EXPECT_EQ(result.severity, c.severity) << c.message;
        EXPECT_EQ(result.strategy, c.strategy) << c.message;
        EXPECT_EQ(result.retryable, c.retryable) << c.message;
    }
}

TEST_F(ErrorClassifierTest, EarlierRulesWinOnAmbiguousText) {
    // Mentions both validation and timeout
    EXPECT_EQ(classify("invalid timeout value").category, ErrorCategory::VALIDATION);
    // Mentions both network and not found
    EXPECT_EQ(classify("network host not found").category, ErrorCategory::EXTERNAL);
    // Mentions both rate limit and permission
    EXPECT_EQ(classify("rate limit: permission throttled").category, ErrorCategory::RATE_LIMIT);
}

TEST_F(ErrorClassifierTest, TypedErrorsKeepTheirClassification) {
    ServiceError error("invalid-looking text", ErrorCategory::RATE_LIMIT, ErrorSeverity::LOW);
    const auto result = ErrorClassifier::classify(error);

    EXPECT_EQ(result.category, ErrorCategory::RATE_LIMIT);
    EXPECT_EQ(result.severity, ErrorSeverity::LOW);
    EXPECT_TRUE(result.retryable);
}

TEST_F(ErrorClassifierTest, CircuitOpenIsNotRetryable) {
    const auto result = ErrorClassifier::classify(CircuitOpenError("analyzer"));

    EXPECT_EQ(result.category, ErrorCategory::EXTERNAL);
    EXPECT_FALSE(result.retryable);
}

TEST_F(ErrorClassifierTest, TimeoutErrorIsRetryablePerformance) {
    const auto result = ErrorClassifier::classify(TimeoutError("analyze", warden::Milliseconds(50)));

    EXPECT_EQ(result.category, ErrorCategory::PERFORMANCE);
    EXPECT_TRUE(result.retryable);
}

TEST_F(ErrorClassifierTest, StandardExceptionTypes) {
    EXPECT_EQ(ErrorClassifier::classify(std::bad_alloc()).category, ErrorCategory::SYSTEM);

    std::filesystem::filesystem_error fs_error(
        "cannot open", std::filesystem::path("/tmp/x"),
        std::make_error_code(std::errc::io_error));
    EXPECT_EQ(ErrorClassifier::classify(fs_error).category, ErrorCategory::RESOURCE);
}

TEST(ErrorTypesTest, StandardizedErrorSerializesOptionalFieldsOnlyWhenSet) {
    StandardizedError error;
    error.code = "WARDEN_EXTERNAL_HIGH";
    error.message = "down";
    error.category = ErrorCategory::EXTERNAL;
    error.severity = ErrorSeverity::HIGH;
    error.suggestions = {"Check network connectivity"};

    Json::Value json = error.to_json();
    EXPECT_EQ(json["code"].asString(), "WARDEN_EXTERNAL_HIGH");
    EXPECT_EQ(json["category"].asString(), "external");
    EXPECT_EQ(json["suggestions"].size(), 1u);
    EXPECT_FALSE(json.isMember("toolName"));
    EXPECT_FALSE(json.isMember("requestId"));

    error.tool_name = "analyzer";
    error.request_id = "req-1";
    json = error.to_json();
    EXPECT_EQ(json["toolName"].asString(), "analyzer");
    EXPECT_EQ(json["requestId"].asString(), "req-1");
}

TEST(ErrorTypesTest, ValidationErrorCarriesIssues) {
    ValidationError error("bad input", {{"projectPath", "Required"}, {"depth", "Expected integer"}});

    ASSERT_EQ(error.issues().size(), 2u);
    EXPECT_EQ(error.category(), ErrorCategory::VALIDATION);
    EXPECT_EQ(error.context()["issues"].size(), 2u);
    EXPECT_EQ(error.context()["issues"][0]["path"].asString(), "projectPath");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
