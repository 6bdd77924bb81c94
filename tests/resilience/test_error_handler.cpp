#include <gtest/gtest.h>
#include "common/clock.hpp"
#include "common/logger.hpp"
#include "resilience/error_handler.hpp"
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using namespace warden;
using namespace warden::resilience;

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        common::Logger::Config log_config;
        log_config.level = common::LogLevel::DEBUG;
        log_config.enable_console_output = false;
        common::Logger::initialize("test", log_config);

        clock_ = std::make_shared<common::ManualClock>();
        config_.circuit_breaker.failure_threshold = 2;
        config_.circuit_breaker.recovery_timeout = Milliseconds(5000);
        config_.retry.max_attempts = 3;
        config_.retry.base_delay = Milliseconds(10);
        config_.retry.backoff_multiplier = 2.0;
        config_.retry.max_delay = Milliseconds(100);
    }

    void TearDown() override {
        common::Logger::shutdown();
    }

    std::shared_ptr<common::ManualClock> clock_;
    ErrorHandler::Config config_;
};

TEST_F(ErrorHandlerTest, DefaultConstructedHandlerUsesDefaultConfig) {
    ErrorHandler handler;

    EXPECT_TRUE(handler.config().enable_fallbacks);
    EXPECT_EQ(handler.config().retry.max_attempts, RetryPolicy{}.max_attempts);
    EXPECT_EQ(handler.circuit_breakers().default_config().failure_threshold,
              CircuitBreaker::Config{}.failure_threshold);
    EXPECT_EQ(handler.execute_with_circuit_breaker("default", [] { return 7; }), 7);
}

TEST_F(ErrorHandlerTest, HandleErrorBuildsStandardizedResponse) {
    ErrorHandler handler(config_, clock_);

    auto response = handler.handle_error(std::runtime_error("connect ECONNREFUSED 10.0.0.1:443"),
                                         "analyzer", "analyze", std::string("req-1"));

    EXPECT_FALSE(response.success);
    EXPECT_EQ(response.error.code, "WARDEN_EXTERNAL_HIGH");
    EXPECT_EQ(response.error.category, ErrorCategory::EXTERNAL);
    EXPECT_EQ(response.error.tool_name, "analyzer");
    EXPECT_EQ(response.error.operation, "analyze");
    ASSERT_TRUE(response.error.request_id.has_value());
    EXPECT_EQ(*response.error.request_id, "req-1");
    EXPECT_EQ(response.error.suggestions.size(), 3u);

    EXPECT_EQ(response.metadata.degradation_strategy, DegradationStrategy::CIRCUIT);
    EXPECT_TRUE(response.metadata.retryable);
    ASSERT_TRUE(response.metadata.retry_after.has_value());
    EXPECT_EQ(response.metadata.retry_after->count(), 10);

    const auto json = response.to_json();
    EXPECT_FALSE(json["success"].asBool());
    EXPECT_EQ(json["metadata"]["degradationStrategy"].asString(), "circuit");
}

TEST_F(ErrorHandlerTest, ValidationErrorsAreNotRetryable) {
    ErrorHandler handler(config_, clock_);

    auto response = handler.handle_error(ValidationError("Invalid parameters: name (Required)"),
                                         "analyzer", "analyze");

    EXPECT_EQ(response.error.code, "WARDEN_VALIDATION_MEDIUM");
    EXPECT_EQ(response.metadata.degradation_strategy, DegradationStrategy::FAIL);
    EXPECT_FALSE(response.metadata.retryable);
    EXPECT_FALSE(response.metadata.retry_after.has_value());
    EXPECT_FALSE(response.error.request_id.has_value());
}

TEST_F(ErrorHandlerTest, RetryAfterReflectsOpenBreaker) {
    ErrorHandler handler(config_, clock_);
    handler.circuit_breakers().get_or_create("analyzer")->force_open();
    clock_->advance(std::chrono::milliseconds(2000));

    auto response = handler.handle_error(std::runtime_error("request timeout"), "analyzer", "analyze");

    ASSERT_TRUE(response.metadata.retry_after.has_value());
    EXPECT_EQ(response.metadata.retry_after->count(), 3000);
}

TEST_F(ErrorHandlerTest, ErrorCodesDropUnderscores) {
    EXPECT_EQ(ErrorHandler::generate_error_code(ErrorCategory::RATE_LIMIT, ErrorSeverity::LOW),
              "WARDEN_RATELIMIT_LOW");
    EXPECT_EQ(ErrorHandler::generate_error_code(ErrorCategory::SYSTEM, ErrorSeverity::CRITICAL),
              "WARDEN_SYSTEM_CRITICAL");
}

TEST_F(ErrorHandlerTest, SanitizeContextRedactsAndTruncates) {
    Json::Value context(Json::objectValue);
    context["apiKey"] = "abc123";
    context["user"]["password"] = "hunter2";
    context["user"]["name"] = "dana";
    context["headers"].append(Json::Value(Json::objectValue));
    context["headers"][0]["Authorization"] = "Bearer x";
    context["log"] = std::string(1500, 'x');
    context["count"] = 3;

    const Json::Value sanitized = ErrorHandler::sanitize_context(context);

    EXPECT_EQ(sanitized["apiKey"].asString(), "[REDACTED]");
    EXPECT_EQ(sanitized["user"]["password"].asString(), "[REDACTED]");
    EXPECT_EQ(sanitized["user"]["name"].asString(), "dana");
    EXPECT_EQ(sanitized["headers"][0]["Authorization"].asString(), "[REDACTED]");
    EXPECT_EQ(sanitized["log"].asString(), std::string(1000, 'x') + "...[TRUNCATED]");
    EXPECT_EQ(sanitized["count"].asInt(), 3);

    EXPECT_TRUE(ErrorHandler::sanitize_context(Json::Value()).isObject());
}

TEST_F(ErrorHandlerTest, CategorizeKeepsServiceErrorDetails) {
    ErrorHandler handler(config_, clock_);
    TimeoutError timeout("analyze", Milliseconds(250));

    auto error = handler.categorize(timeout, "analyzer", "analyze");

    EXPECT_EQ(error.category, ErrorCategory::PERFORMANCE);
    EXPECT_EQ(error.severity, ErrorSeverity::HIGH);
    EXPECT_EQ(error.message, "Operation 'analyze' timed out after 250 ms");
    EXPECT_EQ(error.tool_name, "analyzer");
}

TEST_F(ErrorHandlerTest, RetriesUntilSuccess) {
    ErrorHandler handler(config_, clock_);
    int calls = 0;

    int result = handler.execute_with_retry([&calls]() {
        if (++calls < 3) {
            throw std::runtime_error("request timeout");
        }
        return 42;
    }, "analyzer", "analyze", 3);

    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 3);
}

TEST_F(ErrorHandlerTest, RethrowsLastErrorWhenAttemptsExhausted) {
    ErrorHandler handler(config_, clock_);
    int calls = 0;

    EXPECT_THROW(handler.execute_with_retry([&calls]() -> int {
        ++calls;
        throw std::runtime_error("network unreachable");
    }, "analyzer", "analyze", 3), std::runtime_error);

    EXPECT_EQ(calls, 3);
}

TEST_F(ErrorHandlerTest, NonRetryableErrorsAreNotRetried) {
    ErrorHandler handler(config_, clock_);
    int calls = 0;

    EXPECT_THROW(handler.execute_with_retry([&calls]() -> int {
        ++calls;
        throw ValidationError("Invalid parameters: depth (Expected integer)");
    }, "analyzer", "analyze", 5), ValidationError);
    EXPECT_EQ(calls, 1);

    calls = 0;
    EXPECT_THROW(handler.execute_with_retry([&calls]() -> int {
        ++calls;
        throw CircuitOpenError("analyzer");
    }, "analyzer", "analyze", 5), CircuitOpenError);
    EXPECT_EQ(calls, 1);
}

TEST_F(ErrorHandlerTest, ObserverSeesExponentialDelays) {
    ErrorHandler handler(config_, clock_);
    std::vector<long long> delays;

    RetryPolicy policy = config_.retry;
    policy.max_attempts = 4;

    EXPECT_THROW(handler.execute_with_retry([]() -> int {
        throw std::runtime_error("request timeout");
    }, "analyzer", "analyze", policy,
    [&delays](u32, const std::exception&, Milliseconds delay) {
        delays.push_back(delay.count());
    }), std::runtime_error);

    EXPECT_EQ(delays, (std::vector<long long>{10, 20, 40}));
}

TEST_F(ErrorHandlerTest, BackoffIsCappedAtMaxDelay) {
    RetryPolicy policy;
    policy.base_delay = Milliseconds(1000);
    policy.backoff_multiplier = 3.0;
    policy.max_delay = Milliseconds(5000);

    EXPECT_EQ(policy.delay_for_attempt(1).count(), 1000);
    EXPECT_EQ(policy.delay_for_attempt(2).count(), 3000);
    EXPECT_EQ(policy.delay_for_attempt(3).count(), 5000);
}

TEST_F(ErrorHandlerTest, CancelPendingRetriesInterruptsWait) {
    config_.retry.base_delay = Milliseconds(10000);
    config_.retry.max_delay = Milliseconds(10000);
    ErrorHandler handler(config_, clock_);

    std::promise<void> first_attempt;
    auto started = first_attempt.get_future();
    int calls = 0;

    auto pending = std::async(std::launch::async, [&]() {
        try {
            handler.execute_with_retry([&]() -> int {
                if (++calls == 1) {
                    first_attempt.set_value();
                }
                throw std::runtime_error("request timeout");
            }, "analyzer", "analyze", 3);
        } catch (const std::runtime_error&) {
            return true;
        }
        return false;
    });

    started.wait();
    handler.cancel_pending_retries();

    ASSERT_EQ(pending.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(pending.get());
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(handler.retries_cancelled());

    handler.reset();
    EXPECT_FALSE(handler.retries_cancelled());
}

TEST_F(ErrorHandlerTest, BreakerOpensAndUsesFallback) {
    ErrorHandler handler(config_, clock_);

    for (int i = 0; i < 2; ++i) {
        EXPECT_THROW(handler.execute_with_circuit_breaker("analyzer", []() -> std::string {
            throw std::runtime_error("connection refused");
        }), std::runtime_error);
    }

    EXPECT_FALSE(handler.is_service_available("analyzer"));
    EXPECT_TRUE(handler.is_service_available("never-called"));

    EXPECT_THROW(handler.execute_with_circuit_breaker("analyzer", []() { return std::string("live"); }),
                 CircuitOpenError);

    auto value = handler.execute_with_circuit_breaker("analyzer",
        []() { return std::string("live"); },
        []() { return std::string("fallback"); });
    EXPECT_EQ(value, "fallback");

    handler.reset_circuit_breaker("analyzer");
    EXPECT_TRUE(handler.is_service_available("analyzer"));
    EXPECT_EQ(handler.execute_with_circuit_breaker("analyzer", []() { return std::string("live"); }), "live");

    const auto states = handler.get_circuit_breaker_states();
    ASSERT_EQ(states.count("analyzer"), 1u);
    EXPECT_EQ(states.at("analyzer").state, CircuitBreaker::State::CLOSED);
}

TEST_F(ErrorHandlerTest, FallbacksCanBeDisabled) {
    config_.enable_fallbacks = false;
    ErrorHandler handler(config_, clock_);
    handler.circuit_breakers().get_or_create("analyzer")->force_open();

    EXPECT_THROW(handler.execute_with_circuit_breaker("analyzer",
        []() { return 1; },
        []() { return 2; }), CircuitOpenError);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
