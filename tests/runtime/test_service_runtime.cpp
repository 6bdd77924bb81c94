#include <gtest/gtest.h>
#include "common/clock.hpp"
#include "common/config_manager.hpp"
#include "common/error_handling.hpp"
#include "common/logger.hpp"
#include "runtime/runtime_config.hpp"
#include "runtime/service_runtime.hpp"
#include <atomic>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using namespace warden;
using namespace warden::runtime;

namespace {

// Resolves a dependency name to a pinned version, or fails on demand
class VersionLookup : public adapter::ServiceOperation<std::string, std::string> {
public:
    std::string name() const override { return "version_lookup"; }
    std::string description() const override { return "Resolves pinned dependency versions"; }
    cache::CacheLayer cache_layer() const override { return cache::CacheLayer::DEPENDENCIES; }

    std::string validate_input(const Json::Value& raw) const override {
        if (!raw.isObject() || !raw["package"].isString()) {
            throw resilience::ValidationError("Invalid parameters: package (Expected string)",
                                              {{"package", "Expected string"}});
        }
        return raw["package"].asString();
    }

    std::string cache_key(const std::string& package) const override { return package; }

    Json::Value execute_core(const std::string& package, const adapter::ToolContext&) override {
        calls++;
        if (failing) {
            throw std::runtime_error("registry ECONNREFUSED");
        }
        Json::Value raw(Json::objectValue);
        raw["version"] = package + "@1.0.0";
        return raw;
    }

    std::string transform_output(const Json::Value& raw) const override {
        return raw["version"].asString();
    }

    std::atomic<int> calls{0};
    std::atomic<bool> failing{false};
};

Json::Value package(const std::string& name) {
    Json::Value params(Json::objectValue);
    params["package"] = name;
    return params;
}

} // namespace

class ServiceRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        common::Logger::Config log_config;
        log_config.level = common::LogLevel::DEBUG;
        log_config.enable_console_output = false;
        common::Logger::initialize("test", log_config);

        clock_ = std::make_shared<common::ManualClock>();
        config_.fallback.max_retries = 0;
        config_.fallback.operation_timeout = Milliseconds(0);
        config_.error_handler.circuit_breaker.failure_threshold = 2;
    }

    void TearDown() override {
        common::Logger::shutdown();
    }

    std::shared_ptr<common::ManualClock> clock_;
    RuntimeConfig config_;
};

TEST_F(ServiceRuntimeTest, ConfigFileMapsOntoComponents) {
    common::ConfigManager config;
    config.load_from_string(
        "[cache]\n"
        "max_total_memory_mb = 128\n"
        "cleanup_interval_ms = 5000\n"
        "[cache.configuration]\n"
        "max_entries = 10\n"
        "ttl_ms = 0\n"
        "eviction_policy = lru\n"
        "[circuit_breaker]\n"
        "failure_threshold = 4\n"
        "recovery_timeout_ms = 2000\n"
        "[retry]\n"
        "max_attempts = 6\n"
        "[adapter]\n"
        "fallback_chain = cache, partial, default\n"
        "max_retries = 1\n"
        "operation_timeout_ms = 250\n"
        "[monitor]\n"
        "max_history = 50\n");

    const RuntimeConfig result = RuntimeConfig::from_config(config);

    EXPECT_EQ(result.cache.max_total_memory_bytes, 128u * 1024 * 1024);
    EXPECT_EQ(result.cache.cleanup_interval.count(), 5000);

    const auto& layer = result.cache.layers.at(cache::CacheLayer::CONFIGURATION);
    EXPECT_EQ(layer.max_entries, 10u);
    EXPECT_FALSE(layer.default_ttl.has_value());
    EXPECT_EQ(layer.eviction_policy, cache::EvictionPolicy::LRU);
    EXPECT_EQ(result.cache.layers.at(cache::CacheLayer::COVERAGE).max_entries, 200u);

    EXPECT_EQ(result.error_handler.circuit_breaker.failure_threshold, 4u);
    EXPECT_EQ(result.error_handler.circuit_breaker.recovery_timeout.count(), 2000);
    EXPECT_EQ(result.error_handler.retry.max_attempts, 6u);

    ASSERT_EQ(result.fallback.fallback_chain.size(), 3u);
    EXPECT_EQ(result.fallback.fallback_chain[1], adapter::FallbackStrategy::PARTIAL);
    EXPECT_EQ(result.fallback.max_retries, 1u);
    EXPECT_EQ(result.fallback.operation_timeout.count(), 250);
    EXPECT_EQ(result.max_history, 50u);
    EXPECT_FALSE(result.configure_logger);
}

TEST_F(ServiceRuntimeTest, LoggerSectionRequestsLoggerSetup) {
    common::ConfigManager config;
    config.load_from_string("[logger]\nlevel = warn\nformat = json\nconsole = false\n");

    const RuntimeConfig result = RuntimeConfig::from_config(config);

    EXPECT_TRUE(result.configure_logger);
    EXPECT_EQ(result.logger.level, common::LogLevel::WARNING);
    EXPECT_EQ(result.logger.format, common::Logger::OutputFormat::JSON);
    EXPECT_FALSE(result.logger.enable_console_output);
}

TEST_F(ServiceRuntimeTest, InvalidValuesAreRejected) {
    const char* invalid[] = {
        "[circuit_breaker]\nfailure_threshold = 0\n",
        "[cache]\ncleanup_interval_ms = -5\n",
        "[cache.coverage]\neviction_policy = random\n",
        "[adapter]\nfallback_strategy = guess\n",
        "[adapter]\nfallback_chain = cache, sometimes\n",
        "[logger]\nformat = xml\n",
    };

    for (const char* content : invalid) {
        common::ConfigManager config;
        config.load_from_string(content);
        EXPECT_THROW(RuntimeConfig::from_config(config), ConfigException) << content;
    }
}

TEST_F(ServiceRuntimeTest, MissingConfigFileThrows) {
    EXPECT_THROW(RuntimeConfig::from_file("/nonexistent/warden.conf"), ConfigException);
}

TEST_F(ServiceRuntimeTest, ConfigFileIsLoadedFromDisk) {
    const std::string path = ::testing::TempDir() + "warden_runtime_test.conf";
    {
        std::ofstream out(path);
        out << "[monitor]\nmax_history = 7\n";
    }

    const RuntimeConfig result = RuntimeConfig::from_file(path);
    EXPECT_EQ(result.max_history, 7u);
    std::remove(path.c_str());
}

TEST_F(ServiceRuntimeTest, AdaptersShareRuntimeState) {
    ServiceRuntime runtime(config_, clock_);
    auto operation = std::make_shared<VersionLookup>();

    auto first = runtime.make_adapter<std::string, std::string>(operation);
    auto second = runtime.make_adapter<std::string, std::string>(operation);

    EXPECT_EQ(first->execute(package("left-pad")).value, "left-pad@1.0.0");
    auto cached = second->execute(package("left-pad"));

    EXPECT_EQ(cached.status, adapter::ExecutionStatus::CACHED);
    EXPECT_EQ(operation->calls.load(), 1);

    const auto stats = runtime.get_stats();
    EXPECT_EQ(stats.total_executions, 2u);
    EXPECT_EQ(stats.cache_hits, 1u);
    EXPECT_EQ(stats.cache_metrics.entry_count, 1u);
    EXPECT_TRUE(runtime.is_healthy());
}

TEST_F(ServiceRuntimeTest, OpenBreakerMakesRuntimeUnhealthy) {
    ServiceRuntime runtime(config_, clock_);
    auto operation = std::make_shared<VersionLookup>();
    operation->failing = true;

    adapter::FallbackConfig strict = config_.fallback;
    strict.enable_fallback = false;
    auto adapter = runtime.make_adapter<std::string, std::string>(operation, strict);

    for (int i = 0; i < 2; ++i) {
        EXPECT_THROW(adapter->execute(package("react")), resilience::ServiceError);
    }

    EXPECT_FALSE(runtime.error_handler().is_service_available("version_lookup"));
    EXPECT_FALSE(runtime.is_healthy());

    const auto stats = runtime.get_stats();
    EXPECT_EQ(stats.failed_executions, 2u);
    EXPECT_EQ(stats.circuit_breaker_stats.open_circuits, 1u);
}

TEST_F(ServiceRuntimeTest, ResetIsolatesState) {
    ServiceRuntime runtime(config_, clock_);
    auto operation = std::make_shared<VersionLookup>();
    auto adapter = runtime.make_adapter<std::string, std::string>(operation);

    adapter->execute(package("lodash"));
    runtime.error_handler().circuit_breakers().get_or_create("version_lookup")->force_open();

    runtime.reset();

    EXPECT_EQ(runtime.get_stats().total_executions, 0u);
    EXPECT_EQ(runtime.cache().get_aggregate_metrics().entry_count, 0u);
    EXPECT_TRUE(runtime.error_handler().get_circuit_breaker_states().empty());
    EXPECT_TRUE(runtime.is_healthy());

    adapter->execute(package("lodash"));
    EXPECT_EQ(operation->calls.load(), 2);
}

TEST_F(ServiceRuntimeTest, RuntimesAreIndependent) {
    ServiceRuntime left(config_, clock_);
    ServiceRuntime right(config_, clock_);
    auto operation = std::make_shared<VersionLookup>();

    left.make_adapter<std::string, std::string>(operation)->execute(package("chalk"));
    auto result = right.make_adapter<std::string, std::string>(operation)->execute(package("chalk"));

    EXPECT_EQ(result.status, adapter::ExecutionStatus::SUCCESS);
    EXPECT_EQ(operation->calls.load(), 2);
}

TEST_F(ServiceRuntimeTest, StartAndShutdownManageBackgroundWork) {
    ServiceRuntime runtime(config_, clock_);

    runtime.start();
    EXPECT_TRUE(runtime.is_running());
    EXPECT_TRUE(runtime.cache().is_cleanup_running());

    runtime.shutdown();
    EXPECT_FALSE(runtime.is_running());
    EXPECT_FALSE(runtime.cache().is_cleanup_running());
    EXPECT_TRUE(runtime.error_handler().retries_cancelled());

    runtime.shutdown();
    EXPECT_FALSE(runtime.is_running());
}

TEST_F(ServiceRuntimeTest, PrometheusExportNamesEveryMetric) {
    ServiceRuntime runtime(config_, clock_);
    auto adapter = runtime.make_adapter<std::string, std::string>(std::make_shared<VersionLookup>());
    adapter->execute(package("express"));
    adapter->execute(package("express"));

    const std::string metrics = runtime.export_prometheus_metrics();

    for (const char* name : {"warden_cache_hits_total 1.0000", "warden_cache_misses_total 1.0000",
                             "warden_cache_layer_entries{layer=\"dependencies\"} 1",
                             "warden_circuit_breaker_total 1.0000",
                             "warden_executions_total 2.0000", "warden_success_rate 1.0000",
                             "warden_runtime_healthy 1.0000"}) {
        EXPECT_NE(metrics.find(name), std::string::npos) << name;
    }
    EXPECT_NE(metrics.find("# TYPE warden_retries_total counter"), std::string::npos);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
