#include <gtest/gtest.h>
#include "common/config_manager.hpp"
#include "common/id_generator.hpp"
#include "common/logger.hpp"
#include <json/json.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace warden::common;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Config log_config;
        log_config.level = LogLevel::DEBUG;
        log_config.format = Logger::OutputFormat::PLAIN;
        log_config.enable_console_output = false;
        log_config.include_thread_id = false;
        Logger::initialize("test", log_config);
        Logger::set_sink([this](const Logger::Entry& entry, const std::string& formatted) {
            entries_.push_back(entry);
            lines_.push_back(formatted);
        });
    }

    void TearDown() override {
        Logger::set_sink(nullptr);
        Logger::shutdown();
    }

    std::vector<Logger::Entry> entries_;
    std::vector<std::string> lines_;
};

TEST_F(LoggerTest, FormatsPlaceholdersInOrder) {
    LOG_INFO("Loaded {} entries from {}", 3, "disk");

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(entries_[0].message, "Loaded 3 entries from disk");
    EXPECT_NE(lines_[0].find("[INFO]"), std::string::npos);
}

TEST_F(LoggerTest, LevelFilterDropsLowerEntries) {
    Logger::set_level(LogLevel::WARNING);

    LOG_DEBUG("hidden");
    LOG_INFO("hidden");
    LOG_WARNING("shown");
    LOG_ERROR("shown too");

    ASSERT_EQ(entries_.size(), 2u);
    EXPECT_EQ(entries_[0].level, LogLevel::WARNING);
    EXPECT_EQ(entries_[1].level, LogLevel::ERROR);
}

TEST_F(LoggerTest, JsonFormatCarriesContextFields) {
    Logger::set_format(Logger::OutputFormat::JSON);

    LogContext context;
    context.add("tool", "analyze").add("attempt", 2).add("cached", true);
    LOG_STRUCTURED(LogLevel::INFO, "structured", context);

    ASSERT_EQ(lines_.size(), 1u);
    Json::Value parsed;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream input(lines_[0]);
    ASSERT_TRUE(Json::parseFromStream(builder, input, &parsed, &errors)) << errors;

    EXPECT_EQ(parsed["message"].asString(), "structured");
    EXPECT_EQ(parsed["logger"].asString(), "test");
    EXPECT_EQ(parsed["tool"].asString(), "analyze");
    EXPECT_EQ(parsed["attempt"].asString(), "2");
    EXPECT_EQ(parsed["cached"].asString(), "true");
}

TEST_F(LoggerTest, LogfmtQuotesValuesWithSpaces) {
    Logger::set_format(Logger::OutputFormat::LOGFMT);

    LogContext context;
    context.add("reason", "disk full").add("code", 28);
    LOG_STRUCTURED(LogLevel::ERROR, "write failed", context);

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_NE(lines_[0].find("reason=\"disk full\""), std::string::npos);
    EXPECT_NE(lines_[0].find("code=28"), std::string::npos);
    EXPECT_NE(lines_[0].find("message=\"write failed\""), std::string::npos);
}

TEST_F(LoggerTest, ErrorEntriesIncludeExceptionMessage) {
    std::runtime_error error("boom");
    LOG_ERROR_WITH_EXCEPTION("operation failed", error, LogContext{});

    ASSERT_EQ(entries_.size(), 1u);
    const auto& fields = entries_[0].context.get_fields();
    ASSERT_TRUE(fields.count("exception_message"));
    EXPECT_EQ(fields.at("exception_message"), "boom");
}

TEST_F(LoggerTest, LevelNamesParseCaseInsensitively) {
    EXPECT_EQ(Logger::level_from_string("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::level_from_string("warn"), LogLevel::WARNING);
    EXPECT_EQ(Logger::level_from_string("Critical"), LogLevel::CRITICAL);
    EXPECT_EQ(Logger::level_from_string("bogus"), LogLevel::INFO);
}

TEST(IdGeneratorTest, GeneratesDistinctPrefixedIds) {
    const std::string first = generate_prefixed_id("trace");
    const std::string second = generate_prefixed_id("trace");

    EXPECT_NE(first, second);
    EXPECT_EQ(first.rfind("trace-", 0), 0u);
    EXPECT_EQ(generate_uuid().size(), 36u);
}

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::Config log_config;
        log_config.enable_console_output = false;
        Logger::initialize("test", log_config);
    }

    void TearDown() override {
        Logger::shutdown();
    }

    ConfigManager config_;
};

TEST_F(ConfigManagerTest, ParsesSectionsAndTypedValues) {
    config_.load_from_string(
        "# runtime settings\n"
        "name = warden\n"
        "\n"
        "[circuit_breaker]\n"
        "failure_threshold = 7\n"
        "; alternate comment style\n"
        "[retry]\n"
        "backoff_multiplier = 1.5\n"
        "enabled = yes\n");

    EXPECT_EQ(config_.get<std::string>("name"), "warden");
    EXPECT_EQ(config_.get<int>("circuit_breaker.failure_threshold"), 7);
    EXPECT_DOUBLE_EQ(config_.get<double>("retry.backoff_multiplier"), 1.5);
    EXPECT_TRUE(config_.get<bool>("retry.enabled"));
    EXPECT_EQ(config_.size(), 4u);
}

TEST_F(ConfigManagerTest, MissingOrMalformedValuesUseDefault) {
    config_.load_from_string("[cache]\nmax_entries = lots\nflag = maybe\n");

    EXPECT_EQ(config_.get<int>("cache.max_entries", 42), 42);
    EXPECT_EQ(config_.get<int>("cache.absent", 9), 9);
    EXPECT_TRUE(config_.get<bool>("cache.flag", true));
    EXPECT_FALSE(config_.has_key("cache.absent"));
}

TEST_F(ConfigManagerTest, SectionKeysAreSortedWithoutPrefix) {
    config_.load_from_string("[logger]\nlevel = debug\nformat = json\n[other]\nx = 1\n");

    const auto keys = config_.get_section_keys("logger");
    ASSERT_EQ(keys.size(), 2u);
    EXPECT_EQ(keys[0], "format");
    EXPECT_EQ(keys[1], "level");
}

TEST_F(ConfigManagerTest, SetNotifiesWatchers) {
    std::vector<std::pair<std::string, std::string>> changes;
    config_.watch_changes([&changes](const std::string& key, const std::string& value) {
        changes.emplace_back(key, value);
    });

    config_.set("retry.max_attempts", 5);
    config_.set("adapter.enable_fallback", false);

    ASSERT_EQ(changes.size(), 2u);
    EXPECT_EQ(changes[0].first, "retry.max_attempts");
    EXPECT_EQ(changes[0].second, "5");
    EXPECT_EQ(changes[1].second, "false");
    EXPECT_EQ(config_.get<int>("retry.max_attempts"), 5);
}

TEST_F(ConfigManagerTest, ReloadPicksUpFileChanges) {
    const std::string path = "warden_config_test_" + generate_uuid() + ".conf";
    {
        std::ofstream out(path);
        out << "[retry]\nmax_attempts = 2\n";
    }
    ASSERT_TRUE(config_.load_from_file(path));
    EXPECT_EQ(config_.get<int>("retry.max_attempts"), 2);

    {
        std::ofstream out(path, std::ios::trunc);
        out << "[retry]\nmax_attempts = 4\n";
    }
    EXPECT_TRUE(config_.reload());
    EXPECT_EQ(config_.get<int>("retry.max_attempts"), 4);

    std::remove(path.c_str());
}

TEST_F(ConfigManagerTest, LoadFromMissingFileFails) {
    EXPECT_FALSE(config_.load_from_file("/nonexistent/warden.conf"));
    EXPECT_FALSE(config_.reload());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
