#include <gtest/gtest.h>
#include "config_manager.hpp"
#include <cstdio>
#include <fstream>

namespace scrub {

class ConfigManagerTest : public ::testing::Test {
protected:
    ConfigManager& config = ConfigManager::getInstance();

    void SetUp() override {
        config.clear();
    }

    void TearDown() override {
        config.clear();
    }
};

TEST_F(ConfigManagerTest, FlattensNestedKeys) {
    ASSERT_TRUE(config.loadFromString(R"({
        "engine": {"scope_policy": "strict", "date_sample_size": 25, "iqr_multiplier": 2.5},
        "logging": {"level": "DEBUG", "console_output": false}
    })"));

    EXPECT_EQ(config.getString("engine.scope_policy"), "strict");
    EXPECT_EQ(config.getInt("engine.date_sample_size"), 25);
    EXPECT_DOUBLE_EQ(config.getDouble("engine.iqr_multiplier"), 2.5);
    EXPECT_FALSE(config.getBool("logging.console_output", true));
    EXPECT_TRUE(config.hasKey("logging.level"));
    EXPECT_FALSE(config.hasKey("engine"));
    EXPECT_EQ(config.getString("missing.key", "fallback"), "fallback");
}

TEST_F(ConfigManagerTest, RejectsMalformedDocuments) {
    EXPECT_FALSE(config.loadFromString("{not json"));
    EXPECT_FALSE(config.loadFromString("[1, 2, 3]"));
    EXPECT_FALSE(config.loadConfig("/nonexistent/path/config.json"));
}

TEST_F(ConfigManagerTest, LoadsFromFile) {
    const std::string path = ::testing::TempDir() + "scrub_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"engine": {"zscore_threshold": 2.0}})";
    }

    ASSERT_TRUE(config.loadConfig(path));
    EXPECT_DOUBLE_EQ(config.getEngineConfig().zscoreThreshold, 2.0);

    std::remove(path.c_str());
}

TEST_F(ConfigManagerTest, EngineConfigReadsEngineSection) {
    ASSERT_TRUE(config.loadFromString(R"({
        "engine": {
            "scope_policy": "strict",
            "date_sample_size": 50,
            "default_date_format": "%d/%m/%Y",
            "iqr_multiplier": 3,
            "zscore_threshold": 2.5
        }
    })"));

    EngineConfig engine = config.getEngineConfig();

    EXPECT_EQ(engine.scopePolicy, ScopePolicy::STRICT);
    EXPECT_EQ(engine.dateSampleSize, 50);
    EXPECT_EQ(engine.defaultDateFormat, "%d/%m/%Y");
    EXPECT_DOUBLE_EQ(engine.iqrMultiplier, 3.0);
    EXPECT_DOUBLE_EQ(engine.zscoreThreshold, 2.5);
}

TEST_F(ConfigManagerTest, EmptyConfigurationYieldsDefaults) {
    EXPECT_TRUE(config.getEngineConfig() == EngineConfig{});
    EXPECT_TRUE(config.validateConfiguration().isValid);
}

TEST_F(ConfigManagerTest, InvalidEngineSectionFallsBackToDefaults) {
    ASSERT_TRUE(config.loadFromString(R"({"engine": {"iqr_multiplier": -1, "date_sample_size": 0}})"));

    auto validation = config.validateConfiguration();
    EXPECT_FALSE(validation.isValid);
    EXPECT_EQ(validation.errors.size(), 2u);
    for (const auto& error : validation.errors) {
        EXPECT_EQ(error.rfind("Engine: ", 0), 0u) << error;
    }

    EXPECT_TRUE(config.getEngineConfig() == EngineConfig{});
}

TEST_F(ConfigManagerTest, UnknownScopePolicyIsAnError) {
    ASSERT_TRUE(config.loadFromString(R"({"engine": {"scope_policy": "lenient"}})"));

    auto validation = config.validateConfiguration();

    EXPECT_FALSE(validation.isValid);
    ASSERT_EQ(validation.errors.size(), 1u);
    EXPECT_NE(validation.errors[0].find("lenient"), std::string::npos);
}

TEST_F(ConfigManagerTest, LowSampleSizeIsOnlyAWarning) {
    ASSERT_TRUE(config.loadFromString(R"({"engine": {"date_sample_size": 5}})"));

    auto validation = config.validateConfiguration();

    EXPECT_TRUE(validation.isValid);
    EXPECT_EQ(validation.warnings.size(), 1u);
    EXPECT_EQ(config.getEngineConfig().dateSampleSize, 5);
}

TEST_F(ConfigManagerTest, LoggingConfigDefaultsAndOverrides) {
    LogConfig defaults = config.getLoggingConfig();
    EXPECT_EQ(defaults.level, LogLevel::INFO);
    EXPECT_TRUE(defaults.consoleOutput);
    EXPECT_FALSE(defaults.fileOutput);
    EXPECT_EQ(defaults.logFile, "logs/scrub.log");

    ASSERT_TRUE(config.loadFromString(R"({
        "logging": {"level": "warn", "format": "JSON", "component_filter": ["Engine", "Config"]}
    })"));
    LogConfig loaded = config.getLoggingConfig();

    EXPECT_EQ(loaded.level, LogLevel::WARN);
    EXPECT_EQ(loaded.format, LogFormat::JSON);
    EXPECT_EQ(loaded.componentFilter.size(), 2u);
    EXPECT_EQ(loaded.componentFilter.count("Engine"), 1u);
}

TEST_F(ConfigManagerTest, StringSetAcceptsCommaSeparatedText) {
    ASSERT_TRUE(config.loadFromString(R"({"filter": " a, b ,,c "})"));

    auto values = config.getStringSet("filter");

    EXPECT_EQ(values.size(), 3u);
    EXPECT_EQ(values.count("b"), 1u);
    EXPECT_TRUE(config.getStringSet("absent").empty());
}

TEST_F(ConfigManagerTest, ValidatedValueRejectsOutOfRange) {
    ASSERT_TRUE(config.loadFromString(R"({"engine": {"date_sample_size": -4}})"));

    int size = config.getValidatedValue<int>("engine.date_sample_size", 100,
                                             [](const int& v) { return v > 0; });

    EXPECT_EQ(size, 100);
}

TEST_F(ConfigManagerTest, ScopePolicyNamesRoundTrip) {
    EXPECT_TRUE(parseScopePolicy(" Strict ") == ScopePolicy::STRICT);
    EXPECT_TRUE(parseScopePolicy("permissive") == ScopePolicy::PERMISSIVE);
    EXPECT_FALSE(parseScopePolicy("other").has_value());
    EXPECT_EQ(scopePolicyToString(ScopePolicy::STRICT), "strict");
}

} // namespace scrub
