// EN: Unit tests for ConfigManager - YAML loading, typed access and environment overrides
// FR: Tests unitaires de ConfigManager - chargement YAML, accès typé et surcharges d'environnement

#include <gtest/gtest.h>

#include "infrastructure/config/config_manager.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <filesystem>

using namespace CKW;

namespace {

const char* kYaml = R"(
checkpoint:
  database_path: /var/lib/ckw/checkpoints.db
  compression: zlib
  integrity_checks: true
  cleanup_max_age_hours: 72
coordination:
  timeout_ms: 30000
  quoted_number: "42"
  ratio: 0.75
tools:
  - build_image
  - deploy_kubernetes
retry_policies:
  build_image:
    max_attempts: 3
)";

} // namespace

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(config_.loadFromString(kYaml));
    }

    void TearDown() override {
        unsetenv("CKWTEST_COORDINATION_TIMEOUT_MS");
        unsetenv("CKWTEST_CHECKPOINT_INTEGRITY_CHECKS");
        unsetenv("CKWTEST_CHECKPOINT_DATABASE_PATH");
        unsetenv("CKW_CONFIG_TEST_HOME");
    }

    Testing::LogCapture capture_{LogLevel::WARN};
    ConfigManager config_;
};

TEST_F(ConfigManagerTest, ScalarTypesAreInferred) {
    EXPECT_EQ(config_.get("checkpoint", "database_path").as<std::string>(), "/var/lib/ckw/checkpoints.db");
    EXPECT_TRUE(config_.get("checkpoint", "integrity_checks").as<bool>());
    EXPECT_EQ(config_.get("checkpoint", "cleanup_max_age_hours").as<int>(), 72);
    EXPECT_DOUBLE_EQ(config_.get("coordination", "ratio").as<double>(), 0.75);
    // EN: Quoted scalars stay strings.
    // FR: Les scalaires entre guillemets restent des chaînes.
    EXPECT_EQ(config_.get("coordination", "quoted_number").as<std::string>(), "42");
}

TEST_F(ConfigManagerTest, TopLevelSequenceIsStoredAsValue) {
    auto tools = config_.get("tools", "value").as<std::vector<std::string>>();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0], "build_image");
}

TEST_F(ConfigManagerTest, NestedMapsAreSkipped) {
    EXPECT_FALSE(config_.has("retry_policies", "build_image"));
    auto names = config_.getSectionNames();
    EXPECT_NE(std::find(names.begin(), names.end(), "retry_policies"), names.end());
}

TEST_F(ConfigManagerTest, TypedAccessors) {
    ConfigValue timeout = config_.get("coordination", "timeout_ms");
    EXPECT_THROW(timeout.as<std::string>(), ConfigError);
    EXPECT_FALSE(timeout.tryAs<bool>().has_value());
    EXPECT_EQ(timeout.asOrDefault<std::string>("fallback"), "fallback");
    // EN: Integers widen to double.
    // FR: Les entiers sont élargis en double.
    EXPECT_DOUBLE_EQ(timeout.as<double>(), 30000.0);

    ConfigValue missing = config_.get("coordination", "missing");
    EXPECT_FALSE(missing.isValid());
    EXPECT_THROW(missing.as<int>(), ConfigError);
    EXPECT_EQ(missing.asOrDefault<int>(7), 7);
}

TEST_F(ConfigManagerTest, SetHasRemove) {
    config_.set("resume", "incremental", false);
    EXPECT_TRUE(config_.has("resume", "incremental"));
    EXPECT_FALSE(config_.get("resume", "incremental").as<bool>());

    config_.remove("resume", "incremental");
    EXPECT_FALSE(config_.has("resume", "incremental"));

    config_.clear();
    EXPECT_TRUE(config_.getSectionNames().empty());
}

TEST_F(ConfigManagerTest, EnvironmentOverridesKeepTheKeyType) {
    setenv("CKWTEST_COORDINATION_TIMEOUT_MS", "1500", 1);
    setenv("CKWTEST_CHECKPOINT_INTEGRITY_CHECKS", "false", 1);
    setenv("CKWTEST_CHECKPOINT_DATABASE_PATH", "/tmp/override.db", 1);

    EXPECT_EQ(config_.loadEnvironmentOverrides("CKWTEST_"), 3u);
    EXPECT_EQ(config_.get("coordination", "timeout_ms").as<int>(), 1500);
    EXPECT_FALSE(config_.get("checkpoint", "integrity_checks").as<bool>());
    EXPECT_EQ(config_.get("checkpoint", "database_path").as<std::string>(), "/tmp/override.db");
}

TEST_F(ConfigManagerTest, EnvironmentOverrideWithWrongTypeThrows) {
    setenv("CKWTEST_COORDINATION_TIMEOUT_MS", "soon", 1);
    try {
        config_.loadEnvironmentOverrides("CKWTEST_");
        FAIL() << "Expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.key(), "coordination.timeout_ms");
    }
}

TEST_F(ConfigManagerTest, VariablesAreExpanded) {
    setenv("CKW_CONFIG_TEST_HOME", "/home/ckw", 1);
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("paths:\n  data: ${CKW_CONFIG_TEST_HOME}/data\n  other: ${CKW_CONFIG_TEST_UNSET}/x\n"));
    EXPECT_EQ(config.get("paths", "data").as<std::string>(), "/home/ckw/data");
    EXPECT_EQ(config.get("paths", "other").as<std::string>(), "${CKW_CONFIG_TEST_UNSET}/x");
}

TEST_F(ConfigManagerTest, MalformedYamlIsRejected) {
    ConfigManager config;
    EXPECT_FALSE(config.loadFromString("checkpoint: [unterminated"));
    EXPECT_FALSE(config.loadFromString("- just\n- a list\n"));
    EXPECT_TRUE(config.loadFromString(""));
    EXPECT_FALSE(config.loadFromFile("/nonexistent/ckw.yaml"));
}

TEST_F(ConfigManagerTest, SaveAndReload) {
    auto path = std::filesystem::temp_directory_path() / "ckw_config_manager_test.yaml";
    ASSERT_TRUE(config_.saveToFile(path.string()));

    ConfigManager reloaded;
    ASSERT_TRUE(reloaded.loadFromFile(path.string()));
    EXPECT_EQ(reloaded.get("coordination", "timeout_ms").as<int>(), 30000);
    EXPECT_EQ(reloaded.get("tools", "value").as<std::vector<std::string>>().size(), 2u);
    EXPECT_EQ(reloaded.dump(), config_.dump());

    std::filesystem::remove(path);
}
