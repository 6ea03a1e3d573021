// EN: Unit tests for EngineConfigLoader
// FR: Tests unitaires de EngineConfigLoader

#include <gtest/gtest.h>

#include "orchestrator/engine_config.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace CKW;
using namespace CKW::Orchestrator;
using namespace std::chrono_literals;

namespace {

const char* kFullConfig = R"(
checkpoint:
  database_path: /tmp/ckw.db
  compression: none
  integrity_checks: true
  integrity_policy: strict
  cleanup_max_age_hours: 48
coordination:
  timeout_ms: 5000
  enable_escalation: false
  execute_all_matches: false
  metrics_queue_capacity: 16
resume:
  incremental: false
  checkpoint_on_failure: false
logging:
  level: debug
  console: false
retry_policies:
  build_image:
    max_attempts: 4
    backoff: fixed
    initial_delay_ms: 250
    max_delay_ms: 250
  custom_class:
    max_attempts: 2
    backoff: exponential
    initial_delay_ms: 100
    max_delay_ms: 1000
    backoff_multiplier: 3.0
escalation_rules:
  - source_tool: scan_image
    id: scan_secret_leak
    name: Secret leak
    action: redirect
    redirect_to: generate_dockerfile
    priority: 120
    retry_policy: escalated_build
    parameters:
      fix_secrets: "true"
    conditions:
      - field: error_type
        operator: contains
        value: secret
      - field: findings
        operator: greater_than
        value: 0
  - source_tool: deploy_kubernetes
    id: deploy_quota_abort
    action: abort
    conditions:
      - field: message
        operator: contains
        value: quota
)";

} // namespace

class EngineConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("CKWCFG_COORDINATION_TIMEOUT_MS");
    }

    Testing::LogCapture capture_{LogLevel::WARN};
    EngineConfigLoader loader_{"CKWCFG_"};
};

TEST_F(EngineConfigTest, EmptyDocumentGivesDefaults) {
    EngineConfig config = loader_.loadFromString("");

    EXPECT_EQ(config.coordination.timeout, 30000ms);
    EXPECT_TRUE(config.coordination.enable_escalation);
    EXPECT_TRUE(config.coordination.execute_all_matches);
    EXPECT_EQ(config.coordination.metrics_queue_capacity, 256u);
    EXPECT_EQ(config.checkpoint.store.compression, CompressionMode::ZLIB);
    EXPECT_EQ(config.checkpoint.store.integrity_policy, IntegrityPolicy::BEST_EFFORT);
    EXPECT_TRUE(config.resume.incremental);
    EXPECT_TRUE(config.resume.checkpoint_on_failure);
    EXPECT_TRUE(config.retry_policies.empty());
    EXPECT_TRUE(config.escalation_rules.empty());
}

TEST_F(EngineConfigTest, FullDocumentIsParsed) {
    EngineConfig config = loader_.loadFromString(kFullConfig);

    EXPECT_EQ(config.checkpoint.database_path, "/tmp/ckw.db");
    EXPECT_EQ(config.checkpoint.store.compression, CompressionMode::NONE);
    EXPECT_EQ(config.checkpoint.store.integrity_policy, IntegrityPolicy::STRICT);
    EXPECT_EQ(config.checkpoint.cleanup_max_age, std::chrono::hours(48));
    EXPECT_EQ(config.coordination.timeout, 5000ms);
    EXPECT_FALSE(config.coordination.enable_escalation);
    EXPECT_FALSE(config.coordination.execute_all_matches);
    EXPECT_EQ(config.coordination.metrics_queue_capacity, 16u);
    EXPECT_FALSE(config.resume.incremental);
    EXPECT_FALSE(config.resume.checkpoint_on_failure);
    EXPECT_EQ(config.logging.level, LogLevel::DEBUG);
    EXPECT_FALSE(config.logging.console);

    ASSERT_EQ(config.retry_policies.size(), 2u);
    const RetryPolicy& build = config.retry_policies.at("build_image");
    EXPECT_EQ(build.max_attempts, 4u);
    EXPECT_EQ(build.backoff, BackoffMode::FIXED);
    EXPECT_EQ(build.initial_delay, 250ms);
    EXPECT_DOUBLE_EQ(config.retry_policies.at("custom_class").backoff_multiplier, 3.0);

    ASSERT_EQ(config.escalation_rules.size(), 2u);
    const auto& scan = config.escalation_rules[0];
    EXPECT_EQ(scan.source_tool, "scan_image");
    EXPECT_EQ(scan.rule.redirect_to, "generate_dockerfile");
    EXPECT_EQ(scan.rule.priority, 120);
    EXPECT_EQ(scan.rule.retry_policy_class, "escalated_build");
    EXPECT_EQ(scan.rule.parameters.at("fix_secrets"), "true");
    ASSERT_EQ(scan.rule.conditions.size(), 2u);
    EXPECT_EQ(scan.rule.conditions[0].op, ConditionOperator::CONTAINS);
    EXPECT_EQ(scan.rule.conditions[1].op, ConditionOperator::GREATER_THAN);
    EXPECT_TRUE(scan.rule.conditions[1].value.is_number());

    EXPECT_EQ(config.escalation_rules[1].rule.action, RoutingAction::ABORT);
    EXPECT_EQ(config.escalation_rules[1].rule.name, "deploy_quota_abort");
}

TEST_F(EngineConfigTest, EnvironmentOverridesFlatSections) {
    setenv("CKWCFG_COORDINATION_TIMEOUT_MS", "750", 1);
    EngineConfig config = loader_.loadFromString(kFullConfig);
    EXPECT_EQ(config.coordination.timeout, 750ms);
}

TEST_F(EngineConfigTest, ApplyToRegistersPoliciesAndRules) {
    EngineConfig config = loader_.loadFromString(kFullConfig);
    EscalationRouter router;
    config.applyTo(router);

    EXPECT_EQ(router.retryPolicyFor("build_image").max_attempts, 4u);
    EXPECT_TRUE(router.hasRetryPolicy("custom_class"));

    ToolEvent event;
    event.source_tool = "scan_image";
    event.event_type = "scan_failed";
    event.data = {{"error_type", "secret_exposed"}, {"findings", 3}};
    auto matches = router.route(event);
    ASSERT_FALSE(matches.empty());
    EXPECT_EQ(matches.front().rule.id, "scan_secret_leak");
    EXPECT_EQ(matches.front().parameters.at("fix_secrets"), "true");
}

TEST_F(EngineConfigTest, FailureHandlerConfigFollowsSections) {
    EngineConfig config = loader_.loadFromString(kFullConfig);
    FailureHandlerConfig handler = config.failureHandlerConfig();
    EXPECT_FALSE(handler.enable_escalation);
    EXPECT_FALSE(handler.checkpoint_on_failure);
}

TEST_F(EngineConfigTest, InvalidValuesNameTheKey) {
    auto expectKey = [this](const std::string& yaml, const std::string& key) {
        try {
            loader_.loadFromString(yaml);
            ADD_FAILURE() << "Expected ConfigError for " << key;
        } catch (const ConfigError& e) {
            EXPECT_EQ(e.key(), key) << e.what();
        }
    };

    expectKey("checkpoint:\n  compression: lz4\n", "checkpoint.compression");
    expectKey("checkpoint:\n  integrity_policy: paranoid\n", "checkpoint.integrity_policy");
    expectKey("coordination:\n  timeout_ms: 0\n", "coordination.timeout_ms");
    expectKey("coordination:\n  enable_escalation: maybe\n", "coordination.enable_escalation");
    expectKey("retry_policies:\n  x:\n    backoff: linear\n", "retry_policies.x.backoff");
    expectKey("retry_policies:\n  x:\n    max_attempts: 0\n", "retry_policies.x.max_attempts");
    expectKey("escalation_rules:\n  - id: r\n    redirect_to: t\n", "escalation_rules[0].source_tool");
    expectKey("escalation_rules:\n  - source_tool: s\n    id: r\n", "escalation_rules[0].redirect_to");
    expectKey("escalation_rules:\n  - source_tool: s\n    id: r\n    action: abort\n    conditions:\n"
              "      - field: f\n        operator: like\n", "escalation_rules[0].conditions[0].operator");
}

TEST_F(EngineConfigTest, MalformedDocumentsThrow) {
    EXPECT_THROW(loader_.loadFromString("coordination: [oops"), ConfigError);
    EXPECT_THROW(loader_.loadFromString("- a\n- b\n"), ConfigError);
    EXPECT_THROW(loader_.loadFromFile("/nonexistent/ckw.yaml"), ConfigError);
}

TEST_F(EngineConfigTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "ckw_engine_config_test.yaml";
    {
        std::ofstream file(path);
        file << kFullConfig;
    }
    EngineConfig config = loader_.loadFromFile(path.string());
    EXPECT_EQ(config.escalation_rules.size(), 2u);
    std::filesystem::remove(path);
}
