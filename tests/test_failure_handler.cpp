// EN: Unit tests for the StageFailureHandler (fatal, escalated, retry, aborted and unhandled failures)
// FR: Tests unitaires du StageFailureHandler (échecs fatals, escaladés, retentés, abandonnés, non gérés)

#include <gtest/gtest.h>

#include "orchestrator/failure_handler.hpp"
#include "storage/memory_key_value_store.hpp"
#include "test_helpers.hpp"

using namespace CKW;
using namespace CKW::Orchestrator;
using namespace CKW::Workflow;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

WorkflowError makeError(const std::string& error_type, const std::string& message, bool retryable = true) {
    WorkflowError error;
    error.error_type = error_type;
    error.message = message;
    error.retryable = retryable;
    error.tool_name = "build_image";
    return error;
}

} // namespace

class FailureHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sessions_ = std::make_shared<InMemorySessionManager>(24h, clock_.callable());
        router_ = std::make_shared<EscalationRouter>();

        bridge_ = std::make_shared<InProcessCommunicationBridge>();
        CoordinationConfig config;
        config.timeout = 5s;
        config.register_default_rules = false;
        engine_ = std::make_shared<CoordinationEngine>(bridge_, router_, config);
        engine_->registerTool("generate_dockerfile");
        engine_->registerTool("generate_manifests");
        engine_->registerTool("build_image", {"generate_dockerfile"});
        bridge_->registerHandler("generate_dockerfile", [this](const CancellationToken&, const ToolMessage& message) {
            dispatched_.push_back(message);
            CoordinationResult result;
            result.success = true;
            result.output = json{{"dockerfile", "regenerated"}};
            engine_->completeCoordination(message.correlation_id, result);
        });

        auto store = std::make_shared<CheckpointStore>(std::make_shared<Storage::MemoryKeyValueStore>(),
                                                       CheckpointStoreConfig{}, clock_.callable());
        resume_ = std::make_shared<ResumeSystem>(store, sessions_);
        handler_ = std::make_unique<StageFailureHandler>(sessions_, router_, engine_, resume_);

        session_id_ = sessions_->createSession("containerization").id;
        sessions_->modifySession(session_id_, [this](WorkflowSession& s) {
            s.beginStage("build_image", clock_.now());
        });
    }

    WorkflowSession session() { return *sessions_->getSession(session_id_); }

    Testing::LogCapture capture_{LogLevel::INFO};
    Testing::ManualClock clock_;
    std::shared_ptr<InMemorySessionManager> sessions_;
    std::shared_ptr<EscalationRouter> router_;
    std::shared_ptr<InProcessCommunicationBridge> bridge_;
    std::shared_ptr<CoordinationEngine> engine_;
    std::shared_ptr<ResumeSystem> resume_;
    std::unique_ptr<StageFailureHandler> handler_;
    std::string session_id_;
    std::vector<ToolMessage> dispatched_;
};

TEST_F(FailureHandlerTest, ConstructionAndUnknownSession) {
    EXPECT_THROW(StageFailureHandler(nullptr, router_, engine_), std::invalid_argument);
    EXPECT_THROW(handler_->handleFailure("session_missing", makeError("build_error", "x")), SessionNotFoundError);
}

TEST_F(FailureHandlerTest, CriticalFailureIsFatal) {
    WorkflowError error = makeError("build_error", "daemon crashed");
    error.severity = ErrorSeverity::CRITICAL;

    FailureDecision decision = handler_->handleFailure(session_id_, error);
    EXPECT_EQ(decision.disposition, FailureDisposition::FATAL);
    EXPECT_EQ(decision.stage_name, "build_image");
    EXPECT_TRUE(decision.rule_id.empty());
    ASSERT_TRUE(decision.checkpoint_id.has_value());

    WorkflowSession stored = session();
    EXPECT_EQ(stored.status, WorkflowStatus::FAILED);
    EXPECT_TRUE(stored.isStageFailed("build_image"));
    ASSERT_EQ(stored.checkpoints.size(), 1u);
    EXPECT_EQ(stored.checkpoints[0].checkpoint_id, *decision.checkpoint_id);
    EXPECT_EQ(capture_.count(LogLevel::ERROR, "failure_handler"), 1u);
    EXPECT_TRUE(dispatched_.empty());
}

TEST_F(FailureHandlerTest, FatalKeywordSkipsEscalation) {
    FailureDecision decision = handler_->handleFailure(
        session_id_, makeError("registry_permission_denied", "Dockerfile push denied"));
    EXPECT_EQ(decision.disposition, FailureDisposition::FATAL);
    EXPECT_TRUE(dispatched_.empty());
}

TEST_F(FailureHandlerTest, DockerfileFailureEscalatesAndDispatches) {
    FailureDecision decision = handler_->handleFailure(
        session_id_, makeError("build_error", "Dockerfile syntax error at line 3"), json{{"exit_code", 1}});

    EXPECT_EQ(decision.disposition, FailureDisposition::ESCALATED);
    EXPECT_EQ(decision.rule_id, "build_dockerfile_errors");
    EXPECT_EQ(decision.redirect_to, "generate_dockerfile");
    EXPECT_EQ(decision.source_tool, "build_image");
    EXPECT_TRUE(EscalationUtils::isEscalated(decision.parameters));
    EXPECT_EQ(decision.retry_policy_class, "escalated_build");
    ASSERT_TRUE(decision.retry_policy.has_value());
    EXPECT_EQ(decision.retry_policy->max_attempts, 2u);

    ASSERT_TRUE(decision.coordination.has_value());
    EXPECT_TRUE(decision.coordination->success);
    EXPECT_EQ(decision.coordination->output["dockerfile"], "regenerated");
    ASSERT_EQ(dispatched_.size(), 1u);
    EXPECT_EQ(dispatched_[0].payload["data"]["exit_code"], 1);
    EXPECT_EQ(dispatched_[0].context["session_id"], session_id_);

    WorkflowSession stored = session();
    EXPECT_NE(stored.status, WorkflowStatus::FAILED);
    EXPECT_EQ(stored.shared_context.at("_redirect_from_build_image"), "generate_dockerfile");
    EXPECT_EQ(stored.shared_context.at("_redirect_reason_build_image"), "Dockerfile syntax error at line 3");
    EXPECT_TRUE(decision.checkpoint_id.has_value());
}

TEST_F(FailureHandlerTest, RetryableUnmatchedFailureRetriesUnderToolPolicy) {
    FailureDecision decision = handler_->handleFailure(session_id_, makeError("network_error", "registry timeout"));

    EXPECT_EQ(decision.disposition, FailureDisposition::RETRY);
    EXPECT_EQ(decision.retry_policy_class, "build_image");
    ASSERT_TRUE(decision.retry_policy.has_value());
    EXPECT_EQ(decision.retry_policy->max_attempts, 3u);
    EXPECT_EQ(decision.retry_policy->backoff, BackoffMode::EXPONENTIAL);
    EXPECT_FALSE(decision.coordination.has_value());
    EXPECT_NE(session().status, WorkflowStatus::FAILED);
}

TEST_F(FailureHandlerTest, NonRetryableUnmatchedFailureFailsTheSession) {
    FailureDecision decision =
        handler_->handleFailure(session_id_, makeError("invalid_input", "unsupported language", false));
    EXPECT_EQ(decision.disposition, FailureDisposition::UNHANDLED);
    EXPECT_FALSE(decision.retry_policy.has_value());
    EXPECT_EQ(session().status, WorkflowStatus::FAILED);
}

TEST_F(FailureHandlerTest, RetryAndAbortRules) {
    ErrorRoutingRule retry;
    retry.id = "flaky_registry";
    retry.action = RoutingAction::RETRY;
    retry.conditions = {RuleCondition{ConditionType::FIELD, "error_type", ConditionOperator::EQUALS, "registry_error"}};
    router_->addRule("build_image", retry);

    ErrorRoutingRule abort;
    abort.id = "license_violation";
    abort.action = RoutingAction::ABORT;
    abort.conditions = {RuleCondition{ConditionType::FIELD, "error_type", ConditionOperator::EQUALS, "license_error"}};
    router_->addRule("build_image", abort);

    FailureDecision retried = handler_->handleFailure(session_id_, makeError("registry_error", "503", false));
    EXPECT_EQ(retried.disposition, FailureDisposition::RETRY);
    EXPECT_EQ(retried.rule_id, "flaky_registry");
    EXPECT_EQ(retried.retry_policy_class, "build_image");
    EXPECT_NE(session().status, WorkflowStatus::FAILED);

    FailureDecision aborted = handler_->handleFailure(session_id_, makeError("license_error", "GPL base image"));
    EXPECT_EQ(aborted.disposition, FailureDisposition::ABORTED);
    EXPECT_EQ(session().status, WorkflowStatus::FAILED);
    EXPECT_TRUE(dispatched_.empty());
}

TEST_F(FailureHandlerTest, WithoutEngineRedirectIsDecidedOnly) {
    StageFailureHandler handler(sessions_, router_, nullptr);
    FailureDecision decision = handler.handleFailure(session_id_, makeError("build_error", "Dockerfile invalid"));
    EXPECT_EQ(decision.disposition, FailureDisposition::ESCALATED);
    EXPECT_FALSE(decision.coordination.has_value());
    EXPECT_FALSE(decision.checkpoint_id.has_value());
    EXPECT_TRUE(dispatched_.empty());
}

TEST_F(FailureHandlerTest, EscalationCanBeDisabled) {
    FailureHandlerConfig config;
    config.enable_escalation = false;
    config.checkpoint_on_failure = false;
    StageFailureHandler handler(sessions_, router_, engine_, resume_, config);

    FailureDecision decision = handler.handleFailure(session_id_, makeError("build_error", "Dockerfile invalid"));
    EXPECT_EQ(decision.disposition, FailureDisposition::RETRY);
    EXPECT_FALSE(decision.checkpoint_id.has_value());
    EXPECT_TRUE(session().checkpoints.empty());

    StageFailureHandler no_router(sessions_, nullptr, nullptr);
    FailureDecision fallback = no_router.handleFailure(session_id_, makeError("build_error", "Dockerfile invalid"));
    EXPECT_EQ(fallback.disposition, FailureDisposition::RETRY);
    EXPECT_EQ(fallback.retry_policy, RetryPolicy{});
}

TEST_F(FailureHandlerTest, CoordinationFailurePropagatesAfterRecording) {
    CoordinationConfig config;
    config.register_default_rules = false;
    auto engine = std::make_shared<CoordinationEngine>(bridge_, router_, config);
    engine->registerTool("build_image");
    StageFailureHandler handler(sessions_, router_, engine, resume_);

    EXPECT_THROW(handler.handleFailure(session_id_, makeError("build_error", "Dockerfile invalid")), CoordinationError);

    WorkflowSession stored = session();
    EXPECT_TRUE(stored.isStageFailed("build_image"));
    EXPECT_EQ(stored.shared_context.count("_redirect_from_build_image"), 1u);
    EXPECT_TRUE(stored.checkpoints.empty());
}

TEST(FailureDispositionTest, Names) {
    EXPECT_EQ(failureDispositionToString(FailureDisposition::FATAL), "fatal");
    EXPECT_EQ(failureDispositionToString(FailureDisposition::ESCALATED), "escalated");
    EXPECT_EQ(failureDispositionToString(FailureDisposition::RETRY), "retry");
    EXPECT_EQ(failureDispositionToString(FailureDisposition::ABORTED), "aborted");
    EXPECT_EQ(failureDispositionToString(FailureDisposition::UNHANDLED), "unhandled");
}
