// EN: Unit tests for the workflow session model
// FR: Tests unitaires du modèle de session de workflow

#include <gtest/gtest.h>

#include "workflow/workflow_types.hpp"

using namespace CKW;
using namespace CKW::Workflow;

TEST(WorkflowSessionTest, StageLifecycleKeepsCurrentStageOutOfCompleted) {
    WorkflowSession session;
    session.id = "session_1";

    session.beginStage("analyze_repository");
    EXPECT_EQ(session.status, WorkflowStatus::RUNNING);
    EXPECT_EQ(session.current_stage, "analyze_repository");
    EXPECT_TRUE(session.checkInvariants());

    session.completeStage("analyze_repository", {{"language", "go"}});
    EXPECT_TRUE(session.isStageCompleted("analyze_repository"));
    EXPECT_TRUE(session.current_stage.empty());
    EXPECT_EQ(session.stage_results.at("analyze_repository")["language"], "go");
    EXPECT_TRUE(session.checkInvariants());
}

TEST(WorkflowSessionTest, RedirectedCorrectionReopensCompletedStage) {
    WorkflowSession session;
    session.beginStage("generate_dockerfile");
    session.completeStage("generate_dockerfile", nlohmann::json::object());
    session.beginStage("build_image");
    session.failStage("build_image");

    session.beginStage("generate_dockerfile");
    EXPECT_FALSE(session.isStageCompleted("generate_dockerfile"));
    EXPECT_EQ(session.current_stage, "generate_dockerfile");
    EXPECT_TRUE(session.checkInvariants());
    EXPECT_TRUE(session.isStageFailed("build_image"));
}

TEST(WorkflowSessionTest, FailAndSkipTransitions) {
    WorkflowSession session;
    session.beginStage("scan_image");
    session.failStage("scan_image");
    EXPECT_TRUE(session.isStageFailed("scan_image"));
    session.failStage("scan_image");
    EXPECT_EQ(session.failed_stages.size(), 1u);

    session.beginStage("scan_image");
    EXPECT_FALSE(session.isStageFailed("scan_image"));
    session.skipStage("scan_image");
    EXPECT_TRUE(session.current_stage.empty());
    ASSERT_EQ(session.skipped_stages.size(), 1u);
}

TEST(WorkflowSessionTest, InvariantViolationIsDetected) {
    WorkflowSession session;
    session.completed_stages = {"build_image"};
    session.current_stage = "build_image";
    EXPECT_FALSE(session.checkInvariants());
}

TEST(WorkflowTypesTest, StatusAndSeverityStrings) {
    EXPECT_EQ(workflowStatusToString(WorkflowStatus::PAUSED), "paused");
    EXPECT_EQ(parseWorkflowStatus("Canceled"), WorkflowStatus::CANCELLED);
    EXPECT_FALSE(parseWorkflowStatus("exploded").has_value());

    EXPECT_EQ(parseErrorSeverity("CRITICAL"), ErrorSeverity::CRITICAL);
    EXPECT_EQ(parseErrorSeverity("unknown"), ErrorSeverity::MEDIUM);
    EXPECT_EQ(errorSeverityToString(ErrorSeverity::HIGH), "high");
}

TEST(WorkflowTypesTest, WorkflowErrorJson) {
    WorkflowError error;
    error.id = "e1";
    error.message = "Dockerfile syntax error";
    error.error_type = "build_error";
    error.severity = ErrorSeverity::HIGH;
    error.retryable = false;
    error.stage_name = "build";
    error.tool_name = "build_image";
    error.timestamp = TimeUtils::fromUnixMicros(1700000000000000LL);

    nlohmann::json j = error;
    EXPECT_EQ(j["severity"], "high");
    EXPECT_EQ(j["timestamp"], "2023-11-14T22:13:20.000000Z");

    WorkflowError decoded = j.get<WorkflowError>();
    EXPECT_EQ(decoded.tool_name, "build_image");
    EXPECT_FALSE(decoded.retryable);
    EXPECT_EQ(decoded.timestamp, error.timestamp);

    // EN: Missing fields fall back to defaults.
    // FR: Les champs absents prennent leurs valeurs par défaut.
    WorkflowError sparse = nlohmann::json{{"message", "x"}}.get<WorkflowError>();
    EXPECT_TRUE(sparse.retryable);
    EXPECT_EQ(sparse.severity, ErrorSeverity::MEDIUM);
}

TEST(WorkflowTypesTest, WorkflowExceptionCarriesError) {
    WorkflowError error;
    error.message = "boom";
    error.error_type = "network_timeout";
    WorkflowException exception(error);
    EXPECT_STREQ(exception.what(), "boom");
    EXPECT_EQ(exception.error().error_type, "network_timeout");
}

TEST(TimeUtilsTest, Rfc3339RoundTripAndOffsets) {
    TimePoint tp = TimeUtils::fromUnixMicros(1700000000123456LL);
    EXPECT_EQ(TimeUtils::toRfc3339(tp), "2023-11-14T22:13:20.123456Z");
    EXPECT_EQ(TimeUtils::fromRfc3339("2023-11-14T22:13:20.123456Z"), tp);

    auto offset = TimeUtils::fromRfc3339("2023-11-14T23:13:20+01:00");
    ASSERT_TRUE(offset.has_value());
    EXPECT_EQ(TimeUtils::toUnixMicros(*offset), 1700000000000000LL);

    EXPECT_FALSE(TimeUtils::fromRfc3339("yesterday").has_value());
}
