// EN: Unit tests for the versioned session state codec
// FR: Tests unitaires du codec versionné d'état de session

#include <gtest/gtest.h>

#include "workflow/session_snapshot.hpp"

using namespace CKW;
using namespace CKW::Workflow;
using nlohmann::json;

namespace {

WorkflowSession makeSession() {
    WorkflowSession session;
    session.id = "session_42";
    session.workflow_id = "wf_containerize";
    session.workflow_name = "containerization";
    session.status = WorkflowStatus::RUNNING;
    session.completed_stages = {"analyze_repository", "generate_dockerfile"};
    session.current_stage = "build_image";
    session.shared_context = {{"language", "go"}, {"port", 8080}};
    session.resource_bindings = {{"image", "registry.local/app:1"}};
    session.created_at = TimeUtils::fromUnixMicros(1700000000000000LL);
    session.last_activity = TimeUtils::fromUnixMicros(1700000000500000LL);
    return session;
}

} // namespace

TEST(SessionSnapshotTest, FullSnapshotIsTaggedWithCurrentVersion) {
    SessionSnapshot snapshot = SessionSnapshot::fromSession(makeSession());
    json document = SessionStateCodec::toJson(snapshot);

    EXPECT_EQ(document["schema_version"], kSessionSchemaVersion);
    EXPECT_EQ(document["kind"], "full");
    EXPECT_EQ(document["session_id"], "session_42");
    EXPECT_EQ(document["status"], "running");
    EXPECT_EQ(document["created_at"], "2023-11-14T22:13:20.000000Z");

    SessionState decoded = SessionStateCodec::fromJson(document);
    ASSERT_TRUE(std::holds_alternative<SessionSnapshot>(decoded));
    const auto& restored = std::get<SessionSnapshot>(decoded);
    EXPECT_EQ(restored.workflow_name, "containerization");
    EXPECT_EQ(restored.completed_stages, snapshot.completed_stages);
    EXPECT_EQ(restored.shared_context.at("port"), 8080);
    EXPECT_EQ(restored.resource_bindings.at("image"), "registry.local/app:1");
    EXPECT_EQ(restored.last_activity, snapshot.last_activity);
}

TEST(SessionSnapshotTest, ApplyToCopiesTrackedFields) {
    WorkflowSession original = makeSession();
    SessionSnapshot snapshot = SessionSnapshot::fromSession(original);

    WorkflowSession target;
    target.stage_results["analyze_repository"] = json{{"kept", true}};
    snapshot.applyTo(target);

    EXPECT_EQ(target.id, original.id);
    EXPECT_EQ(target.current_stage, "build_image");
    EXPECT_EQ(target.completed_stages, original.completed_stages);
    EXPECT_EQ(target.stage_results.count("analyze_repository"), 1u);
}

TEST(SessionSnapshotTest, UntaggedDocumentReadsAsVersionOne) {
    json legacy = {
        {"id", "legacy_session"},
        {"workflow_name", "containerization"},
        {"completed_stages", {"analyze_repository", 7}},
        {"start_time", "2023-11-14T22:13:20Z"},
        {"shared_context", "not-a-map"}
    };
    EXPECT_EQ(SessionStateCodec::detectSchemaVersion(legacy), 1);

    SessionState decoded = SessionStateCodec::fromJson(legacy);
    ASSERT_TRUE(std::holds_alternative<SessionSnapshot>(decoded));
    const auto& snapshot = std::get<SessionSnapshot>(decoded);
    EXPECT_EQ(snapshot.session_id, "legacy_session");
    EXPECT_EQ(snapshot.status, WorkflowStatus::PENDING);
    EXPECT_EQ(snapshot.completed_stages, std::vector<std::string>{"analyze_repository"});
    EXPECT_TRUE(snapshot.shared_context.empty());
    EXPECT_EQ(TimeUtils::toUnixMicros(snapshot.created_at), 1700000000000000LL);
    EXPECT_EQ(snapshot.last_activity, snapshot.created_at);
}

TEST(SessionSnapshotTest, VersionOneDeltaIsDetectedByShape) {
    json legacy_delta = {
        {"session_id", "legacy_session"},
        {"new_completed_stages", json::array({"build_image"})},
        {"context_updates", {{"image_id", "sha256:abc"}}}
    };
    SessionState decoded = SessionStateCodec::fromJson(legacy_delta);
    ASSERT_TRUE(std::holds_alternative<SessionDelta>(decoded));
    const auto& delta = std::get<SessionDelta>(decoded);
    EXPECT_EQ(delta.new_completed_stages, std::vector<std::string>{"build_image"});
    EXPECT_EQ(delta.context_updates.at("image_id"), "sha256:abc");
    EXPECT_FALSE(delta.status.has_value());
}

TEST(SessionSnapshotTest, GarbageNeverThrows) {
    EXPECT_NO_THROW(SessionStateCodec::fromJson(json::array({1, 2, 3})));
    EXPECT_NO_THROW(SessionStateCodec::fromJson(json("text")));
    EXPECT_NO_THROW(SessionStateCodec::fromJson(json{{"schema_version", "two"}, {"status", 5}}));
    EXPECT_EQ(SessionStateCodec::detectSchemaVersion(json{{"schema_version", "two"}}), 1);
}

TEST(SessionSnapshotTest, ComputeDeltaCarriesOnlyChanges) {
    WorkflowSession session = makeSession();
    SessionSnapshot previous = SessionSnapshot::fromSession(session);

    session.completeStage("build_image", json{{"image_id", "sha256:abc"}},
                          TimeUtils::fromUnixMicros(1700000001000000LL));
    session.shared_context["image_id"] = "sha256:abc";

    SessionDelta delta = SessionStateCodec::computeDelta(session, previous);
    EXPECT_EQ(delta.session_id, "session_42");
    EXPECT_FALSE(delta.status.has_value());
    ASSERT_TRUE(delta.current_stage.has_value());
    EXPECT_TRUE(delta.current_stage->empty());
    EXPECT_EQ(delta.new_completed_stages, std::vector<std::string>{"build_image"});
    EXPECT_TRUE(delta.reopened_stages.empty());
    EXPECT_EQ(delta.context_updates.size(), 1u);
    EXPECT_TRUE(delta.binding_updates.empty());
    EXPECT_EQ(TimeUtils::toUnixMicros(delta.last_activity), 1700000001000000LL);

    json document = SessionStateCodec::toJson(delta);
    EXPECT_EQ(document["kind"], "delta");
    EXPECT_FALSE(document.contains("status"));
    EXPECT_FALSE(document.contains("reopened_stages"));
}

TEST(SessionSnapshotTest, ApplyDeltaReproducesCurrentState) {
    WorkflowSession session = makeSession();
    SessionSnapshot base = SessionSnapshot::fromSession(session);

    // EN: Redirect back to an earlier stage after a failure.
    // FR: Redirection vers une étape antérieure après un échec.
    session.failStage("build_image");
    session.beginStage("generate_dockerfile");
    session.resource_bindings["image"] = "registry.local/app:2";

    SessionDelta delta = SessionStateCodec::computeDelta(session, base);
    EXPECT_EQ(delta.reopened_stages, std::vector<std::string>{"generate_dockerfile"});
    EXPECT_EQ(delta.new_failed_stages, std::vector<std::string>{"build_image"});

    SessionState decoded = SessionStateCodec::fromJson(SessionStateCodec::toJson(delta));
    ASSERT_TRUE(std::holds_alternative<SessionDelta>(decoded));
    SessionStateCodec::applyDelta(base, std::get<SessionDelta>(decoded));

    SessionSnapshot expected = SessionSnapshot::fromSession(session);
    EXPECT_EQ(base.completed_stages, expected.completed_stages);
    EXPECT_EQ(base.failed_stages, expected.failed_stages);
    EXPECT_EQ(base.current_stage, "generate_dockerfile");
    EXPECT_EQ(base.resource_bindings.at("image"), "registry.local/app:2");
    EXPECT_EQ(base.last_activity, expected.last_activity);
}

TEST(SessionSnapshotTest, ClearedFailuresAreRemoved) {
    SessionSnapshot base;
    base.session_id = "s";
    base.failed_stages = {"build_image", "scan_image"};

    SessionDelta delta;
    delta.session_id = "s";
    delta.cleared_failed_stages = {"build_image"};
    delta.new_failed_stages = {"scan_image"};
    SessionStateCodec::applyDelta(base, delta);

    EXPECT_EQ(base.failed_stages, std::vector<std::string>{"scan_image"});
}

TEST(SessionSnapshotTest, RemovedEntriesSurviveTheDeltaDocument) {
    WorkflowSession session = makeSession();
    session.skipped_stages = {"scan_image"};
    session.resource_bindings["cache"] = "volume/build-cache";
    SessionSnapshot base = SessionSnapshot::fromSession(session);

    session.shared_context.erase("port");
    session.resource_bindings.erase("image");
    session.skipped_stages.clear();

    SessionDelta delta = SessionStateCodec::computeDelta(session, base);
    EXPECT_EQ(delta.removed_context_keys, std::vector<std::string>{"port"});
    EXPECT_EQ(delta.removed_bindings, std::vector<std::string>{"image"});
    EXPECT_EQ(delta.unskipped_stages, std::vector<std::string>{"scan_image"});
    EXPECT_TRUE(delta.context_updates.empty());
    EXPECT_TRUE(delta.binding_updates.empty());

    json document = SessionStateCodec::toJson(delta);
    EXPECT_EQ(document["removed_context_keys"], json::array({"port"}));
    EXPECT_FALSE(document.contains("removed_stage_results"));

    SessionState decoded = SessionStateCodec::fromJson(document);
    ASSERT_TRUE(std::holds_alternative<SessionDelta>(decoded));
    SessionStateCodec::applyDelta(base, std::get<SessionDelta>(decoded));

    EXPECT_EQ(base.shared_context.count("port"), 0u);
    EXPECT_EQ(base.shared_context.at("language"), "go");
    EXPECT_EQ(base.resource_bindings.count("image"), 0u);
    EXPECT_EQ(base.resource_bindings.at("cache"), "volume/build-cache");
    EXPECT_TRUE(base.skipped_stages.empty());
}

TEST(SessionSnapshotTest, RemovedStageResultsRoundTrip) {
    SessionDelta delta;
    delta.session_id = "s";
    delta.removed_stage_results = {"build_image"};

    SessionState decoded = SessionStateCodec::fromJson(SessionStateCodec::toJson(delta));
    ASSERT_TRUE(std::holds_alternative<SessionDelta>(decoded));
    EXPECT_EQ(std::get<SessionDelta>(decoded).removed_stage_results, std::vector<std::string>{"build_image"});
}
