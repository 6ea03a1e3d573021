// EN: Unit tests for the in-memory session manager
// FR: Tests unitaires du gestionnaire de sessions en mémoire

#include <gtest/gtest.h>

#include "workflow/session_manager.hpp"
#include "test_helpers.hpp"

#include <set>
#include <thread>

using namespace CKW;
using namespace CKW::Workflow;
using namespace std::chrono_literals;

class SessionManagerTest : public ::testing::Test {
protected:
    Testing::LogCapture capture_{LogLevel::INFO};
    Testing::ManualClock clock_;
    InMemorySessionManager manager_{std::chrono::hours(1), clock_.callable()};
};

TEST_F(SessionManagerTest, CreateAssignsUniqueIdsAndTimestamps) {
    WorkflowSession first = manager_.createSession("containerization");
    WorkflowSession second = manager_.createSession("containerization");

    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(first.id.rfind("session_", 0), 0u);
    EXPECT_EQ(first.status, WorkflowStatus::PENDING);
    EXPECT_EQ(first.workflow_id, "containerization");
    EXPECT_EQ(first.created_at, clock_.now());
    EXPECT_EQ(first.last_activity, first.created_at);
    EXPECT_EQ(manager_.sessionCount(), 2u);
    EXPECT_EQ(capture_.count(LogLevel::INFO, "session_manager"), 2u);
}

TEST_F(SessionManagerTest, SpecReferenceNamesTheWorkflowId) {
    WorkflowSpecRef spec;
    spec.name = "containerize";
    spec.version = "1.2.0";
    WorkflowSession session = manager_.createSession("containerization", spec);

    EXPECT_EQ(session.workflow_id, "containerize@1.2.0");
    ASSERT_TRUE(session.workflow_spec.has_value());
}

TEST_F(SessionManagerTest, GetReturnsCopy) {
    WorkflowSession created = manager_.createSession("wf");
    auto fetched = manager_.getSession(created.id);
    ASSERT_TRUE(fetched.has_value());
    fetched->current_stage = "mutated";

    EXPECT_TRUE(manager_.getSession(created.id)->current_stage.empty());
    EXPECT_FALSE(manager_.getSession("session_missing").has_value());
}

TEST_F(SessionManagerTest, UpdateRequiresExistingSession) {
    WorkflowSession session = manager_.createSession("wf");
    session.beginStage("analyze_repository");
    manager_.updateSession(session);
    EXPECT_EQ(manager_.getSession(session.id)->current_stage, "analyze_repository");

    WorkflowSession unknown;
    unknown.id = "session_unknown";
    try {
        manager_.updateSession(unknown);
        FAIL() << "Expected SessionNotFoundError";
    } catch (const SessionNotFoundError& e) {
        EXPECT_EQ(e.sessionId(), "session_unknown");
    }
}

TEST_F(SessionManagerTest, RestoreInsertsOrReplaces) {
    WorkflowSession restored;
    restored.id = "session_restored";
    restored.completed_stages = {"analyze_repository"};
    manager_.restoreSession(restored);
    EXPECT_TRUE(manager_.getSession("session_restored")->isStageCompleted("analyze_repository"));

    restored.completed_stages.clear();
    manager_.restoreSession(restored);
    EXPECT_TRUE(manager_.getSession("session_restored")->completed_stages.empty());

    EXPECT_THROW(manager_.restoreSession(WorkflowSession{}), std::invalid_argument);
}

TEST_F(SessionManagerTest, ModifyRefreshesLastActivity) {
    WorkflowSession session = manager_.createSession("wf");
    clock_.advance(5min);

    EXPECT_TRUE(manager_.modifySession(session.id, [](WorkflowSession& s) {
        s.shared_context["language"] = "go";
    }));
    auto updated = manager_.getSession(session.id);
    EXPECT_EQ(updated->shared_context.at("language"), "go");
    EXPECT_EQ(updated->last_activity, clock_.now());

    EXPECT_FALSE(manager_.modifySession("session_missing", [](WorkflowSession&) {}));
}

TEST_F(SessionManagerTest, DeleteAndList) {
    WorkflowSession a = manager_.createSession("wf_a");
    manager_.createSession("wf_b");

    EXPECT_TRUE(manager_.deleteSession(a.id));
    EXPECT_FALSE(manager_.deleteSession(a.id));

    auto sessions = manager_.listSessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].workflow_name, "wf_b");
}

TEST_F(SessionManagerTest, ExpiredSessionsAreCleanedUp) {
    WorkflowSession stale = manager_.createSession("stale");
    clock_.advance(45min);
    WorkflowSession fresh = manager_.createSession("fresh");
    clock_.advance(30min);

    EXPECT_EQ(manager_.cleanupExpiredSessions(), 1u);
    EXPECT_FALSE(manager_.getSession(stale.id).has_value());
    EXPECT_TRUE(manager_.getSession(fresh.id).has_value());
    EXPECT_EQ(manager_.cleanupExpiredSessions(), 0u);
}

TEST_F(SessionManagerTest, ConcurrentCreationIsSafe) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this]() {
            for (int i = 0; i < 25; ++i) {
                manager_.createSession("parallel");
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::string> ids;
    for (const auto& session : manager_.listSessions()) {
        ids.insert(session.id);
    }
    EXPECT_EQ(ids.size(), 100u);
}
