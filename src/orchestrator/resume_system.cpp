// EN: Resume System implementation for CK-Workflow
// FR: Implémentation du système de reprise pour CK-Workflow

#include "orchestrator/resume_system.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>

namespace CKW::Orchestrator {

ResumeSystem::ResumeSystem(std::shared_ptr<CheckpointStore> store,
                           std::shared_ptr<Workflow::SessionManager> sessions,
                           const ResumeConfig& config)
    : store_(std::move(store)), sessions_(std::move(sessions)), config_(config) {
    if (!store_ || !sessions_) {
        throw std::invalid_argument("ResumeSystem requires a checkpoint store and a session manager");
    }
}

WorkflowCheckpoint ResumeSystem::checkpointSession(const std::string& session_id, const std::string& stage_name,
                                                   const std::string& message) {
    auto session = sessions_->getSession(session_id);
    if (!session) {
        throw Workflow::SessionNotFoundError(session_id);
    }

    WorkflowCheckpoint checkpoint;
    try {
        checkpoint = config_.incremental
            ? store_->createIncrementalCheckpoint(*session, stage_name, message)
            : store_->createCheckpoint(*session, stage_name, message);
    } catch (const CheckpointError&) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        statistics_.failed_checkpoints++;
        throw;
    }

    session->checkpoints.push_back(Workflow::CheckpointRef{
        checkpoint.id, checkpoint.stage_name, checkpoint.timestamp, checkpoint.isIncremental()});
    sessions_->updateSession(*session);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        statistics_.total_checkpoints_created++;
        if (checkpoint.isIncremental()) {
            statistics_.incremental_checkpoints_created++;
        }
    }

    LOG_DEBUG("resume_system", "Checkpoint " + checkpoint.id + " taken for session " + session_id +
              " at stage '" + stage_name + "'" + (checkpoint.isIncremental() ? " (incremental)" : ""));
    return checkpoint;
}

std::optional<Workflow::WorkflowSession> ResumeSystem::resumeSession(const std::string& session_id) {
    auto latest = store_->findLatestCheckpoint(session_id);
    if (!latest) {
        LOG_INFO("resume_system", "No checkpoint to resume session " + session_id + " from");
        return std::nullopt;
    }
    return restore(session_id, latest->id, latest->stage_name);
}

Workflow::WorkflowSession ResumeSystem::resumeFromCheckpoint(const std::string& session_id,
                                                             const std::string& checkpoint_id) {
    return restore(session_id, checkpoint_id, "");
}

Workflow::WorkflowSession ResumeSystem::restore(const std::string& session_id, const std::string& checkpoint_id,
                                                const std::string& stage_name) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    };

    Workflow::WorkflowSession session;
    try {
        session = store_->restoreFromCheckpoint(session_id, checkpoint_id);

        // EN: Checkpoint references are not part of the snapshot; rebuild them oldest first.
        // FR: Les références de checkpoint ne font pas partie du snapshot ; reconstruites du plus ancien.
        auto checkpoints = store_->listCheckpoints(session_id);
        std::reverse(checkpoints.begin(), checkpoints.end());
        session.checkpoints.clear();
        for (const auto& checkpoint : checkpoints) {
            session.checkpoints.push_back(Workflow::CheckpointRef{
                checkpoint.id, checkpoint.stage_name, checkpoint.timestamp, checkpoint.isIncremental()});
        }

        sessions_->restoreSession(session);
    } catch (const std::exception& e) {
        recordResume(false, stage_name, elapsed());
        LOG_ERROR_META("resume_system", "Resume failed: " + std::string(e.what()),
            (std::unordered_map<std::string, std::string>{
                {"session_id", session_id},
                {"checkpoint_id", checkpoint_id}
            }));
        throw;
    }

    std::string resumed_stage = stage_name;
    if (resumed_stage.empty()) {
        auto ref = std::find_if(session.checkpoints.begin(), session.checkpoints.end(),
                                [&checkpoint_id](const Workflow::CheckpointRef& r) { return r.checkpoint_id == checkpoint_id; });
        if (ref != session.checkpoints.end()) {
            resumed_stage = ref->stage_name;
        }
    }
    recordResume(true, resumed_stage, elapsed());

    LOG_INFO_META("resume_system", "Session resumed from checkpoint", (std::unordered_map<std::string, std::string>{
        {"session_id", session_id},
        {"checkpoint_id", checkpoint_id},
        {"stage_name", resumed_stage},
        {"status", Workflow::workflowStatusToString(session.status)}
    }));
    return session;
}

bool ResumeSystem::canResume(const std::string& session_id) const {
    return store_->findLatestCheckpoint(session_id).has_value();
}

std::vector<WorkflowCheckpoint> ResumeSystem::getAvailableResumePoints(const std::string& session_id) const {
    return store_->listCheckpoints(session_id);
}

size_t ResumeSystem::cleanupOldCheckpoints() {
    return cleanupOldCheckpoints(std::chrono::duration_cast<std::chrono::milliseconds>(config_.cleanup_age));
}

size_t ResumeSystem::cleanupOldCheckpoints(std::chrono::milliseconds max_age) {
    const size_t removed = store_->cleanupExpiredCheckpoints(max_age);
    std::lock_guard<std::mutex> lock(stats_mutex_);
    statistics_.checkpoints_cleaned += removed;
    return removed;
}

ResumeStatistics ResumeSystem::getStatistics() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return statistics_;
}

void ResumeSystem::resetStatistics() {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    statistics_ = ResumeStatistics{};
}

void ResumeSystem::recordResume(bool success, const std::string& stage_name, std::chrono::milliseconds elapsed) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    statistics_.total_resumes++;
    if (!success) {
        statistics_.failed_resumes++;
        return;
    }
    statistics_.successful_resumes++;
    statistics_.total_recovery_time += elapsed;
    statistics_.average_recovery_time = std::chrono::milliseconds(
        statistics_.total_recovery_time.count() / static_cast<long long>(statistics_.successful_resumes));
    if (!stage_name.empty()) {
        statistics_.stage_resume_counts[stage_name]++;
    }
}

AutoCheckpointGuard::AutoCheckpointGuard(ResumeSystem& resume_system, const std::string& session_id,
                                         const std::string& stage_name)
    : resume_system_(resume_system), session_id_(session_id), stage_name_(stage_name),
      message_("Stage '" + stage_name + "' checkpoint") {}

AutoCheckpointGuard::~AutoCheckpointGuard() {
    if (dismissed_) {
        return;
    }
    try {
        last_checkpoint_id_ = resume_system_.checkpointSession(session_id_, stage_name_, message_).id;
    } catch (const std::exception& e) {
        LOG_ERROR_META("resume_system", "Automatic checkpoint failed: " + std::string(e.what()),
            (std::unordered_map<std::string, std::string>{
                {"session_id", session_id_},
                {"stage_name", stage_name_}
            }));
    }
}

std::string AutoCheckpointGuard::forceCheckpoint() {
    last_checkpoint_id_ = resume_system_.checkpointSession(session_id_, stage_name_, message_).id;
    return last_checkpoint_id_;
}

} // namespace CKW::Orchestrator
