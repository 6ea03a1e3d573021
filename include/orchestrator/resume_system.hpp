// EN: Resume System for CK-Workflow - checkpoint live sessions and rebuild them after a restart
// FR: Système de reprise pour CK-Workflow - sauvegarde des sessions actives et reconstruction après redémarrage

#pragma once

#include "orchestrator/checkpoint_store.hpp"
#include "workflow/session_manager.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace CKW::Orchestrator {

// EN: Resume behaviour configuration.
// FR: Configuration du comportement de reprise.
struct ResumeConfig {
    bool incremental = true;                             // EN: Delta checkpoints after the first one / FR: Checkpoints delta après le premier
    bool checkpoint_on_failure = true;                   // EN: Checkpoint after a failure decision / FR: Checkpoint après une décision d'échec
    std::chrono::hours cleanup_age{24 * 7};              // EN: Default age for cleanupOldCheckpoints() / FR: Âge par défaut pour cleanupOldCheckpoints()
};

// EN: Resume statistics for monitoring.
// FR: Statistiques de reprise pour le monitoring.
struct ResumeStatistics {
    size_t total_checkpoints_created = 0;
    size_t incremental_checkpoints_created = 0;
    size_t failed_checkpoints = 0;
    size_t total_resumes = 0;
    size_t successful_resumes = 0;
    size_t failed_resumes = 0;
    size_t checkpoints_cleaned = 0;
    std::chrono::milliseconds total_recovery_time{0};
    std::chrono::milliseconds average_recovery_time{0};
    std::map<std::string, size_t> stage_resume_counts;   // EN: Resumes by checkpoint stage / FR: Reprises par étape du checkpoint
};

// EN: Glue between the session manager and the checkpoint store.
// FR: Liaison entre le gestionnaire de sessions et le magasin de checkpoints.
class ResumeSystem {
public:
    ResumeSystem(std::shared_ptr<CheckpointStore> store,
                 std::shared_ptr<Workflow::SessionManager> sessions,
                 const ResumeConfig& config = ResumeConfig{});

    ResumeSystem(const ResumeSystem&) = delete;
    ResumeSystem& operator=(const ResumeSystem&) = delete;

    // EN: Checkpoint the live session (full or incremental per config) and record the reference on it.
    //     Throws Workflow::SessionNotFoundError for an unknown session.
    // FR: Sauvegarde la session active (complète ou incrémentale selon la config) et y note la référence.
    //     Lève Workflow::SessionNotFoundError pour une session inconnue.
    WorkflowCheckpoint checkpointSession(const std::string& session_id, const std::string& stage_name,
                                         const std::string& message);

    // EN: Rebuild from the newest checkpoint and hand the session back to the manager; nullopt when
    //     the session has no checkpoint.
    // FR: Reconstruit depuis le checkpoint le plus récent et rend la session au gestionnaire ; nullopt
    //     si la session n'a aucun checkpoint.
    std::optional<Workflow::WorkflowSession> resumeSession(const std::string& session_id);

    Workflow::WorkflowSession resumeFromCheckpoint(const std::string& session_id, const std::string& checkpoint_id);

    bool canResume(const std::string& session_id) const;
    std::vector<WorkflowCheckpoint> getAvailableResumePoints(const std::string& session_id) const;

    size_t cleanupOldCheckpoints();
    size_t cleanupOldCheckpoints(std::chrono::milliseconds max_age);

    ResumeStatistics getStatistics() const;
    void resetStatistics();

    const ResumeConfig& getConfig() const { return config_; }
    CheckpointStore& checkpointStore() { return *store_; }

private:
    Workflow::WorkflowSession restore(const std::string& session_id, const std::string& checkpoint_id,
                                      const std::string& stage_name);
    void recordResume(bool success, const std::string& stage_name, std::chrono::milliseconds elapsed);

    std::shared_ptr<CheckpointStore> store_;
    std::shared_ptr<Workflow::SessionManager> sessions_;
    ResumeConfig config_;

    mutable std::mutex stats_mutex_;
    ResumeStatistics statistics_;
};

// EN: RAII helper: checkpoints the stage when the scope exits unless dismissed. Failures are logged,
//     never thrown from the destructor.
// FR: Helper RAII : sauvegarde l'étape à la sortie du scope sauf si annulé. Les échecs sont
//     journalisés, jamais levés depuis le destructeur.
class AutoCheckpointGuard {
public:
    AutoCheckpointGuard(ResumeSystem& resume_system, const std::string& session_id, const std::string& stage_name);
    ~AutoCheckpointGuard();

    AutoCheckpointGuard(const AutoCheckpointGuard&) = delete;
    AutoCheckpointGuard& operator=(const AutoCheckpointGuard&) = delete;

    void setMessage(const std::string& message) { message_ = message; }
    void dismiss() { dismissed_ = true; }

    // EN: Checkpoint now; the scope exit still checkpoints again unless dismissed.
    // FR: Sauvegarde immédiate ; la sortie du scope sauvegarde encore sauf si annulé.
    std::string forceCheckpoint();

    const std::string& lastCheckpointId() const { return last_checkpoint_id_; }

private:
    ResumeSystem& resume_system_;
    std::string session_id_;
    std::string stage_name_;
    std::string message_;
    bool dismissed_ = false;
    std::string last_checkpoint_id_;
};

} // namespace CKW::Orchestrator
