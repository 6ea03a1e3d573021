#pragma once

#include "workflow/workflow_types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace CKW::Workflow {

class SessionNotFoundError : public std::runtime_error {
public:
    explicit SessionNotFoundError(const std::string& session_id)
        : std::runtime_error("Session not found: " + session_id), session_id_(session_id) {}

    const std::string& sessionId() const { return session_id_; }

private:
    std::string session_id_;
};

// EN: Owner of live sessions. Supplies the session to checkpoint and accepts a rebuilt one on restore.
// FR: Propriétaire des sessions actives. Fournit la session à sauvegarder et accepte celle reconstruite.
class SessionManager {
public:
    virtual ~SessionManager() = default;

    virtual std::optional<WorkflowSession> getSession(const std::string& session_id) = 0;

    // EN: Throws SessionNotFoundError when the session does not exist.
    // FR: Lève SessionNotFoundError si la session n'existe pas.
    virtual void updateSession(const WorkflowSession& session) = 0;

    // EN: Inserts or replaces the session as rebuilt from a checkpoint.
    // FR: Insère ou remplace la session reconstruite depuis un checkpoint.
    virtual void restoreSession(const WorkflowSession& session) = 0;
};

// EN: Process-local session table with TTL expiry on last activity.
// FR: Table de sessions locale au processus avec expiration TTL sur la dernière activité.
class InMemorySessionManager : public SessionManager {
public:
    using Clock = std::function<TimePoint()>;

    explicit InMemorySessionManager(std::chrono::milliseconds ttl = std::chrono::hours(24), Clock clock = nullptr);

    WorkflowSession createSession(const std::string& workflow_name,
                                  const std::optional<WorkflowSpecRef>& spec = std::nullopt);

    std::optional<WorkflowSession> getSession(const std::string& session_id) override;
    void updateSession(const WorkflowSession& session) override;
    void restoreSession(const WorkflowSession& session) override;

    // EN: Applies `mutation` under the table lock and refreshes last_activity. False when unknown.
    // FR: Applique `mutation` sous le verrou de la table et rafraîchit last_activity. False si inconnue.
    bool modifySession(const std::string& session_id, const std::function<void(WorkflowSession&)>& mutation);

    bool deleteSession(const std::string& session_id);
    std::vector<WorkflowSession> listSessions() const;
    size_t sessionCount() const;

    // EN: Drops sessions whose last activity is older than now - ttl.
    // FR: Supprime les sessions dont la dernière activité date de plus de now - ttl.
    size_t cleanupExpiredSessions();

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    TimePoint now() const;

    std::chrono::milliseconds ttl_;
    Clock clock_;
    std::map<std::string, WorkflowSession> sessions_;
    mutable std::mutex mutex_;
};

} // namespace CKW::Workflow
