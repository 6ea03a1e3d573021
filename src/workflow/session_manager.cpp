#include "workflow/session_manager.hpp"
#include "infrastructure/logging/logger.hpp"

#include <iomanip>
#include <random>
#include <sstream>

namespace CKW::Workflow {

namespace {

std::string generateSessionId() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::ostringstream ss;
    ss << "session_" << std::hex << std::setfill('0') << std::setw(16) << gen() << std::setw(16) << gen();
    return ss.str();
}

} // namespace

InMemorySessionManager::InMemorySessionManager(std::chrono::milliseconds ttl, Clock clock)
    : ttl_(ttl), clock_(std::move(clock)) {}

TimePoint InMemorySessionManager::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

WorkflowSession InMemorySessionManager::createSession(const std::string& workflow_name,
                                                      const std::optional<WorkflowSpecRef>& spec) {
    WorkflowSession session;
    session.id = generateSessionId();
    session.workflow_id = spec ? spec->name + "@" + spec->version : workflow_name;
    session.workflow_name = workflow_name;
    session.workflow_spec = spec;
    session.status = WorkflowStatus::PENDING;
    session.created_at = now();
    session.last_activity = session.created_at;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session.id] = session;
    }
    LOG_INFO("session_manager", "Created session " + session.id + " for workflow '" + workflow_name + "'");
    return session;
}

std::optional<WorkflowSession> InMemorySessionManager::getSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemorySessionManager::updateSession(const WorkflowSession& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session.id);
    if (it == sessions_.end()) {
        throw SessionNotFoundError(session.id);
    }
    it->second = session;
}

void InMemorySessionManager::restoreSession(const WorkflowSession& session) {
    if (session.id.empty()) {
        throw std::invalid_argument("Cannot restore a session without an id");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session.id] = session;
}

bool InMemorySessionManager::modifySession(const std::string& session_id,
                                           const std::function<void(WorkflowSession&)>& mutation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return false;
    }
    mutation(it->second);
    it->second.last_activity = now();
    return true;
}

bool InMemorySessionManager::deleteSession(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(session_id) > 0;
}

std::vector<WorkflowSession> InMemorySessionManager::listSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<WorkflowSession> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        sessions.push_back(session);
    }
    return sessions;
}

size_t InMemorySessionManager::sessionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t InMemorySessionManager::cleanupExpiredSessions() {
    const TimePoint cutoff = now() - ttl_;
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.last_activity < cutoff) {
                it = sessions_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        LOG_INFO("session_manager", "Expired " + std::to_string(removed) + " session(s)");
    }
    return removed;
}

} // namespace CKW::Workflow
