#include "workflow/workflow_types.hpp"

#include <algorithm>
#include <cctype>

namespace CKW::Workflow {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

void addUnique(std::vector<std::string>& values, const std::string& value) {
    if (!contains(values, value)) {
        values.push_back(value);
    }
}

void removeValue(std::vector<std::string>& values, const std::string& value) {
    values.erase(std::remove(values.begin(), values.end(), value), values.end());
}

} // namespace

std::string workflowStatusToString(WorkflowStatus status) {
    switch (status) {
        case WorkflowStatus::PENDING:   return "pending";
        case WorkflowStatus::RUNNING:   return "running";
        case WorkflowStatus::COMPLETED: return "completed";
        case WorkflowStatus::FAILED:    return "failed";
        case WorkflowStatus::PAUSED:    return "paused";
        case WorkflowStatus::CANCELLED: return "cancelled";
    }
    return "pending";
}

std::optional<WorkflowStatus> parseWorkflowStatus(const std::string& text) {
    const std::string lower = toLower(text);
    if (lower == "pending") return WorkflowStatus::PENDING;
    if (lower == "running") return WorkflowStatus::RUNNING;
    if (lower == "completed") return WorkflowStatus::COMPLETED;
    if (lower == "failed") return WorkflowStatus::FAILED;
    if (lower == "paused") return WorkflowStatus::PAUSED;
    if (lower == "cancelled" || lower == "canceled") return WorkflowStatus::CANCELLED;
    return std::nullopt;
}

std::string errorSeverityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW:      return "low";
        case ErrorSeverity::MEDIUM:   return "medium";
        case ErrorSeverity::HIGH:     return "high";
        case ErrorSeverity::CRITICAL: return "critical";
    }
    return "medium";
}

ErrorSeverity parseErrorSeverity(const std::string& text) {
    const std::string lower = toLower(text);
    if (lower == "low") return ErrorSeverity::LOW;
    if (lower == "high") return ErrorSeverity::HIGH;
    if (lower == "critical") return ErrorSeverity::CRITICAL;
    return ErrorSeverity::MEDIUM;
}

void to_json(nlohmann::json& j, const WorkflowError& error) {
    j = nlohmann::json{
        {"id", error.id},
        {"message", error.message},
        {"code", error.code},
        {"type", error.type},
        {"error_type", error.error_type},
        {"severity", errorSeverityToString(error.severity)},
        {"retryable", error.retryable},
        {"stage_name", error.stage_name},
        {"tool_name", error.tool_name},
        {"timestamp", TimeUtils::toRfc3339(error.timestamp)}
    };
}

void from_json(const nlohmann::json& j, WorkflowError& error) {
    error.id = j.value("id", "");
    error.message = j.value("message", "");
    error.code = j.value("code", "");
    error.type = j.value("type", "");
    error.error_type = j.value("error_type", "");
    error.severity = parseErrorSeverity(j.value("severity", "medium"));
    error.retryable = j.value("retryable", true);
    error.stage_name = j.value("stage_name", "");
    error.tool_name = j.value("tool_name", "");
    if (auto ts = TimeUtils::fromRfc3339(j.value("timestamp", ""))) {
        error.timestamp = *ts;
    }
}

void to_json(nlohmann::json& j, const WorkflowSpecRef& spec) {
    j = nlohmann::json{{"name", spec.name}, {"version", spec.version}};
}

void from_json(const nlohmann::json& j, WorkflowSpecRef& spec) {
    spec.name = j.value("name", "");
    spec.version = j.value("version", "");
}

void WorkflowSession::beginStage(const std::string& stage, TimePoint now) {
    // EN: Re-entering a completed stage (a redirected correction) reopens it.
    // FR: Réentrer dans une étape terminée (correction redirigée) la rouvre.
    removeValue(completed_stages, stage);
    removeValue(failed_stages, stage);
    removeValue(skipped_stages, stage);
    current_stage = stage;
    status = WorkflowStatus::RUNNING;
    last_activity = now;
}

void WorkflowSession::completeStage(const std::string& stage, nlohmann::json result, TimePoint now) {
    addUnique(completed_stages, stage);
    removeValue(failed_stages, stage);
    stage_results[stage] = std::move(result);
    if (current_stage == stage) {
        current_stage.clear();
    }
    last_activity = now;
}

void WorkflowSession::failStage(const std::string& stage, TimePoint now) {
    removeValue(completed_stages, stage);
    addUnique(failed_stages, stage);
    last_activity = now;
}

void WorkflowSession::skipStage(const std::string& stage, TimePoint now) {
    addUnique(skipped_stages, stage);
    if (current_stage == stage) {
        current_stage.clear();
    }
    last_activity = now;
}

bool WorkflowSession::isStageCompleted(const std::string& stage) const {
    return contains(completed_stages, stage);
}

bool WorkflowSession::isStageFailed(const std::string& stage) const {
    return contains(failed_stages, stage);
}

bool WorkflowSession::checkInvariants() const {
    return current_stage.empty() || !contains(completed_stages, current_stage);
}

} // namespace CKW::Workflow
