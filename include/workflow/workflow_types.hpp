#pragma once

#include "infrastructure/system/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace CKW::Workflow {

// EN: Lifecycle status of a workflow session.
// FR: Statut du cycle de vie d'une session de workflow.
enum class WorkflowStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    PAUSED,
    CANCELLED
};

std::string workflowStatusToString(WorkflowStatus status);
std::optional<WorkflowStatus> parseWorkflowStatus(const std::string& text);

// EN: Severity attached to a stage failure.
// FR: Sévérité associée à un échec d'étape.
enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

std::string errorSeverityToString(ErrorSeverity severity);
// EN: Case-insensitive; unknown values map to MEDIUM.
// FR: Insensible à la casse ; les valeurs inconnues donnent MEDIUM.
ErrorSeverity parseErrorSeverity(const std::string& text);

// EN: Structured failure reported by a stage or tool.
// FR: Échec structuré remonté par une étape ou un outil.
struct WorkflowError {
    std::string id;
    std::string message;
    std::string code;
    std::string type;
    std::string error_type;
    ErrorSeverity severity = ErrorSeverity::MEDIUM;
    bool retryable = true;
    std::string stage_name;
    std::string tool_name;
    TimePoint timestamp{};
};

void to_json(nlohmann::json& j, const WorkflowError& error);
void from_json(const nlohmann::json& j, WorkflowError& error);

// EN: Exception carrying a domain failure from a stage body.
// FR: Exception portant un échec métier issu d'une étape.
class WorkflowException : public std::runtime_error {
public:
    explicit WorkflowException(WorkflowError error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    const WorkflowError& error() const { return error_; }

private:
    WorkflowError error_;
};

// EN: Reference to the workflow definition a session runs against.
// FR: Référence à la définition de workflow exécutée par la session.
struct WorkflowSpecRef {
    std::string name;
    std::string version;

    bool operator==(const WorkflowSpecRef& other) const {
        return name == other.name && version == other.version;
    }
};

void to_json(nlohmann::json& j, const WorkflowSpecRef& spec);
void from_json(const nlohmann::json& j, WorkflowSpecRef& spec);

// EN: Lightweight record of a checkpoint taken for a session.
// FR: Trace légère d'un checkpoint pris pour une session.
struct CheckpointRef {
    std::string checkpoint_id;
    std::string stage_name;
    TimePoint timestamp{};
    bool incremental = false;
};

// EN: One end-to-end pipeline run. Invariant: current_stage never appears in completed_stages.
// FR: Une exécution complète du pipeline. Invariant : current_stage n'apparaît jamais dans completed_stages.
struct WorkflowSession {
    std::string id;
    std::string workflow_id;
    std::string workflow_name;
    std::optional<WorkflowSpecRef> workflow_spec;
    WorkflowStatus status = WorkflowStatus::PENDING;
    std::string current_stage;
    std::vector<std::string> completed_stages;
    std::vector<std::string> failed_stages;
    std::vector<std::string> skipped_stages;
    std::map<std::string, nlohmann::json> stage_results;
    std::map<std::string, nlohmann::json> shared_context;
    std::map<std::string, std::string> resource_bindings;
    TimePoint created_at{};
    TimePoint last_activity{};
    std::vector<CheckpointRef> checkpoints;

    // EN: Stage transitions. Each one refreshes last_activity.
    // FR: Transitions d'étape. Chacune rafraîchit last_activity.
    void beginStage(const std::string& stage, TimePoint now = std::chrono::system_clock::now());
    void completeStage(const std::string& stage, nlohmann::json result,
                       TimePoint now = std::chrono::system_clock::now());
    void failStage(const std::string& stage, TimePoint now = std::chrono::system_clock::now());
    void skipStage(const std::string& stage, TimePoint now = std::chrono::system_clock::now());

    bool isStageCompleted(const std::string& stage) const;
    bool isStageFailed(const std::string& stage) const;
    bool checkInvariants() const;
};

} // namespace CKW::Workflow
