// EN: Stage Failure Handler for CK-Workflow - classify, escalate or retry a failed stage
// FR: Gestionnaire d'échecs d'étape pour CK-Workflow - classification, escalade ou nouvelle tentative

#pragma once

#include "infrastructure/system/cancellation.hpp"
#include "infrastructure/system/error_recovery.hpp"
#include "orchestrator/coordination_engine.hpp"
#include "orchestrator/escalation_router.hpp"
#include "orchestrator/resume_system.hpp"
#include "workflow/session_manager.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace CKW::Orchestrator {

// EN: What happened to the failed stage.
// FR: Ce qu'il advient de l'étape en échec.
enum class FailureDisposition {
    FATAL,      // EN: Non-recoverable, session failed / FR: Non récupérable, session en échec
    ESCALATED,  // EN: Redirected to a corrective tool / FR: Redirigé vers un outil correctif
    RETRY,      // EN: Caller should retry under retry_policy / FR: L'appelant doit réessayer selon retry_policy
    ABORTED,    // EN: An abort rule matched, session failed / FR: Une règle d'abandon a correspondu, session en échec
    UNHANDLED   // EN: Not retryable and nothing matched, session failed / FR: Non réessayable sans correspondance, session en échec
};

std::string failureDispositionToString(FailureDisposition disposition);

struct FailureDecision {
    FailureDisposition disposition = FailureDisposition::UNHANDLED;
    std::string session_id;
    std::string stage_name;
    std::string source_tool;
    std::string rule_id;                            // EN: Matched escalation rule, empty when none / FR: Règle d'escalade retenue, vide sinon
    std::string redirect_to;
    std::map<std::string, std::string> parameters;  // EN: Parameters for the corrective tool / FR: Paramètres pour l'outil correctif
    std::string retry_policy_class;
    std::optional<RetryPolicy> retry_policy;
    std::optional<CoordinationResult> coordination;
    std::optional<std::string> checkpoint_id;
};

struct FailureHandlerConfig {
    bool enable_escalation = true;
    bool checkpoint_on_failure = true;
};

// EN: Entry point for a stage failure. The router, engine and resume system are optional; without a
//     router nothing escalates, without an engine redirects are decided but not dispatched.
// FR: Point d'entrée d'un échec d'étape. Routeur, moteur et système de reprise sont optionnels ;
//     sans routeur rien n'est escaladé, sans moteur les redirections sont décidées mais non envoyées.
class StageFailureHandler {
public:
    StageFailureHandler(std::shared_ptr<Workflow::SessionManager> sessions,
                        std::shared_ptr<EscalationRouter> router,
                        std::shared_ptr<CoordinationEngine> engine,
                        std::shared_ptr<ResumeSystem> resume_system = nullptr,
                        const FailureHandlerConfig& config = FailureHandlerConfig{});

    // EN: Records the failure on the session and decides what comes next. Throws
    //     Workflow::SessionNotFoundError for an unknown session; coordination and storage errors propagate.
    // FR: Enregistre l'échec sur la session et décide de la suite. Lève Workflow::SessionNotFoundError
    //     pour une session inconnue ; les erreurs de coordination et de stockage sont propagées.
    FailureDecision handleFailure(const std::string& session_id,
                                  const Workflow::WorkflowError& error,
                                  const nlohmann::json& output = nlohmann::json::object(),
                                  const CancellationToken& cancellation = CancellationToken());

    const FailureHandlerConfig& getConfig() const { return config_; }

private:
    void applyMatch(Workflow::WorkflowSession& session, const MatchedRule& match,
                    const Workflow::WorkflowError& error, FailureDecision& decision) const;
    void checkpointDecision(FailureDecision& decision);

    std::shared_ptr<Workflow::SessionManager> sessions_;
    std::shared_ptr<EscalationRouter> router_;
    std::shared_ptr<CoordinationEngine> engine_;
    std::shared_ptr<ResumeSystem> resume_system_;
    FailureHandlerConfig config_;
};

} // namespace CKW::Orchestrator
