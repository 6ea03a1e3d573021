// EN: Stage Failure Handler implementation for CK-Workflow
// FR: Implémentation du gestionnaire d'échecs d'étape pour CK-Workflow

#include "orchestrator/failure_handler.hpp"
#include "infrastructure/logging/logger.hpp"
#include "workflow/error_classifier.hpp"

namespace CKW::Orchestrator {

std::string failureDispositionToString(FailureDisposition disposition) {
    switch (disposition) {
        case FailureDisposition::FATAL: return "fatal";
        case FailureDisposition::ESCALATED: return "escalated";
        case FailureDisposition::RETRY: return "retry";
        case FailureDisposition::ABORTED: return "aborted";
        case FailureDisposition::UNHANDLED: return "unhandled";
    }
    return "unknown";
}

StageFailureHandler::StageFailureHandler(std::shared_ptr<Workflow::SessionManager> sessions,
                                         std::shared_ptr<EscalationRouter> router,
                                         std::shared_ptr<CoordinationEngine> engine,
                                         std::shared_ptr<ResumeSystem> resume_system,
                                         const FailureHandlerConfig& config)
    : sessions_(std::move(sessions)), router_(std::move(router)), engine_(std::move(engine)),
      resume_system_(std::move(resume_system)), config_(config) {
    if (!sessions_) {
        throw std::invalid_argument("StageFailureHandler requires a session manager");
    }
}

FailureDecision StageFailureHandler::handleFailure(const std::string& session_id,
                                                   const Workflow::WorkflowError& error,
                                                   const nlohmann::json& output,
                                                   const CancellationToken& cancellation) {
    auto session = sessions_->getSession(session_id);
    if (!session) {
        throw Workflow::SessionNotFoundError(session_id);
    }

    FailureDecision decision;
    decision.session_id = session_id;
    decision.stage_name = error.stage_name.empty() ? session->current_stage : error.stage_name;
    decision.source_tool = error.tool_name.empty() ? decision.stage_name : error.tool_name;

    if (!decision.stage_name.empty()) {
        session->failStage(decision.stage_name);
    }

    if (Workflow::ErrorClassifier::isFatal(error)) {
        decision.disposition = FailureDisposition::FATAL;
        session->status = Workflow::WorkflowStatus::FAILED;
        sessions_->updateSession(*session);

        LOG_ERROR_META("failure_handler", "Fatal stage failure: " + error.message,
            (std::unordered_map<std::string, std::string>{
                {"session_id", session_id},
                {"stage_name", decision.stage_name},
                {"error_type", error.error_type},
                {"severity", Workflow::errorSeverityToString(error.severity)}
            }));
        checkpointDecision(decision);
        return decision;
    }

    std::optional<ToolEvent> event;
    std::vector<MatchedRule> matches;
    if (config_.enable_escalation && router_) {
        nlohmann::json context = nlohmann::json::object();
        for (const auto& [key, value] : session->shared_context) {
            context[key] = value;
        }
        context["session_id"] = session_id;
        context["workflow_name"] = session->workflow_name;
        context["stage_name"] = decision.stage_name;

        event = ToolEvent::fromError(error, output, context);
        event->source_tool = decision.source_tool;
        matches = router_->route(*event);
    }

    if (!matches.empty()) {
        applyMatch(*session, matches.front(), error, decision);
    } else if (error.retryable) {
        decision.disposition = FailureDisposition::RETRY;
        decision.retry_policy_class = decision.source_tool;
        decision.retry_policy = router_ ? router_->retryPolicyFor(decision.source_tool) : RetryPolicy{};
    } else {
        decision.disposition = FailureDisposition::UNHANDLED;
        session->status = Workflow::WorkflowStatus::FAILED;
    }

    sessions_->updateSession(*session);

    if (decision.disposition == FailureDisposition::ESCALATED && engine_ && event) {
        decision.coordination = engine_->coordinateExecution(*event, cancellation);
    }

    LOG_INFO_META("failure_handler", "Stage failure handled", (std::unordered_map<std::string, std::string>{
        {"session_id", session_id},
        {"stage_name", decision.stage_name},
        {"disposition", failureDispositionToString(decision.disposition)},
        {"rule_id", decision.rule_id},
        {"redirect_to", decision.redirect_to}
    }));

    checkpointDecision(decision);
    return decision;
}

void StageFailureHandler::applyMatch(Workflow::WorkflowSession& session, const MatchedRule& match,
                                     const Workflow::WorkflowError& error, FailureDecision& decision) const {
    decision.rule_id = match.rule.id;
    decision.parameters = match.parameters;
    decision.retry_policy_class = match.rule.retry_policy_class;

    switch (match.rule.action) {
        case RoutingAction::REDIRECT:
            decision.disposition = FailureDisposition::ESCALATED;
            decision.redirect_to = match.rule.redirect_to;
            // EN: Leave a trace on the session so the corrective stage knows what it replaces.
            // FR: Trace sur la session pour que l'étape corrective sache ce qu'elle remplace.
            session.shared_context["_redirect_from_" + decision.stage_name] = match.rule.redirect_to;
            session.shared_context["_redirect_reason_" + decision.stage_name] = error.message;
            break;
        case RoutingAction::RETRY:
            decision.disposition = FailureDisposition::RETRY;
            if (decision.retry_policy_class.empty()) {
                decision.retry_policy_class = decision.source_tool;
            }
            break;
        case RoutingAction::ABORT:
            decision.disposition = FailureDisposition::ABORTED;
            session.status = Workflow::WorkflowStatus::FAILED;
            break;
    }

    if (!decision.retry_policy_class.empty() && router_) {
        decision.retry_policy = router_->retryPolicyFor(decision.retry_policy_class);
    }
}

void StageFailureHandler::checkpointDecision(FailureDecision& decision) {
    if (!config_.checkpoint_on_failure || !resume_system_) {
        return;
    }
    auto checkpoint = resume_system_->checkpointSession(
        decision.session_id, decision.stage_name,
        "Stage '" + decision.stage_name + "' failed (" + failureDispositionToString(decision.disposition) + ")");
    decision.checkpoint_id = checkpoint.id;
}

} // namespace CKW::Orchestrator
