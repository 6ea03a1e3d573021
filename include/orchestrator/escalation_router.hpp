// EN: Escalation Router for CK-Workflow - per-tool error routing rules and retry policy classes
// FR: Routeur d'escalade pour CK-Workflow - règles de routage d'erreurs par outil et classes de politiques de retry

#pragma once

#include "infrastructure/system/error_recovery.hpp"
#include "orchestrator/rule_condition.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace CKW::Orchestrator {

// EN: What a matched routing rule asks for.
// FR: Ce que demande une règle de routage satisfaite.
enum class RoutingAction {
    REDIRECT,  // EN: Hand the work to redirect_to / FR: Confie le travail à redirect_to
    RETRY,     // EN: Retry the source tool under retry_policy_class / FR: Retente l'outil source avec retry_policy_class
    ABORT      // EN: Stop the workflow / FR: Arrête le workflow
};

std::string routingActionToString(RoutingAction action);
std::optional<RoutingAction> parseRoutingAction(const std::string& text);

// EN: Error routing rule registered for one source tool. All conditions must hold.
// FR: Règle de routage d'erreur enregistrée pour un outil source. Toutes les conditions doivent tenir.
struct ErrorRoutingRule {
    std::string id;
    std::string name;
    std::string description;
    std::vector<RuleCondition> conditions;
    RoutingAction action = RoutingAction::REDIRECT;
    std::string redirect_to;
    bool fix_errors = true;
    std::map<std::string, std::string> parameters;
    std::string retry_policy_class;
    int priority = 0;                            // EN: Higher wins / FR: Le plus élevé l'emporte
    bool enabled = true;
};

// EN: Rule that matched an event, with the flat parameter bag handed to the target tool.
// FR: Règle satisfaite par un événement, avec le sac de paramètres transmis à l'outil cible.
struct MatchedRule {
    std::string source_tool;
    ErrorRoutingRule rule;
    std::map<std::string, std::string> parameters;
};

// EN: Process-wide routing table. Evaluation takes a shared lock, registration an exclusive one.
// FR: Table de routage globale au processus. L'évaluation prend un verrou partagé, l'enregistrement un exclusif.
class EscalationRouter {
public:
    static constexpr const char* kDefaultPolicyClass = "default";

    // EN: Loads the built-in rules and retry policies unless told otherwise.
    // FR: Charge les règles et politiques intégrées sauf indication contraire.
    explicit EscalationRouter(bool register_defaults = true);

    // EN: Adds or replaces (same id, same source tool) a rule. Throws std::invalid_argument on an
    //     empty id or source tool, or a redirect rule without target.
    // FR: Ajoute ou remplace (même id, même outil source) une règle. Lève std::invalid_argument
    //     sur un id ou outil source vide, ou une redirection sans cible.
    void addRule(const std::string& source_tool, const ErrorRoutingRule& rule);
    bool removeRule(const std::string& source_tool, const std::string& rule_id);
    bool setRuleEnabled(const std::string& source_tool, const std::string& rule_id, bool enabled);

    std::vector<ErrorRoutingRule> getRules(const std::string& source_tool) const;
    std::vector<std::string> getSourceTools() const;

    // EN: Enabled rules of the event's source tool whose conditions hold, by descending priority
    //     (registration order among equal priorities).
    // FR: Règles actives de l'outil source dont les conditions tiennent, par priorité décroissante
    //     (ordre d'enregistrement à priorité égale).
    std::vector<MatchedRule> route(const ToolEvent& event) const;

    void setRetryPolicy(const std::string& policy_class, const RetryPolicy& policy);
    bool hasRetryPolicy(const std::string& policy_class) const;

    // EN: Falls back to the "default" class, then to a default-constructed policy.
    // FR: Retombe sur la classe "default", puis sur une politique par défaut.
    RetryPolicy retryPolicyFor(const std::string& policy_class) const;

    void clear();

private:
    void registerDefaultRules();
    void registerDefaultRetryPolicies();
    static std::map<std::string, std::string> buildParameters(const std::string& source_tool,
                                                              const ErrorRoutingRule& rule);

    std::map<std::string, std::vector<ErrorRoutingRule>> rules_;
    std::map<std::string, RetryPolicy> retry_policies_;
    mutable std::shared_mutex mutex_;
};

// EN: Helpers for tools invoked as a correction.
// FR: Utilitaires pour les outils invoqués comme correction.
namespace EscalationUtils {

constexpr const char* ESCALATION_SOURCE = "escalation_source";
constexpr const char* ESCALATION_MODE = "escalation_mode";
constexpr const char* ESCALATION_RULE = "escalation_rule";
constexpr const char* FIX_ERRORS = "fix_errors";
constexpr const char* AUTO_MODE = "auto";

bool isEscalated(const std::map<std::string, std::string>& parameters);
std::optional<std::string> escalationSource(const std::map<std::string, std::string>& parameters);

// EN: Same checks on a JSON parameter object.
// FR: Mêmes vérifications sur un objet JSON de paramètres.
bool isEscalated(const nlohmann::json& parameters);
std::optional<std::string> escalationSource(const nlohmann::json& parameters);

} // namespace EscalationUtils
} // namespace CKW::Orchestrator
