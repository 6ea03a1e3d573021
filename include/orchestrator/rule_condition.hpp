#pragma once

#include "infrastructure/system/time_utils.hpp"
#include "workflow/workflow_types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace CKW::Orchestrator {

// EN: Comparison applied between the looked-up value and the expected one.
// FR: Comparaison appliquée entre la valeur trouvée et la valeur attendue.
enum class ConditionOperator {
    EQUALS,
    CONTAINS,
    GREATER_THAN,
    LESS_THAN
};

// EN: Where a condition looks its field up.
// FR: Où une condition cherche son champ.
enum class ConditionType {
    FIELD,            // EN: Event data, then event context / FR: Données, puis contexte de l'événement
    OUTPUT_CONTAINS,  // EN: Event data only / FR: Données de l'événement uniquement
    CONTEXT_EXISTS,   // EN: Key presence in the context / FR: Présence d'une clé dans le contexte
    METRIC_THRESHOLD  // EN: context["metrics"][field] / FR: context["metrics"][field]
};

std::string conditionOperatorToString(ConditionOperator op);
std::optional<ConditionOperator> parseConditionOperator(const std::string& text);
std::string conditionTypeToString(ConditionType type);
std::optional<ConditionType> parseConditionType(const std::string& text);

struct RuleCondition {
    ConditionType type = ConditionType::FIELD;
    std::string field;                           // EN: Dotted path, e.g. "error.type" / FR: Chemin pointé, ex. "error.type"
    ConditionOperator op = ConditionOperator::EQUALS;
    nlohmann::json value;
};

void to_json(nlohmann::json& j, const RuleCondition& condition);
void from_json(const nlohmann::json& j, RuleCondition& condition);

// EN: Something a tool reported: a failure, a finding, a completion.
// FR: Ce qu'un outil a signalé : un échec, un constat, une fin d'exécution.
struct ToolEvent {
    std::string source_tool;
    std::string event_type;
    nlohmann::json data = nlohmann::json::object();
    nlohmann::json context = nlohmann::json::object();
    TimePoint timestamp = std::chrono::system_clock::now();

    bool isFailure() const;

    // EN: Failure event whose data is `output` enriched with the error fields (error_type, message,
    //     code, severity, stage_name). Source tool falls back to the stage name.
    // FR: Événement d'échec dont les données sont `output` enrichies des champs d'erreur
    //     (error_type, message, code, severity, stage_name). L'outil source retombe sur l'étape.
    static ToolEvent fromError(const Workflow::WorkflowError& error,
                               const nlohmann::json& output = nlohmann::json::object(),
                               const nlohmann::json& context = nlohmann::json::object(),
                               const std::string& event_type = "failed");
};

void to_json(nlohmann::json& j, const ToolEvent& event);

// EN: Condition evaluation shared by escalation and coordination rules.
// FR: Évaluation de conditions partagée par les règles d'escalade et de coordination.
namespace ConditionUtils {

// EN: Resolve a dotted path inside an object; nullptr when any segment is missing.
// FR: Résout un chemin pointé dans un objet ; nullptr si un segment manque.
const nlohmann::json* lookupField(const nlohmann::json& root, const std::string& path);

// EN: Numeric operators only accept JSON numbers; a non-numeric operand fails the comparison.
//     `contains` is a case-insensitive substring test on strings, or membership on arrays.
// FR: Les opérateurs numériques n'acceptent que des nombres JSON ; sinon la comparaison échoue.
//     `contains` teste une sous-chaîne sans casse, ou l'appartenance pour un tableau.
bool compareValues(const nlohmann::json& actual, ConditionOperator op, const nlohmann::json& expected);

bool evaluate(const RuleCondition& condition, const ToolEvent& event);

// EN: Conjunction; an empty list holds.
// FR: Conjonction ; une liste vide est vraie.
bool evaluateAll(const std::vector<RuleCondition>& conditions, const ToolEvent& event);

} // namespace ConditionUtils
} // namespace CKW::Orchestrator
