// EN: Rule condition evaluation against error fields, messages and context values
// FR: Évaluation des conditions de règle sur les champs d'erreur, les messages et le contexte

#include "orchestrator/rule_condition.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace CKW::Orchestrator {

namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool endsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::string conditionOperatorToString(ConditionOperator op) {
    switch (op) {
        case ConditionOperator::EQUALS:       return "equals";
        case ConditionOperator::CONTAINS:     return "contains";
        case ConditionOperator::GREATER_THAN: return "greater_than";
        case ConditionOperator::LESS_THAN:    return "less_than";
    }
    return "equals";
}

std::optional<ConditionOperator> parseConditionOperator(const std::string& text) {
    const std::string lower = toLower(text);
    if (lower == "equals" || lower == "eq") return ConditionOperator::EQUALS;
    if (lower == "contains") return ConditionOperator::CONTAINS;
    if (lower == "greater_than" || lower == "gt") return ConditionOperator::GREATER_THAN;
    if (lower == "less_than" || lower == "lt") return ConditionOperator::LESS_THAN;
    return std::nullopt;
}

std::string conditionTypeToString(ConditionType type) {
    switch (type) {
        case ConditionType::FIELD:            return "field";
        case ConditionType::OUTPUT_CONTAINS:  return "output_contains";
        case ConditionType::CONTEXT_EXISTS:   return "context_exists";
        case ConditionType::METRIC_THRESHOLD: return "metric_threshold";
    }
    return "field";
}

std::optional<ConditionType> parseConditionType(const std::string& text) {
    const std::string lower = toLower(text);
    if (lower == "field") return ConditionType::FIELD;
    if (lower == "output_contains") return ConditionType::OUTPUT_CONTAINS;
    if (lower == "context_exists") return ConditionType::CONTEXT_EXISTS;
    if (lower == "metric_threshold") return ConditionType::METRIC_THRESHOLD;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const RuleCondition& condition) {
    j = nlohmann::json{
        {"type", conditionTypeToString(condition.type)},
        {"field", condition.field},
        {"operator", conditionOperatorToString(condition.op)},
        {"value", condition.value}
    };
}

void from_json(const nlohmann::json& j, RuleCondition& condition) {
    const std::string type_text = j.value("type", "field");
    auto type = parseConditionType(type_text);
    if (!type) {
        throw std::invalid_argument("Unknown condition type: " + type_text);
    }
    const std::string op_text = j.value("operator", "equals");
    auto op = parseConditionOperator(op_text);
    if (!op) {
        throw std::invalid_argument("Unknown condition operator: " + op_text);
    }
    condition.type = *type;
    condition.op = *op;
    condition.field = j.at("field").get<std::string>();
    condition.value = j.contains("value") ? j.at("value") : nlohmann::json();
}

bool ToolEvent::isFailure() const {
    return endsWith(toLower(event_type), "failed");
}

ToolEvent ToolEvent::fromError(const Workflow::WorkflowError& error, const nlohmann::json& output,
                               const nlohmann::json& context, const std::string& event_type) {
    ToolEvent event;
    event.source_tool = error.tool_name.empty() ? error.stage_name : error.tool_name;
    event.event_type = event_type;
    event.data = output.is_object() ? output : nlohmann::json::object();
    if (!output.is_null() && !output.is_object()) {
        event.data["output"] = output;
    }
    event.data["error_type"] = error.error_type;
    event.data["message"] = error.message;
    event.data["code"] = error.code;
    event.data["severity"] = Workflow::errorSeverityToString(error.severity);
    event.data["stage_name"] = error.stage_name;
    event.context = context.is_object() ? context : nlohmann::json::object();
    event.timestamp = error.timestamp == TimePoint{} ? std::chrono::system_clock::now() : error.timestamp;
    return event;
}

void to_json(nlohmann::json& j, const ToolEvent& event) {
    j = nlohmann::json{
        {"source_tool", event.source_tool},
        {"event_type", event.event_type},
        {"data", event.data},
        {"context", event.context},
        {"timestamp", TimeUtils::toRfc3339(event.timestamp)}
    };
}

namespace ConditionUtils {

const nlohmann::json* lookupField(const nlohmann::json& root, const std::string& path) {
    if (path.empty()) {
        return nullptr;
    }

    // EN: An exact key wins over a dotted interpretation.
    // FR: Une clé exacte l'emporte sur l'interprétation pointée.
    if (root.is_object()) {
        auto exact = root.find(path);
        if (exact != root.end()) {
            return &(*exact);
        }
    }

    const nlohmann::json* current = &root;
    size_t start = 0;
    while (start <= path.size()) {
        const size_t dot = path.find('.', start);
        const std::string segment = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
        if (dot == std::string::npos) {
            return current;
        }
        start = dot + 1;
    }
    return nullptr;
}

bool compareValues(const nlohmann::json& actual, ConditionOperator op, const nlohmann::json& expected) {
    switch (op) {
        case ConditionOperator::EQUALS:
            return actual == expected;

        case ConditionOperator::CONTAINS:
            if (actual.is_string() && expected.is_string()) {
                return toLower(actual.get<std::string>()).find(toLower(expected.get<std::string>())) != std::string::npos;
            }
            if (actual.is_array()) {
                return std::find(actual.begin(), actual.end(), expected) != actual.end();
            }
            return false;

        case ConditionOperator::GREATER_THAN:
        case ConditionOperator::LESS_THAN: {
            if (!actual.is_number() || !expected.is_number()) {
                return false;
            }
            const double lhs = actual.get<double>();
            const double rhs = expected.get<double>();
            return op == ConditionOperator::GREATER_THAN ? lhs > rhs : lhs < rhs;
        }
    }
    return false;
}

bool evaluate(const RuleCondition& condition, const ToolEvent& event) {
    switch (condition.type) {
        case ConditionType::FIELD: {
            const nlohmann::json* value = lookupField(event.data, condition.field);
            if (!value) {
                value = lookupField(event.context, condition.field);
            }
            return value && compareValues(*value, condition.op, condition.value);
        }
        case ConditionType::OUTPUT_CONTAINS: {
            const nlohmann::json* value = lookupField(event.data, condition.field);
            return value && compareValues(*value, condition.op, condition.value);
        }
        case ConditionType::CONTEXT_EXISTS:
            return lookupField(event.context, condition.field) != nullptr;
        case ConditionType::METRIC_THRESHOLD: {
            const nlohmann::json* metrics = lookupField(event.context, "metrics");
            if (!metrics) {
                return false;
            }
            const nlohmann::json* value = lookupField(*metrics, condition.field);
            return value && compareValues(*value, condition.op, condition.value);
        }
    }
    return false;
}

bool evaluateAll(const std::vector<RuleCondition>& conditions, const ToolEvent& event) {
    return std::all_of(conditions.begin(), conditions.end(),
                       [&event](const RuleCondition& condition) { return evaluate(condition, event); });
}

} // namespace ConditionUtils
} // namespace CKW::Orchestrator
