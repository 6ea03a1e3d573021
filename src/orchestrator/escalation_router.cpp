// EN: Escalation Router implementation for CK-Workflow
// FR: Implémentation du routeur d'escalade pour CK-Workflow

#include "orchestrator/escalation_router.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace CKW::Orchestrator {

namespace {

RuleCondition fieldCondition(const std::string& field, ConditionOperator op, nlohmann::json value) {
    RuleCondition condition;
    condition.type = ConditionType::FIELD;
    condition.field = field;
    condition.op = op;
    condition.value = std::move(value);
    return condition;
}

RetryPolicy makePolicy(size_t attempts, BackoffMode backoff, long long initial_ms, long long max_ms,
                       double multiplier) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.backoff = backoff;
    policy.initial_delay = std::chrono::milliseconds(initial_ms);
    policy.max_delay = std::chrono::milliseconds(max_ms);
    policy.backoff_multiplier = multiplier;
    return policy;
}

} // namespace

std::string routingActionToString(RoutingAction action) {
    switch (action) {
        case RoutingAction::REDIRECT: return "redirect";
        case RoutingAction::RETRY:    return "retry";
        case RoutingAction::ABORT:    return "abort";
    }
    return "redirect";
}

std::optional<RoutingAction> parseRoutingAction(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "redirect") return RoutingAction::REDIRECT;
    if (lower == "retry") return RoutingAction::RETRY;
    if (lower == "abort") return RoutingAction::ABORT;
    return std::nullopt;
}

EscalationRouter::EscalationRouter(bool register_defaults) {
    if (register_defaults) {
        registerDefaultRules();
        registerDefaultRetryPolicies();
    }
}

void EscalationRouter::addRule(const std::string& source_tool, const ErrorRoutingRule& rule) {
    if (source_tool.empty()) {
        throw std::invalid_argument("Routing rule needs a source tool");
    }
    if (rule.id.empty()) {
        throw std::invalid_argument("Routing rule for '" + source_tool + "' needs an id");
    }
    if (rule.action == RoutingAction::REDIRECT && rule.redirect_to.empty()) {
        throw std::invalid_argument("Redirect rule '" + rule.id + "' has no target tool");
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto& rules = rules_[source_tool];
        auto existing = std::find_if(rules.begin(), rules.end(),
                                     [&rule](const ErrorRoutingRule& r) { return r.id == rule.id; });
        if (existing != rules.end()) {
            *existing = rule;
        } else {
            rules.push_back(rule);
        }
    }

    LOG_DEBUG_META("escalation_router", "Routing rule registered", (std::unordered_map<std::string, std::string>{
        {"source_tool", source_tool},
        {"rule_id", rule.id},
        {"action", routingActionToString(rule.action)},
        {"redirect_to", rule.redirect_to},
        {"priority", std::to_string(rule.priority)}
    }));
}

bool EscalationRouter::removeRule(const std::string& source_tool, const std::string& rule_id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = rules_.find(source_tool);
    if (it == rules_.end()) {
        return false;
    }
    auto& rules = it->second;
    const auto before = rules.size();
    rules.erase(std::remove_if(rules.begin(), rules.end(),
                               [&rule_id](const ErrorRoutingRule& r) { return r.id == rule_id; }),
                rules.end());
    const bool removed = rules.size() != before;
    if (rules.empty()) {
        rules_.erase(it);
    }
    return removed;
}

bool EscalationRouter::setRuleEnabled(const std::string& source_tool, const std::string& rule_id, bool enabled) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = rules_.find(source_tool);
    if (it == rules_.end()) {
        return false;
    }
    for (auto& rule : it->second) {
        if (rule.id == rule_id) {
            rule.enabled = enabled;
            return true;
        }
    }
    return false;
}

std::vector<ErrorRoutingRule> EscalationRouter::getRules(const std::string& source_tool) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rules_.find(source_tool);
    return it != rules_.end() ? it->second : std::vector<ErrorRoutingRule>{};
}

std::vector<std::string> EscalationRouter::getSourceTools() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> tools;
    tools.reserve(rules_.size());
    for (const auto& [tool, rules] : rules_) {
        tools.push_back(tool);
    }
    return tools;
}

std::vector<MatchedRule> EscalationRouter::route(const ToolEvent& event) const {
    std::vector<MatchedRule> matches;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = rules_.find(event.source_tool);
        if (it == rules_.end()) {
            return matches;
        }
        for (const auto& rule : it->second) {
            if (rule.enabled && ConditionUtils::evaluateAll(rule.conditions, event)) {
                matches.push_back(MatchedRule{event.source_tool, rule, buildParameters(event.source_tool, rule)});
            }
        }
    }

    std::stable_sort(matches.begin(), matches.end(), [](const MatchedRule& a, const MatchedRule& b) {
        return a.rule.priority > b.rule.priority;
    });

    if (!matches.empty()) {
        LOG_DEBUG("escalation_router", "Event from '" + event.source_tool + "' matched " +
                  std::to_string(matches.size()) + " rule(s), top: " + matches.front().rule.id);
    }
    return matches;
}

void EscalationRouter::setRetryPolicy(const std::string& policy_class, const RetryPolicy& policy) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    retry_policies_[policy_class] = policy;
}

bool EscalationRouter::hasRetryPolicy(const std::string& policy_class) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return retry_policies_.count(policy_class) > 0;
}

RetryPolicy EscalationRouter::retryPolicyFor(const std::string& policy_class) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = retry_policies_.find(policy_class);
    if (it != retry_policies_.end()) {
        return it->second;
    }
    it = retry_policies_.find(kDefaultPolicyClass);
    return it != retry_policies_.end() ? it->second : RetryPolicy{};
}

void EscalationRouter::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rules_.clear();
    retry_policies_.clear();
}

// EN: Rule parameters first, then the escalation markers, which always win.
// FR: Paramètres de la règle d'abord, puis les marqueurs d'escalade, qui l'emportent toujours.
std::map<std::string, std::string> EscalationRouter::buildParameters(const std::string& source_tool,
                                                                     const ErrorRoutingRule& rule) {
    std::map<std::string, std::string> parameters = rule.parameters;
    parameters[EscalationUtils::ESCALATION_SOURCE] = source_tool;
    parameters[EscalationUtils::ESCALATION_MODE] = EscalationUtils::AUTO_MODE;
    parameters[EscalationUtils::ESCALATION_RULE] = rule.id;
    parameters[EscalationUtils::FIX_ERRORS] = rule.fix_errors ? "true" : "false";
    return parameters;
}

void EscalationRouter::registerDefaultRules() {
    ErrorRoutingRule dockerfile;
    dockerfile.id = "build_dockerfile_errors";
    dockerfile.name = "Dockerfile build errors";
    dockerfile.description = "Image build failed on a Dockerfile problem; regenerate the Dockerfile";
    dockerfile.conditions = {
        fieldCondition("error_type", ConditionOperator::CONTAINS, "build_error"),
        fieldCondition("message", ConditionOperator::CONTAINS, "dockerfile")
    };
    dockerfile.redirect_to = "generate_dockerfile";
    dockerfile.retry_policy_class = "escalated_build";
    dockerfile.priority = 100;
    addRule("build_image", dockerfile);

    ErrorRoutingRule resources;
    resources.id = "build_resource_errors";
    resources.name = "Build resource errors";
    resources.description = "Image build ran out of resources; regenerate manifests with adjusted limits";
    resources.conditions = {
        fieldCondition("error_type", ConditionOperator::CONTAINS, "build_error"),
        fieldCondition("message", ConditionOperator::CONTAINS, "resource")
    };
    resources.redirect_to = "generate_manifests";
    resources.parameters = {{"fix_resources", "true"}};
    resources.retry_policy_class = "escalated_build";
    resources.priority = 90;
    addRule("build_image", resources);

    ErrorRoutingRule manifests;
    manifests.id = "deploy_manifest_errors";
    manifests.name = "Invalid deployment manifests";
    manifests.description = "Deployment rejected the manifests; regenerate them";
    manifests.conditions = {
        fieldCondition("error_type", ConditionOperator::CONTAINS, "deploy"),
        fieldCondition("message", ConditionOperator::CONTAINS, "manifest")
    };
    manifests.redirect_to = "generate_manifests";
    manifests.parameters = {{"fix_manifests", "true"}};
    manifests.retry_policy_class = "escalated_deploy";
    manifests.priority = 80;
    addRule("deploy_kubernetes", manifests);

    ErrorRoutingRule vulnerabilities;
    vulnerabilities.id = "scan_vulnerability_fix";
    vulnerabilities.name = "Vulnerable base image";
    vulnerabilities.description = "Security scan found vulnerabilities; regenerate the Dockerfile with a patched base";
    vulnerabilities.conditions = {
        fieldCondition("error_type", ConditionOperator::CONTAINS, "vulnerabilit")
    };
    vulnerabilities.redirect_to = "generate_dockerfile";
    vulnerabilities.parameters = {{"fix_vulnerabilities", "true"}};
    vulnerabilities.retry_policy_class = "escalated_build";
    vulnerabilities.priority = 70;
    addRule("scan_image", vulnerabilities);
}

void EscalationRouter::registerDefaultRetryPolicies() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    retry_policies_["build_image"] = makePolicy(3, BackoffMode::EXPONENTIAL, 2000, 60000, 2.0);
    retry_policies_["deploy_kubernetes"] = makePolicy(5, BackoffMode::EXPONENTIAL, 3000, 120000, 1.5);
    retry_policies_["scan_image"] = makePolicy(3, BackoffMode::EXPONENTIAL, 1000, 45000, 1.5);
    // EN: Escalations are already a second chance: fewer attempts, fixed backoff.
    // FR: Une escalade est déjà une seconde chance : moins de tentatives, backoff fixe.
    retry_policies_["escalated_build"] = makePolicy(2, BackoffMode::FIXED, 2000, 2000, 1.0);
    retry_policies_["escalated_deploy"] = makePolicy(2, BackoffMode::FIXED, 5000, 5000, 1.0);
    retry_policies_[kDefaultPolicyClass] = makePolicy(3, BackoffMode::EXPONENTIAL, 1000, 30000, 2.0);
}

namespace EscalationUtils {

bool isEscalated(const std::map<std::string, std::string>& parameters) {
    auto it = parameters.find(ESCALATION_MODE);
    return it != parameters.end() && it->second == AUTO_MODE;
}

std::optional<std::string> escalationSource(const std::map<std::string, std::string>& parameters) {
    if (!isEscalated(parameters)) {
        return std::nullopt;
    }
    auto it = parameters.find(ESCALATION_SOURCE);
    if (it == parameters.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

bool isEscalated(const nlohmann::json& parameters) {
    if (!parameters.is_object()) {
        return false;
    }
    auto it = parameters.find(ESCALATION_MODE);
    return it != parameters.end() && it->is_string() && it->get<std::string>() == AUTO_MODE;
}

std::optional<std::string> escalationSource(const nlohmann::json& parameters) {
    if (!isEscalated(parameters)) {
        return std::nullopt;
    }
    auto it = parameters.find(ESCALATION_SOURCE);
    if (it == parameters.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace EscalationUtils
} // namespace CKW::Orchestrator
