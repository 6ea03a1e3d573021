// EN: Engine configuration loader for CK-Workflow
// FR: Chargeur de configuration du moteur pour CK-Workflow

#include "orchestrator/engine_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace CKW::Orchestrator {

namespace {

template<typename T>
T readOr(const ConfigManager& config, const std::string& section, const std::string& key, const T& fallback) {
    ConfigValue value = config.get(section, key);
    if (!value.isValid()) {
        return fallback;
    }
    if (auto typed = value.tryAs<T>()) {
        return *typed;
    }
    throw ConfigError("Invalid value for " + section + "." + key + ": " + value.toString(), section + "." + key);
}

int readPositive(const ConfigManager& config, const std::string& section, const std::string& key, int fallback) {
    const int value = readOr<int>(config, section, key, fallback);
    if (value <= 0) {
        throw ConfigError(section + "." + key + " must be positive", section + "." + key);
    }
    return value;
}

template<typename T>
T scalarAs(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError("Invalid value for " + path + ": " + std::string(e.what()), path);
    }
}

template<typename T>
T scalarOr(const YAML::Node& parent, const std::string& key, const T& fallback, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    return scalarAs<T>(node, path + "." + key);
}

// EN: Condition values keep their YAML scalar type so numeric operators work.
// FR: Les valeurs de condition gardent leur type scalaire YAML pour les opérateurs numériques.
nlohmann::json yamlScalarToJson(const YAML::Node& node, const std::string& path) {
    if (!node || node.IsNull()) {
        return nullptr;
    }
    if (!node.IsScalar()) {
        throw ConfigError(path + " must be a scalar", path);
    }
    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        return text;
    }
    if (text == "true" || text == "false") {
        return text == "true";
    }
    long long int_value = 0;
    if (YAML::convert<long long>::decode(node, int_value)) {
        return int_value;
    }
    double double_value = 0.0;
    if (YAML::convert<double>::decode(node, double_value)) {
        return double_value;
    }
    return text;
}

RetryPolicy parseRetryPolicy(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw ConfigError(path + " must be a mapping", path);
    }

    RetryPolicy policy;
    const int attempts = scalarOr<int>(node, "max_attempts", static_cast<int>(policy.max_attempts), path);
    if (attempts <= 0) {
        throw ConfigError(path + ".max_attempts must be positive", path + ".max_attempts");
    }
    policy.max_attempts = static_cast<size_t>(attempts);

    const std::string backoff = scalarOr<std::string>(node, "backoff", backoffModeToString(policy.backoff), path);
    auto mode = parseBackoffMode(backoff);
    if (!mode) {
        throw ConfigError("Unknown backoff mode '" + backoff + "' in " + path, path + ".backoff");
    }
    policy.backoff = *mode;

    policy.initial_delay = std::chrono::milliseconds(
        scalarOr<long long>(node, "initial_delay_ms", policy.initial_delay.count(), path));
    policy.max_delay = std::chrono::milliseconds(
        scalarOr<long long>(node, "max_delay_ms", policy.max_delay.count(), path));
    policy.backoff_multiplier = scalarOr<double>(node, "backoff_multiplier", policy.backoff_multiplier, path);

    if (policy.initial_delay.count() < 0 || policy.max_delay < policy.initial_delay) {
        throw ConfigError(path + " delays must satisfy 0 <= initial_delay_ms <= max_delay_ms", path);
    }
    if (policy.backoff_multiplier < 1.0) {
        throw ConfigError(path + ".backoff_multiplier must be at least 1", path + ".backoff_multiplier");
    }
    return policy;
}

RuleCondition parseCondition(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw ConfigError(path + " must be a mapping", path);
    }

    RuleCondition condition;
    condition.field = scalarOr<std::string>(node, "field", "", path);
    if (condition.field.empty()) {
        throw ConfigError(path + ".field is required", path + ".field");
    }

    const std::string op = scalarOr<std::string>(node, "operator", "equals", path);
    auto parsed_op = parseConditionOperator(op);
    if (!parsed_op) {
        throw ConfigError("Unknown operator '" + op + "' in " + path, path + ".operator");
    }
    condition.op = *parsed_op;

    const std::string type = scalarOr<std::string>(node, "type", conditionTypeToString(condition.type), path);
    auto parsed_type = parseConditionType(type);
    if (!parsed_type) {
        throw ConfigError("Unknown condition type '" + type + "' in " + path, path + ".type");
    }
    condition.type = *parsed_type;

    condition.value = yamlScalarToJson(node["value"], path + ".value");
    return condition;
}

ConfiguredEscalationRule parseEscalationRule(const YAML::Node& node, const std::string& path) {
    if (!node.IsMap()) {
        throw ConfigError(path + " must be a mapping", path);
    }

    ConfiguredEscalationRule configured;
    configured.source_tool = scalarOr<std::string>(node, "source_tool", "", path);
    if (configured.source_tool.empty()) {
        throw ConfigError(path + ".source_tool is required", path + ".source_tool");
    }

    ErrorRoutingRule& rule = configured.rule;
    rule.id = scalarOr<std::string>(node, "id", "", path);
    if (rule.id.empty()) {
        throw ConfigError(path + ".id is required", path + ".id");
    }
    rule.name = scalarOr<std::string>(node, "name", rule.id, path);
    rule.description = scalarOr<std::string>(node, "description", "", path);

    const std::string action = scalarOr<std::string>(node, "action", "redirect", path);
    auto parsed_action = parseRoutingAction(action);
    if (!parsed_action) {
        throw ConfigError("Unknown action '" + action + "' in " + path, path + ".action");
    }
    rule.action = *parsed_action;
    rule.redirect_to = scalarOr<std::string>(node, "redirect_to", "", path);
    if (rule.action == RoutingAction::REDIRECT && rule.redirect_to.empty()) {
        throw ConfigError(path + " redirects without redirect_to", path + ".redirect_to");
    }

    rule.priority = scalarOr<int>(node, "priority", 0, path);
    rule.enabled = scalarOr<bool>(node, "enabled", true, path);
    rule.fix_errors = scalarOr<bool>(node, "fix_errors", true, path);
    rule.retry_policy_class = scalarOr<std::string>(node, "retry_policy", "", path);

    if (const YAML::Node parameters = node["parameters"]) {
        if (!parameters.IsMap()) {
            throw ConfigError(path + ".parameters must be a mapping", path + ".parameters");
        }
        for (const auto& item : parameters) {
            const std::string key = scalarAs<std::string>(item.first, path + ".parameters");
            rule.parameters[key] = scalarAs<std::string>(item.second, path + ".parameters." + key);
        }
    }

    if (const YAML::Node conditions = node["conditions"]) {
        if (!conditions.IsSequence()) {
            throw ConfigError(path + ".conditions must be a list", path + ".conditions");
        }
        for (size_t i = 0; i < conditions.size(); ++i) {
            rule.conditions.push_back(parseCondition(conditions[i], path + ".conditions[" + std::to_string(i) + "]"));
        }
    }
    return configured;
}

} // namespace

FailureHandlerConfig EngineConfig::failureHandlerConfig() const {
    FailureHandlerConfig config;
    config.enable_escalation = coordination.enable_escalation;
    config.checkpoint_on_failure = resume.checkpoint_on_failure;
    return config;
}

void EngineConfig::applyTo(EscalationRouter& router) const {
    for (const auto& [policy_class, policy] : retry_policies) {
        router.setRetryPolicy(policy_class, policy);
    }
    for (const auto& configured : escalation_rules) {
        router.addRule(configured.source_tool, configured.rule);
    }
}

void EngineConfig::applyLogging() const {
    auto& logger = Logger::getInstance();
    logger.setLogLevel(logging.level);
    if (!logging.output_file.empty()) {
        logger.setOutputFile(logging.output_file);
    }
    logger.setConsoleOutput(logging.console);
}

EngineConfigLoader::EngineConfigLoader(std::string env_prefix) : env_prefix_(std::move(env_prefix)) {}

EngineConfig EngineConfigLoader::loadFromFile(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + filename);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return loadFromString(content.str());
}

EngineConfig EngineConfigLoader::loadFromString(const std::string& yaml_content) const {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_content);
    } catch (const YAML::Exception& e) {
        throw ConfigError("Malformed configuration: " + std::string(e.what()));
    }
    if (root.IsNull()) {
        root = YAML::Node(YAML::NodeType::Map);
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }

    // EN: Flat sections go through ConfigManager so environment overrides apply to them.
    // FR: Les sections plates passent par ConfigManager pour que les surcharges d'environnement s'appliquent.
    ConfigManager flat;
    if (!flat.loadFromString(yaml_content)) {
        throw ConfigError("Configuration could not be loaded");
    }
    flat.loadEnvironmentOverrides(env_prefix_);

    EngineConfig config;

    auto& checkpoint = config.checkpoint;
    checkpoint.database_path = readOr<std::string>(flat, "checkpoint", "database_path", checkpoint.database_path);
    const std::string compression = readOr<std::string>(flat, "checkpoint", "compression",
                                                        compressionModeToString(checkpoint.store.compression));
    auto compression_mode = parseCompressionMode(compression);
    if (!compression_mode) {
        throw ConfigError("Unknown compression mode '" + compression + "'", "checkpoint.compression");
    }
    checkpoint.store.compression = *compression_mode;
    checkpoint.store.enable_integrity_checks =
        readOr<bool>(flat, "checkpoint", "integrity_checks", checkpoint.store.enable_integrity_checks);
    const std::string integrity = readOr<std::string>(flat, "checkpoint", "integrity_policy",
                                                      integrityPolicyToString(checkpoint.store.integrity_policy));
    auto integrity_policy = parseIntegrityPolicy(integrity);
    if (!integrity_policy) {
        throw ConfigError("Unknown integrity policy '" + integrity + "'", "checkpoint.integrity_policy");
    }
    checkpoint.store.integrity_policy = *integrity_policy;
    checkpoint.cleanup_max_age = std::chrono::hours(
        readPositive(flat, "checkpoint", "cleanup_max_age_hours", static_cast<int>(checkpoint.cleanup_max_age.count())));

    auto& coordination = config.coordination;
    coordination.timeout = std::chrono::milliseconds(
        readPositive(flat, "coordination", "timeout_ms", static_cast<int>(coordination.timeout.count())));
    coordination.enable_escalation = readOr<bool>(flat, "coordination", "enable_escalation", coordination.enable_escalation);
    coordination.execute_all_matches =
        readOr<bool>(flat, "coordination", "execute_all_matches", coordination.execute_all_matches);
    coordination.metrics_queue_capacity = static_cast<size_t>(
        readPositive(flat, "coordination", "metrics_queue_capacity", static_cast<int>(coordination.metrics_queue_capacity)));

    config.resume.incremental = readOr<bool>(flat, "resume", "incremental", config.resume.incremental);
    config.resume.checkpoint_on_failure =
        readOr<bool>(flat, "resume", "checkpoint_on_failure", config.resume.checkpoint_on_failure);
    config.resume.cleanup_age = checkpoint.cleanup_max_age;

    config.logging.level = Logger::levelFromString(
        readOr<std::string>(flat, "logging", "level", Logger::levelToString(config.logging.level)));
    config.logging.output_file = readOr<std::string>(flat, "logging", "output_file", "");
    config.logging.console = readOr<bool>(flat, "logging", "console", config.logging.console);

    if (const YAML::Node policies = root["retry_policies"]) {
        if (!policies.IsMap()) {
            throw ConfigError("retry_policies must be a mapping", "retry_policies");
        }
        for (const auto& item : policies) {
            const std::string policy_class = scalarAs<std::string>(item.first, "retry_policies");
            config.retry_policies[policy_class] = parseRetryPolicy(item.second, "retry_policies." + policy_class);
        }
    }

    if (const YAML::Node rules = root["escalation_rules"]) {
        if (!rules.IsSequence()) {
            throw ConfigError("escalation_rules must be a list", "escalation_rules");
        }
        for (size_t i = 0; i < rules.size(); ++i) {
            config.escalation_rules.push_back(
                parseEscalationRule(rules[i], "escalation_rules[" + std::to_string(i) + "]"));
        }
    }

    LOG_DEBUG("engine_config", "Engine configuration loaded: " + std::to_string(config.retry_policies.size()) +
              " retry policies, " + std::to_string(config.escalation_rules.size()) + " escalation rules");
    return config;
}

} // namespace CKW::Orchestrator
