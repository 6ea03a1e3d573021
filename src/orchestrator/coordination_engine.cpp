// EN: Coordination Engine implementation for CK-Workflow
// FR: Implémentation du moteur de coordination pour CK-Workflow

#include "orchestrator/coordination_engine.hpp"
#include "infrastructure/logging/logger.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace CKW::Orchestrator {

namespace {

std::string pairKey(const std::string& source_tool, const std::string& target_tool) {
    return source_tool + "->" + target_tool;
}

CoordinationRule makeDefaultRule(const std::string& id, const std::string& name, const std::string& source,
                                 const std::string& target, const std::string& trigger, int priority,
                                 ConditionType type, const std::string& field, ConditionOperator op,
                                 nlohmann::json value) {
    CoordinationRule rule;
    rule.id = id;
    rule.name = name;
    rule.source_tool = source;
    rule.target_tool = target;
    rule.trigger_event = trigger;
    rule.priority = priority;
    RuleCondition condition;
    condition.type = type;
    condition.field = field;
    condition.op = op;
    condition.value = std::move(value);
    rule.conditions.push_back(std::move(condition));
    return rule;
}

} // namespace

std::string coordinationStatusToString(CoordinationStatus status) {
    switch (status) {
        case CoordinationStatus::RUNNING:   return "running";
        case CoordinationStatus::COMPLETED: return "completed";
        case CoordinationStatus::CANCELLED: return "cancelled";
        case CoordinationStatus::TIMEOUT:   return "timeout";
        case CoordinationStatus::FAILED:    return "failed";
    }
    return "failed";
}

CoordinationEngine::CoordinationEngine(std::shared_ptr<CommunicationBridge> bridge,
                                       std::shared_ptr<EscalationRouter> router,
                                       const CoordinationConfig& config)
    : bridge_(std::move(bridge)),
      router_(std::move(router)),
      config_(config),
      bookkeeping_queue_(WorkQueueConfig{config.metrics_queue_capacity, 1, "coordination_bookkeeping"}) {
    if (!bridge_) {
        throw std::invalid_argument("CoordinationEngine requires a communication bridge");
    }
    if (config_.register_default_rules) {
        registerDefaultRules();
    }
}

CoordinationEngine::~CoordinationEngine() {
    bookkeeping_queue_.shutdown();
}

void CoordinationEngine::registerTool(const std::string& tool_name, const std::vector<std::string>& dependencies) {
    if (tool_name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    graph_.addNode(tool_name, dependencies);

    std::ostringstream deps;
    for (size_t i = 0; i < dependencies.size(); ++i) {
        deps << (i > 0 ? "," : "") << dependencies[i];
    }
    LOG_INFO_META("coordination", "Tool registered with coordinator", (std::unordered_map<std::string, std::string>{
        {"tool_name", tool_name},
        {"dependencies", deps.str()}
    }));
}

bool CoordinationEngine::isToolRegistered(const std::string& tool_name) const {
    return graph_.hasNode(tool_name);
}

void CoordinationEngine::addCoordinationRule(const CoordinationRule& rule) {
    if (!graph_.hasNode(rule.source_tool)) {
        throw std::invalid_argument("source tool " + rule.source_tool + " not registered");
    }
    if (!graph_.hasNode(rule.target_tool)) {
        throw std::invalid_argument("target tool " + rule.target_tool + " not registered");
    }

    {
        std::unique_lock<std::shared_mutex> lock(rules_mutex_);
        rules_.push_back(rule);
    }

    LOG_INFO_META("coordination", "Coordination rule added", (std::unordered_map<std::string, std::string>{
        {"rule_id", rule.id},
        {"source_tool", rule.source_tool},
        {"target_tool", rule.target_tool}
    }));
}

std::vector<CoordinationRule> CoordinationEngine::getCoordinationRules() const {
    std::shared_lock<std::shared_mutex> lock(rules_mutex_);
    return rules_;
}

CoordinationResult CoordinationEngine::coordinateExecution(const ToolEvent& event,
                                                           const CancellationToken& cancellation) {
    const auto start = std::chrono::steady_clock::now();

    std::vector<CoordinationRule> rules = findApplicableRules(event);
    std::vector<CoordinationRule> escalations = escalationRules(event);
    rules.insert(rules.end(), std::make_move_iterator(escalations.begin()),
                 std::make_move_iterator(escalations.end()));

    if (rules.empty()) {
        CoordinationResult result;
        result.success = true;
        result.status = CoordinationStatus::COMPLETED;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        result.metadata["message"] = "no applicable rules";
        return result;
    }

    std::stable_sort(rules.begin(), rules.end(), [](const CoordinationRule& a, const CoordinationRule& b) {
        return a.priority > b.priority;
    });
    if (!config_.execute_all_matches) {
        rules.resize(1);
    }

    CoordinationResult last_result;
    for (const auto& rule : rules) {
        const auto rule_start = std::chrono::steady_clock::now();
        try {
            last_result = executeCoordination(event, rule, cancellation);
        } catch (const CoordinationError& e) {
            LOG_ERROR_META("coordination", "Coordination execution failed: " + std::string(e.what()),
                (std::unordered_map<std::string, std::string>{
                    {"rule_id", rule.id},
                    {"source_tool", rule.source_tool},
                    {"target_tool", rule.target_tool},
                    {"status", coordinationStatusToString(e.status())}
                }));
            recordOutcome(rule.source_tool, rule.target_tool,
                          std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - rule_start),
                          false);
            throw;
        }
        recordOutcome(rule.source_tool, rule.target_tool,
                      std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - rule_start),
                      true);
    }

    return last_result;
}

std::vector<CoordinationRule> CoordinationEngine::findApplicableRules(const ToolEvent& event) const {
    std::shared_lock<std::shared_mutex> lock(rules_mutex_);
    std::vector<CoordinationRule> applicable;
    for (const auto& rule : rules_) {
        if (rule.source_tool != event.source_tool) {
            continue;
        }
        if (!rule.trigger_event.empty() && rule.trigger_event != event.event_type) {
            continue;
        }
        if (ConditionUtils::evaluateAll(rule.conditions, event)) {
            applicable.push_back(rule);
        }
    }
    return applicable;
}

// EN: Redirect matches from the router become rules whose payload carries the flat parameter bag.
// FR: Les redirections du routeur deviennent des règles dont la charge porte le sac de paramètres.
std::vector<CoordinationRule> CoordinationEngine::escalationRules(const ToolEvent& event) const {
    std::vector<CoordinationRule> rules;
    if (!config_.enable_escalation || !router_ || !event.isFailure()) {
        return rules;
    }

    for (const auto& match : router_->route(event)) {
        if (match.rule.action != RoutingAction::REDIRECT) {
            continue;
        }
        CoordinationRule rule;
        rule.id = "escalation:" + match.rule.id;
        rule.name = match.rule.name;
        rule.source_tool = match.source_tool;
        rule.target_tool = match.rule.redirect_to;
        rule.trigger_event = event.event_type;
        rule.priority = match.rule.priority;
        rule.metadata["retry_policy_class"] = match.rule.retry_policy_class;
        rule.metadata["escalation_rule"] = match.rule.id;

        const nlohmann::json parameters = match.parameters;
        rule.transform = [parameters](const nlohmann::json& data) {
            return nlohmann::json{{"parameters", parameters}, {"data", data}};
        };
        rules.push_back(std::move(rule));
    }
    return rules;
}

CoordinationResult CoordinationEngine::executeCoordination(const ToolEvent& event, const CoordinationRule& rule,
                                                           const CancellationToken& cancellation) {
    if (!graph_.hasNode(rule.target_tool)) {
        throw CoordinationError("target tool " + rule.target_tool + " not registered",
                                CoordinationStatus::FAILED, rule.id, rule.source_tool, rule.target_tool);
    }

    const std::string coordination_id = nextId("coord");
    const auto started = std::chrono::steady_clock::now();

    auto active = std::make_shared<ActiveCoordination>();
    active->info.id = coordination_id;
    active->info.rule_id = rule.id;
    active->info.source_tool = rule.source_tool;
    active->info.target_tool = rule.target_tool;
    active->info.start_time = std::chrono::system_clock::now();
    active->info.status = CoordinationStatus::RUNNING;
    active->info.context = event.context;

    {
        std::unique_lock<std::shared_mutex> lock(active_mutex_);
        active_[coordination_id] = active;
    }

    // EN: The record leaves the active map however this coordination ends.
    // FR: L'enregistrement quitte la table active quelle que soit l'issue.
    struct ActiveRecordGuard {
        CoordinationEngine& engine;
        const std::string& id;
        ~ActiveRecordGuard() { engine.removeActive(id); }
    } guard{*this, coordination_id};

    auto fail = [&](CoordinationStatus status, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(active->mutex);
            active->info.status = status;
        }
        postBookkeeping([this, target = rule.target_tool]() { graph_.setStatus(target, ToolNodeStatus::FAILED); });
        return CoordinationError(message, status, rule.id, rule.source_tool, rule.target_tool);
    };

    nlohmann::json payload = event.data;
    if (rule.transform) {
        try {
            payload = rule.transform(event.data);
        } catch (const std::exception& e) {
            throw fail(CoordinationStatus::FAILED, "data transformation failed: " + std::string(e.what()));
        }
    }

    ToolMessage message;
    message.id = nextId("msg");
    message.from = rule.source_tool;
    message.to = rule.target_tool;
    message.type = "coordination";
    message.payload = std::move(payload);
    message.context = event.context;
    message.timestamp = std::chrono::system_clock::now();
    message.correlation_id = coordination_id;

    postBookkeeping([this, target = rule.target_tool, when = message.timestamp]() {
        graph_.setStatus(target, ToolNodeStatus::RUNNING);
        graph_.recordRun(target, when);
    });

    try {
        bridge_->send(cancellation, rule.source_tool, rule.target_tool, message);
    } catch (const std::exception& e) {
        throw fail(CoordinationStatus::FAILED, "failed to send coordination message: " + std::string(e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(active->mutex);
        active->info.messages.push_back(message);
    }

    LOG_DEBUG_META("coordination", "Coordination dispatched", (std::unordered_map<std::string, std::string>{
        {"coordination_id", coordination_id},
        {"rule_id", rule.id},
        {"source_tool", rule.source_tool},
        {"target_tool", rule.target_tool}
    }));

    CancellationRegistration registration(cancellation, [active]() {
        {
            std::lock_guard<std::mutex> lock(active->mutex);
            active->cancelled = true;
        }
        active->condition.notify_all();
    });

    const auto deadline = started + config_.timeout;
    std::unique_lock<std::mutex> lock(active->mutex);
    active->condition.wait_until(lock, deadline, [&active]() {
        return active->completion.has_value() || active->cancelled;
    });

    if (active->completion) {
        active->info.status = CoordinationStatus::COMPLETED;
        CoordinationResult result = *active->completion;
        lock.unlock();

        result.status = CoordinationStatus::COMPLETED;
        result.coordination_id = coordination_id;
        result.rule_id = rule.id;
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
        postBookkeeping([this, target = rule.target_tool]() { graph_.setStatus(target, ToolNodeStatus::COMPLETED); });
        return result;
    }

    // EN: Resolve under the lock so a late completeCoordination is refused.
    // FR: Résolution sous verrou pour refuser un completeCoordination tardif.
    const bool cancelled = active->cancelled;
    active->info.status = cancelled ? CoordinationStatus::CANCELLED : CoordinationStatus::TIMEOUT;
    lock.unlock();
    if (cancelled) {
        throw fail(CoordinationStatus::CANCELLED, "coordination cancelled");
    }
    throw fail(CoordinationStatus::TIMEOUT, "coordination timeout after " +
               std::to_string(config_.timeout.count()) + "ms");
}

bool CoordinationEngine::completeCoordination(const std::string& coordination_id, const CoordinationResult& result) {
    std::shared_ptr<ActiveCoordination> active;
    {
        std::shared_lock<std::shared_mutex> lock(active_mutex_);
        auto it = active_.find(coordination_id);
        if (it == active_.end()) {
            return false;
        }
        active = it->second;
    }

    {
        std::lock_guard<std::mutex> lock(active->mutex);
        if (active->completion || active->info.status != CoordinationStatus::RUNNING) {
            return false;
        }
        active->completion = result;
    }
    active->condition.notify_all();
    return true;
}

std::vector<ActiveCoordinationInfo> CoordinationEngine::getActiveCoordinations() const {
    std::vector<std::shared_ptr<ActiveCoordination>> records;
    {
        std::shared_lock<std::shared_mutex> lock(active_mutex_);
        records.reserve(active_.size());
        for (const auto& [id, record] : active_) {
            records.push_back(record);
        }
    }

    std::vector<ActiveCoordinationInfo> infos;
    infos.reserve(records.size());
    for (const auto& record : records) {
        std::lock_guard<std::mutex> lock(record->mutex);
        infos.push_back(record->info);
    }
    return infos;
}

void CoordinationEngine::removeActive(const std::string& coordination_id) {
    std::unique_lock<std::shared_mutex> lock(active_mutex_);
    active_.erase(coordination_id);
}

CoordinationMetrics CoordinationEngine::getMetrics() const {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void CoordinationEngine::flushMetrics() {
    bookkeeping_queue_.waitForAll();
}

void CoordinationEngine::recordOutcome(const std::string& source_tool, const std::string& target_tool,
                                       std::chrono::microseconds duration, bool success) {
    postBookkeeping([this, source_tool, target_tool, duration, success]() {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        metrics_.total_coordinations++;
        if (success) {
            metrics_.successful_coordinations++;
            const auto n = static_cast<long long>(metrics_.successful_coordinations);
            metrics_.average_latency = std::chrono::microseconds(
                (metrics_.average_latency.count() * (n - 1) + duration.count()) / n);
        } else {
            metrics_.failed_coordinations++;
        }

        auto& pair = metrics_.tool_pairs[pairKey(source_tool, target_tool)];
        pair.source_tool = source_tool;
        pair.target_tool = target_tool;
        pair.count++;
        if (success) {
            pair.successes++;
        } else {
            pair.failures++;
        }
        pair.total_time += duration;
    });
}

// EN: A full queue runs the update inline, so bookkeeping never lags by more than the queue capacity.
// FR: Une file pleine exécute la mise à jour en ligne ; le retard est borné par la capacité.
void CoordinationEngine::postBookkeeping(std::function<void()> task) {
    if (!bookkeeping_queue_.tryPost(task)) {
        task();
    }
}

std::string CoordinationEngine::nextId(const char* prefix) {
    const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return std::string(prefix) + "_" + std::to_string(nanos) + "_" + std::to_string(++id_counter_);
}

void CoordinationEngine::registerDefaultRules() {
    std::unique_lock<std::shared_mutex> lock(rules_mutex_);
    rules_.push_back(makeDefaultRule("build_failure_analyze", "Route build failures to analysis",
                                     "build_image", "analyze_repository", "build_failed", 10,
                                     ConditionType::OUTPUT_CONTAINS, "error_type", ConditionOperator::EQUALS,
                                     "dockerfile_error"));
    rules_.push_back(makeDefaultRule("security_vuln_rebuild", "Trigger rebuild on security vulnerabilities",
                                     "scan_security", "build_image", "vulnerabilities_found", 9,
                                     ConditionType::METRIC_THRESHOLD, "severity_score", ConditionOperator::GREATER_THAN,
                                     7.0));
    rules_.push_back(makeDefaultRule("deploy_failure_regenerate", "Regenerate manifests on deployment failure",
                                     "deploy_kubernetes", "generate_manifests", "deployment_failed", 8,
                                     ConditionType::OUTPUT_CONTAINS, "error_type", ConditionOperator::EQUALS,
                                     "manifest_invalid"));
}

} // namespace CKW::Orchestrator
