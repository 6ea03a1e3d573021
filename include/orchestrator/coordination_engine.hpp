// EN: Coordination Engine for CK-Workflow - timeout-bounded cross-tool hand-offs driven by matched rules
// FR: Moteur de coordination pour CK-Workflow - passages de relais inter-outils bornés par un timeout

#pragma once

#include "infrastructure/system/cancellation.hpp"
#include "infrastructure/threading/work_queue.hpp"
#include "orchestrator/communication_bridge.hpp"
#include "orchestrator/dependency_graph.hpp"
#include "orchestrator/escalation_router.hpp"
#include "orchestrator/rule_condition.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace CKW::Orchestrator {

// EN: running is the only non-terminal state.
// FR: running est le seul état non terminal.
enum class CoordinationStatus {
    RUNNING,
    COMPLETED,
    CANCELLED,
    TIMEOUT,
    FAILED
};

std::string coordinationStatusToString(CoordinationStatus status);

// EN: Rewrites the source event data into the target's payload; throws to abort the coordination.
// FR: Réécrit les données de l'événement source en charge utile cible ; lève pour annuler la coordination.
using DataTransform = std::function<nlohmann::json(const nlohmann::json&)>;

// EN: Hand-off rule keyed by (source tool, trigger event). An empty trigger matches any event.
// FR: Règle de relais indexée par (outil source, événement déclencheur). Un déclencheur vide accepte tout.
struct CoordinationRule {
    std::string id;
    std::string name;
    std::string source_tool;
    std::string target_tool;
    std::string trigger_event;
    std::vector<RuleCondition> conditions;
    DataTransform transform;
    int priority = 0;
    nlohmann::json metadata = nlohmann::json::object();
};

struct CoordinationResult {
    bool success = false;
    CoordinationStatus status = CoordinationStatus::COMPLETED;
    std::string error;
    std::chrono::milliseconds duration{0};
    nlohmann::json output;
    nlohmann::json metadata = nlohmann::json::object();
    std::string coordination_id;
    std::string rule_id;
};

// EN: Snapshot of an in-flight coordination.
// FR: Instantané d'une coordination en cours.
struct ActiveCoordinationInfo {
    std::string id;
    std::string rule_id;
    std::string source_tool;
    std::string target_tool;
    TimePoint start_time{};
    CoordinationStatus status = CoordinationStatus::RUNNING;
    std::vector<ToolMessage> messages;
    nlohmann::json context = nlohmann::json::object();
};

// EN: A coordination that did not complete. Aborts the whole coordinateExecution call.
// FR: Une coordination non terminée. Interrompt tout l'appel coordinateExecution.
class CoordinationError : public std::runtime_error {
public:
    CoordinationError(const std::string& message, CoordinationStatus status, std::string rule_id,
                      std::string source_tool, std::string target_tool)
        : std::runtime_error(message), status_(status), rule_id_(std::move(rule_id)),
          source_tool_(std::move(source_tool)), target_tool_(std::move(target_tool)) {}

    CoordinationStatus status() const { return status_; }
    const std::string& ruleId() const { return rule_id_; }
    const std::string& sourceTool() const { return source_tool_; }
    const std::string& targetTool() const { return target_tool_; }

private:
    CoordinationStatus status_;
    std::string rule_id_;
    std::string source_tool_;
    std::string target_tool_;
};

struct CoordinationConfig {
    std::chrono::milliseconds timeout{30000};
    bool enable_escalation = true;
    // EN: true runs every matched rule and returns the last result; false applies only the top match.
    // FR: true exécute toutes les règles et retourne le dernier résultat ; false n'applique que la première.
    bool execute_all_matches = true;
    size_t metrics_queue_capacity = 256;
    bool register_default_rules = true;
};

struct ToolPairMetric {
    std::string source_tool;
    std::string target_tool;
    size_t count = 0;
    size_t successes = 0;
    size_t failures = 0;
    std::chrono::microseconds total_time{0};

    std::chrono::microseconds averageDuration() const {
        return count == 0 ? std::chrono::microseconds{0}
                          : std::chrono::microseconds(total_time.count() / static_cast<long long>(count));
    }
};

struct CoordinationMetrics {
    size_t total_coordinations = 0;
    size_t successful_coordinations = 0;
    size_t failed_coordinations = 0;
    std::chrono::microseconds average_latency{0};    // EN: Successful coordinations only / FR: Coordinations réussies uniquement
    std::map<std::string, ToolPairMetric> tool_pairs; // EN: Keyed "source->target" / FR: Clé "source->target"
};

// EN: Runs the hand-off implied by matched rules: transform, dispatch, then wait for completion,
//     cancellation or timeout. Registry locks are never held across dispatch, transform or wait.
// FR: Exécute le relais impliqué par les règles satisfaites : transformation, envoi, puis attente de
//     fin, d'annulation ou du timeout. Les verrous ne sont jamais tenus pendant l'envoi ou l'attente.
class CoordinationEngine {
public:
    CoordinationEngine(std::shared_ptr<CommunicationBridge> bridge,
                       std::shared_ptr<EscalationRouter> router = nullptr,
                       const CoordinationConfig& config = CoordinationConfig{});
    ~CoordinationEngine();

    CoordinationEngine(const CoordinationEngine&) = delete;
    CoordinationEngine& operator=(const CoordinationEngine&) = delete;

    void registerTool(const std::string& tool_name, const std::vector<std::string>& dependencies = {});
    bool isToolRegistered(const std::string& tool_name) const;

    // EN: Throws std::invalid_argument when the source or target tool is not registered.
    // FR: Lève std::invalid_argument si l'outil source ou cible n'est pas enregistré.
    void addCoordinationRule(const CoordinationRule& rule);
    std::vector<CoordinationRule> getCoordinationRules() const;

    // EN: Matched rules run by descending priority; the first failure aborts with CoordinationError.
    //     Without any match the result is a success carrying "no applicable rules".
    // FR: Les règles satisfaites s'exécutent par priorité décroissante ; le premier échec interrompt
    //     avec CoordinationError. Sans correspondance, le résultat est un succès "no applicable rules".
    CoordinationResult coordinateExecution(const ToolEvent& event,
                                           const CancellationToken& cancellation = CancellationToken());

    // EN: Delivers the target's outcome. False when the id is unknown or already resolved.
    // FR: Transmet le résultat de la cible. False si l'id est inconnu ou déjà résolu.
    bool completeCoordination(const std::string& coordination_id, const CoordinationResult& result);

    std::vector<ActiveCoordinationInfo> getActiveCoordinations() const;

    const ToolDependencyGraph& dependencyGraph() const { return graph_; }
    std::shared_ptr<EscalationRouter> escalationRouter() const { return router_; }
    const CoordinationConfig& getConfig() const { return config_; }

    CoordinationMetrics getMetrics() const;

    // EN: Waits until queued bookkeeping has been applied.
    // FR: Attend que le suivi en file ait été appliqué.
    void flushMetrics();

private:
    struct ActiveCoordination {
        ActiveCoordinationInfo info;
        std::optional<CoordinationResult> completion;
        bool cancelled = false;
        std::mutex mutex;
        std::condition_variable condition;
    };

    std::vector<CoordinationRule> findApplicableRules(const ToolEvent& event) const;
    std::vector<CoordinationRule> escalationRules(const ToolEvent& event) const;
    CoordinationResult executeCoordination(const ToolEvent& event, const CoordinationRule& rule,
                                           const CancellationToken& cancellation);
    void removeActive(const std::string& coordination_id);

    void recordOutcome(const std::string& source_tool, const std::string& target_tool,
                       std::chrono::microseconds duration, bool success);
    void postBookkeeping(std::function<void()> task);
    void registerDefaultRules();

    std::string nextId(const char* prefix);

    std::shared_ptr<CommunicationBridge> bridge_;
    std::shared_ptr<EscalationRouter> router_;
    CoordinationConfig config_;
    ToolDependencyGraph graph_;

    std::vector<CoordinationRule> rules_;
    mutable std::shared_mutex rules_mutex_;

    std::map<std::string, std::shared_ptr<ActiveCoordination>> active_;
    mutable std::shared_mutex active_mutex_;

    CoordinationMetrics metrics_;
    mutable std::mutex metrics_mutex_;

    std::atomic<unsigned long long> id_counter_{0};
    WorkQueue bookkeeping_queue_;
};

} // namespace CKW::Orchestrator
