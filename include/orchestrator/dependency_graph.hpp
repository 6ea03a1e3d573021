#pragma once

#include "infrastructure/system/time_utils.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace CKW::Orchestrator {

// EN: Coarse scheduling status of a tool node.
// FR: Statut d'ordonnancement d'un nœud outil.
enum class ToolNodeStatus {
    READY,
    WAITING,
    RUNNING,
    COMPLETED,
    FAILED
};

std::string toolNodeStatusToString(ToolNodeStatus status);

// EN: Per-tool dependency node. `dependents` are the reverse edges.
// FR: Nœud de dépendance par outil. `dependents` sont les arêtes inverses.
struct DependencyNode {
    std::string tool_name;
    std::vector<std::string> dependencies;
    std::vector<std::string> dependents;
    ToolNodeStatus status = ToolNodeStatus::READY;
    std::optional<TimePoint> last_run;
    std::size_t run_count = 0;
};

// EN: Raised when the declared dependencies contain a cycle. `cycle()` lists the tools on it,
//     starting and ending with the same tool.
// FR: Levée quand les dépendances déclarées contiennent un cycle. `cycle()` liste les outils du
//     cycle, commençant et finissant par le même outil.
class CyclicDependencyError : public std::runtime_error {
public:
    explicit CyclicDependencyError(std::vector<std::string> cycle);

    const std::vector<std::string>& cycle() const { return cycle_; }

private:
    std::vector<std::string> cycle_;
};

// EN: Tool-to-tool ordering constraints. Registration takes an exclusive lock, queries a shared one.
// FR: Contraintes d'ordre entre outils. L'enregistrement prend un verrou exclusif, les requêtes un partagé.
class ToolDependencyGraph {
public:
    ToolDependencyGraph() = default;

    // EN: Register or replace a tool and its dependencies; reverse edges are back-filled on
    //     already-registered dependencies, and later registrations of dependencies pick up
    //     existing dependents.
    // FR: Enregistre ou remplace un outil et ses dépendances ; les arêtes inverses sont
    //     complétées sur les dépendances déjà enregistrées, et les enregistrements ultérieurs
    //     récupèrent les dépendants existants.
    void addNode(const std::string& tool_name, const std::vector<std::string>& dependencies);

    bool hasNode(const std::string& tool_name) const;
    std::optional<DependencyNode> getNode(const std::string& tool_name) const;
    std::vector<std::string> getToolNames() const;
    std::size_t size() const;

    // EN: Depth-first post-order: every dependency precedes its dependents. Declared but unregistered
    //     dependencies are emitted too. Throws CyclicDependencyError on a back edge.
    // FR: Post-ordre en profondeur : chaque dépendance précède ses dépendants. Les dépendances
    //     déclarées mais non enregistrées sont aussi émises. Lève CyclicDependencyError sur un arc arrière.
    std::vector<std::string> getExecutionOrder() const;

    // EN: Status bookkeeping; false when the tool is unknown.
    // FR: Suivi de statut ; false si l'outil est inconnu.
    bool setStatus(const std::string& tool_name, ToolNodeStatus status);
    bool recordRun(const std::string& tool_name, TimePoint when);

private:
    void visit(const std::string& tool_name, std::map<std::string, int>& colors,
               std::vector<std::string>& path, std::vector<std::string>& order) const;

    std::map<std::string, DependencyNode> nodes_;
    // EN: Forward edges: dependency -> tools that depend on it.
    // FR: Arêtes directes : dépendance -> outils qui en dépendent.
    std::map<std::string, std::vector<std::string>> edges_;
    mutable std::shared_mutex mutex_;
};

} // namespace CKW::Orchestrator
