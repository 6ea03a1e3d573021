// EN: Tool dependency graph with cycle detection and execution ordering
// FR: Graphe de dépendances des outils avec détection de cycles et ordre d'exécution

#include "orchestrator/dependency_graph.hpp"

#include <algorithm>
#include <mutex>

namespace CKW::Orchestrator {

namespace {

std::string joinCycle(const std::vector<std::string>& cycle) {
    std::string text;
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) {
            text += " -> ";
        }
        text += cycle[i];
    }
    return text;
}

void addUnique(std::vector<std::string>& values, const std::string& value) {
    if (std::find(values.begin(), values.end(), value) == values.end()) {
        values.push_back(value);
    }
}

void removeValue(std::vector<std::string>& values, const std::string& value) {
    values.erase(std::remove(values.begin(), values.end(), value), values.end());
}

} // namespace

std::string toolNodeStatusToString(ToolNodeStatus status) {
    switch (status) {
        case ToolNodeStatus::READY:     return "ready";
        case ToolNodeStatus::WAITING:   return "waiting";
        case ToolNodeStatus::RUNNING:   return "running";
        case ToolNodeStatus::COMPLETED: return "completed";
        case ToolNodeStatus::FAILED:    return "failed";
    }
    return "ready";
}

CyclicDependencyError::CyclicDependencyError(std::vector<std::string> cycle)
    : std::runtime_error("cyclic dependency detected: " + joinCycle(cycle)), cycle_(std::move(cycle)) {}

void ToolDependencyGraph::addNode(const std::string& tool_name, const std::vector<std::string>& dependencies) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    DependencyNode& node = nodes_[tool_name];
    node.tool_name = tool_name;

    // EN: Drop the edges of a previous registration before adding the new ones.
    // FR: Retire les arêtes d'un enregistrement précédent avant d'ajouter les nouvelles.
    for (const auto& old_dependency : node.dependencies) {
        removeValue(edges_[old_dependency], tool_name);
        auto it = nodes_.find(old_dependency);
        if (it != nodes_.end()) {
            removeValue(it->second.dependents, tool_name);
        }
    }

    node.dependencies.clear();
    for (const auto& dependency : dependencies) {
        addUnique(node.dependencies, dependency);
    }
    for (const auto& dependency : node.dependencies) {
        addUnique(edges_[dependency], tool_name);
        auto it = nodes_.find(dependency);
        if (it != nodes_.end()) {
            addUnique(it->second.dependents, tool_name);
        }
    }

    auto edges = edges_.find(tool_name);
    node.dependents = edges != edges_.end() ? edges->second : std::vector<std::string>{};
}

bool ToolDependencyGraph::hasNode(const std::string& tool_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_.count(tool_name) > 0;
}

std::optional<DependencyNode> ToolDependencyGraph::getNode(const std::string& tool_name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = nodes_.find(tool_name);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ToolDependencyGraph::getToolNames() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(nodes_.size());
    for (const auto& [name, node] : nodes_) {
        names.push_back(name);
    }
    return names;
}

std::size_t ToolDependencyGraph::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return nodes_.size();
}

std::vector<std::string> ToolDependencyGraph::getExecutionOrder() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    // EN: Colors: 0 = white (unvisited), 1 = gray (on the current path), 2 = black (emitted).
    // FR: Couleurs : 0 = blanc (non visité), 1 = gris (sur le chemin courant), 2 = noir (émis).
    std::map<std::string, int> colors;
    std::vector<std::string> path;
    std::vector<std::string> order;
    order.reserve(nodes_.size());

    for (const auto& [name, node] : nodes_) {
        if (colors[name] == 0) {
            visit(name, colors, path, order);
        }
    }
    return order;
}

void ToolDependencyGraph::visit(const std::string& tool_name, std::map<std::string, int>& colors,
                                std::vector<std::string>& path, std::vector<std::string>& order) const {
    colors[tool_name] = 1;
    path.push_back(tool_name);

    auto it = nodes_.find(tool_name);
    if (it != nodes_.end()) {
        for (const auto& dependency : it->second.dependencies) {
            const int color = colors[dependency];
            if (color == 1) {
                // EN: Back edge: report the path segment from the dependency to here.
                // FR: Arc arrière : rapporte le segment du chemin depuis la dépendance.
                auto start = std::find(path.begin(), path.end(), dependency);
                std::vector<std::string> cycle(start, path.end());
                cycle.push_back(dependency);
                throw CyclicDependencyError(std::move(cycle));
            }
            if (color == 0) {
                visit(dependency, colors, path, order);
            }
        }
    }

    path.pop_back();
    colors[tool_name] = 2;
    order.push_back(tool_name);
}

bool ToolDependencyGraph::setStatus(const std::string& tool_name, ToolNodeStatus status) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = nodes_.find(tool_name);
    if (it == nodes_.end()) {
        return false;
    }
    it->second.status = status;
    return true;
}

bool ToolDependencyGraph::recordRun(const std::string& tool_name, TimePoint when) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = nodes_.find(tool_name);
    if (it == nodes_.end()) {
        return false;
    }
    it->second.last_run = when;
    it->second.run_count++;
    return true;
}

} // namespace CKW::Orchestrator
