// EN: Pipeline Dependency Resolver implementation. Arena graph, Kahn ordering and cycle reporting.
// FR: Implémentation du résolveur de dépendances. Graphe en arène, tri de Kahn et rapport de cycles.

#include "orchestrator/pipeline_engine.hpp"
#include "orchestrator/pipeline_errors.hpp"

#include <algorithm>
#include <functional>
#include <queue>
#include <set>

namespace DPF {
namespace Orchestrator {

PipelineDependencyResolver::PipelineDependencyResolver(const PipelineDefinition& definition) {
    nodes_.reserve(definition.stages.size());

    // EN: Every stage gets a node, duplicates included, so node i is always stage i.
    // FR: Chaque étape a un nœud, doublons compris, donc le nœud i est toujours l'étape i.
    for (size_t i = 0; i < definition.stages.size(); ++i) {
        Node node;
        node.name = definition.stages[i].name;
        if (!index_.emplace(node.name, i).second) {
            duplicates_.push_back(node.name);
        }
        nodes_.push_back(std::move(node));
    }

    for (size_t i = 0; i < definition.stages.size(); ++i) {
        std::set<size_t> seen;
        for (const auto& need : definition.stages[i].needs) {
            auto it = index_.find(need);
            if (it == index_.end()) {
                nodes_[i].missing.push_back(need);
                continue;
            }
            if (it->second == i) {
                nodes_[i].self_dependency = true;
                continue;
            }
            if (!seen.insert(it->second).second) {
                continue;
            }
            nodes_[i].predecessors.push_back(it->second);
            nodes_[it->second].successors.push_back(i);
        }
    }
}

std::vector<std::string> PipelineDependencyResolver::validate() const {
    std::vector<std::string> problems;

    for (const auto& name : duplicates_) {
        problems.push_back("duplicate stage name '" + name + "'");
    }
    for (const auto& node : nodes_) {
        if (!PipelineUtils::isValidStageName(node.name)) {
            problems.push_back("invalid stage name '" + node.name + "' (allowed: letters, digits, '_' and '-')");
        }
        for (const auto& missing : node.missing) {
            problems.push_back("stage '" + node.name + "' needs unknown stage '" + missing + "'");
        }
        if (node.self_dependency) {
            problems.push_back("stage '" + node.name + "' depends on itself");
        }
    }

    auto cycle = getCircularDependencies();
    if (!cycle.empty()) {
        std::string path;
        for (size_t i = 0; i < cycle.size(); ++i) {
            if (i > 0) path += " -> ";
            path += cycle[i];
        }
        problems.push_back("dependency cycle: " + path);
    }
    return problems;
}

void PipelineDependencyResolver::validateOrThrow() const {
    auto problems = validate();
    if (!problems.empty()) {
        throw DefinitionError(problems);
    }
}

bool PipelineDependencyResolver::hasCircularDependency() const {
    return !topologicalSort().has_value();
}

std::vector<std::string> PipelineDependencyResolver::getCircularDependencies() const {
    return namesOf(findCycle());
}

std::vector<std::string> PipelineDependencyResolver::getExecutionOrder() const {
    return namesOf(getExecutionOrderIndices());
}

std::vector<size_t> PipelineDependencyResolver::getExecutionOrderIndices() const {
    auto order = topologicalSort();
    if (!order) {
        throw DefinitionError("dependency graph contains a cycle");
    }
    return *order;
}

std::vector<std::vector<std::string>> PipelineDependencyResolver::getExecutionLevels() const {
    std::vector<size_t> level(nodes_.size(), 0);
    size_t max_level = 0;

    for (size_t index : getExecutionOrderIndices()) {
        for (size_t pred : nodes_[index].predecessors) {
            level[index] = std::max(level[index], level[pred] + 1);
        }
        max_level = std::max(max_level, level[index]);
    }

    std::vector<std::vector<std::string>> levels(nodes_.empty() ? 0 : max_level + 1);
    for (size_t i = 0; i < nodes_.size(); ++i) {
        levels[level[i]].push_back(nodes_[i].name);
    }
    return levels;
}

std::vector<std::string> PipelineDependencyResolver::getDependents(const std::string& stage_name) const {
    auto index = indexOf(stage_name);
    return index ? namesOf(nodes_[*index].successors) : std::vector<std::string>{};
}

std::vector<std::string> PipelineDependencyResolver::getDependencies(const std::string& stage_name) const {
    auto index = indexOf(stage_name);
    return index ? namesOf(nodes_[*index].predecessors) : std::vector<std::string>{};
}

std::vector<std::string> PipelineDependencyResolver::getTransitiveDependents(const std::string& stage_name) const {
    auto start = indexOf(stage_name);
    if (!start) {
        return {};
    }

    std::vector<bool> visited(nodes_.size(), false);
    std::vector<size_t> pending = nodes_[*start].successors;
    while (!pending.empty()) {
        size_t current = pending.back();
        pending.pop_back();
        if (visited[current]) {
            continue;
        }
        visited[current] = true;
        for (size_t next : nodes_[current].successors) {
            pending.push_back(next);
        }
    }

    std::vector<size_t> result;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (visited[i] && i != *start) {
            result.push_back(i);
        }
    }
    return namesOf(result);
}

std::optional<size_t> PipelineDependencyResolver::indexOf(const std::string& stage_name) const {
    auto it = index_.find(stage_name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// EN: Kahn's algorithm; among ready nodes the lowest definition index goes first.
// FR: Algorithme de Kahn ; parmi les nœuds prêts, le plus petit indice de définition passe en premier.
std::optional<std::vector<size_t>> PipelineDependencyResolver::topologicalSort() const {
    std::vector<size_t> in_degree(nodes_.size(), 0);
    for (size_t i = 0; i < nodes_.size(); ++i) {
        in_degree[i] = nodes_[i].predecessors.size();
    }

    std::priority_queue<size_t, std::vector<size_t>, std::greater<size_t>> ready;
    for (size_t i = 0; i < nodes_.size(); ++i) {
        if (in_degree[i] == 0) {
            ready.push(i);
        }
    }

    std::vector<size_t> order;
    order.reserve(nodes_.size());
    while (!ready.empty()) {
        size_t current = ready.top();
        ready.pop();
        order.push_back(current);
        for (size_t next : nodes_[current].successors) {
            if (--in_degree[next] == 0) {
                ready.push(next);
            }
        }
    }

    if (order.size() != nodes_.size()) {
        return std::nullopt;
    }
    return order;
}

// EN: Iterative DFS along `needs` edges with colors (0=white, 1=gray, 2=black).
// EN: A back edge closes the cycle found on the current path.
// FR: DFS itératif le long des arêtes `needs` avec couleurs (0=blanc, 1=gris, 2=noir).
// FR: Une arête arrière ferme le cycle trouvé sur le chemin courant.
std::vector<size_t> PipelineDependencyResolver::findCycle() const {
    std::vector<int> colors(nodes_.size(), 0);

    for (size_t root = 0; root < nodes_.size(); ++root) {
        if (colors[root] != 0) {
            continue;
        }

        std::vector<std::pair<size_t, size_t>> stack = {{root, 0}};
        std::vector<size_t> path = {root};
        colors[root] = 1;

        while (!stack.empty()) {
            auto& [current, edge] = stack.back();
            const auto& preds = nodes_[current].predecessors;

            if (edge == preds.size()) {
                colors[current] = 2;
                stack.pop_back();
                path.pop_back();
                continue;
            }

            size_t next = preds[edge++];
            if (colors[next] == 1) {
                auto start = std::find(path.begin(), path.end(), next);
                std::vector<size_t> cycle(start, path.end());
                cycle.push_back(next);
                return cycle;
            }
            if (colors[next] == 0) {
                colors[next] = 1;
                stack.emplace_back(next, 0);
                path.push_back(next);
            }
        }
    }
    return {};
}

std::vector<std::string> PipelineDependencyResolver::namesOf(const std::vector<size_t>& indices) const {
    std::vector<std::string> names;
    names.reserve(indices.size());
    for (size_t index : indices) {
        names.push_back(nodes_[index].name);
    }
    return names;
}

} // namespace Orchestrator
} // namespace DPF
