#include "dag/DependencyResolver.hpp"
#include "dag/Errors.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include <algorithm>

namespace dag {

int StagedPlan::stageOf(const std::string& nodeId) const {
    for (size_t i = 0; i < stages.size(); ++i) {
        if (std::find(stages[i].begin(), stages[i].end(), nodeId) != stages[i].end()) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

StagedPlan DependencyResolver::resolve(const GraphSnapshot& snapshot) {
    PROFILE_SCOPE("resolve");

    // In-degree per node, checking edges against the node set
    std::unordered_map<std::string, size_t> inDegree;
    for (const auto& node : snapshot.nodes()) {
        inDegree[node.id] = 0;
    }
    for (const auto& edge : snapshot.edges()) {
        if (!inDegree.count(edge.source) || !inDegree.count(edge.target)) {
            throw ConsistencyError("edge " + edge.source + " -> " + edge.target +
                                   " references an unknown node");
        }
        inDegree[edge.target]++;
    }

    StagedPlan plan;

    Stage current;
    for (const auto& [nodeId, degree] : inDegree) {
        if (degree == 0) {
            current.push_back(nodeId);
        }
    }

    size_t placed = 0;
    while (!current.empty()) {
        std::sort(current.begin(), current.end());
        placed += current.size();

        // Removing this stage releases the next one
        Stage next;
        for (const auto& nodeId : current) {
            for (const auto& successor : snapshot.successors(nodeId)) {
                if (--inDegree[successor] == 0) {
                    next.push_back(successor);
                }
            }
        }

        plan.stages.push_back(std::move(current));
        current = std::move(next);
    }

    if (placed != snapshot.nodeCount()) {
        LOG_ERROR("Dependency resolution placed " + std::to_string(placed) + " of " +
                  std::to_string(snapshot.nodeCount()) + " nodes");
        throw ConsistencyError("graph contains a cycle (" + std::to_string(snapshot.nodeCount() - placed) +
                               " node(s) never became ready)");
    }

    for (const auto& node : snapshot.nodes()) {
        plan.nodes.emplace(node.id, node);
    }

    LOG_DEBUG("Resolved " + std::to_string(placed) + " node(s) into " +
              std::to_string(plan.stages.size()) + " stage(s)");
    return plan;
}

} // namespace dag
