#pragma once

#include "dag/GraphStore.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace dag {

/**
 * Set of node ids that may run concurrently (sorted ascending)
 */
using Stage = std::vector<std::string>;

/**
 * Execution order derived from a snapshot
 *
 * stages[i+1] may depend on stages[i] and must not start before it
 * completes. The plan also carries a copy of every planned node, so
 * the executor never touches the graph.
 */
struct StagedPlan {
    std::vector<Stage> stages;
    std::unordered_map<std::string, Node> nodes;

    size_t nodeCount() const { return nodes.size(); }

    /**
     * Index of the stage holding the node, or -1
     */
    int stageOf(const std::string& nodeId) const;
};

/**
 * Converts a graph snapshot into a StagedPlan
 *
 * Kahn's algorithm generalised to stages: stage 0 is every node with
 * no predecessor, each following stage is the set of nodes whose last
 * predecessor was in the previous one. Ties are broken by id so the
 * output is reproducible.
 */
class DependencyResolver {
public:
    /**
     * Throws ConsistencyError if the snapshot contains a cycle or an
     * edge to an unknown node
     */
    static StagedPlan resolve(const GraphSnapshot& snapshot);
};

} // namespace dag
