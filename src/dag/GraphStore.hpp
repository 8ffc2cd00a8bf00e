#pragma once

#include "dag/Types.hpp"
#include "dag/OperationRegistry.hpp"
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dag {

/**
 * Frozen copy of a graph, handed to the resolver
 *
 * Nodes and edges keep their insertion order.
 */
class GraphSnapshot {
public:
    GraphSnapshot() = default;
    GraphSnapshot(std::vector<Node> nodes, std::vector<Edge> edges);

    const std::vector<Node>& nodes() const { return m_nodes; }
    const std::vector<Edge>& edges() const { return m_edges; }
    size_t nodeCount() const { return m_nodes.size(); }
    size_t edgeCount() const { return m_edges.size(); }

    /**
     * Returns nullptr if not found
     */
    const Node* findNode(const std::string& id) const;

    size_t inDegree(const std::string& id) const;
    size_t outDegree(const std::string& id) const;
    const std::vector<std::string>& successors(const std::string& id) const;

private:
    std::vector<Node> m_nodes;
    std::vector<Edge> m_edges;
    std::unordered_map<std::string, size_t> m_index;
    std::unordered_map<std::string, std::vector<std::string>> m_successors;
    std::unordered_map<std::string, size_t> m_inDegree;
};

/**
 * Mutable DAG of operation nodes
 *
 * Every mutation is validated and atomic: a failed call leaves the
 * graph exactly as it was. The edge set is acyclic at all times.
 * A read-write lock separates mutations from snapshots and queries.
 */
class GraphStore {
public:
    explicit GraphStore(const OperationRegistry& registry = OperationRegistry::defaults());

    // Non-copyable (owns a lock)
    GraphStore(const GraphStore&) = delete;
    GraphStore& operator=(const GraphStore&) = delete;

    // === Node Management ===

    /**
     * Add a node
     *
     * Throws DuplicateNodeError, UnknownKindError, MissingParameterError
     * or InvalidParameterError (empty id, malformed list, values the
     * operation rejects such as a zero SMA window).
     */
    void addNode(const std::string& id, const std::string& kind, const ParamList& parameters);

    /**
     * Remove a node and every incident edge; no-op if absent
     */
    void removeNode(const std::string& id);

    // === Edge Management ===

    /**
     * Add source -> target
     *
     * Throws NodeNotFoundError if an endpoint is missing, CycleError if
     * target already reaches source. Adding an existing edge is a no-op.
     */
    void addEdge(const std::string& source, const std::string& target);

    /**
     * Remove source -> target; no-op if absent
     */
    void removeEdge(const std::string& source, const std::string& target);

    /**
     * Remove every node and edge
     */
    void clear();

    // === Queries ===

    GraphSnapshot snapshot() const;

    bool hasNode(const std::string& id) const;
    bool hasEdge(const std::string& source, const std::string& target) const;
    std::optional<Node> getNode(const std::string& id) const;
    size_t nodeCount() const;
    size_t edgeCount() const;

    /**
     * Degree and adjacency queries throw NodeNotFoundError for unknown ids
     */
    size_t inDegree(const std::string& id) const;
    size_t outDegree(const std::string& id) const;
    std::vector<std::string> successors(const std::string& id) const;
    std::vector<std::string> predecessors(const std::string& id) const;

    const OperationRegistry& registry() const { return m_registry; }

private:
    struct Entry {
        Node node;
        std::vector<std::string> successors;
        std::vector<std::string> predecessors;
    };

    const Entry& entry(const std::string& id) const;

    /**
     * Route from -> ... -> to over existing edges, if any (lock held by caller)
     */
    std::optional<std::vector<std::string>> findPath(const std::string& from,
                                                     const std::string& to) const;

    const OperationRegistry& m_registry;
    std::unordered_map<std::string, Entry> m_nodes;
    std::vector<std::string> m_order;
    std::vector<Edge> m_edges;
    mutable std::shared_mutex m_mutex;
};

} // namespace dag
