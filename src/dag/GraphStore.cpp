#include "dag/GraphStore.hpp"
#include "dag/Errors.hpp"
#include "server/Logger.hpp"
#include <algorithm>
#include <mutex>
#include <unordered_set>

namespace dag {

// =============================================================================
// GraphSnapshot
// =============================================================================

GraphSnapshot::GraphSnapshot(std::vector<Node> nodes, std::vector<Edge> edges)
    : m_nodes(std::move(nodes))
    , m_edges(std::move(edges))
{
    for (size_t i = 0; i < m_nodes.size(); ++i) {
        m_index[m_nodes[i].id] = i;
        m_inDegree[m_nodes[i].id] = 0;
    }
    for (const auto& edge : m_edges) {
        m_successors[edge.source].push_back(edge.target);
        m_inDegree[edge.target]++;
    }
}

const Node* GraphSnapshot::findNode(const std::string& id) const {
    auto it = m_index.find(id);
    return it != m_index.end() ? &m_nodes[it->second] : nullptr;
}

size_t GraphSnapshot::inDegree(const std::string& id) const {
    auto it = m_inDegree.find(id);
    return it != m_inDegree.end() ? it->second : 0;
}

size_t GraphSnapshot::outDegree(const std::string& id) const {
    return successors(id).size();
}

const std::vector<std::string>& GraphSnapshot::successors(const std::string& id) const {
    static const std::vector<std::string> empty;
    auto it = m_successors.find(id);
    return it != m_successors.end() ? it->second : empty;
}

// =============================================================================
// GraphStore - Node Management
// =============================================================================

GraphStore::GraphStore(const OperationRegistry& registry)
    : m_registry(registry)
{}

void GraphStore::addNode(const std::string& id, const std::string& kind, const ParamList& parameters) {
    if (id.empty()) {
        throw InvalidParameterError("node id must not be empty");
    }

    std::unique_lock lock(m_mutex);

    if (m_nodes.count(id)) {
        LOG_WARN("Rejected node " + id + ": duplicate id");
        throw DuplicateNodeError(id);
    }

    // Kind and parameters are resolved before anything is stored
    const auto& capability = m_registry.lookup(kind);
    Parameters internal = Parameters::fromList(parameters);
    m_registry.validate(capability.kind, internal);
    capability.unit->validate(internal);

    Entry e;
    e.node = Node{id, capability.kind, std::move(internal)};
    m_nodes.emplace(id, std::move(e));
    m_order.push_back(id);

    LOG_INFO("Node " + id + " (" + kind + ") added");
}

void GraphStore::removeNode(const std::string& id) {
    std::unique_lock lock(m_mutex);

    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        LOG_DEBUG("Remove node " + id + ": not found, nothing to do");
        return;
    }

    auto dropFrom = [&id](std::vector<std::string>& ids) {
        ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
    };
    for (const auto& succ : it->second.successors) {
        dropFrom(m_nodes.at(succ).predecessors);
    }
    for (const auto& pred : it->second.predecessors) {
        dropFrom(m_nodes.at(pred).successors);
    }

    m_edges.erase(
        std::remove_if(m_edges.begin(), m_edges.end(),
            [&id](const Edge& e) { return e.source == id || e.target == id; }),
        m_edges.end());
    dropFrom(m_order);
    m_nodes.erase(it);

    LOG_INFO("Node " + id + " removed");
}

// =============================================================================
// GraphStore - Edge Management
// =============================================================================

void GraphStore::addEdge(const std::string& source, const std::string& target) {
    std::unique_lock lock(m_mutex);

    auto srcIt = m_nodes.find(source);
    if (srcIt == m_nodes.end()) {
        throw NodeNotFoundError(source);
    }
    auto tgtIt = m_nodes.find(target);
    if (tgtIt == m_nodes.end()) {
        throw NodeNotFoundError(target);
    }

    auto& succ = srcIt->second.successors;
    if (std::find(succ.begin(), succ.end(), target) != succ.end()) {
        LOG_DEBUG("Edge " + source + " -> " + target + " already present");
        return;
    }

    // The new edge closes a cycle iff target already reaches source
    if (auto path = findPath(target, source)) {
        LOG_WARN("Rejected edge " + source + " -> " + target + ": would create a cycle");
        throw CycleError(source, target, std::move(*path));
    }

    succ.push_back(target);
    tgtIt->second.predecessors.push_back(source);
    m_edges.push_back(Edge{source, target});

    LOG_INFO("Edge " + source + " -> " + target + " added");
}

void GraphStore::removeEdge(const std::string& source, const std::string& target) {
    std::unique_lock lock(m_mutex);

    auto edgeIt = std::find(m_edges.begin(), m_edges.end(), Edge{source, target});
    if (edgeIt == m_edges.end()) {
        LOG_DEBUG("Remove edge " + source + " -> " + target + ": not found, nothing to do");
        return;
    }

    m_edges.erase(edgeIt);
    auto& succ = m_nodes.at(source).successors;
    succ.erase(std::remove(succ.begin(), succ.end(), target), succ.end());
    auto& pred = m_nodes.at(target).predecessors;
    pred.erase(std::remove(pred.begin(), pred.end(), source), pred.end());

    LOG_INFO("Edge " + source + " -> " + target + " removed");
}

void GraphStore::clear() {
    std::unique_lock lock(m_mutex);
    m_nodes.clear();
    m_order.clear();
    m_edges.clear();
}

std::optional<std::vector<std::string>> GraphStore::findPath(const std::string& from,
                                                             const std::string& to) const {
    // Iterative DFS confined to what is reachable from 'from'
    std::unordered_map<std::string, std::string> parent;
    std::unordered_set<std::string> visited{from};
    std::vector<std::string> stack{from};

    while (!stack.empty()) {
        std::string current = std::move(stack.back());
        stack.pop_back();

        if (current == to) {
            std::vector<std::string> path{current};
            while (path.back() != from) {
                path.push_back(parent.at(path.back()));
            }
            std::reverse(path.begin(), path.end());
            return path;
        }

        for (const auto& next : m_nodes.at(current).successors) {
            if (visited.insert(next).second) {
                parent[next] = current;
                stack.push_back(next);
            }
        }
    }
    return std::nullopt;
}

// =============================================================================
// GraphStore - Queries
// =============================================================================

GraphSnapshot GraphStore::snapshot() const {
    std::shared_lock lock(m_mutex);

    std::vector<Node> nodes;
    nodes.reserve(m_order.size());
    for (const auto& id : m_order) {
        nodes.push_back(m_nodes.at(id).node);
    }
    return GraphSnapshot(std::move(nodes), m_edges);
}

const GraphStore::Entry& GraphStore::entry(const std::string& id) const {
    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        throw NodeNotFoundError(id);
    }
    return it->second;
}

bool GraphStore::hasNode(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    return m_nodes.count(id) > 0;
}

bool GraphStore::hasEdge(const std::string& source, const std::string& target) const {
    std::shared_lock lock(m_mutex);
    auto it = m_nodes.find(source);
    if (it == m_nodes.end()) return false;
    const auto& succ = it->second.successors;
    return std::find(succ.begin(), succ.end(), target) != succ.end();
}

std::optional<Node> GraphStore::getNode(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) return std::nullopt;
    return it->second.node;
}

size_t GraphStore::nodeCount() const {
    std::shared_lock lock(m_mutex);
    return m_nodes.size();
}

size_t GraphStore::edgeCount() const {
    std::shared_lock lock(m_mutex);
    return m_edges.size();
}

size_t GraphStore::inDegree(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    return entry(id).predecessors.size();
}

size_t GraphStore::outDegree(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    return entry(id).successors.size();
}

std::vector<std::string> GraphStore::successors(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    return entry(id).successors;
}

std::vector<std::string> GraphStore::predecessors(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    return entry(id).predecessors;
}

} // namespace dag
