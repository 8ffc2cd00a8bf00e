#include "dag/GraphSession.hpp"
#include "dag/DependencyResolver.hpp"
#include "dag/Errors.hpp"
#include "server/Logger.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace dag {

GraphSession::GraphSession(const OperationRegistry& registry, ExecutorOptions options)
    : m_registry(registry)
    , m_options(options)
    , m_store(std::make_shared<GraphStore>(registry))
{
    if (m_options.concurrency < 1 || m_options.retryBudget < 1) {
        throw std::invalid_argument("concurrency and retry budget must be at least 1");
    }
}

void GraphSession::checkNodeIds(const std::vector<std::string>& ids, const DataTable& table) const {
    for (const auto& id : ids) {
        if (table.hasColumn(id)) {
            LOG_WARN("Rejected node id " + id + ": shadows a dataset column");
            throw InvalidParameterError("node id '" + id + "' collides with a dataset column");
        }
    }
}

// =============================================================================
// Graph Editing
// =============================================================================

void GraphSession::addNode(const std::string& id, const std::string& kind, const ParamList& parameters) {
    std::shared_lock lock(m_mutex);
    checkNodeIds({id}, m_dataset);
    m_store->addNode(id, kind, parameters);
}

void GraphSession::removeNode(const std::string& id) {
    std::shared_lock lock(m_mutex);
    m_store->removeNode(id);
}

void GraphSession::addEdge(const std::string& source, const std::string& target) {
    std::shared_lock lock(m_mutex);
    m_store->addEdge(source, target);
}

void GraphSession::removeEdge(const std::string& source, const std::string& target) {
    std::shared_lock lock(m_mutex);
    m_store->removeEdge(source, target);
}

// =============================================================================
// Execution
// =============================================================================

void GraphSession::setExecutionCallback(ExecutionCallback callback) {
    std::unique_lock lock(m_mutex);
    m_callback = std::move(callback);
}

ExecutionSummary GraphSession::execute(const CancellationToken& cancel) {
    GraphSnapshot graph;
    DataTable inputs;
    ExecutionCallback callback;
    {
        std::shared_lock lock(m_mutex);
        graph = m_store->snapshot();
        inputs = m_dataset;
        callback = m_callback;
    }

    StagedPlan plan = DependencyResolver::resolve(graph);

    Executor executor(m_registry, m_options);
    executor.setExecutionCallback(std::move(callback));

    // Outputs of this run replace the previous ones; the dataset stays input only
    auto publish = [this](const ExecutionSummary& summary) {
        DataTable outputs;
        for (const auto& [id, outcome] : summary.outcomes) {
            if (outcome.state == NodeState::Succeeded) {
                outputs.setColumn(id, outcome.output);
            }
        }
        std::unique_lock lock(m_mutex);
        m_outputs = std::move(outputs);
    };

    try {
        ExecutionSummary summary = executor.run(plan, inputs, cancel);
        publish(summary);
        return summary;
    } catch (const FatalError& e) {
        publish(e.summary());
        throw;
    }
}

// =============================================================================
// Documents
// =============================================================================

GraphSnapshot GraphSession::snapshot() const {
    std::shared_lock lock(m_mutex);
    return m_store->snapshot();
}

size_t GraphSession::nodeCount() const {
    std::shared_lock lock(m_mutex);
    return m_store->nodeCount();
}

GraphDocument GraphSession::exportGraph() const {
    return GraphSerializer::fromSnapshot(snapshot());
}

void GraphSession::loadGraph(const GraphDocument& document) {
    auto fresh = std::make_shared<GraphStore>(m_registry);

    for (const auto& node : document.nodes) {
        fresh->addNode(node.id, node.type, node.parameters);
    }
    for (const auto& edge : document.edges) {
        fresh->addEdge(edge.source, edge.target);
    }

    std::vector<std::string> ids;
    for (const auto& node : document.nodes) {
        ids.push_back(node.id);
    }
    {
        std::unique_lock lock(m_mutex);
        checkNodeIds(ids, m_dataset);
        m_store = std::move(fresh);
    }

    LOG_INFO("Graph loaded: " + std::to_string(document.nodes.size()) + " node(s), " +
             std::to_string(document.edges.size()) + " edge(s)");
}

void GraphSession::saveToFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << GraphSerializer::toString(exportGraph());
    if (!file) {
        throw std::runtime_error("Failed writing graph to " + path);
    }
    LOG_INFO("Graph saved to " + path);
}

void GraphSession::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    loadGraph(GraphSerializer::fromString(buffer.str()));
}

// =============================================================================
// Dataset
// =============================================================================

void GraphSession::setDataset(DataTable table) {
    std::unique_lock lock(m_mutex);
    std::vector<std::string> ids;
    for (const auto& node : m_store->snapshot().nodes()) {
        ids.push_back(node.id);
    }
    checkNodeIds(ids, table);
    m_dataset = std::move(table);
}

DataTable GraphSession::dataset() const {
    std::shared_lock lock(m_mutex);
    return m_dataset;
}

DataTable GraphSession::outputs() const {
    std::shared_lock lock(m_mutex);
    return m_outputs;
}

} // namespace dag
