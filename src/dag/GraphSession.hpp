#pragma once

#include "dag/Types.hpp"
#include "dag/OperationRegistry.hpp"
#include "dag/GraphStore.hpp"
#include "dag/Executor.hpp"
#include "dag/GraphSerializer.hpp"
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dag {

/**
 * The graph a client works with, plus the dataset it runs against
 *
 * Usage:
 *   GraphSession session;
 *   session.setDataset(DataTable::readCsv("prices.csv"));
 *   session.addNode("sma", "SMA", {ColumnRef{"close"}, 20.0});
 *   auto summary = session.execute();
 *
 * The dataset is input only: every run starts from it unchanged, and
 * the outputs of the latest run are kept apart in outputs(). A node id
 * may not shadow a dataset column.
 *
 * Thread-safe: graph mutations are serialised by the store and hold the
 * session lock shared, so loadGraph (which swaps the whole store under
 * the exclusive lock) never drops a concurrent mutation.
 */
class GraphSession {
public:
    explicit GraphSession(const OperationRegistry& registry = OperationRegistry::defaults(),
                          ExecutorOptions options = {});

    // Non-copyable
    GraphSession(const GraphSession&) = delete;
    GraphSession& operator=(const GraphSession&) = delete;

    // === Graph Editing ===

    /**
     * Throws InvalidParameterError if the id names a dataset column
     */
    void addNode(const std::string& id, const std::string& kind, const ParamList& parameters);
    void removeNode(const std::string& id);
    void addEdge(const std::string& source, const std::string& target);
    void removeEdge(const std::string& source, const std::string& target);

    // === Execution ===

    /**
     * Snapshot, resolve and run the current graph
     *
     * The run reads the dataset plus the outputs of its own earlier
     * stages. Succeeded outputs of this run replace outputs(), including
     * those of a run that ends in FatalError.
     */
    ExecutionSummary execute(const CancellationToken& cancel = {});

    void setExecutionCallback(ExecutionCallback callback);

    // === Documents ===

    GraphDocument exportGraph() const;

    /**
     * Replace the graph with the document's contents
     *
     * Replays addNode then addEdge in document order into a fresh store.
     * On error the current graph is kept and the error propagates.
     */
    void loadGraph(const GraphDocument& document);

    /**
     * Write the exported graph as JSON (throws std::runtime_error on IO failure)
     */
    void saveToFile(const std::string& path) const;

    /**
     * Read a JSON document and load it (DocumentError on bad JSON)
     */
    void loadFromFile(const std::string& path);

    // === Dataset ===

    /**
     * Throws InvalidParameterError if a column name is already a node id
     */
    void setDataset(DataTable table);
    DataTable dataset() const;

    /**
     * Output column per succeeded node of the latest run
     */
    DataTable outputs() const;

    // === Accessors ===

    GraphSnapshot snapshot() const;
    size_t nodeCount() const;
    const ExecutorOptions& options() const { return m_options; }
    const OperationRegistry& registry() const { return m_registry; }

private:
    void checkNodeIds(const std::vector<std::string>& ids, const DataTable& table) const;

    const OperationRegistry& m_registry;
    ExecutorOptions m_options;
    ExecutionCallback m_callback;

    mutable std::shared_mutex m_mutex;
    std::shared_ptr<GraphStore> m_store;
    DataTable m_dataset;
    DataTable m_outputs;
};

} // namespace dag
