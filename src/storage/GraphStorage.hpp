#pragma once

#include "storage/GraphMetadata.hpp"
#include "dag/GraphSerializer.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>

namespace storage {

/**
 * SQLite-based storage for graph documents with versioning support
 *
 * Each graph is identified by a unique slug and can have multiple versions.
 * The graph content is stored as JSON (via GraphSerializer).
 *
 * Usage:
 *   GraphStorage db("./graphs.db");
 *   db.createGraph({.slug = "trend", .name = "Trend"});
 *   db.saveVersion("trend", session.exportGraph(), "Initial version");
 *   session.loadGraph(db.loadDocument("trend"));
 */
class GraphStorage {
public:
    /**
     * Open or create a SQLite database at the given path
     */
    explicit GraphStorage(const std::string& dbPath);
    ~GraphStorage();

    // Non-copyable
    GraphStorage(const GraphStorage&) = delete;
    GraphStorage& operator=(const GraphStorage&) = delete;

    // Movable
    GraphStorage(GraphStorage&&) noexcept;
    GraphStorage& operator=(GraphStorage&&) noexcept;

    // === Graph CRUD ===

    /**
     * Create a new graph (timestamps are auto-set)
     * Throws if slug already exists
     */
    void createGraph(const GraphMetadata& metadata);

    /**
     * Delete a graph and all its versions
     */
    void deleteGraph(const std::string& slug);

    std::optional<GraphMetadata> getGraph(const std::string& slug);

    /**
     * List all graphs ordered by updated_at DESC
     */
    std::vector<GraphMetadata> listGraphs();

    bool graphExists(const std::string& slug);

    // === Version Management ===

    /**
     * Save a new version of a graph
     * Returns the version ID
     * Throws if graph doesn't exist
     */
    int64_t saveVersion(const std::string& slug,
                        const dag::GraphDocument& document,
                        const std::optional<std::string>& versionName = std::nullopt);

    /**
     * Get the most recently saved version of a graph
     */
    std::optional<GraphVersion> getLatestVersion(const std::string& slug);

    /**
     * List all versions of a graph, newest first
     */
    std::vector<GraphVersion> listVersions(const std::string& slug);

    /**
     * Parse the latest version of a graph
     * Throws if graph doesn't exist or has no versions
     */
    dag::GraphDocument loadDocument(const std::string& slug);

    const std::string& getDbPath() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace storage
