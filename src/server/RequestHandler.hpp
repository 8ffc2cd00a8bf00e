#pragma once

#include "dag/Errors.hpp"
#include "dag/GraphSession.hpp"
#include "storage/GraphStorage.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace opgraph {
namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/**
 * Request handler - business logic behind the HTTP routes
 *
 * Holds the session the routes act on and, optionally, the graph
 * storage backing /api/graphs. Both are owned by the caller.
 *
 * handle() routes a request and maps every error to a status code:
 * structural errors and bad JSON -> 400, unknown slugs -> 404,
 * fatal execution -> 500, no storage configured -> 503.
 */
class RequestHandler {
public:
    explicit RequestHandler(dag::GraphSession& session, storage::GraphStorage* storage = nullptr);

    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    /**
     * Route a request; target may carry a query string
     */
    RouteResult handle(const std::string& method, const std::string& target, const std::string& body);

    bool hasGraphStorage() const { return m_storage != nullptr; }

    // Graph endpoint handlers
    json handleHealth();
    json handleAddNode(const json& request);
    json handleRemoveNode(const std::string& nodeId);
    json handleAddEdge(const json& request);
    json handleRemoveEdge(const json& request);
    json handleExecute();
    json handleGetDag();
    json handlePutDag(const json& request);

    // Storage endpoint handlers
    json handleListGraphs();
    json handleSaveGraph(const std::string& slug, const json& request);
    json handleLoadGraph(const std::string& slug);

    /**
     * JSON body for a structural error: {"error", "code", ...context}
     */
    static json errorToJson(const dag::GraphError& error);

    /**
     * JSON form of an execution summary
     */
    static json summaryToJson(const dag::ExecutionSummary& summary);

private:
    storage::GraphStorage& requireStorage();

    dag::GraphSession& m_session;
    storage::GraphStorage* m_storage;
};

} // namespace server
} // namespace opgraph
