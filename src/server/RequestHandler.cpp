#include "server/RequestHandler.hpp"
#include "server/Logger.hpp"
#include "dag/Errors.hpp"
#include "dag/GraphSerializer.hpp"
#include <stdexcept>

namespace opgraph {
namespace server {

namespace {

/**
 * Requested resource does not exist (404)
 */
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Route needs a component this server was started without (503)
 */
class UnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string pathSuffix(const std::string& path, const std::string& prefix) {
    if (path.size() <= prefix.size() || path.compare(0, prefix.size(), prefix) != 0) {
        return "";
    }
    std::string remaining = path.substr(prefix.size());
    if (remaining.find('/') != std::string::npos) {
        return "";
    }
    return remaining;
}

json message(const std::string& text) {
    return json{{"message", text}};
}

} // anonymous namespace

RequestHandler::RequestHandler(dag::GraphSession& session, storage::GraphStorage* storage)
    : m_session(session)
    , m_storage(storage)
{
}

storage::GraphStorage& RequestHandler::requireStorage() {
    if (!m_storage) {
        throw UnavailableError("Graph storage is not configured");
    }
    return *m_storage;
}

// =============================================================================
// Routing
// =============================================================================

RouteResult RequestHandler::handle(const std::string& method, const std::string& target,
                                   const std::string& body) {
    std::string path = target.substr(0, target.find('?'));

    auto parseBody = [&body]() {
        return body.empty() ? json::object() : json::parse(body);
    };

    try {
        // GET /api/health
        if (method == "GET" && path == "/api/health") {
            return {200, handleHealth()};
        }

        // POST /add_node
        if (method == "POST" && path == "/add_node") {
            return {200, handleAddNode(parseBody())};
        }

        // DELETE /remove_node/<id>
        if (method == "DELETE") {
            std::string nodeId = pathSuffix(path, "/remove_node/");
            if (!nodeId.empty()) {
                return {200, handleRemoveNode(nodeId)};
            }
        }

        // POST /add_edge, POST /remove_edge
        if (method == "POST" && path == "/add_edge") {
            return {200, handleAddEdge(parseBody())};
        }
        if (method == "POST" && path == "/remove_edge") {
            return {200, handleRemoveEdge(parseBody())};
        }

        // GET|POST /execute
        if ((method == "GET" || method == "POST") && path == "/execute") {
            return {200, handleExecute()};
        }

        // GET|PUT /dag
        if (method == "GET" && path == "/dag") {
            return {200, handleGetDag()};
        }
        if (method == "PUT" && path == "/dag") {
            return {200, handlePutDag(parseBody())};
        }

        // /api/graphs[/<slug>]
        if (method == "GET" && path == "/api/graphs") {
            return {200, handleListGraphs()};
        }
        std::string slug = pathSuffix(path, "/api/graphs/");
        if (!slug.empty()) {
            if (method == "POST") {
                return {200, handleSaveGraph(slug, parseBody())};
            }
            if (method == "GET") {
                return {200, handleLoadGraph(slug)};
            }
        }

        return {404, json{{"error", "Route not found: " + method + " " + path}, {"code", "NotFound"}}};

    } catch (const json::parse_error& e) {
        return {400, json{{"error", std::string("Invalid JSON: ") + e.what()}, {"code", "InvalidJson"}}};
    } catch (const dag::FatalError& e) {
        json result = errorToJson(e);
        result["node"] = e.nodeId();
        result["attempts"] = e.attempts();
        result["completed"] = e.summary().completedNodes();
        return {500, result};
    } catch (const dag::ConsistencyError& e) {
        return {500, errorToJson(e)};
    } catch (const dag::GraphError& e) {
        return {400, errorToJson(e)};
    } catch (const NotFoundError& e) {
        return {404, json{{"error", e.what()}, {"code", "NotFound"}}};
    } catch (const UnavailableError& e) {
        return {503, json{{"error", e.what()}, {"code", "Unavailable"}}};
    } catch (const json::exception& e) {
        // Missing or mistyped request fields
        return {400, json{{"error", std::string("Invalid request: ") + e.what()}, {"code", "InvalidRequest"}}};
    } catch (const std::exception& e) {
        LOG_ERROR("Request " + method + " " + path + " failed: " + e.what());
        return {500, json{{"error", e.what()}, {"code", "InternalError"}}};
    }
}

// =============================================================================
// Graph endpoints
// =============================================================================

json RequestHandler::handleHealth() {
    return json{
        {"status", "ok"},
        {"service", "OpGraphServer"},
        {"version", "1.0.0"},
        {"nodes", m_session.nodeCount()},
        {"storage", hasGraphStorage()}
    };
}

json RequestHandler::handleAddNode(const json& request) {
    std::string id = request.at("id").get<std::string>();
    std::string type = request.at("type").get<std::string>();
    dag::ParamList parameters = dag::GraphSerializer::jsonToParamList(
        request.contains("parameters") ? request["parameters"] : json::array());

    m_session.addNode(id, type, parameters);
    return message("Node added successfully");
}

json RequestHandler::handleRemoveNode(const std::string& nodeId) {
    m_session.removeNode(nodeId);
    return message("Node removed successfully");
}

json RequestHandler::handleAddEdge(const json& request) {
    m_session.addEdge(request.at("source").get<std::string>(),
                      request.at("target").get<std::string>());
    return message("Edge added successfully");
}

json RequestHandler::handleRemoveEdge(const json& request) {
    m_session.removeEdge(request.at("source").get<std::string>(),
                         request.at("target").get<std::string>());
    return message("Edge removed successfully");
}

json RequestHandler::handleExecute() {
    return summaryToJson(m_session.execute());
}

json RequestHandler::handleGetDag() {
    return json{{"dag", dag::GraphSerializer::toJson(m_session.exportGraph())}};
}

json RequestHandler::handlePutDag(const json& request) {
    const json& document = request.contains("dag") ? request["dag"] : request;
    m_session.loadGraph(dag::GraphSerializer::fromJson(document));
    return message("Graph replaced");
}

// =============================================================================
// Storage endpoints
// =============================================================================

json RequestHandler::handleListGraphs() {
    auto& db = requireStorage();

    json graphs = json::array();
    for (const auto& meta : db.listGraphs()) {
        graphs.push_back(json{
            {"slug", meta.slug},
            {"name", meta.name},
            {"created_at", meta.createdAt},
            {"updated_at", meta.updatedAt}
        });
    }
    return json{{"graphs", graphs}};
}

json RequestHandler::handleSaveGraph(const std::string& slug, const json& request) {
    auto& db = requireStorage();

    if (!db.graphExists(slug)) {
        db.createGraph({.slug = slug, .name = request.value("name", slug)});
    }

    std::optional<std::string> versionName;
    if (request.contains("version_name")) {
        versionName = request["version_name"].get<std::string>();
    }

    int64_t versionId = db.saveVersion(slug, m_session.exportGraph(), versionName);
    LOG_INFO("Graph " + slug + " saved as version " + std::to_string(versionId));

    return json{{"message", "Graph saved"}, {"slug", slug}, {"version_id", versionId}};
}

json RequestHandler::handleLoadGraph(const std::string& slug) {
    auto& db = requireStorage();

    auto version = db.getLatestVersion(slug);
    if (!version) {
        throw NotFoundError("Graph not found or has no version: " + slug);
    }

    auto document = dag::GraphSerializer::fromString(version->graphJson);
    m_session.loadGraph(document);

    return json{
        {"message", "Graph loaded"},
        {"slug", slug},
        {"version_id", version->id},
        {"dag", dag::GraphSerializer::toJson(document)}
    };
}

// =============================================================================
// JSON mapping
// =============================================================================

json RequestHandler::errorToJson(const dag::GraphError& error) {
    json result{{"error", error.what()}, {"code", error.code()}};

    if (const auto* e = dynamic_cast<const dag::DuplicateNodeError*>(&error)) {
        result["node"] = e->nodeId();
    } else if (const auto* e = dynamic_cast<const dag::NodeNotFoundError*>(&error)) {
        result["node"] = e->nodeId();
    } else if (const auto* e = dynamic_cast<const dag::UnknownKindError*>(&error)) {
        result["kind"] = e->kind();
    } else if (const auto* e = dynamic_cast<const dag::MissingParameterError*>(&error)) {
        result["kind"] = e->kind();
        result["missing"] = e->missing();
        result["required"] = e->required();
        result["supplied"] = e->supplied();
    } else if (const auto* e = dynamic_cast<const dag::CycleError*>(&error)) {
        result["source"] = e->source();
        result["target"] = e->target();
        result["path"] = e->path();
    } else if (const auto* e = dynamic_cast<const dag::ExecutionError*>(&error)) {
        result["node"] = e->nodeId();
        result["cause"] = e->cause();
    }

    return result;
}

json RequestHandler::summaryToJson(const dag::ExecutionSummary& summary) {
    json nodes = json::object();
    for (const auto& [id, outcome] : summary.outcomes) {
        json n{
            {"state", dag::nodeStateToString(outcome.state)},
            {"attempts", outcome.attempts},
            {"duration_ms", outcome.durationMs}
        };
        if (!outcome.lastError.empty()) {
            n["error"] = outcome.lastError;
        }
        if (outcome.state == dag::NodeState::Succeeded) {
            n["output"] = outcome.output;
        }
        nodes[id] = n;
    }

    return json{
        {"status", summary.cancelled ? "cancelled" : "completed"},
        {"stages", summary.stageCount},
        {"stages_completed", summary.stagesCompleted},
        {"duration_ms", summary.durationMs},
        {"completed", summary.completedNodes()},
        {"nodes", nodes}
    };
}

} // namespace server
} // namespace opgraph
