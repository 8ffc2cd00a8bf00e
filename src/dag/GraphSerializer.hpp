#pragma once

#include "dag/Types.hpp"
#include "dag/GraphStore.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dag {

using json = nlohmann::json;

/**
 * Node as written in a graph document (kind kept as its wire name)
 */
struct NodeDocument {
    std::string id;
    std::string type;
    ParamList parameters;

    bool operator==(const NodeDocument&) const = default;
};

/**
 * Portable form of a graph, in insertion order
 */
struct GraphDocument {
    std::vector<NodeDocument> nodes;
    std::vector<Edge> edges;

    bool operator==(const GraphDocument&) const = default;
};

/**
 * Serialization/Deserialization for GraphDocument
 *
 * JSON format:
 * {
 *   "nodes": [
 *     {"id": "C", "type": "ADD", "parameters": [{"column": "x"}, {"value": 5}]}
 *   ],
 *   "edges": [
 *     {"source": "A", "target": "C"}
 *   ]
 * }
 *
 * Structural validity (known kinds, existing endpoints, no cycles) is
 * not checked here; GraphSession::loadGraph replays the document.
 */
class GraphSerializer {
public:
    // === Serialization ===

    static json toJson(const GraphDocument& document);
    static std::string toString(const GraphDocument& document, int indent = 2);

    // === Deserialization ===

    /**
     * Throws DocumentError on malformed input
     */
    static GraphDocument fromJson(const json& j);
    static GraphDocument fromString(const std::string& str);

    // === Helpers (used by the HTTP layer) ===

    static json paramListToJson(const ParamList& list);
    static ParamList jsonToParamList(const json& j);

    static GraphDocument fromSnapshot(const GraphSnapshot& snapshot);

private:
    static json paramEntryToJson(const ParamEntry& entry);
    static ParamEntry jsonToParamEntry(const json& j);
};

} // namespace dag
