#include "dag/GraphSerializer.hpp"
#include "dag/Errors.hpp"
#include <variant>

namespace dag {

// =============================================================================
// Serialization
// =============================================================================

json GraphSerializer::paramEntryToJson(const ParamEntry& entry) {
    if (const auto* column = std::get_if<ColumnRef>(&entry)) {
        return json{{"column", column->name}};
    }
    return json{{"value", std::get<double>(entry)}};
}

json GraphSerializer::paramListToJson(const ParamList& list) {
    json result = json::array();
    for (const auto& entry : list) {
        result.push_back(paramEntryToJson(entry));
    }
    return result;
}

json GraphSerializer::toJson(const GraphDocument& document) {
    json result;

    json nodesArray = json::array();
    for (const auto& node : document.nodes) {
        json n;
        n["id"] = node.id;
        n["type"] = node.type;
        n["parameters"] = paramListToJson(node.parameters);
        nodesArray.push_back(n);
    }
    result["nodes"] = nodesArray;

    json edgesArray = json::array();
    for (const auto& edge : document.edges) {
        edgesArray.push_back(json{{"source", edge.source}, {"target", edge.target}});
    }
    result["edges"] = edgesArray;

    return result;
}

std::string GraphSerializer::toString(const GraphDocument& document, int indent) {
    return toJson(document).dump(indent);
}

GraphDocument GraphSerializer::fromSnapshot(const GraphSnapshot& snapshot) {
    GraphDocument document;
    for (const auto& node : snapshot.nodes()) {
        document.nodes.push_back(NodeDocument{node.id, kindToString(node.kind), node.parameters.toList()});
    }
    document.edges = snapshot.edges();
    return document;
}

// =============================================================================
// Deserialization
// =============================================================================

ParamEntry GraphSerializer::jsonToParamEntry(const json& j) {
    if (!j.is_object()) {
        throw DocumentError("parameter entry must be an object");
    }

    bool hasColumn = j.contains("column");
    bool hasValue = j.contains("value");
    if (hasColumn == hasValue) {
        throw DocumentError("parameter entry must have exactly one of 'column' or 'value'");
    }

    if (hasColumn) {
        if (!j["column"].is_string()) {
            throw DocumentError("'column' must be a string");
        }
        return ColumnRef{j["column"].get<std::string>()};
    }

    if (!j["value"].is_number()) {
        throw DocumentError("'value' must be a number");
    }
    return j["value"].get<double>();
}

ParamList GraphSerializer::jsonToParamList(const json& j) {
    if (j.is_null()) {
        return {};
    }
    if (!j.is_array()) {
        throw DocumentError("'parameters' must be an array");
    }

    ParamList list;
    for (const auto& entry : j) {
        list.push_back(jsonToParamEntry(entry));
    }
    return list;
}

GraphDocument GraphSerializer::fromJson(const json& j) {
    if (!j.is_object()) {
        throw DocumentError("graph document must be an object");
    }

    GraphDocument document;

    if (j.contains("nodes")) {
        if (!j["nodes"].is_array()) {
            throw DocumentError("'nodes' must be an array");
        }
        for (const auto& nodeJson : j["nodes"]) {
            if (!nodeJson.is_object() || !nodeJson.contains("id") || !nodeJson.contains("type")) {
                throw DocumentError("Invalid node: missing 'id' or 'type'");
            }
            if (!nodeJson["id"].is_string() || !nodeJson["type"].is_string()) {
                throw DocumentError("Invalid node: 'id' and 'type' must be strings");
            }

            NodeDocument node;
            node.id = nodeJson["id"].get<std::string>();
            node.type = nodeJson["type"].get<std::string>();
            if (nodeJson.contains("parameters")) {
                node.parameters = jsonToParamList(nodeJson["parameters"]);
            }
            document.nodes.push_back(std::move(node));
        }
    }

    if (j.contains("edges")) {
        if (!j["edges"].is_array()) {
            throw DocumentError("'edges' must be an array");
        }
        for (const auto& edgeJson : j["edges"]) {
            if (!edgeJson.is_object() || !edgeJson.contains("source") || !edgeJson.contains("target") ||
                !edgeJson["source"].is_string() || !edgeJson["target"].is_string()) {
                throw DocumentError("Invalid edge: 'source' and 'target' must be strings");
            }
            document.edges.push_back(Edge{edgeJson["source"].get<std::string>(),
                                          edgeJson["target"].get<std::string>()});
        }
    }

    return document;
}

GraphDocument GraphSerializer::fromString(const std::string& str) {
    json j;
    try {
        j = json::parse(str);
    } catch (const json::parse_error& e) {
        throw DocumentError(std::string("invalid JSON: ") + e.what());
    }
    return fromJson(j);
}

} // namespace dag
