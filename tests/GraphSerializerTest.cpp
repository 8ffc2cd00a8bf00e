#include <catch2/catch.hpp>
#include "dag/GraphSerializer.hpp"
#include "dag/Errors.hpp"

using namespace dag;

TEST_CASE("Serialize a document", "[GraphSerializer]") {
    GraphDocument doc;
    doc.nodes.push_back({"A", "ADD", {ColumnRef{"x"}, 1.0}});
    doc.nodes.push_back({"C", "ADD", {ColumnRef{"x"}, 5.0}});
    doc.edges.push_back({"A", "C"});

    json j = GraphSerializer::toJson(doc);

    REQUIRE(j["nodes"].size() == 2);
    REQUIRE(j["nodes"][1]["id"] == "C");
    REQUIRE(j["nodes"][1]["type"] == "ADD");
    REQUIRE(j["nodes"][1]["parameters"] == json::parse(R"([{"column": "x"}, {"value": 5}])"));
    REQUIRE(j["edges"][0] == json{{"source", "A"}, {"target", "C"}});
}

TEST_CASE("Parse a document", "[GraphSerializer]") {
    auto doc = GraphSerializer::fromString(R"({
        "nodes": [
            {"id": "C", "type": "ADD", "parameters": [{"column": "x"}, {"value": 5}]},
            {"id": "S", "type": "SMA", "parameters": [{"column": "C"}, {"value": 3}]}
        ],
        "edges": [{"source": "C", "target": "S"}]
    })");

    REQUIRE(doc.nodes.size() == 2);
    REQUIRE(doc.nodes[0].id == "C");
    REQUIRE(doc.nodes[0].parameters == ParamList{ColumnRef{"x"}, 5.0});
    REQUIRE(doc.edges == std::vector<Edge>{{"C", "S"}});

    // And back again
    REQUIRE(GraphSerializer::fromJson(GraphSerializer::toJson(doc)) == doc);
}

TEST_CASE("Missing sections are empty", "[GraphSerializer]") {
    auto doc = GraphSerializer::fromString("{}");
    REQUIRE(doc.nodes.empty());
    REQUIRE(doc.edges.empty());

    auto noParams = GraphSerializer::fromString(R"({"nodes": [{"id": "A", "type": "ADD"}]})");
    REQUIRE(noParams.nodes[0].parameters.empty());
}

TEST_CASE("Malformed documents are rejected", "[GraphSerializer]") {
    REQUIRE_THROWS_AS(GraphSerializer::fromString("{not json"), DocumentError);
    REQUIRE_THROWS_AS(GraphSerializer::fromString("[]"), DocumentError);
    REQUIRE_THROWS_AS(GraphSerializer::fromString(R"({"nodes": [{"type": "ADD"}]})"), DocumentError);
    REQUIRE_THROWS_AS(GraphSerializer::fromString(R"({"nodes": [{"id": 1, "type": "ADD"}]})"), DocumentError);
    REQUIRE_THROWS_AS(GraphSerializer::fromString(R"({"edges": [{"source": "A"}]})"), DocumentError);
}

TEST_CASE("Parameter entries need exactly one of column or value", "[GraphSerializer]") {
    REQUIRE_THROWS_AS(GraphSerializer::jsonToParamList(json::parse(R"([{"column": "x", "value": 1}])")),
                      DocumentError);
    REQUIRE_THROWS_AS(GraphSerializer::jsonToParamList(json::parse(R"([{"name": "x"}])")), DocumentError);
    REQUIRE_THROWS_AS(GraphSerializer::jsonToParamList(json::parse(R"([{"value": "5"}])")), DocumentError);
    REQUIRE_THROWS_AS(GraphSerializer::jsonToParamList(json::parse(R"({"column": "x"})")), DocumentError);
}

TEST_CASE("Document from a snapshot keeps canonical parameters", "[GraphSerializer]") {
    GraphStore store;
    store.addNode("C", "ADD", {5.0, ColumnRef{"x"}});
    store.addNode("D", "ADD", {ColumnRef{"C"}, 1.0});
    store.addEdge("C", "D");

    auto doc = GraphSerializer::fromSnapshot(store.snapshot());

    REQUIRE(doc.nodes.size() == 2);
    REQUIRE(doc.nodes[0].type == "ADD");
    REQUIRE(doc.nodes[0].parameters == ParamList{ColumnRef{"x"}, 5.0});
    REQUIRE(doc.edges == std::vector<Edge>{{"C", "D"}});
}
