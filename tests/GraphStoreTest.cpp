#include <catch2/catch.hpp>
#include "dag/GraphStore.hpp"
#include "dag/Errors.hpp"

using namespace dag;

namespace {

ParamList addParams(const std::string& column, double value) {
    return {ColumnRef{column}, value};
}

} // anonymous namespace

// =============================================================================
// Node Tests
// =============================================================================

TEST_CASE("Add nodes and query them", "[GraphStore]") {
    GraphStore store;
    store.addNode("A", "ADD", addParams("x", 1));
    store.addNode("B", "SMA", {ColumnRef{"A"}, 3.0});

    REQUIRE(store.nodeCount() == 2);
    REQUIRE(store.hasNode("A"));

    auto node = store.getNode("B");
    REQUIRE(node.has_value());
    REQUIRE(node->kind == OperationKind::Sma);
    REQUIRE(node->parameters.columns() == std::vector<std::string>{"A"});
    REQUIRE_FALSE(store.getNode("Z").has_value());
}

TEST_CASE("Rejected nodes leave the graph unchanged", "[GraphStore]") {
    GraphStore store;
    store.addNode("A", "ADD", addParams("x", 1));

    REQUIRE_THROWS_AS(store.addNode("A", "ADD", addParams("y", 2)), DuplicateNodeError);
    REQUIRE_THROWS_AS(store.addNode("B", "MUL", addParams("x", 2)), UnknownKindError);
    REQUIRE_THROWS_AS(store.addNode("C", "ADD", {ColumnRef{"x"}}), MissingParameterError);
    REQUIRE_THROWS_AS(store.addNode("D", "SMA", {ColumnRef{"x"}, 0.0}), InvalidParameterError);
    REQUIRE_THROWS_AS(store.addNode("", "ADD", addParams("x", 1)), InvalidParameterError);

    REQUIRE(store.nodeCount() == 1);
    REQUIRE(store.getNode("A")->parameters.columns() == std::vector<std::string>{"x"});
}

TEST_CASE("Remove node drops incident edges and is idempotent", "[GraphStore]") {
    GraphStore store;
    store.addNode("A", "ADD", addParams("x", 1));
    store.addNode("B", "ADD", addParams("A", 1));
    store.addNode("C", "ADD", addParams("B", 1));
    store.addEdge("A", "B");
    store.addEdge("B", "C");

    store.removeNode("B");

    REQUIRE(store.nodeCount() == 2);
    REQUIRE(store.edgeCount() == 0);
    REQUIRE(store.outDegree("A") == 0);
    REQUIRE(store.inDegree("C") == 0);

    REQUIRE_NOTHROW(store.removeNode("B"));
    REQUIRE(store.nodeCount() == 2);
}

// =============================================================================
// Edge Tests
// =============================================================================

TEST_CASE("Edges update adjacency", "[GraphStore][Edges]") {
    GraphStore store;
    store.addNode("A", "ADD", addParams("x", 1));
    store.addNode("B", "ADD", addParams("x", 2));
    store.addEdge("A", "B");

    REQUIRE(store.hasEdge("A", "B"));
    REQUIRE_FALSE(store.hasEdge("B", "A"));
    REQUIRE(store.successors("A") == std::vector<std::string>{"B"});
    REQUIRE(store.predecessors("B") == std::vector<std::string>{"A"});
    REQUIRE(store.inDegree("B") == 1);
    REQUIRE_THROWS_AS(store.inDegree("Z"), NodeNotFoundError);
}

TEST_CASE("Adding an existing edge is a no-op", "[GraphStore][Edges]") {
    GraphStore store;
    store.addNode("A", "ADD", addParams("x", 1));
    store.addNode("B", "ADD", addParams("x", 2));
    store.addEdge("A", "B");
    store.addEdge("A", "B");

    REQUIRE(store.edgeCount() == 1);
    REQUIRE(store.inDegree("B") == 1);
}

TEST_CASE("Edge to a missing node is rejected", "[GraphStore][Edges]") {
    GraphStore store;
    store.addNode("A", "ADD", addParams("x", 1));

    REQUIRE_THROWS_AS(store.addEdge("A", "Z"), NodeNotFoundError);
    REQUIRE_THROWS_AS(store.addEdge("Z", "A"), NodeNotFoundError);
    REQUIRE(store.edgeCount() == 0);
}

TEST_CASE("Closing a cycle is rejected with the existing path", "[GraphStore][Edges][Cycle]") {
    GraphStore store;
    store.addNode("A", "ADD", addParams("x", 1));
    store.addNode("B", "ADD", addParams("x", 2));
    store.addNode("C", "ADD", addParams("x", 3));
    store.addEdge("A", "B");
    store.addEdge("B", "C");

    try {
        store.addEdge("C", "A");
        FAIL("expected CycleError");
    } catch (const CycleError& e) {
        REQUIRE(e.source() == "C");
        REQUIRE(e.target() == "A");
        REQUIRE(e.path() == std::vector<std::string>{"A", "B", "C"});
        REQUIRE(e.code() == "CycleError");
    }

    // Graph unchanged
    REQUIRE(store.edgeCount() == 2);
    REQUIRE_FALSE(store.hasEdge("C", "A"));
    REQUIRE(store.inDegree("A") == 0);
}

TEST_CASE("Self loop is a cycle", "[GraphStore][Edges][Cycle]") {
    GraphStore store;
    store.addNode("A", "ADD", addParams("x", 1));

    REQUIRE_THROWS_AS(store.addEdge("A", "A"), CycleError);
    REQUIRE(store.edgeCount() == 0);
}

TEST_CASE("Remove edge is idempotent", "[GraphStore][Edges]") {
    GraphStore store;
    store.addNode("A", "ADD", addParams("x", 1));
    store.addNode("B", "ADD", addParams("x", 2));
    store.addEdge("A", "B");

    store.removeEdge("A", "B");
    REQUIRE(store.edgeCount() == 0);
    REQUIRE(store.successors("A").empty());

    REQUIRE_NOTHROW(store.removeEdge("A", "B"));
    REQUIRE_NOTHROW(store.removeEdge("A", "Z"));
}

// =============================================================================
// Snapshot Tests
// =============================================================================

TEST_CASE("Snapshot keeps insertion order", "[GraphStore][Snapshot]") {
    GraphStore store;
    store.addNode("C", "ADD", addParams("x", 1));
    store.addNode("A", "ADD", addParams("x", 2));
    store.addNode("B", "ADD", addParams("x", 3));
    store.addEdge("C", "B");
    store.addEdge("A", "B");

    auto snapshot = store.snapshot();

    REQUIRE(snapshot.nodeCount() == 3);
    REQUIRE(snapshot.nodes()[0].id == "C");
    REQUIRE(snapshot.nodes()[1].id == "A");
    REQUIRE(snapshot.edges()[0] == Edge{"C", "B"});
    REQUIRE(snapshot.inDegree("B") == 2);
    REQUIRE(snapshot.outDegree("A") == 1);
    REQUIRE(snapshot.findNode("Z") == nullptr);

    // Later mutations do not leak into the snapshot
    store.removeNode("B");
    REQUIRE(snapshot.edgeCount() == 2);
}
