#include <catch2/catch.hpp>
#include "dag/GraphSession.hpp"
#include "dag/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace dag;

namespace {

class TempFile {
public:
    TempFile() : m_path("/tmp/test_graph_session_" + std::to_string(std::rand()) + ".json") {}
    ~TempFile() { std::filesystem::remove(m_path); }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

void buildChain(GraphSession& session) {
    session.addNode("A", "ADD", {ColumnRef{"x"}, 1.0});
    session.addNode("B", "ADD", {ColumnRef{"A"}, 1.0});
    session.addEdge("A", "B");
}

} // anonymous namespace

TEST_CASE("Execute publishes outputs apart from the dataset", "[GraphSession]") {
    GraphSession session;
    DataTable table;
    table.setColumn("x", {1.0, 2.0});
    session.setDataset(table);
    buildChain(session);

    auto summary = session.execute();

    REQUIRE(summary.completedNodes() == std::vector<std::string>{"A", "B"});
    auto outputs = session.outputs();
    REQUIRE(outputs.getColumn("A") == ColumnData{2.0, 3.0});
    REQUIRE(outputs.getColumn("B") == ColumnData{3.0, 4.0});

    auto data = session.dataset();
    REQUIRE(data.getColumnNames() == std::vector<std::string>{"x"});
    REQUIRE(data.getColumn("x") == ColumnData{1.0, 2.0});
}

TEST_CASE("Running an unchanged graph twice gives the same outputs", "[GraphSession]") {
    GraphSession session;
    DataTable table;
    table.setColumn("x", {1.0, 2.0});
    session.setDataset(table);
    buildChain(session);

    auto first = session.execute();
    auto second = session.execute();

    REQUIRE(first.find("B")->output == ColumnData{3.0, 4.0});
    REQUIRE(second.find("B")->output == first.find("B")->output);
    REQUIRE(second.find("A")->output == first.find("A")->output);
}

TEST_CASE("Node ids may not shadow dataset columns", "[GraphSession]") {
    GraphSession session;
    DataTable table;
    table.setColumn("x", {1.0, 2.0});
    session.setDataset(table);

    SECTION("addNode") {
        REQUIRE_THROWS_AS(session.addNode("x", "ADD", {ColumnRef{"x"}, 1.0}), InvalidParameterError);
        REQUIRE(session.nodeCount() == 0);
    }

    SECTION("loadGraph") {
        buildChain(session);
        auto before = session.exportGraph();

        GraphDocument doc;
        doc.nodes.push_back({"x", "ADD", {ColumnRef{"x"}, 1.0}});
        REQUIRE_THROWS_AS(session.loadGraph(doc), InvalidParameterError);
        REQUIRE(session.exportGraph() == before);
    }

    SECTION("setDataset") {
        buildChain(session);
        DataTable shadowing;
        shadowing.setColumn("A", {5.0});
        REQUIRE_THROWS_AS(session.setDataset(shadowing), InvalidParameterError);
        REQUIRE(session.dataset().hasColumn("x"));
        REQUIRE_FALSE(session.dataset().hasColumn("A"));
    }
}

TEST_CASE("Outputs of a removed node are not visible to later runs", "[GraphSession]") {
    GraphSession session(OperationRegistry::defaults(), ExecutorOptions{2, 1});
    DataTable table;
    table.setColumn("x", {1.0});
    session.setDataset(table);

    session.addNode("A", "ADD", {ColumnRef{"x"}, 1.0});
    session.execute();
    REQUIRE(session.outputs().hasColumn("A"));

    session.removeNode("A");
    session.addNode("B", "ADD", {ColumnRef{"A"}, 1.0});

    REQUIRE_THROWS_AS(session.execute(), FatalError);
    REQUIRE_FALSE(session.outputs().hasColumn("A"));
    REQUIRE_FALSE(session.outputs().hasColumn("B"));
}

TEST_CASE("Fatal execution still publishes completed stages", "[GraphSession]") {
    GraphSession session(OperationRegistry::defaults(), ExecutorOptions{2, 1});
    DataTable table;
    table.setColumn("x", {1.0});
    session.setDataset(table);

    session.addNode("A", "ADD", {ColumnRef{"x"}, 1.0});
    session.addNode("B", "ADD", {ColumnRef{"missing"}, 1.0});
    session.addEdge("A", "B");

    REQUIRE_THROWS_AS(session.execute(), FatalError);
    REQUIRE(session.outputs().hasColumn("A"));
    REQUIRE_FALSE(session.outputs().hasColumn("B"));
}

TEST_CASE("Export then load reproduces the graph", "[GraphSession]") {
    GraphSession source;
    buildChain(source);

    GraphSession target;
    target.loadGraph(source.exportGraph());

    REQUIRE(target.exportGraph() == source.exportGraph());
    REQUIRE(target.nodeCount() == 2);
}

TEST_CASE("Failed load keeps the previous graph", "[GraphSession]") {
    GraphSession session;
    buildChain(session);
    auto before = session.exportGraph();

    SECTION("cyclic document") {
        GraphDocument doc;
        doc.nodes.push_back({"P", "ADD", {ColumnRef{"x"}, 1.0}});
        doc.nodes.push_back({"Q", "ADD", {ColumnRef{"x"}, 1.0}});
        doc.edges = {{"P", "Q"}, {"Q", "P"}};
        REQUIRE_THROWS_AS(session.loadGraph(doc), CycleError);
    }

    SECTION("unknown kind") {
        GraphDocument doc;
        doc.nodes.push_back({"P", "EMA", {ColumnRef{"x"}, 1.0}});
        REQUIRE_THROWS_AS(session.loadGraph(doc), UnknownKindError);
    }

    SECTION("dangling edge") {
        GraphDocument doc;
        doc.nodes.push_back({"P", "ADD", {ColumnRef{"x"}, 1.0}});
        doc.edges = {{"P", "ghost"}};
        REQUIRE_THROWS_AS(session.loadGraph(doc), NodeNotFoundError);
    }

    REQUIRE(session.exportGraph() == before);
}

TEST_CASE("Mutations racing a load are never lost", "[GraphSession]") {
    GraphSession session;
    GraphDocument doc;
    doc.nodes.push_back({"base", "ADD", {ColumnRef{"x"}, 1.0}});

    constexpr int count = 300;
    std::thread adder([&session] {
        for (int i = 0; i < count; ++i) {
            session.addNode("n" + std::to_string(i), "ADD", {ColumnRef{"x"}, 1.0});
        }
    });
    for (int i = 0; i < 20; ++i) {
        session.loadGraph(doc);
    }
    adder.join();

    // Every load keeps only what was added after it: the survivors form
    // a contiguous tail of the sequence
    auto snapshot = session.snapshot();
    int first = count;
    for (int i = count - 1; i >= 0; --i) {
        if (!snapshot.findNode("n" + std::to_string(i))) {
            break;
        }
        first = i;
    }
    REQUIRE(snapshot.findNode("base") != nullptr);
    REQUIRE(snapshot.nodeCount() == static_cast<size_t>(1 + count - first));
}

TEST_CASE("Save and load through a file", "[GraphSession]") {
    TempFile file;
    GraphSession source;
    buildChain(source);
    source.saveToFile(file.path());

    GraphSession target;
    target.loadFromFile(file.path());
    REQUIRE(target.exportGraph() == source.exportGraph());

    REQUIRE_THROWS_AS(target.loadFromFile("/tmp/no_such_graph_opgraph.json"), std::runtime_error);
}

TEST_CASE("Loading a malformed file is a document error", "[GraphSession]") {
    TempFile file;
    {
        std::ofstream out(file.path());
        out << "{\"nodes\": [";
    }

    GraphSession session;
    REQUIRE_THROWS_AS(session.loadFromFile(file.path()), DocumentError);
}
