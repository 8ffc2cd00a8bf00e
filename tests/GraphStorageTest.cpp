#include <catch2/catch.hpp>
#include "storage/GraphStorage.hpp"
#include "dag/Errors.hpp"
#include <filesystem>
#include <cstdlib>

using namespace storage;

// Helper to create a temporary database file
class TempDatabase {
public:
    TempDatabase() : m_path("/tmp/test_graph_storage_" +
                            std::to_string(std::rand()) + ".db") {}

    ~TempDatabase() {
        std::filesystem::remove(m_path);
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

namespace {

dag::GraphDocument sampleDocument() {
    dag::GraphDocument doc;
    doc.nodes.push_back({"A", "ADD", {dag::ColumnRef{"x"}, 1.0}});
    doc.nodes.push_back({"S", "SMA", {dag::ColumnRef{"A"}, 3.0}});
    doc.edges.push_back({"A", "S"});
    return doc;
}

} // anonymous namespace

// =============================================================================
// Graph CRUD Tests
// =============================================================================

TEST_CASE("Create and retrieve graph", "[GraphStorage][CRUD]") {
    TempDatabase tempDb;
    GraphStorage db(tempDb.path());

    db.createGraph({.slug = "trend", .name = "Trend following"});

    REQUIRE(db.graphExists("trend"));
    auto meta = db.getGraph("trend");
    REQUIRE(meta.has_value());
    REQUIRE(meta->name == "Trend following");
    REQUIRE_FALSE(meta->createdAt.empty());
    REQUIRE(meta->createdAt == meta->updatedAt);
    REQUIRE(db.getDbPath() == tempDb.path());
}

TEST_CASE("Duplicate slug is rejected", "[GraphStorage][CRUD]") {
    TempDatabase tempDb;
    GraphStorage db(tempDb.path());

    db.createGraph({.slug = "trend", .name = "Trend"});
    REQUIRE_THROWS_AS(db.createGraph({.slug = "trend", .name = "Other"}), std::runtime_error);
}

TEST_CASE("Name defaults to the slug", "[GraphStorage][CRUD]") {
    TempDatabase tempDb;
    GraphStorage db(tempDb.path());

    db.createGraph({.slug = "momentum"});
    REQUIRE(db.getGraph("momentum")->name == "momentum");
}

TEST_CASE("List graphs", "[GraphStorage][CRUD]") {
    TempDatabase tempDb;
    GraphStorage db(tempDb.path());

    REQUIRE(db.listGraphs().empty());

    db.createGraph({.slug = "a", .name = "A"});
    db.createGraph({.slug = "b", .name = "B"});

    REQUIRE(db.listGraphs().size() == 2);
    REQUIRE_FALSE(db.getGraph("c").has_value());
}

// =============================================================================
// Version Tests
// =============================================================================

TEST_CASE("Save and load versions", "[GraphStorage][Versions]") {
    TempDatabase tempDb;
    GraphStorage db(tempDb.path());
    db.createGraph({.slug = "trend", .name = "Trend"});

    REQUIRE_FALSE(db.getLatestVersion("trend").has_value());

    auto first = db.saveVersion("trend", dag::GraphDocument{}, "empty");
    auto doc = sampleDocument();
    auto second = db.saveVersion("trend", doc);

    REQUIRE(second > first);

    auto latest = db.getLatestVersion("trend");
    REQUIRE(latest.has_value());
    REQUIRE(latest->id == second);
    REQUIRE_FALSE(latest->versionName.has_value());

    auto versions = db.listVersions("trend");
    REQUIRE(versions.size() == 2);
    REQUIRE(versions[0].id == second);
    REQUIRE(versions[1].versionName == "empty");

    REQUIRE(db.loadDocument("trend") == doc);
}

TEST_CASE("Saving a version of an unknown graph throws", "[GraphStorage][Versions]") {
    TempDatabase tempDb;
    GraphStorage db(tempDb.path());

    REQUIRE_THROWS_AS(db.saveVersion("nope", sampleDocument()), std::runtime_error);
    REQUIRE_THROWS_AS(db.loadDocument("nope"), std::runtime_error);
}

TEST_CASE("Deleting a graph removes its versions", "[GraphStorage][Versions]") {
    TempDatabase tempDb;
    GraphStorage db(tempDb.path());
    db.createGraph({.slug = "trend", .name = "Trend"});
    db.saveVersion("trend", sampleDocument());

    db.deleteGraph("trend");

    REQUIRE_FALSE(db.graphExists("trend"));
    REQUIRE(db.listVersions("trend").empty());
}

TEST_CASE("Data survives reopening the database", "[GraphStorage]") {
    TempDatabase tempDb;
    {
        GraphStorage db(tempDb.path());
        db.createGraph({.slug = "trend", .name = "Trend"});
        db.saveVersion("trend", sampleDocument());
    }

    GraphStorage reopened(tempDb.path());
    REQUIRE(reopened.loadDocument("trend") == sampleDocument());
}
