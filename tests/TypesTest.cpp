#include <catch2/catch.hpp>
#include "dag/Types.hpp"
#include "dag/Errors.hpp"
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace dag;

// Helper to create a temporary CSV file
class TempCsv {
public:
    explicit TempCsv(const std::string& content)
        : m_path("/tmp/test_opgraph_" + std::to_string(std::rand()) + ".csv")
    {
        std::ofstream file(m_path);
        file << content;
    }

    ~TempCsv() {
        std::filesystem::remove(m_path);
    }

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

// =============================================================================
// OperationKind Tests
// =============================================================================

TEST_CASE("Kind wire names round trip", "[Types]") {
    REQUIRE(kindToString(OperationKind::Add) == "ADD");
    REQUIRE(kindToString(OperationKind::Sma) == "SMA");
    REQUIRE(kindToString(OperationKind::Adx) == "ADX");

    REQUIRE(stringToKind("ADD") == OperationKind::Add);
    REQUIRE(stringToKind("SMA") == OperationKind::Sma);
    REQUIRE(stringToKind("ADX") == OperationKind::Adx);
}

TEST_CASE("Unknown kind name is rejected", "[Types]") {
    REQUIRE_THROWS_AS(stringToKind("MUL"), UnknownKindError);
    REQUIRE_FALSE(tryStringToKind("add").has_value());
}

// =============================================================================
// Parameters Tests
// =============================================================================

TEST_CASE("Parameters keep column order and the scalar", "[Types][Parameters]") {
    auto params = Parameters::fromList({ColumnRef{"x"}, 5.0, ColumnRef{"y"}});

    REQUIRE(params.columns() == std::vector<std::string>{"x", "y"});
    REQUIRE(params.hasScalar());
    REQUIRE(*params.scalar() == 5.0);

    // Columns first, then the scalar
    ParamList expected{ColumnRef{"x"}, ColumnRef{"y"}, 5.0};
    REQUIRE(params.toList() == expected);
    REQUIRE(describeParameters(params) == "columns=[x, y], value=5");
}

TEST_CASE("Parameters reject a second value entry", "[Types][Parameters]") {
    REQUIRE_THROWS_AS(Parameters::fromList({1.0, 2.0}), InvalidParameterError);
}

TEST_CASE("Parameters reject empty column names and non-finite values", "[Types][Parameters]") {
    REQUIRE_THROWS_AS(Parameters::fromList({ColumnRef{""}}), InvalidParameterError);
    REQUIRE_THROWS_AS(Parameters::fromList({std::nan("")}), InvalidParameterError);
}

TEST_CASE("Empty parameter list has no columns and no scalar", "[Types][Parameters]") {
    auto params = Parameters::fromList({});
    REQUIRE(params.columns().empty());
    REQUIRE_FALSE(params.hasScalar());
    REQUIRE(params.toList().empty());
}

// =============================================================================
// DataTable Tests
// =============================================================================

TEST_CASE("DataTable set and get columns", "[DataTable]") {
    DataTable table;
    table.setColumn("close", {1.0, 2.0, 3.0});
    table.setColumn("open", {1.5});

    REQUIRE(table.hasColumn("close"));
    REQUIRE_FALSE(table.hasColumn("volume"));
    REQUIRE(table.getColumn("close") == ColumnData{1.0, 2.0, 3.0});
    REQUIRE(table.columnCount() == 2);
    REQUIRE(table.rowCount() == 3);
    REQUIRE_THROWS_AS(table.getColumn("volume"), std::out_of_range);
}

TEST_CASE("DataTable reads numeric CSV", "[DataTable][CSV]") {
    TempCsv csv("high,low,close\n10,8,9\n11,,10.5\n");

    auto table = DataTable::readCsv(csv.path());

    REQUIRE(table.getColumnNames() == std::vector<std::string>{"close", "high", "low"});
    REQUIRE(table.rowCount() == 2);
    REQUIRE(table.getColumn("close") == ColumnData{9.0, 10.5});
    REQUIRE(std::isnan(table.getColumn("low")[1]));
}

TEST_CASE("DataTable CSV rejects non-numeric cells", "[DataTable][CSV]") {
    TempCsv csv("close\n1\nabc\n");
    REQUIRE_THROWS_AS(DataTable::readCsv(csv.path()), std::runtime_error);
}

TEST_CASE("DataTable CSV missing file throws", "[DataTable][CSV]") {
    REQUIRE_THROWS_AS(DataTable::readCsv("/tmp/does_not_exist_opgraph.csv"), std::runtime_error);
}
