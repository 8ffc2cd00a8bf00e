#include <catch2/catch.hpp>
#include "dag/operations/ArithmeticOperations.hpp"
#include "dag/operations/IndicatorOperations.hpp"
#include "dag/Errors.hpp"
#include <cmath>

using namespace dag;
using Catch::Detail::Approx;

// =============================================================================
// ADD Tests
// =============================================================================

TEST_CASE("ADD sums columns and the scalar", "[Operations][ADD]") {
    DataTable table;
    table.setColumn("x", {1.0, 2.0, 3.0});
    table.setColumn("y", {10.0, 20.0, 30.0});

    AddUnit unit;
    auto out = unit.execute(Parameters::fromList({ColumnRef{"x"}, ColumnRef{"y"}, 5.0}), table);

    REQUIRE(out == ColumnData{16.0, 27.0, 38.0});
}

TEST_CASE("ADD fails on a missing column", "[Operations][ADD]") {
    DataTable table;
    table.setColumn("x", {1.0});

    AddUnit unit;
    REQUIRE_THROWS_AS(unit.execute(Parameters::fromList({ColumnRef{"nope"}, 1.0}), table), std::runtime_error);
}

TEST_CASE("ADD fails on columns of different lengths", "[Operations][ADD]") {
    DataTable table;
    table.setColumn("x", {1.0, 2.0});
    table.setColumn("y", {1.0});

    AddUnit unit;
    REQUIRE_THROWS_AS(unit.execute(Parameters::fromList({ColumnRef{"x"}, ColumnRef{"y"}, 0.0}), table),
                      std::runtime_error);
}

// =============================================================================
// SMA Tests
// =============================================================================

TEST_CASE("SMA averages over the window", "[Operations][SMA]") {
    DataTable table;
    table.setColumn("close", {1.0, 2.0, 3.0, 4.0, 5.0});

    SmaUnit unit;
    auto out = unit.execute(Parameters::fromList({ColumnRef{"close"}, 3.0}), table);

    REQUIRE(out.size() == 5);
    REQUIRE(std::isnan(out[0]));
    REQUIRE(std::isnan(out[1]));
    REQUIRE(out[2] == Approx(2.0));
    REQUIRE(out[3] == Approx(3.0));
    REQUIRE(out[4] == Approx(4.0));
}

TEST_CASE("SMA window must be a positive integer", "[Operations][SMA]") {
    SmaUnit unit;
    REQUIRE_THROWS_AS(unit.validate(Parameters::fromList({ColumnRef{"close"}, 0.0})), InvalidParameterError);
    REQUIRE_THROWS_AS(unit.validate(Parameters::fromList({ColumnRef{"close"}, 2.5})), InvalidParameterError);
    REQUIRE_THROWS_AS(unit.validate(Parameters::fromList({ColumnRef{"a"}, ColumnRef{"b"}, 2.0})),
                      InvalidParameterError);
    REQUIRE_NOTHROW(unit.validate(Parameters::fromList({ColumnRef{"close"}, 20.0})));
}

// =============================================================================
// ADX Tests
// =============================================================================

TEST_CASE("ADX of a steady uptrend is 100", "[Operations][ADX]") {
    DataTable table;
    table.setColumn("high", {10.0, 11.0, 12.0, 13.0, 14.0, 15.0});
    table.setColumn("low", {9.0, 10.0, 11.0, 12.0, 13.0, 14.0});
    table.setColumn("close", {9.5, 10.5, 11.5, 12.5, 13.5, 14.5});

    AdxUnit unit;
    auto out = unit.execute(
        Parameters::fromList({ColumnRef{"high"}, ColumnRef{"low"}, ColumnRef{"close"}, 2.0}), table);

    REQUIRE(out.size() == 6);
    for (size_t i = 0; i < 3; ++i) {
        REQUIRE(std::isnan(out[i]));
    }
    REQUIRE(out[3] == Approx(100.0));
    REQUIRE(out[5] == Approx(100.0));
}

TEST_CASE("ADX with too few rows is all NaN", "[Operations][ADX]") {
    DataTable table;
    table.setColumn("high", {10.0, 11.0, 12.0});
    table.setColumn("low", {9.0, 10.0, 11.0});
    table.setColumn("close", {9.5, 10.5, 11.5});

    AdxUnit unit;
    auto out = unit.execute(
        Parameters::fromList({ColumnRef{"high"}, ColumnRef{"low"}, ColumnRef{"close"}, 14.0}), table);

    REQUIRE(out.size() == 3);
    for (double v : out) {
        REQUIRE(std::isnan(v));
    }
}

TEST_CASE("ADX needs three columns and a period of at least 2", "[Operations][ADX]") {
    AdxUnit unit;
    REQUIRE_THROWS_AS(unit.validate(Parameters::fromList({ColumnRef{"h"}, ColumnRef{"l"}, ColumnRef{"c"}, 1.0})),
                      InvalidParameterError);
    REQUIRE_THROWS_AS(unit.validate(Parameters::fromList({ColumnRef{"h"}, ColumnRef{"l"}, 14.0})),
                      InvalidParameterError);
}
