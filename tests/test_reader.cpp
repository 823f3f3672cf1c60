/*
===============================================================================
TEST READER — CSV ingestion of the market tables and demand scenarios
===============================================================================
*/

#include <catch2/catch.hpp>

#include "errors.hpp"
#include "misc.hpp"
#include "MarketReader.hpp"
#include "fixtures.hpp"

static const string dataDir = TEST_DATA_DIR;

TEST_CASE("Two-region tables are read", "[MarketReader]")
{
	MarketTables t;
	REQUIRE(readMarketTables(dataDir + "two_region", t));

	REQUIRE(t.regionDemand.size() == 2);
	CHECK(t.regionDemand[0].region == "NSW");
	CHECK(t.regionDemand[0].demand == Approx(100));
	CHECK(t.regionDemand[1].region == "VIC");

	REQUIRE(t.generators.size() == 2);
	CHECK(t.generators[1].region == "VIC");
	CHECK(t.generators[1].generatorName == "VIC_GEN1");
	CHECK(t.generators[1].nameplateCapacity == Approx(200));

	REQUIRE(t.priceLevels.size() == 1);
	CHECK(t.priceLevels[0] == Approx(50));

	REQUIRE(t.bids.size() == 2);
	CHECK(t.bids[0].generatorName == "NSW_GEN1");
	CHECK(t.bids[0].priceLevel == Approx(50));
	CHECK(t.bids[0].bidCapacity == Approx(200));

	REQUIRE(t.interconnectors.size() == 1);
	CHECK(t.interconnectors[0].interconnectorId == "NSW-VIC");
	CHECK(t.interconnectors[0].regionStart == "NSW");
	CHECK(t.interconnectors[0].regionEnd == "VIC");
	CHECK(t.interconnectors[0].capacity == Approx(50));

	Market mkt;
	REQUIRE_NOTHROW(mkt.build(t));
}

/**
 * Columns in another order, padded fields, CRLF line endings, blank lines,
 * negative prices, and no interconnectors.csv.
 */
TEST_CASE("Tables are read by column name", "[MarketReader]")
{
	MarketTables t;
	REQUIRE(readMarketTables(dataDir + "single_region/", t));

	REQUIRE(t.regionDemand.size() == 1);
	CHECK(t.regionDemand[0].region == "SA");

	REQUIRE(t.generators.size() == 3);
	CHECK(t.generators[0].generatorName == "SA_WIND");
	CHECK(t.generators[0].region == "SA");
	CHECK(t.generators[0].nameplateCapacity == Approx(120));
	CHECK(t.generators[2].nameplateCapacity == 0.0);

	REQUIRE(t.priceLevels.size() == 3);
	CHECK(t.priceLevels[0] == Approx(-10));
	CHECK(t.priceLevels[1] == Approx(45.5));

	CHECK(t.bids.size() == 3);
	CHECK(t.interconnectors.empty());
}

TEST_CASE("Unreadable tables are reported", "[MarketReader][errors]")
{
	MarketTables t;
	t.priceLevels.push_back(1);

	SECTION("malformed number")
	{
		REQUIRE_FALSE(readMarketTables(dataDir + "malformed", t));
	}

	SECTION("missing directory")
	{
		REQUIRE_FALSE(readMarketTables(dataDir + "does_not_exist", t));
	}

	// the output is only replaced by a complete read
	CHECK(t.priceLevels.size() == 1);
}

TEST_CASE("Demand scenarios override the base demand", "[MarketReader][scenarios]")
{
	MarketTables t;
	REQUIRE(readMarketTables(dataDir + "two_region", t));
	Market mkt;
	mkt.build(t);

	vector<Scenario> scenarios;
	REQUIRE(readScenarios(dataDir + "scenarios.csv", mkt, scenarios));
	REQUIRE(scenarios.size() == 3);

	CHECK(scenarios[0].name == "peak");
	CHECK(scenarios[0].demand[0] == Approx(180));
	CHECK(scenarios[0].demand[1] == Approx(120));

	SECTION("regions a scenario does not list keep their demand")
	{
		CHECK(scenarios[1].name == "night");
		CHECK(scenarios[1].demand[0] == Approx(100));
		CHECK(scenarios[1].demand[1] == Approx(30));
	}

	SECTION("unknown regions are rejected")
	{
		vector<Scenario> bad;
		REQUIRE_THROWS_AS(readScenarios(dataDir + "bad_scenarios.csv", mkt, bad), ValidationError);
		CHECK(bad.empty());
	}

	SECTION("a region listed twice in a scenario is rejected")
	{
		vector<Scenario> dup;
		REQUIRE_THROWS_WITH(readScenarios(dataDir + "duplicate_scenarios.csv", mkt, dup), Catch::Contains("Duplicate demand in scenario peak"));
		CHECK(dup.empty());
	}

	SECTION("scenario names must be usable in file names")
	{
		vector<Scenario> bad;
		REQUIRE_THROWS_AS(readScenarios(dataDir + "bad_name_scenarios.csv", mkt, bad), ValidationError);
	}

	SECTION("missing file")
	{
		REQUIRE_FALSE(readScenarios(dataDir + "nothing.csv", mkt, scenarios));
		CHECK(scenarios.size() == 3);
	}
}

TEST_CASE("Numbers must be finite", "[MarketReader]")
{
	double value = -1;

	CHECK(parseDouble(" 45.5 ", value));
	CHECK(value == Approx(45.5));
	CHECK(parseDouble("-10", value));

	CHECK_FALSE(parseDouble("inf", value));
	CHECK_FALSE(parseDouble("-Infinity", value));
	CHECK_FALSE(parseDouble("nan", value));
	CHECK_FALSE(parseDouble("1e999", value));
	CHECK_FALSE(parseDouble("12 MW", value));
	CHECK_FALSE(parseDouble("", value));
}
