/*
===============================================================================
TEST MARKET — normalization of the input tables
===============================================================================

Market::build turns the five tables into indexed regions, generators, price
levels and interconnectors, and rejects inconsistent input with a
ValidationError before any model can be built.

===============================================================================
*/

#include <limits>

#include <catch2/catch.hpp>

#include "errors.hpp"
#include "market/Market.hpp"
#include "fixtures.hpp"

TEST_CASE("Two-region market is normalized", "[Market]")
{
	Market mkt;
	mkt.build(twoRegionTables());

	REQUIRE(mkt.numRegion == 2);
	REQUIRE(mkt.numGen == 2);
	REQUIRE(mkt.numPriceLevel == 1);
	REQUIRE(mkt.numInterconnector == 1);

	CHECK(mkt.findRegion("NSW") == 0);
	CHECK(mkt.findRegion("VIC") == 1);
	CHECK(mkt.findRegion("QLD") == -1);
	CHECK(mkt.findGenerator("VIC_GEN1") == 1);
	CHECK(mkt.findPriceLevel(50) == 0);
	CHECK(mkt.findPriceLevel(51) == -1);

	CHECK(mkt.regions[0].demand == Approx(100));
	CHECK(mkt.regions[1].demand == Approx(80));

	const Generator &gen = mkt.generators[0];
	CHECK(gen.name == "NSW_GEN1");
	CHECK(gen.region == 0);
	CHECK(gen.nameplateCapacity == Approx(200));
	CHECK(gen.bidAt(0) == Approx(200));

	SECTION("generators are attached to their region")
	{
		REQUIRE(mkt.regions[0].connectedGenerators.size() == 1);
		CHECK(mkt.regions[0].connectedGenerators[0] == 0);
		REQUIRE(mkt.regions[1].connectedGenerators.size() == 1);
		CHECK(mkt.regions[1].connectedGenerators[0] == 1);
	}

	SECTION("interconnector exports from its start and imports into its end")
	{
		const Interconnector &ic = mkt.interconnectors[0];
		CHECK(ic.name == "NSW-VIC");
		CHECK(ic.regionStart == 0);
		CHECK(ic.regionEnd == 1);
		CHECK(ic.capacity == Approx(50));

		CHECK(mkt.regions[0].exportingInterconnectors == vector<int>(1, 0));
		CHECK(mkt.regions[0].importingInterconnectors.empty());
		CHECK(mkt.regions[1].importingInterconnectors == vector<int>(1, 0));
		CHECK(mkt.regions[1].exportingInterconnectors.empty());
	}

	SECTION("base demand follows the region order")
	{
		vector<double> demand = mkt.baseDemand();
		REQUIRE(demand.size() == 2);
		CHECK(demand[0] == Approx(100));
		CHECK(demand[1] == Approx(80));
	}
}

TEST_CASE("Bands without a bid offer nothing", "[Market]")
{
	MarketTables t;
	addRegion(t, "SA", 50);
	t.priceLevels.push_back(-10);
	t.priceLevels.push_back(40);
	t.priceLevels.push_back(300);
	addGenerator(t, "SA", "WIND", 120);
	addGenerator(t, "SA", "IDLE", 0);
	addBid(t, "WIND", 300, 20);
	addBid(t, "WIND", -10, 100);

	Market mkt;
	mkt.build(t);

	const Generator &wind = mkt.generators[ mkt.findGenerator("WIND") ];
	REQUIRE(wind.bidCapacity.size() == 3);
	CHECK(wind.bidAt(0) == Approx(100));
	CHECK(wind.bidAt(1) == 0.0);
	CHECK(wind.bidAt(2) == Approx(20));
	CHECK(wind.bidAt(7) == 0.0);
	CHECK(wind.totalBid() == Approx(120));
	CHECK(wind.hasBids());

	const Generator &idle = mkt.generators[ mkt.findGenerator("IDLE") ];
	CHECK_FALSE(idle.hasBids());
	CHECK(idle.totalBid() == 0.0);
}

TEST_CASE("Regions without generators or interconnectors are kept", "[Market]")
{
	MarketTables t = twoRegionTables();
	addRegion(t, "TAS", 0);

	Market mkt;
	mkt.build(t);

	int r = mkt.findRegion("TAS");
	REQUIRE(r == 2);
	CHECK(mkt.regions[r].connectedGenerators.empty());
	CHECK(mkt.regions[r].importingInterconnectors.empty());
	CHECK(mkt.regions[r].exportingInterconnectors.empty());
}

TEST_CASE("Inconsistent tables are rejected", "[Market][errors]")
{
	MarketTables t = twoRegionTables();
	Market mkt;

	SECTION("bids exceeding capacity")
	{
		addBid(t, "NSW_GEN1", 60, 1);
		t.priceLevels.push_back(60);
		REQUIRE_THROWS_AS(mkt.build(t), ValidationError);
		REQUIRE_THROWS_WITH(mkt.build(t), Catch::Contains("Bids exceed generator capacity") && Catch::Contains("NSW_GEN1"));
	}

	SECTION("bid of an unknown generator")
	{
		addBid(t, "GHOST", 50, 1);
		REQUIRE_THROWS_AS(mkt.build(t), ValidationError);
	}

	SECTION("generator in an unknown region")
	{
		addGenerator(t, "QLD", "QLD_GEN1", 10);
		REQUIRE_THROWS_WITH(mkt.build(t), Catch::Contains("unknown region QLD"));
	}

	SECTION("bid at an unknown price level")
	{
		t.bids[0].priceLevel = 51;
		REQUIRE_THROWS_WITH(mkt.build(t), Catch::Contains("unknown price level"));
	}

	SECTION("interconnector to an unknown region")
	{
		addInterconnector(t, "VIC-SA", "VIC", "SA", 10);
		REQUIRE_THROWS_WITH(mkt.build(t), Catch::Contains("unknown region SA"));
	}

	SECTION("interconnector within one region")
	{
		addInterconnector(t, "LOOP", "VIC", "VIC", 10);
		REQUIRE_THROWS_AS(mkt.build(t), ValidationError);
	}

	SECTION("duplicate region")
	{
		addRegion(t, "NSW", 1);
		REQUIRE_THROWS_WITH(mkt.build(t), Catch::Contains("Duplicate region"));
	}

	SECTION("duplicate generator")
	{
		addGenerator(t, "VIC", "NSW_GEN1", 10);
		REQUIRE_THROWS_AS(mkt.build(t), ValidationError);
	}

	SECTION("duplicate price level")
	{
		t.priceLevels.push_back(50);
		REQUIRE_THROWS_WITH(mkt.build(t), Catch::Contains("Duplicate price level"));
	}

	SECTION("duplicate bid")
	{
		t.bids[0].bidCapacity = 100;
		addBid(t, "NSW_GEN1", 50, 100);
		REQUIRE_THROWS_WITH(mkt.build(t), Catch::Contains("Duplicate bid"));
	}

	SECTION("duplicate interconnector")
	{
		addInterconnector(t, "NSW-VIC", "VIC", "NSW", 10);
		REQUIRE_THROWS_WITH(mkt.build(t), Catch::Contains("Duplicate interconnector"));
	}

	SECTION("negative quantities")
	{
		SECTION("demand")			{ t.regionDemand[1].demand = -1; }
		SECTION("nameplate")		{ addGenerator(t, "VIC", "NEG", -5); }
		SECTION("bid")				{ t.bids[1].bidCapacity = -1; }
		SECTION("interconnector")	{ t.interconnectors[0].capacity = -50; }

		REQUIRE_THROWS_AS(mkt.build(t), ValidationError);
	}

	SECTION("non-finite quantities")
	{
		double value = GENERATE(std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity());

		SECTION("demand")			{ t.regionDemand[0].demand = value; }
		SECTION("nameplate")		{ t.generators[0].nameplateCapacity = value; }
		SECTION("bid")				{ t.bids[1].bidCapacity = value; }
		SECTION("interconnector")	{ t.interconnectors[0].capacity = value; }
		SECTION("price level")		{ t.priceLevels.push_back(value); }

		REQUIRE_THROWS_AS(mkt.build(t), ValidationError);
	}
}

TEST_CASE("A failed build leaves the market unchanged", "[Market][errors]")
{
	Market mkt;
	mkt.build(twoRegionTables());

	MarketTables bad = twoRegionTables();
	addGenerator(bad, "QLD", "QLD_GEN1", 10);
	REQUIRE_THROWS_AS(mkt.build(bad), ValidationError);

	CHECK(mkt.numRegion == 2);
	CHECK(mkt.numGen == 2);
	CHECK(mkt.findGenerator("QLD_GEN1") == -1);
}
