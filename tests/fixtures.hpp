//
//  fixtures.hpp
//  nemClear tests
//
//  Small builders for the input tables and the run parameters used by the
//  test suites.
//

#ifndef fixtures_hpp
#define fixtures_hpp

#include <cmath>
#include <ostream>
#include <string>

#include "config.hpp"
#include "records.hpp"
#include "solution.hpp"
#include "market/Market.hpp"

inline void addRegion (MarketTables &t, const string &region, double demand) {
	RegionDemandRecord rec;
	rec.region = region;
	rec.demand = demand;
	t.regionDemand.push_back(rec);
}

inline void addGenerator (MarketTables &t, const string &region, const string &name, double capacity) {
	GeneratorRecord rec;
	rec.region = region;
	rec.generatorName = name;
	rec.nameplateCapacity = capacity;
	t.generators.push_back(rec);
}

inline void addBid (MarketTables &t, const string &generator, double price, double capacity) {
	BidRecord rec;
	rec.generatorName = generator;
	rec.priceLevel = price;
	rec.bidCapacity = capacity;
	t.bids.push_back(rec);
}

inline void addInterconnector (MarketTables &t, const string &id, const string &start, const string &end, double capacity) {
	InterconnectorRecord rec;
	rec.interconnectorId = id;
	rec.regionStart = start;
	rec.regionEnd = end;
	rec.capacity = capacity;
	t.interconnectors.push_back(rec);
}

/* NSW 100 MW and VIC 80 MW, one 200 MW generator each bidding all of it at $50, NSW->VIC limited to 50 MW */
inline MarketTables twoRegionTables () {
	MarketTables t;
	addRegion(t, "NSW", 100);
	addRegion(t, "VIC", 80);
	t.priceLevels.push_back(50);
	addGenerator(t, "NSW", "NSW_GEN1", 200);
	addGenerator(t, "VIC", "VIC_GEN1", 200);
	addBid(t, "NSW_GEN1", 50, 200);
	addBid(t, "VIC_GEN1", 50, 200);
	addInterconnector(t, "NSW-VIC", "NSW", "VIC", 50);
	return t;
}

inline runType quietRunParam () {
	runType param;
	setDefaultRunParam(param);
	param.exportInfeasible = false;
	param.writeModel = false;
	param.numThreads = 2;
	return param;
}

/* Swallows the solver output */
struct NullLog : public std::ostream {
	NullLog () : std::ostream(NULL) {}
};

/* Generation of a region plus its net import, as the balance row sees it */
inline double regionalSupply (const Market &mkt, const MarketResult &result, int r) {
	const Region &region = mkt.regions[r];
	double supply = 0.0;

	for (unsigned int i = 0; i < region.connectedGenerators.size(); i++)
		supply += result.dispatch.find(region.name)->second.find( mkt.generators[ region.connectedGenerators[i] ].name )->second;
	for (unsigned int i = 0; i < region.importingInterconnectors.size(); i++)
		supply += result.interconnectorFlow.find( mkt.interconnectors[ region.importingInterconnectors[i] ].name )->second;
	for (unsigned int i = 0; i < region.exportingInterconnectors.size(); i++)
		supply -= result.interconnectorFlow.find( mkt.interconnectors[ region.exportingInterconnectors[i] ].name )->second;

	return supply;
}

#endif /* fixtures_hpp */
