//
//  Market.cpp
//  nemClear
//

#include <cmath>
#include <set>

#include "Market.hpp"
#include "../validation.hpp"
#include "../errors.hpp"
#include "../config.hpp"
#include "../misc.hpp"

/* MW quantities: non-negative and finite */
static bool isQuantity (double value) {
	return value >= 0 && !std::isinf(value);
}

Market::Market () : numRegion(0), numGen(0), numPriceLevel(0), numInterconnector(0) {}

void Market::build (const MarketTables &tables) {

	// bids are checked against the raw tables, before anything is normalized
	vector<string> offenders;
	if ( !validateBidsAgainstCapacity(tables.generators, tables.bids, &offenders) ) {
		string msg = "Bids exceed generator capacity:";
		for (unsigned int i = 0; i < offenders.size(); i++)
			msg += " " + offenders[i];
		throw ValidationError(msg);
	}

	Market mkt;
	mkt.readRegions(tables.regionDemand);
	mkt.readPriceLevels(tables.priceLevels);
	mkt.readGenerators(tables.generators);
	mkt.readBids(tables.bids);
	mkt.readInterconnectors(tables.interconnectors);
	mkt.postprocessing();

	*this = mkt;
}

void Market::readRegions (const vector<RegionDemandRecord> &records) {
	for (unsigned int r = 0; r < records.size(); r++) {
		if ( mapRegionNameToIndex.count(records[r].region) )
			throw ValidationError("Duplicate region: " + records[r].region);
		if ( !isQuantity(records[r].demand) )
			throw ValidationError("Negative or non-finite demand in region " + records[r].region);

		Region region;
		region.id = (int) regions.size();
		region.name = records[r].region;
		region.demand = records[r].demand;

		mapRegionNameToIndex.insert( pair<string, int> (region.name, region.id) );
		regions.push_back(region);
	}
	numRegion = (int) regions.size();
}

void Market::readPriceLevels (const vector<double> &records) {
	for (unsigned int p = 0; p < records.size(); p++) {
		if ( !std::isfinite(records[p]) )
			throw ValidationError("Non-finite price level: " + numToStr(records[p]));
		if ( findPriceLevel(records[p]) >= 0 )
			throw ValidationError("Duplicate price level: " + numToStr(records[p]));
		priceLevels.push_back(records[p]);
	}
	numPriceLevel = (int) priceLevels.size();
}

void Market::readGenerators (const vector<GeneratorRecord> &records) {
	for (unsigned int g = 0; g < records.size(); g++) {
		const GeneratorRecord &rec = records[g];

		if ( mapGenNameToIndex.count(rec.generatorName) )
			throw ValidationError("Duplicate generator: " + rec.generatorName);
		if ( !isQuantity(rec.nameplateCapacity) )
			throw ValidationError("Negative or non-finite nameplate capacity for generator " + rec.generatorName);

		int r = findRegion(rec.region);
		if ( r < 0 )
			throw ValidationError("Generator " + rec.generatorName + " references unknown region " + rec.region);

		Generator gen;
		gen.id = (int) generators.size();
		gen.name = rec.generatorName;
		gen.nameplateCapacity = rec.nameplateCapacity;
		gen.region = r;
		gen.regionName = rec.region;
		gen.bidCapacity.assign(numPriceLevel, 0.0);		// a band without a bid offers nothing

		mapGenNameToIndex.insert( pair<string, int> (gen.name, gen.id) );
		generators.push_back(gen);
	}
	numGen = (int) generators.size();
}

void Market::readBids (const vector<BidRecord> &records) {
	set< pair<int, int> > seen;

	for (unsigned int b = 0; b < records.size(); b++) {
		const BidRecord &rec = records[b];

		int g = findGenerator(rec.generatorName);
		if ( g < 0 )
			throw ValidationError("Bid references unknown generator " + rec.generatorName);

		int p = findPriceLevel(rec.priceLevel);
		if ( p < 0 )
			throw ValidationError("Bid of " + rec.generatorName + " references unknown price level " + numToStr(rec.priceLevel));

		if ( !isQuantity(rec.bidCapacity) )
			throw ValidationError("Negative or non-finite bid capacity for generator " + rec.generatorName);

		if ( !seen.insert( make_pair(g, p) ).second )
			throw ValidationError("Duplicate bid of " + rec.generatorName + " at price level " + numToStr(rec.priceLevel));

		generators[g].bidCapacity[p] = rec.bidCapacity;
	}
}

void Market::readInterconnectors (const vector<InterconnectorRecord> &records) {
	set<string> names;

	for (unsigned int l = 0; l < records.size(); l++) {
		const InterconnectorRecord &rec = records[l];

		if ( !names.insert(rec.interconnectorId).second )
			throw ValidationError("Duplicate interconnector: " + rec.interconnectorId);
		if ( !isQuantity(rec.capacity) )
			throw ValidationError("Negative or non-finite capacity for interconnector " + rec.interconnectorId);

		Interconnector ic;
		ic.id = (int) interconnectors.size();
		ic.name = rec.interconnectorId;
		ic.capacity = rec.capacity;

		// origin and destination regions
		ic.regionStart = findRegion(rec.regionStart);
		ic.regionEnd = findRegion(rec.regionEnd);
		if ( ic.regionStart < 0 )
			throw ValidationError("Interconnector " + rec.interconnectorId + " references unknown region " + rec.regionStart);
		if ( ic.regionEnd < 0 )
			throw ValidationError("Interconnector " + rec.interconnectorId + " references unknown region " + rec.regionEnd);
		if ( ic.regionStart == ic.regionEnd )
			throw ValidationError("Interconnector " + rec.interconnectorId + " starts and ends in region " + rec.regionStart);

		interconnectors.push_back(ic);
	}
	numInterconnector = (int) interconnectors.size();
}

/****************************************************************************
 * postprocessing
 * Sets the connectedGenerators field of each region
 * Sets the importing and exporting interconnectors of each region
 ****************************************************************************/
void Market::postprocessing () {
	for (int g = 0; g < numGen; g++)
		regions[ generators[g].region ].connectedGenerators.push_back(g);

	for (int l = 0; l < numInterconnector; l++) {
		regions[ interconnectors[l].regionStart ].exportingInterconnectors.push_back(l);
		regions[ interconnectors[l].regionEnd ].importingInterconnectors.push_back(l);
	}
}

int Market::findRegion (const string &name) const {
	map<string, int>::const_iterator it = mapRegionNameToIndex.find(name);
	return (it == mapRegionNameToIndex.end()) ? -1 : it->second;
}

int Market::findGenerator (const string &name) const {
	map<string, int>::const_iterator it = mapGenNameToIndex.find(name);
	return (it == mapGenNameToIndex.end()) ? -1 : it->second;
}

int Market::findPriceLevel (double price) const {
	for (int p = 0; p < (int) priceLevels.size(); p++)
		if ( fabs(priceLevels[p] - price) <= EPSzero )
			return p;
	return -1;
}

vector<double> Market::baseDemand () const {
	vector<double> demand (numRegion);
	for (int r = 0; r < numRegion; r++)
		demand[r] = regions[r].demand;
	return demand;
}
