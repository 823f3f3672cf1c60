//
//  Market.hpp
//  nemClear
//

#ifndef Market_hpp
#define Market_hpp

#include <vector>
#include <string>
#include <map>

#include "Region.hpp"
#include "Generator.hpp"
#include "Interconnector.hpp"
#include "../records.hpp"

using namespace std;

class Market {

public:
	Market ();

	/* Normalizes and validates the tables. Throws ValidationError, and leaves the market unchanged, if they are inconsistent. */
	void build (const MarketTables &tables);

	int findRegion (const string &name) const;			// -1 if unknown
	int findGenerator (const string &name) const;
	int findPriceLevel (double price) const;

	vector<double> baseDemand () const;

	int numRegion;
	int numGen;
	int numPriceLevel;
	int numInterconnector;

	vector<Region>			regions;
	vector<Generator>		generators;
	vector<double>			priceLevels;	// $ / MW, in input order
	vector<Interconnector>	interconnectors;

private:
	void readRegions (const vector<RegionDemandRecord> &records);
	void readPriceLevels (const vector<double> &records);
	void readGenerators (const vector<GeneratorRecord> &records);
	void readBids (const vector<BidRecord> &records);
	void readInterconnectors (const vector<InterconnectorRecord> &records);
	void postprocessing ();

	// helpers
	map<string, int> mapRegionNameToIndex;
	map<string, int> mapGenNameToIndex;
};

#endif /* Market_hpp */
