//
//  records.hpp
//  nemClear
//
//  Rows of the five input tables, as read and before any normalization.
//

#ifndef records_hpp
#define records_hpp

#include <string>
#include <vector>

using namespace std;

struct RegionDemandRecord {
	string	region;
	double	demand;		// MW
};

struct GeneratorRecord {
	string	region;
	string	generatorName;
	double	nameplateCapacity;	// MW
};

struct BidRecord {
	string	generatorName;
	double	priceLevel;		// $ / MW
	double	bidCapacity;	// MW
};

struct InterconnectorRecord {
	string	interconnectorId;
	string	regionStart;
	string	regionEnd;
	double	capacity;		// MW, in either direction
};

struct MarketTables {
	vector<RegionDemandRecord>		regionDemand;
	vector<GeneratorRecord>			generators;
	vector<double>					priceLevels;
	vector<BidRecord>				bids;
	vector<InterconnectorRecord>	interconnectors;
};

#endif /* records_hpp */
