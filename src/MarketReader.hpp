//
//  MarketReader.hpp
//  nemClear
//

#ifndef MarketReader_hpp
#define MarketReader_hpp

#include <string>
#include <vector>

#include "records.hpp"
#include "market/Market.hpp"

using namespace std;

struct Scenario {
	string			name;
	vector<double>	demand;		// MW, indexed as Market::regions
};

/* Reads region_demand.csv, generators.csv, pricelevel.csv, bids.csv and the optional interconnectors.csv
 * of the input directory. Returns false, after reporting the cause, if a required file or column is missing
 * or a field is malformed. */
bool readMarketTables (string inputDir, MarketTables &tables);

/* Reads "scenario,region,demand" rows. Regions not listed by a scenario keep their base demand.
 * Returns false if the file cannot be read; throws ValidationError for unknown regions, negative demands, a region
 * repeated within a scenario, or a scenario name that is not usable in a file name. */
bool readScenarios (string filepath, const Market &mkt, vector<Scenario> &scenarios);

#endif /* MarketReader_hpp */
