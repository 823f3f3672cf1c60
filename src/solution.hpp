//
//  solution.hpp
//  nemClear
//

#ifndef solution_hpp
#define solution_hpp

#include <map>
#include <string>
#include <vector>

#include "config.hpp"
#include "market/Market.hpp"

using namespace std;

/* Index of a dispatch variable: generator g of region r offering at price band p */
struct DispatchKey {
	DispatchKey () : region(-1), generator(-1), band(-1) {}
	DispatchKey (int r, int g, int p) : region(r), generator(g), band(p) {}

	bool operator< (const DispatchKey &o) const {
		if (region != o.region) return region < o.region;
		if (generator != o.generator) return generator < o.generator;
		return band < o.band;
	}

	int region;
	int generator;
	int band;
};

/* Values read back from the solver after a solve. Only the status is meaningful unless it is OPTIMAL. */
struct SolvedValues {
	SolvedValues () : status(NOT_SOLVED), objValue(0.0) {}

	SolveStatus					status;
	double						objValue;
	map<DispatchKey, double>	dispatch;	// variables that were not created are absent
	vector<double>				flow;		// indexed as Market::interconnectors
	vector<double>				balanceDuals;	// indexed as Market::regions, empty if not computed
};

struct MarketResult {
	MarketResult () : status(NOT_SOLVED), totalCost(0.0) {}

	bool hasSolution () const { return status == OPTIMAL; }

	SolveStatus	status;
	double		totalCost;		// NaN unless the status is OPTIMAL

	map<string, map<string, double> >	dispatch;		// region -> generator -> MW
	map<string, map<double, double> >	bandDispatch;	// generator -> price level -> MW
	map<string, double>					interconnectorFlow;	// signed MW, positive from start to end region
	map<pair<string, string>, double>	regionFlow;		// (start, end) -> signed MW summed over parallel interconnectors
	map<string, double>					regionalPrice;	// $ / MW, empty if not computed
};

/* Re-aggregates the solved variables into domain totals. A non-optimal status yields a result with empty
 * mappings and a NaN cost. */
MarketResult aggregateResult (const Market &mkt, const SolvedValues &solved);

string statusName (SolveStatus status);

#endif /* solution_hpp */
