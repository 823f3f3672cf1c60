//
//  solution.cpp
//  nemClear
//

#include <algorithm>
#include <cmath>
#include <limits>

#include "solution.hpp"

/* numerical corrections of solver noise */
static double clean (double value) {
	return (fabs(value) < dispatchTol) ? 0.0 : value;
}

MarketResult aggregateResult (const Market &mkt, const SolvedValues &solved) {
	MarketResult result;
	result.status = solved.status;

	if ( solved.status != OPTIMAL ) {
		result.totalCost = numeric_limits<double>::quiet_NaN();
		return result;
	}

	result.totalCost = solved.objValue;

	/* dispatch totals: summed over the price bands of each generator */
	for (int r = 0; r < mkt.numRegion; r++) {
		const Region &region = mkt.regions[r];
		map<string, double> &regionDispatch = result.dispatch[region.name];

		for (unsigned int i = 0; i < region.connectedGenerators.size(); i++) {
			const Generator &gen = mkt.generators[ region.connectedGenerators[i] ];
			double total = 0.0;

			for (int p = 0; p < mkt.numPriceLevel; p++) {
				map<DispatchKey, double>::const_iterator it = solved.dispatch.find( DispatchKey(r, gen.id, p) );
				double value = (it == solved.dispatch.end()) ? 0.0 : max(0.0, clean(it->second));

				result.bandDispatch[gen.name][ mkt.priceLevels[p] ] = value;
				total += value;
			}
			regionDispatch[gen.name] = total;
		}
	}

	/* flows */
	for (int l = 0; l < mkt.numInterconnector; l++) {
		const Interconnector &ic = mkt.interconnectors[l];
		double value = (l < (int) solved.flow.size()) ? clean(solved.flow[l]) : 0.0;

		result.interconnectorFlow[ic.name] = value;
		result.regionFlow[ make_pair(mkt.regions[ic.regionStart].name, mkt.regions[ic.regionEnd].name) ] += value;
	}

	/* regional prices */
	for (unsigned int r = 0; r < solved.balanceDuals.size() && (int) r < mkt.numRegion; r++)
		result.regionalPrice[ mkt.regions[r].name ] = clean(solved.balanceDuals[r]);

	return result;
}

string statusName (SolveStatus status) {
	switch (status) {
	case OPTIMAL:		return "Optimal";
	case INFEASIBLE:	return "Infeasible";
	case UNBOUNDED:		return "Unbounded";
	case UNDEFINED:		return "Undefined";
	default:			return "Not Solved";
	}
}
