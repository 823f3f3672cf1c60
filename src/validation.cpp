//
//  validation.cpp
//  nemClear
//

#include <cmath>
#include <map>

#include "validation.hpp"
#include "config.hpp"

bool validateBidsAgainstCapacity (const vector<GeneratorRecord> &generators, const vector<BidRecord> &bids, vector<string> *offenders) {

	// total bid per generator, in the order the generators first appear in the bids
	map<string, double> totalBids;
	vector<string> bidders;
	for (unsigned int b = 0; b < bids.size(); b++) {
		if ( totalBids.find(bids[b].generatorName) == totalBids.end() ) {
			totalBids[bids[b].generatorName] = 0.0;
			bidders.push_back(bids[b].generatorName);
		}
		totalBids[bids[b].generatorName] += bids[b].bidCapacity;
	}

	map<string, double> capacity;
	for (unsigned int g = 0; g < generators.size(); g++)
		capacity[generators[g].generatorName] = generators[g].nameplateCapacity;

	bool status = true;
	for (unsigned int i = 0; i < bidders.size(); i++) {
		map<string, double>::const_iterator it = capacity.find(bidders[i]);

		// written so that a NaN total or capacity fails
		if ( it == capacity.end() || !std::isfinite(it->second) || !(totalBids[bidders[i]] <= it->second + EPSzero) ) {
			status = false;
			if (offenders == NULL)
				break;
			offenders->push_back(bidders[i]);
		}
	}

	return status;
}
