//
//  validation.hpp
//  nemClear
//

#ifndef validation_hpp
#define validation_hpp

#include <string>
#include <vector>

#include "records.hpp"

using namespace std;

/* True if, for every generator, the bid capacities summed over all price levels do not exceed its nameplate capacity
 * by more than EPSzero (1e-8 MW), which absorbs floating-point rounding of the sum. A non-finite capacity or sum fails,
 * as does a bid for a generator that is not in the generator table. Offending generator names are
 * appended to offenders, if provided. */
bool validateBidsAgainstCapacity (const vector<GeneratorRecord> &generators, const vector<BidRecord> &bids, vector<string> *offenders = NULL);

#endif /* validation_hpp */
