//
//  Generator.cpp
//  nemClear
//

#include "Generator.hpp"

Generator::Generator() : id(-1), nameplateCapacity(0.0), region(-1) {}

double Generator::bidAt(int band) const {
	if ( band < 0 || band >= (int) bidCapacity.size() )
		return 0.0;
	return bidCapacity[band];
}

double Generator::totalBid() const {
	double total = 0.0;
	for (unsigned int p = 0; p < bidCapacity.size(); p++)
		total += bidCapacity[p];
	return total;
}

bool Generator::hasBids() const {
	for (unsigned int p = 0; p < bidCapacity.size(); p++)
		if ( bidCapacity[p] > 0.0 ) return true;
	return false;
}
