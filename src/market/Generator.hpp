//
//  Generator.hpp
//  nemClear
//

#ifndef Generator_hpp
#define Generator_hpp

#include <string>
#include <vector>

using namespace std;

class Generator {

public:
	Generator ();

	double bidAt (int band) const;	// bid capacity at the price band, 0 if there is none
	double totalBid () const;
	bool   hasBids () const;

	// generator identifiers
	string	name;	// provided by the data
	int		id;		// assigned by us

	double	nameplateCapacity;	// MW

	int		region;				// owning region
	string	regionName;

	vector<double>	bidCapacity;	// MW offered at each price band, indexed as Market::priceLevels
};

#endif /* Generator_hpp */
