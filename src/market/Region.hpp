//
//  Region.hpp
//  nemClear
//

#ifndef Region_hpp
#define Region_hpp

#include <string>
#include <vector>

using namespace std;

class Region {

public:
	Region () : id(-1), demand(0.0) {}

	// region identifiers
	int		id;
	string	name;

	double	demand;		// MW

	vector<int>	connectedGenerators;
	vector<int>	importingInterconnectors;	// interconnectors ending in this region
	vector<int>	exportingInterconnectors;	// interconnectors starting in this region
};

#endif /* Region_hpp */
