//
//  Interconnector.hpp
//  nemClear
//

#ifndef Interconnector_hpp
#define Interconnector_hpp

#include <string>

using namespace std;

class Interconnector {

public:
	Interconnector () : id(-1), capacity(0.0), regionStart(-1), regionEnd(-1) {}

	// interconnector identifiers
	int		id;
	string	name;

	double	capacity;	// MW, flow is limited to [-capacity, capacity]

	// positive flow runs from regionStart to regionEnd
	int		regionStart;
	int		regionEnd;
};

#endif /* Interconnector_hpp */
