//
//  config.hpp
//  nemClear
//

#ifndef config_h
#define config_h

#include <string>
#include <thread>

enum SolveStatus {
	NOT_SOLVED,
	OPTIMAL,
	INFEASIBLE,
	UNBOUNDED,
	UNDEFINED
};

enum ModelState {
	EMPTY,
	BUILT,
	SUBMITTED,
	SOLVED
};

struct runType {
	std::string	outputDir;			// logs and result files are written here

	int		cplexThreads;		// threads used by a single CPLEX solve
	int		numThreads;			// worker threads of the scenario batch

	double	optimalityTol;		// EpOpt
	double	feasibilityTol;		// EpRHS
	double	timeLimit;			// in seconds, 0 if the solve is not time limited

	bool	computePrices;		// record balance duals as regional prices
	bool	writeModel;			// export each formulated model in LP format
	bool	exportInfeasible;	// export the model when the solve is not optimal
};

void setDefaultRunParam (runType &param);
bool readRunfile (std::string filepath, runType &param);

const double EPSzero = 1e-8;
const double dispatchTol = 1e-6;	// solution values below this are recorded as zero

const char delimiter = ',';

const unsigned short defaultSolverThreads = 1;
const unsigned short defaultBatchThreads = std::thread::hardware_concurrency() > 0 ? std::thread::hardware_concurrency() : 1;

#endif /* config_h */
