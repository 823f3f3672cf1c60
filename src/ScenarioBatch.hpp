//
//  ScenarioBatch.hpp
//  nemClear
//
//  Clears the same market under several demand scenarios. Every scenario is
//  an independent model with its own CPLEX environment; the scenarios are
//  distributed over a pool of worker threads.
//

#ifndef ScenarioBatch_hpp
#define ScenarioBatch_hpp

#include <exception>
#include <string>
#include <vector>

#include "config.hpp"
#include "solution.hpp"
#include "MarketReader.hpp"
#include "market/Market.hpp"

using namespace std;

class ScenarioBatch {

public:
	ScenarioBatch (const Market &mkt, const vector<Scenario> &scenarios, const runType &param);

	/* Solves every scenario. Rethrows the first exception raised by a scenario once all of them are done. */
	void solve ();

	int numScenarios () const { return (int) scenarios.size(); }
	const Scenario& getScenario (int s) const { return scenarios[s]; }
	const MarketResult& getResult (int s) const { return results[s]; }
	const vector<MarketResult>& getResults () const { return results; }
	double getSolveTime (int s) const { return solveTimes[s]; }

private:
	void solveOneScenario (int s);

	const Market		&mkt;
	vector<Scenario>	scenarios;
	runType				param;

	vector<MarketResult>		results;
	vector<exception_ptr>		errors;
	vector<double>				solveTimes;
};

#endif /* ScenarioBatch_hpp */
