/*
 * DispatchModel.hpp
 *
 * Single-period market clearing: dispatch of price-band bids across regions
 * connected by interconnectors, at least cost, meeting the regional demands.
 *
 */

#ifndef DISPATCHMODEL_HPP_
#define DISPATCHMODEL_HPP_

#include <ilcplex/ilocplex.h>

#include <map>
#include <string>
#include <vector>

#include "config.hpp"
#include "solution.hpp"
#include "market/Market.hpp"

using namespace std;

#ifndef NAMESIZE
#define NAMESIZE 128
#endif

class DispatchModel {

public:
	DispatchModel(const Market &mkt, const runType &param, ostream &logStream, string name = "market");
	DispatchModel(const Market &mkt, const vector<double> &demand, const runType &param, ostream &logStream, string name = "market");
	~DispatchModel();

	void		formulate();
	SolveStatus	solve();

	MarketResult	getResult() const;
	double			getObjValue() const;
	SolveStatus		getStatus() const { return solved.status; }
	ModelState		getState() const { return state; }

	void exportModel(string filename);

	int numDispatchVars() const { return (int) dispatch.size(); }
	int numFlowVars() const { return mkt.numInterconnector; }
	int numConstraints() const { return (int) rowNames.size(); }
	const vector<string>& getRowNames() const { return rowNames; }
	bool hasDispatchVar(int r, int g, int p) const { return dispatch.count( DispatchKey(r, g, p) ) > 0; }

	IloEnv		env;
	IloModel	model;
	IloCplex	cplex;

private:
	// owns its environment, which the destructor ends
	DispatchModel(const DispatchModel &);
	DispatchModel& operator=(const DispatchModel &);

	void setup();
	void recordSolution();

	map<DispatchKey, IloNumVar>	dispatch;		// only bands with a positive bid get a variable
	IloNumVarArray				flow;
	IloRangeArray				bidCap, nameplateCap, balance;

	const Market	&mkt;
	vector<double>	demand;		// MW, indexed as Market::regions
	runType			param;
	ostream			&logStream;
	string			name;

	ModelState		state;
	SolvedValues	solved;
	vector<string>	rowNames;	// in the order the constraints were added
};

/* Formulates, solves and extracts one market. Infeasibility is reported through the status of the result. */
MarketResult clearMarket(const Market &mkt, const runType &param, ostream &logStream);

/* Builds the market from the tables first. Throws ValidationError before any model is built if they are inconsistent. */
MarketResult clearMarket(const MarketTables &tables, const runType &param, ostream &logStream);

#endif /* DISPATCHMODEL_HPP_ */
