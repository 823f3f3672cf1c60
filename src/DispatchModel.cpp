/*
 * DispatchModel.cpp
 *
 */

#include <cmath>
#include <stdexcept>

#include "misc.hpp"
#include "errors.hpp"
#include "DispatchModel.hpp"

static SolveStatus convertStatus(IloAlgorithm::Status status) {
	switch (status) {
	case IloAlgorithm::Optimal:
		return OPTIMAL;
	case IloAlgorithm::Infeasible:
	case IloAlgorithm::InfeasibleOrUnbounded:	// dispatch and flows are bounded, so this can only be infeasible
		return INFEASIBLE;
	case IloAlgorithm::Unbounded:
		return UNBOUNDED;
	default:
		return UNDEFINED;
	}
}

DispatchModel::DispatchModel(const Market &mkt, const runType &param, ostream &logStream, string name)
	: mkt(mkt), demand(mkt.baseDemand()), param(param), logStream(logStream), name(name), state(EMPTY) {
	setup();
}

DispatchModel::DispatchModel(const Market &mkt, const vector<double> &demand, const runType &param, ostream &logStream, string name)
	: mkt(mkt), demand(demand), param(param), logStream(logStream), name(name), state(EMPTY) {

	if ( (int) demand.size() != mkt.numRegion ) {
		env.end();
		throw ValidationError("Demand of " + name + " has " + numToStr(demand.size()) + " regions, the market has " + numToStr(mkt.numRegion));
	}
	for (int r = 0; r < mkt.numRegion; r++) {
		if ( !(demand[r] >= 0) || std::isinf(demand[r]) ) {
			env.end();
			throw ValidationError("Negative or non-finite demand of " + name + " in region " + mkt.regions[r].name);
		}
	}
	setup();
}

DispatchModel::~DispatchModel() {
	env.end();
}

void DispatchModel::setup() {
	try {
		model = IloModel(env);
		cplex = IloCplex(model);

		cplex.setOut(logStream);
		cplex.setWarning(logStream);

		cplex.setParam(IloCplex::Threads, param.cplexThreads);
		cplex.setParam(IloCplex::EpOpt, param.optimalityTol);
		cplex.setParam(IloCplex::EpRHS, param.feasibilityTol);
		if (param.timeLimit > 0)
			cplex.setParam(IloCplex::TiLim, param.timeLimit);

		// primal reductions only: presolve then reports infeasibility as such
		cplex.setParam(IloCplex::Reduce, 1);

		flow = IloNumVarArray(env);
		bidCap = IloRangeArray(env);
		nameplateCap = IloRangeArray(env);
		balance = IloRangeArray(env);
	}
	catch (IloException &e) {
		string msg = e.getMessage();
		e.end();
		env.end();
		throw SolverError("CPLEX could not be initialized: " + msg);
	}
}

void DispatchModel::formulate() {
	char elemName[NAMESIZE];

	if (state != EMPTY)
		throw logic_error("Model " + name + " has already been formulated.");

	try {
		/**** Decision variables *****/
		for (int r = 0; r < mkt.numRegion; r++) {
			const Region *regPtr = &(mkt.regions[r]);

			for (unsigned int i = 0; i < regPtr->connectedGenerators.size(); i++) {
				const Generator *genPtr = &(mkt.generators[ regPtr->connectedGenerators[i] ]);

				for (int p = 0; p < mkt.numPriceLevel; p++) {
					// a band without a bid would be pinned to zero, it is left out instead
					if ( genPtr->bidAt(p) <= 0.0 ) continue;

					snprintf(elemName, NAMESIZE, "dispatch(%s)(%s)(%d)", regPtr->name.c_str(), genPtr->name.c_str(), p);
					IloNumVar var(env, 0, IloInfinity, ILOFLOAT, elemName);
					model.add(var);
					dispatch[ DispatchKey(r, genPtr->id, p) ] = var;
				}
			}
		}

		/* Interconnector flows, positive from the start to the end region */
		for (int l = 0; l < mkt.numInterconnector; l++) {
			const Interconnector *icPtr = &(mkt.interconnectors[l]);

			snprintf(elemName, NAMESIZE, "flow(%s)", icPtr->name.c_str());
			flow.add( IloNumVar(env, -icPtr->capacity, icPtr->capacity, ILOFLOAT, elemName) );
			model.add(flow[l]);
		}

		/***** Constraints *****/
		/* Bid capacities */
		for (map<DispatchKey, IloNumVar>::iterator it = dispatch.begin(); it != dispatch.end(); ++it) {
			const Generator *genPtr = &(mkt.generators[it->first.generator]);

			snprintf(elemName, NAMESIZE, "bidCap(%s)(%d)", genPtr->name.c_str(), it->first.band);
			IloRange c(env, -IloInfinity, it->second, genPtr->bidAt(it->first.band), elemName);
			bidCap.add(c); rowNames.push_back(elemName);
		}
		model.add(bidCap);

		/* Nameplate capacities */
		for (int r = 0; r < mkt.numRegion; r++) {
			const Region *regPtr = &(mkt.regions[r]);

			for (unsigned int i = 0; i < regPtr->connectedGenerators.size(); i++) {
				const Generator *genPtr = &(mkt.generators[ regPtr->connectedGenerators[i] ]);

				IloExpr expr (env);
				for (int p = 0; p < mkt.numPriceLevel; p++) {
					map<DispatchKey, IloNumVar>::iterator it = dispatch.find( DispatchKey(r, genPtr->id, p) );
					if ( it != dispatch.end() ) expr += it->second;
				}

				snprintf(elemName, NAMESIZE, "nameplate(%s)", genPtr->name.c_str());
				IloRange c(env, -IloInfinity, expr, genPtr->nameplateCapacity, elemName);
				nameplateCap.add(c); rowNames.push_back(elemName);
				expr.end();
			}
		}
		model.add(nameplateCap);

		/* Regional balance: generation + imports - exports = demand */
		for (int r = 0; r < mkt.numRegion; r++) {
			const Region *regPtr = &(mkt.regions[r]);
			IloExpr expr (env);

			// production
			for (unsigned int i = 0; i < regPtr->connectedGenerators.size(); i++) {
				int g = regPtr->connectedGenerators[i];
				for (int p = 0; p < mkt.numPriceLevel; p++) {
					map<DispatchKey, IloNumVar>::iterator it = dispatch.find( DispatchKey(r, g, p) );
					if ( it != dispatch.end() ) expr += it->second;
				}
			}

			// in/out flow
			for (unsigned int i = 0; i < regPtr->importingInterconnectors.size(); i++)
				expr += flow[ regPtr->importingInterconnectors[i] ];
			for (unsigned int i = 0; i < regPtr->exportingInterconnectors.size(); i++)
				expr -= flow[ regPtr->exportingInterconnectors[i] ];

			snprintf(elemName, NAMESIZE, "balance(%s)", regPtr->name.c_str());
			IloRange c(env, demand[r], expr, demand[r], elemName);
			balance.add(c); rowNames.push_back(elemName);
			expr.end();
		}
		model.add(balance);

		/***** Objective function *****/
		IloExpr dispatchCost (env);
		for (map<DispatchKey, IloNumVar>::iterator it = dispatch.begin(); it != dispatch.end(); ++it)
			dispatchCost += mkt.priceLevels[it->first.band] * it->second;

		IloObjective obj = IloMinimize(env, dispatchCost, "dispatchCost");
		model.add(obj);
		dispatchCost.end();
	}
	catch (IloException &e) {
		string msg = e.getMessage();
		e.end();
		logStream << "Formulation of " << name << " failed: " << msg << endl;
		throw SolverError(msg);
	}

	state = BUILT;
	logStream << "Formulated " << name << ": " << dispatch.size() << " dispatch variables, "
			  << flow.getSize() << " flow variables, " << rowNames.size() << " constraints." << endl;

	if (param.writeModel)
		exportModel(param.outputDir + name + ".lp");
}//END formulate()

/****************************************************************************
 * solve
 * - Submits the model to CPLEX and records the solution, if it is optimal.
 * - Infeasible and unbounded models are returned as a status. Failures of
 * CPLEX itself are raised as SolverError.
 ****************************************************************************/
SolveStatus DispatchModel::solve() {
	if (state == EMPTY)
		throw logic_error("Model " + name + " must be formulated before it is solved.");
	if (state != BUILT)
		throw logic_error("Model " + name + " has already been submitted.");

	state = SUBMITTED;

	try {
		cplex.solve();

		solved.status = convertStatus( cplex.getStatus() );
		logStream << "Optimization is completed with status " << cplex.getCplexStatus() << endl;

		if (solved.status == OPTIMAL) {
			recordSolution();
		}
	}
	catch (IloException &e) {
		string msg = e.getMessage();
		e.end();
		logStream << "CPLEX failed to solve " << name << ": " << msg << endl;
		throw SolverError(msg);
	}

	if (solved.status != OPTIMAL && param.exportInfeasible)
		exportModel(param.outputDir + "infeasible_" + name + ".lp");

	state = SOLVED;
	return solved.status;
}//END solve()

void DispatchModel::recordSolution() {
	solved.objValue = cplex.getObjValue();

	// dispatch at each band
	for (map<DispatchKey, IloNumVar>::iterator it = dispatch.begin(); it != dispatch.end(); ++it)
		solved.dispatch[it->first] = cplex.getValue(it->second);

	// flows
	solved.flow.resize(mkt.numInterconnector);
	for (int l = 0; l < mkt.numInterconnector; l++)
		solved.flow[l] = cplex.getValue(flow[l]);

	// regional prices
	if (param.computePrices && mkt.numRegion > 0) {
		IloNumArray duals (env);
		cplex.getDuals(duals, balance);

		solved.balanceDuals.resize(mkt.numRegion);
		for (int r = 0; r < mkt.numRegion; r++)
			solved.balanceDuals[r] = duals[r];
		duals.end();
	}
}

/****************************************************************************
 * getResult
 * - Returns the domain level result of the last solve.
 ****************************************************************************/
MarketResult DispatchModel::getResult() const {
	if (state != SOLVED)
		throw logic_error("Model " + name + " has not been solved.");
	return aggregateResult(mkt, solved);
}

double DispatchModel::getObjValue() const {
	if (solved.status != OPTIMAL)
		throw logic_error("Model " + name + " has no optimal solution.");
	return solved.objValue;
}

/* Writes the model for inspection; a file that cannot be written is reported and does not affect the solve */
void DispatchModel::exportModel(string filename) {
	try {
		cplex.exportModel(filename.c_str());
		logStream << "Model written to " << filename << endl;
	}
	catch (IloException &e) {
		logStream << "Could not write " << filename << ": " << e.getMessage() << endl;
		e.end();
	}
}

MarketResult clearMarket(const Market &mkt, const runType &param, ostream &logStream) {
	DispatchModel dm (mkt, param, logStream);
	dm.formulate();
	dm.solve();
	return dm.getResult();
}

MarketResult clearMarket(const MarketTables &tables, const runType &param, ostream &logStream) {
	Market mkt;
	mkt.build(tables);
	return clearMarket(mkt, param, logStream);
}
