//
//  ScenarioBatch.cpp
//  nemClear
//

#include <boost/asio.hpp>
#include <boost/bind.hpp>
#include <boost/thread/thread.hpp>

#include "ScenarioBatch.hpp"
#include "DispatchModel.hpp"
#include "misc.hpp"

ScenarioBatch::ScenarioBatch (const Market &mkt, const vector<Scenario> &scenarios, const runType &param)
	: mkt(mkt), scenarios(scenarios), param(param) {}

void ScenarioBatch::solve () {
	int numScen = (int) scenarios.size();

	results.assign(numScen, MarketResult());
	errors.assign(numScen, exception_ptr());
	solveTimes.assign(numScen, 0.0);

	int numThreads = max(1, min(param.numThreads, numScen));

	/***** Parallel programming stuff (START) *****/
	boost::asio::io_service io_service;
	boost::thread_group threads;
	{
		boost::asio::io_service::work work(io_service);	// keeps run() from exiting before the scenarios are posted

		for (int k = 0; k < numThreads; k++)
			threads.create_thread( boost::bind(&boost::asio::io_service::run, &io_service) );

		// solve scenarios
		for (int s = 0; s < numScen; s++)
			io_service.post( boost::bind(&ScenarioBatch::solveOneScenario, this, s) );
	}	// work is released here, run() returns once the queue is empty
	threads.join_all();
	/***** Parallel programming stuff (END)   *****/

	for (int s = 0; s < numScen; s++) {
		if (errors[s])
			rethrow_exception(errors[s]);
	}
}

/****************************************************************************
 * solveOneScenario
 * - Runs on a worker thread. Writes only to the slots of scenario s.
 ****************************************************************************/
void ScenarioBatch::solveOneScenario (int s) {
	const Scenario &scen = scenarios[s];
	double begin_t = get_wall_time();

	try {
		ofstream solverLog;
		if ( !open_file(solverLog, param.outputDir + "solver_" + scen.name + ".log") )
			solverLog.setstate(ios::badbit);	// no log file, solve silently

		DispatchModel dm (mkt, scen.demand, param, solverLog, scen.name);
		dm.formulate();
		dm.solve();
		results[s] = dm.getResult();
	}
	catch (...) {
		errors[s] = current_exception();
	}

	solveTimes[s] = get_wall_time() - begin_t;
}
