/*
 * setup.cpp
 *
 * Runs of the market clearing: a single market, or a batch of demand
 * scenarios of the same market.
 *
 */

#include "misc.hpp"
#include "errors.hpp"
#include "DispatchModel.hpp"
#include "ScenarioBatch.hpp"
#include "MarketReader.hpp"
#include "report.hpp"

/* Clears the market with the demand it was read with */
int setup_single(Market &mkt, runType &param) {
	double begin_t;

	/* logging */
	ofstream timeLog, solverLog;
	open_file(timeLog, param.outputDir + "time.log");
	if ( !open_file(solverLog, param.outputDir + "solver.log") )
		return 1;

	cout << "------------------------------------------------------------------" << endl;
	cout << "-------------------------- Market Clearing -----------------------" << endl;
	cout << "------------------------------------------------------------------" << endl;
	solverLog << "Run started at " << getCurrentDateTime() << endl;

	begin_t = get_wall_time();

	printf("Market clearing: ");
	fflush(stdout);

	DispatchModel dm (mkt, param, solverLog);
	dm.formulate();

	SolveStatus status = dm.solve();
	if (status == OPTIMAL)	printf("Success (Obj= %.2f).\n", dm.getObjValue());
	else					printf("%s.\n", statusName(status).c_str());
	fflush(stdout);

	timeLog << get_wall_time() - begin_t << endl;

	MarketResult result = dm.getResult();

	cout << "------------------------------------------------------------------" << endl;
	printResult(cout, mkt, result);
	cout << "------------------------------------------------------------------" << endl;

	if ( !writeResult(param.outputDir, mkt, result) )
		perror("Failed to write the result files.\n");

	solverLog.close();
	timeLog.close();

	return 0;
}

/* Clears the market under each demand scenario of the file */
int setup_scenarios(Market &mkt, string &scenarioPath, runType &param) {
	vector<Scenario> scenarios;
	if ( !readScenarios(scenarioPath, mkt, scenarios) )
		return 1;

	ofstream timeLog;
	open_file(timeLog, param.outputDir + "time.log");

	cout << "------------------------------------------------------------------" << endl;
	cout << "------------------ Market Clearing / Scenario Batch --------------" << endl;
	cout << "------------------------------------------------------------------" << endl;
	printf("%d scenarios on %d threads.\n", (int) scenarios.size(), min(param.numThreads, max(1, (int) scenarios.size())));

	double begin_t = get_wall_time();

	ScenarioBatch batch (mkt, scenarios, param);
	batch.solve();

	for (int s = 0; s < batch.numScenarios(); s++) {
		const MarketResult &result = batch.getResult(s);

		printf("%-20s: %-11s", batch.getScenario(s).name.c_str(), statusName(result.status).c_str());
		if ( result.hasSolution() ) printf(" (Obj= %.2f)", result.totalCost);
		printf(" [%.3f sec]\n", batch.getSolveTime(s));

		if ( !writeResult(param.outputDir, mkt, result, batch.getScenario(s).name + "_") )
			perror("Failed to write the result files.\n");

		timeLog << batch.getScenario(s).name << delimiter << batch.getSolveTime(s) << endl;
	}
	timeLog << "total" << delimiter << get_wall_time() - begin_t << endl;
	cout << "------------------------------------------------------------------" << endl;

	timeLog.close();

	return 0;
}
