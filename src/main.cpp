//
//  main.cpp
//  nemClear
//

#include "misc.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "records.hpp"
#include "MarketReader.hpp"
#include "market/Market.hpp"

runType runParam;

void parseCmdLine(int argc, const char *argv[], string &inputDir, string &scenarioPath);

int setup_single(Market &mkt, runType &param);
int setup_scenarios(Market &mkt, string &scenarioPath, runType &param);

int main(int argc, const char * argv[]) {
	string inputDir, scenarioPath;

	parseCmdLine(argc, argv, inputDir, scenarioPath);

	/* Read the configuration file */
	readRunfile(inputDir + "runParameters.txt", runParam);

	/* Read the market */
	MarketTables tables;
	if ( !readMarketTables(inputDir, tables) ) {
		printf("Error: Market data could not be read.\n");
		return 1;
	}

	try {
		Market mkt;
		mkt.build(tables);
		printf("Market has been read successfully (%d regions, %d generators, %d price levels, %d interconnectors).\n",
			   mkt.numRegion, mkt.numGen, mkt.numPriceLevel, mkt.numInterconnector);

		int status;
		if ( scenarioPath.empty() )
			status = setup_single(mkt, runParam);
		else
			status = setup_scenarios(mkt, scenarioPath, runParam);

		if (status) {
			perror("Failed to complete the run.\n");
			return 1;
		}
	}
	catch (ValidationError &e) {
		cerr << "Input error: " << e.what() << endl;
		return 1;
	}
	catch (SolverError &e) {
		cerr << "Solver error: " << e.what() << endl;
		return 2;
	}

	return 0;
}

void parseCmdLine(int argc, const char *argv[], string &inputDir, string &scenarioPath)
{
	if (argc == 2 || argc == 3) {
		inputDir = argv[1];
		if ( inputDir[inputDir.size()-1] != '/' )
			inputDir += "/";
		if (argc == 3)
			scenarioPath = argv[2];
	}
	else {
		cout << "Missing inputs. Please provide the following in the given order:\n  (1) input directory path,\n  (2) optionally, a demand scenario file (scenario,region,demand)." << endl;
		exit(1);
	}
}//END parseCmdLine()
