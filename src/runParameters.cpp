//
//  runParameters.cpp
//  nemClear
//

#include "config.hpp"
#include "misc.hpp"

void setDefaultRunParam (runType &param) {
	param.outputDir = "./";

	param.cplexThreads = defaultSolverThreads;
	param.numThreads = defaultBatchThreads;

	param.optimalityTol = 1e-6;
	param.feasibilityTol = 1e-6;
	param.timeLimit = 0;

	param.computePrices = true;
	param.writeModel = false;
	param.exportInfeasible = true;
}

/****************************************************************************
 * readRunfile
 * - Sets the default values and overwrites them with the "key value" lines
 * of the run file. Returns false if the file could not be opened, in which
 * case the defaults are kept.
 ****************************************************************************/
bool readRunfile (string filepath, runType &param) {
	ifstream fptr;
	string	 line, field1, field2;

	setDefaultRunParam(param);

	fptr.open( filepath.c_str() );
	if ( fptr.fail() ) {
		perror("Failed to read the run parameters, using the default parameters.\n");
		return false;
	}

	while ( safeGetline(fptr, line) ) {
		istringstream iss(line);
		if ( !(iss >> field1 >> field2) || field1[0] == '#' )
			continue;

		double temp = (double) atof(field2.c_str());

		if ( field1 == "outputDir" ) {
			param.outputDir = field2;
			if ( param.outputDir[param.outputDir.size()-1] != '/' )
				param.outputDir += "/";
		}
		else if ( field1 == "cplexThreads" )
			param.cplexThreads = max(1, (int) temp);
		else if ( field1 == "numThreads" )
			param.numThreads = max(1, (int) temp);
		else if ( field1 == "optimalityTol" )
			param.optimalityTol = temp;
		else if ( field1 == "feasibilityTol" )
			param.feasibilityTol = temp;
		else if ( field1 == "timeLimit" )
			param.timeLimit = temp;
		else if ( field1 == "computePrices" )
			param.computePrices = temp;
		else if ( field1 == "writeModel" )
			param.writeModel = temp;
		else if ( field1 == "exportInfeasible" )
			param.exportInfeasible = temp;
		else {
			perror( ("Warning:: Unidentified run parameter in the file: " + field1 + "\n").c_str() );
		}
	}
	fptr.close();

	/* Print configuration summary */
	cout << "------------------------------------------------------------------" << endl;
	cout << "Output directory      : " << param.outputDir << endl;
	cout << "CPLEX threads         : " << param.cplexThreads << endl;
	cout << "Scenario threads      : " << param.numThreads << endl;
	cout << "Tolerances (opt/feas) : " << scientific << setprecision(1) << param.optimalityTol << " / " << param.feasibilityTol << endl;
	cout.unsetf(ios::floatfield);
	if (param.timeLimit > 0) cout << "Time limit            : " << param.timeLimit << " sec" << endl;
	if (param.computePrices) cout << "Regional prices are computed from the balance duals." << endl;
	cout << "------------------------------------------------------------------" << endl;

	return true;
}//END readRunfile()
