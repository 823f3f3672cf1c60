//
//  MarketReader.cpp
//  nemClear
//

#include <cctype>
#include <set>

#include "MarketReader.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "misc.hpp"

namespace {

/* A comma separated file with a header line, columns located by name */
class CsvTable {

public:
	bool read (const string &filepath, const vector<string> &requiredColumns);

	const string& field (int row, const string &column) const;
	bool number (int row, const string &column, double &value) const;

	int numRows () const { return (int) rows.size(); }

	string	name;

private:
	map<string, int>		columns;
	vector<vector<string> >	rows;
	vector<int>				lineNumbers;
};

bool CsvTable::read (const string &filepath, const vector<string> &requiredColumns) {
	ifstream input;
	string line;

	name = filepath;
	if ( !open_file(input, filepath) )
		return false;

	// read the headers
	safeGetline(input, line);
	vector<string> headers = splitString(line, delimiter);
	for (unsigned int c = 0; c < headers.size(); c++)
		columns[ trim(headers[c]) ] = c;

	for (unsigned int c = 0; c < requiredColumns.size(); c++) {
		if ( columns.find(requiredColumns[c]) == columns.end() ) {
			cerr << "Error: " << filepath << " has no column '" << requiredColumns[c] << "'." << endl;
			return false;
		}
	}

	// read the data
	int lineNumber = 1;
	while ( safeGetline(input, line) ) {
		lineNumber++;
		if ( trim(line).empty() )
			continue;

		vector<string> tokens = splitString(line, delimiter);
		if ( tokens.size() < headers.size() ) {
			cerr << "Error: " << filepath << " line " << lineNumber << " has " << tokens.size()
				 << " fields, expected " << headers.size() << "." << endl;
			return false;
		}
		for (unsigned int c = 0; c < tokens.size(); c++)
			tokens[c] = trim(tokens[c]);

		rows.push_back(tokens);
		lineNumbers.push_back(lineNumber);
	}
	input.close();

	return true;
}

const string& CsvTable::field (int row, const string &column) const {
	return rows[row][ columns.find(column)->second ];
}

bool CsvTable::number (int row, const string &column, double &value) const {
	if ( !parseDouble(field(row, column), value) ) {
		cerr << "Error: " << name << " line " << lineNumbers[row] << ": '" << field(row, column)
			 << "' is not a number (column " << column << ")." << endl;
		return false;
	}
	return true;
}

vector<string> columnList (const char *c1, const char *c2 = NULL, const char *c3 = NULL, const char *c4 = NULL) {
	vector<string> cols;
	cols.push_back(c1);
	if (c2) cols.push_back(c2);
	if (c3) cols.push_back(c3);
	if (c4) cols.push_back(c4);
	return cols;
}

}

bool readMarketTables (string inputDir, MarketTables &tables) {
	if ( !inputDir.empty() && inputDir[inputDir.size()-1] != '/' )
		inputDir += "/";

	MarketTables tmp;
	CsvTable table;

	/* regional demand */
	if ( !table.read(inputDir + "region_demand.csv", columnList("region", "demand")) )
		return false;
	for (int i = 0; i < table.numRows(); i++) {
		RegionDemandRecord rec;
		rec.region = table.field(i, "region");
		if ( !table.number(i, "demand", rec.demand) ) return false;
		tmp.regionDemand.push_back(rec);
	}

	/* generators */
	table = CsvTable();
	if ( !table.read(inputDir + "generators.csv", columnList("region", "generator_name", "nameplate_capacity")) )
		return false;
	for (int i = 0; i < table.numRows(); i++) {
		GeneratorRecord rec;
		rec.region = table.field(i, "region");
		rec.generatorName = table.field(i, "generator_name");
		if ( !table.number(i, "nameplate_capacity", rec.nameplateCapacity) ) return false;
		tmp.generators.push_back(rec);
	}

	/* price levels */
	table = CsvTable();
	if ( !table.read(inputDir + "pricelevel.csv", columnList("pricelevel")) )
		return false;
	for (int i = 0; i < table.numRows(); i++) {
		double price;
		if ( !table.number(i, "pricelevel", price) ) return false;
		tmp.priceLevels.push_back(price);
	}

	/* bids */
	table = CsvTable();
	if ( !table.read(inputDir + "bids.csv", columnList("generator_name", "pricelevel", "bid_capacity")) )
		return false;
	for (int i = 0; i < table.numRows(); i++) {
		BidRecord rec;
		rec.generatorName = table.field(i, "generator_name");
		if ( !table.number(i, "pricelevel", rec.priceLevel) ) return false;
		if ( !table.number(i, "bid_capacity", rec.bidCapacity) ) return false;
		tmp.bids.push_back(rec);
	}

	/* interconnectors (optional) */
	string icFile = inputDir + "interconnectors.csv";
	if ( file_exists(icFile) ) {
		table = CsvTable();
		if ( !table.read(icFile, columnList("interconnector_id", "region_start", "region_end", "interconnector_capacity")) )
			return false;
		for (int i = 0; i < table.numRows(); i++) {
			InterconnectorRecord rec;
			rec.interconnectorId = table.field(i, "interconnector_id");
			rec.regionStart = table.field(i, "region_start");
			rec.regionEnd = table.field(i, "region_end");
			if ( !table.number(i, "interconnector_capacity", rec.capacity) ) return false;
			tmp.interconnectors.push_back(rec);
		}
	}
	else {
		printf("> interconnectors.csv file not found (Optional).\n");
	}

	tables = tmp;
	return true;
}

static bool validScenarioName (const string &name) {
	if ( name.empty() || name == "." || name == ".." )
		return false;
	for (unsigned int i = 0; i < name.size(); i++) {
		unsigned char c = name[i];
		if ( !isalnum(c) && c != '_' && c != '-' && c != '.' )
			return false;
	}
	return true;
}

bool readScenarios (string filepath, const Market &mkt, vector<Scenario> &scenarios) {
	CsvTable table;
	if ( !table.read(filepath, columnList("scenario", "region", "demand")) )
		return false;

	vector<Scenario> tmp;
	map<string, int> mapScenarioNameToIndex;
	set< pair<string, int> > seen;

	for (int i = 0; i < table.numRows(); i++) {
		const string &name = table.field(i, "scenario");
		const string &regionName = table.field(i, "region");

		double demand;
		if ( !table.number(i, "demand", demand) )
			return false;

		// the name becomes part of the log and result file names
		if ( !validScenarioName(name) )
			throw ValidationError("Invalid scenario name \"" + name + "\", use letters, digits, '_', '-' or '.'");

		int r = mkt.findRegion(regionName);
		if ( r < 0 )
			throw ValidationError("Scenario " + name + " references unknown region " + regionName);
		if ( demand < 0 )
			throw ValidationError("Negative demand in scenario " + name + " for region " + regionName);
		if ( !seen.insert( make_pair(name, r) ).second )
			throw ValidationError("Duplicate demand in scenario " + name + " for region " + regionName);

		map<string, int>::iterator it = mapScenarioNameToIndex.find(name);
		if ( it == mapScenarioNameToIndex.end() ) {
			Scenario scen;
			scen.name = name;
			scen.demand = mkt.baseDemand();
			it = mapScenarioNameToIndex.insert( pair<string, int> (name, (int) tmp.size()) ).first;
			tmp.push_back(scen);
		}
		tmp[it->second].demand[r] = demand;
	}

	scenarios = tmp;
	return true;
}
