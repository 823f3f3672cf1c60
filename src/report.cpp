//
//  report.cpp
//  nemClear
//

#include "report.hpp"
#include "config.hpp"
#include "misc.hpp"

void printResult (ostream &out, const Market &mkt, const MarketResult &result) {
	ios::fmtflags flags = out.flags();
	streamsize precision = out.precision();

	out << "Status: " << statusName(result.status) << endl;

	if ( !result.hasSolution() ) {
		out << "No dispatch solution available." << endl;
		return;
	}

	out << "Total Cost: $" << formatThousands(result.totalCost, 2) << endl;

	out << endl << "Dispatch Schedule:" << endl;
	for (int r = 0; r < mkt.numRegion; r++) {
		const Region &region = mkt.regions[r];
		out << endl << "Region " << region.name << ":" << endl;

		map<string, map<string, double> >::const_iterator regIt = result.dispatch.find(region.name);
		for (unsigned int i = 0; i < region.connectedGenerators.size(); i++) {
			const string &genName = mkt.generators[ region.connectedGenerators[i] ].name;
			double value = regIt->second.find(genName)->second;
			out << genName << ": " << fixed << setprecision(2) << value << " MW" << endl;
		}
	}

	if (mkt.numInterconnector > 0)
		out << endl;
	for (int l = 0; l < mkt.numInterconnector; l++) {
		const Interconnector &ic = mkt.interconnectors[l];
		out << "Interconnector Flow (" << mkt.regions[ic.regionStart].name << " to " << mkt.regions[ic.regionEnd].name << "): "
			<< fixed << setprecision(2) << result.interconnectorFlow.find(ic.name)->second << " MW" << endl;
	}

	if ( !result.regionalPrice.empty() ) {
		out << endl << "Regional Prices:" << endl;
		for (int r = 0; r < mkt.numRegion; r++) {
			out << mkt.regions[r].name << ": $" << fixed << setprecision(2)
				<< result.regionalPrice.find(mkt.regions[r].name)->second << " /MW" << endl;
		}
	}
	out.flags(flags);
	out.precision(precision);
}

bool writeResult (string dir, const Market &mkt, const MarketResult &result, string prefix) {
	ofstream output;

	if ( !dir.empty() && dir[dir.size()-1] != '/' )
		dir += "/";

	/* summary */
	if ( !open_file(output, dir + prefix + "summary.csv") )
		return false;
	output << "status" << delimiter << "total_cost" << endl;
	output << statusName(result.status) << delimiter;
	if ( result.hasSolution() )
		output << setprecision(6) << fixed << result.totalCost;
	output << endl;
	output.close();

	if ( !result.hasSolution() )
		return true;

	/* dispatch at each price level */
	if ( !open_file(output, dir + prefix + "dispatch.csv") )
		return false;
	output << "region" << delimiter << "generator" << delimiter << "pricelevel" << delimiter << "dispatch" << endl;
	for (int g = 0; g < mkt.numGen; g++) {
		const Generator &gen = mkt.generators[g];
		const map<double, double> &bands = result.bandDispatch.find(gen.name)->second;

		for (int p = 0; p < mkt.numPriceLevel; p++) {
			output << gen.regionName << delimiter << gen.name << delimiter << mkt.priceLevels[p] << delimiter
				   << setprecision(6) << fixed << bands.find(mkt.priceLevels[p])->second << endl;
			output.unsetf(ios::floatfield);
		}
	}
	output.close();

	/* interconnector flows */
	if ( !open_file(output, dir + prefix + "flows.csv") )
		return false;
	output << "interconnector" << delimiter << "region_start" << delimiter << "region_end" << delimiter << "flow" << endl;
	for (int l = 0; l < mkt.numInterconnector; l++) {
		const Interconnector &ic = mkt.interconnectors[l];
		output << ic.name << delimiter << mkt.regions[ic.regionStart].name << delimiter << mkt.regions[ic.regionEnd].name << delimiter
			   << setprecision(6) << fixed << result.interconnectorFlow.find(ic.name)->second << endl;
	}
	output.close();

	/* regional prices */
	if ( !result.regionalPrice.empty() ) {
		if ( !open_file(output, dir + prefix + "prices.csv") )
			return false;
		output << "region" << delimiter << "price" << endl;
		for (map<string, double>::const_iterator it = result.regionalPrice.begin(); it != result.regionalPrice.end(); ++it)
			output << it->first << delimiter << setprecision(6) << fixed << it->second << endl;
		output.close();
	}

	return true;
}
