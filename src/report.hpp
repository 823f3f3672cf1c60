//
//  report.hpp
//  nemClear
//

#ifndef report_hpp
#define report_hpp

#include <ostream>
#include <string>

#include "solution.hpp"
#include "market/Market.hpp"

using namespace std;

void printResult (ostream &out, const Market &mkt, const MarketResult &result);

/* Writes dispatch.csv, flows.csv, prices.csv and summary.csv into dir, each name preceded by prefix.
 * Only summary.csv is written when there is no solution. */
bool writeResult (string dir, const Market &mkt, const MarketResult &result, string prefix = "");

#endif /* report_hpp */
