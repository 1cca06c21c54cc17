#ifndef REPORT_HPP
#define REPORT_HPP

#include <string>
#include <vector>

using namespace std;

// Log path for an instance file. The full file name is kept so that
// a.txt and a.dat in one directory do not share a log.
string logFileName(const string& logDir, const string& instName);

// Rows are printed 1-based, matching the S1..Sm numbering of instance files
string formatSolution(const vector<int>& solution);

#endif
