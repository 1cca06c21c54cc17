#include "report.hpp"
#include <filesystem>
#include <sstream>

string logFileName(const string& logDir, const string& instName) {
    return (filesystem::path(logDir) / (instName + ".log")).string();
}

string formatSolution(const vector<int>& solution) {
    ostringstream out;
    for (size_t i = 0; i < solution.size(); i++) {
        if (i > 0) out << " ";
        out << (solution[i] + 1);
    }
    return out.str();
}
