#ifndef ALGORITHM_X_HPP
#define ALGORITHM_X_HPP

#include "../exact-cover/exact_cover.hpp"
#include <vector>
#include <string>
#include <chrono>

using namespace std;

// Knuth's Algorithm X over a dense boolean relation.
// Stops at the first exact cover found; returned row indices are 0-based.
class AlgorithmX {
public:
    enum SearchStatus {
        NOT_STARTED,
        SOLVED,
        NO_SOLUTION,
        TIME_LIMIT
    };

    // Live rows and columns of the relation at one recursion level,
    // both stored as original indices in original order.
    struct View {
        vector<int> rows;
        vector<int> cols;
    };

private:
    // Algorithm parameters
    int timeLimit;                     // Time limit in seconds, 0 = unlimited
    long long progressInterval;        // Explored nodes between progress lines, 0 = off
    bool verbose;

    // Algorithm state
    vector<int> solution;              // Original row indices of the current path
    SearchStatus status;
    bool timedOut;
    chrono::high_resolution_clock::time_point startTime;

    // Counters
    long long exploredNodes;
    long long backtracks;
    int maxDepth;
    long long elapsedMillis;

public:
    AlgorithmX();
    AlgorithmX(int timeLimit, long long progressInterval = 100000, bool verbose = true);

    // Main methods
    vector<int> run(const ExactCover& instance);
    vector<int> run(const vector<vector<bool>>& relation, int numColumns);

    // Configuration setters
    void setTimeLimit(int timeLimit) { this->timeLimit = timeLimit; }
    void setProgressInterval(long long interval) { progressInterval = interval; }
    void setVerbose(bool verbose) { this->verbose = verbose; }

    // Getters
    int getTimeLimit() const { return timeLimit; }
    long long getProgressInterval() const { return progressInterval; }
    bool isVerbose() const { return verbose; }
    SearchStatus getStatus() const { return status; }
    bool hasSolution() const { return status == SOLVED; }
    const vector<int>& getSolution() const { return solution; }
    long long getExploredNodes() const { return exploredNodes; }
    long long getBacktracks() const { return backtracks; }
    int getMaxDepth() const { return maxDepth; }
    long long getElapsedMillis() const { return elapsedMillis; }

    static string statusName(SearchStatus status);

    // Search helpers, exposed for inspection of a single level
    static vector<int> orderColumns(const vector<vector<bool>>& relation, const View& view);
    static int countCovering(const vector<vector<bool>>& relation, const View& view, int col);
    static View reduce(const vector<vector<bool>>& relation, const View& view, int row);

private:
    void initialize();
    bool solve(const vector<vector<bool>>& relation, const View& view, int depth);
    bool timeLimitReached();
    void reportProgress() const;
};

#endif
