#include <algorithm>
#include <iostream>
#include "algorithm_x.hpp"

AlgorithmX::AlgorithmX() : timeLimit(0), progressInterval(100000), verbose(true),
status(NOT_STARTED), timedOut(false), exploredNodes(0), backtracks(0), maxDepth(0), elapsedMillis(0) {
}

AlgorithmX::AlgorithmX(int timeLimit, long long progressInterval, bool verbose)
    : timeLimit(timeLimit), progressInterval(progressInterval), verbose(verbose),
    status(NOT_STARTED), timedOut(false), exploredNodes(0), backtracks(0), maxDepth(0), elapsedMillis(0) {
}

vector<int> AlgorithmX::run(const ExactCover& instance) {
    return run(instance.getRelation(), instance.getNumElements());
}

vector<int> AlgorithmX::run(const vector<vector<bool>>& relation, int numColumns) {
    initialize();

    View root;
    for (int i = 0; i < static_cast<int>(relation.size()); i++) root.rows.push_back(i);
    for (int j = 0; j < numColumns; j++) root.cols.push_back(j);

    if (verbose) {
        cout << "Starting Algorithm X for exact cover..." << endl;
        cout << "Parameters: rows=" << root.rows.size() << ", columns=" << root.cols.size()
            << ", timeLimit=" << timeLimit << endl;
    }

    startTime = chrono::high_resolution_clock::now();

    bool found = solve(relation, root, 0);

    auto endTime = chrono::high_resolution_clock::now();
    elapsedMillis = chrono::duration_cast<chrono::milliseconds>(endTime - startTime).count();

    if (timedOut) {
        // Partial paths are not covers
        solution.clear();
        status = TIME_LIMIT;
    }
    else if (found) {
        status = SOLVED;
    }
    else {
        status = NO_SOLUTION;
    }

    if (verbose) {
        cout << "Algorithm X finished: " << statusName(status) << endl;
        cout << "Selected rows: " << solution.size() << ", explored nodes: " << exploredNodes
            << ", backtracks: " << backtracks << ", max depth: " << maxDepth << endl;
    }

    return solution;
}

void AlgorithmX::initialize() {
    // Clear previous state
    solution.clear();
    status = NOT_STARTED;
    timedOut = false;
    exploredNodes = 0;
    backtracks = 0;
    maxDepth = 0;
    elapsedMillis = 0;
}

bool AlgorithmX::solve(const vector<vector<bool>>& relation, const View& view, int depth) {
    exploredNodes++;
    maxDepth = max(maxDepth, depth);
    reportProgress();

    // No columns left: every element is covered by the rows on the current path
    if (view.cols.empty()) {
        return true;
    }

    vector<int> colOrder = orderColumns(relation, view);

    // The least covered column cannot be covered at all
    if (countCovering(relation, view, colOrder[0]) == 0) {
        return false;
    }

    for (int c : colOrder) {
        for (int r : view.rows) {
            if (!relation[r][c]) continue;

            if (timeLimitReached()) {
                return false;
            }

            solution.push_back(r);

            View subView = reduce(relation, view, r);
            if (solve(relation, subView, depth + 1)) {
                return true;
            }

            solution.pop_back();
            backtracks++;

            if (timedOut) {
                return false;
            }
        }
    }

    return false;
}

vector<int> AlgorithmX::orderColumns(const vector<vector<bool>>& relation, const View& view) {
    vector<int> counts(view.cols.size(), 0);
    for (size_t k = 0; k < view.cols.size(); k++) {
        counts[k] = countCovering(relation, view, view.cols[k]);
    }

    vector<size_t> positions(view.cols.size());
    for (size_t k = 0; k < positions.size(); k++) positions[k] = k;

    // Ties keep the original column order
    stable_sort(positions.begin(), positions.end(),
        [&counts](size_t a, size_t b) { return counts[a] < counts[b]; });

    vector<int> order;
    order.reserve(positions.size());
    for (size_t k : positions) {
        order.push_back(view.cols[k]);
    }

    return order;
}

int AlgorithmX::countCovering(const vector<vector<bool>>& relation, const View& view, int col) {
    int count = 0;
    for (int r : view.rows) {
        if (relation[r][col]) {
            count++;
        }
    }
    return count;
}

AlgorithmX::View AlgorithmX::reduce(const vector<vector<bool>>& relation, const View& view, int row) {
    View subView;
    vector<int> removedCols;

    // Columns covered by the selected row are satisfied
    for (int c : view.cols) {
        if (relation[row][c]) {
            removedCols.push_back(c);
        }
        else {
            subView.cols.push_back(c);
        }
    }

    // Rows sharing a satisfied column would cover it twice
    for (int r : view.rows) {
        bool clashes = false;
        for (int c : removedCols) {
            if (relation[r][c]) {
                clashes = true;
                break;
            }
        }
        if (!clashes) {
            subView.rows.push_back(r);
        }
    }

    return subView;
}

bool AlgorithmX::timeLimitReached() {
    if (timedOut) return true;
    if (timeLimit <= 0) return false;

    auto currentTime = chrono::high_resolution_clock::now();
    auto elapsed = chrono::duration_cast<chrono::seconds>(currentTime - startTime).count();
    if (elapsed >= timeLimit) {
        timedOut = true;
        if (verbose) {
            cout << "Time limit reached!" << endl;
        }
    }

    return timedOut;
}

void AlgorithmX::reportProgress() const {
    if (!verbose || progressInterval <= 0 || exploredNodes % progressInterval != 0) {
        return;
    }

    cout << "Node " << exploredNodes << " - depth: " << solution.size()
        << ", backtracks: " << backtracks << endl;
}

string AlgorithmX::statusName(SearchStatus status) {
    switch (status) {
    case SOLVED:
        return "SOLVED";
    case NO_SOLUTION:
        return "NO_SOLUTION";
    case TIME_LIMIT:
        return "TIME_LIMIT";
    default:
        return "NOT_STARTED";
    }
}
