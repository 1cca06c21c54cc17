#ifndef EXACT_COVER_HPP
#define EXACT_COVER_HPP

#include <string>
#include <vector>

using namespace std;

// Exact cover instance: rows are candidate subsets, columns are universe elements.
// Row and column indices are 0-based; set files and getSet() use 1-based element numbers.
class ExactCover {
public:
    string path;
    int m = 0; // Number of sets (rows)
    int n = 0; // Number of elements (columns)
    vector<vector<bool>> relation; // relation[i][j] is true if set i contains element j
    vector<vector<int>> sets;      // Elements of each set, 1-based

    ExactCover(string path);
    ExactCover(const vector<vector<bool>>& relation);
    ExactCover(int numElements, const vector<vector<int>>& sets);

    bool isExactCover(const vector<int>& solution) const;
    vector<int> countCoverage(const vector<int>& solution) const;
    void printProblem() const;

    int getNumSets() const;
    int getNumElements() const;
    const vector<vector<bool>>& getRelation() const;
    // index is 0-based and unchecked; the returned elements are 1-based
    const vector<int>& getSet(int index) const;

    // row and col are 0-based and unchecked
    bool covers(int row, int col) const { return relation[row][col]; }

private:
    void readFile();
    void buildRelation();
};

#endif
