#include "exact_cover.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

ExactCover::ExactCover(string path) : path(path) {
    readFile();
}

ExactCover::ExactCover(const vector<vector<bool>>& relation) : path(""), relation(relation) {
    this->m = static_cast<int>(relation.size());
    this->n = this->m > 0 ? static_cast<int>(relation[0].size()) : 0;

    this->sets.assign(this->m, {});
    for (int i = 0; i < this->m; i++) {
        if (static_cast<int>(relation[i].size()) != this->n) {
            throw runtime_error("Ragged relation: row " + to_string(i + 1) + " has "
                + to_string(relation[i].size()) + " columns, expected " + to_string(this->n));
        }
        for (int j = 0; j < this->n; j++) {
            if (relation[i][j]) {
                this->sets[i].push_back(j + 1);
            }
        }
    }
}

ExactCover::ExactCover(int numElements, const vector<vector<int>>& sets)
    : path(""), m(static_cast<int>(sets.size())), n(numElements), sets(sets) {
    if (numElements < 0) {
        throw runtime_error("Negative number of elements: " + to_string(numElements));
    }
    buildRelation();
}

void ExactCover::readFile() {
    ifstream file(path);
    string line;

    if (!file.is_open()) {
        throw runtime_error("Error opening file: " + path);
    }

    // 1. Read number of sets and number of elements
    if (!getline(file, line)) {
        throw runtime_error("Error: empty instance file " + path);
    }
    stringstream header(line);
    if (!(header >> this->m >> this->n) || this->m < 0 || this->n < 0) {
        throw runtime_error("Error: invalid header in " + path + " (expected \"<sets> <elements>\")");
    }
    if (!(header >> ws).eof()) {
        throw runtime_error("Error: invalid token in header of " + path);
    }

    this->sets.assign(this->m, {});

    // 2. Read set sizes
    vector<int> sizes(this->m, 0);
    if (this->m > 0) {
        if (!getline(file, line)) {
            throw runtime_error("Error: missing set sizes in " + path);
        }
        stringstream ss(line);
        for (int i = 0; i < this->m; i++) {
            if (!(ss >> sizes[i])) {
                throw runtime_error("Error: expected " + to_string(this->m) + " set sizes in " + path);
            }
        }
        if (!(ss >> ws).eof()) {
            throw runtime_error("Error: invalid token in set sizes of " + path);
        }
    }

    // 3. Read sets S1, S2, ..., Sm (an empty set is an empty line)
    for (int i = 0; i < this->m; i++) {
        if (!getline(file, line)) {
            line.clear();
        }
        stringstream ss(line);
        int elem;
        while (ss >> elem) {
            this->sets[i].push_back(elem);
        }
        // Extraction stops early on anything that is not an integer
        if (!ss.eof()) {
            throw runtime_error("Error: invalid token in S" + to_string(i + 1) + " of " + path);
        }
        // Verify if the read size matches the expected size
        if (static_cast<int>(this->sets[i].size()) != sizes[i]) {
            throw runtime_error("Error: size of S" + to_string(i + 1) + " in " + path
                + " differs from specified (" + to_string(sizes[i]) + ", "
                + to_string(this->sets[i].size()) + ")");
        }
    }

    file.close();

    buildRelation();
}

void ExactCover::buildRelation() {
    this->relation.assign(this->m, vector<bool>(this->n, false));

    for (int i = 0; i < this->m; i++) {
        for (int elem : this->sets[i]) {
            if (elem < 1 || elem > this->n) {
                throw runtime_error("Error: S" + to_string(i + 1) + " contains element " + to_string(elem)
                    + " outside the universe 1.." + to_string(this->n));
            }
            if (this->relation[i][elem - 1]) {
                throw runtime_error("Error: S" + to_string(i + 1) + " contains element "
                    + to_string(elem) + " twice");
            }
            this->relation[i][elem - 1] = true;
        }
    }
}

vector<int> ExactCover::countCoverage(const vector<int>& solution) const {
    vector<int> coverage(this->n, 0);

    for (int row : solution) {
        if (row < 0 || row >= this->m) continue;
        for (int j = 0; j < this->n; j++) {
            if (this->relation[row][j]) {
                coverage[j]++;
            }
        }
    }

    return coverage;
}

bool ExactCover::isExactCover(const vector<int>& solution) const {
    vector<bool> used(this->m, false);
    for (int row : solution) {
        if (row < 0 || row >= this->m || used[row]) {
            return false;
        }
        used[row] = true;
    }

    // Every element must be covered by exactly one selected set
    for (int count : countCoverage(solution)) {
        if (count != 1) {
            return false;
        }
    }

    return true;
}

int ExactCover::getNumSets() const { return m; }

int ExactCover::getNumElements() const { return n; }

const vector<vector<bool>>& ExactCover::getRelation() const { return relation; }

const vector<int>& ExactCover::getSet(int index) const { return sets[index]; }

void ExactCover::printProblem() const {
    cout << "Number of sets (m): " << this->m << endl;
    cout << "Number of elements (n): " << this->n << endl;
    cout << "Sets:" << endl;
    for (int i = 0; i < this->m; i++) {
        cout << "S" << (i + 1) << ":";
        for (int elem : this->sets[i]) {
            cout << " " << elem;
        }
        cout << endl;
    }
}
