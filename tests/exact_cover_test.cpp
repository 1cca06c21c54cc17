#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include "../src/exact-cover/exact_cover.hpp"

namespace {

string writeInstance(const string& name, const string& contents) {
    filesystem::path file = filesystem::temp_directory_path() / ("exact_cover_test_" + name + ".txt");
    ofstream out(file);
    out << contents;
    return file.string();
}

}  // namespace

TEST(ExactCoverTest, BuildsRelationFromSets) {
    ExactCover instance(4, {{1, 3}, {2}, {}});

    EXPECT_EQ(instance.getNumSets(), 3);
    EXPECT_EQ(instance.getNumElements(), 4);
    EXPECT_EQ(instance.getRelation()[0], (vector<bool>{true, false, true, false}));
    EXPECT_EQ(instance.getRelation()[1], (vector<bool>{false, true, false, false}));
    EXPECT_EQ(instance.getRelation()[2], (vector<bool>(4, false)));
    EXPECT_TRUE(instance.covers(0, 2));
    EXPECT_FALSE(instance.covers(1, 2));
}

TEST(ExactCoverTest, BuildsSetsFromRelation) {
    vector<vector<bool>> relation = {
        {true, false, true},
        {false, false, false}
    };
    ExactCover instance(relation);

    EXPECT_EQ(instance.getNumSets(), 2);
    EXPECT_EQ(instance.getNumElements(), 3);
    EXPECT_EQ(instance.getSet(0), (vector<int>{1, 3}));
    EXPECT_TRUE(instance.getSet(1).empty());
}

TEST(ExactCoverTest, RejectsRaggedRelation) {
    vector<vector<bool>> relation = {
        {true, false, true},
        {false, true}
    };

    EXPECT_THROW(ExactCover instance(relation), runtime_error);
}

TEST(ExactCoverTest, RejectsElementOutsideUniverse) {
    EXPECT_THROW(ExactCover(3, {{1, 4}}), runtime_error);
    EXPECT_THROW(ExactCover(3, {{0}}), runtime_error);
}

TEST(ExactCoverTest, RejectsDuplicateElementInSet) {
    EXPECT_THROW(ExactCover(3, {{2, 2}}), runtime_error);
}

TEST(ExactCoverTest, ReadsInstanceFile) {
    string path = writeInstance("knuth",
        "6 7\n"
        "3 2 3 3 4 2\n"
        "1 4 7\n"
        "1 4\n"
        "4 5 7\n"
        "3 5 6\n"
        "2 3 6 7\n"
        "2 7\n");

    ExactCover instance(path);

    EXPECT_EQ(instance.getNumSets(), 6);
    EXPECT_EQ(instance.getNumElements(), 7);
    EXPECT_EQ(instance.getSet(4), (vector<int>{2, 3, 6, 7}));
    EXPECT_TRUE(instance.covers(0, 6));
    EXPECT_TRUE(instance.isExactCover({1, 3, 5}));

    filesystem::remove(path);
}

TEST(ExactCoverTest, ReadsEmptySetLinesAndEmptyInstances) {
    string withEmptySet = writeInstance("empty_set", "2 2\n0 2\n\n1 2\n");
    string noSets = writeInstance("no_sets", "0 4\n");

    ExactCover first(withEmptySet);
    ExactCover second(noSets);

    EXPECT_TRUE(first.getSet(0).empty());
    EXPECT_EQ(first.getSet(1), (vector<int>{1, 2}));
    EXPECT_EQ(second.getNumSets(), 0);
    EXPECT_EQ(second.getNumElements(), 4);

    filesystem::remove(withEmptySet);
    filesystem::remove(noSets);
}

TEST(ExactCoverTest, RejectsMalformedFiles) {
    string sizeMismatch = writeInstance("size_mismatch", "1 3\n2\n1 2 3\n");
    string badHeader = writeInstance("bad_header", "three sets\n");
    string empty = writeInstance("empty", "");

    EXPECT_THROW(ExactCover instance(sizeMismatch), runtime_error);
    EXPECT_THROW(ExactCover instance(badHeader), runtime_error);
    EXPECT_THROW(ExactCover instance(empty), runtime_error);
    EXPECT_THROW(ExactCover instance(string("/nonexistent/exact_cover.txt")), runtime_error);

    filesystem::remove(sizeMismatch);
    filesystem::remove(badHeader);
    filesystem::remove(empty);
}

TEST(ExactCoverTest, RejectsNonIntegerTokens) {
    string setToken = writeInstance("set_token", "1 3\n2\n1 2 x\n");
    string headerToken = writeInstance("header_token", "1 3 7 junk\n3\n1 2 3\n");
    string sizesToken = writeInstance("sizes_token", "1 3\n3 9\n1 2 3\n");

    EXPECT_THROW(ExactCover instance(setToken), runtime_error);
    EXPECT_THROW(ExactCover instance(headerToken), runtime_error);
    EXPECT_THROW(ExactCover instance(sizesToken), runtime_error);

    filesystem::remove(setToken);
    filesystem::remove(headerToken);
    filesystem::remove(sizesToken);
}

TEST(ExactCoverTest, AcceptsTrailingWhitespace) {
    string path = writeInstance("trailing_space", "2 3 \n2 1  \n1 2 \n3\t\n");

    ExactCover instance(path);

    EXPECT_EQ(instance.getSet(0), (vector<int>{1, 2}));
    EXPECT_EQ(instance.getSet(1), (vector<int>{3}));

    filesystem::remove(path);
}

TEST(ExactCoverTest, ChecksExactCovers) {
    ExactCover instance(4, {{1, 2}, {3, 4}, {2, 3}, {4}, {1}});

    EXPECT_TRUE(instance.isExactCover({0, 1}));
    EXPECT_TRUE(instance.isExactCover({4, 2, 3}));
    EXPECT_FALSE(instance.isExactCover({0, 2, 3}));  // element 2 twice
    EXPECT_FALSE(instance.isExactCover({0}));        // 3 and 4 missing
    EXPECT_FALSE(instance.isExactCover({0, 1, 1}));  // repeated set
    EXPECT_FALSE(instance.isExactCover({0, 5}));     // no such set
    EXPECT_FALSE(instance.isExactCover({}));
}

TEST(ExactCoverTest, EmptyUniverseIsCoveredByNothing) {
    ExactCover instance(0, {{}, {}});

    EXPECT_TRUE(instance.isExactCover({}));
}

TEST(ExactCoverTest, CountsCoverage) {
    ExactCover instance(4, {{1, 2}, {2, 3}, {4}});

    EXPECT_EQ(instance.countCoverage({0, 1}), (vector<int>{1, 2, 1, 0}));
    EXPECT_EQ(instance.countCoverage({}), (vector<int>(4, 0)));
}

TEST(ExactCoverTest, PrintsSetsOneBased) {
    ExactCover instance(3, {{1, 3}, {}});

    testing::internal::CaptureStdout();
    instance.printProblem();
    string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Number of sets (m): 2"), string::npos);
    EXPECT_NE(output.find("S1: 1 3"), string::npos);
    EXPECT_NE(output.find("S2:\n"), string::npos);
}
