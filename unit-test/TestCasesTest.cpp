#include <algorithm>
#include <fstream>
#include "gtest/gtest.h"
#include "server/test_cases.hpp"
#include "test/environment.hpp"

using namespace std;
using namespace sortbot;
using namespace sortbot::server;
using namespace sortbot::test;
namespace fs = std::filesystem;

static fs::path write_input(const string &name, const string &content) {
    fs::path path = test_run_dir() / name;
    ofstream fout(path);
    fout << content;
    return path;
}

TEST(TestCasesTest, SampleBattery) {
    auto cases = sample_test_cases();
    ASSERT_EQ(cases.size(), 10u);
    for (size_t i = 0; i < cases.size(); ++i) {
        EXPECT_EQ(cases[i].id, (int)i + 1);
        EXPECT_TRUE(is_sorted(cases[i].expected.begin(), cases[i].expected.end()));
        EXPECT_TRUE(is_permutation(cases[i].data.begin(), cases[i].data.end(), cases[i].expected.begin(), cases[i].expected.end()));
    }

    EXPECT_EQ(cases[0].name, "Small Sorted Array");
    EXPECT_EQ(cases[0].data.size(), 100u);
    EXPECT_EQ(cases[1].data.front(), 100);
    EXPECT_EQ(cases[1].data.back(), 1);
    EXPECT_EQ(cases[2].data.size(), 20u);
    EXPECT_EQ(cases[3].size_category, "medium");
    EXPECT_EQ(cases[4].data.size(), 1000u);
    EXPECT_TRUE(cases[6].data.empty());
    EXPECT_EQ(cases[9].data.size(), 15u);
    EXPECT_EQ(cases[9].difficulty, "random");
}

TEST(TestCasesTest, ParseInputFile) {
    fs::path path = write_input("arrays.txt", "1, 2, 3\n\n  -5,10  \n42\n");
    auto arrays = parse_input_file(path);
    ASSERT_EQ(arrays.size(), 3u);
    EXPECT_EQ(arrays[0], vector<int64_t>({1, 2, 3}));
    EXPECT_EQ(arrays[1], vector<int64_t>({-5, 10}));
    EXPECT_EQ(arrays[2], vector<int64_t>({42}));
}

TEST(TestCasesTest, MissingFileIsEmpty) {
    EXPECT_TRUE(parse_input_file(test_run_dir() / "does-not-exist.txt").empty());
    EXPECT_TRUE(load_test_cases(test_run_dir() / "does-not-exist.txt").empty());
}

TEST(TestCasesTest, MalformedFileIsEmpty) {
    fs::path path = write_input("malformed.txt", "1,2,3\n4,five,6\n");
    EXPECT_TRUE(parse_input_file(path).empty());
}

TEST(TestCasesTest, LoadTestCasesDifficulty) {
    fs::path path = write_input("battery.txt",
                                "3,1,2\n"   // 第一个数组无序时默认为 best_case
                                "1,3,2\n"   // 第二个数组无序时默认为 worst_case
                                "1,2,3\n"
                                "9,5,1\n"
                                "4,1,3\n");
    auto cases = load_test_cases(path, "medium");
    ASSERT_EQ(cases.size(), 5u);

    EXPECT_EQ(cases[0].difficulty, "best_case");
    EXPECT_EQ(cases[1].difficulty, "worst_case");
    EXPECT_EQ(cases[2].difficulty, "best_case");
    EXPECT_EQ(cases[3].difficulty, "worst_case");
    EXPECT_EQ(cases[4].difficulty, "random");

    for (size_t i = 0; i < cases.size(); ++i) {
        EXPECT_EQ(cases[i].id, (int)i + 1);
        EXPECT_EQ(cases[i].name, "Test Case " + to_string(i + 1));
        EXPECT_EQ(cases[i].size_category, "medium");
    }
    EXPECT_EQ(cases[4].expected, vector<int64_t>({1, 3, 4}));
}

TEST(TestCasesTest, MakeTestCaseSortsExpected) {
    auto tc = make_test_case(3, "Dups", "small", "random", {5, 1, 5, -2});
    EXPECT_EQ(tc.data, vector<int64_t>({5, 1, 5, -2}));
    EXPECT_EQ(tc.expected, vector<int64_t>({-2, 1, 5, 5}));
}
