#include "server/test_cases.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <functional>

namespace sortbot::server {
using namespace std;

static vector<int64_t> range(int64_t from, int64_t to, int64_t step = 1) {
    vector<int64_t> result;
    for (int64_t i = from; step > 0 ? i < to : i > to; i += step) result.push_back(i);
    return result;
}

test_case make_test_case(int id, const string &name, const string &size_category,
                         const string &difficulty, const vector<int64_t> &data) {
    test_case tc;
    tc.id = id;
    tc.name = name;
    tc.size_category = size_category;
    tc.difficulty = difficulty;
    tc.data = data;
    tc.expected = data;
    sort(tc.expected.begin(), tc.expected.end());
    return tc;
}

vector<test_case> sample_test_cases() {
    // clang-format off
    return {
        make_test_case(1, "Small Sorted Array", "small", "best_case", range(0, 100)),
        make_test_case(2, "Small Reverse Array", "small", "worst_case", range(100, 0, -1)),
        make_test_case(3, "Small Random Array", "small", "random", {64, 34, 25, 12, 22, 11, 90, 5, 77, 30, 88, 76, 50, 42, 13, 27, 96, 4, 47, 82}),
        make_test_case(4, "Medium Sorted Array", "medium", "best_case", range(0, 1000)),
        make_test_case(5, "Medium Reverse Array", "medium", "worst_case", range(1000, 0, -1)),
        make_test_case(6, "Single Element", "small", "best_case", {42}),
        make_test_case(7, "Empty Array", "small", "best_case", {}),
        make_test_case(8, "Two Elements Sorted", "small", "best_case", {1, 2}),
        make_test_case(9, "Two Elements Reverse", "small", "worst_case", {2, 1}),
        make_test_case(10, "Duplicates Array", "small", "random", {5, 2, 8, 2, 9, 1, 5, 5, 3, 7, 2, 8, 1, 9, 5}),
    };
    // clang-format on
}

vector<vector<int64_t>> parse_input_file(const filesystem::path &path) {
    ifstream fin(path);
    if (!fin) {
        LOG(WARNING) << path.string() << " not found, skipping";
        return {};
    }

    vector<vector<int64_t>> arrays;
    string line;
    while (getline(fin, line)) {
        boost::algorithm::trim(line);
        if (line.empty()) continue;

        vector<string> tokens;
        boost::algorithm::split(tokens, line, boost::is_any_of(","));
        vector<int64_t> array;
        for (auto &token : tokens) {
            int64_t value;
            if (!boost::conversion::try_lexical_convert(boost::algorithm::trim_copy(token), value)) {
                LOG(WARNING) << "Error parsing " << path.string() << ": invalid integer '" << token << "'";
                return {};
            }
            array.push_back(value);
        }
        arrays.push_back(move(array));
    }
    return arrays;
}

vector<test_case> load_test_cases(const filesystem::path &path, const string &size_category) {
    vector<test_case> cases;
    auto arrays = parse_input_file(path);
    for (size_t i = 0; i < arrays.size(); ++i) {
        auto &array = arrays[i];
        string difficulty;
        if (is_sorted(array.begin(), array.end()))
            difficulty = "best_case";
        else if (is_sorted(array.begin(), array.end(), greater<int64_t>()))
            difficulty = "worst_case";
        else if (i == 0)  // 第一个数组一般是有序的
            difficulty = "best_case";
        else if (i == 1)  // 第二个数组一般是逆序的
            difficulty = "worst_case";
        else
            difficulty = "random";

        cases.push_back(make_test_case(i + 1, "Test Case " + to_string(i + 1), size_category, difficulty, array));
    }
    LOG(INFO) << "Loaded " << cases.size() << " test cases from " << path.string();
    return cases;
}

}  // namespace sortbot::server
