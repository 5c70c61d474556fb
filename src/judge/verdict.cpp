#include "judge/verdict.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <cmath>
#include <vector>

namespace sortbot {
using namespace std;

/**
 * @brief 按前两个逗号将结果行切分为至多三个字段
 */
static vector<string> split_fields(const string &line) {
    vector<string> fields;
    size_t begin = 0;
    while (fields.size() < 2) {
        size_t comma = line.find(',', begin);
        if (comma == string::npos) break;
        fields.push_back(line.substr(begin, comma - begin));
        begin = comma + 1;
    }
    fields.push_back(line.substr(begin));
    return fields;
}

static double parse_duration(const vector<string> &fields, double fallback) {
    if (fields.size() < 2) return fallback;
    double value;
    if (!boost::conversion::try_lexical_convert(boost::algorithm::trim_copy(fields[1]), value))
        return fallback;
    if (!std::isfinite(value) || value < 0) return fallback;
    return value;
}

test_outcome parse_verdict(const string &out, const string &err, bool timed_out, double fallback_elapsed, double timeout) {
    test_outcome result;
    if (timed_out) {
        result.kind = outcome::TIMEOUT;
        result.run_time = timeout;
        result.message = "Execution timed out";
        return result;
    }

    if (!std::isfinite(fallback_elapsed) || fallback_elapsed < 0) fallback_elapsed = 0;

    string line = boost::algorithm::trim_left_copy(out);
    line = line.substr(0, line.find('\n'));
    boost::algorithm::trim(line);

    vector<string> fields = split_fields(line);
    result.run_time = parse_duration(fields, fallback_elapsed);

    if (boost::algorithm::starts_with(line, "PASS")) {
        result.kind = outcome::PASS;
    } else if (boost::algorithm::starts_with(line, "FAIL")) {
        result.kind = outcome::FAIL;
        result.message = fields.size() > 2 ? fields[2] : "Test failed";
    } else {
        result.kind = outcome::ERROR;
        result.message = fields.size() > 2 ? fields[2] : err;
    }
    return result;
}

}  // namespace sortbot
