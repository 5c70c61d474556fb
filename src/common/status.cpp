#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace sortbot {
using namespace std;

// clang-format off
static const unordered_map<outcome, const char *> outcome_string = boost::assign::map_list_of
    (outcome::PASS, "Pass")
    (outcome::FAIL, "Fail")
    (outcome::ERROR, "Error")
    (outcome::TIMEOUT, "Timeout");

static const unordered_map<outcome, const char *> outcome_name = boost::assign::map_list_of
    (outcome::PASS, "pass")
    (outcome::FAIL, "fail")
    (outcome::ERROR, "error")
    (outcome::TIMEOUT, "timeout");

static const unordered_map<submission_status, const char *> submission_status_string = boost::assign::map_list_of
    (submission_status::PENDING, "Pending")
    (submission_status::RUNNING, "Running")
    (submission_status::COMPLETED, "Completed")
    (submission_status::FAILED, "Failed");

static const unordered_map<submission_status, const char *> submission_status_name = boost::assign::map_list_of
    (submission_status::PENDING, "pending")
    (submission_status::RUNNING, "running")
    (submission_status::COMPLETED, "completed")
    (submission_status::FAILED, "failed");
// clang-format on

const char *get_display_message(outcome kind) {
    return outcome_string.at(kind);
}

const char *get_display_message(submission_status stat) {
    return submission_status_string.at(stat);
}

const char *get_status_name(outcome kind) {
    return outcome_name.at(kind);
}

const char *get_status_name(submission_status stat) {
    return submission_status_name.at(stat);
}

outcome parse_outcome(const string &name) {
    for (auto &[kind, str] : outcome_name)
        if (name == str) return kind;
    throw invalid_argument("Unrecognized outcome " + name);
}

submission_status parse_submission_status(const string &name) {
    for (auto &[stat, str] : submission_status_name)
        if (name == str) return stat;
    throw invalid_argument("Unrecognized submission status " + name);
}

bool is_terminal(submission_status stat) {
    return stat == submission_status::COMPLETED || stat == submission_status::FAILED;
}

}  // namespace sortbot
