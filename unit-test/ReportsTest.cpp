#include "gtest/gtest.h"
#include "server/memory_store.hpp"
#include "server/reports.hpp"
#include "server/test_cases.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace sortbot;
using namespace sortbot::server;
using nlohmann::json;

class ReportsTest : public ::testing::Test {
protected:
    vector<test_case> cases;
    vector<submission_record> submissions;

    void SetUp() override {
        cases.push_back(make_test_case(1, "Small Random Array", "small", "random", {3, 1, 2}));
        cases.push_back(make_test_case(2, "Large Reverse Array", "large", "worst_case", {5, 4, 3, 2, 1}));
    }

    submission_record &add(const string &sub_id, const string &bot_id, const string &name, int64_t submitted_at) {
        submission_record record;
        record.sub_id = sub_id;
        record.bot.id = bot_id;
        record.bot.name = name;
        record.bot.algorithm = "quick_sort";
        record.code = "# " + sub_id;
        record.submitted_at = submitted_at;
        submissions.push_back(record);
        return submissions.back();
    }

    static test_outcome outcome_of(int id, outcome kind, double run_time) {
        test_outcome o;
        o.test_case_id = id;
        o.kind = kind;
        o.run_time = run_time;
        if (kind != outcome::PASS) o.message = "Result mismatch";
        return o;
    }
};

TEST_F(ReportsTest, CompletedReportJoinsTestCases) {
    auto &record = add("sub-1", "bot-1", "quick", 100);
    record.status = submission_status::COMPLETED;
    record.outcomes = {outcome_of(1, outcome::PASS, 0.25), outcome_of(2, outcome::FAIL, 0.5)};
    record.score = 0.25;

    json report = submission_report(record, cases);
    EXPECT_EQ(report["sub_id"], "sub-1");
    EXPECT_EQ(report["bot_id"], "bot-1");
    EXPECT_EQ(report["bot_name"], "quick");
    EXPECT_EQ(report["bot"]["algorithm"], "quick_sort");
    EXPECT_EQ(report["submitted_at"], 100);
    EXPECT_EQ(report["status"], "completed");
    EXPECT_EQ(report["total_score"], 0.25);
    EXPECT_TRUE(report["error"].is_null());

    ASSERT_EQ(report["results"].size(), 2u);
    EXPECT_EQ(report["results"][0]["test_case_name"], "Small Random Array");
    EXPECT_EQ(report["results"][0]["size_category"], "small");
    EXPECT_EQ(report["results"][0]["success"], "pass");
    EXPECT_EQ(report["results"][1]["test_case_name"], "Large Reverse Array");
    EXPECT_EQ(report["results"][1]["size_category"], "large");
    EXPECT_EQ(report["results"][1]["error_message"], "Result mismatch");
}

TEST_F(ReportsTest, FailedReportCarriesError) {
    auto &record = add("sub-1", "bot-1", "quick", 100);
    record.status = submission_status::FAILED;
    record.error = "database unavailable";
    record.outcomes = {outcome_of(1, outcome::PASS, 0.25)};

    json report = submission_report(record, cases);
    EXPECT_EQ(report["status"], "failed");
    EXPECT_TRUE(report["total_score"].is_null());
    EXPECT_EQ(report["error"], "database unavailable");
    ASSERT_EQ(report["results"].size(), 1u);
}

TEST_F(ReportsTest, RunningReportHidesResults) {
    auto &record = add("sub-1", "bot-1", "quick", 100);
    record.status = submission_status::RUNNING;
    record.outcomes = {outcome_of(1, outcome::PASS, 0.25)};

    json report = submission_report(record, cases);
    EXPECT_EQ(report["status"], "running");
    EXPECT_TRUE(report["results"].empty());
}

TEST_F(ReportsTest, ResultOfRemovedTestCaseHasNullName) {
    auto &record = add("sub-1", "bot-1", "quick", 100);
    record.status = submission_status::COMPLETED;
    record.outcomes = {outcome_of(7, outcome::PASS, 0.25)};
    record.score = 0.25;

    json report = submission_report(record, cases);
    EXPECT_TRUE(report["results"][0]["test_case_name"].is_null());
    EXPECT_TRUE(report["results"][0]["size_category"].is_null());
}

TEST_F(ReportsTest, ListsBotsInFirstSubmissionOrder) {
    add("sub-3", "bot-b", "bubble", 300);
    add("sub-1", "bot-a", "quick", 100);
    add("sub-2", "bot-b", "bubble-old", 200);
    add("sub-4", "bot-a", "quick-v2", 400);

    auto bots = list_bots(submissions);
    ASSERT_EQ(bots.size(), 2u);
    EXPECT_EQ(bots[0].bot.id, "bot-a");
    EXPECT_EQ(bots[0].created_at, 100);
    EXPECT_EQ(bots[0].submission_count, 2u);
    EXPECT_EQ(bots[0].latest_sub_id, "sub-4");
    EXPECT_EQ(bots[0].bot.name, "quick-v2");
    EXPECT_EQ(bots[0].latest_code, "# sub-4");
    EXPECT_EQ(bots[1].bot.id, "bot-b");
    EXPECT_EQ(bots[1].created_at, 200);
    EXPECT_EQ(bots[1].latest_sub_id, "sub-3");

    json j = bots[0];
    EXPECT_FALSE(j.contains("code"));
    EXPECT_EQ(j["latest_submission_id"], "sub-4");
}

TEST_F(ReportsTest, BotListIsPaginated) {
    add("sub-1", "bot-a", "a", 100);
    add("sub-2", "bot-b", "b", 200);
    add("sub-3", "bot-c", "c", 300);

    auto page = list_bots(submissions, 1, 1);
    ASSERT_EQ(page.size(), 1u);
    EXPECT_EQ(page[0].bot.id, "bot-b");
    EXPECT_TRUE(list_bots(submissions, 3, 10).empty());
}

TEST_F(ReportsTest, FindsBotById) {
    add("sub-1", "bot-a", "a", 100);
    ASSERT_TRUE(find_bot(submissions, "bot-a"));
    EXPECT_EQ(find_bot(submissions, "bot-a")->latest_sub_id, "sub-1");
    EXPECT_FALSE(find_bot(submissions, "bot-z"));
}

TEST_F(ReportsTest, ResubmittedBotKeepsIdentity) {
    memory_store store("reports");
    bot_info bot;
    bot.name = "quick";
    bot.algorithm = "quick_sort";
    string first = store.submit(bot, "def sort_array(a): return sorted(a)");
    string bot_id = store.get_submission(first).bot.id;

    auto found = find_bot(store.list_submissions(), bot_id);
    ASSERT_TRUE(found);
    string second = store.submit(found->bot, found->latest_code);
    EXPECT_NE(second, first);
    EXPECT_EQ(store.get_submission(second).bot.id, bot_id);
    EXPECT_EQ(store.get_submission(second).code, "def sort_array(a): return sorted(a)");
    EXPECT_EQ(store.get_status(second), submission_status::PENDING);
    EXPECT_EQ(list_bots(store.list_submissions()).size(), 1u);
}

TEST_F(ReportsTest, TestCaseListOmitsData) {
    json list = test_case_list(cases);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[1]["id"], 2);
    EXPECT_EQ(list[1]["name"], "Large Reverse Array");
    EXPECT_EQ(list[1]["size_category"], "large");
    EXPECT_EQ(list[1]["difficulty"], "worst_case");
    EXPECT_EQ(list[1]["data_length"], 5);
    EXPECT_FALSE(list[1].contains("data"));
}

TEST_F(ReportsTest, SeedsOnlyEmptyStores) {
    memory_store store("reports");
    EXPECT_EQ(seed_store(store, sample_test_cases()), 10u);
    EXPECT_EQ(store.get_test_cases().size(), 10u);
    EXPECT_EQ(seed_store(store, sample_test_cases()), 0u);
    EXPECT_EQ(store.get_test_cases().size(), 10u);
}
