#include "server/leaderboard.hpp"
#include <algorithm>
#include <set>

namespace sortbot::server {
using namespace std;
using namespace nlohmann;

void to_json(json &j, const leaderboard_entry &value) {
    j = {{"rank", value.rank},
         {"bot_name", value.bot_name},
         {"bot_id", value.bot_id},
         {"algorithm", value.algorithm},
         {"author", value.author},
         {"total_score", value.total_score},
         {"submission_id", value.submission_id},
         {"submitted_at", value.submitted_at}};
}

static bool passed_category(const submission_record &record, const set<int> &category_cases) {
    return any_of(record.outcomes.begin(), record.outcomes.end(), [&](const test_outcome &o) {
        return o.kind == outcome::PASS && category_cases.count(o.test_case_id);
    });
}

vector<leaderboard_entry> rank(const vector<submission_record> &submissions,
                               const vector<test_case> &test_cases,
                               const leaderboard_filter &filter) {
    set<int> category_cases;
    if (filter.size_category) {
        for (auto &tc : test_cases)
            if (tc.size_category == *filter.size_category) category_cases.insert(tc.id);
    }

    vector<const submission_record *> qualified;
    for (auto &record : submissions) {
        if (record.status != submission_status::COMPLETED || !record.score) continue;
        if (filter.algorithm && record.bot.algorithm != *filter.algorithm) continue;
        if (filter.size_category && !passed_category(record, category_cases)) continue;
        qualified.push_back(&record);
    }

    stable_sort(qualified.begin(), qualified.end(), [](const submission_record *a, const submission_record *b) {
        if (*a->score != *b->score) return *a->score < *b->score;
        return a->submitted_at < b->submitted_at;
    });

    vector<leaderboard_entry> entries;
    for (size_t i = filter.offset; i < qualified.size() && entries.size() < filter.limit; ++i) {
        const submission_record &record = *qualified[i];
        leaderboard_entry entry;
        entry.rank = i + 1;
        entry.bot_name = record.bot.name;
        entry.bot_id = record.bot.id;
        entry.algorithm = record.bot.algorithm;
        entry.author = record.bot.author;
        entry.total_score = *record.score;
        entry.submission_id = record.sub_id;
        entry.submitted_at = record.submitted_at;
        entries.push_back(move(entry));
    }
    return entries;
}

}  // namespace sortbot::server
