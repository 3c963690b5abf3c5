#include <halbox/sandbox/intent.hpp>

#include "test_helpers.hpp"

using namespace halbox;

TEST(IntentAnalyzer, KeywordsPickTaskType) {
    IntentAnalyzer analyzer;
    EXPECT_EQ(analyzer.analyze("Load the CSV and compute averages").task_type, "data");
    EXPECT_EQ(analyzer.analyze("fetch this URL").task_type, "network");
    EXPECT_EQ(analyzer.analyze("toggle the shelly relay").task_type, "iot");
    EXPECT_EQ(analyzer.analyze("make a markdown table").task_type, "text");
    EXPECT_EQ(analyzer.analyze("matplotlib plot of sin").task_type, "viz");
    EXPECT_EQ(analyzer.analyze("run a bash one-liner").task_type, "system");
    EXPECT_EQ(analyzer.analyze("hello there").task_type, "text");
}

TEST(IntentAnalyzer, TaskTypeMapsToProfile) {
    IntentAnalyzer analyzer;
    EXPECT_EQ(analyzer.analyze("analiza danych z pliku csv").profile, "analysis");
    EXPECT_EQ(analyzer.analyze("read the mqtt sensor").profile, "iot");
    EXPECT_EQ(analyzer.analyze("download the api response").profile, "headless");
}

TEST(IntentAnalyzer, EarlierRulesWin) {
    // "csv" (data) and "http" (network) both present
    Intent intent = IntentAnalyzer().analyze("download csv over http");
    EXPECT_EQ(intent.task_type, "data");
    EXPECT_FALSE(intent.expected_output.empty());
}
