#include <halbox/sandbox/event_log.hpp>
#include <halbox/core/utils.hpp>

#include "test_helpers.hpp"

#include <thread>

using namespace halbox;
using testing_support::TempDir;
using testing_support::count_lines;
using testing_support::write_text;

namespace {

ExecutionResult failed_run(int rc) {
    ExecutionResult r;
    r.source = "snippet";
    r.profile_used = "headless";
    r.return_code = rc;
    r.outcome = Outcome::RUNTIME_FAILURE;
    r.stdout_text = "partial";
    r.stderr_text = "Traceback: boom";
    return r;
}

} // namespace

TEST(EventLog, OneLinePerRecord) {
    TempDir dir;
    EventLog log(dir.file("logs/code_exec.log"));

    ExecutionResult ok = failed_run(0);
    ok.outcome = Outcome::SUCCESS;
    ASSERT_TRUE(log.record(ok));
    ASSERT_TRUE(log.record(failed_run(1)));

    EXPECT_EQ(count_lines(log.path()), 2u);

    std::string text;
    ASSERT_TRUE(read_file(log.path(), text));
    std::vector<std::string> lines = split_lines(text);
    Json first = Json::parse(lines[0]);
    EXPECT_EQ(first["src"], "snippet");
    EXPECT_EQ(first["profile"], "headless");
    EXPECT_EQ(first["returncode"], 0);
    EXPECT_EQ(first["outcome"], "success");
    EXPECT_EQ(first["stdout_len"], 7);
    EXPECT_FALSE(first.contains("path"));
    EXPECT_TRUE(first.contains("ts"));
}

TEST(EventLog, ConcurrentAppendsStayWhole) {
    TempDir dir;
    EventLog log(dir.file("events.log"));

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&log]() {
            for (int i = 0; i < 50; ++i) {
                EXPECT_TRUE(log.record(failed_run(1)));
            }
        });
    }
    for (auto& th : threads) th.join();

    std::string text;
    ASSERT_TRUE(read_file(log.path(), text));
    std::vector<std::string> lines = split_lines(text);
    ASSERT_EQ(lines.size(), 200u);
    for (const auto& line : lines) {
        EXPECT_FALSE(Json::parse(line, nullptr, false).is_discarded());
    }
}

TEST(EventLog, UnwritablePathReportsFalse) {
    EventLog log("/proc/halbox/nope.log");
    EXPECT_FALSE(log.record(failed_run(1)));
    EventLog unset;
    EXPECT_FALSE(unset.record(failed_run(1)));
}

TEST(FailureJournal, RecordsOnlyFailures) {
    TempDir dir;
    FailureJournal journal(dir.file("failures.jsonl"));

    EXPECT_FALSE(journal.record_failure(failed_run(0), "print(1)"));
    EXPECT_TRUE(journal.record_failure(failed_run(1), "raise SystemExit(1)"));

    std::vector<Json> recent = journal.recent_failures(10);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0]["returncode"], 1);
    EXPECT_EQ(recent[0]["source_sha256"], sha256_hex("raise SystemExit(1)"));
    EXPECT_EQ(recent[0]["meta"]["profile"], "headless");
    EXPECT_EQ(recent[0]["meta"]["outcome"], "runtime_failure");
    EXPECT_TRUE(recent[0]["meta"].contains("env"));
}

TEST(FailureJournal, StderrIsBounded) {
    TempDir dir;
    FailureJournal journal(dir.file("failures.jsonl"));
    ExecutionResult r = failed_run(1);
    r.stderr_text = std::string(FailureJournal::MAX_STDERR * 3, 'e');
    ASSERT_TRUE(journal.record_failure(r, ""));

    std::vector<Json> recent = journal.recent_failures(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0]["stderr"].get<std::string>().size(), FailureJournal::MAX_STDERR);
}

TEST(FailureJournal, RecentSkipsBadLinesAndHonorsLimit) {
    TempDir dir;
    std::string path = dir.file("failures.jsonl");
    write_text(path, "{\"returncode\": 1}\nnot json\n{\"returncode\": 2}\n{\"returncode\": 3}\n");

    FailureJournal journal(path);
    std::vector<Json> last_two = journal.recent_failures(2);
    ASSERT_EQ(last_two.size(), 2u);
    EXPECT_EQ(last_two[0]["returncode"], 2);
    EXPECT_EQ(last_two[1]["returncode"], 3);

    EXPECT_EQ(journal.recent_failures(10).size(), 3u);
    EXPECT_TRUE(journal.recent_failures(0).empty());
    EXPECT_TRUE(FailureJournal(dir.file("missing.jsonl")).recent_failures(5).empty());
}
