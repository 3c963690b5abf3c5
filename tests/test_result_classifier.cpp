#include <halbox/sandbox/result_classifier.hpp>

#include "test_helpers.hpp"

using namespace halbox;

namespace {

ExecutionProfile headless() {
    ExecutionProfile p;
    p.name = "headless";
    return p;
}

RawRunResult raw(int rc, const std::string& out, const std::string& err) {
    RawRunResult r;
    r.return_code = rc;
    r.stdout_text = out;
    r.stderr_text = err;
    r.duration_ms = 12;
    return r;
}

} // namespace

TEST(ResultClassifier, SuccessWithOutputIsValid) {
    ExecutionResult r = ResultClassifier().classify(raw(0, "42\n", ""), headless(), EnvironmentDescriptor());
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.outcome, Outcome::SUCCESS);
    EXPECT_TRUE(r.validated);
    EXPECT_TRUE(r.valid);
    EXPECT_TRUE(r.suggestion.empty());
    EXPECT_EQ(r.profile_used, "headless");
    EXPECT_EQ(r.duration_ms, 12);
}

TEST(ResultClassifier, SuccessWithoutOutputIsNotValid) {
    ExecutionResult r = ResultClassifier().classify(raw(0, "  \n", ""), headless(), EnvironmentDescriptor());
    EXPECT_TRUE(r.ok);
    EXPECT_FALSE(r.valid);
}

TEST(ResultClassifier, ValidationCanBeDisabled) {
    ExecutionResult r = ResultClassifier(false).classify(raw(0, "", ""), headless(), EnvironmentDescriptor());
    EXPECT_FALSE(r.validated);
    EXPECT_FALSE(r.to_json().contains("valid"));
}

TEST(ResultClassifier, TimeoutOutcome) {
    RawRunResult t = raw(TIMEOUT_EXIT_CODE, "", "Timeout after 8s");
    t.timed_out = true;
    ExecutionResult r = ResultClassifier().classify(t, headless(), EnvironmentDescriptor());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.outcome, Outcome::TIMEOUT);
    EXPECT_NE(r.suggestion.find("too long"), std::string::npos);
}

TEST(ResultClassifier, RuntimeFailureGetsHint) {
    ExecutionResult r = ResultClassifier().classify(
        raw(1, "", "Traceback...\nModuleNotFoundError: No module named 'numpy'"),
        headless(), EnvironmentDescriptor());
    EXPECT_EQ(r.outcome, Outcome::RUNTIME_FAILURE);
    EXPECT_EQ(r.suggestion, ResultClassifier::suggest_fix("ModuleNotFoundError"));
}

TEST(ResultClassifier, RejectJoinsViolationMessages) {
    std::vector<PolicyViolation> v;
    v.push_back(PolicyViolation(ViolationKind::BLOCKED_IMPORT, "socket", 1));
    v.push_back(PolicyViolation(ViolationKind::BLOCKED_CALL, "eval", 3));

    ExecutionResult r = ResultClassifier().reject(v, headless(), EnvironmentDescriptor());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.return_code, POLICY_EXIT_CODE);
    EXPECT_EQ(r.outcome, Outcome::POLICY_VIOLATION);
    EXPECT_EQ(r.stderr_text,
              "SandboxViolation: blocked import 'socket' (line 1)\n"
              "SandboxViolation: blocked call 'eval' (line 3)");
    EXPECT_EQ(r.to_json()["violations"].size(), 2u);
}

TEST(ResultClassifier, NotFound) {
    ExecutionResult r = ResultClassifier().not_found("/no/such.py", "headless", EnvironmentDescriptor());
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.return_code, 2);
    EXPECT_EQ(r.outcome, Outcome::NOT_FOUND);
    EXPECT_EQ(r.stderr_text, "File not found: /no/such.py");
    EXPECT_EQ(r.to_json()["path"], "/no/such.py");
}

TEST(ResultClassifier, SuggestFixTable) {
    EXPECT_NE(ResultClassifier::suggest_fix("IndentationError: unexpected indent").find("syntax"), std::string::npos);
    EXPECT_NE(ResultClassifier::suggest_fix("SandboxViolation: blocked call 'eval'").find("profile"), std::string::npos);
    EXPECT_NE(ResultClassifier::suggest_fix("MemoryError").find("memory"), std::string::npos);
    EXPECT_EQ(ResultClassifier::suggest_fix("ZeroDivisionError"), "Unknown error: check the sandbox logs.");
}

TEST(ResultClassifier, JsonShape) {
    RawRunResult t = raw(0, "bad \xff byte\n", "");
    t.stdout_truncated = true;
    ExecutionResult r = ResultClassifier().classify(t, headless(), EnvironmentDescriptor());
    r.source = "snippet";
    r.intent = "data";

    Json j = r.to_json();
    EXPECT_EQ(j["ok"], true);
    EXPECT_EQ(j["returncode"], 0);
    EXPECT_EQ(j["profile"], "headless");
    EXPECT_EQ(j["outcome"], "success");
    EXPECT_EQ(j["src"], "snippet");
    EXPECT_EQ(j["intent"], "data");
    EXPECT_EQ(j["truncated"], true);
    EXPECT_FALSE(j.contains("path"));
    EXPECT_TRUE(j["violations"].is_array());
    EXPECT_NO_THROW(j.dump());
}

TEST(ResultClassifier, SummarizeShapes) {
    ExecutionResult r;
    r.ok = true;

    r.stdout_text = "";
    EXPECT_EQ(ResultClassifier::summarize(r), "The program finished without writing to stdout.");

    r.stdout_text = "1 2.5 -3 4 5 6\n";
    EXPECT_EQ(ResultClassifier::summarize(r), "Numeric data (6 values), e.g.: 1, 2.5, -3, 4, 5...");

    r.stdout_text = "#####\n# x #\n#####\n";
    EXPECT_EQ(ResultClassifier::summarize(r).rfind("ASCII output:\n#####", 0), 0u);

    r.stdout_text = "hello\nworld\n";
    EXPECT_EQ(ResultClassifier::summarize(r), "Text result: hello world");

    r.stdout_text = "a\nb\nc\nd\ne\nf\ng\n";
    EXPECT_EQ(ResultClassifier::summarize(r), "Longer text, first lines:\na\nb\nc\nd\ne\nf\ng");

    r.ok = false;
    r.return_code = 1;
    r.stderr_text = "boom\n";
    EXPECT_EQ(ResultClassifier::summarize(r), "Execution failed:\nboom");
}
