#include <halbox/sandbox/preflight.hpp>

#include "test_helpers.hpp"

using namespace halbox;

namespace {

ExecutionProfile strict_profile() {
    ExecutionProfile p;
    p.name = "test";
    p.blocked_imports = {"socket", "subprocess", "requests"};
    p.blocked_calls = {"os.system", "eval", "exec"};
    return p;
}

} // namespace

TEST(Preflight, CleanSourcePasses) {
    std::string code = "import math\nprint(math.sqrt(16))\n";
    EXPECT_TRUE(PreflightAnalyzer().scan(code, strict_profile()).empty());
}

TEST(Preflight, BlockedImportReportsLine) {
    std::string code = "x = 1\nimport socket\n";
    std::vector<PolicyViolation> v = PreflightAnalyzer().scan(code, strict_profile());
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].kind, ViolationKind::BLOCKED_IMPORT);
    EXPECT_EQ(v[0].name, "socket");
    EXPECT_EQ(v[0].line_number, 2);
    EXPECT_EQ(v[0].message, "SandboxViolation: blocked import 'socket' (line 2)");
}

TEST(Preflight, FromImportOfSubmoduleIsCaught) {
    std::vector<PolicyViolation> v =
        PreflightAnalyzer().scan("from requests.adapters import HTTPAdapter\n", strict_profile());
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].name, "requests");
}

TEST(Preflight, CommaSeparatedImportIsCaught) {
    std::vector<PolicyViolation> v =
        PreflightAnalyzer().scan("import os, json as j, subprocess\n", strict_profile());
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].name, "subprocess");
}

TEST(Preflight, SimilarModuleNamesAreNotFlagged) {
    EXPECT_TRUE(PreflightAnalyzer().scan("import socketserver\n", strict_profile()).empty());
}

TEST(Preflight, BlockedCallIsCaught) {
    std::vector<PolicyViolation> v =
        PreflightAnalyzer().scan("import os\nos.system ('ls')\n", strict_profile());
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0].kind, ViolationKind::BLOCKED_CALL);
    EXPECT_EQ(v[0].name, "os.system");
    EXPECT_EQ(v[0].line_number, 2);
    EXPECT_EQ(v[0].message, "SandboxViolation: blocked call 'os.system' (line 2)");
}

TEST(Preflight, CallMatchRespectsIdentifierBoundary) {
    std::string code = "def my_eval(x):\n    return x\nmy_eval(1)\nobj.eval(2)\n";
    EXPECT_TRUE(PreflightAnalyzer().scan(code, strict_profile()).empty());
}

TEST(Preflight, ReportsEveryViolationInOrder) {
    std::string code = "import socket\nexec('1')\neval('2')\n";
    std::vector<PolicyViolation> v = PreflightAnalyzer().scan(code, strict_profile());
    ASSERT_EQ(v.size(), 3u);
    EXPECT_EQ(v[0].line_number, 1);
    EXPECT_EQ(v[1].line_number, 2);
    EXPECT_EQ(v[2].line_number, 3);
}

TEST(Preflight, ScanIsDeterministic) {
    std::string code = "import socket\nimport requests\neval('x')\n";
    PreflightAnalyzer analyzer;
    std::vector<PolicyViolation> a = analyzer.scan(code, strict_profile());
    std::vector<PolicyViolation> b = analyzer.scan(code, strict_profile());
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].message, b[i].message);
    }
}

TEST(Preflight, EmptyProfileAllowsEverything) {
    ExecutionProfile open;
    open.name = "open";
    EXPECT_TRUE(PreflightAnalyzer().scan("import socket\neval('1')\n", open).empty());
}

TEST(Preflight, BinaryAndLongLinesDoNotThrow) {
    std::string code("\xff\xfe\x00import socket\n", 17);
    code += std::string(PreflightAnalyzer::MAX_REGEX_LINE * 4, 'a') + " eval(1)\n";
    std::vector<PolicyViolation> v;
    EXPECT_NO_THROW(v = PreflightAnalyzer().scan(code, strict_profile()));
    ASSERT_EQ(v.size(), 2u);
    EXPECT_EQ(v[1].name, "eval");
    EXPECT_EQ(v[1].line_number, 2);
}

TEST(Preflight, ViolationJson) {
    PolicyViolation v(ViolationKind::BLOCKED_CALL, "eval", 7);
    Json j = v.to_json();
    EXPECT_EQ(j["line"], 7);
    EXPECT_EQ(j["kind"], "blocked_call");
    EXPECT_EQ(j["name"], "eval");
}
