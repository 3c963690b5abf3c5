#include <halbox/sandbox/wrapper_builder.hpp>

#include "test_helpers.hpp"

using namespace halbox;

TEST(WrapperBuilder, EmbedsTargetAndPolicyAsLiterals) {
    ExecutionProfile p;
    p.name = "headless";
    p.blocked_imports = {"socket", "ssl"};
    p.blocked_calls = {"os.system"};

    std::string src = WrapperBuilder().build("/tmp/it's \"here\".py", p);

    EXPECT_NE(src.find("_TARGET = \"/tmp/it's \\\"here\\\".py\""), std::string::npos);
    EXPECT_NE(src.find("frozenset([\"socket\",\"ssl\"])"), std::string::npos);
    EXPECT_NE(src.find("_BLOCKED_CALLS = [\"os.system\"]"), std::string::npos);
    EXPECT_EQ(src.find('@'), std::string::npos);
}

TEST(WrapperBuilder, InstallsEveryImportHook) {
    ExecutionProfile p;
    p.name = "x";
    std::string src = WrapperBuilder().build("/tmp/a.py", p);

    EXPECT_NE(src.find("sys.meta_path.insert(0"), std::string::npos);
    EXPECT_NE(src.find("builtins.__import__ ="), std::string::npos);
    EXPECT_NE(src.find("importlib.import_module ="), std::string::npos);
    EXPECT_NE(src.find("types.ModuleType(\"__main__\")"), std::string::npos);
    EXPECT_NE(src.find("sys.exit(2)"), std::string::npos);
    EXPECT_NE(src.find("frozenset([])"), std::string::npos);
}

TEST(WrapperBuilder, PlaceholderTextInTargetPathIsKeptVerbatim) {
    ExecutionProfile p;
    p.name = "headless";
    p.blocked_imports = {"socket"};
    p.blocked_calls = {"eval"};

    std::string src = WrapperBuilder().build("/tmp/x@BLOCKED_IMPORTS@y@BLOCKED_CALLS@.py", p);

    EXPECT_NE(src.find("_TARGET = \"/tmp/x@BLOCKED_IMPORTS@y@BLOCKED_CALLS@.py\""), std::string::npos);
    EXPECT_NE(src.find("_BLOCKED_IMPORTS = frozenset([\"socket\"])"), std::string::npos);
    EXPECT_NE(src.find("_BLOCKED_CALLS = [\"eval\"]"), std::string::npos);
}

TEST(WrapperBuilder, RevokesBuiltinsThroughPrivateReferences) {
    ExecutionProfile p;
    p.name = "x";
    p.blocked_calls = {"eval"};
    std::string src = WrapperBuilder().build("/tmp/a.py", p);

    EXPECT_NE(src.find("_halbox_real_exec = builtins.exec"), std::string::npos);
    EXPECT_NE(src.find("_halbox_real_exec(_halbox_code"), std::string::npos);
    EXPECT_EQ(src.find("runpy"), std::string::npos);
}

TEST(WrapperBuilder, InterpreterArgsAreUnbuffered) {
    std::vector<std::string> args = WrapperBuilder::interpreter_args("/tmp/w.py");
    ASSERT_EQ(args.size(), 3u);
    EXPECT_EQ(args[0], "-u");
    EXPECT_EQ(args.back(), "/tmp/w.py");
}
