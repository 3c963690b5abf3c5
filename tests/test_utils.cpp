#include <halbox/core/utils.hpp>

#include "test_helpers.hpp"

#include <set>

using namespace halbox;

TEST(Utils, SplitLinesStripsCarriageReturns) {
    std::vector<std::string> lines = split_lines("a\r\nb\n\nc");
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "a");
    EXPECT_EQ(lines[1], "b");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "c");

    EXPECT_TRUE(split_lines("").empty());
    EXPECT_EQ(split_lines("x\n").size(), 1u);
}

TEST(Utils, TruncateSafeDoesNotSplitMultibyteCharacters) {
    std::string s = "ab\xc5\x82" "cd";   // "abłcd"
    EXPECT_EQ(truncate_safe(s, 3), "ab");
    EXPECT_EQ(truncate_safe(s, 4), "ab\xc5\x82");
    EXPECT_EQ(truncate_safe(s, 100), s);
}

TEST(Utils, SanitizeUtf8ReplacesInvalidBytes) {
    std::string out = sanitize_utf8(std::string("ok\xff\x01", 4));
    EXPECT_EQ(out, "ok\xEF\xBF\xBD ");
}

TEST(Utils, PathHelpers) {
    EXPECT_EQ(normalize_path("/a/./b/../c"), "/a/c");
    EXPECT_EQ(join_path("/a/", "/b"), "/a/b");
    EXPECT_EQ(dirname_of("/a/b/c.py"), "/a/b");
    EXPECT_EQ(dirname_of("/c.py"), "/");
    EXPECT_EQ(dirname_of("c.py"), ".");
}

TEST(Utils, ExpandUserUsesHome) {
    testing_support::EnvGuard home("HOME", "/home/tester");
    EXPECT_EQ(expand_user("~/x.py"), "/home/tester/x.py");
    EXPECT_EQ(expand_user("~"), "/home/tester");
    EXPECT_EQ(expand_user("/abs/x.py"), "/abs/x.py");
}

TEST(Utils, GenerateUuidIsVersion4AndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; ++i) {
        std::string id = generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[14], '4');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST(Utils, Sha256KnownVector) {
    EXPECT_EQ(sha256_hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Utils, EnsureDirectoryCreatesParents) {
    testing_support::TempDir dir;
    std::string deep = dir.file("a/b/c");
    EXPECT_TRUE(ensure_directory(deep));
    struct stat st;
    ASSERT_EQ(stat(deep.c_str(), &st), 0);
    EXPECT_TRUE(S_ISDIR(st.st_mode));
    EXPECT_TRUE(ensure_directory(deep));
}
