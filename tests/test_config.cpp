#include <halbox/core/config.hpp>

#include "test_helpers.hpp"

using halbox::Config;
using halbox::Json;
using halbox::testing_support::TempDir;
using halbox::testing_support::write_text;

TEST(DeepMerge, NestedObjectsMergeKeyByKey) {
    Json base = {{"a", 1}, {"nested", {{"x", 1}, {"y", 2}}}};
    Json overlay = {{"nested", {{"y", 20}, {"z", 30}}}};

    halbox::deep_merge(base, overlay);

    EXPECT_EQ(base["a"], 1);
    EXPECT_EQ(base["nested"]["x"], 1);
    EXPECT_EQ(base["nested"]["y"], 20);
    EXPECT_EQ(base["nested"]["z"], 30);
}

TEST(DeepMerge, ArraysAndScalarsReplaceTheLeaf) {
    Json base = {{"list", {1, 2, 3}}, {"obj", {{"k", "v"}}}};
    Json overlay = {{"list", {9}}, {"obj", "flat"}};

    halbox::deep_merge(base, overlay);

    EXPECT_EQ(base["list"], Json::array({9}));
    EXPECT_EQ(base["obj"], "flat");
}

TEST(Config, DottedKeysReachIntoNestedObjects) {
    Config cfg(Json{{"policy", {{"timeout", 5}, {"name", "strict"}, {"on", true}}}});

    EXPECT_EQ(cfg.get_int("policy.timeout", 0), 5);
    EXPECT_EQ(cfg.get_string("policy.name", ""), "strict");
    EXPECT_TRUE(cfg.get_bool("policy.on", false));
    EXPECT_EQ(cfg.get_int("policy.missing", 42), 42);
    EXPECT_EQ(cfg.get_string("policy.timeout.deeper", "def"), "def");
}

TEST(Config, WrongTypesFallBackToDefaults) {
    Config cfg(Json{{"n", "eight"}, {"s", 3}, {"b", "yes"}});

    EXPECT_EQ(cfg.get_int("n", 8), 8);
    EXPECT_EQ(cfg.get_string("s", "x"), "x");
    EXPECT_FALSE(cfg.get_bool("b", false));
}

TEST(Config, StringArrayKeepsOnlyStrings) {
    Config cfg(Json{{"items", {"a", 1, "b", nullptr}}});
    std::vector<std::string> items = cfg.get_string_array("items");
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "a");
    EXPECT_EQ(items[1], "b");
}

TEST(Config, LoadFileRejectsMalformedAndNonObjectDocuments) {
    TempDir dir;
    Config cfg(Json{{"keep", 1}});

    write_text(dir.file("bad.json"), "{ not json");
    EXPECT_FALSE(cfg.load_file(dir.file("bad.json")));
    EXPECT_NE(cfg.last_error().find("invalid JSON"), std::string::npos);

    write_text(dir.file("list.json"), "[1, 2]");
    EXPECT_FALSE(cfg.load_file(dir.file("list.json")));

    EXPECT_FALSE(cfg.load_file(dir.file("missing.json")));

    // Previous contents survive failed loads
    EXPECT_EQ(cfg.get_int("keep"), 1);
}

TEST(Config, SaveThenLoadPreservesContents) {
    TempDir dir;
    std::string path = dir.file("nested/dir/cfg.json");

    Config out(Json{{"profile", "iot"}, {"exec_timeout_sec", 3}});
    ASSERT_TRUE(out.save_file(path));

    Config in;
    ASSERT_TRUE(in.load_file(path));
    EXPECT_EQ(in.get_string("profile"), "iot");
    EXPECT_EQ(in.get_int("exec_timeout_sec"), 3);
}
