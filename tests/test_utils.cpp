#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <set>

TEST(Utils, ParseIntStrict) {
    int v = 0;
    EXPECT_TRUE(parse_int("42", v));
    EXPECT_EQ(v, 42);
    EXPECT_TRUE(parse_int(" -7 ", v));
    EXPECT_EQ(v, -7);
    EXPECT_FALSE(parse_int("", v));
    EXPECT_FALSE(parse_int("12abc", v));
    EXPECT_FALSE(parse_int("2.5", v));
    EXPECT_FALSE(parse_int("99999999999999", v));
}

TEST(Utils, ParseBool) {
    bool b = false;
    EXPECT_TRUE(parse_bool("TRUE", b));
    EXPECT_TRUE(b);
    EXPECT_TRUE(parse_bool("off", b));
    EXPECT_FALSE(b);
    EXPECT_FALSE(parse_bool("perhaps", b));
}

TEST(Utils, SceneIdCharset) {
    EXPECT_TRUE(is_valid_scene_id("abc123"));
    EXPECT_TRUE(is_valid_scene_id("a.b_c-d"));
    EXPECT_FALSE(is_valid_scene_id(""));
    EXPECT_FALSE(is_valid_scene_id(".."));
    EXPECT_FALSE(is_valid_scene_id("a b"));
    EXPECT_FALSE(is_valid_scene_id("a/b"));
}

TEST(Utils, UuidShape) {
    std::set<std::string> seen;
    for (int i = 0; i < 50; i++) {
        std::string id = generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
        EXPECT_TRUE(is_valid_scene_id(id));
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 50u);
}

TEST(Utils, RandomHexLength) {
    EXPECT_EQ(random_hex(8).size(), 8u);
    EXPECT_EQ(random_hex(0), "");
}

TEST(Utils, TailExcerpt) {
    EXPECT_EQ(tail_excerpt("  short \n", 100), "short");
    EXPECT_EQ(tail_excerpt("0123456789", 4), "...6789");
}

TEST(Utils, MaskSecret) {
    EXPECT_EQ(mask_secret(""), "");
    EXPECT_EQ(mask_secret("abcdefgh"), "ab******");
    EXPECT_EQ(mask_secret("abc"), "***");
}

TEST(Utils, UrlJoin) {
    EXPECT_EQ(url_join("https://h", "a.zip"), "https://h/a.zip");
    EXPECT_EQ(url_join("https://h/", "/a.zip"), "https://h/a.zip");
    EXPECT_EQ(url_join("https://h/", "a.zip"), "https://h/a.zip");
    EXPECT_EQ(url_join("", "a.zip"), "a.zip");
}

TEST(Utils, JoinCommandQuotesSpaces) {
    EXPECT_EQ(join_command("colmap", {"mapper", "--image_path", "/my dir"}),
              "colmap mapper --image_path \"/my dir\"");
}

TEST(Log, ParseLevels) {
    LogLevel l = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("debug", l));
    EXPECT_EQ(l, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("warning", l));
    EXPECT_EQ(l, LogLevel::Warn);
    EXPECT_FALSE(parse_log_level("verbose", l));
}

TEST(Log, JobLogPathStaysInsideLogsDir) {
    EXPECT_EQ(job_log_path("/w", "job-1"), std::filesystem::path("/w/logs/job-1.log"));
    EXPECT_EQ(job_log_path("/w", "../etc/x"), std::filesystem::path("/w/logs/_.._etc_x.log"));
}
