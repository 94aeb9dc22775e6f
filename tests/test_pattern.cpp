#include <gtest/gtest.h>

#include <regex>
#include <stdexcept>

#include "engine/pattern.hpp"

namespace parts::engine::test {

    namespace {
        bool glob(const std::string& pattern, const std::string& path) {
            return CompiledRule(SelectionRule::glob(pattern)).matches(path);
        }

        bool regex(const std::string& pattern, const std::string& path) {
            return CompiledRule(SelectionRule::regex(pattern)).matches(path);
        }
    }

    TEST(PatternTest, StarStopsAtSeparator) {
        EXPECT_TRUE(glob("src/*.rs", "src/a.rs"));
        EXPECT_FALSE(glob("src/*.rs", "src/x/a.rs"));
        EXPECT_FALSE(glob("*.md", "docs/a.md"));
    }

    TEST(PatternTest, DoubleStarCrossesDirectories) {
        EXPECT_TRUE(glob("src/**.rs", "src/a.rs"));
        EXPECT_TRUE(glob("src/**.rs", "src/x/y/a.rs"));
        EXPECT_FALSE(glob("src/**.rs", "lib/a.rs"));
        EXPECT_TRUE(glob("src/**", "src/x/y"));
    }

    TEST(PatternTest, LeadingDoubleStarMatchesZeroDirectories) {
        EXPECT_TRUE(glob("**/*.md", "README.md"));
        EXPECT_TRUE(glob("**/*.md", "docs/guide/intro.md"));
        EXPECT_TRUE(glob("a/**/b", "a/b"));
        EXPECT_TRUE(glob("a/**/b", "a/x/y/b"));
    }

    TEST(PatternTest, QuestionMarkAndClasses) {
        EXPECT_TRUE(glob("file?.txt", "file1.txt"));
        EXPECT_FALSE(glob("file?.txt", "file10.txt"));
        EXPECT_FALSE(glob("a?b", "a/b"));
        EXPECT_TRUE(glob("[a-c].txt", "b.txt"));
        EXPECT_FALSE(glob("[a-c].txt", "d.txt"));
        EXPECT_TRUE(glob("[!a-c].txt", "d.txt"));
        EXPECT_FALSE(glob("[!a-c].txt", "a.txt"));
    }

    TEST(PatternTest, AlternationAndEscapes) {
        EXPECT_TRUE(glob("*.{h,hpp}", "a.hpp"));
        EXPECT_TRUE(glob("*.{h,hpp}", "a.h"));
        EXPECT_FALSE(glob("*.{h,hpp}", "a.cpp"));
        EXPECT_TRUE(glob("\\*.txt", "*.txt"));
        EXPECT_FALSE(glob("\\*.txt", "a.txt"));
        EXPECT_TRUE(glob("a+b(1).txt", "a+b(1).txt"));
    }

    TEST(PatternTest, GlobIsWholePathMatch) {
        EXPECT_FALSE(glob("a.rs", "src/a.rs"));
        EXPECT_FALSE(glob("src", "src/a.rs"));
    }

    TEST(PatternTest, RegexIsNotImplicitlyAnchored) {
        EXPECT_TRUE(regex(".md", "docs/README.md"));
        EXPECT_TRUE(regex(".*\\.md$", "README.md"));
        EXPECT_FALSE(regex(".*\\.md$", "README.md.bak"));
        EXPECT_TRUE(regex("^src/", "src/lib.rs"));
        EXPECT_FALSE(regex("^src/", "lib/src/x.rs"));
    }

    TEST(PatternTest, MalformedPatternsThrowAtCompileTime) {
        EXPECT_THROW(CompiledRule(SelectionRule::glob("[abc")), std::invalid_argument);
        EXPECT_THROW(CompiledRule(SelectionRule::glob("{a,b")), std::invalid_argument);
        EXPECT_THROW(CompiledRule(SelectionRule::glob("a\\")), std::invalid_argument);
        EXPECT_THROW(CompiledRule(SelectionRule::regex("(unclosed")), std::regex_error);
    }

    TEST(PatternTest, GlobsCannotLeaveTheRoot) {
        EXPECT_THROW(glob_to_regex("/etc/passwd"), std::invalid_argument);
        EXPECT_THROW(glob_to_regex("../other/*.rs"), std::invalid_argument);
        EXPECT_THROW(glob_to_regex("src/../../x"), std::invalid_argument);
        EXPECT_NO_THROW(glob_to_regex("src/..foo"));
    }

    TEST(PatternTest, PathMatcherAppliesExclusionsAndDirectory) {
        std::vector<CompiledRule> include;
        include.emplace_back(SelectionRule::glob("**/*.rs"));
        std::vector<CompiledRule> exclude;
        exclude.emplace_back(SelectionRule::glob("src/gen/**"));
        PathMatcher matcher(std::move(include), std::move(exclude), normalize_directory("./src/"));

        EXPECT_TRUE(matcher.matches("src/a.rs"));
        EXPECT_TRUE(matcher.matches("src/x/b.rs"));
        EXPECT_FALSE(matcher.matches("src/gen/c.rs"));
        EXPECT_FALSE(matcher.matches("lib/a.rs"));
        EXPECT_FALSE(matcher.matches("srcx/a.rs"));
    }

    TEST(PatternTest, PathMatcherWithoutRulesMatchesNothing) {
        PathMatcher matcher({}, {}, "");
        EXPECT_FALSE(matcher.matches("a.txt"));
    }

    TEST(PatternTest, NormalizeDirectory) {
        EXPECT_EQ(normalize_directory("."), "");
        EXPECT_EQ(normalize_directory(""), "");
        EXPECT_EQ(normalize_directory("./"), "");
        EXPECT_EQ(normalize_directory("src"), "src/");
        EXPECT_EQ(normalize_directory("./a/b/"), "a/b/");
        EXPECT_THROW(normalize_directory("../x"), std::invalid_argument);
        EXPECT_THROW(normalize_directory("/abs"), std::invalid_argument);
    }

}
