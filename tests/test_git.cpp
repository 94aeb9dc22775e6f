#include "test_util.hpp"

#include "engine/detector.hpp"
#include "engine/errors.hpp"
#include "engine/git.hpp"

namespace parts::engine::test {

    class GitTest : public ProjectTest {
    protected:
        void SetUp() override {
            ProjectTest::SetUp();
            if (!git_available()) GTEST_SKIP() << "git is not installed";
            git_init();
            write(".gitignore", ".parts/\n");
        }

        std::string head() const {
            return git::rev_parse(root_, "HEAD");
        }

        std::map<std::string, std::string> contents(const TreeSource& tree) {
            std::map<std::string, std::string> out;
            tree.for_each_path([&](const FileRecord& r) {
                std::string data;
                tree.read(r, [&](const char* p, size_t n) { data.append(p, n); });
                out[r.path] = data;
            });
            return out;
        }

        RunResult run(const std::vector<PartDefinition>& defs, const std::string& rev, bool full = false) {
            auto resolver = PartResolver::compile(defs);
            auto source = create_revision_tree(root_, rev, {});
            StateStore store(root_ / ".parts" / "state.db");
            RunOptions options;
            options.commit = true;
            options.full_recompute = full;
            return ChangeDetector(resolver, *source, store).run(options);
        }
    };

    TEST_F(GitTest, RevisionTreeSeesCommittedContentOnly) {
        write("src/a.rs", "committed");
        git_commit("one");
        write("src/a.rs", "edited in working tree");
        write("src/new.rs", "untracked");

        auto tree = create_revision_tree(root_, "HEAD", {});
        EXPECT_EQ(tree->revision(), head());
        EXPECT_EQ(tree->revision()->size(), 40u);

        std::map<std::string, std::string> expected = {{"src/a.rs", "committed"}};
        EXPECT_EQ(contents(*tree), expected);
    }

    TEST_F(GitTest, RevisionTreeAppliesHiddenAndIgnorePatterns) {
        write("src/a.rs", "a");
        write("src/a.tmp", "t");
        write(".config/x", "x");
        git_commit("one");

        IgnoreOptions options;
        options.patterns = {"*.tmp"};
        auto tree = create_revision_tree(root_, "HEAD", options);
        std::map<std::string, std::string> expected = {{"src/a.rs", "a"}};
        EXPECT_EQ(contents(*tree), expected);
    }

    TEST_F(GitTest, UnknownRevisionIsIoError) {
        write("a", "a");
        git_commit("one");
        EXPECT_THROW(create_revision_tree(root_, "no-such-branch", {}), IoError);
        EXPECT_THROW(create_revision_tree(root_, "--output=x", {}), IoError);
    }

    TEST_F(GitTest, TouchedSinceListsChangedPaths) {
        write("a.txt", "1");
        write("b.txt", "1");
        write("c.txt", "1");
        git_commit("one");
        const std::string first = head();

        write("a.txt", "2");
        remove("b.txt");
        write("d.txt", "new");
        git_commit("two");

        auto tree = create_revision_tree(root_, "HEAD", {});
        auto touched = tree->touched_since(first);
        ASSERT_TRUE(touched.has_value());
        std::sort(touched->begin(), touched->end());
        EXPECT_EQ(*touched, (std::vector<std::string>{"a.txt", "b.txt", "d.txt"}));
    }

    TEST_F(GitTest, SameFilesGiveSameFingerprintAsWorkingTree) {
        write("src/a.rs", "fn main(){}");
        write("src/b.rs", "fn b(){}");
        git_commit("one");

        auto resolver = PartResolver::compile({PartDefinition{"src", {SelectionRule::glob("src/**")}, {}, "."}});
        auto live = create_working_tree(root_, {});
        auto rev = create_revision_tree(root_, "HEAD", {});

        auto live_fp = Fingerprinter(*live).fingerprint(resolver.members_of("src", *live));
        auto rev_fp = Fingerprinter(*rev).fingerprint(resolver.members_of("src", *rev));
        EXPECT_EQ(live_fp, rev_fp);
    }

    TEST_F(GitTest, IgnoreFilesApplyAtRevisionAsInWorkingTree) {
        write(".partsignore", "gen/\n");
        write("gen/x.txt", "generated");
        write("a.txt", "a");
        write("sub/.partsignore", "local.txt\n");
        write("sub/local.txt", "l");
        write("sub/kept.txt", "k");
        git_commit("one");

        // Tracked despite .gitignore; the working tree skips it, so must the revision
        write(".gitignore", ".parts/\n*.log\n");
        write("build.log", "log");
        ASSERT_EQ(git("add -f build.log"), 0);
        git_commit("two");

        auto resolver = PartResolver::compile({PartDefinition{"all", {SelectionRule::glob("**")}, {}, "."}});
        auto live = create_working_tree(root_, {});
        auto rev = create_revision_tree(root_, "HEAD", {});

        auto live_members = resolver.members_of("all", *live);
        auto rev_members = resolver.members_of("all", *rev);
        std::vector<std::string> live_paths, rev_paths;
        for (const auto& r : live_members) live_paths.push_back(r.path);
        for (const auto& r : rev_members) rev_paths.push_back(r.path);
        EXPECT_EQ(live_paths, (std::vector<std::string>{"a.txt", "sub/kept.txt"}));
        EXPECT_EQ(rev_paths, live_paths);

        EXPECT_EQ(Fingerprinter(*live).fingerprint(live_members), Fingerprinter(*rev).fingerprint(rev_members));
    }

    TEST_F(GitTest, ExcludedPathsAreSkippedAtRevision) {
        write("a.txt", "a");
        write("parts-state.db", "tracked by mistake");
        git_commit("one");

        IgnoreOptions options;
        options.exclude(root_, root_ / "parts-state.db");
        auto rev = create_revision_tree(root_, "HEAD", options);
        std::map<std::string, std::string> expected = {{"a.txt", "a"}};
        EXPECT_EQ(contents(*rev), expected);
    }

    TEST_F(GitTest, UntouchedPartsAreReusedAndAgreeWithFullRecompute) {
        std::vector<PartDefinition> defs = {
            PartDefinition{"app", {SelectionRule::glob("app/**")}, {}, "."},
            PartDefinition{"lib", {SelectionRule::glob("lib/**")}, {}, "."},
        };
        write("app/main.rs", "app v1");
        write("lib/lib.rs", "lib v1");
        git_commit("one");
        auto first = run(defs, "HEAD");
        EXPECT_EQ(first.report.count(ChangeEntry::Kind::Added), 2u);

        write("app/main.rs", "app v2");
        git_commit("two");
        auto second = run(defs, "HEAD");
        EXPECT_FALSE(second.parts[0].reused);
        EXPECT_TRUE(second.parts[1].reused);
        EXPECT_EQ(second.report.find("app")->kind, ChangeEntry::Kind::Changed);
        EXPECT_EQ(second.report.find("lib")->kind, ChangeEntry::Kind::Unchanged);

        auto full = run(defs, "HEAD", true);
        EXPECT_FALSE(full.parts[1].reused);
        EXPECT_EQ(*full.parts[0].fingerprint, *second.parts[0].fingerprint);
        EXPECT_EQ(*full.parts[1].fingerprint, *second.parts[1].fingerprint);
        EXPECT_FALSE(full.report.has_changes());
    }

    TEST_F(GitTest, ChangedDefinitionDisablesReuse) {
        write("lib/lib.rs", "lib");
        write("lib/extra.txt", "txt");
        git_commit("one");
        run({PartDefinition{"lib", {SelectionRule::glob("lib/*.rs")}, {}, "."}}, "HEAD");

        git_commit("empty");
        auto next = run({PartDefinition{"lib", {SelectionRule::glob("lib/**")}, {}, "."}}, "HEAD");
        EXPECT_FALSE(next.parts[0].reused);
        EXPECT_EQ(next.report.find("lib")->kind, ChangeEntry::Kind::Changed);
    }

    TEST_F(GitTest, WorkingTreeRunsNeverReuse) {
        write("lib/lib.rs", "lib");
        git_commit("one");
        run({PartDefinition{"lib", {SelectionRule::glob("lib/**")}, {}, "."}}, "HEAD");

        auto resolver = PartResolver::compile({PartDefinition{"lib", {SelectionRule::glob("lib/**")}, {}, "."}});
        auto live = create_working_tree(root_, {});
        StateStore store(root_ / ".parts" / "state.db");
        RunOptions options;
        auto result = ChangeDetector(resolver, *live, store).run(options);
        EXPECT_FALSE(result.parts[0].reused);
        EXPECT_EQ(result.report.find("lib")->kind, ChangeEntry::Kind::Unchanged);
    }

}
