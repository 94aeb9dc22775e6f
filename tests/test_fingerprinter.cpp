#include "test_util.hpp"

#include <atomic>

#include "engine/errors.hpp"
#include "engine/fingerprinter.hpp"
#include "engine/resolver.hpp"

namespace parts::engine::test {

    namespace {
        std::vector<FileRecord> all_of(const TreeSource& tree) {
            std::vector<FileRecord> out;
            tree.for_each_path([&](const FileRecord& r) { out.push_back(r); });
            return out;
        }

        Fingerprint fingerprint(const MemoryTree& tree) {
            return Fingerprinter(tree).fingerprint(all_of(tree));
        }
    }

    TEST(FingerprinterTest, KnownSha256Vector) {
        crypto::SHA256 sha;
        sha.update(std::string("abc"));
        Fingerprint fp;
        fp.bytes = sha.finish();
        EXPECT_EQ(fp.hex(), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    TEST(FingerprinterTest, EmptyPartHasStableDigest) {
        MemoryTree tree;
        EXPECT_EQ(fingerprint(tree), Fingerprinter::empty());
        EXPECT_EQ(Fingerprinter::empty(), Fingerprinter::empty());

        crypto::SHA256 plain;
        Fingerprint nothing;
        nothing.bytes = plain.finish();
        EXPECT_NE(Fingerprinter::empty(), nothing);
    }

    TEST(FingerprinterTest, DeterministicAndOrderIndependent) {
        MemoryTree forward;
        forward.files = {{"a.rs", "alpha"}, {"b/c.rs", "gamma"}, {"z.rs", "zeta"}};
        MemoryTree backward = forward;
        backward.reverse = true;

        EXPECT_EQ(fingerprint(forward), fingerprint(forward));
        EXPECT_EQ(fingerprint(forward), fingerprint(backward));
    }

    TEST(FingerprinterTest, EveryByteMatters) {
        MemoryTree tree;
        tree.files = {{"a.rs", "fn main(){}"}, {"b.rs", "fn other(){}"}};
        const Fingerprint base = fingerprint(tree);

        for (size_t i = 0; i < tree.files["a.rs"].size(); ++i) {
            MemoryTree edited = tree;
            edited.files["a.rs"][i] ^= 0x01;
            EXPECT_NE(fingerprint(edited), base) << "byte " << i;
        }
    }

    TEST(FingerprinterTest, RenameChangesDigest) {
        MemoryTree tree;
        tree.files = {{"a.rs", "same"}};
        MemoryTree renamed;
        renamed.files = {{"b.rs", "same"}};
        EXPECT_NE(fingerprint(tree), fingerprint(renamed));
    }

    TEST(FingerprinterTest, MembershipChangesDigest) {
        MemoryTree one;
        one.files = {{"a.rs", "x"}};
        MemoryTree two = one;
        two.files["b.rs"] = "";
        EXPECT_NE(fingerprint(one), fingerprint(two));
        EXPECT_NE(fingerprint(one), Fingerprinter::empty());
    }

    TEST(FingerprinterTest, ContentBoundariesDoNotCollide) {
        // Same concatenated bytes, split differently across files
        MemoryTree a;
        a.files = {{"f1", "ab"}, {"f2", "c"}};
        MemoryTree b;
        b.files = {{"f1", "a"}, {"f2", "bc"}};
        EXPECT_NE(fingerprint(a), fingerprint(b));

        MemoryTree truncated;
        truncated.files = {{"f1", "ab"}, {"f2", ""}};
        EXPECT_NE(fingerprint(a), fingerprint(truncated));
    }

    TEST(FingerprinterTest, ReadErrorIsNotEmptyContent) {
        MemoryTree tree;
        tree.files = {{"a.rs", "x"}};
        tree.unreadable = {"a.rs"};
        EXPECT_THROW(fingerprint(tree), IoError);
    }

    TEST(FingerprinterTest, FingerprintAllIsolatesFailuresPerPart) {
        MemoryTree tree;
        tree.files = {{"src/a.rs", "a"}, {"src/b.rs", "b"}, {"docs/x.md", "x"}, {"secret/key", "k"}};
        tree.unreadable = {"secret/key"};

        auto resolver = PartResolver::compile({
            PartDefinition{"src", {SelectionRule::glob("src/**")}, {}, "."},
            PartDefinition{"docs", {SelectionRule::glob("docs/**")}, {}, "."},
            PartDefinition{"secret", {SelectionRule::glob("secret/**")}, {}, "."},
        });
        auto members = resolver.resolve(tree);

        FingerprintOptions options;
        options.jobs = 3;
        auto results = Fingerprinter(tree).fingerprint_all(resolver.parts(), members, options);

        ASSERT_EQ(results.size(), 3u);
        EXPECT_EQ(results[0].name, "src");
        EXPECT_TRUE(results[0].fingerprint.has_value());
        EXPECT_EQ(results[0].files, 2u);
        EXPECT_TRUE(results[1].fingerprint.has_value());
        EXPECT_FALSE(results[2].fingerprint.has_value());
        EXPECT_NE(results[2].error.find("secret/key"), std::string::npos);

        EXPECT_EQ(*results[0].fingerprint, Fingerprinter(tree).fingerprint(members[0]));
    }

    TEST(FingerprinterTest, ParallelMatchesSerial) {
        MemoryTree tree;
        std::vector<PartDefinition> defs;
        for (int i = 0; i < 16; ++i) {
            const std::string dir = "p" + std::to_string(i);
            for (int j = 0; j < 5; ++j) {
                tree.files[dir + "/f" + std::to_string(j)] = std::string(100 + i * j, char('a' + j));
            }
            defs.push_back(PartDefinition{dir, {SelectionRule::glob(dir + "/**")}, {}, "."});
        }
        auto resolver = PartResolver::compile(defs);
        auto members = resolver.resolve(tree);

        FingerprintOptions serial;
        serial.jobs = 1;
        FingerprintOptions parallel;
        parallel.jobs = 8;
        auto a = Fingerprinter(tree).fingerprint_all(resolver.parts(), members, serial);
        auto b = Fingerprinter(tree).fingerprint_all(resolver.parts(), members, parallel);
        for (size_t i = 0; i < a.size(); ++i) {
            EXPECT_EQ(*a[i].fingerprint, *b[i].fingerprint) << a[i].name;
        }
    }

    TEST(FingerprinterTest, SkippedPartsAreNotRead) {
        MemoryTree tree;
        tree.files = {{"a/x", "1"}, {"b/y", "2"}};
        tree.unreadable = {"a/x"};

        auto resolver = PartResolver::compile({
            PartDefinition{"a", {SelectionRule::glob("a/**")}, {}, "."},
            PartDefinition{"b", {SelectionRule::glob("b/**")}, {}, "."},
        });
        auto members = resolver.resolve(tree);
        auto results = Fingerprinter(tree).fingerprint_all(resolver.parts(), members, {}, {true, false});

        EXPECT_FALSE(results[0].fingerprint.has_value());
        EXPECT_TRUE(results[0].error.empty());
        EXPECT_EQ(results[0].files, 1u);
        EXPECT_TRUE(results[1].fingerprint.has_value());
    }

    TEST(FingerprinterTest, CancellationAborts) {
        MemoryTree tree;
        tree.files = {{"a", "1"}};
        auto resolver = PartResolver::compile({PartDefinition{"all", {SelectionRule::glob("**")}, {}, "."}});
        auto members = resolver.resolve(tree);

        std::atomic<bool> cancel{true};
        FingerprintOptions options;
        options.cancel = &cancel;
        EXPECT_THROW(Fingerprinter(tree).fingerprint_all(resolver.parts(), members, options), Cancelled);
    }

}
