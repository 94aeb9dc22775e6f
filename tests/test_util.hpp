#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>
#include <unistd.h>

#include "engine/errors.hpp"
#include "engine/tree_source.hpp"

namespace parts::engine::test {

    // Temporary project directory, unique per test and process.
    class ProjectTest : public ::testing::Test {
    protected:
        std::filesystem::path root_;

        void SetUp() override {
            auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
            root_ = std::filesystem::temp_directory_path() /
                    (std::string("parts_") + info->test_suite_name() + "_" + info->name() + "_" + std::to_string(getpid()));
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
            std::filesystem::create_directories(root_);
        }

        void TearDown() override {
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
        }

        void write(const std::string& rel, const std::string& content) {
            auto path = root_ / rel;
            std::filesystem::create_directories(path.parent_path());
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            file << content;
        }

        void remove(const std::string& rel) {
            std::filesystem::remove(root_ / rel);
        }

        void rename(const std::string& from, const std::string& to) {
            std::filesystem::create_directories((root_ / to).parent_path());
            std::filesystem::rename(root_ / from, root_ / to);
        }

        // Runs a git command in the project; returns its exit status.
        int git(const std::string& args) {
            std::string cmd = "git -C '" + root_.string() + "' -c user.name=test -c user.email=test@example.com " +
                              args + " >/dev/null 2>&1";
            return std::system(cmd.c_str());
        }

        void git_init() {
            ASSERT_EQ(git("init -q"), 0);
        }

        void git_commit(const std::string& message) {
            ASSERT_EQ(git("add -A"), 0);
            ASSERT_EQ(git("commit -q --allow-empty -m '" + message + "'"), 0);
        }

        static bool git_available() {
            return std::system("git --version >/dev/null 2>&1") == 0;
        }
    };

    // In-memory tree with a controllable enumeration order and unreadable paths.
    class MemoryTree : public TreeSource {
    public:
        std::map<std::string, std::string> files;
        std::set<std::string> unreadable;
        bool reverse = false;

        void for_each_path(const PathCallback& callback) const override {
            std::vector<FileRecord> records;
            for (const auto& [path, content] : files) {
                FileRecord r;
                r.path = path;
                r.size = content.size();
                records.push_back(r);
            }
            if (reverse) std::reverse(records.begin(), records.end());
            for (const auto& r : records) callback(r);
        }

        void read(const FileRecord& record, const ChunkSink& sink) const override {
            if (unreadable.count(record.path)) throw IoError(record.path, "permission denied");
            auto it = files.find(record.path);
            if (it == files.end()) throw IoError(record.path, "no such file");
            // Split into small chunks to exercise streaming
            const std::string& data = it->second;
            for (size_t i = 0; i < data.size(); i += 3) {
                sink(data.data() + i, std::min<size_t>(3, data.size() - i));
            }
        }

        std::string describe() const override { return "memory"; }
    };

}
