#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace parts::engine::git {

    struct TreeEntry {
        std::string path; // relative to the project directory
        std::string blob_id;
        std::uintmax_t size = 0;
    };

    using ChunkSink = std::function<void(const char*, size_t)>;

    /**
     * @brief True if a git executable can be run.
     */
    bool available();

    /**
     * @brief Resolves a revision expression to a full commit id.
     * @throws IoError if git fails or the revision does not name a commit.
     */
    std::string rev_parse(const std::filesystem::path& dir, const std::string& revision);

    /**
     * @brief Blobs recorded in a revision's tree below dir. Submodules and
     * symlinks are left out.
     */
    std::vector<TreeEntry> list_tree(const std::filesystem::path& dir, const std::string& revision);

    void read_blob(const std::filesystem::path& dir, const std::string& blob_id, const ChunkSink& sink);

    /**
     * @brief Paths below dir touched between two revisions (added, deleted, modified).
     */
    std::vector<std::string> changed_paths(const std::filesystem::path& dir, const std::string& from, const std::string& to);

}
