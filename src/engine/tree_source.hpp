#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ignore.hpp"
#include "parts/types.hpp"

namespace parts::engine {

    /**
     * @brief Enumeration and content access over one project tree.
     * Implementations walk the live filesystem or a git revision; the resolver
     * and fingerprinter only see this interface.
     */
    class TreeSource {
    public:
        using PathCallback = std::function<void(const FileRecord&)>;
        using ChunkSink = std::function<void(const char*, size_t)>;

        virtual ~TreeSource() = default;

        /**
         * @brief Runs one full pass over the regular files of the tree.
         * Every call is a fresh pass; the order is unspecified.
         * @throws IoError if the tree cannot be enumerated.
         */
        virtual void for_each_path(const PathCallback& callback) const = 0;

        /**
         * @brief Streams the content of one file to the sink in chunks.
         * Safe to call from several threads at once.
         * @throws IoError if the content cannot be read completely.
         */
        virtual void read(const FileRecord& record, const ChunkSink& sink) const = 0;

        /**
         * @brief Human-readable origin, e.g. "working tree /src/proj".
         */
        virtual std::string describe() const = 0;

        /**
         * @brief Commit id the tree was taken from, empty for the live tree.
         */
        virtual std::optional<std::string> revision() const { return std::nullopt; }

        /**
         * @brief Paths that differ between an older revision and this tree,
         * or nullopt when the backend cannot tell.
         */
        virtual std::optional<std::vector<std::string>> touched_since(const std::string& revision) const {
            (void)revision;
            return std::nullopt;
        }
    };

    std::unique_ptr<TreeSource> create_working_tree(const std::filesystem::path& root, IgnoreOptions options);
    std::unique_ptr<TreeSource> create_revision_tree(const std::filesystem::path& root, const std::string& revision, IgnoreOptions options);

    /**
     * @brief Relative path of entry under root with '/' separators.
     */
    std::string relative_key(const std::filesystem::path& root, const std::filesystem::path& entry);

}
