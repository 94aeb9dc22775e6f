#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <regex>

namespace parts::engine {

    /**
     * @brief Ignore configuration handed to a tree source. Nothing here is
     * process-wide; two sources with different options can walk concurrently.
     */
    struct IgnoreOptions {
        bool use_gitignore = true;
        bool ignore_hidden = true;
        std::vector<std::string> ignore_files{".partsignore"};
        std::vector<std::string> patterns; // gitignore syntax, relative to the root
        std::vector<std::string> exclude_paths; // exact relative paths, never members

        /**
         * @brief Excludes file from enumeration when it lies inside root.
         * Used to keep the state database out of every part.
         */
        void exclude(const std::filesystem::path& root, const std::filesystem::path& file);

        bool excluded(const std::string& path) const;

        /**
         * @brief Stable text form, folded into part definition digests.
         */
        std::string signature() const;
    };

    class Ignore {
    public:
        /**
         * @brief Loads patterns from a gitignore-style file.
         * @param ignore_file Path to the ignore file. Missing files are skipped.
         * @param base Directory the file lives in, "" for the root or "dir/".
         */
        void load(const std::filesystem::path& ignore_file, const std::string& base);

        /**
         * @brief Adds every line of an ignore file's content.
         * @param origin Shown in warnings about invalid lines.
         */
        void add_lines(const std::string& text, const std::string& base, const std::string& origin);

        /**
         * @brief Adds one gitignore line. Blank lines and comments are skipped.
         * @return false if the pattern could not be compiled.
         */
        bool add(const std::string& line, const std::string& base);

        /**
         * @brief Adds the always-ignored entries (.git).
         */
        void add_defaults();

        /**
         * @brief Checks if a path should be ignored. The last matching rule wins,
         * so a later "!pattern" re-includes.
         * @param path Project-relative path with '/' separators.
         * @param is_directory Directory-only rules ("build/") apply to directories only.
         */
        bool check(const std::string& path, bool is_directory) const;

        size_t size() const { return m_patterns.size(); }

    private:
        struct Pattern {
            std::regex regex;
            std::string original;
            std::string base;
            bool negated = false;
            bool directory_only = false;
        };
        std::vector<Pattern> m_patterns;
    };

    /**
     * @brief True when any segment of a relative path starts with '.'.
     */
    bool is_hidden_path(const std::string& path);

}
