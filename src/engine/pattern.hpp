#pragma once

#include <regex>
#include <string>
#include <vector>

namespace parts::engine {

    struct SelectionRule {
        enum class Kind {
            Glob,
            Regex
        };

        Kind kind = Kind::Glob;
        std::string pattern;

        static SelectionRule glob(std::string p) { return {Kind::Glob, std::move(p)}; }
        static SelectionRule regex(std::string p) { return {Kind::Regex, std::move(p)}; }

        /**
         * @brief "glob:src/**" or "regex:.*\.md$", used in messages and definition digests.
         */
        std::string describe() const;
    };

    /**
     * @brief Translates a shell glob into an ECMAScript regex matching a whole
     * project-relative path.
     *
     * '*' and '?' stop at '/', '**' crosses directories and a leading '**\/'
     * also matches zero directories. Character classes, {a,b} alternation and
     * backslash escapes are supported.
     *
     * @throws std::invalid_argument for unbalanced classes or braces, a trailing
     * escape, absolute patterns and '..' segments.
     */
    std::string glob_to_regex(const std::string& glob);

    class CompiledRule {
    public:
        /**
         * @throws std::invalid_argument or std::regex_error on a malformed pattern.
         */
        explicit CompiledRule(SelectionRule rule);

        // Globs must match the whole path, regexes may match anywhere in it.
        bool matches(const std::string& path) const;

        const SelectionRule& rule() const { return m_rule; }

    private:
        SelectionRule m_rule;
        std::regex m_regex;
    };

    /**
     * @brief Membership predicate of one part: inside the directory scope,
     * matched by an include rule and by no exclude rule.
     */
    class PathMatcher {
    public:
        PathMatcher() = default;
        PathMatcher(std::vector<CompiledRule> include, std::vector<CompiledRule> exclude, std::string directory);

        bool matches(const std::string& path) const;

        const std::string& directory() const { return m_directory; }

    private:
        std::vector<CompiledRule> m_include;
        std::vector<CompiledRule> m_exclude;
        std::string m_directory; // "" or "dir/" prefix
    };

    /**
     * @brief Normalizes a configured directory to "" (project root) or "a/b/".
     * @throws std::invalid_argument when the directory leaves the project.
     */
    std::string normalize_directory(const std::string& directory);

}
