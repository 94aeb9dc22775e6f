#include "pattern.hpp"
#include <stdexcept>

namespace parts::engine {

    namespace {
        bool is_regex_special(char c) {
            switch (c) {
                case '.': case '^': case '$': case '+': case '(': case ')':
                case '|': case '{': case '}': case '[': case ']': case '\\':
                case '*': case '?':
                    return true;
                default:
                    return false;
            }
        }

        void append_literal(std::string& out, char c) {
            if (is_regex_special(c)) out += '\\';
            out += c;
        }

        void check_scoped(const std::string& glob) {
            if (!glob.empty() && glob[0] == '/') {
                throw std::invalid_argument("absolute pattern escapes the project root");
            }
            size_t start = 0;
            while (start <= glob.size()) {
                size_t end = glob.find('/', start);
                if (end == std::string::npos) end = glob.size();
                if (glob.compare(start, end - start, "..") == 0) {
                    throw std::invalid_argument("'..' segment escapes the project root");
                }
                start = end + 1;
            }
        }

        // Parses a [...] class starting at glob[i] == '['. Returns index past ']'.
        size_t translate_class(const std::string& glob, size_t i, std::string& out) {
            size_t j = i + 1;
            out += '[';
            if (j < glob.size() && (glob[j] == '!' || glob[j] == '^')) {
                out += '^';
                ++j;
            }
            bool first = true;
            for (; j < glob.size(); ++j) {
                char c = glob[j];
                if (c == ']' && !first) {
                    out += ']';
                    return j + 1;
                }
                first = false;
                if (c == '\\' || c == '[' || c == ']' || c == '^') {
                    out += '\\';
                }
                out += c;
            }
            throw std::invalid_argument("unclosed character class");
        }
    }

    std::string SelectionRule::describe() const {
        return (kind == Kind::Glob ? "glob:" : "regex:") + pattern;
    }

    std::string glob_to_regex(const std::string& glob) {
        check_scoped(glob);

        std::string regex_str;
        int brace_depth = 0;
        for (size_t i = 0; i < glob.size();) {
            char c = glob[i];
            if (c == '*') {
                size_t run = i;
                while (run < glob.size() && glob[run] == '*') ++run;
                if (run - i == 1) {
                    regex_str += "[^/]*";
                    i = run;
                    continue;
                }
                bool at_segment_start = (i == 0 || glob[i - 1] == '/');
                if (at_segment_start && run < glob.size() && glob[run] == '/') {
                    regex_str += "(?:.*/)?";
                    i = run + 1;
                } else {
                    regex_str += ".*";
                    i = run;
                }
            } else if (c == '?') {
                regex_str += "[^/]";
                ++i;
            } else if (c == '[') {
                i = translate_class(glob, i, regex_str);
            } else if (c == '{') {
                if (brace_depth > 0) throw std::invalid_argument("nested alternation");
                ++brace_depth;
                regex_str += "(?:";
                ++i;
            } else if (c == '}' && brace_depth > 0) {
                --brace_depth;
                regex_str += ')';
                ++i;
            } else if (c == ',' && brace_depth > 0) {
                regex_str += '|';
                ++i;
            } else if (c == '\\') {
                if (i + 1 >= glob.size()) throw std::invalid_argument("dangling escape");
                append_literal(regex_str, glob[i + 1]);
                i += 2;
            } else {
                append_literal(regex_str, c);
                ++i;
            }
        }
        if (brace_depth != 0) throw std::invalid_argument("unclosed alternation");
        return regex_str;
    }

    CompiledRule::CompiledRule(SelectionRule rule)
        : m_rule(std::move(rule)) {
        const std::string source = m_rule.kind == SelectionRule::Kind::Glob
            ? glob_to_regex(m_rule.pattern)
            : m_rule.pattern;
        m_regex = std::regex(source, std::regex::ECMAScript | std::regex::optimize);
    }

    bool CompiledRule::matches(const std::string& path) const {
        if (m_rule.kind == SelectionRule::Kind::Glob) {
            return std::regex_match(path, m_regex);
        }
        return std::regex_search(path, m_regex);
    }

    PathMatcher::PathMatcher(std::vector<CompiledRule> include, std::vector<CompiledRule> exclude, std::string directory)
        : m_include(std::move(include)), m_exclude(std::move(exclude)), m_directory(std::move(directory)) {}

    bool PathMatcher::matches(const std::string& path) const {
        if (!m_directory.empty() && path.compare(0, m_directory.size(), m_directory) != 0) {
            return false;
        }

        bool included = false;
        for (const auto& rule : m_include) {
            if (rule.matches(path)) {
                included = true;
                break;
            }
        }
        if (!included) return false;

        for (const auto& rule : m_exclude) {
            if (rule.matches(path)) return false;
        }
        return true;
    }

    std::string normalize_directory(const std::string& directory) {
        std::string dir = directory;
        for (auto& c : dir) {
            if (c == '\\') c = '/';
        }
        while (dir.compare(0, 2, "./") == 0) dir.erase(0, 2);
        while (!dir.empty() && dir.back() == '/') dir.pop_back();
        if (dir.empty() || dir == ".") return "";

        check_scoped(dir);
        return dir + "/";
    }

}
