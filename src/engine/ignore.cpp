#include "ignore.hpp"
#include "pattern.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace parts::engine {

    std::string IgnoreOptions::signature() const {
        std::string sig;
        sig += use_gitignore ? "gitignore;" : "no-gitignore;";
        sig += ignore_hidden ? "hidden;" : "no-hidden;";
        for (const auto& f : ignore_files) sig += "file:" + f + ";";
        for (const auto& p : patterns) sig += "pattern:" + p + ";";
        return sig;
    }

    void IgnoreOptions::exclude(const std::filesystem::path& root, const std::filesystem::path& file) {
        const auto rel = file.lexically_normal().lexically_relative(root.lexically_normal());
        if (rel.empty() || rel.is_absolute()) return;
        const std::string key = rel.generic_string();
        if (key == "." || key.compare(0, 2, "..") == 0) return;
        exclude_paths.push_back(key);
    }

    bool IgnoreOptions::excluded(const std::string& path) const {
        return std::find(exclude_paths.begin(), exclude_paths.end(), path) != exclude_paths.end();
    }

    void Ignore::load(const std::filesystem::path& ignore_file, const std::string& base) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(ignore_file, ec)) return;

        std::ifstream file(ignore_file);
        if (!file) {
            std::cerr << "[Ignore] Cannot read " << ignore_file.string() << ", rules skipped\n";
            return;
        }
        std::stringstream content;
        content << file.rdbuf();
        add_lines(content.str(), base, ignore_file.string());
    }

    void Ignore::add_lines(const std::string& text, const std::string& base, const std::string& origin) {
        std::istringstream lines(text);
        std::string line;
        while (std::getline(lines, line)) {
            if (!add(line, base)) {
                std::cerr << "[Ignore] Skipping invalid pattern in " << origin << ": " << line << "\n";
            }
        }
    }

    bool Ignore::add(const std::string& raw, const std::string& base) {
        std::string line = raw;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        // Trailing spaces are insignificant unless escaped
        while (!line.empty() && line.back() == ' ' && !(line.size() > 1 && line[line.size() - 2] == '\\')) {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') return true;

        Pattern p;
        p.original = line;
        p.base = base;

        if (line[0] == '!') {
            p.negated = true;
            line.erase(0, 1);
        } else if (line.compare(0, 2, "\\!") == 0 || line.compare(0, 2, "\\#") == 0) {
            line.erase(0, 1);
        }
        if (!line.empty() && line.back() == '/') {
            p.directory_only = true;
            line.pop_back();
        }
        if (line.empty()) return false;

        // A slash anywhere but the end anchors the pattern to its base
        bool anchored = line.find('/') != std::string::npos;
        if (line[0] == '/') line.erase(0, 1);

        try {
            std::string body = glob_to_regex(line);
            if (!anchored && body.compare(0, 8, "(?:.*/)?") != 0) {
                body = "(?:.*/)?" + body;
            }
            p.regex = std::regex(body, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::regex_error&) {
            return false;
        }

        m_patterns.push_back(std::move(p));
        return true;
    }

    void Ignore::add_defaults() {
        add(".git/", "");
    }

    bool Ignore::check(const std::string& path, bool is_directory) const {
        bool ignored = false;
        for (const auto& p : m_patterns) {
            if (p.directory_only && !is_directory) continue;
            if (!p.base.empty() && path.compare(0, p.base.size(), p.base) != 0) continue;

            if (std::regex_match(path.begin() + p.base.size(), path.end(), p.regex)) {
                ignored = !p.negated;
            }
        }
        return ignored;
    }

    bool is_hidden_path(const std::string& path) {
        size_t start = 0;
        while (start < path.size()) {
            if (path[start] == '.') return true;
            size_t slash = path.find('/', start);
            if (slash == std::string::npos) break;
            start = slash + 1;
        }
        return false;
    }

}
