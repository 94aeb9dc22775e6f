#include "git.hpp"
#include "errors.hpp"
#include <cstdio>
#include <sstream>
#include <sys/wait.h>

namespace parts::engine::git {

    namespace {
        constexpr size_t kPipeChunk = 64 * 1024;

        class Pipe {
        public:
            explicit Pipe(const std::string& command)
                : m_file(popen(command.c_str(), "r")) {}

            ~Pipe() {
                if (m_file) pclose(m_file);
            }

            Pipe(const Pipe&) = delete;
            Pipe& operator=(const Pipe&) = delete;

            FILE* get() const { return m_file; }

            int close() {
                int status = pclose(m_file);
                m_file = nullptr;
                return status;
            }

        private:
            FILE* m_file;
        };

        std::string shell_quote(const std::string& s) {
            std::string out = "'";
            for (char c : s) {
                if (c == '\'') out += "'\\''";
                else out += c;
            }
            out += "'";
            return out;
        }

        void check_revision(const std::string& revision) {
            if (revision.empty() || revision[0] == '-') {
                throw IoError(revision, "invalid git revision");
            }
        }

        void run(const std::filesystem::path& dir, const std::string& args, const ChunkSink& sink) {
            const std::string command = "git -C " + shell_quote(dir.string()) + " " + args;
            Pipe pipe(command);
            if (!pipe.get()) throw IoError(command, "cannot start git");

            std::vector<char> buffer(kPipeChunk);
            size_t n;
            while ((n = fread(buffer.data(), 1, buffer.size(), pipe.get())) > 0) {
                sink(buffer.data(), n);
            }
            const bool read_error = ferror(pipe.get()) != 0;
            const int status = pipe.close();

            if (read_error) throw IoError(command, "error reading git output");
            if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
                int code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
                throw IoError(command, "git exited with status " + std::to_string(code));
            }
        }

        std::string capture(const std::filesystem::path& dir, const std::string& args) {
            std::string out;
            run(dir, args, [&out](const char* data, size_t n) { out.append(data, n); });
            return out;
        }

        std::string first_line(const std::string& s) {
            return s.substr(0, s.find('\n'));
        }

        std::vector<std::string> split_nul(const std::string& s) {
            std::vector<std::string> parts;
            size_t start = 0;
            while (start < s.size()) {
                size_t end = s.find('\0', start);
                if (end == std::string::npos) end = s.size();
                if (end > start) parts.push_back(s.substr(start, end - start));
                start = end + 1;
            }
            return parts;
        }
    }

    bool available() {
        try {
            return !capture(".", "--version").empty();
        } catch (const IoError&) {
            return false;
        }
    }

    std::string rev_parse(const std::filesystem::path& dir, const std::string& revision) {
        check_revision(revision);
        std::string id = first_line(capture(dir, "rev-parse --verify --quiet " + shell_quote(revision + "^{commit}")));
        if (id.empty()) throw IoError(revision, "unknown git revision");
        return id;
    }

    std::vector<TreeEntry> list_tree(const std::filesystem::path& dir, const std::string& revision) {
        check_revision(revision);
        const std::string prefix = first_line(capture(dir, "rev-parse --show-prefix"));
        const std::string listing = capture(dir, "ls-tree -r -z -l --full-tree " + shell_quote(revision));

        std::vector<TreeEntry> entries;
        for (const auto& record : split_nul(listing)) {
            size_t tab = record.find('\t');
            if (tab == std::string::npos) {
                throw IoError(revision, "unexpected ls-tree output");
            }

            std::istringstream meta(record.substr(0, tab));
            std::string mode, type, oid, size;
            meta >> mode >> type >> oid >> size;
            if (type != "blob" || mode == "120000") continue;

            std::string path = record.substr(tab + 1);
            if (path.compare(0, prefix.size(), prefix) != 0) continue;

            TreeEntry entry;
            entry.path = path.substr(prefix.size());
            entry.blob_id = oid;
            try {
                entry.size = std::stoull(size);
            } catch (const std::exception&) {
                throw IoError(entry.path, "unexpected ls-tree size field");
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    void read_blob(const std::filesystem::path& dir, const std::string& blob_id, const ChunkSink& sink) {
        check_revision(blob_id);
        run(dir, "cat-file blob " + shell_quote(blob_id), sink);
    }

    std::vector<std::string> changed_paths(const std::filesystem::path& dir, const std::string& from, const std::string& to) {
        check_revision(from);
        check_revision(to);
        return split_nul(capture(dir, "diff --name-only -z --no-renames --relative " +
                                      shell_quote(from) + " " + shell_quote(to)));
    }

}
