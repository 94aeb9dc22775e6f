#include "tree_source.hpp"
#include "errors.hpp"
#include <fstream>
#include <vector>

namespace parts::engine {

    namespace {
        constexpr size_t kReadChunk = 64 * 1024;

        class WorkingTree : public TreeSource {
        public:
            WorkingTree(const std::filesystem::path& root, IgnoreOptions options)
                : m_root(root), m_options(std::move(options)) {
                m_ignore.add_defaults();
                for (const auto& p : m_options.patterns) {
                    if (!m_ignore.add(p, "")) {
                        throw ConfigError("invalid ignore pattern \"" + p + "\"");
                    }
                }
            }

            void for_each_path(const PathCallback& callback) const override {
                std::error_code ec;
                if (!std::filesystem::is_directory(m_root, ec)) {
                    throw IoError(m_root.string(), "project root is not a directory");
                }

                // Rules from nested ignore files only live for this pass
                // .git/info/exclude ranks below every .gitignore, so it goes first
                Ignore ignore = m_ignore;
                if (m_options.use_gitignore) {
                    ignore.load(m_root / ".git" / "info" / "exclude", "");
                }
                load_ignore_files(ignore, m_root, "");

                std::filesystem::recursive_directory_iterator it(m_root, std::filesystem::directory_options::none, ec);
                if (ec) throw IoError(m_root.string(), "cannot enumerate directory (" + ec.message() + ")");

                const std::filesystem::recursive_directory_iterator end;
                while (it != end) {
                    const auto& entry = *it;
                    const std::string rel = relative_key(m_root, entry.path());

                    auto status = entry.symlink_status(ec);
                    if (ec) throw IoError(rel, "cannot stat (" + ec.message() + ")");
                    const bool is_dir = std::filesystem::is_directory(status);

                    const std::string name = entry.path().filename().string();
                    if ((m_options.ignore_hidden && !name.empty() && name[0] == '.') || ignore.check(rel, is_dir)) {
                        if (is_dir) it.disable_recursion_pending();
                    } else if (is_dir) {
                        load_ignore_files(ignore, entry.path(), rel + "/");
                    } else if (std::filesystem::is_regular_file(status) && !m_options.excluded(rel)) {
                        FileRecord record;
                        record.path = rel;
                        record.size = entry.file_size(ec);
                        if (ec) throw IoError(rel, "cannot stat (" + ec.message() + ")");
                        callback(record);
                    }
                    // Symlinks and special files are never members

                    it.increment(ec);
                    if (ec) throw IoError(rel, "cannot enumerate directory (" + ec.message() + ")");
                }
            }

            void read(const FileRecord& record, const ChunkSink& sink) const override {
                std::ifstream file(m_root / record.path, std::ios::binary);
                if (!file) throw IoError(record.path, "cannot open file");

                std::vector<char> buffer(kReadChunk);
                while (file) {
                    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                    std::streamsize n = file.gcount();
                    if (n > 0) sink(buffer.data(), static_cast<size_t>(n));
                }
                if (file.bad()) throw IoError(record.path, "read failed");
            }

            std::string describe() const override {
                return "working tree " + m_root.string();
            }

        private:
            std::filesystem::path m_root;
            IgnoreOptions m_options;
            Ignore m_ignore;

            void load_ignore_files(Ignore& ignore, const std::filesystem::path& dir, const std::string& base) const {
                if (m_options.use_gitignore) ignore.load(dir / ".gitignore", base);
                for (const auto& f : m_options.ignore_files) {
                    ignore.load(dir / f, base);
                }
            }
        };
    }

    std::string relative_key(const std::filesystem::path& root, const std::filesystem::path& entry) {
        return entry.lexically_relative(root).generic_string();
    }

    std::unique_ptr<TreeSource> create_working_tree(const std::filesystem::path& root, IgnoreOptions options) {
        return std::make_unique<WorkingTree>(root, std::move(options));
    }

}
