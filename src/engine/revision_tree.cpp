#include "tree_source.hpp"
#include "errors.hpp"
#include "git.hpp"
#include <algorithm>

namespace parts::engine {

    namespace {
        class RevisionTree : public TreeSource {
        public:
            RevisionTree(const std::filesystem::path& root, const std::string& revision, IgnoreOptions options)
                : m_root(root), m_options(std::move(options)) {
                for (const auto& p : m_options.patterns) {
                    if (!m_ignore.add(p, "")) {
                        throw ConfigError("invalid ignore pattern \"" + p + "\"");
                    }
                }
                m_commit = git::rev_parse(m_root, revision);
                m_entries = git::list_tree(m_root, m_commit);
                load_ignore_files();
            }

            void for_each_path(const PathCallback& callback) const override {
                for (const auto& entry : m_entries) {
                    if (m_options.ignore_hidden && is_hidden_path(entry.path)) continue;
                    if (m_options.excluded(entry.path) || ignored(entry.path)) continue;

                    FileRecord record;
                    record.path = entry.path;
                    record.size = entry.size;
                    record.blob_id = entry.blob_id;
                    callback(record);
                }
            }

            void read(const FileRecord& record, const ChunkSink& sink) const override {
                if (record.blob_id.empty()) throw IoError(record.path, "no blob recorded for path");
                git::read_blob(m_root, record.blob_id, sink);
            }

            std::string describe() const override {
                return "revision " + m_commit;
            }

            std::optional<std::string> revision() const override { return m_commit; }

            std::optional<std::vector<std::string>> touched_since(const std::string& revision) const override {
                return git::changed_paths(m_root, revision, m_commit);
            }

        private:
            std::filesystem::path m_root;
            IgnoreOptions m_options;
            Ignore m_ignore;
            std::string m_commit;
            std::vector<git::TreeEntry> m_entries;

            // Same rule sources as the working tree, but the per-directory
            // files are read from the revision. Parents load before children
            // so deeper rules win.
            void load_ignore_files() {
                if (m_options.use_gitignore) {
                    m_ignore.load(m_root / ".git" / "info" / "exclude", "");
                }

                std::vector<std::string> names;
                if (m_options.use_gitignore) names.push_back(".gitignore");
                names.insert(names.end(), m_options.ignore_files.begin(), m_options.ignore_files.end());

                struct Found {
                    size_t depth;
                    std::string base;
                    size_t rank; // position in names
                    const git::TreeEntry* entry;
                };
                std::vector<Found> found;
                for (const auto& entry : m_entries) {
                    const size_t slash = entry.path.rfind('/');
                    const std::string base = slash == std::string::npos ? "" : entry.path.substr(0, slash + 1);
                    const std::string name = entry.path.substr(base.size());
                    auto it = std::find(names.begin(), names.end(), name);
                    if (it == names.end()) continue;
                    const size_t depth = static_cast<size_t>(std::count(base.begin(), base.end(), '/'));
                    found.push_back({depth, base, static_cast<size_t>(it - names.begin()), &entry});
                }
                std::sort(found.begin(), found.end(), [](const Found& a, const Found& b) {
                    if (a.depth != b.depth) return a.depth < b.depth;
                    if (a.base != b.base) return a.base < b.base;
                    return a.rank < b.rank;
                });

                for (const auto& f : found) {
                    std::string text;
                    git::read_blob(m_root, f.entry->blob_id, [&text](const char* data, size_t n) { text.append(data, n); });
                    m_ignore.add_lines(text, f.base, f.entry->path + " at " + m_commit);
                }
            }

            // A path is ignored when it or any parent directory matches
            bool ignored(const std::string& path) const {
                if (m_ignore.size() == 0) return false;
                for (size_t slash = path.find('/'); slash != std::string::npos; slash = path.find('/', slash + 1)) {
                    if (m_ignore.check(path.substr(0, slash), true)) return true;
                }
                return m_ignore.check(path, false);
            }
        };
    }

    std::unique_ptr<TreeSource> create_revision_tree(const std::filesystem::path& root, const std::string& revision, IgnoreOptions options) {
        return std::make_unique<RevisionTree>(root, revision, std::move(options));
    }

}
