#include "state_store.hpp"
#include "errors.hpp"

namespace parts::engine {

    namespace {
        constexpr int kBusyTimeoutMs = 10000;

        const char* kSchema =
            "CREATE TABLE IF NOT EXISTS meta ("
            "  key TEXT PRIMARY KEY,"
            "  value TEXT NOT NULL"
            ");"
            "CREATE TABLE IF NOT EXISTS parts ("
            "  name TEXT PRIMARY KEY,"
            "  digest TEXT NOT NULL,"
            "  revision TEXT,"
            "  definition TEXT NOT NULL,"
            "  updated_at INTEGER NOT NULL"
            ");";

        class Statement {
        public:
            Statement() = default;
            ~Statement() { sqlite3_finalize(m_stmt); }

            Statement(const Statement&) = delete;
            Statement& operator=(const Statement&) = delete;

            sqlite3_stmt** out() { return &m_stmt; }
            sqlite3_stmt* get() const { return m_stmt; }

        private:
            sqlite3_stmt* m_stmt = nullptr;
        };

        // Rolls back unless commit() was reached
        class Transaction {
        public:
            explicit Transaction(sqlite3* db) : m_db(db) {}
            ~Transaction() {
                if (!m_done) sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
            }
            void done() { m_done = true; }

        private:
            sqlite3* m_db;
            bool m_done = false;
        };

        std::string column_text(sqlite3_stmt* stmt, int col) {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            return text ? reinterpret_cast<const char*>(text) : "";
        }
    }

    StateStore::StateStore(std::filesystem::path path)
        : m_path(std::move(path)) {}

    StateStore::~StateStore() { close(); }

    void StateStore::open(bool writable) {
        close();
        int flags = writable ? (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE) : SQLITE_OPEN_READONLY;
        int rc = sqlite3_open_v2(m_path.c_str(), &m_db, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
            close();
            throw IoError(m_path.string(), "cannot open state file (" + msg + ")");
        }
        sqlite3_busy_timeout(m_db, kBusyTimeoutMs);
    }

    void StateStore::close() {
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
    }

    void StateStore::fail(const std::string& what, int rc) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        if (rc == SQLITE_NOTADB || rc == SQLITE_CORRUPT || rc == SQLITE_ERROR) {
            throw StateFormatError("unreadable state file " + m_path.string() + ": " + what + " (" + msg + ")");
        }
        throw IoError(m_path.string(), what + " (" + msg + ")");
    }

    void StateStore::exec(const char* sql) {
        int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) fail(sql, rc);
    }

    std::optional<std::string> StateStore::meta(const char* key) {
        Statement stmt;
        int rc = sqlite3_prepare_v2(m_db, "SELECT value FROM meta WHERE key = ?;", -1, stmt.out(), nullptr);
        if (rc != SQLITE_OK) fail("reading meta table", rc);

        sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
        rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_ROW) return column_text(stmt.get(), 0);
        if (rc != SQLITE_DONE) fail("reading meta table", rc);
        return std::nullopt;
    }

    std::optional<Snapshot> StateStore::load() {
        std::error_code ec;
        bool exists = std::filesystem::exists(m_path, ec);
        if (ec) throw IoError(m_path.string(), "cannot stat state file (" + ec.message() + ")");
        if (!exists) return std::nullopt;

        open(false);
        struct CloseGuard {
            StateStore* store;
            ~CloseGuard() { store->close(); }
        } guard{this};

        exec("BEGIN;");
        Transaction tx(m_db);

        auto format = meta("format");
        if (!format || *format != kFormat) {
            throw StateFormatError("state file " + m_path.string() + " has unknown format \"" + format.value_or("") + "\"");
        }
        auto version = meta("version");
        if (!version || *version != std::to_string(kVersion)) {
            throw StateFormatError("state file " + m_path.string() + " has unsupported version \"" + version.value_or("") +
                                   "\" (expected " + std::to_string(kVersion) + ")");
        }

        Snapshot snapshot;
        try {
            snapshot.generation = std::stoll(meta("generation").value_or("0"));
        } catch (const std::exception&) {
            throw StateFormatError("state file " + m_path.string() + " has a corrupt generation counter");
        }

        Statement stmt;
        int rc = sqlite3_prepare_v2(m_db, "SELECT name, digest, revision, definition, updated_at FROM parts;", -1, stmt.out(), nullptr);
        if (rc != SQLITE_OK) fail("reading parts table", rc);

        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            std::string name = column_text(stmt.get(), 0);
            auto fp = Fingerprint::from_hex(column_text(stmt.get(), 1));
            if (name.empty() || !fp) {
                throw StateFormatError("state file " + m_path.string() + " has a corrupt entry for part \"" + name + "\"");
            }

            SnapshotEntry entry;
            entry.fingerprint = *fp;
            if (sqlite3_column_type(stmt.get(), 2) != SQLITE_NULL) {
                entry.revision = column_text(stmt.get(), 2);
            }
            entry.definition = column_text(stmt.get(), 3);
            entry.updated_at = sqlite3_column_int64(stmt.get(), 4);
            snapshot.parts[name] = entry;
        }
        if (rc != SQLITE_DONE) fail("reading parts table", rc);

        exec("COMMIT;");
        tx.done();
        return snapshot;
    }

    int64_t StateStore::commit(const Snapshot& snapshot, int64_t expected_generation) {
        std::error_code ec;
        if (m_path.has_parent_path()) {
            std::filesystem::create_directories(m_path.parent_path(), ec);
            if (ec) throw IoError(m_path.parent_path().string(), "cannot create state directory (" + ec.message() + ")");
        }

        open(true);
        struct CloseGuard {
            StateStore* store;
            ~CloseGuard() { store->close(); }
        } guard{this};

        // Takes the write lock up front; concurrent committers queue here
        exec("BEGIN IMMEDIATE;");
        Transaction tx(m_db);
        exec(kSchema);

        auto format = meta("format");
        if (format) {
            auto version = meta("version");
            if (*format != kFormat || !version || *version != std::to_string(kVersion)) {
                throw StateFormatError("refusing to overwrite state file " + m_path.string() + " with unknown format or version");
            }
        }

        int64_t current = 0;
        try {
            current = std::stoll(meta("generation").value_or("0"));
        } catch (const std::exception&) {
            throw StateFormatError("state file " + m_path.string() + " has a corrupt generation counter");
        }
        if (current != expected_generation) {
            throw StateConflictError("state file " + m_path.string() + " was updated by another run (generation " +
                                     std::to_string(current) + ", expected " + std::to_string(expected_generation) + ")");
        }

        exec("DELETE FROM parts;");

        Statement insert;
        int rc = sqlite3_prepare_v2(m_db,
            "INSERT INTO parts (name, digest, revision, definition, updated_at) VALUES (?, ?, ?, ?, ?);",
            -1, insert.out(), nullptr);
        if (rc != SQLITE_OK) fail("preparing insert", rc);

        for (const auto& [name, entry] : snapshot.parts) {
            const std::string digest = entry.fingerprint.hex();
            sqlite3_reset(insert.get());
            sqlite3_bind_text(insert.get(), 1, name.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(insert.get(), 2, digest.c_str(), -1, SQLITE_TRANSIENT);
            if (entry.revision) {
                sqlite3_bind_text(insert.get(), 3, entry.revision->c_str(), -1, SQLITE_TRANSIENT);
            } else {
                sqlite3_bind_null(insert.get(), 3);
            }
            sqlite3_bind_text(insert.get(), 4, entry.definition.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(insert.get(), 5, entry.updated_at);

            rc = sqlite3_step(insert.get());
            if (rc != SQLITE_DONE) fail("writing part \"" + name + "\"", rc);
        }

        const int64_t next = current + 1;
        Statement upsert;
        rc = sqlite3_prepare_v2(m_db,
            "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);",
            -1, upsert.out(), nullptr);
        if (rc != SQLITE_OK) fail("preparing meta update", rc);

        const std::pair<std::string, std::string> rows[] = {
            {"format", kFormat},
            {"version", std::to_string(kVersion)},
            {"generation", std::to_string(next)},
        };
        for (const auto& [key, value] : rows) {
            sqlite3_reset(upsert.get());
            sqlite3_bind_text(upsert.get(), 1, key.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(upsert.get(), 2, value.c_str(), -1, SQLITE_TRANSIENT);
            rc = sqlite3_step(upsert.get());
            if (rc != SQLITE_DONE) fail("writing meta \"" + key + "\"", rc);
        }

        exec("COMMIT;");
        tx.done();
        return next;
    }

    std::vector<std::filesystem::path> StateStore::files(const std::filesystem::path& path) {
        std::vector<std::filesystem::path> out;
        for (const char* suffix : {"", "-journal", "-wal", "-shm"}) {
            out.emplace_back(path.string() + suffix);
        }
        return out;
    }

    void StateStore::discard() {
        close();
        for (const auto& file : files(m_path)) {
            std::error_code ec;
            std::filesystem::remove(file, ec);
            if (ec) throw IoError(file.string(), "cannot remove state file (" + ec.message() + ")");
        }
    }

}
