#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "parts/types.hpp"

namespace parts::engine {

    /**
     * @brief Persists the last committed snapshot in a SQLite database.
     *
     * Layout: meta(key, value) holding format, version and generation, and
     * parts(name, digest, revision, definition, updated_at).
     */
    class StateStore {
    public:
        static constexpr const char* kFormat = "parts-state";
        static constexpr int kVersion = 1;

        explicit StateStore(std::filesystem::path path);
        ~StateStore();

        StateStore(const StateStore&) = delete;
        StateStore& operator=(const StateStore&) = delete;

        /**
         * @brief Reads the committed snapshot.
         * @return nullopt if no state file exists yet.
         * @throws StateFormatError on unknown format, version or corrupt rows.
         * @throws IoError if the file exists but cannot be read.
         */
        std::optional<Snapshot> load();

        /**
         * @brief Replaces the persisted snapshot in one transaction.
         * @param expected_generation Generation of the snapshot this run loaded (0 if none).
         * @return The new generation.
         * @throws StateConflictError if another writer committed in between.
         */
        int64_t commit(const Snapshot& snapshot, int64_t expected_generation);

        /**
         * @brief Deletes the state file. Used when the caller opts to start over
         * from an unreadable state.
         */
        void discard();

        const std::filesystem::path& path() const { return m_path; }

        /**
         * @brief The database file and the journal files SQLite may keep beside it.
         */
        static std::vector<std::filesystem::path> files(const std::filesystem::path& path);

    private:
        std::filesystem::path m_path;
        sqlite3* m_db = nullptr;

        void open(bool writable);
        void close();
        void exec(const char* sql);
        [[noreturn]] void fail(const std::string& what, int rc);
        std::optional<std::string> meta(const char* key);
    };

}
