#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "parts/sha256.h"

namespace parts::engine {

    /**
     * @brief Aggregate digest of one part's member set.
     */
    struct Fingerprint {
        crypto::Digest bytes{};

        std::string hex() const;
        std::string short_hex() const { return hex().substr(0, 12); }

        /**
         * @brief Parses 64 hex characters. Returns nullopt on any other input.
         */
        static std::optional<Fingerprint> from_hex(const std::string& text);

        bool operator==(const Fingerprint& other) const { return bytes == other.bytes; }
        bool operator!=(const Fingerprint& other) const { return bytes != other.bytes; }
    };

    // Project-relative path with '/' separators, plus a content reference:
    // byte size for the working tree, blob id for a git revision.
    struct FileRecord {
        std::string path;
        std::uintmax_t size = 0;
        std::string blob_id;

        bool operator<(const FileRecord& other) const { return path < other.path; }
    };

    struct SnapshotEntry {
        Fingerprint fingerprint;
        std::optional<std::string> revision;
        int64_t updated_at = 0; // unix seconds
        std::string definition; // hex digest of the part's rules
    };

    struct Snapshot {
        std::map<std::string, SnapshotEntry> parts;
        int64_t generation = 0;
    };

    struct ChangeEntry {
        enum class Kind {
            Unchanged,
            Changed,
            Added,
            Removed,
            Failed
        };

        std::string name;
        Kind kind = Kind::Unchanged;
        std::optional<Fingerprint> previous;
        std::optional<Fingerprint> current;
        std::string error; // Failed only
    };

    const char* to_string(ChangeEntry::Kind kind);

    struct ChangeReport {
        std::vector<ChangeEntry> entries;

        size_t count(ChangeEntry::Kind kind) const;
        size_t changed_count() const;
        size_t failed_count() const { return count(ChangeEntry::Kind::Failed); }
        bool has_changes() const { return changed_count() > 0; }
        const ChangeEntry* find(const std::string& name) const;
    };

}
