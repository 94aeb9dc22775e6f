#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <vector>
#include "resolver.hpp"
#include "tree_source.hpp"
#include "parts/types.hpp"

namespace parts::engine {

    /**
     * @brief Fingerprint outcome of one part. Exactly one of fingerprint and
     * error is set.
     */
    struct PartResult {
        std::string name;
        std::string definition;
        std::optional<Fingerprint> fingerprint;
        std::string error;
        size_t files = 0;
        bool reused = false; // taken from the prior snapshot, content not read
    };

    struct FingerprintOptions {
        size_t jobs = 0; // 0 = WorkerPool::default_size()
        const std::atomic<bool>* cancel = nullptr;
    };

    class Fingerprinter {
    public:
        explicit Fingerprinter(const TreeSource& source)
            : m_source(source) {}

        /**
         * @brief Digest of a member set. Members are sorted by path first, so
         * the enumeration order never matters. Content is streamed.
         * @throws IoError if any member cannot be read; Cancelled if cancel is raised.
         */
        Fingerprint fingerprint(std::vector<FileRecord> members, const std::atomic<bool>* cancel = nullptr) const;

        /**
         * @brief Fingerprints every part on a bounded worker pool, one task per part.
         * Parts listed in skip (same indexing as parts) are left untouched in the
         * returned vector apart from name, definition and file count.
         * Read failures become PartResult::error.
         * @throws Cancelled if the cancel flag was raised during the run.
         */
        std::vector<PartResult> fingerprint_all(const std::vector<CompiledPart>& parts,
                                                const std::vector<std::vector<FileRecord>>& members,
                                                const FingerprintOptions& options,
                                                const std::vector<bool>& skip = {}) const;

        /**
         * @brief Digest of a part with no members.
         */
        static Fingerprint empty();

    private:
        const TreeSource& m_source;
    };

}
