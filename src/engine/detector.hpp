#pragma once

#include <atomic>
#include <optional>
#include <vector>
#include "fingerprinter.hpp"
#include "resolver.hpp"
#include "state_store.hpp"
#include "tree_source.hpp"
#include "parts/types.hpp"

namespace parts::engine {

    struct RunOptions {
        bool commit = false; // false = dry run
        bool discard_unreadable_state = false;
        bool full_recompute = false;
        size_t jobs = 0;
        const std::atomic<bool>* cancel = nullptr;
    };

    struct RunResult {
        ChangeReport report;
        std::vector<PartResult> parts;
        std::optional<Snapshot> prior;
        bool committed = false;
        bool state_discarded = false;
        int64_t generation = 0; // of the committed snapshot, or the prior one
    };

    class ChangeDetector {
    public:
        ChangeDetector(const PartResolver& resolver, const TreeSource& source, StateStore& store)
            : m_resolver(resolver), m_source(source), m_store(store) {}

        /**
         * @brief Classifies every part present in current or prior, exactly once.
         * Declared parts come first in their order, then removed parts sorted by name.
         */
        static ChangeReport classify(const std::vector<PartResult>& current, const std::optional<Snapshot>& prior);

        /**
         * @brief Builds the snapshot to commit from a fully successful run.
         * Unchanged parts keep their previous timestamp.
         */
        static Snapshot next_snapshot(const std::vector<PartResult>& current, const std::optional<Snapshot>& prior,
                                      const std::optional<std::string>& revision, int64_t now);

        /**
         * @brief Fingerprints the current tree, compares it with the stored
         * snapshot and commits the new one if requested and every part succeeded.
         * @throws StateFormatError unless options.discard_unreadable_state is set.
         * @throws Cancelled; nothing is committed in that case.
         */
        RunResult run(const RunOptions& options);

    private:
        const PartResolver& m_resolver;
        const TreeSource& m_source;
        StateStore& m_store;

        std::vector<bool> reusable_parts(const std::optional<Snapshot>& prior) const;
    };

}
