#include "detector.hpp"
#include "errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <set>

namespace parts::engine {

    ChangeReport ChangeDetector::classify(const std::vector<PartResult>& current, const std::optional<Snapshot>& prior) {
        ChangeReport report;
        std::set<std::string> declared;

        for (const auto& part : current) {
            declared.insert(part.name);

            ChangeEntry entry;
            entry.name = part.name;

            const SnapshotEntry* old = nullptr;
            if (prior) {
                auto it = prior->parts.find(part.name);
                if (it != prior->parts.end()) old = &it->second;
            }
            if (old) entry.previous = old->fingerprint;

            if (!part.fingerprint) {
                entry.kind = ChangeEntry::Kind::Failed;
                entry.error = part.error;
            } else {
                entry.current = part.fingerprint;
                if (!old) {
                    entry.kind = ChangeEntry::Kind::Added;
                } else if (old->fingerprint == *part.fingerprint) {
                    entry.kind = ChangeEntry::Kind::Unchanged;
                } else {
                    entry.kind = ChangeEntry::Kind::Changed;
                }
            }
            report.entries.push_back(std::move(entry));
        }

        if (prior) {
            // std::map iterates in name order
            for (const auto& [name, old] : prior->parts) {
                if (declared.count(name)) continue;
                ChangeEntry entry;
                entry.name = name;
                entry.kind = ChangeEntry::Kind::Removed;
                entry.previous = old.fingerprint;
                report.entries.push_back(std::move(entry));
            }
        }
        return report;
    }

    Snapshot ChangeDetector::next_snapshot(const std::vector<PartResult>& current, const std::optional<Snapshot>& prior,
                                           const std::optional<std::string>& revision, int64_t now) {
        Snapshot next;
        next.generation = prior ? prior->generation : 0;
        for (const auto& part : current) {
            if (!part.fingerprint) continue;

            SnapshotEntry entry;
            entry.fingerprint = *part.fingerprint;
            entry.revision = revision;
            entry.definition = part.definition;
            entry.updated_at = now;
            if (prior) {
                auto it = prior->parts.find(part.name);
                if (it != prior->parts.end() && it->second.fingerprint == entry.fingerprint) {
                    entry.updated_at = it->second.updated_at;
                }
            }
            next.parts[part.name] = entry;
        }
        return next;
    }

    std::vector<bool> ChangeDetector::reusable_parts(const std::optional<Snapshot>& prior) const {
        const auto& parts = m_resolver.parts();
        std::vector<bool> reuse(parts.size(), false);
        if (!prior || !m_source.revision()) return reuse;

        std::map<std::string, std::optional<std::vector<std::string>>> touched_by_revision;
        for (size_t i = 0; i < parts.size(); ++i) {
            auto it = prior->parts.find(parts[i].name);
            if (it == prior->parts.end()) continue;
            const SnapshotEntry& old = it->second;
            if (!old.revision || old.definition != parts[i].definition) continue;

            auto cached = touched_by_revision.find(*old.revision);
            if (cached == touched_by_revision.end()) {
                std::optional<std::vector<std::string>> touched;
                try {
                    touched = m_source.touched_since(*old.revision);
                } catch (const IoError& e) {
                    // e.g. the old commit was garbage collected; recompute instead
                    std::cerr << "[Detector] Cannot diff against " << *old.revision << ", recomputing: " << e.what() << "\n";
                }
                cached = touched_by_revision.emplace(*old.revision, std::move(touched)).first;
            }
            if (!cached->second) continue;

            const auto& touched = *cached->second;
            reuse[i] = std::none_of(touched.begin(), touched.end(), [&](const std::string& path) {
                return parts[i].matcher.matches(path);
            });
        }
        return reuse;
    }

    RunResult ChangeDetector::run(const RunOptions& options) {
        RunResult result;

        try {
            result.prior = m_store.load();
        } catch (const StateFormatError& e) {
            if (!options.discard_unreadable_state) throw;
            std::cerr << "[Detector] Treating unreadable state as absent: " << e.what() << "\n";
            result.state_discarded = true;
        }
        if (result.prior) result.generation = result.prior->generation;

        const auto members = m_resolver.resolve(m_source);
        const auto reuse = options.full_recompute ? std::vector<bool>{} : reusable_parts(result.prior);

        FingerprintOptions fp_options;
        fp_options.jobs = options.jobs;
        fp_options.cancel = options.cancel;
        result.parts = Fingerprinter(m_source).fingerprint_all(m_resolver.parts(), members, fp_options, reuse);

        for (size_t i = 0; i < reuse.size(); ++i) {
            if (!reuse[i]) continue;
            result.parts[i].fingerprint = result.prior->parts.at(result.parts[i].name).fingerprint;
            result.parts[i].reused = true;
        }

        result.report = classify(result.parts, result.prior);

        if (!options.commit) return result;

        if (result.report.failed_count() > 0) {
            std::cerr << "[Detector] Not committing: " << result.report.failed_count() << " part(s) could not be evaluated\n";
            return result;
        }
        if (options.cancel && options.cancel->load()) throw Cancelled();

        if (result.state_discarded) m_store.discard();

        const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        Snapshot next = next_snapshot(result.parts, result.prior, m_source.revision(), now);
        result.generation = m_store.commit(next, result.prior ? result.prior->generation : 0);
        result.committed = true;
        return result;
    }

}
