#include "fingerprinter.hpp"
#include "errors.hpp"
#include "worker_pool.hpp"
#include <algorithm>

namespace parts::engine {

    namespace {
        const char kFingerprintTag[] = "parts-fingerprint-v1";

        void begin(crypto::SHA256& acc) {
            acc.update(kFingerprintTag, sizeof(kFingerprintTag)); // includes the NUL
        }

        Fingerprint end(crypto::SHA256& acc, uint64_t count) {
            acc.update_u64(count);
            Fingerprint fp;
            fp.bytes = acc.finish();
            return fp;
        }
    }

    Fingerprint Fingerprinter::fingerprint(std::vector<FileRecord> members, const std::atomic<bool>* cancel) const {
        std::sort(members.begin(), members.end());

        crypto::SHA256 acc;
        begin(acc);
        for (const auto& member : members) {
            if (cancel && cancel->load()) throw Cancelled();

            crypto::SHA256 content;
            uint64_t length = 0;
            m_source.read(member, [&](const char* data, size_t n) {
                content.update(data, n);
                length += n;
            });

            acc.update_u64(member.path.size());
            acc.update(member.path);
            acc.update_u64(length);
            const crypto::Digest digest = content.finish();
            acc.update(digest.data(), digest.size());
        }
        return end(acc, members.size());
    }

    Fingerprint Fingerprinter::empty() {
        crypto::SHA256 acc;
        begin(acc);
        return end(acc, 0);
    }

    std::vector<PartResult> Fingerprinter::fingerprint_all(const std::vector<CompiledPart>& parts,
                                                           const std::vector<std::vector<FileRecord>>& members,
                                                           const FingerprintOptions& options,
                                                           const std::vector<bool>& skip) const {
        std::vector<PartResult> results(parts.size());
        std::atomic<bool> cancelled{false};

        {
            WorkerPool pool(options.jobs ? options.jobs : WorkerPool::default_size());
            for (size_t i = 0; i < parts.size(); ++i) {
                results[i].name = parts[i].name;
                results[i].definition = parts[i].definition;
                results[i].files = members[i].size();
                if (i < skip.size() && skip[i]) continue;

                // Each task writes only results[i]
                pool.submit([this, i, &members, &results, &options, &cancelled]() {
                    try {
                        results[i].fingerprint = fingerprint(members[i], options.cancel);
                    } catch (const Cancelled&) {
                        cancelled = true;
                    } catch (const std::exception& e) {
                        results[i].error = e.what();
                    }
                });
            }
            pool.wait();
        }

        if (cancelled || (options.cancel && options.cancel->load())) throw Cancelled();
        return results;
    }

}
