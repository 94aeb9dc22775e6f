#include <iostream>
#include <iomanip>
#include <csignal>
#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engine/config.hpp"
#include "engine/detector.hpp"
#include "engine/errors.hpp"
#include "engine/fingerprinter.hpp"
#include "engine/resolver.hpp"
#include "engine/state_store.hpp"
#include "engine/tree_source.hpp"

namespace {

    constexpr int kExitClean = 0;
    constexpr int kExitError = 1;
    constexpr int kExitChanged = 2;
    constexpr int kExitInterrupted = 130;

    // Raised by SIGINT/SIGTERM, polled by the fingerprint workers
    std::atomic<bool> g_cancel{false};

    void signal_handler(int) {
        g_cancel = true;
    }

    struct Options {
        std::filesystem::path root;
        std::optional<std::string> config;
        bool verbose = false;
        std::string command;
        std::vector<std::string> args;
    };

    void print_usage() {
        std::cerr << "Usage: parts [--root DIR] [--config FILE[:KEYS]] [-v] <command> [args...]\n";
        std::cerr << "Commands:\n";
        std::cerr << "  list                     - List the parts defined in the config file\n";
        std::cerr << "  files [PART]             - List the files of PART (or the default part)\n";
        std::cerr << "  fingerprint [PART...]    - Print the fingerprint of parts\n";
        std::cerr << "  status [options]         - Classify parts against the stored snapshot\n";
        std::cerr << "      --rev REV                 fingerprint git revision REV instead of the working tree\n";
        std::cerr << "      --commit                  store the new snapshot (default is a dry run)\n";
        std::cerr << "      --state FILE              state file (default from config)\n";
        std::cerr << "      --jobs N                  worker threads\n";
        std::cerr << "      --full                    never reuse fingerprints of untouched parts\n";
        std::cerr << "      --discard-unreadable-state  treat an unreadable state file as absent\n";
        std::cerr << "Exit status: 0 = no part changed, 2 = parts changed, 1 = error\n";
    }

    std::optional<Options> parse_args(int argc, char* argv[]) {
        Options opts;
        int i = 1;
        for (; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--root" && i + 1 < argc) {
                opts.root = argv[++i];
            } else if (arg == "--config" && i + 1 < argc) {
                opts.config = argv[++i];
            } else if (arg == "-v" || arg == "--verbose") {
                opts.verbose = true;
            } else if (arg == "-h" || arg == "--help") {
                return std::nullopt;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "[parts] Unknown option: " << arg << "\n";
                return std::nullopt;
            } else {
                break;
            }
        }
        if (i >= argc) return std::nullopt;

        opts.command = argv[i++];
        for (; i < argc; ++i) opts.args.push_back(argv[i]);
        return opts;
    }

    std::filesystem::path resolve_state_file(const Options& opts, std::filesystem::path state_file) {
        if (state_file.is_relative()) state_file = opts.root / state_file;
        std::error_code ec;
        auto canonical = std::filesystem::weakly_canonical(state_file, ec);
        return ec ? state_file : canonical;
    }

    // The state database and its journals are never part members
    std::unique_ptr<parts::engine::TreeSource> make_source(const Options& opts, const parts::engine::Config& cfg,
                                                           const std::optional<std::string>& revision,
                                                           const std::filesystem::path& state_file) {
        parts::engine::IgnoreOptions ignore = cfg.ignore;
        for (const auto& file : parts::engine::StateStore::files(state_file)) {
            ignore.exclude(opts.root, file);
        }
        if (revision) {
            return parts::engine::create_revision_tree(opts.root, *revision, ignore);
        }
        return parts::engine::create_working_tree(opts.root, ignore);
    }

    int cmd_list(const parts::engine::Config& cfg) {
        auto [path, keys] = parts::engine::split_path_and_keys(cfg.source);
        std::cout << "Found " << cfg.parts.size() << " part(s) in file: " << path;
        for (const auto& key : keys) std::cout << " -> " << key;
        std::cout << "\n";

        for (const auto& part : cfg.parts) {
            std::cout << part.name;
            if (cfg.default_part && *cfg.default_part == part.name) std::cout << " (default)";
            std::cout << "\n";
        }
        return kExitClean;
    }

    int cmd_files(const Options& opts, const parts::engine::Config& cfg) {
        std::optional<std::string> name;
        std::optional<std::string> revision;
        for (size_t i = 0; i < opts.args.size(); ++i) {
            if (opts.args[i] == "--rev" && i + 1 < opts.args.size()) revision = opts.args[++i];
            else name = opts.args[i];
        }

        const auto* def = cfg.get(name);
        if (!def) {
            std::cerr << "[parts] " << (name ? "Unknown part name: " + *name : std::string("No part given and no default part configured")) << "\n";
            return kExitError;
        }

        auto resolver = parts::engine::PartResolver::compile({*def}, cfg.ignore.signature());
        auto source = make_source(opts, cfg, revision, resolve_state_file(opts, cfg.state_file));
        for (const auto& record : resolver.members_of(def->name, *source)) {
            std::cout << record.path << "\n";
        }
        return kExitClean;
    }

    int cmd_fingerprint(const Options& opts, const parts::engine::Config& cfg) {
        std::vector<std::string> names;
        std::optional<std::string> revision;
        size_t jobs = cfg.jobs;
        for (size_t i = 0; i < opts.args.size(); ++i) {
            if (opts.args[i] == "--rev" && i + 1 < opts.args.size()) revision = opts.args[++i];
            else if (opts.args[i] == "--jobs" && i + 1 < opts.args.size()) jobs = std::stoul(opts.args[++i]);
            else names.push_back(opts.args[i]);
        }

        std::vector<parts::engine::PartDefinition> selected;
        if (names.empty()) {
            selected = cfg.parts;
        } else {
            for (const auto& n : names) {
                const auto* def = cfg.get(n);
                if (!def) {
                    std::cerr << "[parts] Unknown part name: " << n << "\n";
                    return kExitError;
                }
                selected.push_back(*def);
            }
        }

        auto resolver = parts::engine::PartResolver::compile(selected, cfg.ignore.signature());
        auto source = make_source(opts, cfg, revision, resolve_state_file(opts, cfg.state_file));
        auto members = resolver.resolve(*source);

        parts::engine::FingerprintOptions fp_options;
        fp_options.jobs = jobs;
        fp_options.cancel = &g_cancel;
        auto results = parts::engine::Fingerprinter(*source).fingerprint_all(resolver.parts(), members, fp_options);

        int code = kExitClean;
        for (const auto& r : results) {
            if (r.fingerprint) {
                std::cout << r.fingerprint->hex() << "  " << r.name;
                if (opts.verbose) std::cout << "  (" << r.files << " files)";
                std::cout << "\n";
            } else {
                std::cerr << "[parts] " << r.name << ": " << r.error << "\n";
                code = kExitError;
            }
        }
        return code;
    }

    int cmd_status(const Options& opts, const parts::engine::Config& cfg) {
        parts::engine::RunOptions run_options;
        run_options.jobs = cfg.jobs;
        run_options.cancel = &g_cancel;
        std::optional<std::string> revision;
        std::filesystem::path state_file = cfg.state_file;

        for (size_t i = 0; i < opts.args.size(); ++i) {
            const std::string& arg = opts.args[i];
            if (arg == "--rev" && i + 1 < opts.args.size()) revision = opts.args[++i];
            else if (arg == "--state" && i + 1 < opts.args.size()) state_file = opts.args[++i];
            else if (arg == "--jobs" && i + 1 < opts.args.size()) run_options.jobs = std::stoul(opts.args[++i]);
            else if (arg == "--commit") run_options.commit = true;
            else if (arg == "--full") run_options.full_recompute = true;
            else if (arg == "--discard-unreadable-state") run_options.discard_unreadable_state = true;
            else {
                std::cerr << "[parts] Unknown status argument: " << arg << "\n";
                return kExitError;
            }
        }
        state_file = resolve_state_file(opts, state_file);

        auto resolver = parts::engine::PartResolver::compile(cfg.parts, cfg.ignore.signature());
        auto source = make_source(opts, cfg, revision, state_file);
        parts::engine::StateStore store(state_file);

        if (opts.verbose) {
            std::cerr << "[parts] Source: " << source->describe() << "\n";
            std::cerr << "[parts] State: " << store.path().string() << "\n";
        }

        parts::engine::ChangeDetector detector(resolver, *source, store);
        auto result = detector.run(run_options);

        for (const auto& entry : result.report.entries) {
            std::cout << std::left << std::setw(10) << parts::engine::to_string(entry.kind) << " " << entry.name;
            switch (entry.kind) {
                case parts::engine::ChangeEntry::Kind::Changed:
                    std::cout << "  " << entry.previous->short_hex() << " -> " << entry.current->short_hex();
                    break;
                case parts::engine::ChangeEntry::Kind::Failed:
                    std::cout << "  " << entry.error;
                    break;
                default:
                    break;
            }
            std::cout << "\n";
        }

        if (opts.verbose) {
            for (const auto& part : result.parts) {
                std::cerr << "[parts] " << part.name << ": " << part.files << " files"
                          << (part.reused ? ", untouched since last snapshot" : "") << "\n";
            }
            if (result.committed) {
                std::cerr << "[parts] Committed snapshot generation " << result.generation << "\n";
            } else if (!run_options.commit) {
                std::cerr << "[parts] Dry run, snapshot not committed\n";
            }
        }

        if (result.report.failed_count() > 0) return kExitError;
        return result.report.has_changes() ? kExitChanged : kExitClean;
    }

}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage();
        return kExitError;
    }
    Options opts = *parsed;

    try {
        std::error_code ec;
        if (opts.root.empty()) opts.root = std::filesystem::current_path();
        auto root = std::filesystem::weakly_canonical(opts.root, ec);
        if (ec) {
            std::cerr << "[parts] Invalid root path: " << opts.root << "\n";
            return kExitError;
        }
        opts.root = root;

        auto cfg = opts.config ? parts::engine::Config::load(opts.root, *opts.config)
                               : parts::engine::Config::find(opts.root);
        if (opts.verbose) std::cerr << "[parts] Config: " << cfg.source << "\n";

        if (opts.command == "list") return cmd_list(cfg);
        if (opts.command == "files") return cmd_files(opts, cfg);
        if (opts.command == "fingerprint") return cmd_fingerprint(opts, cfg);
        if (opts.command == "status") return cmd_status(opts, cfg);

        std::cerr << "[parts] Unknown command: " << opts.command << "\n";
        print_usage();
        return kExitError;
    } catch (const parts::engine::Cancelled&) {
        std::cerr << "\n[parts] Interrupted, nothing committed.\n";
        return kExitInterrupted;
    } catch (const parts::engine::Error& e) {
        std::cerr << "[parts] error: " << e.what() << "\n";
        return kExitError;
    } catch (const std::exception& e) {
        std::cerr << "[parts] error: " << e.what() << "\n";
        return kExitError;
    }
}
