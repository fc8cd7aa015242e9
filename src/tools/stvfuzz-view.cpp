// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license
// Results database viewer

#include <db/fuzz_db.h>
#include <fuzzer/errors.h>
#include <util/strencodings.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static std::string Shorten(const std::string& text, size_t width) {
    std::string escaped = EscapeBytes(text);
    if (escaped.size() <= width) {
        return escaped;
    }
    return escaped.substr(0, width - 3) + "...";
}

static void ShowSummary(const SeedList& seeds, const std::vector<CCrashRecord>& crashes) {
    uint64_t total_hits = 0;
    for (const auto& crash : crashes) {
        total_hits += crash.nCount;
    }

    std::cout << "=== Summary ===" << std::endl;
    std::cout << "  Corpus entries  : " << seeds.size() << std::endl;
    std::cout << "  Unique crashes  : " << crashes.size() << std::endl;
    std::cout << "  Total crash hits: " << total_hits << std::endl;
    std::cout << std::endl;
}

static void ShowCorpus(const SeedList& seeds, bool show_data) {
    std::cout << "=== Corpus (" << seeds.size() << " entries) ===" << std::endl;
    for (size_t i = 0; i < seeds.size(); ++i) {
        const CSeedInput& seed = *seeds[i];
        std::cout << "  [" << std::setw(4) << (i + 1) << "] picked=" << std::setw(4) << seed.metadata.nTimesPicked
                  << "  fuzzed=" << std::setw(4) << seed.metadata.nTimesFuzzed
                  << "  created=" << seed.created_at << std::endl;
        if (show_data) {
            std::cout << "         data: " << Shorten(seed.data, 120) << std::endl;
        }
    }
    std::cout << std::endl;
}

static void ShowCrashes(const std::vector<CCrashRecord>& crashes, bool show_traceback, bool show_data) {
    std::cout << "=== Crashes (" << crashes.size() << " unique) ===" << std::endl;
    for (const auto& crash : crashes) {
        std::cout << "  [" << std::setw(4) << crash.nId << "] " << crash.info.exception_type << ": "
                  << Shorten(crash.info.exception_message, 60) << std::endl;
        std::cout << "         file : " << crash.info.file << ":" << crash.info.line << std::endl;
        std::cout << "         count: " << crash.nCount << "  first=" << crash.first_seen_at
                  << "  last=" << crash.last_seen_at << std::endl;
        if (show_data) {
            std::cout << "         input: " << Shorten(crash.data, 120) << std::endl;
        }
        if (show_traceback) {
            std::cout << "         traceback:" << std::endl;
            std::istringstream lines(crash.info.traceback);
            std::string line;
            while (std::getline(lines, line)) {
                std::cout << "           " << line << std::endl;
            }
        }
        std::cout << std::endl;
    }
}

static void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " <run_dir|results.db> [--corpus] [--crashes] [--data] [--traceback] [--all]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "  --corpus     Show corpus entries" << std::endl;
    std::cerr << "  --crashes    Show crash entries" << std::endl;
    std::cerr << "  --data       Include input data in output" << std::endl;
    std::cerr << "  --traceback  Include full tracebacks in crash output" << std::endl;
    std::cerr << "  --all        Show everything (corpus + crashes + data + tracebacks)" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string db_path;
    bool show_corpus = false;
    bool show_crashes = false;
    bool show_data = false;
    bool show_traceback = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--corpus") {
            show_corpus = true;
        } else if (arg == "--crashes") {
            show_crashes = true;
        } else if (arg == "--data") {
            show_data = true;
        } else if (arg == "--traceback") {
            show_traceback = true;
        } else if (arg == "--all") {
            show_corpus = show_crashes = show_data = show_traceback = true;
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (db_path.empty() && arg.find("--") != 0) {
            db_path = arg;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (db_path.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    // A run directory holds results.db
    std::error_code ec;
    if (fs::is_directory(fs::path(db_path) / "results.db", ec)) {
        db_path = (fs::path(db_path) / "results.db").string();
    }

    // Default: summary + crashes if no specific section requested
    if (!show_corpus && !show_crashes) {
        show_crashes = true;
    }

    CFuzzDB db;
    try {
        db.Open(db_path, false);

        SeedList seeds = db.LoadSeeds();
        std::vector<CCrashRecord> crashes = db.LoadCrashes();
        db.Close();

        std::cout << "Database: " << db_path << std::endl << std::endl;
        ShowSummary(seeds, crashes);
        if (show_corpus) {
            ShowCorpus(seeds, show_data);
        }
        if (show_crashes) {
            ShowCrashes(crashes, show_traceback, show_data);
        }
    } catch (const FuzzerError& e) {
        std::cerr << "Failed to read results database at " << db_path << ": " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
