// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#ifndef STVFUZZ_FUZZER_OPTIONS_H
#define STVFUZZ_FUZZER_OPTIONS_H

#include <fuzzer/scheduler.h>
#include <util/config_validator.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

class CConfigParser;

/**
 * Run configuration
 *
 * Assembled from defaults, the config file, STVFUZZ_* environment variables
 * and the command line. Priority: Command-line > Environment > Config file > Default
 */
struct FuzzerOptions {
    std::string project_dir = ".";
    std::string harness;
    std::string seed_dir;
    std::string runs_dir = "runs";
    std::string resume;             // existing run directory to continue, empty = new run
    std::string conf;               // config file, empty = stvfuzz.conf

    int64_t max_iterations = 1000;  // -1 = disabled
    int64_t time_limit = 60;        // seconds, -1 = disabled

    std::string scheduler = "fast";
    int64_t energy = DEFAULT_RANDOM_ENERGY;
    double energy_c = DEFAULT_ENERGY_C;
    int64_t max_energy = DEFAULT_MAX_ENERGY;
    std::string strategy = "single";

    int64_t exec_timeout_ms = 10000;  // -1 = disabled
    uint64_t rng_seed = 0;            // 0 = random
    int64_t report_interval = 100;
    std::string loglevel = "info";
    std::string logcategories = "all";  // comma-separated, see ParseLogCategory()
    bool printtoconsole = true;

    /**
     * Parse `--key=value` options and up to three positional arguments
     * (project_dir, harness, seed_dir).
     *
     * @return false on --help or a malformed/unknown option (already reported)
     */
    bool ParseArgs(int argc, char* argv[]);

    void PrintUsage(const char* program) const;

    /** Config file to load: --conf, otherwise the default path. */
    std::string GetConfigFile() const;

    /**
     * Merge the config file and environment into the options. Values given
     * on the command line win over both.
     *
     * @throws ConfigurationError for the first invalid value
     */
    void Apply(const CConfigParser& parser);

    /**
     * Check required options and paths after merging.
     * @return failed checks only (empty when valid)
     */
    std::vector<ConfigValidationResult> Validate() const;

    /** harness split on whitespace into argv */
    std::vector<std::string> HarnessCommand() const;

    /** logcategories as a bit mask */
    uint32_t LogCategoryMask() const;

private:
    /** Raw values from the command line, keyed by config key */
    std::map<std::string, std::string> m_cliValues;

    bool Lookup(const CConfigParser& parser, const std::string& key, std::string& value) const;
};

#endif // STVFUZZ_FUZZER_OPTIONS_H
