// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <fuzzer/options.h>
#include <exec/subprocess_executor.h>
#include <fuzzer/errors.h>
#include <util/config.h>
#include <util/logging.h>
#include <util/strencodings.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace {

struct OptionInfo {
    const char* key;
    const char* arg;   // nullptr for flags
    const char* help;
};

const OptionInfo OPTIONS[] = {
    {"project_dir",     "<path>",          "Project root; the harness runs here and coverage is scoped to it (default: .)"},
    {"harness",         "<command>",       "Harness command, split on whitespace"},
    {"seed_dir",        "<path>",          "Initial seed corpus directory"},
    {"runs_dir",        "<path>",          "Directory for run output (default: runs)"},
    {"resume",          "<run dir>",       "Continue an existing run directory instead of starting a new one"},
    {"conf",            "<file>",          "Config file (default: stvfuzz.conf)"},
    {"max_iterations",  "<n>",             "Stop after n executions, -1 to disable (default: 1000)"},
    {"time_limit",      "<seconds>",       "Stop after this many seconds, -1 to disable (default: 60)"},
    {"scheduler",       "<random|fast>",   "Seed scheduler (default: fast)"},
    {"energy",          "<n>",             "Fixed energy of the random scheduler (default: 10)"},
    {"energy_c",        "<c>",             "Power schedule constant of the fast scheduler (default: 1.0)"},
    {"max_energy",      "<n>",             "Energy cap of the fast scheduler (default: 100)"},
    {"strategy",        "<single|stacked>", "Mutation strategy (default: single)"},
    {"exec_timeout_ms", "<ms>",            "Kill the harness after this long, -1 to disable (default: 10000)"},
    {"rng_seed",        "<n>",             "Random seed, 0 for a random one (default: 0)"},
    {"report_interval", "<n>",             "Executions between progress lines, 0 to disable (default: 100)"},
    {"loglevel",        "<level>",         "error, warn, info or debug (default: info)"},
    {"logcategories",   "<cat,...>",       "Only log these of corpus, mutate, sched, feedback, crash, store, exec, engine (default: all)"},
    {"printtoconsole",  nullptr,           "Log to the console as well as fuzz.log (default: on)"},
};

const char* const POSITIONAL_KEYS[] = {"project_dir", "harness", "seed_dir"};

const OptionInfo* FindOption(const std::string& key) {
    for (const OptionInfo& option : OPTIONS) {
        if (key == option.key) {
            return &option;
        }
    }
    return nullptr;
}

void Require(const ConfigValidationResult& result) {
    if (result.valid) {
        return;
    }
    std::string message = result.error_message;
    if (!result.suggestions.empty()) {
        message += " (" + result.suggestions.front() + ")";
    }
    throw ConfigurationError(result.field_name, message);
}

std::vector<std::string> SplitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = TrimString(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

bool IsTrue(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

} // namespace

bool FuzzerOptions::ParseArgs(int argc, char* argv[]) {
    size_t positional = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (arg == "--help" || arg == "-h") {
            return false;
        }
        else if (arg.find("--") == 0) {
            std::string body = arg.substr(2);
            size_t eq = body.find('=');
            std::string key = body.substr(0, eq);
            std::replace(key.begin(), key.end(), '-', '_');

            const OptionInfo* option = FindOption(key);
            if (option == nullptr) {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }

            std::string value;
            if (eq != std::string::npos) {
                value = body.substr(eq + 1);
            } else if (option->arg == nullptr) {
                value = "1";
            } else {
                std::cerr << "Error: Option --" << option->key << " requires a value: --"
                          << option->key << "=" << option->arg << std::endl;
                return false;
            }

            if (key == "conf") {
                conf = value;
            } else {
                m_cliValues[key] = value;
            }
        }
        else if (arg.size() > 1 && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
        else {
            if (positional >= sizeof(POSITIONAL_KEYS) / sizeof(POSITIONAL_KEYS[0])) {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return false;
            }
            m_cliValues[POSITIONAL_KEYS[positional++]] = arg;
        }
    }
    return true;
}

void FuzzerOptions::PrintUsage(const char* program) const {
    std::cout << "stvfuzz - coverage-guided fuzzer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] [<project_dir> <harness> <seed_dir>]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    for (const OptionInfo& option : OPTIONS) {
        std::string name = std::string("--") + option.key;
        std::replace(name.begin() + 2, name.end(), '_', '-');
        if (option.arg != nullptr) {
            name += std::string("=") + option.arg;
        }
        std::cout << "  " << name;
        if (name.size() < 34) {
            std::cout << std::string(34 - name.size(), ' ');
        } else {
            std::cout << std::endl << std::string(36, ' ');
        }
        std::cout << option.help << std::endl;
    }
    std::cout << "  --help, -h                        Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Configuration file: stvfuzz.conf (key=value, same names as the options)" << std::endl;
    std::cout << "  Environment variables: STVFUZZ_* (e.g., STVFUZZ_MAX_ITERATIONS=5000)" << std::endl;
    std::cout << "  Priority: Command-line > Environment > Config file > Default" << std::endl;
    std::cout << std::endl;
    std::cout << "Output:" << std::endl;
    std::cout << "  Each run writes <runs_dir>/<YYYYmmdd_HHMMSS>/results.db and fuzz.log" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " . ./build/stvfuzz-calc-target contrib/corpus/calc" << std::endl;
    std::cout << "  " << program << " --scheduler=random --energy=20 --time-limit=-1 --max-iterations=50000 \\" << std::endl;
    std::cout << "      . ./build/stvfuzz-calc-target contrib/corpus/calc" << std::endl;
    std::cout << std::endl;
}

std::string FuzzerOptions::GetConfigFile() const {
    return conf.empty() ? GetDefaultConfigFilePath() : conf;
}

bool FuzzerOptions::Lookup(const CConfigParser& parser, const std::string& key, std::string& value) const {
    auto it = m_cliValues.find(key);
    if (it != m_cliValues.end()) {
        value = it->second;
        return true;
    }
    if (parser.IsSet(key)) {
        value = parser.GetString(key);
        return true;
    }
    return false;
}

void FuzzerOptions::Apply(const CConfigParser& parser) {
    std::string value;

    if (Lookup(parser, "project_dir", value)) project_dir = value;
    if (Lookup(parser, "harness", value)) harness = value;
    if (Lookup(parser, "seed_dir", value)) seed_dir = value;
    if (Lookup(parser, "runs_dir", value)) runs_dir = value;
    if (Lookup(parser, "resume", value)) resume = value;

    if (Lookup(parser, "max_iterations", value)) {
        Require(CConfigValidator::ValidateLimit(value, "max_iterations"));
        ParseInt64(value, max_iterations);
    }
    if (Lookup(parser, "time_limit", value)) {
        Require(CConfigValidator::ValidateLimit(value, "time_limit"));
        ParseInt64(value, time_limit);
    }
    if (Lookup(parser, "scheduler", value)) {
        Require(CConfigValidator::ValidateChoice(value, "scheduler", {"random", "fast"}));
        scheduler = value;
    }
    if (Lookup(parser, "energy", value)) {
        Require(CConfigValidator::ValidateInteger(value, "energy", 1));
        ParseInt64(value, energy);
    }
    if (Lookup(parser, "energy_c", value)) {
        Require(CConfigValidator::ValidatePositiveNumber(value, "energy_c"));
        energy_c = std::strtod(value.c_str(), nullptr);
    }
    if (Lookup(parser, "max_energy", value)) {
        Require(CConfigValidator::ValidateInteger(value, "max_energy", 1));
        ParseInt64(value, max_energy);
    }
    if (Lookup(parser, "strategy", value)) {
        Require(CConfigValidator::ValidateChoice(value, "strategy", {"single", "stacked"}));
        strategy = value;
    }
    if (Lookup(parser, "exec_timeout_ms", value)) {
        Require(CConfigValidator::ValidateLimit(value, "exec_timeout_ms", MAX_EXEC_TIMEOUT_MS));
        ParseInt64(value, exec_timeout_ms);
    }
    if (Lookup(parser, "rng_seed", value)) {
        Require(CConfigValidator::ValidateInteger(value, "rng_seed", 0));
        int64_t seed = 0;
        ParseInt64(value, seed);
        rng_seed = static_cast<uint64_t>(seed);
    }
    if (Lookup(parser, "report_interval", value)) {
        Require(CConfigValidator::ValidateInteger(value, "report_interval", 0));
        ParseInt64(value, report_interval);
    }
    if (Lookup(parser, "loglevel", value)) {
        std::string lower = value;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        Require(CConfigValidator::ValidateChoice(lower, "loglevel", {"error", "warn", "info", "debug"}));
        loglevel = lower;
    }
    if (Lookup(parser, "logcategories", value)) {
        std::vector<std::string> names = SplitList(value);
        if (names.empty()) {
            throw ConfigurationError("logcategories", "no log category given (use all)");
        }
        for (const std::string& name : names) {
            LogCategory category;
            if (!ParseLogCategory(name, category)) {
                throw ConfigurationError("logcategories", "Unknown log category '" + name + "'");
            }
        }
        logcategories = value;
    }
    if (Lookup(parser, "printtoconsole", value)) {
        Require(CConfigValidator::ValidateBool(value, "printtoconsole"));
        printtoconsole = IsTrue(value);
    }
}

std::vector<ConfigValidationResult> FuzzerOptions::Validate() const {
    std::vector<ConfigValidationResult> failures;
    auto check = [&failures](const ConfigValidationResult& result) {
        if (!result.valid) {
            failures.push_back(result);
        }
    };

    check(CConfigValidator::ValidateDirectory(project_dir, "project_dir"));

    if (HarnessCommand().empty()) {
        ConfigValidationResult result("harness", "harness is required");
        result.suggestions.push_back("Pass the harness command as the second argument or set harness= in stvfuzz.conf");
        failures.push_back(result);
    }

    if (resume.empty()) {
        if (seed_dir.empty()) {
            ConfigValidationResult result("seed_dir", "seed_dir is required for a new run");
            result.suggestions.push_back("Pass the seed directory as the third argument or set seed_dir= in stvfuzz.conf");
            failures.push_back(result);
        }
        check(CConfigValidator::ValidateOutputDir(runs_dir, "runs_dir"));
    } else {
        check(CConfigValidator::ValidateDirectory(resume, "resume"));
    }

    return failures;
}

uint32_t FuzzerOptions::LogCategoryMask() const {
    uint32_t mask = 0;
    for (const std::string& name : SplitList(logcategories)) {
        LogCategory category;
        if (ParseLogCategory(name, category)) {
            mask |= static_cast<uint32_t>(category);
        }
    }
    return mask;
}

std::vector<std::string> FuzzerOptions::HarnessCommand() const {
    std::vector<std::string> command;
    std::istringstream stream(harness);
    std::string word;
    while (stream >> word) {
        command.push_back(word);
    }
    return command;
}
