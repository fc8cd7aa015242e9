// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * Configuration file and environment variable support.
 * Reads from stvfuzz.conf and allows STVFUZZ_* environment overrides.
 */

#ifndef STVFUZZ_UTIL_CONFIG_H
#define STVFUZZ_UTIL_CONFIG_H

#include <string>
#include <map>
#include <optional>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Environment variable overrides (STVFUZZ_*)
 */
class CConfigParser {
private:
    std::multimap<std::string, std::string> m_settings;
    std::string m_config_file_path;
    bool m_loaded;

    // Helper: Trim whitespace
    static std::string Trim(const std::string& str);

    // Helper: Parse line
    bool ParseLine(const std::string& line, std::string& key, std::string& value);

    // Helper: Get environment variable
    static std::optional<std::string> GetEnv(const std::string& name);

public:
    CConfigParser();
    ~CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to stvfuzz.conf
     * @return true if loaded successfully (or file doesn't exist), false on read error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Whether a key is set by environment or config file
     */
    bool IsSet(const std::string& key) const;

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     * @param key Configuration key (e.g., "scheduler")
     * @param default_value Default value if not found
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }
};

/**
 * Default config file path (stvfuzz.conf in the current directory)
 */
std::string GetDefaultConfigFilePath();

#endif // STVFUZZ_UTIL_CONFIG_H
