// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

#include <util/config.h>
#include <util/logging.h>
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iterator>

static const char* const ENV_PREFIX = "STVFUZZ_";

static std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

static std::string EnvKey(const std::string& key) {
    std::string env_key = ENV_PREFIX + key;
    std::transform(env_key.begin(), env_key.end(), env_key.begin(), ::toupper);
    // Keys use '_' already; map '-' for keys typed CLI-style
    std::replace(env_key.begin(), env_key.end(), '-', '_');
    return env_key;
}

CConfigParser::CConfigParser() : m_loaded(false) {
}

CConfigParser::~CConfigParser() {
}

std::string CConfigParser::Trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

bool CConfigParser::ParseLine(const std::string& line, std::string& key, std::string& value) {
    // Remove comments
    std::string clean_line = line;
    size_t comment_pos = clean_line.find('#');
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }
    comment_pos = clean_line.find(';');
    if (comment_pos != std::string::npos) {
        clean_line = clean_line.substr(0, comment_pos);
    }

    clean_line = Trim(clean_line);
    if (clean_line.empty()) {
        return false;  // Empty line or comment only
    }

    // Skip section headers [section]
    if (clean_line[0] == '[' && clean_line.back() == ']') {
        return false;
    }

    size_t eq_pos = clean_line.find('=');
    if (eq_pos == std::string::npos) {
        return false;  // No equals sign
    }

    key = Trim(clean_line.substr(0, eq_pos));
    value = Trim(clean_line.substr(eq_pos + 1));

    // Remove quotes if present
    if (value.length() >= 2 && value[0] == '"' && value.back() == '"') {
        value = value.substr(1, value.length() - 2);
    }

    return !key.empty();
}

std::optional<std::string> CConfigParser::GetEnv(const std::string& name) {
    const char* env_value = std::getenv(name.c_str());
    if (env_value == nullptr) {
        return std::nullopt;
    }
    return std::string(env_value);
}

bool CConfigParser::LoadConfigFile(const std::string& file_path) {
    m_config_file_path = file_path;
    m_settings.clear();
    m_loaded = false;

    std::ifstream file(file_path);
    if (!file.is_open()) {
        // File doesn't exist - this is OK, use defaults
        LogPrintf(ALL, DEBUG, "Config file not found: %s (using defaults)", file_path.c_str());
        m_loaded = true;
        return true;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string key, value;
        if (ParseLine(line, key, value)) {
            key = ToLower(key);
            m_settings.emplace(key, value);
            LogPrintf(ALL, DEBUG, "Config: %s = %s", key.c_str(), value.c_str());
        }
    }

    if (file.bad()) {
        LogPrintf(ALL, ERROR, "Failed reading config file %s", file_path.c_str());
        return false;
    }

    m_loaded = true;
    if (!m_settings.empty()) {
        LogPrintf(ALL, INFO, "Loaded configuration from %s (%zu settings)",
                  file_path.c_str(), m_settings.size());
    }
    return true;
}

bool CConfigParser::IsSet(const std::string& key) const {
    if (GetEnv(EnvKey(key)).has_value()) {
        return true;
    }
    return m_settings.find(ToLower(key)) != m_settings.end();
}

std::string CConfigParser::GetString(const std::string& key, const std::string& default_value) const {
    // Priority 1: Environment variable (STVFUZZ_*)
    auto env_value = GetEnv(EnvKey(key));
    if (env_value.has_value()) {
        LogPrintf(ALL, DEBUG, "Config: %s = %s (from environment)",
                  key.c_str(), env_value->c_str());
        return *env_value;
    }

    // Priority 2: Config file (last assignment wins)
    auto range = m_settings.equal_range(ToLower(key));
    if (range.first != range.second) {
        return std::prev(range.second)->second;
    }

    // Priority 3: Default
    return default_value;
}

std::string GetDefaultConfigFilePath() {
    return "stvfuzz.conf";
}
