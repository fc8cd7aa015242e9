// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * Configuration Validation
 *
 * Validates raw option values (from the command line, environment or
 * config file) and provides helpful error messages
 */

#ifndef STVFUZZ_UTIL_CONFIG_VALIDATOR_H
#define STVFUZZ_UTIL_CONFIG_VALIDATOR_H

#include <limits>
#include <string>
#include <vector>
#include <cstdint>

/**
 * Configuration validation result
 */
struct ConfigValidationResult {
    bool valid;
    std::string error_message;
    std::string field_name;
    std::vector<std::string> suggestions;

    ConfigValidationResult() : valid(true) {}
    ConfigValidationResult(const std::string& field, const std::string& error)
        : valid(false), error_message(error), field_name(field) {}
};

/**
 * Configuration validator
 */
class CConfigValidator {
public:
    /**
     * Validate an integer that must be >= min_value
     */
    static ConfigValidationResult ValidateInteger(const std::string& value, const std::string& field_name,
                                                  int64_t min_value);

    /**
     * Validate a stop condition: -1 (disabled) or an integer in [0, max_value]
     */
    static ConfigValidationResult ValidateLimit(const std::string& value, const std::string& field_name,
                                                int64_t max_value = std::numeric_limits<int64_t>::max());

    /**
     * Validate a strictly positive finite number
     */
    static ConfigValidationResult ValidatePositiveNumber(const std::string& value, const std::string& field_name);

    /**
     * Validate one of a fixed set of names
     */
    static ConfigValidationResult ValidateChoice(const std::string& value, const std::string& field_name,
                                                 const std::vector<std::string>& choices);

    /**
     * Validate boolean value
     */
    static ConfigValidationResult ValidateBool(const std::string& value, const std::string& field_name);

    /**
     * Validate an existing directory
     */
    static ConfigValidationResult ValidateDirectory(const std::string& path, const std::string& field_name);

    /**
     * Validate a path that is created on demand (its parent may be missing)
     */
    static ConfigValidationResult ValidateOutputDir(const std::string& path, const std::string& field_name);
};

#endif // STVFUZZ_UTIL_CONFIG_VALIDATOR_H
