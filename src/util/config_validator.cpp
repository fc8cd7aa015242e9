// Copyright (c) 2026 The stvfuzz developers
// Distributed under the MIT software license

/**
 * Configuration Validation Implementation
 */

#include <util/config_validator.h>
#include <util/strencodings.h>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

ConfigValidationResult CConfigValidator::ValidateInteger(const std::string& value, const std::string& field_name,
                                                         int64_t min_value) {
    ConfigValidationResult result;
    result.field_name = field_name;

    int64_t number = 0;
    if (!ParseInt64(value, number)) {
        result.valid = false;
        result.error_message = "Invalid number format: '" + value + "'";
        result.suggestions.push_back("Use a whole number, e.g. " + field_name + "=" + std::to_string(std::max<int64_t>(min_value, 1)));
    } else if (number < min_value) {
        result.valid = false;
        result.error_message = field_name + " must be at least " + std::to_string(min_value);
        result.suggestions.push_back("Set " + field_name + " to " + std::to_string(min_value) + " or more");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateLimit(const std::string& value, const std::string& field_name,
                                                       int64_t max_value) {
    ConfigValidationResult result;
    result.field_name = field_name;

    int64_t number = 0;
    if (!ParseInt64(value, number) || number < -1) {
        result.valid = false;
        result.error_message = "Invalid limit: '" + value + "'";
        result.suggestions.push_back("Use a non-negative number");
        result.suggestions.push_back("Use -1 to disable this limit");
    } else if (number > max_value) {
        result.valid = false;
        result.error_message = "Limit too large: " + value;
        result.suggestions.push_back("Use at most " + std::to_string(max_value));
        result.suggestions.push_back("Use -1 to disable this limit");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidatePositiveNumber(const std::string& value, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    errno = 0;
    char* end = nullptr;
    double number = value.empty() ? 0.0 : std::strtod(value.c_str(), &end);
    if (value.empty() || errno == ERANGE || end != value.c_str() + value.size()) {
        result.valid = false;
        result.error_message = "Invalid number format: '" + value + "'";
        result.suggestions.push_back("Use a decimal number, e.g. " + field_name + "=1.0");
    } else if (!std::isfinite(number) || number <= 0.0) {
        result.valid = false;
        result.error_message = field_name + " must be greater than 0";
        result.suggestions.push_back("Use a positive number, e.g. " + field_name + "=1.0");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateChoice(const std::string& value, const std::string& field_name,
                                                        const std::vector<std::string>& choices) {
    ConfigValidationResult result;
    result.field_name = field_name;

    if (std::find(choices.begin(), choices.end(), value) == choices.end()) {
        std::string joined;
        for (const auto& choice : choices) {
            if (!joined.empty()) joined += ", ";
            joined += choice;
        }
        result.valid = false;
        result.error_message = "Unknown " + field_name + " '" + value + "'";
        result.suggestions.push_back("Use one of: " + joined);
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateBool(const std::string& value, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower != "0" && lower != "1" && lower != "true" && lower != "false" &&
        lower != "yes" && lower != "no" && lower != "on" && lower != "off") {
        result.valid = false;
        result.error_message = "Invalid boolean value";
        result.suggestions.push_back("Use: 0/1, true/false, yes/no, or on/off");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateDirectory(const std::string& path, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    if (path.empty()) {
        result.valid = false;
        result.error_message = field_name + " is required";
        result.suggestions.push_back("Pass it on the command line or set " + field_name + "= in stvfuzz.conf");
        return result;
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
        result.valid = false;
        result.error_message = "Not a directory: " + path;
        result.suggestions.push_back("Check the path and its permissions");
    }

    return result;
}

ConfigValidationResult CConfigValidator::ValidateOutputDir(const std::string& path, const std::string& field_name) {
    ConfigValidationResult result;
    result.field_name = field_name;

    if (path.empty()) {
        result.valid = false;
        result.error_message = field_name + " cannot be empty";
        result.suggestions.push_back("Use a directory path, e.g. " + field_name + "=runs");
        return result;
    }

    std::error_code ec;
    if (std::filesystem::exists(path, ec) && !std::filesystem::is_directory(path, ec)) {
        result.valid = false;
        result.error_message = "Exists but is not a directory: " + path;
        result.suggestions.push_back("Remove the file or choose another directory");
    }

    return result;
}
