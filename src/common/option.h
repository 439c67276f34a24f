#pragma once

#include <any>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/string_utils.h"

namespace backstop {

// Options is a map of config items <config_name, config_value>
using Options = std::unordered_map<std::string, std::string>;

inline std::ostream& operator<<(std::ostream& os, const Options& options) {
    os << "{";
    for (auto it = options.begin(); it != options.end(); ++it) {
        if (it != options.begin()) {
            os << ", ";
        }
        os << it->first << ": " << it->second;
    }
    os << "}";
    return os;
}

inline std::string ToString(const Options& options) {
    std::ostringstream oss;
    oss << options;
    return oss.str();
}

// Option definition: config name, config value type, default value.....
enum ValueType : uint8_t { INT = 0, STRING = 1, STRING_LIST = 2, BOOL = 3, DOUBLE = 5, UNKNOWN = 255 };

struct OptionDef {
    ValueType value_type;
    std::string default_value;
};

using OptionDefinition = std::unordered_map<std::string, OptionDef>;

inline OptionDefinition& GetOptionDefinitions() {
    static OptionDefinition defs;
    return defs;
}

inline std::mutex& GetOptionDefinitionsMutex() {
    static std::mutex m;
    return m;
}

struct CreateOption {
    CreateOption(const std::string& name, ValueType type, const std::string& default_value) {
        std::lock_guard<std::mutex> lock(GetOptionDefinitionsMutex());
        auto& defs = GetOptionDefinitions();

        auto it = defs.find(name);
        if (it == defs.end()) {
            defs.emplace(name, OptionDef{type, default_value});
        } else {
            const auto& old = it->second;
            if (old.value_type != type || old.default_value != default_value) {
                SPDLOG_ERROR(
                    "Option {} already defined with different definition: "
                    "old(type={}, default={}), new(type={}, default={})",
                    name,
                    static_cast<int>(old.value_type),
                    old.default_value,
                    static_cast<int>(type),
                    default_value);
            } else {
                SPDLOG_WARN("Option {} already defined with identical definition, ignoring duplicate", name);
            }
        }
    }
};

#define OPTION(name, type, default_value) \
    inline const std::string name = #name; \
    inline const ::backstop::CreateOption option_reg_##name(name, type, default_value);

/********** Option definition: [Option Name, Option Type, Default Value] ***********/
OPTION(BACKSTOP_OPTIONS_LOAD_MODE, STRING, "ENV") // ENV, FILE
OPTION(BACKSTOP_OPTIONS_FILE_PATH, STRING, "") // Config file path

// Retry Options
OPTION(RETRY_MAX_ATTEMPTS, INT, "3")
OPTION(RETRY_INITIAL_DELAY_MS, INT, "1000") // 1s
OPTION(RETRY_MAX_DELAY_MS, INT, "60000") // 60s
OPTION(RETRY_EXPONENTIAL_BASE, DOUBLE, "2.0")
OPTION(RETRY_JITTER, BOOL, "true")
OPTION(RETRY_RETRYABLE_KINDS, STRING_LIST, "SERVER_ERROR,RATE_LIMITED,TIMEOUT,CONNECTION_FAILURE")

// Circuit Breaker Options
OPTION(CIRCUIT_BREAKER_FAILURE_THRESHOLD, INT, "5")
OPTION(CIRCUIT_BREAKER_RECOVERY_TIMEOUT_MS, INT, "60000") // 60s

// Log Options
OPTION(BACKSTOP_LOG_DIR, STRING, "/tmp/backstop")
OPTION(BACKSTOP_LOG_LEVEL, STRING, "INFO") // DEBUG, INFO, WARNING, ERROR
OPTION(BACKSTOP_LOG_TO_CONSOLE, BOOL, "false")
OPTION(BACKSTOP_LOG_TO_FILE, BOOL, "true")
OPTION(BACKSTOP_LOG_MAX_FILE_DAYS, INT, "5") // 5 days
/********** Option definition: [Option Name, Option Type, Default Value] ***********/

// Value Parser Utils
inline int ParseInt(const std::any& value) {
    if (value.type() == typeid(int)) {
        return std::any_cast<int>(value);
    }
    if (value.type() == typeid(std::string)) {
        return std::stoi(std::any_cast<std::string>(value));
    }
    throw std::invalid_argument("Invalid type for int");
}

inline std::string ParseString(const std::any& value) {
    if (value.type() == typeid(std::string)) {
        return std::any_cast<std::string>(value);
    }
    if (value.type() == typeid(const char*)) {
        return std::any_cast<const char*>(value);
    }
    if (value.type() == typeid(std::string_view)) {
        return std::string(std::any_cast<std::string_view>(value));
    }

    SPDLOG_ERROR("Invalid type for string, got type: {}", value.type().name());
    throw std::invalid_argument("Invalid type for string");
}

inline std::vector<std::string> ParseStringList(const std::any& value) {
    if (value.type() == typeid(std::string)) {
        return SplitByComma(std::any_cast<std::string>(value));
    }
    if (value.type() == typeid(std::vector<std::string>)) {
        return std::any_cast<std::vector<std::string>>(value);
    }
    throw std::invalid_argument("Invalid type for string list");
}

inline bool ParseBool(const std::any& value) {
    if (value.type() == typeid(bool)) {
        return std::any_cast<bool>(value);
    }
    if (value.type() == typeid(std::string)) {
        auto str = std::any_cast<std::string>(value);
        if (str == "true" || str == "True" || str == "TRUE" || str == "1") {
            return true;
        }
        if (str == "false" || str == "False" || str == "FALSE" || str == "0") {
            return false;
        }
        throw std::invalid_argument("Invalid type for bool: " + str);
    }
    throw std::invalid_argument("Invalid type for bool: " + std::string(value.type().name()));
}

inline double ParseDouble(const std::any& value) {
    if (value.type() == typeid(double)) {
        return std::any_cast<double>(value);
    }
    if (value.type() == typeid(std::string)) {
        return std::stod(std::any_cast<std::string>(value));
    }
    throw std::invalid_argument("Invalid type for double");
}

inline std::any ParseValue(ValueType type, const std::any& value) {
    switch (type) {
        case ValueType::INT:
            return ParseInt(value);
        case ValueType::STRING:
            return ParseString(value);
        case ValueType::STRING_LIST:
            return ParseStringList(value);
        case ValueType::BOOL:
            return ParseBool(value);
        case ValueType::DOUBLE:
            return ParseDouble(value);
        default:
            throw std::invalid_argument("Invalid type for value: " + std::to_string(type));
    }
}

// Get & Put Option Value from Options
template <typename T>
T GetOptionValue(const Options& options, const std::string& name) {
    auto& defs = GetOptionDefinitions();
    auto def_iter = defs.find(name);
    if (def_iter == defs.end()) {
        SPDLOG_ERROR("Option definition for {} not found", name);
        return T{};
    }

    const auto& def = def_iter->second;

    auto opt_iter = options.find(name);
    if (opt_iter != options.end()) {
        return std::any_cast<T>(ParseValue(def.value_type, opt_iter->second));
    }

    if (def.default_value.empty()) {
        SPDLOG_DEBUG("Option {} not set and no default value", name);
        return T{};
    }

    return std::any_cast<T>(ParseValue(def.value_type, def.default_value));
}

void PutOptionValue(Options& options, const std::string& name, const std::string& value);

// Utils for config
std::string GetOptionFromEnv(const std::string& name);
void LoadOptions(Options& options);
void LoadOptionsFromEnv(Options& options);
void LoadOptionsFromFile(Options& options, std::string file_path = "");

} // namespace backstop
