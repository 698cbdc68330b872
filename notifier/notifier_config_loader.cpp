#include "notifier/notifier_config_loader.h"
#include "notifier/logger.h"     // For NOTIFIER_LOG_WARN, NOTIFIER_LOG_INFO, NOTIFIER_LOG_ERROR

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace notifier {

namespace {

size_t readSize(const Json& value) {
    if (value.is_string()) {
        std::string val_str = value.get<std::string>();
        // stoul accepts a leading '-' and wraps it around
        if (val_str.find('-') != std::string::npos) {
            throw std::out_of_range("negative value '" + val_str + "'");
        }
        return static_cast<size_t>(std::stoul(val_str));
    }
    if (!value.is_number_integer()) {
        throw std::invalid_argument("not an integer: " + value.dump());
    }
    if (value.get<long long>() < 0) {
        throw std::out_of_range("negative value " + value.dump());
    }
    return value.get<size_t>();
}

bool readBool(const Json& value) {
    if (value.is_string()) {
        std::string val_str = value.get<std::string>();
        std::transform(val_str.begin(), val_str.end(), val_str.begin(),
                       [](unsigned char c){ return std::tolower(c); });
        return val_str == "true" || val_str == "1";
    }
    return value.get<bool>();
}

} // namespace

FailurePolicy failurePolicyFromString(const std::string& policy_str, FailurePolicy default_policy) {
    std::string lower_policy_str = policy_str;
    std::transform(lower_policy_str.begin(), lower_policy_str.end(), lower_policy_str.begin(),
                   [](unsigned char c){ return std::tolower(c); });

    if (lower_policy_str == "abort") {
        return FailurePolicy::ABORT;
    } else if (lower_policy_str == "isolate") {
        return FailurePolicy::ISOLATE;
    } else if (lower_policy_str == "collect-and-throw") {
        return FailurePolicy::COLLECT_AND_THROW;
    } else {
        NOTIFIER_LOG_WARN("Unrecognized failure policy string: '%s'. Defaulting to %s.",
                          policy_str.c_str(), failurePolicyToString(default_policy).c_str());
        return default_policy;
    }
}

std::string failurePolicyToString(FailurePolicy policy) {
    switch (policy) {
        case FailurePolicy::ABORT:             return "abort";
        case FailurePolicy::ISOLATE:           return "isolate";
        case FailurePolicy::COLLECT_AND_THROW: return "collect-and-throw";
    }
    return "isolate";
}

bool loadNotifierConfig(const Json& doc,
                        const std::string& subjectName,
                        NotifierConfig& config_out) {
    std::string config_key = subjectName.empty() || subjectName == CFG_NOTIFIER_GLOBAL_KEY ?
                             CFG_NOTIFIER_GLOBAL_KEY : subjectName;

    std::string full_config_entry = CFG_NOTIFIER_TABLE_NAME + "|" + config_key;

    if (!doc.is_object() || !doc.contains(CFG_NOTIFIER_TABLE_NAME) ||
        !doc.at(CFG_NOTIFIER_TABLE_NAME).is_object() ||
        !doc.at(CFG_NOTIFIER_TABLE_NAME).contains(config_key)) {
        NOTIFIER_LOG_INFO("No notifier config found for entry '%s'. Using defaults or previously loaded global config.",
                          full_config_entry.c_str());
        config_out.parseFailurePolicy();
        return false;
    }

    const Json& config_values = doc.at(CFG_NOTIFIER_TABLE_NAME).at(config_key);
    if (!config_values.is_object()) {
        NOTIFIER_LOG_ERROR("Notifier config entry '%s' is not an object", full_config_entry.c_str());
        config_out.parseFailurePolicy();
        return false;
    }

    NOTIFIER_LOG_INFO("Loading notifier config for entry '%s'. Found %zu fields.",
                      full_config_entry.c_str(), config_values.size());
    bool loaded_any_value = false;

    try {
        if (config_values.contains("failure_policy")) {
            config_out.failure_policy_str = config_values.at("failure_policy").get<std::string>();
            config_out.failure_policy_enum =
                failurePolicyFromString(config_out.failure_policy_str, FailurePolicy::ISOLATE);
            loaded_any_value = true;
        }
        if (config_values.contains("max_subscribers")) {
            config_out.max_subscribers = readSize(config_values.at("max_subscribers"));
            loaded_any_value = true;
        }
        if (config_values.contains("allow_duplicates")) {
            config_out.allow_duplicates = readBool(config_values.at("allow_duplicates"));
            loaded_any_value = true;
        }
        if (config_values.contains("log_deliveries")) {
            config_out.log_deliveries = readBool(config_values.at("log_deliveries"));
            loaded_any_value = true;
        }
    } catch (const Json::exception& je) {
        NOTIFIER_LOG_ERROR("NotifierConfig: Wrong value type for '%s': %s", full_config_entry.c_str(), je.what());
    } catch (const std::invalid_argument& ia) {
        NOTIFIER_LOG_ERROR("NotifierConfig: Invalid argument parsing field for '%s': %s", full_config_entry.c_str(), ia.what());
    } catch (const std::out_of_range& oor) {
        NOTIFIER_LOG_ERROR("NotifierConfig: Out of range parsing field for '%s': %s", full_config_entry.c_str(), oor.what());
    }

    config_out.parseFailurePolicy();

    if (loaded_any_value) {
        NOTIFIER_LOG_INFO("Loaded notifier config for entry '%s'. Failure policy string: '%s', enum: %d",
                          full_config_entry.c_str(), config_out.failure_policy_str.c_str(),
                          static_cast<int>(config_out.failure_policy_enum));
    }
    return loaded_any_value;
}

bool loadNotifierConfigFile(const std::string& path,
                            const std::string& subjectName,
                            NotifierConfig& config_out) {
    std::ifstream in(path);
    if (!in.is_open()) {
        NOTIFIER_LOG_ERROR("Cannot open notifier config file '%s'", path.c_str());
        return false;
    }

    Json doc;
    try {
        doc = Json::parse(in);
    } catch (const Json::parse_error& pe) {
        NOTIFIER_LOG_ERROR("Cannot parse notifier config file '%s': %s", path.c_str(), pe.what());
        return false;
    }

    return loadNotifierConfig(doc, subjectName, config_out);
}

bool applyLoggerConfig(const Json& doc) {
    if (!doc.is_object() || !doc.contains(CFG_LOGGER_TABLE_NAME) ||
        !doc.at(CFG_LOGGER_TABLE_NAME).is_object()) {
        return false;
    }

    const Json& logger_values = doc.at(CFG_LOGGER_TABLE_NAME);
    bool applied = false;

    try {
        if (logger_values.contains("level")) {
            std::string level_str = logger_values.at("level").get<std::string>();
            Logger::Priority prio;
            if (Logger::priorityFromString(level_str, prio)) {
                Logger::setMinPrio(prio);
                applied = true;
            } else {
                NOTIFIER_LOG_WARN("Unrecognized log level '%s'", level_str.c_str());
            }
        }
        if (logger_values.contains("output")) {
            std::string output_str = logger_values.at("output").get<std::string>();
            Logger::Output output;
            if (Logger::outputFromString(output_str, output)) {
                Logger::setOutput(output);
                applied = true;
            } else {
                NOTIFIER_LOG_WARN("Unrecognized log output '%s'", output_str.c_str());
            }
        }
    } catch (const Json::exception& je) {
        NOTIFIER_LOG_ERROR("Logger config: Wrong value type: %s", je.what());
    }

    return applied;
}

} // namespace notifier
