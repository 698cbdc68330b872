#pragma once
#include "notifier/notifier_types.h" // For notifier::NotifierConfig and notifier::FailurePolicy
#include "notifier/json.h"
#include <string>

namespace notifier {

// Top-level section holding per-subject registry settings
const std::string CFG_NOTIFIER_TABLE_NAME = "NOTIFIER_CONFIG";
const std::string CFG_NOTIFIER_GLOBAL_KEY = "global";

// Top-level section holding logger settings: { "level": "...", "output": "..." }
const std::string CFG_LOGGER_TABLE_NAME = "LOGGER";

// Case-insensitive; logs a warning and returns default_policy for unknown strings.
FailurePolicy failurePolicyFromString(const std::string& policy_str,
                                      FailurePolicy default_policy = FailurePolicy::ISOLATE);

std::string failurePolicyToString(FailurePolicy policy);

// Applies NOTIFIER_CONFIG|<subjectName> from doc onto config_out.
// An empty subjectName or "global" selects the global section.
// Fields absent from the section keep their current values, so callers can
// load "global" first and then the subject's own section on top of it.
// Returns true if at least one value was loaded.
bool loadNotifierConfig(const Json& doc,
                        const std::string& subjectName,
                        NotifierConfig& config_out);

// Same as loadNotifierConfig, reading doc from a JSON file.
// Returns false if the file cannot be read or parsed.
bool loadNotifierConfigFile(const std::string& path,
                            const std::string& subjectName,
                            NotifierConfig& config_out);

// Applies the LOGGER section (min priority and output) to notifier::Logger.
// Returns true if at least one setting was applied.
bool applyLoggerConfig(const Json& doc);

} // namespace notifier
