#ifndef NOTIFIER_NOTIFIER_TYPES_H_
#define NOTIFIER_NOTIFIER_TYPES_H_

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace notifier {

/**
 * @brief Identifies one entry of a SubjectRegistry.
 *
 * Ids are unique per registry and never reused during its lifetime.
 */
using SubscriptionId = uint64_t;

/// Reserved value that represents "no subscription".
static constexpr SubscriptionId INVALID_SUBSCRIPTION_ID = 0;

/**
 * @brief What notifyAll() does when a subscriber throws.
 */
enum class FailurePolicy {
    ABORT,             ///< Propagate the first failure; remaining subscribers are skipped.
    ISOLATE,           ///< Record the failure in the DeliveryReport and continue.
    COLLECT_AND_THROW  ///< Continue, then throw NotificationError if anything failed.
};

/**
 * @brief One subscriber that failed during a broadcast.
 */
struct DeliveryFailure {
    SubscriptionId id = INVALID_SUBSCRIPTION_ID; ///< Entry whose receive() threw.
    size_t position = 0;                         ///< Index of the entry in the broadcast snapshot.
    std::string what;                            ///< Exception message.
};

/**
 * @brief Outcome of a single notifyAll() call.
 */
struct DeliveryReport {
    size_t attempted = 0;                  ///< Subscribers visited.
    size_t delivered = 0;                  ///< Subscribers whose receive() returned normally.
    std::vector<DeliveryFailure> failures; ///< In delivery order.

    bool ok() const { return failures.empty(); }
};

/**
 * @brief Configuration of a SubjectRegistry.
 * @details Defaults reproduce a plain observer subject: duplicates allowed,
 *          no capacity limit. Values can be overridden by loading a JSON
 *          document through notifier::loadNotifierConfig.
 */
struct NotifierConfig {
    std::string failure_policy_str = "isolate";                 ///< String form as read from configuration.
    FailurePolicy failure_policy_enum = FailurePolicy::ISOLATE; ///< Parsed value of failure_policy_str.
    size_t max_subscribers = 0;                                 ///< 0 means unlimited.
    bool allow_duplicates = true;                               ///< Same handle may be registered more than once.
    bool log_deliveries = false;                                ///< Log every delivery at debug level.

    /**
     * @brief Parses `failure_policy_str` into `failure_policy_enum`.
     * @details Case-insensitive. Unknown strings fall back to ISOLATE; the
     *          config loader logs the warning.
     */
    void parseFailurePolicy() {
        std::string lower = failure_policy_str;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c){ return std::tolower(c); });

        if (lower == "abort") {
            failure_policy_enum = FailurePolicy::ABORT;
        } else if (lower == "collect-and-throw") {
            failure_policy_enum = FailurePolicy::COLLECT_AND_THROW;
        } else {
            failure_policy_enum = FailurePolicy::ISOLATE;
        }
    }
};

} // namespace notifier

#endif // NOTIFIER_NOTIFIER_TYPES_H_
