#ifndef NOTIFIER_SUBJECTREGISTRY_H_
#define NOTIFIER_SUBJECTREGISTRY_H_

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "notifier/notifier_counters.h"
#include "notifier/notifier_types.h"
#include "notifier/subscriber.h"
#include "notifier/subscription.h"

namespace notifier {

/**
 * @brief Ordered set of subscribers of one subject.
 *
 * Messages are broadcast synchronously, in registration order, on the
 * caller's thread. The same handle may be registered several times unless
 * NotifierConfig::allow_duplicates is false; each entry receives its own copy
 * of every broadcast.
 *
 * Thread safety
 * -------------
 * All methods may be called from any thread. notifyAll() snapshots the
 * subscriber sequence under the lock and delivers outside it, so subscribers
 * may register or unregister (themselves or others) from inside receive().
 * Entries added during a broadcast are not visited by it; entries removed
 * during a broadcast may still receive it.
 */
class SubjectRegistry : public std::enable_shared_from_this<SubjectRegistry> {
public:
    explicit SubjectRegistry(const std::string& name = "default",
                             const NotifierConfig& config = NotifierConfig());
    ~SubjectRegistry();

    SubjectRegistry(const SubjectRegistry&) = delete;
    SubjectRegistry& operator=(const SubjectRegistry&) = delete;

    /**
     * @brief Append a subscriber to the sequence.
     * @return Id of the new entry, or of the existing entry when duplicates
     *         are disabled and the handle is already registered.
     * @throws std::invalid_argument if subscriber is null.
     * @throws std::length_error if max_subscribers would be exceeded.
     */
    SubscriptionId registerSubscriber(SubscriberPtr subscriber);

    /**
     * @brief Register and return a guard that unregisters on destruction.
     * @details The registry must be owned by a std::shared_ptr.
     */
    Subscription subscribe(SubscriberPtr subscriber);

    /**
     * @brief Remove one entry.
     * @return false if no entry has this id.
     */
    bool unregisterSubscriber(SubscriptionId id);

    /**
     * @brief Remove every entry of this handle.
     * @return Number of entries removed.
     */
    size_t unregisterSubscriber(const SubscriberPtr& subscriber);

    /**
     * @brief Deliver a message to every registered subscriber, in order.
     *
     * Failure handling follows NotifierConfig::failure_policy_enum:
     * - ABORT rethrows the first exception; later subscribers are skipped.
     * - ISOLATE records std::exception failures in the report.
     * - COLLECT_AND_THROW visits everyone, then throws NotificationError.
     * Exceptions not derived from std::exception always propagate.
     */
    DeliveryReport notifyAll(const std::string& message);

    size_t size() const;
    bool empty() const;
    bool contains(const SubscriberPtr& subscriber) const;

    // Drops every entry. Outstanding Subscription guards become no-ops.
    void clear();

    const std::string& getName() const { return name_; }
    const NotifierConfig& getConfig() const { return config_; }
    NotifierCounters getCounters() const;

private:
    struct SubscriberEntry {
        SubscriptionId id;
        SubscriberPtr subscriber;
    };

    std::string name_;
    NotifierConfig config_;

    mutable std::mutex mutex_;
    std::vector<SubscriberEntry> subscribers_;
    SubscriptionId next_id_ = 1;
    NotifierCounters counters_;
};

} // namespace notifier

#endif // NOTIFIER_SUBJECTREGISTRY_H_
