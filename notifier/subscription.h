#ifndef NOTIFIER_SUBSCRIPTION_H_
#define NOTIFIER_SUBSCRIPTION_H_

#include <memory>

#include "notifier/notifier_types.h"

namespace notifier {

class SubjectRegistry;

/**
 * @brief RAII guard of one SubjectRegistry entry.
 *
 * Unregisters the entry on destruction. Holds the registry weakly, so a
 * Subscription that outlives its registry is harmless. Move-only.
 *
 * @code
 * class Dashboard {
 *     notifier::Subscription m_alarmSub;
 *
 *     void attach(const std::shared_ptr<notifier::SubjectRegistry>& alarms) {
 *         m_alarmSub = alarms->subscribe(notifier::makeSubscriber(
 *             [this](const std::string& m) { onAlarm(m); }));
 *     }
 *     // m_alarmSub unregisters when the Dashboard is destroyed.
 * };
 * @endcode
 */
class Subscription {
public:
    /** @brief Empty (invalid) subscription. */
    Subscription() = default;

    Subscription(std::weak_ptr<SubjectRegistry> registry, SubscriptionId id);

    /** @brief Unregister on destruction. */
    ~Subscription();

    Subscription(Subscription&& other) noexcept;
    Subscription& operator=(Subscription&& other) noexcept;

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /** @brief Unregister immediately (idempotent). */
    void reset();

    /**
     * @brief Give up ownership without unregistering.
     * @return The id that was held; the entry stays registered.
     */
    SubscriptionId release();

    /** @brief True while holding an id whose registry is still alive. */
    bool isValid() const;

    SubscriptionId getId() const { return id_; }

private:
    std::weak_ptr<SubjectRegistry> registry_;
    SubscriptionId id_ = INVALID_SUBSCRIPTION_ID;
};

} // namespace notifier

#endif // NOTIFIER_SUBSCRIPTION_H_
