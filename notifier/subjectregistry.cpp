#include "notifier/subjectregistry.h"
#include "notifier/logger.h"
#include "notifier/notificationerror.h"
#include "notifier/notifier_config_loader.h" // For failurePolicyToString

#include <algorithm>
#include <stdexcept>

namespace notifier {

SubjectRegistry::SubjectRegistry(const std::string& name, const NotifierConfig& config)
    : name_(name), config_(config) {
    NOTIFIER_LOG_INFO("SubjectRegistry '%s' created (failure_policy=%s, max_subscribers=%zu, allow_duplicates=%d)",
                      name_.c_str(), failurePolicyToString(config_.failure_policy_enum).c_str(),
                      config_.max_subscribers, config_.allow_duplicates ? 1 : 0);
}

SubjectRegistry::~SubjectRegistry() {
    NOTIFIER_LOG_INFO("SubjectRegistry '%s' destroyed with %zu subscriber(s): %s",
                      name_.c_str(), subscribers_.size(), formatCounters(name_, counters_).c_str());
}

SubscriptionId SubjectRegistry::registerSubscriber(SubscriberPtr subscriber) {
    NOTIFIER_LOG_ENTER();

    if (!subscriber) {
        NOTIFIER_LOG_ERROR("SubjectRegistry '%s': refusing to register a null subscriber", name_.c_str());
        throw std::invalid_argument("SubjectRegistry '" + name_ + "': subscriber is null");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (!config_.allow_duplicates) {
        auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                               [&](const SubscriberEntry& entry) { return entry.subscriber == subscriber; });
        if (it != subscribers_.end()) {
            NOTIFIER_LOG_DEBUG("SubjectRegistry '%s': subscriber already registered as id=%lu",
                               name_.c_str(), static_cast<unsigned long>(it->id));
            return it->id;
        }
    }

    if (config_.max_subscribers > 0 && subscribers_.size() >= config_.max_subscribers) {
        NOTIFIER_LOG_ERROR("SubjectRegistry '%s': subscriber limit %zu reached",
                           name_.c_str(), config_.max_subscribers);
        throw std::length_error("SubjectRegistry '" + name_ + "': subscriber limit reached");
    }

    SubscriptionId id = next_id_++;
    subscribers_.push_back({id, std::move(subscriber)});
    counters_.registrations++;

    NOTIFIER_LOG_INFO("SubjectRegistry '%s': registered id=%lu (%zu subscriber(s))",
                      name_.c_str(), static_cast<unsigned long>(id), subscribers_.size());
    return id;
}

Subscription SubjectRegistry::subscribe(SubscriberPtr subscriber) {
    // shared_from_this() throws std::bad_weak_ptr if not owned by a shared_ptr
    std::weak_ptr<SubjectRegistry> self = shared_from_this();
    SubscriptionId id = registerSubscriber(std::move(subscriber));
    return Subscription(self, id);
}

bool SubjectRegistry::unregisterSubscriber(SubscriptionId id) {
    if (id == INVALID_SUBSCRIPTION_ID) {
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(subscribers_.begin(), subscribers_.end(),
                           [id](const SubscriberEntry& entry) { return entry.id == id; });
    if (it == subscribers_.end()) {
        NOTIFIER_LOG_DEBUG("SubjectRegistry '%s': no subscriber with id=%lu",
                           name_.c_str(), static_cast<unsigned long>(id));
        return false;
    }

    subscribers_.erase(it);
    counters_.unregistrations++;
    NOTIFIER_LOG_INFO("SubjectRegistry '%s': unregistered id=%lu (%zu subscriber(s))",
                      name_.c_str(), static_cast<unsigned long>(id), subscribers_.size());
    return true;
}

size_t SubjectRegistry::unregisterSubscriber(const SubscriberPtr& subscriber) {
    if (!subscriber) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto first = std::remove_if(subscribers_.begin(), subscribers_.end(),
                                [&](const SubscriberEntry& entry) { return entry.subscriber == subscriber; });
    size_t removed = static_cast<size_t>(std::distance(first, subscribers_.end()));
    subscribers_.erase(first, subscribers_.end());
    counters_.unregistrations += removed;

    if (removed > 0) {
        NOTIFIER_LOG_INFO("SubjectRegistry '%s': unregistered %zu entr%s of one subscriber",
                          name_.c_str(), removed, removed == 1 ? "y" : "ies");
    }
    return removed;
}

DeliveryReport SubjectRegistry::notifyAll(const std::string& message) {
    NOTIFIER_LOG_ENTER();

    std::vector<SubscriberEntry> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = subscribers_;
        counters_.broadcasts++;
    }

    DeliveryReport report;

    for (size_t pos = 0; pos < snapshot.size(); ++pos) {
        const SubscriberEntry& entry = snapshot[pos];
        report.attempted++;

        try {
            entry.subscriber->receive(message);
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                counters_.failures++;
            }
            NOTIFIER_LOG_ERROR("SubjectRegistry '%s': subscriber id=%lu at position %zu failed: %s",
                               name_.c_str(), static_cast<unsigned long>(entry.id), pos, e.what());

            if (config_.failure_policy_enum == FailurePolicy::ABORT) {
                NOTIFIER_LOG_WARN("SubjectRegistry '%s': aborting broadcast, %zu subscriber(s) not notified",
                                  name_.c_str(), snapshot.size() - pos - 1);
                throw;
            }

            report.failures.push_back({entry.id, pos, e.what()});
            continue;
        }

        report.delivered++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            counters_.deliveries++;
        }
        if (config_.log_deliveries) {
            NOTIFIER_LOG_DEBUG("SubjectRegistry '%s': delivered to id=%lu",
                               name_.c_str(), static_cast<unsigned long>(entry.id));
        }
    }

    if (!report.failures.empty() && config_.failure_policy_enum == FailurePolicy::COLLECT_AND_THROW) {
        throw NotificationError(name_, report.failures);
    }

    return report;
}

size_t SubjectRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

bool SubjectRegistry::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.empty();
}

bool SubjectRegistry::contains(const SubscriberPtr& subscriber) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(subscribers_.begin(), subscribers_.end(),
                       [&](const SubscriberEntry& entry) { return entry.subscriber == subscriber; });
}

void SubjectRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.unregistrations += subscribers_.size();
    subscribers_.clear();
    NOTIFIER_LOG_INFO("SubjectRegistry '%s': cleared, %s", name_.c_str(),
                      formatCounters(name_, counters_).c_str());
}

NotifierCounters SubjectRegistry::getCounters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

} // namespace notifier
