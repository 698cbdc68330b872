#include "notifier/subscription.h"
#include "notifier/subjectregistry.h"

namespace notifier {

Subscription::Subscription(std::weak_ptr<SubjectRegistry> registry, SubscriptionId id)
    : registry_(std::move(registry)), id_(id) {}

Subscription::~Subscription() {
    reset();
}

Subscription::Subscription(Subscription&& other) noexcept
    : registry_(std::move(other.registry_)), id_(other.id_) {
    other.id_ = INVALID_SUBSCRIPTION_ID;
}

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        registry_ = std::move(other.registry_);
        id_ = other.id_;
        other.id_ = INVALID_SUBSCRIPTION_ID;
    }
    return *this;
}

void Subscription::reset() {
    if (id_ == INVALID_SUBSCRIPTION_ID) {
        return;
    }
    if (auto registry = registry_.lock()) { // Registry may already be gone
        registry->unregisterSubscriber(id_);
    }
    id_ = INVALID_SUBSCRIPTION_ID;
    registry_.reset();
}

SubscriptionId Subscription::release() {
    SubscriptionId id = id_;
    id_ = INVALID_SUBSCRIPTION_ID;
    registry_.reset();
    return id;
}

bool Subscription::isValid() const {
    return id_ != INVALID_SUBSCRIPTION_ID && !registry_.expired();
}

} // namespace notifier
