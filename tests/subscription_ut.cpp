#include <gtest/gtest.h>
#include "notifier/subjectregistry.h"
#include "notifier/subscription.h"
#include <memory>
#include <string>
#include <vector>

class SubscriptionTest : public ::testing::Test {
protected:
    std::shared_ptr<notifier::SubjectRegistry> registry;
    int receive_count = 0;

    void SetUp() override {
        registry = std::make_shared<notifier::SubjectRegistry>("subscription_subject");
    }

    notifier::SubscriberPtr counter() {
        return notifier::makeSubscriber([this](const std::string&) { receive_count++; });
    }
};

TEST_F(SubscriptionTest, UnregistersOnDestruction) {
    {
        auto sub = registry->subscribe(counter());
        ASSERT_TRUE(sub.isValid());
        ASSERT_EQ(registry->size(), 1u);

        registry->notifyAll("inside");
        ASSERT_EQ(receive_count, 1);
    }

    ASSERT_TRUE(registry->empty());
    registry->notifyAll("outside");
    ASSERT_EQ(receive_count, 1);
}

TEST_F(SubscriptionTest, ResetIsIdempotent) {
    auto sub = registry->subscribe(counter());
    sub.reset();
    EXPECT_FALSE(sub.isValid());
    EXPECT_EQ(sub.getId(), notifier::INVALID_SUBSCRIPTION_ID);

    ASSERT_NO_THROW(sub.reset());
    EXPECT_TRUE(registry->empty());
}

TEST_F(SubscriptionTest, MoveTransfersOwnership) {
    auto first = registry->subscribe(counter());
    auto id = first.getId();

    notifier::Subscription second(std::move(first));
    EXPECT_FALSE(first.isValid());
    EXPECT_TRUE(second.isValid());
    EXPECT_EQ(second.getId(), id);
    EXPECT_EQ(registry->size(), 1u);

    notifier::Subscription third;
    third = std::move(second);
    EXPECT_EQ(third.getId(), id);
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(SubscriptionTest, MoveAssignReleasesPreviousEntry) {
    auto keep = registry->subscribe(counter());
    auto replaced = registry->subscribe(counter());
    ASSERT_EQ(registry->size(), 2u);

    replaced = std::move(keep);
    EXPECT_EQ(registry->size(), 1u);
}

TEST_F(SubscriptionTest, ReleaseKeepsEntryRegistered) {
    auto sub = registry->subscribe(counter());
    auto id = sub.release();

    EXPECT_FALSE(sub.isValid());
    EXPECT_NE(id, notifier::INVALID_SUBSCRIPTION_ID);
    EXPECT_EQ(registry->size(), 1u);

    EXPECT_TRUE(registry->unregisterSubscriber(id));
}

TEST_F(SubscriptionTest, OutlivingRegistryIsHarmless) {
    auto sub = registry->subscribe(counter());
    registry.reset();

    EXPECT_FALSE(sub.isValid());
    ASSERT_NO_THROW(sub.reset());
}

TEST_F(SubscriptionTest, GuardsInVector) {
    std::vector<notifier::Subscription> guards;
    for (int i = 0; i < 3; ++i) {
        guards.push_back(registry->subscribe(counter()));
    }
    registry->notifyAll("m");
    EXPECT_EQ(receive_count, 3);

    guards.clear();
    EXPECT_TRUE(registry->empty());
}

TEST(SubscriptionStandaloneTest, RegistryNotOwnedBySharedPtr) {
    notifier::SubjectRegistry registry("stack_registry");
    EXPECT_THROW(registry.subscribe(notifier::makeSubscriber([](const std::string&) {})),
                 std::bad_weak_ptr);
    EXPECT_TRUE(registry.empty());
}

TEST(SubscriptionStandaloneTest, DefaultConstructedIsInvalid) {
    notifier::Subscription sub;
    EXPECT_FALSE(sub.isValid());
    EXPECT_EQ(sub.getId(), notifier::INVALID_SUBSCRIPTION_ID);
}
