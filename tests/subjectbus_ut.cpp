#include <gtest/gtest.h>
#include "notifier/subjectbus.h"
#include <string>
#include <vector>

class SubjectBusTest : public ::testing::Test {
protected:
    notifier::SubjectBus bus;
};

TEST_F(SubjectBusTest, PublishReachesOnlyThatSubject) {
    std::vector<std::string> alarms;
    std::vector<std::string> status;

    auto alarm_sub = bus.subscribe("alarms", notifier::makeSubscriber([&](const std::string& m) { alarms.push_back(m); }));
    auto status_sub = bus.subscribe("status", notifier::makeSubscriber([&](const std::string& m) { status.push_back(m); }));

    bus.publish("alarms", "fan failure");

    ASSERT_EQ(alarms, std::vector<std::string>({"fan failure"}));
    ASSERT_TRUE(status.empty());
}

TEST_F(SubjectBusTest, PublishToUnknownSubject) {
    notifier::DeliveryReport report;
    ASSERT_NO_THROW({
        report = bus.publish("nobody_listens", "message");
    });
    EXPECT_EQ(report.attempted, 0u);
    EXPECT_EQ(bus.findSubject("nobody_listens"), nullptr);
}

TEST_F(SubjectBusTest, GetSubjectReturnsSameRegistry) {
    auto first = bus.getSubject("orders");
    auto second = bus.getSubject("orders");
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->getName(), "orders");
    EXPECT_EQ(bus.findSubject("orders"), first);
}

TEST_F(SubjectBusTest, SubscriptionGuardUnregisters) {
    int count = 0;
    {
        auto sub = bus.subscribe("scoped", notifier::makeSubscriber([&](const std::string&) { count++; }));
        bus.publish("scoped", "1");
    }
    bus.publish("scoped", "2");

    EXPECT_EQ(count, 1);
    EXPECT_TRUE(bus.getSubject("scoped")->empty());
}

TEST_F(SubjectBusTest, SubjectNamesSorted) {
    bus.getSubject("zeta");
    bus.getSubject("alpha");
    bus.getSubject("mu");

    EXPECT_EQ(bus.getSubjectNames(), std::vector<std::string>({"alpha", "mu", "zeta"}));
}

TEST_F(SubjectBusTest, RemoveSubject) {
    auto sub = bus.subscribe("temp", notifier::makeSubscriber([](const std::string&) {}));

    EXPECT_TRUE(bus.removeSubject("temp"));
    EXPECT_FALSE(bus.removeSubject("temp"));
    EXPECT_EQ(bus.findSubject("temp"), nullptr);

    // Registry is gone; the guard must not touch it
    EXPECT_FALSE(sub.isValid());
    ASSERT_NO_THROW(sub.reset());
}

TEST_F(SubjectBusTest, SubscriberPublishesFromCallback) {
    std::vector<std::string> second;
    auto relay = bus.subscribe("first", notifier::makeSubscriber([&](const std::string& m) {
        bus.publish("second", "relayed " + m);
    }));
    auto sink = bus.subscribe("second", notifier::makeSubscriber([&](const std::string& m) { second.push_back(m); }));

    bus.publish("first", "ping");

    ASSERT_EQ(second, std::vector<std::string>({"relayed ping"}));
}

TEST(SubjectBusConfigTest, PerSubjectConfigOverridesGlobal) {
    notifier::Json doc = notifier::Json::parse(R"({
        "NOTIFIER_CONFIG": {
            "global": { "failure_policy": "collect-and-throw", "allow_duplicates": false },
            "orders": { "failure_policy": "abort", "max_subscribers": 4 }
        }
    })");

    notifier::SubjectBus bus(doc);

    EXPECT_EQ(bus.getGlobalConfig().failure_policy_enum, notifier::FailurePolicy::COLLECT_AND_THROW);

    auto orders = bus.getSubject("orders");
    EXPECT_EQ(orders->getConfig().failure_policy_enum, notifier::FailurePolicy::ABORT);
    EXPECT_EQ(orders->getConfig().max_subscribers, 4u);
    EXPECT_FALSE(orders->getConfig().allow_duplicates); // Inherited from global

    auto other = bus.getSubject("other");
    EXPECT_EQ(other->getConfig().failure_policy_enum, notifier::FailurePolicy::COLLECT_AND_THROW);
    EXPECT_EQ(other->getConfig().max_subscribers, 0u);
}

TEST(SubjectBusConfigTest, LargeCapacityDoesNotPreallocate) {
    notifier::Json doc = notifier::Json::parse(R"({
        "NOTIFIER_CONFIG": { "orders": { "max_subscribers": 1000000000000 } }
    })");

    notifier::SubjectBus bus(doc);

    std::shared_ptr<notifier::SubjectRegistry> orders;
    ASSERT_NO_THROW({
        orders = bus.getSubject("orders");
    });
    EXPECT_EQ(orders->getConfig().max_subscribers, 1000000000000u);

    int count = 0;
    auto sub = bus.subscribe("orders", notifier::makeSubscriber([&](const std::string&) { count++; }));
    bus.publish("orders", "new order");
    EXPECT_EQ(count, 1);
}
