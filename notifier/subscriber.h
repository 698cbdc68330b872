#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>

namespace notifier {

// A subscriber receives every message broadcast by the registries it is
// registered with. Identity is the handle: the same shared_ptr registered
// twice is two entries of one subscriber.
class Subscriber
{
public:
    virtual ~Subscriber() = default;

    virtual void receive(const std::string &message) = 0;
};

using SubscriberPtr = std::shared_ptr<Subscriber>;

using MessageCallback = std::function<void(const std::string&)>;

// Returns true if the message should be delivered.
using MessageFilter = std::function<bool(const std::string&)>;

class CallbackSubscriber : public Subscriber
{
public:
    explicit CallbackSubscriber(MessageCallback callback);

    void receive(const std::string &message) override;

private:
    MessageCallback m_callback;
};

// Forwards to the wrapped subscriber only the messages accepted by the filter.
// A throwing filter surfaces as a failure of this subscriber.
class FilteredSubscriber : public Subscriber
{
public:
    FilteredSubscriber(SubscriberPtr target, MessageFilter filter);

    void receive(const std::string &message) override;

    const SubscriberPtr &getTarget() const { return m_target; }

private:
    SubscriberPtr m_target;
    MessageFilter m_filter;
};

// Writes "<name>: <message>" lines to a stream. The stream must outlive the
// subscriber.
class StreamSubscriber : public Subscriber
{
public:
    StreamSubscriber(const std::string &name, std::ostream &out);

    void receive(const std::string &message) override;

    const std::string &getName() const { return m_name; }

private:
    std::string m_name;
    std::ostream &m_out;
};

SubscriberPtr makeSubscriber(MessageCallback callback);

} // namespace notifier
