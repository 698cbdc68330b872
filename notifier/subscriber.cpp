#include "notifier/subscriber.h"
#include "notifier/logger.h"

#include <stdexcept>

namespace notifier {

CallbackSubscriber::CallbackSubscriber(MessageCallback callback)
    : m_callback(std::move(callback))
{
    if (!m_callback)
    {
        throw std::invalid_argument("CallbackSubscriber: callback is empty");
    }
}

void CallbackSubscriber::receive(const std::string &message)
{
    m_callback(message);
}

FilteredSubscriber::FilteredSubscriber(SubscriberPtr target, MessageFilter filter)
    : m_target(std::move(target)),
      m_filter(std::move(filter))
{
    if (!m_target)
    {
        throw std::invalid_argument("FilteredSubscriber: target subscriber is null");
    }
}

void FilteredSubscriber::receive(const std::string &message)
{
    // No filter: pass everything through
    if (m_filter && !m_filter(message))
    {
        NOTIFIER_LOG_DEBUG("Filtered out message of size %zu", message.size());
        return;
    }

    m_target->receive(message);
}

StreamSubscriber::StreamSubscriber(const std::string &name, std::ostream &out)
    : m_name(name),
      m_out(out)
{
}

void StreamSubscriber::receive(const std::string &message)
{
    m_out << m_name << ": " << message << "\n";
}

SubscriberPtr makeSubscriber(MessageCallback callback)
{
    return std::make_shared<CallbackSubscriber>(std::move(callback));
}

} // namespace notifier
