#include "notifier/subjectbus.h"
#include "notifier/logger.h"
#include "notifier/notifier_config_loader.h"

namespace notifier {

SubjectBus::SubjectBus()
    : m_configDoc(Json::object())
{
}

SubjectBus::SubjectBus(const Json& configDoc)
    : m_configDoc(configDoc)
{
    loadNotifierConfig(m_configDoc, CFG_NOTIFIER_GLOBAL_KEY, m_globalConfig);
}

std::shared_ptr<SubjectRegistry> SubjectBus::getSubject(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_subjects.find(name);
    if (it != m_subjects.end())
    {
        return it->second;
    }

    NotifierConfig config = m_globalConfig;
    if (name != CFG_NOTIFIER_GLOBAL_KEY)
    {
        loadNotifierConfig(m_configDoc, name, config);
    }

    auto registry = std::make_shared<SubjectRegistry>(name, config);
    m_subjects.emplace(name, registry);

    NOTIFIER_LOG_NOTICE("SubjectBus: created subject '%s'", name.c_str());
    return registry;
}

std::shared_ptr<SubjectRegistry> SubjectBus::findSubject(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_subjects.find(name);
    return it != m_subjects.end() ? it->second : nullptr;
}

Subscription SubjectBus::subscribe(const std::string& name, SubscriberPtr subscriber)
{
    return getSubject(name)->subscribe(std::move(subscriber));
}

DeliveryReport SubjectBus::publish(const std::string& name, const std::string& message)
{
    // Lock is released before delivery; subscribers may use the bus
    auto registry = findSubject(name);
    if (!registry)
    {
        NOTIFIER_LOG_DEBUG("SubjectBus: no subject '%s', message dropped", name.c_str());
        return DeliveryReport();
    }

    return registry->notifyAll(message);
}

bool SubjectBus::removeSubject(const std::string& name)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_subjects.erase(name) == 0)
    {
        return false;
    }

    NOTIFIER_LOG_NOTICE("SubjectBus: removed subject '%s'", name.c_str());
    return true;
}

std::vector<std::string> SubjectBus::getSubjectNames() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    std::vector<std::string> names;
    names.reserve(m_subjects.size());
    for (const auto& subject : m_subjects)
    {
        names.push_back(subject.first);
    }
    return names;
}

} // namespace notifier
