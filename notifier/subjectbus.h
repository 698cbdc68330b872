#ifndef NOTIFIER_SUBJECTBUS_H_
#define NOTIFIER_SUBJECTBUS_H_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "notifier/json.h"
#include "notifier/notifier_types.h"
#include "notifier/subjectregistry.h"
#include "notifier/subscriber.h"
#include "notifier/subscription.h"

namespace notifier {

// Named subjects, each backed by its own SubjectRegistry. A subject is created
// on first getSubject()/subscribe() with the global configuration, overridden
// by the subject's own NOTIFIER_CONFIG section when one exists.
class SubjectBus {
public:
    SubjectBus();
    explicit SubjectBus(const Json& configDoc);
    ~SubjectBus() = default;

    SubjectBus(const SubjectBus&) = delete;
    SubjectBus& operator=(const SubjectBus&) = delete;

    std::shared_ptr<SubjectRegistry> getSubject(const std::string& name);

    // nullptr if the subject was never created
    std::shared_ptr<SubjectRegistry> findSubject(const std::string& name) const;

    Subscription subscribe(const std::string& name, SubscriberPtr subscriber);

    // Publishing to an unknown subject delivers to nobody.
    DeliveryReport publish(const std::string& name, const std::string& message);

    // Outstanding Subscriptions of a removed subject become no-ops once the
    // last reference to its registry is gone.
    bool removeSubject(const std::string& name);

    std::vector<std::string> getSubjectNames() const;

    const NotifierConfig& getGlobalConfig() const { return m_globalConfig; }

private:
    Json m_configDoc;
    NotifierConfig m_globalConfig;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<SubjectRegistry>> m_subjects;
};

} // namespace notifier

#endif // NOTIFIER_SUBJECTBUS_H_
