#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "notifier/notifier_types.h"

namespace notifier {

// Thrown by SubjectRegistry::notifyAll under FailurePolicy::COLLECT_AND_THROW
// once every subscriber has been visited.
class NotificationError : public std::runtime_error
{
public:
    NotificationError(const std::string& subject, std::vector<DeliveryFailure> failures)
        : std::runtime_error(buildMessage(subject, failures)),
          m_subject(subject),
          m_failures(std::move(failures))
    {
    }

    const std::string& getSubject() const { return m_subject; }
    const std::vector<DeliveryFailure>& getFailures() const { return m_failures; }

private:
    static std::string buildMessage(const std::string& subject, const std::vector<DeliveryFailure>& failures)
    {
        std::string msg = "Notification of subject '" + subject + "' failed for " +
                          std::to_string(failures.size()) + " subscriber(s)";
        if (!failures.empty())
        {
            msg += ": " + failures.front().what;
        }
        return msg;
    }

    std::string m_subject;
    std::vector<DeliveryFailure> m_failures;
};

} // namespace notifier
