#pragma once
#include <cstdint>
#include <string>

namespace notifier {

// Snapshot of the activity of one SubjectRegistry.
struct NotifierCounters {
    uint64_t broadcasts = 0;      // notifyAll() calls
    uint64_t deliveries = 0;      // receive() calls that returned normally
    uint64_t failures = 0;        // receive() calls that threw
    uint64_t registrations = 0;   // entries added
    uint64_t unregistrations = 0; // entries removed
};

namespace CounterNames {

inline std::string broadcasts(const std::string& subject) {
    return subject + ":broadcasts";
}
inline std::string deliveries(const std::string& subject) {
    return subject + ":deliveries";
}
inline std::string failures(const std::string& subject) {
    return subject + ":failures";
}
inline std::string registrations(const std::string& subject) {
    return subject + ":registrations";
}
inline std::string unregistrations(const std::string& subject) {
    return subject + ":unregistrations";
}

} // namespace CounterNames

// "<subject>:broadcasts=N <subject>:deliveries=N ..." for log lines
inline std::string formatCounters(const std::string& subject, const NotifierCounters& counters) {
    return CounterNames::broadcasts(subject) + "=" + std::to_string(counters.broadcasts) + " " +
           CounterNames::deliveries(subject) + "=" + std::to_string(counters.deliveries) + " " +
           CounterNames::failures(subject) + "=" + std::to_string(counters.failures) + " " +
           CounterNames::registrations(subject) + "=" + std::to_string(counters.registrations) + " " +
           CounterNames::unregistrations(subject) + "=" + std::to_string(counters.unregistrations);
}
} // namespace notifier
