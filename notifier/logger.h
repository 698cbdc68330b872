#pragma once

#include <string>
#include <mutex>
#include <stdexcept>
#include <syslog.h>

namespace notifier {

#define NOTIFIER_LOG_ERROR(MSG, ...)  notifier::Logger::getInstance().write(notifier::Logger::NOTIFIER_ERROR,  ":- %s: " MSG, __FUNCTION__, ##__VA_ARGS__)
#define NOTIFIER_LOG_WARN(MSG, ...)   notifier::Logger::getInstance().write(notifier::Logger::NOTIFIER_WARN,   ":- %s: " MSG, __FUNCTION__, ##__VA_ARGS__)
#define NOTIFIER_LOG_NOTICE(MSG, ...) notifier::Logger::getInstance().write(notifier::Logger::NOTIFIER_NOTICE, ":- %s: " MSG, __FUNCTION__, ##__VA_ARGS__)
#define NOTIFIER_LOG_INFO(MSG, ...)   notifier::Logger::getInstance().write(notifier::Logger::NOTIFIER_INFO,   ":- %s: " MSG, __FUNCTION__, ##__VA_ARGS__)
#define NOTIFIER_LOG_DEBUG(MSG, ...)  notifier::Logger::getInstance().write(notifier::Logger::NOTIFIER_DEBUG,  ":- %s: " MSG, __FUNCTION__, ##__VA_ARGS__)

#define NOTIFIER_LOG_CONCAT_IMPL(a, b) a ## b
#define NOTIFIER_LOG_CONCAT(a, b) NOTIFIER_LOG_CONCAT_IMPL(a, b)

#define NOTIFIER_LOG_ENTER() notifier::Logger::ScopeLogger NOTIFIER_LOG_CONCAT(logger, __LINE__) (__LINE__, __FUNCTION__)

#define NOTIFIER_LOG_THROW(MSG, ...) notifier::Logger::getInstance().wthrow(notifier::Logger::NOTIFIER_ERROR, ":- %s: " MSG, __FUNCTION__, ##__VA_ARGS__)

class Logger
{
public:

    enum Priority
    {
        NOTIFIER_EMERG,
        NOTIFIER_ALERT,
        NOTIFIER_CRIT,
        NOTIFIER_ERROR,
        NOTIFIER_WARN,
        NOTIFIER_NOTICE,
        NOTIFIER_INFO,
        NOTIFIER_DEBUG
    };

    enum Output
    {
        NOTIFIER_SYSLOG,
        NOTIFIER_STDOUT,
        NOTIFIER_STDERR
    };

    static Logger &getInstance();

    static void setMinPrio(Priority prio);
    static Priority getMinPrio();

    static void setOutput(Output output);
    static Output getOutput();

    // Case-insensitive names as used in configuration ("error", "notice", ...).
    // Returns false and leaves prio untouched for an unknown name.
    static bool priorityFromString(const std::string &name, Priority &prio);
    static std::string priorityToString(Priority prio);

    static bool outputFromString(const std::string &name, Output &output);

#ifdef __GNUC__
    __attribute__ ((format (printf, 3, 4)))
#endif
    void write(Priority prio, const char *fmt, ...);

    [[noreturn]]
#ifdef __GNUC__
    __attribute__ ((format (printf, 3, 4)))
#endif
    void wthrow(Priority prio, const char *fmt, ...);

    class ScopeLogger
    {
    public:

        ScopeLogger(int line, const char *fun);
        ~ScopeLogger();

    private:

        const int m_line;
        const char *m_fun;
    };

private:

    Logger() = default;
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger &operator=(const Logger&) = delete;

    void writeLine(Priority prio, const char *line);

    Priority m_minPrio = NOTIFIER_NOTICE;
    Output m_output = NOTIFIER_SYSLOG;
    std::mutex m_mutex;
};

} // namespace notifier
