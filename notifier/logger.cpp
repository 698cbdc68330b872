#include "notifier/logger.h"

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <map>

namespace notifier {

namespace {

const std::map<std::string, Logger::Priority> priorityStringMap = {
    { "EMERG",  Logger::NOTIFIER_EMERG },
    { "ALERT",  Logger::NOTIFIER_ALERT },
    { "CRIT",   Logger::NOTIFIER_CRIT },
    { "ERROR",  Logger::NOTIFIER_ERROR },
    { "WARN",   Logger::NOTIFIER_WARN },
    { "NOTICE", Logger::NOTIFIER_NOTICE },
    { "INFO",   Logger::NOTIFIER_INFO },
    { "DEBUG",  Logger::NOTIFIER_DEBUG },
};

const std::map<std::string, Logger::Output> outputStringMap = {
    { "SYSLOG", Logger::NOTIFIER_SYSLOG },
    { "STDOUT", Logger::NOTIFIER_STDOUT },
    { "STDERR", Logger::NOTIFIER_STDERR },
};

// Logger priorities map 1:1 onto syslog levels.
int toSyslogPriority(Logger::Priority prio)
{
    switch (prio)
    {
        case Logger::NOTIFIER_EMERG:  return LOG_EMERG;
        case Logger::NOTIFIER_ALERT:  return LOG_ALERT;
        case Logger::NOTIFIER_CRIT:   return LOG_CRIT;
        case Logger::NOTIFIER_ERROR:  return LOG_ERR;
        case Logger::NOTIFIER_WARN:   return LOG_WARNING;
        case Logger::NOTIFIER_NOTICE: return LOG_NOTICE;
        case Logger::NOTIFIER_INFO:   return LOG_INFO;
        case Logger::NOTIFIER_DEBUG:  return LOG_DEBUG;
    }
    return LOG_DEBUG;
}

std::string toUpper(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c){ return std::toupper(c); });
    return str;
}

} // namespace

Logger &Logger::getInstance()
{
    static Logger logger;
    return logger;
}

void Logger::setMinPrio(Priority prio)
{
    Logger &logger = getInstance();
    std::lock_guard<std::mutex> lock(logger.m_mutex);
    logger.m_minPrio = prio;
}

Logger::Priority Logger::getMinPrio()
{
    Logger &logger = getInstance();
    std::lock_guard<std::mutex> lock(logger.m_mutex);
    return logger.m_minPrio;
}

void Logger::setOutput(Output output)
{
    Logger &logger = getInstance();
    std::lock_guard<std::mutex> lock(logger.m_mutex);
    logger.m_output = output;
}

Logger::Output Logger::getOutput()
{
    Logger &logger = getInstance();
    std::lock_guard<std::mutex> lock(logger.m_mutex);
    return logger.m_output;
}

bool Logger::priorityFromString(const std::string &name, Priority &prio)
{
    auto it = priorityStringMap.find(toUpper(name));
    if (it == priorityStringMap.end())
    {
        return false;
    }
    prio = it->second;
    return true;
}

std::string Logger::priorityToString(Priority prio)
{
    for (const auto &entry : priorityStringMap)
    {
        if (entry.second == prio)
        {
            return entry.first;
        }
    }
    return "UNKNOWN";
}

bool Logger::outputFromString(const std::string &name, Output &output)
{
    auto it = outputStringMap.find(toUpper(name));
    if (it == outputStringMap.end())
    {
        return false;
    }
    output = it->second;
    return true;
}

void Logger::writeLine(Priority prio, const char *line)
{
    // m_mutex held by caller
    switch (m_output)
    {
        case NOTIFIER_SYSLOG:
            syslog(toSyslogPriority(prio), "%s", line);
            break;
        case NOTIFIER_STDOUT:
            fprintf(stdout, "%s %s\n", priorityToString(prio).c_str(), line);
            fflush(stdout);
            break;
        case NOTIFIER_STDERR:
            fprintf(stderr, "%s %s\n", priorityToString(prio).c_str(), line);
            break;
    }
}

void Logger::write(Priority prio, const char *fmt, ...)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (prio > m_minPrio)
    {
        return;
    }

    char buffer[1024];

    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, ap);
    va_end(ap);

    writeLine(prio, buffer);
}

void Logger::wthrow(Priority prio, const char *fmt, ...)
{
    char buffer[1024];

    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, ap);
    va_end(ap);

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (prio <= m_minPrio)
        {
            writeLine(prio, buffer);
        }
    }

    throw std::runtime_error(buffer);
}

Logger::ScopeLogger::ScopeLogger(int line, const char *fun) : m_line(line), m_fun(fun)
{
    Logger::getInstance().write(NOTIFIER_DEBUG, ":> %s:%d: enter", m_fun, m_line);
}

Logger::ScopeLogger::~ScopeLogger()
{
    Logger::getInstance().write(NOTIFIER_DEBUG, ":< %s:%d: exit", m_fun, m_line);
}

} // namespace notifier
