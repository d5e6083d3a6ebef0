#ifndef __VONCOUNT_LOG_H__
#define __VONCOUNT_LOG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <iosfwd>
#include <list>
#include <set>
#include <sstream>
#include <string>

#include <sys/types.h>

#include <boost/date_time/posix_time/ptime.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/function.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>

#include "version.h"

namespace Voncount {

class Logger;
class Stream;

typedef pid_t tid_t;
tid_t gettid();

/// Entry points into the Logger tree
///
/// Loggers are named by ':' separated paths ("voncount:streams:counter");
/// every prefix of a path names an ancestor.  Levels are normally driven by
/// the log.*mask ConfigVars, which are regexes matched against Logger names,
/// and sinks by log.stdout, log.stderr, log.file and log.syslogfacility.
class Log : public boost::noncopyable
{
private:
    Log();

public:
    enum Level {
        NONE,
        FATAL,
        ERROR,
        WARNING,
        INFO,
        VERBOSE,
        DEBUG,
        TRACE
    };

    static boost::shared_ptr<Logger> root();
    /// Find or create the Logger at name
    static boost::shared_ptr<Logger> lookup(const std::string &name);
    /// Breadth first walk of every Logger, starting at root()
    static void visit(boost::function<void (boost::shared_ptr<Logger>)> dg);
};

std::ostream &operator <<(std::ostream &os, Log::Level level);

/// Everything known about one log message
struct LogMessage
{
    std::string logger;
    boost::posix_time::ptime now;
    /// Microseconds since the process started
    unsigned long long elapsed;
    tid_t thread;
    Log::Level level;
    std::string text;
    const char *file;
    int line;
};

/// "<time> <elapsed> <LEVEL> <tid> <logger> <file>:<line> <text>\n"
std::string formatLogMessage(const LogMessage &message);

class LogSink
{
public:
    typedef boost::shared_ptr<LogSink> ptr;

public:
    virtual ~LogSink() {}

    virtual void log(const LogMessage &message) = 0;
};

class StdoutLogSink : public LogSink
{
public:
    void log(const LogMessage &message);
};

/// For programs whose stdout carries data
class StderrLogSink : public LogSink
{
public:
    void log(const LogMessage &message);
};

class SyslogLogSink : public LogSink
{
public:
    SyslogLogSink(int facility) : m_facility(facility) {}

    void log(const LogMessage &message);

    int facility() const { return m_facility; }

    /// @return -1 if name isn't a syslog facility
    static int facilityFromString(const std::string &name);

private:
    int m_facility;
};

/// Appends to a file, one write per message (O_APPEND keeps lines from
/// several processes whole)
class FileLogSink : public LogSink
{
public:
    /// @throws NativeException if file can't be opened
    FileLogSink(const std::string &file);

    void log(const LogMessage &message);

    const std::string &file() const { return m_file; }

private:
    std::string m_file;
    boost::shared_ptr<Stream> m_stream;
};

/// Collects one message; it is logged when the LogEvent is destroyed
class LogEvent
{
    friend class Logger;
private:
    LogEvent(boost::shared_ptr<Logger> logger, Log::Level level,
        const char *file, int line)
        : m_logger(logger),
          m_level(level),
          m_file(file),
          m_line(line)
    {}

public:
    LogEvent(const LogEvent &copy)
        : m_logger(copy.m_logger),
          m_level(copy.m_level),
          m_file(copy.m_file),
          m_line(copy.m_line)
    {}
    ~LogEvent();

    std::ostream &os() { return m_os; }

private:
    boost::shared_ptr<Logger> m_logger;
    Log::Level m_level;
    const char *m_file;
    int m_line;
    std::ostringstream m_os;
};

class Logger : public boost::enable_shared_from_this<Logger>
{
    friend class Log;
public:
    typedef boost::shared_ptr<Logger> ptr;

private:
    struct NameLess
    {
        bool operator()(const Logger::ptr &lhs, const Logger::ptr &rhs) const
        { return lhs->m_name < rhs->m_name; }
    };

    Logger();
    Logger(const std::string &name, Logger::ptr parent);

public:
    /// FATAL is always enabled
    bool enabled(Log::Level level) const;
    /// @param propagate Set every descendant to level too
    void level(Log::Level level, bool propagate = true);
    Log::Level level() const { return m_level; }

    /// If false, messages stop at this Logger's own sinks
    bool inheritSinks() const { return m_inheritSinks; }
    void inheritSinks(bool inherit) { m_inheritSinks = inherit; }
    void addSink(LogSink::ptr sink) { m_sinks.push_back(sink); }
    void removeSink(LogSink::ptr sink);
    void clearSinks() { m_sinks.clear(); }
    /// Only this Logger's own sinks, not inherited ones
    const std::list<LogSink::ptr> &sinks() const { return m_sinks; }

    LogEvent log(Log::Level level, const char *file = NULL, int line = -1)
    { return LogEvent(shared_from_this(), level, file, line); }
    void log(Log::Level level, const std::string &str,
        const char *file = NULL, int line = -1);

    const std::string &name() const { return m_name; }

private:
    std::string m_name;
    boost::weak_ptr<Logger> m_parent;
    std::set<Logger::ptr, NameLess> m_children;
    Log::Level m_level;
    std::list<LogSink::ptr> m_sinks;
    bool m_inheritSinks;
};

/// Stream a message to lg at level; the message isn't built at all unless
/// level is enabled
#define VONCOUNT_LOG_LEVEL(lg, level) if ((lg)->enabled(level))                 \
    (lg)->log(level, __FILE__, __LINE__).os()

#define VONCOUNT_LOG_FATAL(lg) VONCOUNT_LOG_LEVEL(lg, ::Voncount::Log::FATAL)
#define VONCOUNT_LOG_ERROR(lg) VONCOUNT_LOG_LEVEL(lg, ::Voncount::Log::ERROR)
#define VONCOUNT_LOG_WARNING(lg) VONCOUNT_LOG_LEVEL(lg, ::Voncount::Log::WARNING)
#define VONCOUNT_LOG_INFO(lg) VONCOUNT_LOG_LEVEL(lg, ::Voncount::Log::INFO)
#define VONCOUNT_LOG_VERBOSE(lg) VONCOUNT_LOG_LEVEL(lg, ::Voncount::Log::VERBOSE)
#define VONCOUNT_LOG_DEBUG(lg) VONCOUNT_LOG_LEVEL(lg, ::Voncount::Log::DEBUG)
#define VONCOUNT_LOG_TRACE(lg) VONCOUNT_LOG_LEVEL(lg, ::Voncount::Log::TRACE)

}

#endif
