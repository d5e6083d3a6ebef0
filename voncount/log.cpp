// Copyright (c) 2009 - Mozy, Inc.

#include <stddef.h>

#define SYSLOG_NAMES
#include <syslog.h>

#include "log.h"

#include <iostream>

#include <fcntl.h>
#include <string.h>
#include <unistd.h>
#ifdef LINUX
#include <sys/syscall.h>
#endif

#include <boost/bind.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/regex.hpp>

#include "assert.h"
#include "config.h"
#include "exception.h"
#include "voncount/streams/fd.h"

namespace Voncount {

static void updateLevels();
static void updateStdoutSink();
static void updateStderrSink();
static void updateFileSink();
static void updateSyslogSink();

static ConfigVar<std::string>::ptr g_errorMask = Config::lookup(
    "log.errormask", std::string(".*"),
    "Regex of loggers to enable error for");
static ConfigVar<std::string>::ptr g_warnMask = Config::lookup(
    "log.warnmask", std::string(".*"),
    "Regex of loggers to enable warning for");
static ConfigVar<std::string>::ptr g_infoMask = Config::lookup(
    "log.infomask", std::string(".*"),
    "Regex of loggers to enable info for");
static ConfigVar<std::string>::ptr g_verboseMask = Config::lookup(
    "log.verbosemask", std::string(),
    "Regex of loggers to enable verbose for");
static ConfigVar<std::string>::ptr g_debugMask = Config::lookup(
    "log.debugmask", std::string(),
    "Regex of loggers to enable debug for");
static ConfigVar<std::string>::ptr g_traceMask = Config::lookup(
    "log.tracemask", std::string(),
    "Regex of loggers to enable trace for");

static ConfigVar<bool>::ptr g_logStdout = Config::lookup(
    "log.stdout", false, "Log to stdout");
static ConfigVar<bool>::ptr g_logStderr = Config::lookup(
    "log.stderr", false, "Log to stderr");
static ConfigVar<std::string>::ptr g_logFile = Config::lookup(
    "log.file", std::string(), "Append log messages to this file");
static ConfigVar<std::string>::ptr g_logSyslogFacility = Config::lookup(
    "log.syslogfacility", std::string(),
    "Log to syslog with this facility (e.g. user, local0)");

// Set while a message is being handed to the sinks, so anything a sink logs
// is dropped instead of recursing
static bool g_delivering;

static boost::posix_time::ptime startTime()
{
    static boost::posix_time::ptime s_start =
        boost::posix_time::microsec_clock::universal_time();
    return s_start;
}

namespace {
static struct LogInitializer
{
    LogInitializer()
    {
        startTime();

        g_errorMask->onChange.connect(&updateLevels);
        g_warnMask->onChange.connect(&updateLevels);
        g_infoMask->onChange.connect(&updateLevels);
        g_verboseMask->onChange.connect(&updateLevels);
        g_debugMask->onChange.connect(&updateLevels);
        g_traceMask->onChange.connect(&updateLevels);

        g_logStdout->onChange.connect(&updateStdoutSink);
        g_logStderr->onChange.connect(&updateStderrSink);
        g_logFile->onChange.connect(&updateFileSink);
        g_logSyslogFacility->onChange.connect(&updateSyslogSink);
    }
} g_init;
}

static boost::regex maskRegex(const std::string &mask,
    const std::string &fallback)
{
    try {
        return boost::regex(mask);
    } catch (boost::regex_error &) {
        return boost::regex(fallback);
    }
}

static void applyMasks(Logger::ptr logger, const boost::regex *masks)
{
    // masks[0] is ERROR, masks[5] is TRACE; the most verbose match wins
    Log::Level level = Log::FATAL;
    for (int i = 0; i < 6; ++i) {
        if (boost::regex_match(logger->name(), masks[i]))
            level = (Log::Level)(Log::ERROR + i);
    }
    logger->level(level, false);
}

static void updateLevels()
{
    boost::regex masks[6] = {
        maskRegex(g_errorMask->val(), ".*"),
        maskRegex(g_warnMask->val(), ".*"),
        maskRegex(g_infoMask->val(), ".*"),
        maskRegex(g_verboseMask->val(), ""),
        maskRegex(g_debugMask->val(), ""),
        maskRegex(g_traceMask->val(), "")
    };
    Log::visit(boost::bind(&applyMasks, _1, masks));
}

static void replaceRootSink(LogSink::ptr &current, LogSink::ptr replacement)
{
    if (current)
        Log::root()->removeSink(current);
    current = replacement;
    if (current)
        Log::root()->addSink(current);
}

static void updateStdoutSink()
{
    static LogSink::ptr sink;
    if (g_logStdout->val() != (bool)sink)
        replaceRootSink(sink, g_logStdout->val() ?
            LogSink::ptr(new StdoutLogSink()) : LogSink::ptr());
}

static void updateStderrSink()
{
    static LogSink::ptr sink;
    if (g_logStderr->val() != (bool)sink)
        replaceRootSink(sink, g_logStderr->val() ?
            LogSink::ptr(new StderrLogSink()) : LogSink::ptr());
}

static void updateFileSink()
{
    static LogSink::ptr sink;
    std::string file = g_logFile->val();
    if (sink && static_cast<FileLogSink *>(sink.get())->file() == file)
        return;
    replaceRootSink(sink, file.empty() ?
        LogSink::ptr() : LogSink::ptr(new FileLogSink(file)));
}

static void updateSyslogSink()
{
    static LogSink::ptr sink;
    int facility = SyslogLogSink::facilityFromString(
        g_logSyslogFacility->val());
    if (sink &&
        static_cast<SyslogLogSink *>(sink.get())->facility() == facility)
        return;
    replaceRootSink(sink, facility == -1 ?
        LogSink::ptr() : LogSink::ptr(new SyslogLogSink(facility)));
}

static const char *g_levelNames[] = {
    "NONE",
    "FATAL",
    "ERROR",
    "WARN",
    "INFO",
    "VERBOSE",
    "DEBUG",
    "TRACE"
};

std::ostream &operator <<(std::ostream &os, Log::Level level)
{
    if (level < Log::NONE || level > Log::TRACE)
        return os << (int)level;
    return os << g_levelNames[level];
}

std::string formatLogMessage(const LogMessage &message)
{
    std::ostringstream os;
    os << boost::posix_time::to_iso_extended_string(message.now) << " "
        << message.elapsed << " " << message.level << " " << message.thread
        << " " << message.logger << " "
        << (message.file ? message.file : "") << ":" << message.line << " "
        << message.text << "\n";
    return os.str();
}

void
StdoutLogSink::log(const LogMessage &message)
{
    std::cout << formatLogMessage(message);
    std::cout.flush();
}

void
StderrLogSink::log(const LogMessage &message)
{
    std::cerr << formatLogMessage(message);
    std::cerr.flush();
}

int
SyslogLogSink::facilityFromString(const std::string &name)
{
    for (CODE *code = facilitynames; code->c_name; ++code) {
        if (name == code->c_name)
            return code->c_val;
    }
    return -1;
}

void
SyslogLogSink::log(const LogMessage &message)
{
    int priority;
    switch (message.level) {
        case Log::FATAL:
            priority = LOG_CRIT;
            break;
        case Log::ERROR:
            priority = LOG_ERR;
            break;
        case Log::WARNING:
            priority = LOG_WARNING;
            break;
        case Log::INFO:
            priority = LOG_NOTICE;
            break;
        case Log::VERBOSE:
            priority = LOG_INFO;
            break;
        default:
            priority = LOG_DEBUG;
            break;
    }
    std::string line = formatLogMessage(message);
    syslog(priority | m_facility, "%.*s", (int)line.size(), line.c_str());
}

FileLogSink::FileLogSink(const std::string &file)
    : m_file(file)
{
    int fd = ::open(file.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (fd < 0)
        VONCOUNT_THROW_EXCEPTION_FROM_LAST_ERROR_API("open");
    m_stream.reset(new FDStream(fd));
}

void
FileLogSink::log(const LogMessage &message)
{
    std::string line = formatLogMessage(message);
    const char *data = line.c_str();
    size_t remaining = line.size();
    while (remaining > 0) {
        size_t written = m_stream->write(data, remaining);
        data += written;
        remaining -= written;
    }
}

tid_t gettid()
{
#ifdef LINUX
    return (tid_t)syscall(SYS_gettid);
#else
    return getpid();
#endif
}

Logger::ptr
Log::root()
{
    static Logger::ptr s_root(new Logger());
    return s_root;
}

Logger::ptr
Log::lookup(const std::string &name)
{
    Logger::ptr current = root();
    std::string path;
    size_t start = 0;
    while (start < name.size()) {
        size_t end = name.find(':', start);
        if (end == std::string::npos)
            end = name.size();
        if (end > start) {
            if (!path.empty())
                path += ':';
            path.append(name, start, end - start);

            Logger::ptr child;
            for (std::set<Logger::ptr, Logger::NameLess>::const_iterator it =
                    current->m_children.begin();
                it != current->m_children.end();
                ++it) {
                if ((*it)->m_name == path) {
                    child = *it;
                    break;
                }
            }
            if (!child) {
                child.reset(new Logger(path, current));
                current->m_children.insert(child);
            }
            current = child;
        }
        start = end + 1;
    }
    return current;
}

void
Log::visit(boost::function<void (Logger::ptr)> dg)
{
    std::list<Logger::ptr> pending;
    pending.push_back(root());
    while (!pending.empty()) {
        Logger::ptr logger = pending.front();
        pending.pop_front();
        dg(logger);
        pending.insert(pending.end(), logger->m_children.begin(),
            logger->m_children.end());
    }
}

Logger::Logger()
    : m_name(":"),
      m_level(Log::INFO),
      m_inheritSinks(false)
{}

Logger::Logger(const std::string &name, Logger::ptr parent)
    : m_name(name),
      m_parent(parent),
      m_level(parent->m_level),
      m_inheritSinks(true)
{}

bool
Logger::enabled(Log::Level level) const
{
    if (level == Log::FATAL)
        return true;
    return !g_delivering && level <= m_level;
}

void
Logger::level(Log::Level level, bool propagate)
{
    m_level = level;
    if (!propagate)
        return;
    for (std::set<Logger::ptr, NameLess>::iterator it = m_children.begin();
        it != m_children.end();
        ++it)
        (*it)->level(level, true);
}

void
Logger::removeSink(LogSink::ptr sink)
{
    m_sinks.remove(sink);
}

// A broken sink must not fail the code that logged; report it and carry on
// with the remaining sinks
static void
deliver(LogSink &sink, const LogMessage &message)
{
    try {
        sink.log(message);
    } catch (std::exception &) {
        std::cerr << "log sink failed: "
            << boost::current_exception_diagnostic_information() << std::endl;
    }
}

void
Logger::log(Log::Level level, const std::string &str, const char *file,
    int line)
{
    if (str.empty() || !enabled(level) || g_delivering)
        return;
    error_t error = lastError();
    LogMessage message;
    message.logger = m_name;
    message.now = boost::posix_time::microsec_clock::universal_time();
    message.elapsed = (message.now - startTime()).total_microseconds();
    message.thread = gettid();
    message.level = level;
    message.text = str;
    message.file = file;
    message.line = line;

    g_delivering = true;
    for (Logger *logger = this; logger;) {
        for (std::list<LogSink::ptr>::iterator it = logger->m_sinks.begin();
            it != logger->m_sinks.end();
            ++it)
            deliver(**it, message);
        if (!logger->m_inheritSinks)
            break;
        Logger::ptr parent = logger->m_parent.lock();
        logger = parent.get();
    }
    g_delivering = false;
    // Logging must not disturb errno for the caller
    lastError(error);
}

LogEvent::~LogEvent()
{
    m_logger->log(m_level, m_os.str(), m_file, m_line);
}

}
