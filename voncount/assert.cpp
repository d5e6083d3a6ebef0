// Copyright (c) 2010 - Mozy, Inc.

#include "assert.h"

#include <fstream>
#include <string>

#include <signal.h>
#include <stdlib.h>

namespace Voncount {

bool Assertion::throwOnAssertion;

bool isDebuggerAttached()
{
#ifdef LINUX
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 10, "TracerPid:") == 0)
            return atoi(line.c_str() + 10) != 0;
    }
#endif
    return false;
}

void debugBreak()
{
    raise(SIGTRAP);
}

void assertionFailed(const char *expr, const char *function,
    const char *file, int line)
{
    VONCOUNT_LOG_FATAL(Log::root()) << "ASSERTION: " << expr << " in "
        << function << " at " << file << ":" << line
        << "\nbacktrace:\n" << to_string(backtrace(1));
    if (Assertion::throwOnAssertion)
        throw boost::enable_current_exception(Assertion(expr))
            << boost::throw_function(function)
            << boost::throw_file(file)
            << boost::throw_line(line)
            << errinfo_backtrace(backtrace(1));
    if (isDebuggerAttached())
        debugBreak();
    std::terminate();
}

}
