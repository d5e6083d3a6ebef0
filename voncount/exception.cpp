// Copyright (c) 2009 - Mozy, Inc.

#include "exception.h"

#include <algorithm>
#include <sstream>

#include <execinfo.h>
#include <stdlib.h>

#include <boost/shared_ptr.hpp>

namespace Voncount {

std::vector<void *> backtrace(int framesToSkip)
{
    std::vector<void *> result(64);
    int count = ::backtrace(&result[0], (int)result.size());
    result.resize(count);
    // Never report this function itself
    int skip = std::min(count, framesToSkip + 1);
    result.erase(result.begin(), result.begin() + skip);
    return result;
}

std::string to_string(const std::vector<void *> &backtrace)
{
    if (backtrace.empty())
        return std::string();
    boost::shared_ptr<char *> symbols(backtrace_symbols(&backtrace[0],
        (int)backtrace.size()), &free);
    std::ostringstream os;
    for (size_t i = 0; i < backtrace.size(); ++i) {
        if (i != 0)
            os << std::endl;
        if (symbols)
            os << symbols.get()[i];
        else
            os << backtrace[i];
    }
    return os.str();
}

std::string to_string(const errinfo_backtrace &backtrace)
{
    return to_string(backtrace.value());
}

error_t lastError()
{
    return errno;
}

void lastError(error_t error)
{
    errno = error;
}

template <class T>
BOOST_NORETURN static void throwNative(error_t error, const char *api,
    const char *function, const char *file, int line)
{
    T ex;
    ex << errinfo_nativeerror(error)
        << errinfo_backtrace(backtrace(2));
    if (api)
        ex << boost::errinfo_api_function(api);
    if (function)
        ex << boost::throw_function(function)
            << boost::throw_file(file)
            << boost::throw_line(line);
    throw boost::enable_current_exception(ex);
}

void throwExceptionFromLastError(error_t error, const char *api,
    const char *function, const char *file, int line)
{
    switch (error) {
        case EBADF:
            throwNative<BadHandleException>(error, api, function, file, line);
        case ENOENT:
            throwNative<FileNotFoundException>(error, api, function, file,
                line);
        case EACCES:
        case EPERM:
            throwNative<AccessDeniedException>(error, api, function, file,
                line);
        case ECANCELED:
            throwNative<OperationAbortedException>(error, api, function, file,
                line);
        case EPIPE:
            throwNative<BrokenPipeException>(error, api, function, file, line);
        default:
            throwNative<NativeException>(error, api, function, file, line);
    }
}

}
