#ifndef __VONCOUNT_EXCEPTION_H__
#define __VONCOUNT_EXCEPTION_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stdexcept>
#include <string>
#include <vector>

#include <errno.h>

#include <boost/config.hpp>
#include <boost/current_function.hpp>
#include <boost/exception/all.hpp>

#include "version.h"

namespace Voncount {

typedef int error_t;

typedef boost::error_info<struct tag_backtrace, std::vector<void *> >
    errinfo_backtrace;
typedef boost::errinfo_errno errinfo_nativeerror;

/// Return addresses of the calling stack, innermost first
std::vector<void *> backtrace(int framesToSkip = 0);
/// One symbolized frame per line
std::string to_string(const std::vector<void *> &backtrace);
/// Lets boost::diagnostic_information() print an errinfo_backtrace
std::string to_string(const errinfo_backtrace &backtrace);

struct Exception : virtual boost::exception, virtual std::exception {};

struct StreamException : virtual Exception {};
struct UnexpectedEofException : virtual StreamException {};

/// A failed syscall; errinfo_nativeerror and errinfo_api_function say which
struct NativeException : virtual Exception {};
struct FileNotFoundException : virtual NativeException {};
struct AccessDeniedException : virtual NativeException {};
struct BadHandleException : virtual NativeException {};
struct OperationAbortedException : virtual NativeException {};
struct BrokenPipeException : virtual NativeException {};

error_t lastError();
void lastError(error_t error);

/// Throw the NativeException subclass matching error
BOOST_NORETURN void throwExceptionFromLastError(error_t error,
    const char *api = NULL, const char *function = NULL,
    const char *file = NULL, int line = 0);

/// Throw x, recording where it was thrown from
#define VONCOUNT_THROW_EXCEPTION(x)                                             \
    throw ::boost::enable_current_exception(::boost::enable_error_info(x))      \
        << ::boost::throw_function(BOOST_CURRENT_FUNCTION)                      \
        << ::boost::throw_file(__FILE__)                                        \
        << ::boost::throw_line((int)__LINE__)                                   \
        << ::Voncount::errinfo_backtrace(::Voncount::backtrace())

#define VONCOUNT_THROW_EXCEPTION_FROM_ERROR_API(error, api)                     \
    ::Voncount::throwExceptionFromLastError(error, api,                         \
        BOOST_CURRENT_FUNCTION, __FILE__, __LINE__)

#define VONCOUNT_THROW_EXCEPTION_FROM_LAST_ERROR_API(api)                       \
    VONCOUNT_THROW_EXCEPTION_FROM_ERROR_API(::Voncount::lastError(), api)

#define VONCOUNT_THROW_EXCEPTION_FROM_LAST_ERROR()                              \
    VONCOUNT_THROW_EXCEPTION_FROM_ERROR_API(::Voncount::lastError(), NULL)

}

#endif
