#ifndef __VONCOUNT_ASSERT_H__
#define __VONCOUNT_ASSERT_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <exception>

#include <boost/config.hpp>

#include "exception.h"
#include "log.h"

namespace Voncount {

/// Thrown by a failed VONCOUNT_ASSERT()/VONCOUNT_NOTREACHED() instead of
/// terminating, when throwOnAssertion is set (the unit test runner sets it)
struct Assertion : virtual Exception
{
    Assertion(const std::string &expr) : m_expr(expr) {}
    ~Assertion() throw() {}

    const char *what() const throw() { return m_expr.c_str(); }

    static bool throwOnAssertion;

private:
    std::string m_expr;
};

bool isDebuggerAttached();
void debugBreak();

/// Log, then throw or terminate; shared tail of the assertion macros
BOOST_NORETURN void assertionFailed(const char *expr, const char *function,
    const char *file, int line);

}

#endif

// Outside the include guard so NDEBUG can differ per file
#undef VONCOUNT_ASSERT
#undef VONCOUNT_NOTREACHED

#ifdef NDEBUG

#define VONCOUNT_ASSERT(x) ((void)0)

#else

#define VONCOUNT_ASSERT(x)                                                      \
    ((x) ? (void)0 : ::Voncount::assertionFailed(# x, BOOST_CURRENT_FUNCTION,   \
        __FILE__, __LINE__))

#endif

/// Unreachable in every build
#define VONCOUNT_NOTREACHED()                                                   \
    ::Voncount::assertionFailed("Not Reached", BOOST_CURRENT_FUNCTION,          \
        __FILE__, __LINE__)
