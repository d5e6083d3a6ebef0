#ifndef __VONCOUNT_TEST_H__
#define __VONCOUNT_TEST_H__
// Copyright (c) 2009 - Decho Corporation

#include <map>
#include <sstream>
#include <string>
#include <typeinfo>

#include <string.h>

#include "voncount/assert.h"

namespace Voncount {
namespace Test {

typedef void (*TestDg)();
/// Test name -> test
typedef std::map<std::string, TestDg> TestSuite;
/// Suite name -> suite
typedef std::map<std::string, TestSuite> TestSuites;

/// Adds a test to allTests() during static initialization
struct Registration
{
    Registration(const char *suite, const char *test, TestDg dg);
};

/// Define a unit test named Suite::Name
/// @example
/// VONCOUNT_UNITTEST(Buffer, empty)
/// {
///     VONCOUNT_TEST_ASSERT_EQUAL(Buffer().size(), 0u);
/// }
#define VONCOUNT_UNITTEST(Suite, Name)                                          \
    static void Suite ## _ ## Name();                                           \
    static ::Voncount::Test::Registration                                       \
        g_ ## Suite ## _ ## Name ## _registration(#Suite, #Name,                \
            &Suite ## _ ## Name);                                               \
    static void Suite ## _ ## Name()

class TestListener
{
public:
    virtual ~TestListener() {}

    virtual void testStarted(const std::string &suite,
        const std::string &test) = 0;
    virtual void testComplete(const std::string &suite,
        const std::string &test) = 0;
    /// Called from inside the catch block, so the failure is still
    /// boost::current_exception()
    /// @param asserted true for a failed assertion, false for any other
    /// exception
    virtual void testFailed(const std::string &suite,
        const std::string &test, bool asserted) = 0;
    virtual void testsComplete() = 0;
};

TestSuites &allTests();
/// Select tests by regex; each argument is matched against "Suite" and
/// against "Suite::Test"
TestSuites testsForArguments(int argc, char **argv);
/// @return true if every test passed
bool runTests(const TestSuites &suites, TestListener &listener);

/// Throws an Assertion describing the failed check
BOOST_NORETURN void assertion(const char *file, int line,
    const char *function, const std::string &expr);

template <class T, class U>
bool equalValues(const T &lhs, const U &rhs)
{ return lhs == rhs; }
inline bool equalValues(const char *lhs, const char *rhs)
{ return strcmp(lhs, rhs) == 0; }

template <class T, class U>
void assertComparison(const char *file, int line, const char *function,
    const T &lhs, const U &rhs, const char *lhsExpr, const char *rhsExpr,
    const char *op)
{
    std::ostringstream os;
    os << lhsExpr << ' ' << op << ' ' << rhsExpr << "\n"
        << lhs << ' ' << op << ' ' << rhs;
    assertion(file, line, function, os.str());
}

// Each operand is evaluated exactly once, by the macro's call into these

template <class T, class U>
void assertEqual(const char *file, int line, const char *function,
    const T &lhs, const U &rhs, const char *lhsExpr, const char *rhsExpr)
{
    if (!equalValues(lhs, rhs))
        assertComparison(file, line, function, lhs, rhs, lhsExpr, rhsExpr,
            "==");
}

template <class T, class U>
void assertLessThanOrEqual(const char *file, int line, const char *function,
    const T &lhs, const U &rhs, const char *lhsExpr, const char *rhsExpr)
{
    if (!(lhs <= rhs))
        assertComparison(file, line, function, lhs, rhs, lhsExpr, rhsExpr,
            "<=");
}

template <class T, class U>
void assertGreaterThanOrEqual(const char *file, int line,
    const char *function, const T &lhs, const U &rhs, const char *lhsExpr,
    const char *rhsExpr)
{
    if (!(lhs >= rhs))
        assertComparison(file, line, function, lhs, rhs, lhsExpr, rhsExpr,
            ">=");
}

#define VONCOUNT_TEST_ASSERT(expr)                                              \
    if (!(expr)) ::Voncount::Test::assertion(__FILE__, __LINE__,                \
        BOOST_CURRENT_FUNCTION, #expr)

#define VONCOUNT_TEST_ASSERT_EQUAL(lhs, rhs)                                    \
    ::Voncount::Test::assertEqual(__FILE__, __LINE__, BOOST_CURRENT_FUNCTION,   \
        lhs, rhs, #lhs, #rhs)

#define VONCOUNT_TEST_ASSERT_LESS_THAN_OR_EQUAL(lhs, rhs)                       \
    ::Voncount::Test::assertLessThanOrEqual(__FILE__, __LINE__,                 \
        BOOST_CURRENT_FUNCTION, lhs, rhs, #lhs, #rhs)

#define VONCOUNT_TEST_ASSERT_GREATER_THAN_OR_EQUAL(lhs, rhs)                    \
    ::Voncount::Test::assertGreaterThanOrEqual(__FILE__, __LINE__,              \
        BOOST_CURRENT_FUNCTION, lhs, rhs, #lhs, #rhs)

/// code must throw exception (or something derived from it)
#define VONCOUNT_TEST_ASSERT_EXCEPTION(code, exception)                         \
    try {                                                                       \
        code;                                                                   \
        ::Voncount::Test::assertion(__FILE__, __LINE__, BOOST_CURRENT_FUNCTION, \
            "Expected " + std::string(typeid(exception).name()) +               \
            " from " #code);                                                    \
    } catch (exception &) {                                                     \
    }

/// code must trip a VONCOUNT_ASSERT or VONCOUNT_NOTREACHED
#define VONCOUNT_TEST_ASSERT_ASSERTED(code)                                     \
    {                                                                           \
        bool returned_ = false;                                                 \
        try {                                                                   \
            code;                                                               \
            returned_ = true;                                                   \
            ::Voncount::Test::assertion(__FILE__, __LINE__,                     \
                BOOST_CURRENT_FUNCTION, "Expected Assertion from " #code);      \
        } catch (::Voncount::Assertion &) {                                     \
            if (returned_)                                                      \
                throw;                                                          \
        }                                                                       \
    }

}}

#endif
