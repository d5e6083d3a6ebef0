// Copyright (c) 2009 - Mozy, Inc.

#include "test.h"

#include <unistd.h>

#include <boost/regex.hpp>

#include "voncount/config.h"

namespace Voncount {
namespace Test {

static ConfigVar<bool>::ptr g_protect = Config::lookup(
    "test.protect", false,
    "Catch test failures even when a debugger is attached");
static ConfigVar<bool>::ptr g_waitForDebugger = Config::lookup(
    "test.waitfordebugger", false,
    "Wait for a debugger to attach before running tests");

TestSuites &allTests()
{
    static TestSuites s_tests;
    return s_tests;
}

Registration::Registration(const char *suite, const char *test, TestDg dg)
{
    TestSuite &tests = allTests()[suite];
    VONCOUNT_ASSERT(tests.find(test) == tests.end());
    tests[test] = dg;
}

void
assertion(const char *file, int line, const char *function,
    const std::string &expr)
{
    throw boost::enable_current_exception(Assertion(expr))
        << boost::throw_file(file) << boost::throw_line(line)
        << boost::throw_function(function)
        << errinfo_backtrace(backtrace());
}

static bool
runTest(TestListener &listener, const std::string &suite,
    const std::string &name, TestDg test)
{
    listener.testStarted(suite, name);
    // Let failures reach the debugger unless asked otherwise
    if (isDebuggerAttached() && !g_protect->val()) {
        test();
        listener.testComplete(suite, name);
        return true;
    }
    try {
        test();
    } catch (const Assertion &) {
        listener.testFailed(suite, name, true);
        return false;
    } catch (...) {
        listener.testFailed(suite, name, false);
        return false;
    }
    listener.testComplete(suite, name);
    return true;
}

bool
runTests(const TestSuites &suites, TestListener &listener)
{
    Assertion::throwOnAssertion = true;
    if (g_waitForDebugger->val()) {
        while (!isDebuggerAttached())
            ::sleep(1);
        debugBreak();
    }
    bool passed = true;
    for (TestSuites::const_iterator suite = suites.begin();
        suite != suites.end();
        ++suite) {
        for (TestSuite::const_iterator test = suite->second.begin();
            test != suite->second.end();
            ++test) {
            if (!runTest(listener, suite->first, test->first, test->second))
                passed = false;
        }
    }
    listener.testsComplete();
    return passed;
}

TestSuites
testsForArguments(int argc, char **argv)
{
    TestSuites selected;
    const TestSuites &all = allTests();
    for (int i = 0; i < argc; ++i) {
        boost::regex pattern(argv[i]);
        for (TestSuites::const_iterator suite = all.begin();
            suite != all.end();
            ++suite) {
            bool wholeSuite = boost::regex_match(suite->first, pattern);
            for (TestSuite::const_iterator test = suite->second.begin();
                test != suite->second.end();
                ++test) {
                if (wholeSuite || boost::regex_match(
                    suite->first + "::" + test->first, pattern))
                    selected[suite->first][test->first] = test->second;
            }
        }
    }
    return selected;
}

}}
