// Copyright (c) 2009 - Mozy, Inc.

#include "stdoutlistener.h"

#include <iostream>

#include <time.h>

#include <boost/exception/diagnostic_information.hpp>

#include "voncount/config.h"

namespace Voncount {
namespace Test {

static ConfigVar<bool>::ptr g_showStartTime = Config::lookup(
    "test.outputstarttime", true,
    "Prefix each test with the time it started");

void
StdoutListener::testStarted(const std::string &suite, const std::string &test)
{
    ++m_run;
    std::cout << "Running ";
    if (g_showStartTime->val())
        std::cout << "(" << time(NULL) << ") ";
    std::cout << suite << "::" << test << ": " << std::flush;
}

void
StdoutListener::testComplete(const std::string &, const std::string &)
{
    std::cout << "OK" << std::endl;
}

void
StdoutListener::testFailed(const std::string &suite, const std::string &test,
    bool asserted)
{
    std::cout << (asserted ? "Assertion" : "Exception") << std::endl;
    std::cerr << (asserted ? "Assertion failed: " : "Unexpected exception: ")
        << boost::current_exception_diagnostic_information() << std::endl;
    m_failed.push_back(suite + "::" + test);
}

void
StdoutListener::testsComplete()
{
    std::cout << "Tests complete.  " << m_run - m_failed.size() << "/"
        << m_run << " passed." << std::endl;
    if (m_failed.empty())
        return;
    std::cout << "Failures:" << std::endl;
    for (std::vector<std::string>::const_iterator it = m_failed.begin();
        it != m_failed.end();
        ++it)
        std::cout << '\t' << *it << std::endl;
}

}}
