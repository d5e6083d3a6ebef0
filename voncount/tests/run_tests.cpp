// Copyright (c) 2009 - Mozy, Inc.

#include <iostream>

#include <boost/regex.hpp>

#include "voncount/config.h"
#include "voncount/test/stdoutlistener.h"

using namespace Voncount;
using namespace Voncount::Test;

int main(int argc, char *argv[])
{
    try {
        Config::loadFromEnvironment();
        Config::loadFromCommandLine(argc, argv);
    } catch (std::invalid_argument &ex) {
        std::cerr << "Invalid value for " << ex.what() << std::endl;
        return 2;
    }

    // Remaining arguments are regexes selecting suites or Suite::test
    TestSuites tests;
    try {
        tests = argc > 1 ? testsForArguments(argc - 1, argv + 1) : allTests();
    } catch (boost::regex_error &ex) {
        std::cerr << "Bad test pattern: " << ex.what() << std::endl;
        return 2;
    }

    StdoutListener listener;
    return runTests(tests, listener) ? 0 : 1;
}
