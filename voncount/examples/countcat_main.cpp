// Copyright (c) 2009 - Mozy, Inc.

#include <iostream>

#include <boost/exception/diagnostic_information.hpp>

#include "voncount/config.h"
#include "voncount/streams/std.h"
#include "countcat.h"

using namespace Voncount;

static ConfigVar<bool>::ptr g_summary = Config::lookup(
    "countcat.summary", true,
    "Print the number of bytes read and written to stderr when done");

int main(int argc, char *argv[])
{
    try {
        Config::loadFromEnvironment();
        Config::loadFromCommandLine(argc, argv);

        StdoutStream stdoutStream;
        CountcatTotals totals = countcat(countcatInputs(argc, argv),
            stdoutStream);
        if (g_summary->val())
            std::cerr << "read: " << totals.read << " bytes, written: "
                << totals.written << " bytes" << std::endl;
    } catch (...) {
        std::cerr << boost::current_exception_diagnostic_information()
            << std::endl;
        return 1;
    }
    return 0;
}
