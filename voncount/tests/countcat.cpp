// Copyright (c) 2009 - Mozy, Inc.

#include <stdlib.h>
#include <unistd.h>

#include "voncount/examples/countcat.h"
#include "voncount/exception.h"
#include "voncount/streams/fd.h"
#include "voncount/streams/memory.h"
#include "voncount/streams/transfer.h"
#include "voncount/test/test.h"

using namespace Voncount;

static std::string tempFile(const std::string &contents)
{
    char path[] = "/tmp/voncount_countcat_XXXXXX";
    int fd = mkstemp(path);
    VONCOUNT_TEST_ASSERT(fd >= 0);
    FDStream file(fd);
    VONCOUNT_TEST_ASSERT_EQUAL(file.write(contents.c_str(), contents.size()),
        contents.size());
    return path;
}

VONCOUNT_UNITTEST(Countcat, leadingDashDashSkipped)
{
    char program[] = "countcat", dashDash[] = "--", file[] = "in.txt";
    char *argv[] = { program, dashDash, file };
    std::vector<std::string> inputs = countcatInputs(3, argv);
    VONCOUNT_TEST_ASSERT_EQUAL(inputs.size(), 1u);
    VONCOUNT_TEST_ASSERT_EQUAL(inputs[0], "in.txt");
}

VONCOUNT_UNITTEST(Countcat, laterDashDashIsAFile)
{
    char program[] = "countcat", file[] = "in.txt", dashDash[] = "--";
    char *argv[] = { program, file, dashDash };
    std::vector<std::string> inputs = countcatInputs(3, argv);
    VONCOUNT_TEST_ASSERT_EQUAL(inputs.size(), 2u);
    VONCOUNT_TEST_ASSERT_EQUAL(inputs[1], "--");
}

VONCOUNT_UNITTEST(Countcat, noInputsMeansStdin)
{
    char program[] = "countcat", dashDash[] = "--";
    char *argv[] = { program, dashDash };
    std::vector<std::string> inputs = countcatInputs(1, argv);
    VONCOUNT_TEST_ASSERT_EQUAL(inputs.size(), 1u);
    VONCOUNT_TEST_ASSERT_EQUAL(inputs[0], "-");
    inputs = countcatInputs(2, argv);
    VONCOUNT_TEST_ASSERT_EQUAL(inputs.size(), 1u);
    VONCOUNT_TEST_ASSERT_EQUAL(inputs[0], "-");
}

VONCOUNT_UNITTEST(Countcat, copiesAndCountsThroughPipe)
{
    std::vector<std::string> inputs;
    inputs.push_back(tempFile("hello "));
    inputs.push_back(tempFile("world"));

    int fds[2];
    VONCOUNT_TEST_ASSERT_EQUAL(pipe(fds), 0);
    FDStream readEnd(fds[0]);
    CountcatTotals totals;
    {
        FDStream writeEnd(fds[1]);
        totals = countcat(inputs, writeEnd);
    }
    unlink(inputs[0].c_str());
    unlink(inputs[1].c_str());

    VONCOUNT_TEST_ASSERT_EQUAL(totals.read, 11u);
    VONCOUNT_TEST_ASSERT_EQUAL(totals.written, 11u);
    MemoryStream output;
    VONCOUNT_TEST_ASSERT_EQUAL(transferStream(readEnd, output), 11ull);
    VONCOUNT_TEST_ASSERT_EQUAL(output.buffer(), "hello world");
}

VONCOUNT_UNITTEST(Countcat, missingInput)
{
    std::vector<std::string> inputs;
    inputs.push_back("/nonexistent/voncount/countcat");
    MemoryStream output;
    VONCOUNT_TEST_ASSERT_EXCEPTION(countcat(inputs, output),
        FileNotFoundException);
    VONCOUNT_TEST_ASSERT_EQUAL(output.size(), 0);
}
