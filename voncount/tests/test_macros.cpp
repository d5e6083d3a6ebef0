// Copyright (c) 2009 - Mozy, Inc.

#include <string>

#include "voncount/streams/memory.h"
#include "voncount/test/test.h"

using namespace Voncount;
using namespace Voncount::Test;

static int bump(int &calls)
{
    return ++calls;
}

VONCOUNT_UNITTEST(TestMacros, operandsEvaluatedOnce)
{
    int calls = 0;
    VONCOUNT_TEST_ASSERT_EQUAL(bump(calls), 1);
    VONCOUNT_TEST_ASSERT_EQUAL(calls, 1);
    VONCOUNT_TEST_ASSERT_LESS_THAN_OR_EQUAL(bump(calls), 2);
    VONCOUNT_TEST_ASSERT_EQUAL(calls, 2);
    VONCOUNT_TEST_ASSERT_GREATER_THAN_OR_EQUAL(bump(calls), 3);
    VONCOUNT_TEST_ASSERT_EQUAL(calls, 3);
}

VONCOUNT_UNITTEST(TestMacros, streamCallsEvaluatedOnce)
{
    MemoryStream stream;
    VONCOUNT_TEST_ASSERT_EQUAL(stream.write("cody", 4), 4u);
    VONCOUNT_TEST_ASSERT_EQUAL(stream.size(), 4);
    stream.seek(0);
    char byte;
    VONCOUNT_TEST_ASSERT_EQUAL(stream.read(&byte, 1), 1u);
    VONCOUNT_TEST_ASSERT_EQUAL(byte, 'c');
    VONCOUNT_TEST_ASSERT_EQUAL(stream.tell(), 1);
}

VONCOUNT_UNITTEST(TestMacros, failureDescribesBothSides)
{
    int one = 1;
    bool failed = false;
    try {
        VONCOUNT_TEST_ASSERT_EQUAL(one, 2);
    } catch (Assertion &ex) {
        failed = true;
        std::string what = ex.what();
        VONCOUNT_TEST_ASSERT(what.find("one == 2") != std::string::npos);
        VONCOUNT_TEST_ASSERT(what.find("1 == 2") != std::string::npos);
    }
    VONCOUNT_TEST_ASSERT(failed);
}

VONCOUNT_UNITTEST(TestMacros, cStringsCompareByContent)
{
    char buffer[] = "same";
    const char *copy = buffer;
    VONCOUNT_TEST_ASSERT_EQUAL(copy, "same");
}
