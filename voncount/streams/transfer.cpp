// Copyright (c) 2009 - Mozy, Inc.

#include "transfer.h"

#include <boost/scoped_array.hpp>

#include "voncount/assert.h"
#include "voncount/exception.h"
#include "voncount/log.h"
#include "null.h"

namespace Voncount {

static Logger::ptr g_log = Log::lookup("voncount:streams:transfer");

static void writeAll(Stream &dst, const char *buffer, size_t length)
{
    while (length > 0) {
        size_t result = dst.write(buffer, length);
        VONCOUNT_ASSERT(result > 0 && result <= length);
        buffer += result;
        length -= result;
    }
}

unsigned long long transferStream(Stream &src, Stream &dst,
                                  unsigned long long toTransfer,
                                  ExactLength exactLength)
{
    VONCOUNT_ASSERT(src.supportsRead());
    VONCOUNT_ASSERT(dst.supportsWrite());
    if (exactLength == INFER)
        exactLength = (toTransfer == ~0ull ? UNTILEOF : EXACT);
    VONCOUNT_ASSERT(exactLength == EXACT || exactLength == UNTILEOF);

    const size_t chunkSize = 65536;
    boost::scoped_array<char> buffer(new char[chunkSize]);
    // Optimize transfer to NullStream
    bool discard = (&dst == &NullStream::get());
    unsigned long long totalRead = 0;
    while (totalRead < toTransfer) {
        size_t todo = chunkSize;
        if (toTransfer - totalRead < (unsigned long long)todo)
            todo = (size_t)(toTransfer - totalRead);
        size_t readResult = src.read(buffer.get(), todo);
        if (readResult == 0) {
            if (exactLength == EXACT) {
                VONCOUNT_LOG_ERROR(g_log) << "unexpected EOF after "
                    << totalRead << " of " << toTransfer << " bytes";
                VONCOUNT_THROW_EXCEPTION(UnexpectedEofException());
            }
            break;
        }
        totalRead += readResult;
        if (!discard)
            writeAll(dst, buffer.get(), readResult);
    }
    VONCOUNT_LOG_DEBUG(g_log) << "transferred " << totalRead << " bytes";
    return totalRead;
}

}
