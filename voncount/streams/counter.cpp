// Copyright (c) 2009 - Mozy, Inc.

#include "counter.h"

#include <limits>

#include "voncount/assert.h"
#include "voncount/log.h"
#include "voncount/util.h"

namespace Voncount {

static Logger::ptr g_log = Log::lookup("voncount:streams:counter");

static size_t
accumulate(size_t count, size_t amount)
{
    if (amount > std::numeric_limits<size_t>::max() - count) {
        VONCOUNT_LOG_FATAL(g_log) << "byte count overflow: " << count
            << " + " << amount;
        VONCOUNT_NOTREACHED();
    }
    return count + amount;
}

ReadCounter::ReadCounter(Stream &parent)
    : FilterStream(unmanagedPtr(parent), false),
      m_count(0)
{
    VONCOUNT_ASSERT(parent.supportsRead());
}

ReadCounter::ReadCounter(Stream::ptr parent, bool own)
    : FilterStream(parent, own),
      m_count(0)
{
    VONCOUNT_ASSERT(parent->supportsRead());
}

size_t
ReadCounter::read(void *buffer, size_t length)
{
    size_t result = parent()->read(buffer, length);
    m_count = accumulate(m_count, result);
    VONCOUNT_LOG_TRACE(g_log) << this << " read(" << length << "): "
        << result << " (" << m_count << ")";
    return result;
}

WriteCounter::WriteCounter(Stream &parent)
    : FilterStream(unmanagedPtr(parent), false),
      m_count(0)
{
    VONCOUNT_ASSERT(parent.supportsWrite());
}

WriteCounter::WriteCounter(Stream::ptr parent, bool own)
    : FilterStream(parent, own),
      m_count(0)
{
    VONCOUNT_ASSERT(parent->supportsWrite());
}

size_t
WriteCounter::write(const void *buffer, size_t length)
{
    size_t result = parent()->write(buffer, length);
    m_count = accumulate(m_count, result);
    VONCOUNT_LOG_TRACE(g_log) << this << " write(" << length << "): "
        << result << " (" << m_count << ")";
    return result;
}

void
WriteCounter::flush(bool flushParent)
{
    VONCOUNT_LOG_TRACE(g_log) << this << " flush(" << flushParent << ")";
    FilterStream::flush(flushParent);
}

}
