// Copyright (c) 2009 - Decho Corp.

#include "test.h"

#include <algorithm>

namespace Voncount {

size_t
TestStream::Trigger::limit(size_t length)
{
    if (!dg)
        return length;
    if (remaining == 0) {
        dg();
        return length;
    }
    // Stop exactly at the trigger point
    if (remaining < (unsigned long long)length)
        return (size_t)remaining;
    return length;
}

void
TestStream::Trigger::consumed(size_t amount)
{
    if (dg && remaining > 0)
        remaining -= std::min<unsigned long long>(remaining, amount);
}

TestStream::TestStream(Stream::ptr parent)
    : FilterStream(parent, true),
      m_maxReadSize(~(size_t)0),
      m_maxWriteSize(~(size_t)0)
{}

void
TestStream::onRead(boost::function<void ()> dg, unsigned long long after)
{
    m_onRead.dg = dg;
    m_onRead.remaining = after;
}

void
TestStream::onWrite(boost::function<void ()> dg, unsigned long long after)
{
    m_onWrite.dg = dg;
    m_onWrite.remaining = after;
}

void
TestStream::close()
{
    if (m_onClose)
        m_onClose();
    FilterStream::close();
}

size_t
TestStream::read(void *buffer, size_t length)
{
    length = std::min(m_onRead.limit(length), m_maxReadSize);
    size_t result = parent()->read(buffer, length);
    m_onRead.consumed(result);
    return result;
}

size_t
TestStream::write(const void *buffer, size_t length)
{
    length = std::min(m_onWrite.limit(length), m_maxWriteSize);
    size_t result = parent()->write(buffer, length);
    m_onWrite.consumed(result);
    return result;
}

void
TestStream::flush(bool flushParent)
{
    if (m_onFlush)
        m_onFlush(flushParent);
    FilterStream::flush(flushParent);
}

}
