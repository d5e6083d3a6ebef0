#ifndef __VONCOUNT_TEST_STREAM_H__
#define __VONCOUNT_TEST_STREAM_H__
// Copyright (c) 2009 - Decho Corp.

#include <boost/function.hpp>

#include "filter.h"

namespace Voncount {

/// Misbehaving Stream for unit tests
///
/// Caps the size of each read() and write(), and runs a hook (which usually
/// throws) on every read() or write() once a given number of bytes has gone
/// through.  Always owns its parent.
class TestStream : public FilterStream
{
public:
    typedef boost::shared_ptr<TestStream> ptr;

public:
    TestStream(Stream::ptr parent);

    void maxReadSize(size_t max) { m_maxReadSize = max; }
    void maxWriteSize(size_t max) { m_maxWriteSize = max; }

    void onRead(boost::function<void ()> dg, unsigned long long after = 0);
    void onWrite(boost::function<void ()> dg, unsigned long long after = 0);
    void onClose(boost::function<void ()> dg) { m_onClose = dg; }
    void onFlush(boost::function<void (bool)> dg) { m_onFlush = dg; }

    void close();
    size_t read(void *buffer, size_t length);
    using FilterStream::write;
    size_t write(const void *buffer, size_t length);
    void flush(bool flushParent = true);

private:
    struct Trigger
    {
        Trigger() : remaining(0) {}

        size_t limit(size_t length);
        void consumed(size_t amount);

        boost::function<void ()> dg;
        unsigned long long remaining;
    };

private:
    size_t m_maxReadSize, m_maxWriteSize;
    Trigger m_onRead, m_onWrite;
    boost::function<void ()> m_onClose;
    boost::function<void (bool)> m_onFlush;
};

}

#endif
