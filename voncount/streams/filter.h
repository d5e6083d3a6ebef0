#ifndef __VONCOUNT_FILTER_STREAM_H__
#define __VONCOUNT_FILTER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Voncount {

/// Base for Streams that sit on top of another Stream
///
/// Everything but read() and write() is forwarded to parent() by default;
/// subclasses that can read or write must implement those themselves.
/// close() only reaches the parent if this FilterStream owns it.
class FilterStream : public Stream
{
public:
    typedef boost::shared_ptr<FilterStream> ptr;

public:
    FilterStream(Stream::ptr parent, bool own = true)
        : m_parent(parent), m_own(own)
    {}

    Stream::ptr parent() { return m_parent; }
    bool ownsParent() const { return m_own; }

    bool supportsRead() { return m_parent->supportsRead(); }
    bool supportsWrite() { return m_parent->supportsWrite(); }
    bool supportsSeek() { return m_parent->supportsSeek(); }
    bool supportsTell() { return m_parent->supportsTell(); }
    bool supportsSize() { return m_parent->supportsSize(); }

    void close() { if (m_own) m_parent->close(); }
    long long seek(long long offset, Anchor anchor = BEGIN)
    { return m_parent->seek(offset, anchor); }
    long long size() { return m_parent->size(); }
    void flush(bool flushParent = true)
    { if (flushParent) m_parent->flush(true); }

private:
    Stream::ptr m_parent;
    bool m_own;
};

}

#endif
