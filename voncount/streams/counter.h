#ifndef __VONCOUNT_COUNTER_STREAM_H__
#define __VONCOUNT_COUNTER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "filter.h"
#include "voncount/counter.h"

namespace Voncount {

/// Counts the bytes read through it
///
/// Reads are passed to the parent unchanged; whatever the parent returns is
/// added to count() and handed back.  If the parent throws, the exception
/// propagates untouched and count() does not change.  Exceeding the largest
/// representable count is fatal.
///
/// A ReadCounter has exclusive use of its parent for its whole lifetime;
/// nothing else may read from the parent while it is wrapped.
class ReadCounter : public FilterStream, public Counter
{
public:
    typedef boost::shared_ptr<ReadCounter> ptr;

public:
    /// Borrows parent; parent must outlive the ReadCounter, and is never
    /// closed by it
    ReadCounter(Stream &parent);
    ReadCounter(Stream::ptr parent, bool own = true);

    bool supportsWrite() { return false; }

    size_t read(void *buffer, size_t length);

    /// @return The number of bytes read so far
    size_t count() const { return m_count; }

private:
    size_t m_count;
};

/// Counts the bytes written through it
///
/// The write-side twin of ReadCounter.  flush() is delegated to the parent
/// and does not touch count().
class WriteCounter : public FilterStream, public Counter
{
public:
    typedef boost::shared_ptr<WriteCounter> ptr;

public:
    /// Borrows parent; parent must outlive the WriteCounter, and is never
    /// closed by it
    WriteCounter(Stream &parent);
    WriteCounter(Stream::ptr parent, bool own = true);

    bool supportsRead() { return false; }

    using FilterStream::write;
    size_t write(const void *buffer, size_t length);
    void flush(bool flushParent = true);

    /// @return The number of bytes written so far
    size_t count() const { return m_count; }

private:
    size_t m_count;
};

}

#endif
