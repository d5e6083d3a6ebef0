#ifndef __VONCOUNT_STREAM_H__
#define __VONCOUNT_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stddef.h>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>

#include "voncount/assert.h"

namespace Voncount {

/// A synchronous source and/or sink of bytes
///
/// Each Stream advertises what it can do through the supportsXXX() queries;
/// calling anything it doesn't support is a programming error, and the
/// default implementations hit VONCOUNT_NOTREACHED().  close() and flush()
/// may be called on any Stream.
///
/// A Stream is used from one thread at a time.
class Stream : boost::noncopyable
{
public:
    typedef boost::shared_ptr<Stream> ptr;

    enum Anchor {
        BEGIN,
        CURRENT,
        END
    };

public:
    virtual ~Stream() {}

    virtual bool supportsRead() { return false; }
    virtual bool supportsWrite() { return false; }
    virtual bool supportsSeek() { return false; }
    /// Defaults to supportsSeek()
    virtual bool supportsTell() { return supportsSeek(); }
    virtual bool supportsSize() { return false; }

    /// Release the underlying resource; calling it again is a no-op
    virtual void close() {}

    /// Read up to length bytes into buffer
    ///
    /// Short reads are allowed at any time.  0 means EOF, and only EOF.
    /// If an exception escapes, nothing was consumed.
    /// @pre supportsRead()
    virtual size_t read(void *buffer, size_t length);

    /// Write up to length bytes from buffer
    ///
    /// Short writes are allowed, but a write never returns 0.  If an
    /// exception escapes, nothing was written.
    /// @pre supportsWrite()
    virtual size_t write(const void *buffer, size_t length);
    /// write() a NUL terminated string (without the NUL)
    size_t write(const char *string);

    /// @return The new position
    /// @throws std::invalid_argument If the new position would be negative
    /// @pre supportsSeek()
    virtual long long seek(long long offset, Anchor anchor = BEGIN);
    /// @pre supportsTell()
    long long tell() { return seek(0, CURRENT); }
    /// @pre supportsSize()
    virtual long long size();

    /// Push anything buffered out to the underlying resource
    /// @param flushParent Also flush the Stream this one wraps, if any
    virtual void flush(bool flushParent = true) {}
};

}

#endif
