#ifndef __VONCOUNT_FD_STREAM_H__
#define __VONCOUNT_FD_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Voncount {

/// Blocking Stream over a POSIX file descriptor
///
/// Failed syscalls throw the exception mapped from errno (BadHandleException
/// for EBADF, BrokenPipeException for EPIPE, and so on).
class FDStream : public Stream
{
public:
    typedef boost::shared_ptr<FDStream> ptr;

public:
    /// @param own Close fd on close() and on destruction
    FDStream(int fd, bool own = true);
    ~FDStream();

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsSeek() { return true; }
    bool supportsSize() { return true; }

    void close();
    size_t read(void *buffer, size_t length);
    using Stream::write;
    size_t write(const void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);
    long long size();
    /// fsync()s; descriptors that can't be synced (pipes, terminals) are
    /// silently skipped
    void flush(bool flushParent = true);

    int fd() const { return m_fd; }

private:
    int m_fd;
    bool m_own;
};

}

#endif
