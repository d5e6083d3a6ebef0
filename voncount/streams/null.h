#ifndef __VONCOUNT_NULL_STREAM_H__
#define __VONCOUNT_NULL_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"
#include "voncount/util.h"

namespace Voncount {

/// Always at EOF; swallows anything written to it
class NullStream : public Stream
{
private:
    NullStream() {}

public:
    static NullStream &get() { return s_instance; }
    static Stream::ptr get_ptr() { return unmanagedPtr<Stream>(s_instance); }

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsSeek() { return true; }
    bool supportsSize() { return true; }

    size_t read(void *buffer, size_t length) { return 0; }
    using Stream::write;
    size_t write(const void *buffer, size_t length) { return length; }
    long long seek(long long offset, Anchor anchor = BEGIN) { return 0; }
    long long size() { return 0; }

private:
    static NullStream s_instance;
};

}

#endif
