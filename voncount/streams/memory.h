#ifndef __VONCOUNT_MEMORY_STREAM_H__
#define __VONCOUNT_MEMORY_STREAM_H__
// Copyright (c) 2009 - Decho Corporation

#include <string>

#include "stream.h"

namespace Voncount {

/// Random access Stream backed by a std::string
///
/// Writes overwrite in place and grow the stream as needed; writing past the
/// end fills the gap with zeros.
class MemoryStream : public Stream
{
public:
    typedef boost::shared_ptr<MemoryStream> ptr;

public:
    MemoryStream();
    MemoryStream(const std::string &data);
    MemoryStream(const void *data, size_t length);

    bool supportsRead() { return true; }
    bool supportsWrite() { return true; }
    bool supportsSeek() { return true; }
    bool supportsSize() { return true; }

    size_t read(void *buffer, size_t length);
    using Stream::write;
    size_t write(const void *buffer, size_t length);
    long long seek(long long offset, Anchor anchor = BEGIN);
    long long size() { return (long long)m_data.size(); }

    /// Everything in the stream
    const std::string &buffer() const { return m_data; }
    /// Everything from the current position on
    std::string readBuffer() const;

private:
    std::string m_data;
    size_t m_offset;
};

}

#endif
