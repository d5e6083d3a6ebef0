// Copyright (c) 2009 - Mozy, Inc.

#include "memory.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <string.h>

#include "voncount/exception.h"

namespace Voncount {

MemoryStream::MemoryStream()
    : m_offset(0)
{}

MemoryStream::MemoryStream(const std::string &data)
    : m_data(data),
      m_offset(0)
{}

MemoryStream::MemoryStream(const void *data, size_t length)
    : m_data((const char *)data, length),
      m_offset(0)
{}

std::string
MemoryStream::readBuffer() const
{
    if (m_offset >= m_data.size())
        return std::string();
    return m_data.substr(m_offset);
}

size_t
MemoryStream::read(void *buffer, size_t length)
{
    if (m_offset >= m_data.size())
        return 0;
    size_t todo = std::min(length, m_data.size() - m_offset);
    memcpy(buffer, m_data.data() + m_offset, todo);
    m_offset += todo;
    return todo;
}

size_t
MemoryStream::write(const void *buffer, size_t length)
{
    if (m_offset > m_data.size())
        m_data.resize(m_offset, '\0');
    size_t overlap = std::min(length, m_data.size() - m_offset);
    m_data.replace(m_offset, overlap, (const char *)buffer, length);
    m_offset += length;
    return length;
}

long long
MemoryStream::seek(long long offset, Anchor anchor)
{
    long long base = 0;
    switch (anchor) {
        case BEGIN:
            break;
        case CURRENT:
            base = (long long)m_offset;
            break;
        case END:
            base = (long long)m_data.size();
            break;
    }
    long long target = base + offset;
    if (target < 0)
        VONCOUNT_THROW_EXCEPTION(std::invalid_argument(
            "resulting offset is negative"));
    if ((unsigned long long)target > std::numeric_limits<size_t>::max())
        VONCOUNT_THROW_EXCEPTION(std::invalid_argument(
            "resulting offset exceeds the address space"));
    m_offset = (size_t)target;
    return target;
}

}
