// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

#include <string.h>

namespace Voncount {

size_t
Stream::read(void *buffer, size_t length)
{
    VONCOUNT_NOTREACHED();
}

size_t
Stream::write(const void *buffer, size_t length)
{
    VONCOUNT_NOTREACHED();
}

size_t
Stream::write(const char *string)
{
    return write(string, strlen(string));
}

long long
Stream::seek(long long offset, Anchor anchor)
{
    VONCOUNT_NOTREACHED();
}

long long
Stream::size()
{
    VONCOUNT_NOTREACHED();
}

}
