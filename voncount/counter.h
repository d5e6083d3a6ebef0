#ifndef __VONCOUNT_COUNTER_H__
#define __VONCOUNT_COUNTER_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stddef.h>

namespace Voncount {

/// Something that keeps a running count; what it counts is up to the
/// implementation
///
/// A count starts at 0 and never decreases.
class Counter
{
public:
    virtual ~Counter() {}

    /// @return The number of items counted so far
    virtual size_t count() const = 0;
};

}

#endif
