#ifndef __VONCOUNT_TRANSFER_STREAM_H__
#define __VONCOUNT_TRANSFER_STREAM_H__
// Copyright (c) 2009 - Mozy, Inc.

#include "stream.h"

namespace Voncount {

/// What transferStream() does when src hits EOF early
enum ExactLength
{
    /// UNTILEOF if toTransfer is ~0ull, otherwise EXACT
    INFER,
    /// Throw UnexpectedEofException
    EXACT,
    /// Stop and report what was copied
    UNTILEOF
};

/// Copy up to toTransfer bytes from src to dst
///
/// Short writes are retried until everything read has been written.
/// @return The number of bytes copied
unsigned long long transferStream(Stream &src, Stream &dst,
                                  unsigned long long toTransfer = ~0ull,
                                  ExactLength exactLength = INFER);

inline unsigned long long transferStream(Stream::ptr src, Stream &dst,
                                         unsigned long long toTransfer = ~0ull,
                                         ExactLength exactLength = INFER)
{ return transferStream(*src, dst, toTransfer, exactLength); }
inline unsigned long long transferStream(Stream &src, Stream::ptr dst,
                                         unsigned long long toTransfer = ~0ull,
                                         ExactLength exactLength = INFER)
{ return transferStream(src, *dst, toTransfer, exactLength); }

}

#endif
