#ifndef __VONCOUNT_UTIL_H__
#define __VONCOUNT_UTIL_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <boost/shared_ptr.hpp>

namespace Voncount {

struct NullDeleter
{
    template <class T>
    void operator()(T *) const {}
};

/// A shared_ptr that refers to t without owning it
///
/// Nothing is deleted when the last copy goes away; the caller keeps t alive
/// for as long as any copy is in use.
template <class T>
boost::shared_ptr<T> unmanagedPtr(T &t)
{ return boost::shared_ptr<T>(&t, NullDeleter()); }

}

#endif
