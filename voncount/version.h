#ifndef __VONCOUNT_VERSION_H__
#define __VONCOUNT_VERSION_H__
// Copyright (c) 2009 - Mozy, Inc.

#ifdef _WIN32
#   error voncount only builds on POSIX systems
#endif

#if defined(linux) || defined(__linux__)
#   define LINUX
#elif defined(__APPLE__)
#   define OSX
#endif

#endif
