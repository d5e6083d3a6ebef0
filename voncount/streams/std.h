#ifndef __VONCOUNT_STD_STREAM_H__
#define __VONCOUNT_STD_STREAM_H__
// Copyright (c) 2009 - Decho Corporation

#include <unistd.h>

#include "fd.h"

namespace Voncount {

/// The process's standard descriptors; never closed, never seekable
class StdStream : public FDStream
{
protected:
    StdStream(int fd) : FDStream(fd, false) {}

public:
    bool supportsSeek() { return false; }
    bool supportsSize() { return false; }
};

class StdinStream : public StdStream
{
public:
    StdinStream() : StdStream(STDIN_FILENO) {}

    bool supportsWrite() { return false; }
};

class StdoutStream : public StdStream
{
public:
    StdoutStream() : StdStream(STDOUT_FILENO) {}

    bool supportsRead() { return false; }
};

class StderrStream : public StdStream
{
public:
    StderrStream() : StdStream(STDERR_FILENO) {}

    bool supportsRead() { return false; }
};

}

#endif
