#ifndef __VONCOUNT_EXAMPLES_COUNTCAT_H__
#define __VONCOUNT_EXAMPLES_COUNTCAT_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <string>
#include <vector>

#include "voncount/streams/stream.h"

namespace Voncount {

struct CountcatTotals
{
    CountcatTotals() : read(0), written(0) {}

    size_t read;
    size_t written;
};

/// The inputs named on a command line that Config has already consumed
///
/// A leading "--" is dropped; no inputs at all means stdin ("-").
std::vector<std::string> countcatInputs(int argc, char **argv);

/// "-" is stdin, anything else a file opened for reading
/// @throws NativeException if the file can't be opened
Stream::ptr openInput(const std::string &name);

/// Copy every input, in order, to output and flush it
CountcatTotals countcat(const std::vector<std::string> &inputs,
    Stream &output);

}

#endif
