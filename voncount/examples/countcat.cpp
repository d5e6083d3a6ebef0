// Copyright (c) 2009 - Mozy, Inc.

#include "countcat.h"

#include <fcntl.h>
#include <string.h>

#include "voncount/exception.h"
#include "voncount/log.h"
#include "voncount/streams/counter.h"
#include "voncount/streams/fd.h"
#include "voncount/streams/std.h"
#include "voncount/streams/transfer.h"

namespace Voncount {

static Logger::ptr g_log = Log::lookup("voncount:countcat");

std::vector<std::string>
countcatInputs(int argc, char **argv)
{
    int first = 1;
    if (first < argc && strcmp(argv[first], "--") == 0)
        ++first;
    std::vector<std::string> inputs;
    for (int i = first; i < argc; ++i)
        inputs.push_back(argv[i]);
    if (inputs.empty())
        inputs.push_back("-");
    return inputs;
}

Stream::ptr
openInput(const std::string &name)
{
    if (name == "-")
        return Stream::ptr(new StdinStream());
    int fd = ::open(name.c_str(), O_RDONLY);
    if (fd < 0)
        VONCOUNT_THROW_EXCEPTION_FROM_LAST_ERROR_API("open");
    return Stream::ptr(new FDStream(fd));
}

CountcatTotals
countcat(const std::vector<std::string> &inputs, Stream &output)
{
    CountcatTotals totals;
    WriteCounter writer(output);
    for (std::vector<std::string>::const_iterator it = inputs.begin();
        it != inputs.end();
        ++it) {
        ReadCounter reader(openInput(*it));
        transferStream(reader, writer);
        VONCOUNT_LOG_INFO(g_log) << *it << ": " << reader.count() << " bytes";
        totals.read += reader.count();
        reader.close();
    }
    writer.flush();
    totals.written = writer.count();
    return totals;
}

}
