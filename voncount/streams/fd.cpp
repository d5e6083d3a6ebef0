// Copyright (c) 2009 - Mozy, Inc.

#include "fd.h"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "voncount/exception.h"
#include "voncount/log.h"

namespace Voncount {

static Logger::ptr g_log = Log::lookup("voncount:streams:fd");

// Largest single read()/write() Linux will do
static const size_t g_maxTransfer = 0x7ffff000;

FDStream::FDStream(int fd, bool own)
    : m_fd(fd),
      m_own(own)
{
    VONCOUNT_ASSERT(fd >= 0);
}

FDStream::~FDStream()
{
    if (m_own && m_fd >= 0) {
        int rc = ::close(m_fd);
        VONCOUNT_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
            << " close(" << m_fd << "): " << rc << " (" << lastError() << ")";
    }
}

void
FDStream::close()
{
    if (!m_own || m_fd < 0)
        return;
    int fd = m_fd;
    m_fd = -1;
    int rc = ::close(fd);
    error_t error = lastError();
    VONCOUNT_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
        << " close(" << fd << "): " << rc << " (" << error << ")";
    if (rc)
        VONCOUNT_THROW_EXCEPTION_FROM_ERROR_API(error, "close");
}

size_t
FDStream::read(void *buffer, size_t length)
{
    if (length > g_maxTransfer)
        length = g_maxTransfer;
    ssize_t rc;
    do {
        rc = ::read(m_fd, buffer, length);
    } while (rc < 0 && errno == EINTR);
    error_t error = lastError();
    VONCOUNT_LOG_LEVEL(g_log, rc < 0 ? Log::ERROR : Log::DEBUG) << this
        << " read(" << m_fd << ", " << length << "): " << rc << " (" << error
        << ")";
    if (rc < 0)
        VONCOUNT_THROW_EXCEPTION_FROM_ERROR_API(error, "read");
    return (size_t)rc;
}

size_t
FDStream::write(const void *buffer, size_t length)
{
    if (length > g_maxTransfer)
        length = g_maxTransfer;
    ssize_t rc;
    do {
        rc = ::write(m_fd, buffer, length);
    } while (rc < 0 && errno == EINTR);
    error_t error = lastError();
    VONCOUNT_LOG_LEVEL(g_log, rc < 0 ? Log::ERROR : Log::DEBUG) << this
        << " write(" << m_fd << ", " << length << "): " << rc << " (" << error
        << ")";
    if (rc < 0)
        VONCOUNT_THROW_EXCEPTION_FROM_ERROR_API(error, "write");
    if (rc == 0 && length > 0)
        VONCOUNT_THROW_EXCEPTION(std::runtime_error("Zero length write"));
    return (size_t)rc;
}

long long
FDStream::seek(long long offset, Anchor anchor)
{
    int whence = SEEK_SET;
    switch (anchor) {
        case BEGIN:
            break;
        case CURRENT:
            whence = SEEK_CUR;
            break;
        case END:
            whence = SEEK_END;
            break;
    }
    off_t pos = lseek(m_fd, (off_t)offset, whence);
    error_t error = lastError();
    VONCOUNT_LOG_LEVEL(g_log, pos < 0 ? Log::ERROR : Log::VERBOSE) << this
        << " lseek(" << m_fd << ", " << offset << ", " << whence << "): "
        << pos << " (" << error << ")";
    if (pos < 0) {
        if (error == EINVAL)
            VONCOUNT_THROW_EXCEPTION(std::invalid_argument(
                "resulting offset is negative"));
        VONCOUNT_THROW_EXCEPTION_FROM_ERROR_API(error, "lseek");
    }
    return pos;
}

long long
FDStream::size()
{
    struct stat statbuf;
    int rc = fstat(m_fd, &statbuf);
    error_t error = lastError();
    VONCOUNT_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
        << " fstat(" << m_fd << "): " << rc << " (" << error << ")";
    if (rc)
        VONCOUNT_THROW_EXCEPTION_FROM_ERROR_API(error, "fstat");
    return statbuf.st_size;
}

void
FDStream::flush(bool flushParent)
{
    int rc = fsync(m_fd);
    error_t error = lastError();
    if (rc && (error == EINVAL || error == EROFS))
        rc = 0;
    VONCOUNT_LOG_LEVEL(g_log, rc ? Log::ERROR : Log::VERBOSE) << this
        << " fsync(" << m_fd << "): " << rc << " (" << error << ")";
    if (rc)
        VONCOUNT_THROW_EXCEPTION_FROM_ERROR_API(error, "fsync");
}

}
