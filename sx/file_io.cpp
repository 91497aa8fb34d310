// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_io.h"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include "extra_log.h"
#include <fcntl.h>
#include <unistd.h>

using namespace sx;


namespace
{
[[noreturn]] void throwContractViolation(int line)
{
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo(line) + "] Contract violation!");
}


//retry on EINTR: the signal may arrive before any byte was transferred
template <class Function>
size_t retryInterrupted(const char* functionName, Function ioCall) //throw SysError
{
    for (;;)
    {
        const ssize_t rv = ioCall();
        if (rv >= 0)
            return static_cast<size_t>(rv);
        if (errno != EINTR)
            THROW_LAST_SYS_ERROR(functionName);
    }
}


int openForRead(const Zstring& filePath) //throw FileError
{
    try
    {
        //devices and pipes may block open() forever => only regular files (and folders, for a proper EISDIR)
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0)
            THROW_LAST_SYS_ERROR("stat");
        if (!S_ISREG(fileInfo.st_mode) && !S_ISDIR(fileInfo.st_mode))
            throw SysError("Unsupported item type. [mode 0" + numberTo(fileInfo.st_mode & S_IFMT) + ']');

        const int fd = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1)
            THROW_LAST_SYS_ERROR("open");

        ::posix_fadvise(fd, 0, 0 /*until EOF*/, POSIX_FADV_SEQUENTIAL); //read-ahead hint only
        return fd;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot open file %x.", "%x", fmtPath(filePath)), e.toString()); }
}


int createForWrite(const Zstring& filePath) //throw FileError, ErrorTargetExisting
{
    const int fd = ::open(filePath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC,
                          S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH); //0666, minus umask
    if (fd == -1)
    {
        const ErrorCode ec = errno;
        const std::string errorMsg = replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath));
        if (ec == EEXIST)
            throw ErrorTargetExisting(errorMsg, formatSystemError("open", ec));
        throw FileError(errorMsg, formatSystemError("open", ec));
    }
    return fd;
}
}


FileDescriptor::FileDescriptor(const Zstring& filePath, int fd) : filePath_(filePath), fd_(fd) //throw FileError
{
    if (::fstat(fd_, &fileInfo_) != 0)
    {
        const ErrorCode ec = errno;
        ::close(fd_);
        throw FileError(replaceCpy("Cannot read file attributes of %x.", "%x", fmtPath(filePath_)), formatSystemError("fstat", ec));
    }
}


FileDescriptor::~FileDescriptor()
{
    if (fd_ != -1)
        ::close(fd_); //only reached for input files and for unfinished output that is deleted anyway
}


size_t FileDescriptor::getBlockSize() const
{
    const size_t minBlockSize = 256 * 1024;
    return fileInfo_.st_blksize > 0 ? std::max(static_cast<size_t>(fileInfo_.st_blksize), minBlockSize) : minBlockSize;
}


void FileDescriptor::closeFd() //throw FileError
{
    if (fd_ == -1)
        throwContractViolation(__LINE__);

    if (::close(std::exchange(fd_, -1)) != 0) //the descriptor is released even on error
    {
        const ErrorCode ec = errno;
        throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(filePath_)), formatSystemError("close", ec));
    }
}

//----------------------------------------------------------------------------------------------------

FileInputPlain::FileInputPlain(const Zstring& filePath) : FileDescriptor(filePath, openForRead(filePath)) {} //throw FileError


size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw FileError
{
    if (bytesToRead == 0) //read() would return 0 => looks like EOF
        throwContractViolation(__LINE__);
    try
    {
        const size_t bytesRead = retryInterrupted("read", [&] { return ::read(getFd(), buffer, bytesToRead); }); //throw SysError
        ASSERT_SYSERROR(bytesRead <= bytesToRead);
        return bytesRead;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot read file %x.", "%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

FileOutputPlain::FileOutputPlain(const Zstring& filePath) : FileDescriptor(filePath, createForWrite(filePath)) {} //throw FileError, ErrorTargetExisting


FileOutputPlain::~FileOutputPlain()
{
    if (!closed_) //incomplete
        if (::unlink(getFilePath().c_str()) != 0)
        {
            const ErrorCode ec = errno;
            logExtraError(replaceCpy("Cannot delete file %x.", "%x", fmtPath(getFilePath())) + "\n\n" + formatSystemError("unlink", ec));
        }
}


size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw FileError
{
    if (bytesToWrite == 0)
        throwContractViolation(__LINE__);
    try
    {
        const size_t bytesWritten = retryInterrupted("write", [&] { return ::write(getFd(), buffer, bytesToWrite); }); //throw SysError
        if (bytesWritten == 0) //no progress: treat like a full disk
            throw SysError(formatSystemError("write", ENOSPC));

        ASSERT_SYSERROR(bytesWritten <= bytesToWrite);
        return bytesWritten;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot write file %x.", "%x", fmtPath(getFilePath())), e.toString()); }
}


void FileOutputPlain::close() //throw FileError
{
    closeFd(); //throw FileError
    closed_ = true;
}

//----------------------------------------------------------------------------------------------------

std::string sx::getFileContent(const Zstring& filePath) //throw FileError
{
    FileInputPlain fileIn(filePath); //throw FileError

    return unbufferedLoad<std::string>([&](void* buffer, size_t bytesToRead) { return fileIn.tryRead(buffer, bytesToRead); }, //throw FileError
                                       fileIn.getBlockSize());
}
