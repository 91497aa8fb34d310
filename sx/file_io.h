// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_7720193845561029
#define FILE_IO_H_7720193845561029

#include "file_access.h"
#include "serialize.h"
#include <sys/stat.h>


namespace sx
{
//owns a POSIX file descriptor: unbuffered, sequential access, symlinks are followed
class FileDescriptor
{
public:
    const Zstring& getFilePath() const { return filePath_; }

    const struct stat& getStat() const { return fileInfo_; } //as of open()

    size_t getBlockSize() const; //st_blksize, but at least 256 kB

protected:
    FileDescriptor(const Zstring& filePath, int fd); //throw FileError; takes ownership
    ~FileDescriptor(); //closes, unless closed explicitly

    int getFd() const { return fd_; }
    void closeFd(); //throw FileError

private:
    FileDescriptor           (const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    const Zstring filePath_;
    int fd_ = -1;
    struct stat fileInfo_ = {};
};


class FileInputPlain : public FileDescriptor
{
public:
    explicit FileInputPlain(const Zstring& filePath); //throw FileError

    //bytesToRead > 0; short reads possible, 0 only at end of file
    size_t tryRead(void* buffer, size_t bytesToRead); //throw FileError
};


//creates a new file: fails with ErrorTargetExisting if already existing
//the file is deleted again unless close() succeeds
class FileOutputPlain : public FileDescriptor
{
public:
    explicit FileOutputPlain(const Zstring& filePath); //throw FileError, ErrorTargetExisting
    ~FileOutputPlain();

    //bytesToWrite > 0; short writes possible
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw FileError

    void close(); //throw FileError

private:
    bool closed_ = false;
};


std::string getFileContent(const Zstring& filePath); //throw FileError
}

#endif //FILE_IO_H_7720193845561029
