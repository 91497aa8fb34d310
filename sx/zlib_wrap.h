// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ZLIB_WRAP_H_6639028147705512
#define ZLIB_WRAP_H_6639028147705512

#include <ctime>
#include <functional>
#include <memory>
#include "sys_error.h"


namespace sx
{
//RFC 1952 member header
struct GzipHeader
{
    std::string fileName; //FNAME: without directory
    time_t modTime = 0;   //MTIME: 0 if unknown
};

const int GZIP_DEFAULT_LEVEL = 6; //0 (store) - 9 (best)


//gzip-compresses another stream while it is read
class InputStreamAsGzip
{
public:
    using TryRead = std::function<size_t(void* buffer, size_t bytesToRead)>; //throw X; may return short, only 0 means EOF

    InputStreamAsGzip(const TryRead& tryReadSource, size_t blockSize, int level, const GzipHeader& header); //throw SysError
    ~InputStreamAsGzip();

    size_t getBlockSize() const { return blockSize_; }

    //fills the buffer completely unless the stream ends
    size_t read(void* buffer, size_t bytesToRead); //throw SysError, X

private:
    InputStreamAsGzip           (const InputStreamAsGzip&) = delete;
    InputStreamAsGzip& operator=(const InputStreamAsGzip&) = delete;

    struct Deflater;

    const TryRead tryReadSource_;
    const size_t blockSize_;
    const std::unique_ptr<Deflater> deflater_;
};
}

#endif //ZLIB_WRAP_H_6639028147705512
