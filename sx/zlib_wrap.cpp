// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "zlib_wrap.h"
#include <stdexcept>
#include <vector>
#include <zlib.h> //system zlib: the one libssh2 links against

using namespace sx;


namespace
{
std::string formatZlibStatus(const char* functionName, int rc)
{
    static const NamedCode zlibStatusNames[] =
    {
        SX_NAMED_CODE(Z_OK),           SX_NAMED_CODE(Z_STREAM_END), SX_NAMED_CODE(Z_NEED_DICT),
        SX_NAMED_CODE(Z_ERRNO),        SX_NAMED_CODE(Z_STREAM_ERROR), SX_NAMED_CODE(Z_DATA_ERROR),
        SX_NAMED_CODE(Z_MEM_ERROR),    SX_NAMED_CODE(Z_BUF_ERROR),  SX_NAMED_CODE(Z_VERSION_ERROR),
    };
    return formatSystemError(functionName, getCodeName(rc, zlibStatusNames), "");
}
}


struct InputStreamAsGzip::Deflater
{
    z_stream zs = {};
    gz_header gzHeader = {};
    std::string headerName; //referenced by gzHeader until the header is written
    std::vector<Bytef> bufIn;
    bool sourceEof = false;
    bool streamEnd = false;

    ~Deflater() { ::deflateEnd(&zs); } //Z_DATA_ERROR if ended early: fine
};


InputStreamAsGzip::InputStreamAsGzip(const TryRead& tryReadSource, size_t blockSize, int level, const GzipHeader& header) : //throw SysError
    tryReadSource_(tryReadSource),
    blockSize_(blockSize),
    deflater_(std::make_unique<Deflater>())
{
    if (level < Z_NO_COMPRESSION || Z_BEST_COMPRESSION < level)
        throw SysError(formatSystemError("deflateInit2", "", "Invalid compression level " + numberTo(level) + '.'));

    //windowBits + 16: gzip wrapper instead of zlib
    if (const int rc = ::deflateInit2(&deflater_->zs, level, Z_DEFLATED, MAX_WBITS + 16, MAX_MEM_LEVEL, Z_DEFAULT_STRATEGY);
        rc != Z_OK)
        throw SysError(formatZlibStatus("deflateInit2", rc)); //~Deflater(): deflateEnd() ignores a stream without state

    deflater_->headerName = header.fileName;
    deflater_->gzHeader.name = reinterpret_cast<Bytef*>(deflater_->headerName.data()); //std::string is null-terminated
    deflater_->gzHeader.time = static_cast<uLong>(header.modTime);
    deflater_->gzHeader.os   = 3; //Unix

    if (const int rc = ::deflateSetHeader(&deflater_->zs, &deflater_->gzHeader);
        rc != Z_OK)
        throw SysError(formatZlibStatus("deflateSetHeader", rc));

    deflater_->bufIn.resize(blockSize_);
}


InputStreamAsGzip::~InputStreamAsGzip() {}


size_t InputStreamAsGzip::read(void* buffer, size_t bytesToRead) //throw SysError, X
{
    if (bytesToRead == 0) //would look like end of stream
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo(__LINE__) + "] Contract violation!");

    Deflater& d = *deflater_;
    if (d.streamEnd)
        return 0;

    d.zs.next_out  = static_cast<Bytef*>(buffer);
    d.zs.avail_out = static_cast<uInt>(bytesToRead);

    while (d.zs.avail_out > 0)
    {
        if (d.zs.avail_in == 0 && !d.sourceEof)
        {
            const size_t bytesRead = tryReadSource_(d.bufIn.data(), d.bufIn.size()); //throw X
            d.zs.next_in  = d.bufIn.data();
            d.zs.avail_in = static_cast<uInt>(bytesRead);
            d.sourceEof = bytesRead == 0;
        }

        const int rc = ::deflate(&d.zs, d.sourceEof ? Z_FINISH : Z_NO_FLUSH);
        if (rc == Z_STREAM_END)
        {
            d.streamEnd = true;
            break;
        }
        if (rc != Z_OK)
            throw SysError(formatZlibStatus("deflate", rc));
    }
    return bytesToRead - d.zs.avail_out;
}
