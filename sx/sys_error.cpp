// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"
#include <glib.h>

using namespace sx;


namespace
{
//what local disk I/O and a TCP session can run into
const NamedCode errnoNames[] =
{
    SX_NAMED_CODE(EPERM),        SX_NAMED_CODE(ENOENT),        SX_NAMED_CODE(EINTR),
    SX_NAMED_CODE(EIO),          SX_NAMED_CODE(EBADF),         SX_NAMED_CODE(EAGAIN),
    SX_NAMED_CODE(ENOMEM),       SX_NAMED_CODE(EACCES),        SX_NAMED_CODE(EBUSY),
    SX_NAMED_CODE(EEXIST),       SX_NAMED_CODE(EXDEV),         SX_NAMED_CODE(ENOTDIR),
    SX_NAMED_CODE(EISDIR),       SX_NAMED_CODE(EINVAL),        SX_NAMED_CODE(EMFILE),
    SX_NAMED_CODE(EFBIG),        SX_NAMED_CODE(ENOSPC),        SX_NAMED_CODE(EROFS),
    SX_NAMED_CODE(EPIPE),        SX_NAMED_CODE(ENAMETOOLONG),  SX_NAMED_CODE(ENOTEMPTY),
    SX_NAMED_CODE(ELOOP),        SX_NAMED_CODE(ENOTSUP),       SX_NAMED_CODE(EDQUOT),
    SX_NAMED_CODE(ESTALE),       SX_NAMED_CODE(EADDRNOTAVAIL), SX_NAMED_CODE(ENETDOWN),
    SX_NAMED_CODE(ENETUNREACH),  SX_NAMED_CODE(ECONNABORTED),  SX_NAMED_CODE(ECONNRESET),
    SX_NAMED_CODE(ENOTCONN),     SX_NAMED_CODE(ETIMEDOUT),     SX_NAMED_CODE(ECONNREFUSED),
    SX_NAMED_CODE(EHOSTUNREACH), SX_NAMED_CODE(EINPROGRESS),
};
}


std::string sx::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    const ErrorCode ecSaved = errno;
    SX_ON_SCOPE_EXIT(errno = ecSaved);

    //g_strerror(): UTF-8 and thread-safe, unlike strerror()
    return formatSystemError(functionName, getCodeName(ec, errnoNames), ::g_strerror(ec));
}


std::string sx::formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg)
{
    std::string output = trimCpy(errorCode);

    if (const std::string msg = trimCpy(errorMsg);
        !msg.empty())
        output += (output.empty() ? "" : ": ") + msg;

    if (!functionName.empty())
        output += (output.empty() ? "[" : " [") + functionName + ']';
    return output;
}
