// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SYS_ERROR_H_8811029347501927364
#define SYS_ERROR_H_8811029347501927364

#include <cerrno>
#include "scope_guard.h"
#include "string_tools.h" //everyone throwing SysError formats messages
#include "zstring.h"


namespace sx
{
//detail message of a failed system or library call, e.g. "ENOENT: No such file or directory [open]"
//no context: callers wrap it into a FileError naming the item
class SysError
{
public:
    explicit SysError(const std::string& msg) : msg_(msg) {}
    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public sx::SysError { X(const std::string& msg) : SysError(msg) {} };


using ErrorCode = int; //errno

//"<code>: <description> [<functionName>]", skipping empty parts
std::string formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg);
std::string formatSystemError(const std::string& functionName, ErrorCode ec);

#define THROW_LAST_SYS_ERROR(functionName) \
    do { const sx::ErrorCode ecLast = errno; throw sx::SysError(sx::formatSystemError(functionName, ecLast)); } while (false)

//for conditions a library promises but that we still check
#define ASSERT_SYSERROR(expr) \
    do { if (!(expr)) throw sx::SysError(std::string("Assertion failed: \"") + #expr + '"'); } while (false)


//symbolic names for numeric status codes: SX_NAMED_CODE(ENOENT) => {ENOENT, "ENOENT"}
struct NamedCode
{
    long code;
    const char* name;
};
#define SX_NAMED_CODE(X) sx::NamedCode{X, #X}

template <size_t N> inline
std::string getCodeName(long code, const NamedCode (&names)[N]) //"Error code <n>" if unknown
{
    for (const NamedCode& nc : names)
        if (nc.code == code)
            return nc.name;
    return "Error code " + numberTo(code);
}
}

#endif //SYS_ERROR_H_8811029347501927364
