// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) seaxfer contributors                                        *
// *****************************************************************************

#ifndef GLOB_H_7720315586409123
#define GLOB_H_7720315586409123

#include <sx/sys_error.h>
#include <sx/zstring.h>


namespace sxf
{
DEFINE_NEW_SYS_ERROR(SysErrorGlobPattern)

/*  Shell-style pattern for a single path component:
        *         any sequence of characters except FILE_NAME_SEPARATOR
        ?         any single character except FILE_NAME_SEPARATOR
        [a-z0-9]  character class with ranges, must be non-empty
        [^...]    negated character class, same as [!...]
        \c        matches character c literally, also inside a character class     */
bool matchesGlob(ZstringView name, ZstringView pattern); //throw SysErrorGlobPattern

//throw if pattern is malformed, e.g. "[a-" or "abc\"
void checkGlobPattern(ZstringView pattern); //throw SysErrorGlobPattern

bool hasGlobMeta(ZstringView pattern);

//"a\*b" -> "a*b"
Zstring unescapeGlob(ZstringView pattern);
}

#endif //GLOB_H_7720315586409123
