// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_PATH_H_6618203945127733
#define FILE_PATH_H_6618203945127733

#include <optional>
#include "zstring.h"
#include "string_tools.h"


namespace sx
{
const Zchar FILE_NAME_SEPARATOR = '/';

//"/a/b" -> "b"
inline Zstring getItemName(ZstringView itemPath) { return afterLast(itemPath, "/", IfNotFoundReturn::all); }

//"/a/b/" -> "/a"; no value for "/" or a relative path of one component
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath);

//relPath: no leading, trailing or double separator
Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

//environment as seen at the first call
std::optional<Zstring> getEnvironmentVar(ZstringView name);
}

#endif //FILE_PATH_H_6618203945127733
