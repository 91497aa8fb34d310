// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_TRAVERSER_H_5520918347712064
#define FILE_TRAVERSER_H_5520918347712064

#include <functional>
#include "file_access.h"


namespace sx
{
//lists a single folder level: "." and ".." are skipped, symlinks are reported as such (not followed)
void traverseFolder(const Zstring& dirPath, const std::function<void(const Zstring& itemName, ItemType type)>& onItem); //throw FileError
}

#endif //FILE_TRAVERSER_H_5520918347712064
