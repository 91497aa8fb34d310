// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FS_NATIVE_7302148856620915
#define FS_NATIVE_7302148856620915

#include "abstract.h"


namespace sxf
{
//local disk: paths are host paths, absolute or relative to the working directory
std::unique_ptr<AbstractFileSystem> createNativeFileSystem(); //noexcept
}

#endif //FS_NATIVE_7302148856620915
