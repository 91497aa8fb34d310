// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ZSTRING_H_50291837465012
#define ZSTRING_H_50291837465012

#include <stdexcept> //std::logic_error for contract checks everywhere
#include <string>
#include <string_view>


using Zchar = char;
#define Zstr(x) x

//native path string: UTF-8 on Linux, both for local paths and SFTP paths
using Zstring     = std::basic_string<Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

#endif //ZSTRING_H_50291837465012
