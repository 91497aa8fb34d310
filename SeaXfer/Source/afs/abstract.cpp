// *****************************************************************************
// * This file is part of the seaxfer project. It is distributed under         *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "abstract.h"
#include <algorithm>
#include <deque>
#include "glob.h"

using namespace sx;
using namespace sxf;


void AFS::createFolderIfMissingRecursion(const Zstring& folderPath) //throw FileError
{
    auto getItemTypeIfExists2 = [&](const Zstring& itemPath) //throw FileError
    {
        try
        { return getItemTypeIfExists(itemPath); } //throw FileError
        catch (const FileError& e) //need to add context!
        {
            throw FileError(replaceCpy("Cannot create directory %x.", "%x", fmtPath(getDisplayPath(folderPath))),
                            replaceCpy(e.toString(), "\n\n", "\n"));
        }
    };

    try
    {
        //- path most likely already exists => check first
        //- find first existing parent folder (backwards iteration):
        Zstring folderPathEx = folderPath;
        std::deque<Zstring> folderNames;
        for (;;)
        {
            if (const std::optional<ItemType> type = getItemTypeIfExists2(folderPathEx)) //throw FileError
            {
                if (*type == ItemType::file) //obscure, but possible
                    throw SysError(replaceCpy("The name %x is already used by another item.", "%x", fmtPath(getItemName(folderPathEx))));
                break;
            }

            const std::optional<Zstring> parentPath = getParentFolderPath(folderPathEx);
            if (!parentPath)
            {
                if (startsWith(folderPathEx, "/")) //device root not existing!?
                    throw SysError(replaceCpy("Folder %x is not existing.", "%x", fmtPath(folderPathEx)));

                folderNames.push_front(folderPathEx); //first component of a relative path
                folderPathEx.clear();
                break;
            }
            folderNames.push_front(getItemName(folderPathEx));
            folderPathEx = *parentPath;
        }
        //-----------------------------------------------------------

        Zstring folderPathNew = folderPathEx;
        for (const Zstring& folderName : folderNames)
            try
            {
                folderPathNew = appendPath(folderPathNew, folderName);

                createFolderPlain(folderPathNew); //throw FileError, ErrorTargetExisting
            }
            catch (const ErrorTargetExisting&)
            {
                if (getItemTypeIfExists2(folderPathNew) != ItemType::folder) //throw FileError
                    throw;
            }
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy("Cannot create directory %x.", "%x", fmtPath(getDisplayPath(folderPath))), e.toString());
    }
}


std::vector<Zstring> AFS::glob(const Zstring& pattern) //throw FileError
{
    try
    {
        checkGlobPattern(pattern); //throw SysErrorGlobPattern

        std::vector<Zstring> matches{startsWith(pattern, "/") ? Zstring(1, FILE_NAME_SEPARATOR) : Zstring()};

        const std::vector<Zstring> segments = splitCpy(pattern, FILE_NAME_SEPARATOR, SplitOnEmpty::skip);
        if (segments.empty())
            return {};

        for (auto itSeg = segments.begin(); itSeg != segments.end(); ++itSeg)
        {
            const Zstring& segment = *itSeg;
            const bool lastSegment = itSeg + 1 == segments.end();

            std::vector<Zstring> matchesNext;
            for (const Zstring& basePath : matches)
                if (!hasGlobMeta(segment))
                {
                    const Zstring itemPath = appendPath(basePath, unescapeGlob(segment));

                    if (!lastSegment || getItemTypeIfExists(itemPath)) //throw FileError
                        matchesNext.push_back(itemPath); //intermediate folders are checked while listing
                }
                else if (std::optional<std::vector<FolderItem>> items = getFolderContentIfExists(basePath.empty() ? Zstr(".") : basePath)) //throw FileError
                {
                    std::sort(items->begin(), items->end(), [](const FolderItem& lhs, const FolderItem& rhs) { return lhs.itemName < rhs.itemName; });

                    for (const FolderItem& item : *items)
                        if (lastSegment || item.type != ItemType::file)
                            if (matchesGlob(item.itemName, segment)) //throw SysErrorGlobPattern
                                matchesNext.push_back(appendPath(basePath, item.itemName));
                }
            matches.swap(matchesNext);
        }
        return matches;
    }
    catch (const SysError& e) { throw FileError(replaceCpy("Cannot match pattern %x.", "%x", fmtPath(getDisplayPath(pattern))), e.toString()); }
}
