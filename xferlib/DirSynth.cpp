/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Directory synthesis.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "DirSynth.h"


bool DirSynth::MarkSeen(const std::string& dirPath)
{
    return fSeen.insert(dirPath).second;
}

void DirSynth::AddAncestors(const std::string& leafPath, char dirSep,
    std::vector<std::string>* pNewDirs)
{
    if (dirSep == '\0')
        return;

    /*
     * Each separator ends a directory name.  Walk forward so the root comes
     * out first.  Leading and doubled separators would give us empty
     * names, so skip those.
     */
    size_t posn = 0;
    while (true) {
        size_t sepPosn = leafPath.find(dirSep, posn);
        if (sepPosn == std::string::npos)
            break;
        if (sepPosn != posn) {
            std::string dirPath = leafPath.substr(0, sepPosn);
            if (MarkSeen(dirPath)) {
                LOGV("  synth dir '%s'", dirPath.c_str());
                pNewDirs->push_back(dirPath);
            }
        }
        posn = sepPosn + 1;
    }
}

void DirSynth::AddAncestors(const FileEntry* pEntry,
    const FileEntry* pBoundary, char dirSep, std::vector<FileEntry*>* pNewDirs)
{
    std::vector<FileEntry*> chain;

    FileEntry* pDir = pEntry->GetParent();
    while (pDir != NULL && pDir != pBoundary && pDir->GetParent() != NULL) {
        chain.push_back(pDir);
        pDir = pDir->GetParent();
    }

    /* chain is leaf-first; emit root-first */
    for (long idx = (long) chain.size() - 1; idx >= 0; idx--) {
        std::string dirPath = GetRelativePath(chain[idx], pBoundary, dirSep);
        if (MarkSeen(dirPath)) {
            LOGV("  synth dir '%s'", dirPath.c_str());
            pNewDirs->push_back(chain[idx]);
        }
    }
}

/*static*/ std::string DirSynth::GetRelativePath(const FileEntry* pEntry,
    const FileEntry* pBoundary, char dirSep)
{
    std::vector<const char*> names;
    const FileEntry* pCur = pEntry;

    while (pCur != NULL && pCur != pBoundary && pCur->GetParent() != NULL) {
        names.push_back(pCur->GetFileName());
        pCur = pCur->GetParent();
    }

    std::string path;
    for (long idx = (long) names.size() - 1; idx >= 0; idx--) {
        path += names[idx];
        if (idx != 0 && dirSep != '\0')
            path += dirSep;
    }
    return path;
}
