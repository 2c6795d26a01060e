/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Directory synthesis.  When a set of files is copied out of an archive or
 * a subtree of a filesystem, the destination may need directories that
 * weren't explicitly part of the set.  We generate each one exactly once,
 * ahead of the first file that lives in it.
 */
#ifndef XFERLIB_DIRSYNTH_H
#define XFERLIB_DIRSYNTH_H

#include "XferLib.h"
#include <set>
#include <vector>

namespace XferLib {

/*
 * Remembers which directory paths have been generated for one destination.
 *
 * Paths are compared case-sensitively, so "foo" and "FOO" are both
 * generated.  A case-sensitive destination needs both; a case-insensitive
 * one will find the directory already exists the second time.
 */
class XFERLIB_API DirSynth {
public:
    DirSynth(void) {}
    ~DirSynth(void) {}

    void Reset(void) { fSeen.clear(); }

    /*
     * Record a directory path.  Returns true if we hadn't seen it before.
     */
    bool MarkSeen(const std::string& dirPath);
    bool IsSeen(const std::string& dirPath) const {
        return fSeen.find(dirPath) != fSeen.end();
    }

    /*
     * Given the path to a file, append the paths of any ancestor
     * directories we haven't generated yet to "pNewDirs", root first.  The
     * file itself isn't included.  If "dirSep" is '\0' the path has no
     * directories and nothing is added.
     */
    void AddAncestors(const std::string& leafPath, char dirSep,
        std::vector<std::string>* pNewDirs);

    /*
     * Same thing for an entry on a filesystem.  We walk up the parent chain
     * until we reach "pBoundary" (or the volume directory, if that's NULL),
     * and append each unvisited directory entry to "pNewDirs", root first.
     */
    void AddAncestors(const FileEntry* pEntry, const FileEntry* pBoundary,
        char dirSep, std::vector<FileEntry*>* pNewDirs);

    /*
     * Build the path from "pBoundary" down to "pEntry", joining the names
     * with "dirSep".  Neither the boundary nor the volume directory appears
     * in the result.  If the entry isn't underneath the boundary, the path
     * is taken from the volume directory.
     */
    static std::string GetRelativePath(const FileEntry* pEntry,
        const FileEntry* pBoundary, char dirSep);

private:
    DirSynth& operator=(const DirSynth&);
    DirSynth(const DirSynth&);

    std::set<std::string>   fSeen;
};

}   // namespace XferLib

#endif /*XFERLIB_DIRSYNTH_H*/
