/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Plan a transfer.  Takes a set of entries from an archive, a filesystem,
 * or the host, and produces the list of fork-sized items that the workers
 * replay into the destination.
 */
#ifndef XFERLIB_CLIPFILESET_H
#define XFERLIB_CLIPFILESET_H

#include "XferLib.h"
#include "ClipFileEntry.h"
#include "DirSynth.h"
#include <set>
#include <vector>

namespace XferLib {

class AddFileSet;

/*
 * Two lists are generated.  The "xfer" list holds the forks as they are,
 * for copying into another archive or filesystem.  The "foreign" list
 * holds what we'd write to the host filesystem with the selected
 * preservation mode: names are converted to host names, and a file may
 * become an AppleSingle file, a data file plus an AppleDouble header, a
 * pair of NAPS-named files, and so on.
 *
 * The source must not be modified while the set is in use.
 */
class XFERLIB_API ClipFileSet {
public:
    class Options {
    public:
        Options(void)
            : preserve(kPreserveNone), stripPaths(false), macZip(false),
              rawMode(false)
            {}

        PreserveMode preserve;      // for the foreign list
        bool    stripPaths;         // keep only the file name
        bool    macZip;             // pair up "__MACOSX/" header entries
        bool    rawMode;            // open DOS files without the length clip
    };

    typedef std::vector<ClipFileEntry> ItemList;

    ClipFileSet(void) {}
    ~ClipFileSet(void) {}

    /*
     * Plan a transfer of entries from an archive.  Directory entries are
     * ignored; the directories that files live in are generated as needed.
     */
    XferError CreateFromArchive(Archive* pArchive,
        const std::vector<FileEntry*>& entries, const Options& opts);

    /*
     * Plan a transfer of entries from a filesystem.  Directories are
     * descended into.  Paths are relative to "pBaseDir", which may be NULL
     * to indicate the volume directory.
     */
    XferError CreateFromFileSystem(FileSystem* pFileSystem,
        const std::vector<FileEntry*>& entries, FileEntry* pBaseDir,
        const Options& opts);

    /*
     * Plan an add of host files.  Only the xfer list is generated.  The
     * set must outlive this object.
     */
    XferError CreateFromAddSet(const AddFileSet& addSet, const Options& opts);

    const ItemList& GetXferEntries(void) const { return fXferEntries; }
    const ItemList& GetForeignEntries(void) const { return fForeignEntries; }

    /*
     * Generate the host-bound items for one file, according to the
     * preservation mode.  "proto" has everything filled in except the
     * part, the mode, and the final extract path.
     */
    static void GenerateForeignItems(const ClipFileEntry& proto,
        PreserveMode preserve, bool hasDataFork, ItemList* pList);

private:
    ClipFileSet& operator=(const ClipFileSet&);
    ClipFileSet(const ClipFileSet&);

    void Clear(void);
    void AddDirItems(const ClipFileEntry& proto);
    void AddFileItems(const ClipFileEntry& proto, bool hasDataFork);
    std::string GetExtractPath(const std::string& pathName, char dirSep,
        bool isDirectory) const;
    XferError GetMacZipAttribs(const XferContainer& container,
        FileEntry* pHeaderEntry, FileAttribs* pAttrs);
    void WalkFileSystem(FileSystem* pFileSystem, FileEntry* pEntry,
        const FileEntry* pBoundary, const XferContainer& container);

    Options     fOpts;
    DirSynth    fDirSynth;
    std::set<const FileEntry*> fVisited;
    ItemList    fXferEntries;
    ItemList    fForeignEntries;
};

}   // namespace XferLib

#endif /*XFERLIB_CLIPFILESET_H*/
