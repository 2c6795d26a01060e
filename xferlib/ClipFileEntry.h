/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * One fork of one file in a planned transfer.
 */
#ifndef XFERLIB_CLIPFILEENTRY_H
#define XFERLIB_CLIPFILEENTRY_H

#include "XferLib.h"

namespace XferLib {

class AddFileEntry;
class ImportConverter;

/*
 * A file with both forks is represented by two items, data fork first, with
 * identical values in attribs.fullPathName.  The workers pair them up by
 * looking at the next item; there's no explicit link.
 *
 * Directories that weren't in the source (e.g. the parents of an archive
 * entry) have a NULL pEntry.  Items for files being added from the host
 * have a NULL pEntry and a non-NULL pAddEntry.
 *
 * The attributes are a snapshot taken when the plan was built.  A resource
 * fork that should be treated as absent has attribs.rsrcLength == -1.
 *
 * None of the pointers are owned by the item.
 */
class XFERLIB_API ClipFileEntry {
public:
    ClipFileEntry(void)
        : pEntry(NULL), pMacZipEntry(NULL), pAddEntry(NULL),
          pConverter(NULL), part(kPartUnknown), preserve(kPreserveUnknown),
          fsType(kFSUnknown)
        {}

    XferContainer   container;      // where the source lives
    FileEntry*      pEntry;         // source entry
    FileEntry*      pMacZipEntry;   // MacZip "._" header entry, if paired
    const AddFileEntry* pAddEntry;  // host file
    const ImportConverter* pConverter;

    FilePart        part;           // data, rsrc, or raw data
    FileAttribs     attribs;
    std::string     extractPath;    // host path; set for host-bound items
    PreserveMode    preserve;       // kPreserveUnknown for native forks
    FileSystemType  fsType;         // source filesystem, for DOS text

    bool IsDataPart(void) const { return part != kPartRsrcFork; }
    bool IsDirectory(void) const { return attribs.isDirectory; }
    bool HasRsrcFork(void) const { return attribs.rsrcLength >= 0; }

    /*
     * Create a source for the bytes this item represents.  For host-bound
     * items that means the generated AppleSingle or AppleDouble file when
     * the preservation mode calls for one.  Returns NULL for directories.
     * The caller owns the result.
     */
    PartSource* CreatePartSource(void) const;

private:
    PartSource* CreateForkSource(FilePart whichPart) const;
};

}   // namespace XferLib

#endif /*XFERLIB_CLIPFILEENTRY_H*/
