/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * One file (or directory) to be added from the host filesystem.
 */
#ifndef XFERLIB_ADDFILEENTRY_H
#define XFERLIB_ADDFILEENTRY_H

#include "XferLib.h"

namespace XferLib {

class ImportConverter;

/*
 * The data and resource forks may come from different host files, e.g. a
 * plain file and its AppleDouble "._" header, or a pair of NAPS files.
 * The attributes come from whichever file had the best information.
 *
 * The storage directory uses storageDirSep; the storage name is a single
 * component, and may hold characters that aren't legal on the host (it
 * may come from inside an AppleSingle file, or from an unescaped NAPS
 * name).
 */
class XFERLIB_API AddFileEntry {
public:
    typedef enum SourceType {
        kSourceUnknown = 0,
        kSourcePlain,           // file simply holds data
        kSourceAppleSingle,     // file holds one or both forks + attributes
        kSourceAppleDouble,     // ADF header: resource fork + attributes
        kSourceImport,          // file holds data that will be converted
    } SourceType;

    AddFileEntry(void)
        : isDirectory(false),
          hasDataFork(false), dataSource(kSourceUnknown),
          hasRsrcFork(false), rsrcSource(kSourceUnknown),
          hasADFAttribs(false), storageDirSep(kHostDirSep),
          createWhen(kDateNone), modWhen(kDateNone),
          fileType(0), auxType(0), hfsFileType(0), hfsCreator(0),
          access(kFileAccessUnlocked)
        {}

    bool        isDirectory;

    bool        hasDataFork;
    std::string fullDataPath;   // host file holding the data fork
    SourceType  dataSource;

    bool        hasRsrcFork;    // fork may be empty
    std::string fullRsrcPath;   // host file holding the resource fork
    SourceType  rsrcSource;

    // Attributes came from an AppleSingle/AppleDouble header, so the host
    // file's dates and permissions must not replace them.
    bool        hasADFAttribs;

    std::string storageDir;     // relative dir; empty for top level
    char        storageDirSep;
    std::string storageName;

    time_t      createWhen;
    time_t      modWhen;
    uint32_t    fileType;
    uint32_t    auxType;
    uint32_t    hfsFileType;
    uint32_t    hfsCreator;
    uint32_t    access;

    bool HasNonZeroTypes(void) const {
        return fileType != 0 || auxType != 0 || hfsFileType != 0 ||
            hfsCreator != 0;
    }

    // Storage directory and name, joined with storageDirSep.
    std::string GetStoragePath(void) const;

    // Attribute snapshot, for the transfer worker.
    void GetAttribs(FileAttribs* pAttrs) const;

    /*
     * Create a part source that reads the requested fork.  Returns NULL if
     * the entry doesn't have that fork.  The caller owns the result.
     */
    PartSource* CreatePartSource(FilePart part,
        const ImportConverter* pConverter) const;
};

}   // namespace XferLib

#endif /*XFERLIB_ADDFILEENTRY_H*/
