/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Determine the set of host files to add to an archive or disk image.
 *
 * Host files may carry Apple II and Mac attributes in several ways:
 * AppleSingle (".as"), AppleDouble ("._" header beside the plain file),
 * NAPS hex strings in the file name ("FOO#062000"), or the host's own
 * extended attributes and named forks.  We figure out which applies to each
 * file and merge the pieces into one entry per logical file.
 *
 * This is done in two passes.  The first looks at every path and records
 * what it found, opening AppleSingle/AppleDouble files to confirm their
 * contents.  The second merges the findings into entries, applying header
 * attributes after host attributes so that they always win, whatever order
 * the files were found in.
 *
 * We don't keep files open, because there might be a lot of them.
 */
#ifndef XFERLIB_ADDFILESET_H
#define XFERLIB_ADDFILESET_H

#include "XferLib.h"
#include "AddFileEntry.h"
#include <sys/stat.h>
#include <vector>
#include <map>

namespace XferLib {

class ImportConverter;

class XFERLIB_API AddFileSet {
public:
    /*
     * Options that affect adding files.
     */
    class AddOpts {
    public:
        AddOpts(void)
            : parseADF(true), parseAS(true), parseNAPS(true),
              checkNamed(false), checkFinderInfo(false), recurse(true),
              stripExt(true)
            {}

        bool    parseADF;           // unpack AppleDouble "._" files
        bool    parseAS;            // unpack AppleSingle ".as" files
        bool    parseNAPS;          // parse and remove NAPS strings
        bool    checkNamed;         // look for "/..namedfork/rsrc"
        bool    checkFinderInfo;    // look for FinderInfo xattr
        bool    recurse;            // descend into directories
        bool    stripExt;           // strip import extensions (".txt")
    };

    AddFileSet(void) : fpConverter(NULL) {}
    ~AddFileSet(void) { Clear(); }

    /*
     * Build the set.  Relative paths in "pathNames" are relative to
     * "basePath", and so are the storage paths of files under it.  If
     * "pConverter" is non-NULL, every file is an import; we don't take
     * ownership.
     *
     * Returns kXferErrFileNotFound if a listed path doesn't exist.
     */
    XferError Create(const std::string& basePath,
        const std::vector<std::string>& pathNames, const AddOpts& opts,
        const ImportConverter* pConverter);

    long GetCount(void) const { return (long) fEntries.size(); }
    const AddFileEntry* GetEntry(long idx) const {
        if (idx < 0 || idx >= (long) fEntries.size())
            return NULL;
        return fEntries[idx];
    }
    // Find an entry by its key (host path with decorations removed).
    const AddFileEntry* FindEntry(const std::string& key) const;

    const ImportConverter* GetConverter(void) const { return fpConverter; }
    const std::string& GetBasePath(void) const { return fBasePath; }

    /*
     * Convert a path to a canonical absolute path.  This is purely lexical:
     * "." and ".." components and repeated separators are removed, and
     * symbolic links are left alone.
     */
    static std::string NormalizePath(const std::string& basePath,
        const std::string& pathName);

private:
    AddFileSet& operator=(const AddFileSet&);
    AddFileSet(const AddFileSet&);

    typedef enum FindingKind {
        kFindUnknown = 0,
        kFindDirectory,
        kFindPlain,
        kFindImport,
        kFindNAPS,
        kFindAppleSingle,       // header findings start here
        kFindAppleDouble,
    } FindingKind;

    /*
     * What we learned about one host path.
     */
    struct Finding {
        Finding(void)
            : kind(kFindUnknown), doUnescape(false), part(kPartDataFork),
              hasData(false), hasRsrc(false), isLocked(false),
              createWhen(kDateNone), modWhen(kDateNone),
              fileType(0), auxType(0), hfsFileType(0), hfsCreator(0),
              access(kFileAccessUnlocked)
            {}

        FindingKind kind;
        std::string key;        // path with preservation decorations removed
        std::string hostPath;   // the file we actually found
        std::string clipPath;   // path used for the storage name
        std::string storedName; // name stored in an AppleSingle file
        bool        doUnescape; // storage name needs NAPS unescaping
        FilePart    part;       // NAPS: which fork this file holds
        bool        hasData;    // AS: forks present
        bool        hasRsrc;    // AS/ADF
        bool        isLocked;   // host file is read-only
        time_t      createWhen;
        time_t      modWhen;
        uint32_t    fileType;
        uint32_t    auxType;
        uint32_t    hfsFileType;
        uint32_t    hfsCreator;
        uint32_t    access;
    };

    void Clear(void);
    XferError ScanPath(const std::string& fullPath);
    XferError ScanDirectory(const std::string& dirName);
    bool CheckAppleDouble(const std::string& fullPath, Finding* pFinding);
    bool CheckAppleSingle(const std::string& fullPath, Finding* pFinding);
    void GetHostInfo(const struct stat* pSb, Finding* pFinding);

    void Resolve(void);
    AddFileEntry* FindOrCreate(const std::string& key);
    void ApplyFinding(const Finding& finding);
    void SetStoragePath(AddFileEntry* pEntry, const std::string& clipPath,
        const std::string& storedName, bool doUnescape);

    void ScanForADF(const std::vector<std::string>& fullPaths);
    void ScanForHostAttr(void);

    AddOpts                 fOpts;
    const ImportConverter*  fpConverter;
    std::string             fBasePath;

    std::vector<Finding>    fFindings;
    std::vector<AddFileEntry*> fEntries;           // in first-seen order
    std::map<std::string, AddFileEntry*> fEntryMap;
};

}   // namespace XferLib

#endif /*XFERLIB_ADDFILESET_H*/
