/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Classify host files and merge them into logical files.
 *
 * The command line may specify files from different directories.  If the
 * user is in /home/fadden, they might add "foo.txt", "bar/blah.as",
 * "../slurie/stuff.jpg", and "/bin/sh".  We don't want to add everything
 * with full absolute pathnames, but neither do we want to discard the paths
 * from everything that isn't in a subdirectory.  So we convert everything
 * to an absolute path; if it's under the base path we store it relative to
 * that, otherwise we strip the leading '/' and keep the rest.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "AddFileSet.h"
#include "AppleSingle.h"
#include "ImportConverter.h"
#include "PathName.h"
#include <dirent.h>
#include <algorithm>
#include <sys/xattr.h>

/* extended attribute holding the 32-byte Finder info */
#define kFinderInfoXattr    "user.com.apple.FinderInfo"
#define kFinderInfoLen      32


void AddFileSet::Clear(void)
{
    for (size_t i = 0; i < fEntries.size(); i++)
        delete fEntries[i];
    fEntries.clear();
    fEntryMap.clear();
}

const AddFileEntry* AddFileSet::FindEntry(const std::string& key) const
{
    std::map<std::string, AddFileEntry*>::const_iterator it =
        fEntryMap.find(key);
    if (it == fEntryMap.end())
        return NULL;
    return it->second;
}

/*static*/ std::string AddFileSet::NormalizePath(const std::string& basePath,
    const std::string& pathName)
{
    std::string full;
    if (!pathName.empty() && pathName[0] == kHostDirSep)
        full = pathName;
    else
        full = basePath + kHostDirSep + pathName;

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= full.length()) {
        size_t end = full.find(kHostDirSep, start);
        if (end == std::string::npos)
            end = full.length();
        std::string comp = full.substr(start, end - start);
        start = end + 1;

        if (comp.empty() || comp == ".")
            continue;
        if (comp == "..") {
            if (!parts.empty())
                parts.pop_back();
            continue;
        }
        parts.push_back(comp);
    }

    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        result += kHostDirSep;
        result += parts[i];
    }
    if (result.empty())
        result = kHostDirSep;
    return result;
}

XferError AddFileSet::Create(const std::string& basePath,
    const std::vector<std::string>& pathNames, const AddOpts& opts,
    const ImportConverter* pConverter)
{
    XferError xerr = kXferErrNone;
    std::vector<std::string> fullPaths;

    Clear();
    fFindings.clear();
    fOpts = opts;
    fpConverter = pConverter;

    if (basePath.empty() || basePath[0] != kHostDirSep) {
        char cwdBuf[4096];
        if (getcwd(cwdBuf, sizeof(cwdBuf)) == NULL) {
            xerr = ErrnoOrGeneric();
            LOGW("Unable to get current directory (err=%d)", xerr);
            return xerr;
        }
        fBasePath = NormalizePath(cwdBuf, basePath);
    } else {
        fBasePath = NormalizePath("/", basePath);
    }
    LOGD("AddFileSet: base='%s', %d paths, import=%s", fBasePath.c_str(),
        (int) pathNames.size(),
        pConverter == NULL ? "no" : pConverter->GetTag());

    for (size_t i = 0; i < pathNames.size(); i++) {
        std::string fullPath = NormalizePath(fBasePath, pathNames[i]);
        fullPaths.push_back(fullPath);
        xerr = ScanPath(fullPath);
        if (xerr != kXferErrNone)
            goto bail;
    }

    Resolve();

    /*
     * We'll pick up AppleDouble "._" files if they're in a subdirectory, but
     * not if a group of files was selected with shell wildcards.  Look for a
     * "._" file for everything that was explicitly listed.
     */
    if (fOpts.parseADF && fpConverter == NULL)
        ScanForADF(fullPaths);

    if ((fOpts.checkNamed || fOpts.checkFinderInfo) && fpConverter == NULL)
        ScanForHostAttr();

    LOGI("AddFileSet: %d entries from %d findings", (int) fEntries.size(),
        (int) fFindings.size());

bail:
    if (xerr != kXferErrNone)
        Clear();
    return xerr;
}

/*
 * Look at a file or directory, and record what we find.
 */
XferError AddFileSet::ScanPath(const std::string& fullPath)
{
    struct stat sb;
    Finding finding;

    if (stat(fullPath.c_str(), &sb) != 0) {
        LOGW("File not found: '%s'", fullPath.c_str());
        return kXferErrFileNotFound;
    }

    if (S_ISDIR(sb.st_mode)) {
        if (!fOpts.recurse) {
            LOGI("Not descending into '%s'", fullPath.c_str());
            return kXferErrNone;
        }
        // Add an entry for the directory.  This is really only necessary if
        // the directory is empty, but it does allow us to capture the
        // timestamps.
        finding.kind = kFindDirectory;
        finding.key = finding.hostPath = finding.clipPath = fullPath;
        GetHostInfo(&sb, &finding);
        fFindings.push_back(finding);

        return ScanDirectory(fullPath);
    }
    if (!S_ISREG(sb.st_mode)) {
        LOGW("Skipping '%s': not a regular file", fullPath.c_str());
        return kXferErrNone;
    }

    std::string fileName = PathName::GetFileName(fullPath, kHostDirSep);
    finding.hostPath = fullPath;
    GetHostInfo(&sb, &finding);

    if (fpConverter != NULL) {
        /* host file that we're processing as an import */
        finding.kind = kFindImport;
        finding.key = fullPath;
        finding.clipPath = fullPath;
        if (fOpts.stripExt) {
            finding.clipPath = PathName::Combine(
                PathName::GetDirectoryName(fullPath, kHostDirSep),
                fpConverter->StripExtension(fileName), kHostDirSep);
        }
        fFindings.push_back(finding);
        return kXferErrNone;
    }

    if (fOpts.parseADF &&
        fileName.compare(0, strlen(PathName::kADFPrefix),
            PathName::kADFPrefix) == 0)
    {
        if (CheckAppleDouble(fullPath, &finding)) {
            fFindings.push_back(finding);
            return kXferErrNone;
        }
    }

    if (fOpts.parseAS && PathName::EndsWithNoCase(fileName,
            PathName::kASExtension))
    {
        if (CheckAppleSingle(fullPath, &finding)) {
            if (finding.hasData || finding.hasRsrc)
                fFindings.push_back(finding);
            else
                LOGI("Found content-free AppleSingle file: '%s'",
                    fullPath.c_str());
            return kXferErrNone;
        }
    }

    if (fOpts.parseNAPS) {
        std::string storageName;
        uint32_t fileType, auxType;
        bool isHFS;
        char partChar;

        if (PathName::ParseNAPS(fileName, &storageName, &fileType, &auxType,
                &isHFS, &partChar))
        {
            if (partChar == 'i') {
                LOGW("Skipping NAPS disk image: '%s'", fullPath.c_str());
                return kXferErrNone;
            } else if (partChar != '\0' && partChar != 'd' && partChar != 'r') {
                LOGW("Skipping unknown NAPS part: '%s'", fullPath.c_str());
                return kXferErrNone;
            }

            finding.kind = kFindNAPS;
            finding.key = PathName::Combine(
                PathName::GetDirectoryName(fullPath, kHostDirSep),
                storageName, kHostDirSep);
            finding.clipPath = finding.key;
            finding.doUnescape = true;
            finding.part = (partChar == 'r') ? kPartRsrcFork : kPartDataFork;
            if (!isHFS) {
                finding.fileType = fileType;
                finding.auxType = auxType;
            } else {
                finding.hfsFileType = fileType;
                finding.hfsCreator = auxType;
            }
            fFindings.push_back(finding);
            return kXferErrNone;
        }
    }

    /* plain data file */
    finding.kind = kFindPlain;
    finding.key = finding.clipPath = fullPath;
    fFindings.push_back(finding);
    return kXferErrNone;
}

/*
 * Order file names without regard to case.  Names that differ only in case
 * fall back to a plain compare so the order doesn't depend on readdir.
 */
static bool CompareNamesNoCase(const std::string& name1,
    const std::string& name2)
{
    int cmp = strcasecmp(name1.c_str(), name2.c_str());
    if (cmp == 0)
        cmp = strcmp(name1.c_str(), name2.c_str());
    return cmp < 0;
}

/*
 * Grab the list of files in a directory, sort it, and pass each entry to
 * ScanPath.
 */
XferError AddFileSet::ScanDirectory(const std::string& dirName)
{
    XferError xerr = kXferErrNone;
    std::vector<std::string> names;
    DIR* dirp;
    struct dirent* entry;

    LOGD("+++ DESCEND: '%s'", dirName.c_str());

    errno = 0;
    dirp = opendir(dirName.c_str());
    if (dirp == NULL) {
        xerr = ErrnoOrGeneric();
        LOGW("Unable to open directory '%s' (err=%d)", dirName.c_str(), xerr);
        return xerr;
    }

    /* could use readdir_r, but we don't care about reentrancy here */
    while ((entry = readdir(dirp)) != NULL) {
        /* skip the dotsies */
        if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0)
            continue;
        names.push_back(entry->d_name);
    }
    (void) closedir(dirp);

    /* sort the list, ignoring case, then process the files */
    std::sort(names.begin(), names.end(), CompareNamesNoCase);

    for (size_t i = 0; i < names.size(); i++) {
        xerr = ScanPath(PathName::Combine(dirName, names[i], kHostDirSep));
        if (xerr != kXferErrNone)
            break;
    }
    return xerr;
}

void AddFileSet::GetHostInfo(const struct stat* pSb, Finding* pFinding)
{
    pFinding->modWhen = pSb->st_mtime;
    // no birth time in struct stat
    pFinding->createWhen = kDateNone;
    pFinding->isLocked =
        (pSb->st_mode & (S_IWUSR | S_IWGRP | S_IWOTH)) == 0;
}

/*
 * Check for an AppleDouble header file.  On success, fills out the finding
 * and returns true.
 */
bool AddFileSet::CheckAppleDouble(const std::string& fullPath,
    Finding* pFinding)
{
    GFDFile gfd;
    AppleSingle as;

    if (gfd.Open(fullPath.c_str(), true) != kXferErrNone)
        return false;
    if (as.Parse(&gfd, true) != kXferErrNone)
        return false;

    /* the sibling is the file without the leading "._" */
    std::string fileName = PathName::GetFileName(fullPath, kHostDirSep);
    std::string clipPath = PathName::Combine(
        PathName::GetDirectoryName(fullPath, kHostDirSep),
        fileName.substr(strlen(PathName::kADFPrefix)), kHostDirSep);

    pFinding->kind = kFindAppleDouble;
    pFinding->key = pFinding->clipPath = clipPath;
    pFinding->hasRsrc = as.HasRsrcFork();
    pFinding->createWhen = as.GetCreateWhen();
    pFinding->modWhen = as.GetModWhen();
    pFinding->fileType = as.GetFileType();
    pFinding->auxType = as.GetAuxType();
    pFinding->hfsFileType = as.GetHFSFileType();
    pFinding->hfsCreator = as.GetHFSCreator();
    pFinding->access = as.GetAccess();
    return true;
}

/*
 * Check for an AppleSingle file.  On success, fills out the finding and
 * returns true.
 */
bool AddFileSet::CheckAppleSingle(const std::string& fullPath,
    Finding* pFinding)
{
    GFDFile gfd;
    AppleSingle as;

    if (gfd.Open(fullPath.c_str(), true) != kXferErrNone)
        return false;
    if (as.Parse(&gfd, false) != kXferErrNone)
        return false;

    pFinding->kind = kFindAppleSingle;
    pFinding->key = pFinding->clipPath = fullPath;
    pFinding->hasData = as.HasDataFork();
    pFinding->hasRsrc = as.HasRsrcFork();
    pFinding->createWhen = as.GetCreateWhen();
    pFinding->modWhen = as.GetModWhen();
    pFinding->fileType = as.GetFileType();
    pFinding->auxType = as.GetAuxType();
    pFinding->hfsFileType = as.GetHFSFileType();
    pFinding->hfsCreator = as.GetHFSCreator();
    pFinding->access = as.GetAccess();

    if (as.HasFileName()) {
        pFinding->storedName = as.GetFileName();
    } else {
        // Use the filename portion of the pathname, without the ".as".
        std::string name = PathName::GetFileName(fullPath, kHostDirSep);
        if (name.length() > strlen(PathName::kASExtension))
            name.erase(name.length() - strlen(PathName::kASExtension));
        pFinding->storedName = name;
    }
    return true;
}


/*
 * ===========================================================================
 *      Resolution
 * ===========================================================================
 */

AddFileEntry* AddFileSet::FindOrCreate(const std::string& key)
{
    std::map<std::string, AddFileEntry*>::iterator it = fEntryMap.find(key);
    if (it != fEntryMap.end())
        return it->second;

    AddFileEntry* pEntry = new AddFileEntry;
    fEntries.push_back(pEntry);
    fEntryMap[key] = pEntry;
    return pEntry;
}

/*
 * Merge the findings into entries.  Entries appear in the order in which
 * their first finding was made.  Host findings are applied before header
 * findings, so AppleSingle/AppleDouble attributes replace host attributes.
 */
void AddFileSet::Resolve(void)
{
    Clear();

    for (size_t i = 0; i < fFindings.size(); i++)
        (void) FindOrCreate(fFindings[i].key);

    for (size_t i = 0; i < fFindings.size(); i++) {
        if (fFindings[i].kind < kFindAppleSingle)
            ApplyFinding(fFindings[i]);
    }
    for (size_t i = 0; i < fFindings.size(); i++) {
        if (fFindings[i].kind >= kFindAppleSingle)
            ApplyFinding(fFindings[i]);
    }
}

void AddFileSet::ApplyFinding(const Finding& finding)
{
    AddFileEntry* pEntry = FindOrCreate(finding.key);

    switch (finding.kind) {
    case kFindDirectory:
        pEntry->isDirectory = true;
        pEntry->createWhen = finding.createWhen;
        pEntry->modWhen = finding.modWhen;
        SetStoragePath(pEntry, finding.clipPath, "", false);
        break;

    case kFindImport:
        pEntry->hasDataFork = true;
        pEntry->fullDataPath = finding.hostPath;
        pEntry->dataSource = AddFileEntry::kSourceImport;
        if (fpConverter->HasRsrcFork()) {
            pEntry->hasRsrcFork = true;
            pEntry->fullRsrcPath = finding.hostPath;
            pEntry->rsrcSource = AddFileEntry::kSourceImport;
        }
        fpConverter->GetFileTypes(&pEntry->fileType, &pEntry->auxType);
        pEntry->createWhen = finding.createWhen;
        pEntry->modWhen = finding.modWhen;
        if (finding.isLocked)
            pEntry->access = kFileAccessLocked;
        SetStoragePath(pEntry, finding.clipPath, "", false);
        break;

    case kFindPlain:
    case kFindNAPS:
        if (finding.kind == kFindNAPS) {
            if (finding.fileType != 0 || finding.auxType != 0) {
                pEntry->fileType = finding.fileType;
                pEntry->auxType = finding.auxType;
            }
            if (finding.hfsFileType != 0 || finding.hfsCreator != 0) {
                pEntry->hfsFileType = finding.hfsFileType;
                pEntry->hfsCreator = finding.hfsCreator;
            }
        }
        if (finding.part == kPartRsrcFork) {
            if (pEntry->hasRsrcFork)
                LOGW("Resource fork added twice: '%s'", finding.hostPath.c_str());
            pEntry->hasRsrcFork = true;
            pEntry->fullRsrcPath = finding.hostPath;
            pEntry->rsrcSource = AddFileEntry::kSourcePlain;
        } else {
            if (pEntry->hasDataFork)
                LOGW("Data fork added twice: '%s'", finding.hostPath.c_str());
            pEntry->hasDataFork = true;
            pEntry->fullDataPath = finding.hostPath;
            pEntry->dataSource = AddFileEntry::kSourcePlain;
        }
        if (!pEntry->hasADFAttribs) {
            pEntry->createWhen = finding.createWhen;
            pEntry->modWhen = finding.modWhen;
            if (finding.isLocked)
                pEntry->access = kFileAccessLocked;
        }
        SetStoragePath(pEntry, finding.clipPath, "", finding.doUnescape);
        break;

    case kFindAppleSingle:
    case kFindAppleDouble:
        pEntry->createWhen = IsValidDate(finding.createWhen) ?
            finding.createWhen : kDateNone;
        pEntry->modWhen = IsValidDate(finding.modWhen) ?
            finding.modWhen : kDateNone;
        pEntry->fileType = finding.fileType;
        pEntry->auxType = finding.auxType;
        pEntry->hfsFileType = finding.hfsFileType;
        pEntry->hfsCreator = finding.hfsCreator;
        pEntry->access = finding.access;
        pEntry->hasADFAttribs = true;

        if (finding.kind == kFindAppleSingle && finding.hasData) {
            if (pEntry->hasDataFork)
                LOGW("Data fork added twice: '%s'", finding.hostPath.c_str());
            pEntry->hasDataFork = true;
            pEntry->fullDataPath = finding.hostPath;
            pEntry->dataSource = AddFileEntry::kSourceAppleSingle;
        }
        if (finding.hasRsrc) {
            if (pEntry->hasRsrcFork)
                LOGW("Resource fork added twice: '%s'", finding.hostPath.c_str());
            pEntry->hasRsrcFork = true;
            pEntry->fullRsrcPath = finding.hostPath;
            pEntry->rsrcSource = (finding.kind == kFindAppleSingle) ?
                AddFileEntry::kSourceAppleSingle :
                AddFileEntry::kSourceAppleDouble;
        }
        SetStoragePath(pEntry, finding.clipPath, finding.storedName, false);
        break;

    default:
        LOGE("Unexpected finding kind %d", finding.kind);
        DebugBreak();
        break;
    }
}

/*
 * Set the storage directory and name.  "clipPath" is the host path with
 * the leading "._" or trailing NAPS string removed.  "storedName", if not
 * empty, is the name from inside an AppleSingle file, and is used as-is.
 */
void AddFileSet::SetStoragePath(AddFileEntry* pEntry,
    const std::string& clipPath, const std::string& storedName,
    bool doUnescape)
{
    std::string dirName = PathName::GetDirectoryName(clipPath, kHostDirSep);
    std::string fileName = PathName::GetFileName(clipPath, kHostDirSep);
    std::string storageDir;

    if (dirName.compare(0, fBasePath.length(), fBasePath) == 0 &&
        (dirName.length() == fBasePath.length() ||
         dirName[fBasePath.length()] == kHostDirSep ||
         fBasePath == "/"))
    {
        /* save relative path */
        storageDir = dirName.substr(fBasePath.length());
    } else {
        storageDir = dirName;
    }
    /* strip the leading '/' */
    while (!storageDir.empty() && storageDir[0] == kHostDirSep)
        storageDir.erase(0, 1);

    pEntry->storageDir = storageDir;
    pEntry->storageDirSep = kHostDirSep;

    if (!storedName.empty()) {
        pEntry->storageName = storedName;
    } else {
        if (doUnescape) {
            fileName = PathName::UnescapeFileName(fileName, kHostDirSep);
            fileName = PathName::PrintifyControlChars(fileName);
        }
        pEntry->storageName = fileName;
    }
}


/*
 * ===========================================================================
 *      Supplementary scans
 * ===========================================================================
 */

/*
 * Look for a "._" file beside every explicitly-listed plain file that
 * doesn't already have a resource fork or type info.
 */
void AddFileSet::ScanForADF(const std::vector<std::string>& fullPaths)
{
    size_t oldCount = fFindings.size();

    for (size_t i = 0; i < fullPaths.size(); i++) {
        const std::string& fullPath = fullPaths[i];
        const AddFileEntry* pEntry = FindEntry(fullPath);
        if (pEntry == NULL || pEntry->isDirectory) {
            // we used a modified form of the pathname as the key, or it's
            // a directory
            continue;
        }
        if (pEntry->hasRsrcFork || pEntry->fileType != 0 ||
            pEntry->auxType != 0 || pEntry->hfsFileType != 0 ||
            pEntry->hfsCreator != 0)
        {
            // either it's not AppleDouble, or we already found the header
            continue;
        }
        std::string fileName = PathName::GetFileName(fullPath, kHostDirSep);
        if (fileName.compare(0, strlen(PathName::kADFPrefix),
                PathName::kADFPrefix) == 0)
        {
            continue;
        }

        std::string checkPath = PathName::Combine(
            PathName::GetDirectoryName(fullPath, kHostDirSep),
            PathName::kADFPrefix + fileName, kHostDirSep);
        struct stat sb;
        if (stat(checkPath.c_str(), &sb) == 0 && S_ISREG(sb.st_mode)) {
            LOGD("Found AppleDouble companion '%s'", checkPath.c_str());
            (void) ScanPath(checkPath);
        }
    }

    if (fFindings.size() != oldCount)
        Resolve();
}

/*
 * Check every file for host-filesystem attributes, without overriding
 * anything we already have.
 */
void AddFileSet::ScanForHostAttr(void)
{
    for (size_t i = 0; i < fEntries.size(); i++) {
        AddFileEntry* pEntry = fEntries[i];
        if (pEntry->isDirectory || !pEntry->hasDataFork)
            continue;

        if (fOpts.checkFinderInfo && pEntry->hfsFileType == 0 &&
            pEntry->hfsCreator == 0)
        {
            uint8_t fiBuf[kFinderInfoLen];
            ssize_t count = getxattr(pEntry->fullDataPath.c_str(),
                kFinderInfoXattr, fiBuf, sizeof(fiBuf));
            if (count == kFinderInfoLen) {
                uint32_t fileType = GetLongBE(fiBuf);
                uint32_t creator = GetLongBE(fiBuf + 4);
                if (fileType != 0 || creator != 0) {
                    pEntry->hfsFileType = fileType;
                    pEntry->hfsCreator = creator;
                }
            }
        }

        if (fOpts.checkNamed && !pEntry->hasRsrcFork) {
            std::string rsrcPath = pEntry->fullDataPath + PathName::kRsrcForkSuffix;
            struct stat sb;
            if (stat(rsrcPath.c_str(), &sb) == 0 && S_ISREG(sb.st_mode)) {
                pEntry->hasRsrcFork = true;
                pEntry->fullRsrcPath = rsrcPath;
                pEntry->rsrcSource = AddFileEntry::kSourcePlain;
            }
        }
    }
}
