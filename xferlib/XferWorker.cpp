/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Add planned items to an archive or filesystem.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "XferWorker.h"
#include "PartSource.h"
#include "PathName.h"

/*
 * Case-insensitive ordering, for the archive duplicate check.  Archives
 * are generally case-sensitive, but two entries that differ only in case
 * cause trouble when extracted to most hosts.
 */
struct NoCaseLess {
    bool operator()(const std::string& lhs, const std::string& rhs) const {
        return strcasecmp(lhs.c_str(), rhs.c_str()) < 0;
    }
};
typedef std::map<std::string, FileEntry*, NoCaseLess> DupMap;


bool XferWorker::IsCancelPending(void)
{
    CallbackFacts facts(CallbackFacts::kReasonQueryCancel);
    return Notify(facts) == CallbackFacts::kResultCancel;
}

/*
 * Report a failure to the application.  Always returns kXferFailed.
 */
XferStatus XferWorker::Fail(XferError xerr, const std::string& msg)
{
    fLastError = xerr;

    CallbackFacts facts(CallbackFacts::kReasonFailure);
    facts.failMessage = msg;
    facts.failMessage += ": ";
    facts.failMessage += XferStrError(xerr);
    LOGW("Xfer failed: %s", facts.failMessage.c_str());
    (void) Notify(facts);
    return kXferFailed;
}

/*
 * Find the parts for the item at *pIdx.  If the file has both forks, the
 * data fork comes first and the resource fork is in the following item,
 * with an identical path.  *pIdx is advanced past the resource fork item
 * if we use it.
 */
void XferWorker::FindParts(const ClipFileSet::ItemList& items, size_t* pIdx,
    const ClipFileEntry** ppDataPart, const ClipFileEntry** ppRsrcPart)
{
    const ClipFileEntry& item = items[*pIdx];

    *ppDataPart = *ppRsrcPart = NULL;
    if (item.part == kPartRsrcFork)
        *ppRsrcPart = &item;
    else
        *ppDataPart = &item;

    if (*ppRsrcPart == NULL && *pIdx + 1 < items.size()) {
        const ClipFileEntry& checkItem = items[*pIdx + 1];
        if (checkItem.part == kPartRsrcFork &&
            checkItem.attribs.fullPathName == item.attribs.fullPathName)
        {
            *ppRsrcPart = &checkItem;
            (*pIdx)++;
        }
    }
}

/*static*/ std::string XferWorker::AdjustArchivePath(const Archive* pArchive,
    const std::string& storageDir, char dirSep, const std::string& storageName)
{
    char arcSep = pArchive->GetCharacteristics().defaultDirSep;
    std::string result;

    if (arcSep != '\0' && dirSep != '\0' && !storageDir.empty()) {
        size_t start = 0;
        while (start < storageDir.length()) {
            size_t end = storageDir.find(dirSep, start);
            if (end == std::string::npos)
                end = storageDir.length();
            std::string component = storageDir.substr(start, end - start);
            start = end + 1;
            if (component.empty())
                continue;
            result += pArchive->AdjustFileName(component);
            result += arcSep;
        }
    }
    result += pArchive->AdjustFileName(storageName);

    if (!pArchive->CheckStorageName(result)) {
        LOGI("Archive rejected storage name '%s'", result.c_str());
        return std::string();
    }
    return result;
}

/*
 * Have the part source tell the application when the archive starts
 * reading it, which happens during the commit.
 */
void XferWorker::SetProgressHook(PartSource* pSource, const ClipFileEntry& item,
    const std::string& storagePath, char storageSep, int progressPerc)
{
    CallbackFacts facts(CallbackFacts::kReasonProgress,
        item.attribs.fullPathName, item.attribs.fullPathSep);
    facts.newPathName = storagePath;
    facts.newDirSep = storageSep;
    facts.progressPercent = progressPerc;
    facts.part = item.part;
    facts.dosConv = CallbackFacts::kDOSConvNone;
    pSource->SetProgressHook(fFunc, fState, facts);
}


/*
 * ===========================================================================
 *      Archive target
 * ===========================================================================
 */

XferStatus XferWorker::AddToArchive(const ClipFileSet::ItemList& items,
    Archive* pArchive)
{
    const Archive::Characteristics& chars = pArchive->GetCharacteristics();
    bool doMacZip = fOpts.macZip && chars.isMacZipCapable;
    bool canRsrcFork = chars.hasResourceForks || doMacZip;
    bool doStripPaths = fOpts.stripPaths || chars.defaultDirSep == '\0';
    CompressionFormat fmt =
        fOpts.doCompress ? kCompressDefault : kCompressUncompressed;
    XferError xerr;

    fLastError = kXferErrNone;
    if (!chars.canWrite || pArchive->IsDubious())
        return Fail(kXferErrWriteProtected, "Target archive is read-only");

    /*
     * Generate a list of archive contents, for the duplicate check.  The
     * archive might already have duplicates, so the last one wins.
     */
    DupMap dupCheck;
    long entryCount = pArchive->GetEntryCount();
    for (long ent = 0; ent < entryCount; ent++) {
        FileEntry* pEntry = pArchive->GetEntry(ent);
        dupCheck[pEntry->GetPathName()] = pEntry;
    }

    for (size_t idx = 0; idx < items.size(); idx++) {
        if (IsCancelPending()) {
            LOGI("Cancelled before item %d", (int) idx);
            return kXferCancelled;
        }

        const ClipFileEntry& item = items[idx];
        if (item.IsDirectory()) {
            // archives don't get explicit directory entries
            continue;
        }

        size_t dataIdx = idx;       // for the progress counter
        const ClipFileEntry* pDataPart;
        const ClipFileEntry* pRsrcPart;
        FindParts(items, &idx, &pDataPart, &pRsrcPart);

        if (pDataPart == NULL && !canRsrcFork) {
            /* nothing but a resource fork, and we can't store those */
            CallbackFacts facts(CallbackFacts::kReasonResourceForkIgnored,
                item.attribs.fullPathName, item.attribs.fullPathSep);
            facts.part = kPartRsrcFork;
            if (Notify(facts) == CallbackFacts::kResultCancel)
                return kXferCancelled;
            continue;
        }

        std::string storageDir;
        if (!doStripPaths) {
            storageDir = PathName::GetDirectoryName(item.attribs.fullPathName,
                item.attribs.fullPathSep);
        }
        std::string storageName = PathName::GetFileName(
            item.attribs.fullPathName, item.attribs.fullPathSep);
        std::string adjPath = AdjustArchivePath(pArchive, storageDir,
            item.attribs.fullPathSep, storageName);
        if (adjPath.empty()) {
            /* assume the whole thing is too long */
            CallbackFacts facts(CallbackFacts::kReasonPathTooLong,
                PathName::Combine(storageDir, storageName,
                    item.attribs.fullPathSep),
                item.attribs.fullPathSep);
            if (Notify(facts) == CallbackFacts::kResultSkip)
                continue;
            return kXferCancelled;
        }

        /*
         * Check for a duplicate.  If it exists, ask the user if they want
         * to overwrite or skip.
         */
        FileEntry* pDupEntry = NULL;
        DupMap::iterator dupIter = dupCheck.find(adjPath);
        if (dupIter != dupCheck.end()) {
            pDupEntry = dupIter->second;

            CallbackFacts facts(CallbackFacts::kReasonFileNameExists,
                pDupEntry->GetPathName(), pDupEntry->GetFssep());
            facts.origModWhen = pDupEntry->GetModWhen();
            facts.newPathName = item.attribs.fullPathName;
            facts.newDirSep = item.attribs.fullPathSep;
            facts.newModWhen = item.attribs.modWhen;
            CallbackFacts::Result result = Notify(facts);
            if (result == CallbackFacts::kResultSkip)
                continue;
            if (result != CallbackFacts::kResultOverwrite)
                return kXferCancelled;
        }

        if (pDupEntry != NULL) {
            if (doMacZip) {
                std::string oldHeader = PathName::GenerateMacZipName(
                    pDupEntry->GetPathName(), pDupEntry->GetFssep());
                FileEntry* pOldHeader = oldHeader.empty() ? NULL :
                    pArchive->FindEntry(oldHeader.c_str());
                if (pOldHeader != NULL) {
                    dupCheck.erase(oldHeader);
                    xerr = pArchive->DeleteRecord(pOldHeader);
                    if (xerr != kXferErrNone)
                        return Fail(xerr, "Unable to delete '" + oldHeader + "'");
                }
            }
            std::string dupName(pDupEntry->GetPathName());
            dupCheck.erase(dupIter);
            xerr = pArchive->DeleteRecord(pDupEntry);
            if (xerr != kXferErrNone)
                return Fail(xerr, "Unable to delete '" + dupName + "'");
        }

        FileEntry* pNewEntry = NULL;
        xerr = pArchive->CreateRecord(adjPath.c_str(), chars.defaultDirSep,
            &pNewEntry);
        if (xerr != kXferErrNone)
            return Fail(xerr, "Unable to create record '" + adjPath + "'");

        FileAttribs attrs(item.attribs);
        attrs.fullPathName = adjPath;
        attrs.fullPathSep = chars.defaultDirSep;
        attrs.fileNameOnly = PathName::GetFileName(adjPath, chars.defaultDirSep);
        attrs.CopyAttrsTo(pNewEntry);

        int progressPerc = (int) ((100 * dataIdx) / items.size());
        if (pDataPart != NULL) {
            // TODO: DOS text conversion for archives
            PartSource* pSource = pDataPart->CreatePartSource();
            if (pSource == NULL)
                return Fail(kXferErrNotReady,
                    "Unable to open source for '" + item.attribs.fullPathName + "'");
            SetProgressHook(pSource, *pDataPart, adjPath, chars.defaultDirSep,
                progressPerc);
            xerr = pArchive->AddPart(pNewEntry, pDataPart->part, pSource, fmt);
            if (xerr != kXferErrNone)
                return Fail(xerr, "Unable to add data fork to '" + adjPath + "'");
        }

        progressPerc = (int) ((100 * idx) / items.size());
        if (doMacZip) {
            if (pDataPart == NULL) {
                /* AppleDouble wants both halves, so add an empty data fork */
                xerr = pArchive->AddPart(pNewEntry, kPartDataFork,
                    new EmptyPartSource, fmt);
                if (xerr != kXferErrNone)
                    return Fail(xerr, "Unable to add data fork to '" + adjPath + "'");
            }

            // Create the "header" file if there's a resource fork, or if we
            // just need to preserve the file type info.
            if (pRsrcPart != NULL) {
                xerr = AddMacZipRecord(pArchive, *pRsrcPart, true, adjPath,
                    progressPerc, fmt);
            } else if (item.attribs.HasTypeInfo()) {
                xerr = AddMacZipRecord(pArchive, item, false, adjPath,
                    progressPerc, fmt);
            }
            if (xerr != kXferErrNone)
                return Fail(xerr, "Unable to add MacZip header for '" + adjPath + "'");
        } else if (pRsrcPart != NULL) {
            if (!canRsrcFork) {
                CallbackFacts facts(CallbackFacts::kReasonResourceForkIgnored,
                    item.attribs.fullPathName, item.attribs.fullPathSep);
                facts.part = kPartRsrcFork;
                if (Notify(facts) == CallbackFacts::kResultCancel)
                    return kXferCancelled;
            } else {
                PartSource* pSource = pRsrcPart->CreatePartSource();
                if (pSource == NULL)
                    return Fail(kXferErrNotReady,
                        "Unable to open source for '" + item.attribs.fullPathName + "'");
                SetProgressHook(pSource, *pRsrcPart, adjPath,
                    chars.defaultDirSep, progressPerc);
                xerr = pArchive->AddPart(pNewEntry, kPartRsrcFork, pSource, fmt);
                if (xerr != kXferErrNone)
                    return Fail(xerr, "Unable to add resource fork to '" + adjPath + "'");
            }
        }
    }

    return kXferOK;
}

/*
 * Add a "__MACOSX/.../._name" record, holding an AppleDouble header with
 * the file's types and (if "withRsrc" is set) its resource fork.  The
 * header is generated when the archive reads it.
 */
XferError XferWorker::AddMacZipRecord(Archive* pArchive,
    const ClipFileEntry& item, bool withRsrc, const std::string& adjPath,
    int progressPerc, CompressionFormat fmt)
{
    char arcSep = pArchive->GetCharacteristics().defaultDirSep;
    std::string headerPath = PathName::GenerateMacZipName(adjPath, arcSep);
    FileEntry* pHeaderEntry = NULL;
    XferError xerr;

    xerr = pArchive->CreateRecord(headerPath.c_str(), arcSep, &pHeaderEntry);
    if (xerr != kXferErrNone)
        return xerr;
    if (IsValidDate(item.attribs.modWhen))
        pHeaderEntry->SetModWhen(item.attribs.modWhen);     // match the file

    PartSource* pRsrcSource = withRsrc ? item.CreatePartSource() : NULL;
    PartSource* pSource = new GeneratedASPartSource(item.attribs,
        PathName::GetFileName(adjPath, arcSep), NULL, pRsrcSource, true);
    SetProgressHook(pSource, item, headerPath, arcSep, progressPerc);
    return pArchive->AddPart(pHeaderEntry, kPartDataFork, pSource, fmt);
}


/*
 * ===========================================================================
 *      Filesystem target
 * ===========================================================================
 */

XferStatus XferWorker::AddToFileSystem(const ClipFileSet::ItemList& items,
    FileSystem* pFileSystem, FileEntry* pTargetDir)
{
    const FileSystem::Characteristics& chars =
        pFileSystem->GetCharacteristics();
    bool canRsrcFork = chars.hasResourceForks;
    bool doStripPaths = fOpts.stripPaths || !chars.isHierarchical;
    bool targetIsDOS = IsDOSFlavored(chars.fsType);
    XferError xerr;

    fLastError = kXferErrNone;
    if (pFileSystem->IsReadOnly()) {
        return Fail(kXferErrWriteProtected, std::string("Target filesystem is read-only") +
            (pFileSystem->IsDubious() ? " (damaged)" : ""));
    }

    FileEntry* pTargetDirEnt = pTargetDir;
    if (pTargetDirEnt == NULL)
        pTargetDirEnt = pFileSystem->GetVolDirEntry();
    if (pTargetDirEnt == NULL || !pTargetDirEnt->IsDirectory())
        return Fail(kXferErrInvalidArg, "Target is not a directory");

    for (size_t idx = 0; idx < items.size(); idx++) {
        if (IsCancelPending()) {
            LOGI("Cancelled before item %d", (int) idx);
            return kXferCancelled;
        }

        const ClipFileEntry& item = items[idx];
        size_t dataIdx = idx;
        const ClipFileEntry* pDataPart;
        const ClipFileEntry* pRsrcPart;
        FindParts(items, &idx, &pDataPart, &pRsrcPart);

        if (doStripPaths && item.IsDirectory())
            continue;

        if (pDataPart == NULL && !canRsrcFork) {
            CallbackFacts facts(CallbackFacts::kReasonResourceForkIgnored,
                item.attribs.fullPathName, item.attribs.fullPathSep);
            facts.part = kPartRsrcFork;
            if (Notify(facts) == CallbackFacts::kResultCancel)
                return kXferCancelled;
            continue;
        }
        if (pRsrcPart != NULL && !canRsrcFork) {
            CallbackFacts facts(CallbackFacts::kReasonResourceForkIgnored,
                item.attribs.fullPathName, item.attribs.fullPathSep);
            facts.part = kPartRsrcFork;
            if (Notify(facts) == CallbackFacts::kResultCancel)
                return kXferCancelled;
        }

        /*
         * Find the destination directory for this file, creating
         * directories as needed.
         */
        std::string storageDir;
        if (!doStripPaths) {
            storageDir = PathName::GetDirectoryName(item.attribs.fullPathName,
                item.attribs.fullPathSep);
        }
        std::string storageName = PathName::GetFileName(
            item.attribs.fullPathName, item.attribs.fullPathSep);

        FileEntry* pSubDir = NULL;
        xerr = pFileSystem->CreateSubdirectories(pTargetDirEnt, storageDir,
            item.attribs.fullPathSep, &pSubDir);
        if (xerr != kXferErrNone)
            return Fail(xerr, "Unable to create directories for '" +
                item.attribs.fullPathName + "'");

        std::string adjName = pFileSystem->AdjustFileName(storageName);
        FileEntry* pNewEntry = pFileSystem->FindFileEntry(pSubDir,
            adjName.c_str());
        if (pNewEntry != NULL) {
            if (fOpts.isSameProcess && pNewEntry == item.pEntry)
                return Fail(kXferErrSelfOverwrite,
                    "Cannot overwrite '" + adjName + "' with itself");

            if (item.IsDirectory() && !pNewEntry->IsDirectory()) {
                return Fail(kXferErrTypeMismatch, "Cannot replace non-directory '" +
                    adjName + "' with directory");
            } else if (!item.IsDirectory() && pNewEntry->IsDirectory()) {
                return Fail(kXferErrTypeMismatch, "Cannot replace directory '" +
                    adjName + "' with non-directory");
            } else if (!item.IsDirectory()) {
                /* file exists; skip or overwrite */
                CallbackFacts facts(CallbackFacts::kReasonFileNameExists,
                    pNewEntry->GetPathName(), pNewEntry->GetFssep());
                facts.origModWhen = pNewEntry->GetModWhen();
                facts.newPathName = item.attribs.fullPathName;
                facts.newDirSep = item.attribs.fullPathSep;
                facts.newModWhen = item.attribs.modWhen;
                CallbackFacts::Result result = Notify(facts);
                if (result == CallbackFacts::kResultSkip)
                    continue;
                if (result != CallbackFacts::kResultOverwrite)
                    return kXferCancelled;

                if (pNewEntry->IsDamaged())
                    return Fail(kXferErrBadFile,
                        "Cannot overwrite damaged file '" + adjName + "'");

                // We could merge the new forks into the existing file, but
                // for now we just delete it and start over.
                xerr = pFileSystem->DeleteFile(pNewEntry);
                if (xerr != kXferErrNone)
                    return Fail(xerr, "Unable to delete '" + adjName + "'");
                pNewEntry = NULL;
            }
            /* else adding a directory that already exists */
        }

        if (pNewEntry == NULL) {
            FileSystem::CreateParms parms;
            parms.mode = FileSystem::kCreateFile;
            item.attribs.GetProDOSTypes(&parms.fileType, &parms.auxType);
            if (pRsrcPart != NULL && canRsrcFork) {
                parms.mode = FileSystem::kCreateExtended;
            } else if (item.IsDirectory()) {
                parms.mode = FileSystem::kCreateDirectory;
                parms.fileType = kFileTypeDIR;
                parms.auxType = 0;
            }

            xerr = pFileSystem->CreateFile(pSubDir, adjName.c_str(), &parms,
                &pNewEntry);
            if (xerr != kXferErrNone)
                return Fail(xerr, "Unable to create '" + adjName + "'");
        }

        if (item.IsDirectory())
            continue;

        /*
         * Copy the forks.  If anything goes wrong, remove the partial file.
         */
        for (int pass = 0; pass < 2; pass++) {
            const ClipFileEntry* pPart = (pass == 0) ? pDataPart : pRsrcPart;
            if (pPart == NULL || (pass == 1 && !canRsrcFork))
                continue;

            int progressPerc = (int) ((100 * (pass == 0 ? dataIdx : idx)) /
                items.size());
            CallbackFacts::DOSConvMode dosConv = (pass == 0) ?
                GetDOSConvMode(*pPart, targetIsDOS) : CallbackFacts::kDOSConvNone;

            GenericFD* pGFD = NULL;
            xerr = pFileSystem->OpenFile(pNewEntry, false, pPart->part, &pGFD);
            if (xerr == kXferErrNone) {
                xerr = CopyFilePart(*pPart, progressPerc, pNewEntry->GetPathName(),
                    pNewEntry->GetFssep(), dosConv, pGFD);
                XferError cerr = pGFD->Close();
                if (xerr == kXferErrNone)
                    xerr = cerr;
                delete pGFD;
            }
            if (xerr != kXferErrNone) {
                XferError derr = pFileSystem->DeleteFile(pNewEntry);
                if (derr != kXferErrNone)
                    LOGW("Unable to remove partial file '%s': %s",
                        adjName.c_str(), XferStrError(derr));
                return Fail(xerr, "Unable to copy '" +
                    item.attribs.fullPathName + "'");
            }
        }

        /* set types, dates, and access flags */
        FileAttribs attrs(item.attribs);
        attrs.fileNameOnly = adjName;
        attrs.CopyAttrsTo(pNewEntry);
        xerr = pNewEntry->SaveChanges();
        if (xerr != kXferErrNone)
            return Fail(xerr, "Unable to set attributes on '" + adjName + "'");
    }

    return kXferOK;
}

CallbackFacts::DOSConvMode XferWorker::GetDOSConvMode(const ClipFileEntry& item,
    bool targetIsDOS) const
{
    if (!fOpts.convertDOSText || item.attribs.fileType != kFileTypeTXT)
        return CallbackFacts::kDOSConvNone;

    bool srcIsDOS = IsDOSFlavored(item.fsType);
    if (srcIsDOS && !targetIsDOS)
        return CallbackFacts::kDOSConvFromDOS;
    else if (!srcIsDOS && targetIsDOS)
        return CallbackFacts::kDOSConvToDOS;
    else
        return CallbackFacts::kDOSConvNone;
}

/*
 * Copy one fork from the item's source to "pOut".
 */
XferError XferWorker::CopyFilePart(const ClipFileEntry& item, int progressPerc,
    const std::string& storagePath, char storageSep,
    CallbackFacts::DOSConvMode dosConv, GenericFD* pOut)
{
    XferError xerr;

    CallbackFacts facts(CallbackFacts::kReasonProgress,
        item.attribs.fullPathName, item.attribs.fullPathSep);
    facts.newPathName = storagePath;
    facts.newDirSep = storageSep;
    facts.progressPercent = progressPerc;
    facts.part = item.part;
    facts.dosConv = dosConv;
    (void) Notify(facts);

    if (fCopyBuf == NULL)
        fCopyBuf = new uint8_t[kCopyBufSize];

    PartSource* pSource = item.CreatePartSource();
    if (pSource == NULL) {
        LOGW("No source for '%s'", item.attribs.fullPathName.c_str());
        return kXferErrNotReady;
    }

    {
        ScopedPartSource guard(pSource);

        xerr = pSource->Open();
        while (xerr == kXferErrNone) {
            size_t actual;
            xerr = pSource->Read(fCopyBuf, kCopyBufSize, &actual);
            if (xerr != kXferErrNone || actual == 0)
                break;

            if (dosConv == CallbackFacts::kDOSConvFromDOS) {
                for (size_t i = 0; i < actual; i++)
                    fCopyBuf[i] &= 0x7f;        // clear high bit on everything
            } else if (dosConv == CallbackFacts::kDOSConvToDOS) {
                for (size_t i = 0; i < actual; i++) {
                    if (fCopyBuf[i] != 0x00)    // set high bit on all but NULs
                        fCopyBuf[i] |= 0x80;
                }
            }

            xerr = pOut->Write(fCopyBuf, actual);
        }
    }

    delete pSource;
    return xerr;
}
