/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Extraction to the host filesystem.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "ExtractWorker.h"
#include "PartSource.h"
#include "PathName.h"
#include <sys/xattr.h>

#define kFinderInfoXattr    "user.com.apple.FinderInfo"
#define kFinderInfoLen      32


XferStatus ExtractWorker::Fail(XferError xerr, const std::string& msg)
{
    fLastError = xerr;

    CallbackFacts facts(CallbackFacts::kReasonFailure);
    facts.failMessage = msg + ": " + XferStrError(xerr);
    LOGW("Extract failed: %s", facts.failMessage.c_str());
    (void) Notify(facts);
    return kXferFailed;
}

/*
 * Create every directory in "pathName", including the last component.
 * Returns ENOTDIR if a plain file is in the way.
 */
/*static*/ XferError ExtractWorker::CreatePath(const std::string& pathName)
{
    struct stat sb;
    size_t posn = 0;

    while (posn != std::string::npos) {
        posn = pathName.find(kHostDirSep, posn + 1);
        std::string partial = pathName.substr(0, posn);
        if (partial.empty())
            continue;

        if (stat(partial.c_str(), &sb) == 0) {
            if (!S_ISDIR(sb.st_mode)) {
                LOGI("  '%s' exists but isn't a directory", partial.c_str());
                return (XferError) ENOTDIR;
            }
            continue;
        }
        if (mkdir(partial.c_str(), 0755) != 0 && errno != EEXIST) {
            XferError xerr = ErrnoOrGeneric();
            LOGW("  Unable to create '%s': %s", partial.c_str(),
                strerror(errno));
            return xerr;
        }
    }
    return kXferErrNone;
}

/*
 * Get ready to write "outputPath".  Creates the directories it lives in,
 * and gets rid of an existing file if the user says so.
 */
ExtractWorker::PrepResult ExtractWorker::PrepareOutputFile(
    const std::string& outputPath, const ClipFileEntry& item)
{
    std::string dirName = PathName::GetDirectoryName(outputPath, kHostDirSep);
    struct stat sb;
    XferError xerr;

    if (!dirName.empty()) {
        xerr = CreatePath(dirName);
        if (xerr == (XferError) ENOTDIR) {
            /* part of the path is a file; we're not going to remove it */
            CallbackFacts facts(CallbackFacts::kReasonOverwriteFailure,
                dirName, kHostDirSep);
            facts.newPathName = item.attribs.fullPathName;
            facts.newDirSep = item.attribs.fullPathSep;
            (void) Notify(facts);
            return kPrepCancel;
        } else if (xerr != kXferErrNone) {
            fLastError = xerr;
            return kPrepFailed;
        }
    }

    if (lstat(outputPath.c_str(), &sb) != 0)
        return kPrepOK;

    if (S_ISDIR(sb.st_mode)) {
        CallbackFacts facts(CallbackFacts::kReasonOverwriteFailure,
            outputPath, kHostDirSep);
        facts.newPathName = item.attribs.fullPathName;
        facts.newDirSep = item.attribs.fullPathSep;
        if (Notify(facts) == CallbackFacts::kResultCancel)
            return kPrepCancel;
        return kPrepSkip;
    }

    CallbackFacts facts(CallbackFacts::kReasonFileNameExists,
        outputPath, kHostDirSep);
    facts.origModWhen = sb.st_mtime;
    facts.newPathName = item.attribs.fullPathName;
    facts.newDirSep = item.attribs.fullPathSep;
    facts.newModWhen = item.attribs.modWhen;
    facts.part = item.part;
    CallbackFacts::Result result = Notify(facts);
    if (result == CallbackFacts::kResultSkip)
        return kPrepSkip;
    if (result != CallbackFacts::kResultOverwrite)
        return kPrepCancel;

    /* delete existing; it may have been made read-only by an earlier run */
    LOGI("  Deleting existing '%s'", outputPath.c_str());
    (void) chmod(outputPath.c_str(), (sb.st_mode & 07777) | S_IWUSR);
    if (unlink(outputPath.c_str()) != 0 && errno != ENOENT) {
        LOGI("  Failed deleting '%s', err=%d", outputPath.c_str(), errno);
        CallbackFacts failFacts(CallbackFacts::kReasonOverwriteFailure,
            outputPath, kHostDirSep);
        if (Notify(failFacts) == CallbackFacts::kResultCancel)
            return kPrepCancel;
        return kPrepSkip;
    }
    return kPrepOK;
}

/*
 * Copy the item's bytes to a new file.
 */
XferError ExtractWorker::WriteItem(const ClipFileEntry& item,
    const std::string& outputPath)
{
    PartSource* pSource = item.CreatePartSource();
    GFDFile outFile;
    XferError xerr;

    if (pSource == NULL)
        return kXferErrNotReady;
    if (fCopyBuf == NULL)
        fCopyBuf = new uint8_t[kCopyBufSize];

    xerr = outFile.Create(outputPath.c_str());
    if (xerr != kXferErrNone)
        goto bail;

    {
        ScopedPartSource guard(pSource);

        xerr = pSource->Open();
        while (xerr == kXferErrNone) {
            size_t actual;
            xerr = pSource->Read(fCopyBuf, kCopyBufSize, &actual);
            if (xerr != kXferErrNone || actual == 0)
                break;
            xerr = outFile.Write(fCopyBuf, actual);
        }
    }

    {
        XferError cerr = outFile.Close();
        if (xerr == kXferErrNone)
            xerr = cerr;
    }

bail:
    delete pSource;
    return xerr;
}

/*
 * Restore the dates and access flags.  With host preservation, the types
 * go into the Finder info attribute.  Returns false if something didn't
 * take.
 */
bool ExtractWorker::SetHostAttribs(const ClipFileEntry& item,
    const std::string& outputPath)
{
    bool result = true;

    if (item.preserve == kPreserveHost && item.IsDataPart() &&
        item.attribs.HasTypeInfo())
    {
        uint32_t macType = item.attribs.hfsFileType;
        uint32_t macCreator = item.attribs.hfsCreator;
        if (macType == 0 && macCreator == 0) {
            macType = 0x70000000 | (item.attribs.fileType & 0xff) << 16 |
                (item.attribs.auxType & 0xffff);
            macCreator = kPdosCreator;
        }

        uint8_t fiBuf[kFinderInfoLen];
        memset(fiBuf, 0, sizeof(fiBuf));
        PutLongBE(fiBuf, macType);
        PutLongBE(fiBuf + 4, macCreator);
        if (setxattr(outputPath.c_str(), kFinderInfoXattr, fiBuf,
                sizeof(fiBuf), 0) != 0)
        {
            /* lots of filesystems don't do user xattrs; not worth a fuss */
            LOGI("  Unable to set Finder info on '%s': %s",
                outputPath.c_str(), strerror(errno));
        }
    }

    if (fOpts.setModWhen && IsValidDate(item.attribs.modWhen)) {
        struct timeval times[2];
        times[0].tv_sec = times[1].tv_sec = item.attribs.modWhen;
        times[0].tv_usec = times[1].tv_usec = 0;
        if (utimes(outputPath.c_str(), times) != 0) {
            LOGW("  Unable to set date on '%s': %s", outputPath.c_str(),
                strerror(errno));
            result = false;
        }
    }

    /*
     * Locked files become read-only.  The AppleSingle and AppleDouble
     * headers carry the access flags themselves, so leave those alone.
     */
    bool isHeader = item.preserve == kPreserveAS ||
        (item.preserve == kPreserveADF && item.part == kPartRsrcFork);
    if (fOpts.setAccess && !isHeader &&
        (item.attribs.access & kFileAccessWrite) == 0)
    {
        struct stat sb;
        if (stat(outputPath.c_str(), &sb) != 0 ||
            chmod(outputPath.c_str(), sb.st_mode & 07555) != 0)
        {
            LOGW("  Unable to make '%s' read-only: %s", outputPath.c_str(),
                strerror(errno));
            result = false;
        }
    }

    return result;
}

XferStatus ExtractWorker::ExtractToHost(const ClipFileSet::ItemList& items,
    const std::string& destDir)
{
    XferError xerr;

    fLastError = kXferErrNone;
    if (!destDir.empty()) {
        xerr = CreatePath(destDir);
        if (xerr != kXferErrNone)
            return Fail(xerr, "Unable to create '" + destDir + "'");
    }

    for (size_t idx = 0; idx < items.size(); idx++) {
        const ClipFileEntry& item = items[idx];

        CallbackFacts cancelFacts(CallbackFacts::kReasonQueryCancel);
        if (Notify(cancelFacts) == CallbackFacts::kResultCancel) {
            LOGI("Cancelled before item %d", (int) idx);
            return kXferCancelled;
        }

        std::string outputPath = destDir.empty() ? item.extractPath :
            PathName::Combine(destDir, item.extractPath, kHostDirSep);

        if (item.IsDirectory()) {
            xerr = CreatePath(outputPath);
            if (xerr != kXferErrNone)
                return Fail(xerr, "Unable to create directory '" + outputPath + "'");
            continue;
        }

        if (item.preserve == kPreserveNone && item.attribs.rsrcLength > 0) {
            CallbackFacts facts(CallbackFacts::kReasonResourceForkIgnored,
                item.attribs.fullPathName, item.attribs.fullPathSep);
            facts.part = kPartRsrcFork;
            if (Notify(facts) == CallbackFacts::kResultCancel)
                return kXferCancelled;
        }

        CallbackFacts progress(CallbackFacts::kReasonProgress,
            item.attribs.fullPathName, item.attribs.fullPathSep);
        progress.newPathName = outputPath;
        progress.newDirSep = kHostDirSep;
        progress.progressPercent = (int) ((100 * idx) / items.size());
        progress.part = item.part;
        (void) Notify(progress);

        if (item.preserve == kPreserveHost && item.part == kPartRsrcFork) {
            /*
             * Named fork of the file we just wrote.  If the host can't
             * do those, the fork gets dropped.
             */
            xerr = WriteItem(item, outputPath);
            if (xerr != kXferErrNone) {
                LOGI("  Named fork write to '%s' failed: %s",
                    outputPath.c_str(), XferStrError(xerr));
                CallbackFacts facts(CallbackFacts::kReasonResourceForkIgnored,
                    item.attribs.fullPathName, item.attribs.fullPathSep);
                facts.part = kPartRsrcFork;
                if (Notify(facts) == CallbackFacts::kResultCancel)
                    return kXferCancelled;
            }
            continue;
        }

        switch (PrepareOutputFile(outputPath, item)) {
        case kPrepOK:
            break;
        case kPrepSkip:
            LOGI("  Skipping '%s'", outputPath.c_str());
            continue;
        case kPrepCancel:
            return kXferCancelled;
        case kPrepFailed:
        default:
            return Fail(fLastError, "Unable to prepare '" + outputPath + "'");
        }

        LOGI("  Extracting '%s'", outputPath.c_str());
        xerr = WriteItem(item, outputPath);
        if (xerr != kXferErrNone) {
            (void) unlink(outputPath.c_str());
            return Fail(xerr, "Unable to write '" + outputPath + "'");
        }

        if (!SetHostAttribs(item, outputPath)) {
            CallbackFacts facts(CallbackFacts::kReasonAttrFailure,
                outputPath, kHostDirSep);
            if (Notify(facts) == CallbackFacts::kResultCancel)
                return kXferCancelled;
        }
    }

    return kXferOK;
}
