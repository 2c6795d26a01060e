/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Bridge between NufxLib and the Archive interface.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "NufxArchive.h"
#include "PartSource.h"


/*
 * Convert a Mac OS Roman string from the archive to UTF-8, and back.
 */
static std::string MORToUNI(const char* stringMOR)
{
    if (stringMOR == NULL)
        return std::string();

    size_t uniLen = NuConvertMORToUNI(stringMOR, NULL, 0);
    if (uniLen == 0 || uniLen == (size_t) -1) {
        LOGW("Unable to convert MOR name '%s'", stringMOR);
        return std::string(stringMOR);
    }
    std::vector<char> buf(uniLen + 1, '\0');
    NuConvertMORToUNI(stringMOR, &buf[0], uniLen);
    return std::string(&buf[0]);
}

static std::string UNIToMOR(const std::string& stringUNI)
{
    size_t morLen = NuConvertUNIToMOR(stringUNI.c_str(), NULL, 0);
    if (morLen == 0 || morLen == (size_t) -1) {
        LOGW("Unable to convert name '%s' to MOR", stringUNI.c_str());
        return stringUNI;
    }
    std::vector<char> buf(morLen + 1, '\0');
    NuConvertUNIToMOR(stringUNI.c_str(), &buf[0], morLen);
    return std::string(&buf[0]);
}


/*
 * ===========================================================================
 *      NufxEntry
 * ===========================================================================
 */

const char* NufxEntry::GetFileName(void) const
{
    return FilenameOnly(fPathName.c_str(), fFssep);
}

void NufxEntry::AnalyzeRecord(const NuRecord* pRecord)
{
    const NuThread* pThread;
    NuThreadID threadID;

    for (uint32_t idx = 0; idx < NuRecordGetNumThreads(pRecord); idx++) {
        pThread = NuGetThread(pRecord, idx);
        if (pThread == NULL)
            break;

        threadID = NuGetThreadID(pThread);
        if (threadID == kNuThreadIDDataFork) {
            if (!fHasDataFork && !fHasDiskImage) {
                fHasDataFork = true;
                fDataLen = pThread->actualThreadEOF;
                fDataThreadIdx = pThread->threadIdx;
            } else {
                LOGW("WARNING: ignoring second disk image / data fork");
            }
        } else if (threadID == kNuThreadIDRsrcFork) {
            if (!fHasRsrcFork) {
                fHasRsrcFork = true;
                fRsrcLen = pThread->actualThreadEOF;
                fRsrcThreadIdx = pThread->threadIdx;
            } else {
                LOGW("WARNING: ignoring second resource fork");
            }
        } else if (threadID == kNuThreadIDDiskImage) {
            if (!fHasDiskImage && !fHasDataFork) {
                fHasDiskImage = true;
                fDataLen = pThread->actualThreadEOF;
                fDataThreadIdx = pThread->threadIdx;
            } else {
                LOGW("WARNING: ignoring second disk image / data fork");
            }
        }
    }
}


/*
 * ===========================================================================
 *      NufxArchive
 * ===========================================================================
 */

NufxArchive::NufxArchive(void)
    : fpArchive(NULL), fIsReadOnly(true), fInTransaction(false)
{
    fCharacteristics.name = "NuFX (ShrinkIt)";
    fCharacteristics.canWrite = false;
    fCharacteristics.hasResourceForks = true;
    fCharacteristics.keepsEmptyRsrc = true;
    fCharacteristics.hasSingleEntry = false;
    fCharacteristics.isMacZipCapable = false;
    fCharacteristics.defaultDirSep = ':';
}

NufxArchive::~NufxArchive(void)
{
    (void) Close();
}

/*static*/ XferError NufxArchive::AppInit(void)
{
    NuError nerr;
    int32_t major, minor, bug;

    nerr = NuGetVersion(&major, &minor, &bug, NULL, NULL);
    if (nerr != kNuErrNone) {
        LOGE("Unable to get version number from NufxLib");
        return kXferErrNufxLibInitFailed;
    }

    if (major != kNuVersionMajor || minor < kNuVersionMinor) {
        LOGE("Older or incompatible version of NufxLib found: wanted "
             "v%d.%d.x, found %d.%d.%d",
            kNuVersionMajor, kNuVersionMinor, major, minor, bug);
        return kXferErrNufxLibInitFailed;
    }
    if (bug != kNuVersionBug) {
        LOGI("Different 'bug' version (built vX.X.%d, lib vX.X.%d)",
            kNuVersionBug, bug);
    }

    /* set NufxLib's global error message handler */
    NuSetGlobalErrorMessageHandler(NufxErrorMsgHandler);
    return kXferErrNone;
}

/*static*/ XferError NufxArchive::NufxToXferError(NuError nerr)
{
    if (nerr > 0)
        return (XferError) nerr;       // errno value

    switch (nerr) {
    case kNuErrNone:                return kXferErrNone;
    case kNuErrAborted:             return kXferErrCancelled;
    case kNuErrMalloc:              return kXferErrMalloc;
    case kNuErrInvalidArg:          return kXferErrInvalidArg;
    case kNuErrFileNotFound:        return kXferErrFileNotFound;
    case kNuErrFileExists:          return kXferErrFileExists;
    case kNuErrRecordExists:        return kXferErrFileExists;
    case kNuErrFileAccessDenied:    return kXferErrAccessDenied;
    case kNuErrArchiveRO:           return kXferErrWriteProtected;
    case kNuErrFileRead:            return kXferErrReadFailed;
    case kNuErrFileWrite:           return kXferErrWriteFailed;
    case kNuErrNotNuFX:             return kXferErrUnrecognizedFileFmt;
    case kNuErrInvalidFilename:     return kXferErrInvalidFileName;
    case kNuErrBadFormat:           return kXferErrNotSupported;
    case kNuErrBadRecord:
    case kNuErrBadMHCRC:
    case kNuErrBadRHCRC:
    case kNuErrRecHdrNotFound:
    case kNuErrDamaged:             return kXferErrBadArchiveStruct;
    case kNuErrBadThreadCRC:
    case kNuErrBadDataCRC:
    case kNuErrBadData:             return kXferErrBadFile;
    default:                        return kXferErrGeneric;
    }
}

/*static*/ NuResult NufxArchive::NufxErrorMsgHandler(NuArchive*,
    void* vErrorMessage)
{
    const NuErrorMessage* pErrorMessage = (const NuErrorMessage*) vErrorMessage;

    Global::PrintDebugMsg(pErrorMessage->file, pErrorMessage->line,
        "<nufxlib> %s", pErrorMessage->message);
    return kNuOK;
}

/*static*/ NuResult NufxArchive::FcloseHandler(NuArchive*, void* vfp)
{
    fclose((FILE*) vfp);
    return kNuOK;
}

/*static*/ time_t NufxArchive::DateTimeToSeconds(const NuDateTime* pDateTime)
{
    if (pDateTime->second == 0 &&
        pDateTime->minute == 0 &&
        pDateTime->hour == 0 &&
        pDateTime->year == 0 &&
        pDateTime->day == 0 &&
        pDateTime->month == 0 &&
        pDateTime->extra == 0 &&
        pDateTime->weekDay == 0)
    {
        // not invalid; just no date set
        return kDateNone;
    }

    int year;
    if (pDateTime->year < 40)
        year = pDateTime->year + 2000;
    else
        year = pDateTime->year + 1900;

    if (year < 1969)
        return kDateInvalid;

    if (pDateTime->month > 11 ||    // [0,11]
        pDateTime->day > 30 ||      // [0,30]
        pDateTime->hour > 23 ||     // [0,23]
        pDateTime->minute > 59 ||   // [0,59]
        pDateTime->second > 59)     // [0,59]
    {
        return kDateInvalid;
    }

    struct tm tmbuf;
    memset(&tmbuf, 0, sizeof(tmbuf));
    tmbuf.tm_year = year - 1900;
    tmbuf.tm_mon = pDateTime->month;
    tmbuf.tm_mday = pDateTime->day + 1;
    tmbuf.tm_hour = pDateTime->hour;
    tmbuf.tm_min = pDateTime->minute;
    tmbuf.tm_sec = pDateTime->second;
    tmbuf.tm_isdst = -1;
    return mktime(&tmbuf);
}

/*static*/ void NufxArchive::UNIXTimeToDateTime(time_t when,
    NuDateTime* pDateTime)
{
    struct tm tmbuf;
    struct tm* ptm = NULL;

    if (IsValidDate(when))
        ptm = localtime_r(&when, &tmbuf);
    if (ptm == NULL) {
        memset(pDateTime, 0, sizeof(*pDateTime));
        return;
    }
    pDateTime->second = ptm->tm_sec;
    pDateTime->minute = ptm->tm_min;
    pDateTime->hour = ptm->tm_hour;
    pDateTime->day = ptm->tm_mday -1;
    pDateTime->month = ptm->tm_mon;
    pDateTime->year = ptm->tm_year;
    pDateTime->extra = 0;
    pDateTime->weekDay = ptm->tm_wday +1;
}

XferError NufxArchive::Open(const char* filename, bool readOnly)
{
    NuError nerr = kNuErrNone;
    XferError xerr;

    if (fpArchive != NULL)
        return kXferErrAlreadyOpen;

    if (!readOnly) {
        std::string tmpname(filename);
        tmpname += "_NuTmpXXXXXX";
        LOGI("Opening file '%s' rw (tmp='%s')", filename, tmpname.c_str());
        fIsReadOnly = false;
        nerr = NuOpenRW(filename, tmpname.c_str(), 0, &fpArchive);

        if (nerr == kNuErrFileAccessDenied || nerr == EACCES) {
            LOGI("Read-write failed with access denied, trying read-only");
            readOnly = true;
        }
    }
    if (readOnly) {
        LOGI("Opening file '%s' ro", filename);
        fIsReadOnly = true;
        nerr = NuOpenRO(filename, &fpArchive);
    }
    if (nerr != kNuErrNone) {
        LOGW("Unable to open '%s': %s", filename, NuStrError(nerr));
        fpArchive = NULL;
        return NufxToXferError(nerr);
    }
    fCharacteristics.canWrite = !fIsReadOnly;

    xerr = SetCallbacks();
    if (xerr != kXferErrNone)
        return xerr;

    return LoadContents();
}

XferError NufxArchive::New(const char* filename)
{
    NuError nerr;

    if (fpArchive != NULL)
        return kXferErrAlreadyOpen;

    std::string tmpname(filename);
    tmpname += "_NuTmpXXXXXX";
    LOGI("Creating file '%s' (tmp='%s')", filename, tmpname.c_str());
    nerr = NuOpenRW(filename, tmpname.c_str(), kNuOpenCreat | kNuOpenExcl,
        &fpArchive);
    if (nerr != kNuErrNone) {
        LOGW("Unable to create '%s': %s", filename, NuStrError(nerr));
        fpArchive = NULL;
        return NufxToXferError(nerr);
    }
    fIsReadOnly = false;
    fCharacteristics.canWrite = true;

    return SetCallbacks();
}

XferError NufxArchive::Close(void)
{
    NuError nerr = kNuErrNone;

    if (fInTransaction)
        CancelTransaction();
    DeleteEntries();
    if (fpArchive != NULL) {
        nerr = NuClose(fpArchive);
        if (nerr != kNuErrNone)
            LOGW("NuClose failed: %s", NuStrError(nerr));
        fpArchive = NULL;
    }
    return NufxToXferError(nerr);
}

XferError NufxArchive::SetCallbacks(void)
{
    NuError nerr;

    nerr = NuSetExtraData(fpArchive, this);
    if (nerr != kNuErrNone)
        goto bail;
    NuSetErrorMessageHandler(fpArchive, NufxErrorMsgHandler);

    /* let NufxLib worry about buggy records without data threads */
    nerr = NuSetValue(fpArchive, kNuValueMaskDataless, kNuValueTrue);
    if (nerr != kNuErrNone)
        goto bail;

    /* we handle duplicates ourselves, and DOS volumes can have them */
    nerr = NuSetValue(fpArchive, kNuValueAllowDuplicates, kNuValueTrue);

bail:
    if (nerr != kNuErrNone)
        LOGW("NufxLib callback init failed: %s", NuStrError(nerr));
    return NufxToXferError(nerr);
}

void NufxArchive::DeleteEntries(void)
{
    for (size_t i = 0; i < fEntries.size(); i++)
        delete fEntries[i];
    fEntries.clear();
}

XferError NufxArchive::LoadContents(void)
{
    NuError nerr;

    LOGI("NufxArchive LoadContents");
    DeleteEntries();

    nerr = NuContents(fpArchive, ContentFunc);
    if (nerr != kNuErrNone) {
        LOGW("Failed reading archive contents: %s", NuStrError(nerr));
        DeleteEntries();
        fIsReadOnly = true;
        fCharacteristics.canWrite = false;
    }
    return NufxToXferError(nerr);
}

/*static*/ NuResult NufxArchive::ContentFunc(NuArchive* pArchive,
    void* vpRecord)
{
    const NuRecord* pRecord = (const NuRecord*) vpRecord;
    NufxArchive* pThis = NULL;

    NuGetExtraData(pArchive, (void**) &pThis);
    if (pThis == NULL)
        return kNuAbort;

    NufxEntry* pNewEntry = new NufxEntry;
    pNewEntry->fPathName = MORToUNI(pRecord->filenameMOR);
    pNewEntry->fFssep = NuGetSepFromSysInfo(pRecord->recFileSysInfo);
    if (pNewEntry->fFssep == kNufxNoFssep)
        pNewEntry->fFssep = '\0';
    pNewEntry->fFileType = pRecord->recFileType;
    pNewEntry->fAuxType = pRecord->recExtraType;
    pNewEntry->fAccess = pRecord->recAccess;
    pNewEntry->fCreateWhen = DateTimeToSeconds(&pRecord->recCreateWhen);
    pNewEntry->fModWhen = DateTimeToSeconds(&pRecord->recModWhen);
    pNewEntry->fRecordIdx = pRecord->recordIdx;
    pNewEntry->AnalyzeRecord(pRecord);

    pThis->fEntries.push_back(pNewEntry);
    return kNuOK;
}

FileEntry* NufxArchive::GetEntry(long idx) const
{
    if (idx < 0 || idx >= (long) fEntries.size())
        return NULL;
    return fEntries[idx];
}

/*
 * Extract the thread into memory.  Records are usually small, and this
 * gives us a seekable descriptor.
 */
XferError NufxArchive::OpenPart(FileEntry* pGenericEntry, FilePart part,
    GenericFD** ppGFD)
{
    NufxEntry* pEntry = (NufxEntry*) pGenericEntry;
    NuDataSink* pDataSink = NULL;
    NuThreadIdx threadIdx;
    uint32_t threadLen;
    uint8_t* buf = NULL;
    GFDBuffer* pGFD = NULL;
    XferError xerr = kXferErrNone;
    NuError nerr;

    *ppGFD = NULL;

    switch (part) {
    case kPartDataFork:
    case kPartRawData:
    case kPartDiskImage:
        if (!pEntry->HasDataFork())
            return kXferErrForkNotFound;
        threadIdx = pEntry->fDataThreadIdx;
        threadLen = (uint32_t) pEntry->fDataLen;
        break;
    case kPartRsrcFork:
        if (!pEntry->fHasRsrcFork)
            return kXferErrForkNotFound;
        threadIdx = pEntry->fRsrcThreadIdx;
        threadLen = (uint32_t) pEntry->fRsrcLen;
        break;
    default:
        return kXferErrInvalidArg;
    }

    /* one extra byte, so a zero-length thread gets a real buffer */
    buf = new uint8_t[threadLen + 1];
    if (threadLen != 0) {
        nerr = NuCreateDataSinkForBuffer(true, kNuConvertOff, buf, threadLen,
            &pDataSink);
        if (nerr != kNuErrNone) {
            xerr = NufxToXferError(nerr);
            goto bail;
        }

        nerr = NuExtractThread(fpArchive, threadIdx, pDataSink);
        if (nerr != kNuErrNone) {
            LOGW("Unable to extract thread %u: %s", threadIdx, NuStrError(nerr));
            xerr = NufxToXferError(nerr);
            goto bail;
        }
    }

    pGFD = new GFDBuffer;
    xerr = pGFD->Open(buf, threadLen, true, false, true);
    if (xerr != kXferErrNone)
        goto bail;
    buf = NULL;         // owned by pGFD

    *ppGFD = pGFD;
    pGFD = NULL;

bail:
    if (pDataSink != NULL)
        NuFreeDataSink(pDataSink);
    delete pGFD;
    delete[] buf;
    return xerr;
}


/*
 * ===========================================================================
 *      NufxArchive -- transactions
 * ===========================================================================
 */

XferError NufxArchive::StartTransaction(void)
{
    if (fpArchive == NULL || fIsReadOnly)
        return kXferErrWriteProtected;
    if (fInTransaction)
        return kXferErrAlreadyOpen;

    LOGI("NufxArchive transaction started");
    fInTransaction = true;
    return kXferErrNone;
}

NufxArchive::PendingRecord* NufxArchive::FindPending(const FileEntry* pEntry)
{
    for (size_t i = 0; i < fPending.size(); i++) {
        if (fPending[i].pEntry == pEntry)
            return &fPending[i];
    }
    return NULL;
}

XferError NufxArchive::CreateRecord(const char* pathName, char fssep,
    FileEntry** ppEntry)
{
    if (!fInTransaction)
        return kXferErrNotReady;

    PendingRecord pending;
    pending.pEntry = new NufxEntry;
    pending.pEntry->fPathName = pathName;
    pending.pEntry->fFssep = fssep;
    fPending.push_back(pending);

    *ppEntry = pending.pEntry;
    return kXferErrNone;
}

XferError NufxArchive::DeleteRecord(FileEntry* pGenericEntry)
{
    NuError nerr;

    if (!fInTransaction)
        return kXferErrNotReady;

    /* something we added during this transaction? */
    for (size_t i = 0; i < fPending.size(); i++) {
        if (fPending[i].pEntry != pGenericEntry)
            continue;
        for (size_t j = 0; j < fPending[i].parts.size(); j++)
            delete fPending[i].parts[j].pSource;
        delete fPending[i].pEntry;
        fPending.erase(fPending.begin() + i);
        return kXferErrNone;
    }

    NufxEntry* pEntry = (NufxEntry*) pGenericEntry;
    LOGI("  Deleting %u '%s'", pEntry->fRecordIdx, pEntry->fPathName.c_str());
    nerr = NuDeleteRecord(fpArchive, pEntry->fRecordIdx);
    if (nerr != kNuErrNone) {
        LOGW("Unable to delete record %u: %s", pEntry->fRecordIdx,
            NuStrError(nerr));
        return NufxToXferError(nerr);
    }
    return kXferErrNone;
}

XferError NufxArchive::AddPart(FileEntry* pEntry, FilePart part,
    PartSource* pSource, CompressionFormat format)
{
    PendingRecord* pPending = FindPending(pEntry);
    if (!fInTransaction || pPending == NULL) {
        LOGW("AddPart on entry not created in this transaction");
        delete pSource;
        return kXferErrInvalidArg;
    }
    for (size_t i = 0; i < pPending->parts.size(); i++) {
        if (pPending->parts[i].part == part) {
            delete pSource;
            return kXferErrFileExists;
        }
    }

    PendingPart newPart;
    newPart.part = part;
    newPart.pSource = pSource;
    newPart.format = format;
    pPending->parts.push_back(newPart);
    return kXferErrNone;
}

/*
 * Copy a part source to an anonymous temp file.  NufxLib reads it during
 * the flush, and closes it when it's done.
 */
XferError NufxArchive::MaterializePart(PartSource* pSource, FILE** pFp,
    long* pLength)
{
    uint8_t buf[16384];
    XferError xerr;
    FILE* fp;

    *pFp = NULL;
    *pLength = 0;

    fp = tmpfile();
    if (fp == NULL) {
        xerr = ErrnoOrGeneric();
        LOGW("Unable to create temp file: %s", strerror(errno));
        return xerr;
    }

    {
        ScopedPartSource guard(pSource);

        xerr = pSource->Open();
        while (xerr == kXferErrNone) {
            size_t actual;
            xerr = pSource->Read(buf, sizeof(buf), &actual);
            if (xerr != kXferErrNone || actual == 0)
                break;
            if (fwrite(buf, 1, actual, fp) != actual) {
                xerr = ErrnoOrGeneric();
                break;
            }
            *pLength += (long) actual;
        }
    }

    if (xerr == kXferErrNone && fseek(fp, 0, SEEK_SET) != 0)
        xerr = ErrnoOrGeneric();
    if (xerr != kXferErrNone) {
        fclose(fp);
        return xerr;
    }

    *pFp = fp;
    return kXferErrNone;
}

XferError NufxArchive::AddPendingRecord(PendingRecord* pPending)
{
    NufxEntry* pEntry = pPending->pEntry;
    NuFileDetails details;
    NuRecordIdx recordIdx;
    NuDataSource* pSource = NULL;
    XferError xerr = kXferErrNone;
    NuError nerr;

    std::string storageNameMOR = UNIToMOR(pEntry->fPathName);
    char fssep = pEntry->fFssep;
    if (fssep == '\0')
        fssep = kNufxNoFssep;

    memset(&details, 0, sizeof(details));
    details.threadID = kNuThreadIDDataFork;
    details.origName = pEntry->fPathName.c_str();
    details.storageNameMOR = storageNameMOR.c_str();
    details.fileSysID = kNuFileSysProDOS;
    details.fileSysInfo = NuSetSepInSysInfo(0, fssep);
    details.access = pEntry->fAccess;
    details.fileType = pEntry->fFileType;
    details.extraType = pEntry->fAuxType;
    details.storageType = kNuStorageUnknown;
    for (size_t i = 0; i < pPending->parts.size(); i++) {
        if (pPending->parts[i].part == kPartRsrcFork)
            details.storageType = kNuStorageExtended;
    }
    UNIXTimeToDateTime(pEntry->fCreateWhen, &details.createWhen);
    UNIXTimeToDateTime(pEntry->fModWhen, &details.modWhen);
    UNIXTimeToDateTime(time(NULL), &details.archiveWhen);

    LOGI("  NufxArchive adding '%s'", pEntry->fPathName.c_str());
    nerr = NuAddRecord(fpArchive, &details, &recordIdx);
    if (nerr != kNuErrNone) {
        LOGW("Failed adding record: %s", NuStrError(nerr));
        return NufxToXferError(nerr);
    }

    for (size_t i = 0; i < pPending->parts.size(); i++) {
        PendingPart& part = pPending->parts[i];
        FILE* fp;
        long length;

        xerr = MaterializePart(part.pSource, &fp, &length);
        if (xerr != kXferErrNone)
            goto bail;

        nerr = NuCreateDataSourceForFP(kNuThreadFormatUncompressed, 0, fp, 0,
            length, FcloseHandler, &pSource);
        if (nerr != kNuErrNone) {
            fclose(fp);
            LOGW("Unable to create NufxLib data source: %s", NuStrError(nerr));
            xerr = NufxToXferError(nerr);
            goto bail;
        }

        /* compression is picked up when the thread is added */
        nerr = NuSetValue(fpArchive, kNuValueDataCompression,
            part.format == kCompressUncompressed ?
                kNuCompressNone : kNuCompressLZW2);
        if (nerr != kNuErrNone) {
            xerr = NufxToXferError(nerr);
            goto bail;
        }

        NuThreadID targetID;
        if (part.part == kPartRsrcFork)
            targetID = kNuThreadIDRsrcFork;
        else if (part.part == kPartDiskImage)
            targetID = kNuThreadIDDiskImage;
        else
            targetID = kNuThreadIDDataFork;

        nerr = NuAddThread(fpArchive, recordIdx, targetID, pSource, NULL);
        if (nerr != kNuErrNone) {
            LOGW("Failed adding thread: %s", NuStrError(nerr));
            xerr = NufxToXferError(nerr);
            goto bail;
        }
        pSource = NULL;     // NufxLib owns it now
    }

bail:
    NuFreeDataSource(pSource);
    return xerr;
}

XferError NufxArchive::CommitTransaction(void)
{
    XferError xerr = kXferErrNone;
    uint32_t statusFlags = 0;
    NuError nerr;

    if (!fInTransaction)
        return kXferErrNotReady;

    for (size_t i = 0; i < fPending.size(); i++) {
        xerr = AddPendingRecord(&fPending[i]);
        if (xerr != kXferErrNone) {
            CancelTransaction();
            return xerr;
        }
    }

    /* actually do the work */
    nerr = NuFlush(fpArchive, &statusFlags);
    if (nerr != kNuErrNone) {
        LOGW("Unable to flush changes: %s", NuStrError(nerr));
        xerr = NufxToXferError(nerr);

        /* see if it got converted to read-only status */
        if (statusFlags & kNuFlushReadOnly) {
            fIsReadOnly = true;
            fCharacteristics.canWrite = false;
        }
        CancelTransaction();
        return xerr;
    }

    DiscardPending();
    fInTransaction = false;
    return LoadContents();
}

void NufxArchive::DiscardPending(void)
{
    for (size_t i = 0; i < fPending.size(); i++) {
        for (size_t j = 0; j < fPending[i].parts.size(); j++)
            delete fPending[i].parts[j].pSource;
        delete fPending[i].pEntry;
    }
    fPending.clear();
}

void NufxArchive::CancelTransaction(void)
{
    NuError nerr;

    LOGI("NufxArchive transaction cancelled");
    DiscardPending();
    fInTransaction = false;

    // Nothing has been flushed, so the staged adds and deletes can just be
    // thrown away.
    nerr = NuAbort(fpArchive);
    if (nerr != kNuErrNone)
        LOGW("Failed while aborting procedure: %s", NuStrError(nerr));
}

std::string NufxArchive::AdjustFileName(const std::string& fileName) const
{
    std::string result(fileName);

    /* the separator can't appear in a component */
    for (size_t i = 0; i < result.length(); i++) {
        if (result[i] == fCharacteristics.defaultDirSep)
            result[i] = '_';
    }
    if (result.empty())
        result = "A";
    return result;
}

bool NufxArchive::CheckStorageName(const std::string& pathName) const
{
    if (pathName.empty() || pathName[0] == fCharacteristics.defaultDirSep)
        return false;   // NufxLib rejects a leading separator
    return pathName.length() < kNuReasonableFilenameLen;
}
