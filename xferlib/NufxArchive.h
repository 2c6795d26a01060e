/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * NuFX (ShrinkIt) archive support, through NufxLib.
 */
#ifndef XFERLIB_NUFXARCHIVE_H
#define XFERLIB_NUFXARCHIVE_H

#include "XferLib.h"
#include <NufxLib.h>
#include <vector>

namespace XferLib {

class NufxArchive;

/*
 * One record.  We only care about the data fork, resource fork, and disk
 * image threads.
 */
class XFERLIB_API NufxEntry : public FileEntry {
public:
    NufxEntry(void)
        : fFssep(':'), fFileType(0), fAuxType(0),
          fAccess(kFileAccessUnlocked), fCreateWhen(kDateNone),
          fModWhen(kDateNone), fDataLen(0), fRsrcLen(-1), fHasDataFork(false),
          fHasRsrcFork(false), fHasDiskImage(false), fRecordIdx(0),
          fDataThreadIdx(0), fRsrcThreadIdx(0)
        {}
    virtual ~NufxEntry(void) {}

    virtual const char* GetFileName(void) const override;
    virtual const char* GetPathName(void) const override {
        return fPathName.c_str();
    }
    virtual char GetFssep(void) const override { return fFssep; }
    virtual uint32_t GetFileType(void) const override { return fFileType; }
    virtual uint32_t GetAuxType(void) const override { return fAuxType; }
    virtual uint32_t GetAccess(void) const override { return fAccess; }
    virtual time_t GetCreateWhen(void) const override { return fCreateWhen; }
    virtual time_t GetModWhen(void) const override { return fModWhen; }
    virtual xf_off_t GetDataLength(void) const override { return fDataLen; }
    virtual xf_off_t GetRsrcLength(void) const override { return fRsrcLen; }
    virtual bool HasDataFork(void) const override {
        return fHasDataFork || fHasDiskImage;
    }
    virtual bool HasRsrcFork(void) const override { return fHasRsrcFork; }

    virtual void SetFileType(uint32_t fileType) override { fFileType = fileType; }
    virtual void SetAuxType(uint32_t auxType) override { fAuxType = auxType; }
    virtual void SetAccess(uint32_t access) override { fAccess = access; }
    virtual void SetCreateWhen(time_t when) override { fCreateWhen = when; }
    virtual void SetModWhen(time_t when) override { fModWhen = when; }

private:
    friend class NufxArchive;

    // fill in the fork info from the thread list
    void AnalyzeRecord(const NuRecord* pRecord);

    std::string     fPathName;
    char            fFssep;
    uint32_t        fFileType;
    uint32_t        fAuxType;
    uint32_t        fAccess;
    time_t          fCreateWhen;
    time_t          fModWhen;
    xf_off_t        fDataLen;
    xf_off_t        fRsrcLen;
    bool            fHasDataFork;
    bool            fHasRsrcFork;
    bool            fHasDiskImage;

    NuRecordIdx     fRecordIdx;
    NuThreadIdx     fDataThreadIdx;     // data fork or disk image
    NuThreadIdx     fRsrcThreadIdx;
};

/*
 * A NuFX archive.  Changes are staged in NufxLib and written by NuFlush
 * when the transaction commits.
 */
class XFERLIB_API NufxArchive : public Archive {
public:
    NufxArchive(void);
    virtual ~NufxArchive(void);

    // check the NufxLib version, and route its messages to our log
    static XferError AppInit(void);

    XferError Open(const char* filename, bool readOnly);
    XferError New(const char* filename);
    XferError Close(void);

    virtual const Characteristics& GetCharacteristics(void) const override {
        return fCharacteristics;
    }

    virtual long GetEntryCount(void) const override {
        return (long) fEntries.size();
    }
    virtual FileEntry* GetEntry(long idx) const override;

    virtual XferError OpenPart(FileEntry* pEntry, FilePart part,
        GenericFD** ppGFD) override;

    virtual XferError StartTransaction(void) override;
    virtual XferError CreateRecord(const char* pathName, char fssep,
        FileEntry** ppEntry) override;
    virtual XferError DeleteRecord(FileEntry* pEntry) override;
    virtual XferError AddPart(FileEntry* pEntry, FilePart part,
        PartSource* pSource, CompressionFormat format) override;
    virtual XferError CommitTransaction(void) override;
    virtual void CancelTransaction(void) override;

    virtual std::string AdjustFileName(const std::string& fileName) const override;
    virtual bool CheckStorageName(const std::string& pathName) const override;

private:
    NufxArchive& operator=(const NufxArchive&);
    NufxArchive(const NufxArchive&);

    /* NufxLib can't store a '\0' separator, so we use this instead */
    static const char kNufxNoFssep = (char) 0xff;

    /* a record created during the current transaction */
    typedef struct PendingPart {
        FilePart            part;
        PartSource*         pSource;
        CompressionFormat   format;
    } PendingPart;
    typedef struct PendingRecord {
        NufxEntry*          pEntry;
        std::vector<PendingPart> parts;
    } PendingRecord;

    static XferError NufxToXferError(NuError nerr);
    static NuResult NufxErrorMsgHandler(NuArchive* pArchive, void* vErrorMessage);
    static NuResult ContentFunc(NuArchive* pArchive, void* vpRecord);
    static NuResult FcloseHandler(NuArchive* pArchive, void* vfp);
    static time_t DateTimeToSeconds(const NuDateTime* pDateTime);
    static void UNIXTimeToDateTime(time_t when, NuDateTime* pDateTime);

    XferError SetCallbacks(void);
    XferError LoadContents(void);
    void DeleteEntries(void);
    void DiscardPending(void);
    PendingRecord* FindPending(const FileEntry* pEntry);
    XferError AddPendingRecord(PendingRecord* pPending);
    XferError MaterializePart(PartSource* pSource, FILE** pFp, long* pLength);

    NuArchive*      fpArchive;
    bool            fIsReadOnly;
    bool            fInTransaction;
    Characteristics fCharacteristics;
    std::vector<NufxEntry*> fEntries;
    std::vector<PendingRecord> fPending;
};

}   // namespace XferLib

#endif /*XFERLIB_NUFXARCHIVE_H*/
