/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * In-memory archive, for exercising the transfer code without a real
 * archive format underneath.
 */
#ifndef XFERLIB_TESTS_MEMARCHIVE_H
#define XFERLIB_TESTS_MEMARCHIVE_H

#include "XferLib.h"
#include "PartSource.h"
#include <string>
#include <vector>

namespace XferTest {

using namespace XferLib;

class MemArchive;

class MemArchiveEntry : public FileEntry {
public:
    MemArchiveEntry(const std::string& pathName, char fssep, bool hfsTypes)
        : fPathName(pathName), fFssep(fssep), fHFSTypes(hfsTypes),
          fFileType(0), fAuxType(0), fHFSFileType(0), fHFSCreator(0),
          fAccess(kFileAccessUnlocked), fCreateWhen(kDateNone),
          fModWhen(kDateNone), fIsDir(false), fHasData(false),
          fHasRsrc(false)
        {}
    virtual ~MemArchiveEntry(void) {}

    virtual const char* GetFileName(void) const override;
    virtual const char* GetPathName(void) const override {
        return fPathName.c_str();
    }
    virtual char GetFssep(void) const override { return fFssep; }
    virtual uint32_t GetFileType(void) const override { return fFileType; }
    virtual uint32_t GetAuxType(void) const override { return fAuxType; }
    virtual uint32_t GetHFSFileType(void) const override { return fHFSFileType; }
    virtual uint32_t GetHFSCreator(void) const override { return fHFSCreator; }
    virtual uint32_t GetAccess(void) const override { return fAccess; }
    virtual time_t GetCreateWhen(void) const override { return fCreateWhen; }
    virtual time_t GetModWhen(void) const override { return fModWhen; }
    virtual xf_off_t GetDataLength(void) const override {
        return (xf_off_t) fData.length();
    }
    virtual xf_off_t GetRsrcLength(void) const override {
        return fHasRsrc ? (xf_off_t) fRsrc.length() : -1;
    }
    virtual bool HasDataFork(void) const override { return fHasData; }
    virtual bool HasRsrcFork(void) const override { return fHasRsrc; }
    virtual bool IsDirectory(void) const override { return fIsDir; }
    virtual bool HasProDOSTypes(void) const override { return !fHFSTypes; }
    virtual bool HasHFSTypes(void) const override { return fHFSTypes; }

    virtual void SetFileType(uint32_t fileType) override { fFileType = fileType; }
    virtual void SetAuxType(uint32_t auxType) override { fAuxType = auxType; }
    virtual void SetHFSFileType(uint32_t fileType) override {
        fHFSFileType = fileType;
    }
    virtual void SetHFSCreator(uint32_t creator) override {
        fHFSCreator = creator;
    }
    virtual void SetAccess(uint32_t access) override { fAccess = access; }
    virtual void SetCreateWhen(time_t when) override { fCreateWhen = when; }
    virtual void SetModWhen(time_t when) override { fModWhen = when; }

    // fork contents, for setting up and checking tests
    void SetData(const std::string& data) { fData = data; fHasData = true; }
    void SetRsrc(const std::string& rsrc) { fRsrc = rsrc; fHasRsrc = true; }
    void SetDirectory(bool isDir) { fIsDir = isDir; fHasData = !isDir; }
    const std::string& GetData(void) const { return fData; }
    const std::string& GetRsrc(void) const { return fRsrc; }

private:
    friend class MemArchive;

    std::string     fPathName;
    char            fFssep;
    bool            fHFSTypes;
    uint32_t        fFileType;
    uint32_t        fAuxType;
    uint32_t        fHFSFileType;
    uint32_t        fHFSCreator;
    uint32_t        fAccess;
    time_t          fCreateWhen;
    time_t          fModWhen;
    bool            fIsDir;
    bool            fHasData;
    bool            fHasRsrc;
    std::string     fData;
    std::string     fRsrc;
};

/*
 * Entries live in a vector.  Parts added during a transaction are read
 * when it's committed, the way a real archive would.
 */
class MemArchive : public Archive {
public:
    explicit MemArchive(const Characteristics& chars)
        : fCharacteristics(chars), fInTransaction(false), fSeekable(true),
          fHFSTypes(false), fMaxNameLen(255), fOpenCount(0),
          fOpenLimit(-1)
        {}
    virtual ~MemArchive(void);

    /* ShrinkIt-like: ':' separator, resource forks, keeps empty rsrc */
    static Characteristics NuFXLike(void);
    /* ZIP-like: '/' separator, no resource forks, MacZip-capable */
    static Characteristics ZipLike(void);

    // Add an entry directly, outside of any transaction.
    MemArchiveEntry* AddTestEntry(const std::string& pathName,
        const std::string& data);

    // Read streams don't seek; makes rewinds reopen the part.
    void SetSeekable(bool seekable) { fSeekable = seekable; }
    // Entries store HFS types instead of ProDOS types.
    void SetHFSTypes(bool hfsTypes) { fHFSTypes = hfsTypes; }
    void SetMaxNameLen(size_t len) { fMaxNameLen = len; }
    int GetOpenCount(void) const { return fOpenCount; }
    // OpenPart fails once this many parts have been opened.
    void SetOpenLimit(int limit) { fOpenLimit = limit; }
    bool IsInTransaction(void) const { return fInTransaction; }

    virtual const Characteristics& GetCharacteristics(void) const override {
        return fCharacteristics;
    }
    virtual long GetEntryCount(void) const override {
        return (long) fEntries.size();
    }
    virtual FileEntry* GetEntry(long idx) const override;
    MemArchiveEntry* GetMemEntry(long idx) const {
        return (MemArchiveEntry*) GetEntry(idx);
    }

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
    MemArchive& operator=(const MemArchive&);
    MemArchive(const MemArchive&);

    struct PendingPart {
        MemArchiveEntry*    pEntry;
        FilePart            part;
        PartSource*         pSource;
    };

    void DiscardPending(void);
    static XferError ReadSource(PartSource* pSource, std::string* pOut);

    Characteristics fCharacteristics;
    bool            fInTransaction;
    bool            fSeekable;
    bool            fHFSTypes;
    size_t          fMaxNameLen;
    int             fOpenCount;
    int             fOpenLimit;

    std::vector<MemArchiveEntry*> fEntries;
    std::vector<MemArchiveEntry*> fNewEntries;
    std::vector<MemArchiveEntry*> fDeleted;
    std::vector<PendingPart> fPendingParts;
};

}   // namespace XferTest

#endif /*XFERLIB_TESTS_MEMARCHIVE_H*/
