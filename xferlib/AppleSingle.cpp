/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * AppleSingle / AppleDouble parsing and generation.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "AppleSingle.h"
#include "PartSource.h"

/*static*/ const uint32_t AppleSingle::kASMagic;
/*static*/ const uint32_t AppleSingle::kADFMagic;
/*static*/ const uint32_t AppleSingle::kVersion1;
/*static*/ const uint32_t AppleSingle::kVersion2;


void AppleSingle::Reset(void)
{
    fIsDouble = false;
    fIsBigEndian = true;
    fVersion = 0;
    memset(fHomeFileSystem, 0, sizeof(fHomeFileSystem));
    fDataOffset = fRsrcOffset = -1;
    fDataLength = fRsrcLength = 0;
    fHasFileName = false;
    fFileName.clear();
    fHasProDOSInfo = fHasFinderInfo = false;
    fFileType = fAuxType = 0;
    fHFSFileType = fHFSCreator = 0;
    fAccess = kFileAccessUnlocked;
    fCreateWhen = fModWhen = kDateNone;
}

uint16_t AppleSingle::Get16(const uint8_t* buf) const
{
    return fIsBigEndian ? GetShortBE(buf) : GetShortLE(buf);
}

uint32_t AppleSingle::Get32(const uint8_t* buf) const
{
    return fIsBigEndian ? GetLongBE(buf) : GetLongLE(buf);
}

/*static*/ bool AppleSingle::TestMagic(GenericFD* pGFD, bool isDouble)
{
    uint8_t buf[4];
    bool result = false;

    if (pGFD->Rewind() != kXferErrNone)
        return false;
    if (pGFD->Read(buf, sizeof(buf)) == kXferErrNone) {
        if (isDouble)
            result = (GetLongBE(buf) == kADFMagic);
        else
            result = (GetLongBE(buf) == kASMagic || GetLongLE(buf) == kASMagic);
    }
    (void) pGFD->Rewind();
    return result;
}

XferError AppleSingle::Parse(GenericFD* pGFD, bool isDouble)
{
    XferError xerr;
    uint8_t headerBuf[kHeaderLen];
    uint8_t* entryBuf = NULL;
    TOCEntry* entries = NULL;
    xf_off_t fileLen;
    uint32_t magic;
    uint16_t numEntries;

    Reset();
    fIsDouble = isDouble;

    if (!pGFD->IsSeekable())
        return kXferErrNotSupported;
    xerr = pGFD->GetLength(&fileLen);
    if (xerr != kXferErrNone)
        return xerr;
    xerr = pGFD->Rewind();
    if (xerr != kXferErrNone)
        return xerr;

    /*
     * Read the file header.
     */
    if (pGFD->Read(headerBuf, kHeaderLen) != kXferErrNone)
        return kXferErrUnrecognizedFileFmt;    // too short
    if (headerBuf[1] == 0x05) {
        // big-endian (the documented byte order)
        fIsBigEndian = true;
    } else if (!isDouble) {
        // little-endian (Mac OS X generated)
        fIsBigEndian = false;
    } else {
        return kXferErrUnrecognizedFileFmt;
    }
    magic = Get32(&headerBuf[0]);
    fVersion = Get32(&headerBuf[4]);
    memcpy(fHomeFileSystem, &headerBuf[8], kHomeFileSystemLen);
    fHomeFileSystem[kHomeFileSystemLen] = '\0';
    numEntries = Get16(&headerBuf[8 + kHomeFileSystemLen]);

    if (magic != (isDouble ? kADFMagic : kASMagic)) {
        LOGD("File does not have %s magic number",
            isDouble ? "AppleDouble" : "AppleSingle");
        return kXferErrUnrecognizedFileFmt;
    }
    if (fVersion != kVersion1 && fVersion != kVersion2) {
        LOGI("AS file has unrecognized version number 0x%08x", fVersion);
        return kXferErrUnrecognizedFileFmt;
    }

    /*
     * Read the entries (a table of contents).  There are at most 65535
     * entries, so we don't need to worry about capping it at a "reasonable"
     * size.
     */
    size_t totalEntryLen = numEntries * kEntryLen;
    if ((xf_off_t) (kHeaderLen + totalEntryLen) > fileLen) {
        LOGW("AS file too short for %u entries", numEntries);
        return kXferErrBadFileFormat;
    }
    entries = new TOCEntry[numEntries == 0 ? 1 : numEntries];
    if (numEntries != 0) {
        entryBuf = new uint8_t[totalEntryLen];
        xerr = pGFD->Read(entryBuf, totalEntryLen);
        if (xerr != kXferErrNone) {
            LOGW("Unable to read entry list from AS file (err=%d)", xerr);
            goto bail;
        }
    }

    {
        const uint8_t* ptr = entryBuf;
        for (size_t i = 0; i < numEntries; i++, ptr += kEntryLen) {
            entries[i].entryId = Get32(ptr);
            entries[i].offset = Get32(ptr + 4);
            entries[i].length = Get32(ptr + 8);

            /* make sure the file actually has everything */
            uint64_t end = (uint64_t) entries[i].offset + entries[i].length;
            if (end > (uint64_t) fileLen) {
                LOGW("AS entry %u ends at %llu, file len is only %ld",
                    entries[i].entryId, (unsigned long long) end,
                    (long) fileLen);
                xerr = kXferErrBadFileFormat;
                goto bail;
            }
        }
    }

    /*
     * Walk through the TOC entries.
     */
    for (size_t i = 0; i < numEntries; i++) {
        const TOCEntry* pToc = &entries[i];
        switch (pToc->entryId) {
        case kIdDataFork:
            if (isDouble) {
                LOGI("Ignoring data fork in AppleDouble file");
                break;
            }
            if (fDataOffset >= 0) {
                LOGW("Found two data forks in AppleSingle");
                xerr = kXferErrBadFileFormat;
                goto bail;
            }
            fDataOffset = pToc->offset;
            fDataLength = pToc->length;
            break;
        case kIdResourceFork:
            if (fRsrcOffset >= 0) {
                LOGW("Found two rsrc forks in AppleSingle");
                xerr = kXferErrBadFileFormat;
                goto bail;
            }
            fRsrcOffset = pToc->offset;
            fRsrcLength = pToc->length;
            break;
        case kIdRealName:
            fHasFileName = HandleRealName(pGFD, pToc);
            break;
        case kIdComment:
            // We could handle this, but I don't think this is widely used.
            break;
        case kIdFileInfo:
            if (HandleFileInfo(pGFD, pToc))
                fHasProDOSInfo = true;
            break;
        case kIdFileDatesInfo:
            (void) HandleFileDatesInfo(pGFD, pToc);
            break;
        case kIdFinderInfo:
            fHasFinderInfo = HandleFinderInfo(pGFD, pToc);
            break;
        case kIdProDOSFileInfo:
            // this takes precedence over Finder info
            if (HandleProDOSFileInfo(pGFD, pToc))
                fHasProDOSInfo = true;
            break;
        case kIdBWIcon:
        case kIdColorIcon:
        case kIdMacintoshFileInfo:
        case kIdMSDOSFileInfo:
        case kIdShortName:
        case kIdAFPFileInfo:
        case kIdDirectoryId:
            // We're not interested in these.
            break;
        default:
            LOGD("Ignoring entry with type=%u", pToc->entryId);
            break;
        }
    }

    /*
     * If there was no ProDOS info, see if the Finder info is carrying
     * ProDOS types.
     */
    if (!fHasProDOSInfo && fHasFinderInfo && fHFSCreator == kPdosCreator &&
        (fHFSFileType >> 24) == 'p')
    {
        fFileType = (fHFSFileType >> 16) & 0xff;
        fAuxType = fHFSFileType & 0xffff;
    }

    xerr = kXferErrNone;

bail:
    delete[] entryBuf;
    delete[] entries;
    return xerr;
}

bool AppleSingle::GetForkExtent(FilePart part, xf_off_t* pOffset,
    xf_off_t* pLength) const
{
    if (part == kPartDataFork && fDataOffset >= 0) {
        *pOffset = fDataOffset;
        *pLength = fDataLength;
        return true;
    } else if (part == kPartRsrcFork && fRsrcOffset >= 0) {
        *pOffset = fRsrcOffset;
        *pLength = fRsrcLength;
        return true;
    }
    return false;
}

/*
 * Read a fixed-size entry into "buf".
 */
XferError AppleSingle::ReadEntry(GenericFD* pGFD, const TOCEntry* pToc,
    uint8_t* buf)
{
    XferError xerr = pGFD->Seek(pToc->offset, kSeekSet);
    if (xerr != kXferErrNone)
        return xerr;
    return pGFD->Read(buf, pToc->length);
}

bool AppleSingle::HandleRealName(GenericFD* pGFD, const TOCEntry* pToc)
{
    if (pToc->length > kMaxNameLen) {
        // this is a single file name, not a full path
        LOGW("Ignoring excessively long filename (%u)", pToc->length);
        return false;
    }
    if (pToc->length == 0)
        return false;

    char* buf = new char[pToc->length + 1];
    if (ReadEntry(pGFD, pToc, (uint8_t*) buf) != kXferErrNone) {
        LOGW("failed reading file name");
        delete[] buf;
        return false;
    }
    buf[pToc->length] = '\0';

    // v1 names are Mac OS Roman, v2 names are UTF-8; we keep the bytes
    fFileName = buf;

    delete[] buf;
    return !fFileName.empty();
}

bool AppleSingle::HandleFileInfo(GenericFD* pGFD, const TOCEntry* pToc)
{
    if (strcmp(fHomeFileSystem, "ProDOS          ") != 0) {
        LOGD("Ignoring file info for filesystem '%s'", fHomeFileSystem);
        return false;
    }
    if (pToc->length != kFileInfoLen) {
        LOGW("Bad length on ProDOS File Info (%d)", pToc->length);
        return false;
    }

    uint8_t buf[kFileInfoLen];
    if (ReadEntry(pGFD, pToc, buf) != kXferErrNone) {
        LOGW("failed reading ProDOS File Info");
        return false;
    }

    uint16_t createDate, createTime, modDate, modTime;
    createDate = Get16(buf);
    createTime = Get16(buf + 2);
    modDate = Get16(buf + 4);
    modTime = Get16(buf + 6);
    fAccess = Get16(buf + 8);
    fFileType = Get16(buf + 10);
    fAuxType = Get32(buf + 12);
    fCreateWhen = ConvertProDOSDateTime(createDate, createTime);
    fModWhen = ConvertProDOSDateTime(modDate, modTime);
    return true;
}

bool AppleSingle::HandleFileDatesInfo(GenericFD* pGFD, const TOCEntry* pToc)
{
    if (pToc->length != kFileDatesLen) {
        LOGW("Bad length on File Dates info (%d)", pToc->length);
        return false;
    }

    uint8_t buf[kFileDatesLen];
    if (ReadEntry(pGFD, pToc, buf) != kXferErrNone) {
        LOGW("failed reading File Dates info");
        return false;
    }

    // ignore backup date and access date
    uint32_t dates[2];
    time_t* whens[2] = { &fCreateWhen, &fModWhen };
    dates[0] = Get32(buf);
    dates[1] = Get32(buf + 4);

    // The Mac OS X applesingle tool creates entries with some pretty
    // wild values, so range-check them.
    for (int i = 0; i < 2; i++) {
        if (dates[i] == kUnknownDate) {
            *whens[i] = kDateNone;
            continue;
        }
        int64_t tmpTime = (int64_t) (int32_t) dates[i] + kTimeOffset;
        if (tmpTime >= 0 && tmpTime <= 0xffffffffLL)
            *whens[i] = (time_t) tmpTime;
        else
            *whens[i] = kDateNone;
    }
    return true;
}

bool AppleSingle::HandleProDOSFileInfo(GenericFD* pGFD, const TOCEntry* pToc)
{
    if (pToc->length != kProDOSInfoLen) {
        LOGW("Bad length on ProDOS file info (%d)", pToc->length);
        return false;
    }

    uint8_t buf[kProDOSInfoLen];
    if (ReadEntry(pGFD, pToc, buf) != kXferErrNone) {
        LOGW("failed reading ProDOS info");
        return false;
    }

    fAccess = Get16(buf);
    fFileType = Get16(buf + 2);
    fAuxType = Get32(buf + 4);
    return true;
}

bool AppleSingle::HandleFinderInfo(GenericFD* pGFD, const TOCEntry* pToc)
{
    // Some files have a truncated Finder info; we only need the first 8.
    if (pToc->length < 8 || pToc->length > kFinderInfoLen) {
        LOGW("Bad length on Finder info (%d)", pToc->length);
        return false;
    }

    uint8_t buf[kFinderInfoLen];
    if (ReadEntry(pGFD, pToc, buf) != kXferErrNone) {
        LOGW("failed reading Finder info");
        return false;
    }

    // These values are stored big-endian even on Mac OS X.
    fHFSFileType = GetLongBE(buf);
    fHFSCreator = GetLongBE(buf + 4);
    return true;
}


/*
 * ===========================================================================
 *      Generation
 * ===========================================================================
 */

/*
 * Copy the full contents of a part source to "pOut", returning the length.
 */
/*static*/ XferError AppleSingle::CopyFromSource(PartSource* pSrc,
    GenericFD* pOut, uint32_t* pLength)
{
    const size_t kCopyBufSize = 32768;
    XferError xerr;
    uint8_t* buf = NULL;
    uint64_t total = 0;
    ScopedPartSource guard(pSrc);

    xerr = pSrc->Open();
    if (xerr != kXferErrNone)
        goto bail;

    buf = new uint8_t[kCopyBufSize];
    while (true) {
        size_t actual;
        xerr = pSrc->Read(buf, kCopyBufSize, &actual);
        if (xerr != kXferErrNone)
            goto bail;
        if (actual == 0)
            break;
        xerr = pOut->Write(buf, actual);
        if (xerr != kXferErrNone)
            goto bail;
        total += actual;
        if (total > 0xffffffffULL) {
            LOGW("Fork too large for AppleSingle");
            xerr = kXferErrNotSupported;
            goto bail;
        }
    }
    *pLength = (uint32_t) total;

bail:
    delete[] buf;
    return xerr;
}

/*static*/ XferError AppleSingle::Generate(const FileAttribs& attrs,
    const std::string& fileName, PartSource* pDataSrc, PartSource* pRsrcSrc,
    bool asDouble, GenericFD* pOut)
{
    XferError xerr;
    TOCEntry toc[6];
    int numEntries = 0;
    int dataIdx = -1, rsrcIdx = -1;
    uint8_t* hdrBuf = NULL;
    size_t hdrLen;
    uint32_t offset;

    if (pOut == NULL || !pOut->IsSeekable())
        return kXferErrInvalidArg;

    bool hasFinderInfo = (attrs.hfsFileType != 0 || attrs.hfsCreator != 0);
    bool hasProDOSInfo = (attrs.fileType != 0 || attrs.auxType != 0 ||
        attrs.access != 0);
    bool hasData = (!asDouble && pDataSrc != NULL);
    bool hasRsrc = (pRsrcSrc != NULL);

    /*
     * Lay out the table of contents.  Fork lengths aren't known yet.
     */
    if (!fileName.empty()) {
        toc[numEntries].entryId = kIdRealName;
        toc[numEntries].length = (uint32_t) fileName.length();
        numEntries++;
    }
    toc[numEntries].entryId = kIdFileDatesInfo;
    toc[numEntries].length = kFileDatesLen;
    numEntries++;
    if (hasFinderInfo) {
        toc[numEntries].entryId = kIdFinderInfo;
        toc[numEntries].length = kFinderInfoLen;
        numEntries++;
    }
    if (hasProDOSInfo) {
        toc[numEntries].entryId = kIdProDOSFileInfo;
        toc[numEntries].length = kProDOSInfoLen;
        numEntries++;
    }
    if (hasData) {
        dataIdx = numEntries;
        toc[numEntries].entryId = kIdDataFork;
        toc[numEntries].length = 0;
        numEntries++;
    }
    if (hasRsrc) {
        rsrcIdx = numEntries;
        toc[numEntries].entryId = kIdResourceFork;
        toc[numEntries].length = 0;
        numEntries++;
    }

    offset = (uint32_t) (kHeaderLen + numEntries * kEntryLen);
    for (int i = 0; i < numEntries; i++) {
        toc[i].offset = offset;
        offset += toc[i].length;
    }

    /*
     * Build the header, the TOC, and the fixed-size entries in memory.
     */
    hdrLen = offset;
    hdrBuf = new uint8_t[hdrLen];
    memset(hdrBuf, 0, hdrLen);
    PutLongBE(hdrBuf, asDouble ? kADFMagic : kASMagic);
    PutLongBE(hdrBuf + 4, kVersion2);
    PutShortBE(hdrBuf + 8 + kHomeFileSystemLen, (uint16_t) numEntries);

    for (int i = 0; i < numEntries; i++) {
        uint8_t* tocPtr = hdrBuf + kHeaderLen + i * kEntryLen;
        uint8_t* ptr = hdrBuf + toc[i].offset;
        PutLongBE(tocPtr, toc[i].entryId);
        PutLongBE(tocPtr + 4, toc[i].offset);
        PutLongBE(tocPtr + 8, toc[i].length);

        switch (toc[i].entryId) {
        case kIdRealName:
            memcpy(ptr, fileName.data(), fileName.length());
            break;
        case kIdFileDatesInfo:
            {
                time_t whens[2] = { attrs.createWhen, attrs.modWhen };
                for (int j = 0; j < 2; j++) {
                    uint32_t val = kUnknownDate;
                    if (IsValidDate(whens[j]))
                        val = (uint32_t) (int32_t) (whens[j] - kTimeOffset);
                    PutLongBE(ptr + j * 4, val);
                }
                PutLongBE(ptr + 8, kUnknownDate);       // backup
                PutLongBE(ptr + 12, kUnknownDate);      // access
            }
            break;
        case kIdFinderInfo:
            PutLongBE(ptr, attrs.hfsFileType);
            PutLongBE(ptr + 4, attrs.hfsCreator);
            break;
        case kIdProDOSFileInfo:
            PutShortBE(ptr, (uint16_t) attrs.access);
            PutShortBE(ptr + 2, (uint16_t) attrs.fileType);
            PutLongBE(ptr + 4, attrs.auxType);
            break;
        default:
            break;
        }
    }

    xerr = pOut->Rewind();
    if (xerr != kXferErrNone)
        goto bail;
    xerr = pOut->Write(hdrBuf, hdrLen);
    if (xerr != kXferErrNone)
        goto bail;

    /*
     * Append the forks, then go back and fix up the TOC.
     */
    if (hasData) {
        xerr = CopyFromSource(pDataSrc, pOut, &toc[dataIdx].length);
        if (xerr != kXferErrNone)
            goto bail;
        if (hasRsrc)
            toc[rsrcIdx].offset = toc[dataIdx].offset + toc[dataIdx].length;
    }
    if (hasRsrc) {
        xerr = CopyFromSource(pRsrcSrc, pOut, &toc[rsrcIdx].length);
        if (xerr != kXferErrNone)
            goto bail;
    }

    {
        int fixIdx[2] = { dataIdx, rsrcIdx };
        for (int i = 0; i < 2; i++) {
            if (fixIdx[i] < 0)
                continue;
            uint8_t tocBuf[kEntryLen];
            PutLongBE(tocBuf, toc[fixIdx[i]].entryId);
            PutLongBE(tocBuf + 4, toc[fixIdx[i]].offset);
            PutLongBE(tocBuf + 8, toc[fixIdx[i]].length);
            xerr = pOut->Seek(kHeaderLen + fixIdx[i] * kEntryLen, kSeekSet);
            if (xerr != kXferErrNone)
                goto bail;
            xerr = pOut->Write(tocBuf, kEntryLen);
            if (xerr != kXferErrNone)
                goto bail;
        }
    }
    xerr = pOut->Seek(0, kSeekEnd);

    LOGD("Generated %s with %d entries (data=%u rsrc=%u)",
        asDouble ? "AppleDouble" : "AppleSingle", numEntries,
        hasData ? toc[dataIdx].length : 0, hasRsrc ? toc[rsrcIdx].length : 0);

bail:
    delete[] hdrBuf;
    return xerr;
}
