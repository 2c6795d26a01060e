/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * AppleSingle and AppleDouble support.  AppleSingle packages both forks of
 * a file, along with its attributes, into an ordinary file.  AppleDouble is
 * the same thing without the data fork; it lives next to the plain file,
 * usually with a "._" prefix on the name.
 *
 * Files generated by GS/ShrinkIt are version 1 with Mac OS Roman
 * filenames.  The Mac OS X "applesingle" tool generates version 2 files
 * with UTF-8 filenames, and writes them little-endian, so we have to use
 * the magic number to figure out which end is which.  AppleDouble files
 * are always big-endian.
 *
 * We write version 2, big-endian.
 */
#ifndef XFERLIB_APPLESINGLE_H
#define XFERLIB_APPLESINGLE_H

#include "XferLib.h"

namespace XferLib {

/*
 * Parsed AppleSingle or AppleDouble header.
 *
 * The parser reads from a seekable descriptor, which must remain open
 * for as long as the fork offsets are being used.
 */
class XFERLIB_API AppleSingle {
public:
    AppleSingle(void) { Reset(); }
    ~AppleSingle(void) {}

    static const uint32_t kASMagic = 0x00051600;
    static const uint32_t kADFMagic = 0x00051607;
    static const uint32_t kVersion1 = 0x00010000;
    static const uint32_t kVersion2 = 0x00020000;

    /*
     * Parse the header and table of contents.  If "isDouble" is set, the
     * file must be AppleDouble, otherwise it must be AppleSingle.
     *
     * Returns kXferErrUnrecognizedFileFmt if the file isn't the right kind,
     * kXferErrBadFileFormat if it looks right but is damaged (e.g. an entry
     * runs off the end, or there are two data forks).  Either way the file
     * should be treated as something else.
     */
    XferError Parse(GenericFD* pGFD, bool isDouble);

    /*
     * Quick test of the magic number.  The file position is left at the
     * start of the file.
     */
    static bool TestMagic(GenericFD* pGFD, bool isDouble);

    bool IsDouble(void) const { return fIsDouble; }
    bool IsBigEndian(void) const { return fIsBigEndian; }
    uint32_t GetVersion(void) const { return fVersion; }

    bool HasDataFork(void) const { return fDataOffset >= 0; }
    bool HasRsrcFork(void) const { return fRsrcOffset >= 0; }
    xf_off_t GetDataOffset(void) const { return fDataOffset; }
    xf_off_t GetDataLength(void) const { return fDataLength; }
    xf_off_t GetRsrcOffset(void) const { return fRsrcOffset; }
    xf_off_t GetRsrcLength(void) const { return fRsrcLength; }

    // Find the offset and length of a fork.  Returns false if not present.
    bool GetForkExtent(FilePart part, xf_off_t* pOffset,
        xf_off_t* pLength) const;

    bool HasFileName(void) const { return fHasFileName; }
    const std::string& GetFileName(void) const { return fFileName; }

    bool HasProDOSInfo(void) const { return fHasProDOSInfo; }
    bool HasFinderInfo(void) const { return fHasFinderInfo; }
    uint32_t GetFileType(void) const { return fFileType; }
    uint32_t GetAuxType(void) const { return fAuxType; }
    uint32_t GetHFSFileType(void) const { return fHFSFileType; }
    uint32_t GetHFSCreator(void) const { return fHFSCreator; }
    uint32_t GetAccess(void) const { return fAccess; }
    time_t GetCreateWhen(void) const { return fCreateWhen; }
    time_t GetModWhen(void) const { return fModWhen; }

    /*
     * Generate a version 2 file from the attributes and fork sources.
     * Either source may be NULL.  The data fork is ignored if "asDouble"
     * is set.  The sources are opened, read to the end, and closed.
     *
     * "fileName" is stored as the real name if it's not empty.  "pOut"
     * must be seekable, because the fork lengths are filled in at the end.
     */
    static XferError Generate(const FileAttribs& attrs,
        const std::string& fileName, PartSource* pDataSrc,
        PartSource* pRsrcSrc, bool asDouble, GenericFD* pOut);

private:
    // File header.  "homeFileSystem" became all-zero "filler" in v2.
    static const int kHomeFileSystemLen = 16;
    static const size_t kHeaderLen = 4 + 4 + kHomeFileSystemLen + 2;

    struct TOCEntry {
        uint32_t    entryId;
        uint32_t    offset;
        uint32_t    length;
    };
    static const size_t kEntryLen = 4 + 4 + 4;

    // predefined values for entryId
    enum {
        kIdDataFork             = 1,
        kIdResourceFork         = 2,
        kIdRealName             = 3,
        kIdComment              = 4,
        kIdBWIcon               = 5,
        kIdColorIcon            = 6,
        kIdFileInfo             = 7,    // version 1 only
        kIdFileDatesInfo        = 8,    // version 2 only
        kIdFinderInfo           = 9,
        kIdMacintoshFileInfo    = 10,   // here and below are version 2 only
        kIdProDOSFileInfo       = 11,
        kIdMSDOSFileInfo        = 12,
        kIdShortName            = 13,
        kIdAFPFileInfo          = 14,
        kIdDirectoryId          = 15,
    };

    static const int kFileDatesLen = 16;
    static const int kFinderInfoLen = 32;
    static const int kProDOSInfoLen = 8;
    static const int kFileInfoLen = 16;
    static const int kMaxNameLen = 1024;

    // Seconds between Jan 1 1970 and Jan 1 2000.  Does not include
    // leap-seconds.
    static const int32_t kTimeOffset = 946684800;
    static const uint32_t kUnknownDate = 0x80000000;

    void Reset(void);
    uint16_t Get16(const uint8_t* buf) const;
    uint32_t Get32(const uint8_t* buf) const;

    XferError ReadEntry(GenericFD* pGFD, const TOCEntry* pToc, uint8_t* buf);
    bool HandleRealName(GenericFD* pGFD, const TOCEntry* pToc);
    bool HandleFileInfo(GenericFD* pGFD, const TOCEntry* pToc);
    bool HandleFileDatesInfo(GenericFD* pGFD, const TOCEntry* pToc);
    bool HandleFinderInfo(GenericFD* pGFD, const TOCEntry* pToc);
    bool HandleProDOSFileInfo(GenericFD* pGFD, const TOCEntry* pToc);

    static XferError CopyFromSource(PartSource* pSrc, GenericFD* pOut,
        uint32_t* pLength);

    bool        fIsDouble;
    bool        fIsBigEndian;
    uint32_t    fVersion;
    char        fHomeFileSystem[kHomeFileSystemLen + 1];

    xf_off_t    fDataOffset;    // -1 if no data fork
    xf_off_t    fDataLength;
    xf_off_t    fRsrcOffset;    // -1 if no resource fork
    xf_off_t    fRsrcLength;

    bool        fHasFileName;
    std::string fFileName;
    bool        fHasProDOSInfo;
    bool        fHasFinderInfo;
    uint32_t    fFileType;
    uint32_t    fAuxType;
    uint32_t    fHFSFileType;
    uint32_t    fHFSCreator;
    uint32_t    fAccess;
    time_t      fCreateWhen;
    time_t      fModWhen;
};

}   // namespace XferLib

#endif /*XFERLIB_APPLESINGLE_H*/
