/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Import converter implementations.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "ImportConverter.h"
#include "PathName.h"


/*
 * ===========================================================================
 *      TextImportConverter
 * ===========================================================================
 */

std::string TextImportConverter::StripExtension(const std::string& fileName) const
{
    static const char kTextExt[] = ".txt";

    if (fileName.length() > strlen(kTextExt) &&
        PathName::EndsWithNoCase(fileName, kTextExt))
    {
        return fileName.substr(0, fileName.length() - strlen(kTextExt));
    }
    return fileName;
}

void TextImportConverter::GetFileTypes(uint32_t* pFileType,
    uint32_t* pAuxType) const
{
    *pFileType = kFileTypeTXT;
    *pAuxType = 0x0000;
}

XferError TextImportConverter::Convert(GenericFD* pIn, FilePart part,
    GenericFD* pOut) const
{
    const size_t kBufSize = 16384;
    XferError xerr = kXferErrNone;
    uint8_t* inBuf = NULL;
    uint8_t* outBuf = NULL;
    bool lastCR = false;

    if (part != kPartDataFork)
        return kXferErrNone;        // no resource fork

    inBuf = new uint8_t[kBufSize];
    outBuf = new uint8_t[kBufSize];

    while (true) {
        size_t actual;
        xerr = pIn->Read(inBuf, kBufSize, &actual);
        if (xerr == kXferErrEOF) {
            xerr = kXferErrNone;
            break;
        }
        if (xerr != kXferErrNone)
            goto bail;
        if (actual == 0)
            break;

        size_t outLen = 0;
        for (size_t i = 0; i < actual; i++) {
            uint8_t ch = inBuf[i];
            if (ch == '\n') {
                if (lastCR) {
                    /* second half of CRLF; already output the CR */
                    lastCR = false;
                    continue;
                }
                ch = '\r';
            } else {
                lastCR = (ch == '\r');
            }
            if (fHighASCII)
                ch |= 0x80;
            outBuf[outLen++] = ch;
        }

        xerr = pOut->Write(outBuf, outLen);
        if (xerr != kXferErrNone)
            goto bail;
    }

bail:
    delete[] inBuf;
    delete[] outBuf;
    return xerr;
}
