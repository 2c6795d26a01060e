/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * XferLib global utility functions.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"


/*
 * Get values from a memory buffer.
 */
uint16_t XferLib::GetShortLE(const uint8_t* ptr)
{
    return *ptr | (uint16_t) *(ptr+1) << 8;
}

uint32_t XferLib::GetLongLE(const uint8_t* ptr)
{
    return *ptr |
            (uint32_t) *(ptr+1) << 8 |
            (uint32_t) *(ptr+2) << 16 |
            (uint32_t) *(ptr+3) << 24;
}

uint16_t XferLib::GetShortBE(const uint8_t* ptr)
{
    return *(ptr+1) | (uint16_t) *ptr << 8;
}

uint32_t XferLib::GetLongBE(const uint8_t* ptr)
{
    return *(ptr+3) |
            (uint32_t) *(ptr+2) << 8 |
            (uint32_t) *(ptr+1) << 16 |
            (uint32_t) *ptr << 24;
}

void XferLib::PutShortBE(uint8_t* ptr, uint16_t val)
{
    *ptr++ = val >> 8;
    *ptr = (uint8_t) val;
}

void XferLib::PutLongBE(uint8_t* ptr, uint32_t val)
{
    *ptr++ = (uint8_t) (val >> 24);
    *ptr++ = (uint8_t) (val >> 16);
    *ptr++ = (uint8_t) (val >> 8);
    *ptr = (uint8_t) val;
}


/*
 * Find the filename component of a pathname.  Uses the fssep passed in.
 * If the fssep is '\0' (as is the case for DOS 3.3), then the entire
 * pathname is returned.
 *
 * A trailing fssep is ignored, so "/foo/bar/" yields "bar/".
 *
 * Always returns a pointer to a string; never returns NULL.
 */
const char* XferLib::FilenameOnly(const char* pathname, char fssep)
{
    assert(pathname != NULL);
    if (fssep == '\0')
        return pathname;

    size_t len = strlen(pathname);
    if (len < 2)
        return pathname;

    /* skip a trailing separator */
    const char* cp = pathname + len - 1;
    if (*cp == fssep)
        cp--;

    while (cp >= pathname) {
        if (*cp == fssep)
            return cp + 1;
        cp--;
    }
    return pathname;
}

/*
 * Convert a ProDOS date/time pair to a time_t, in local time.
 *
 * A date of zero means no date was set.  ProDOS 8 uses 0-39 for the
 * years 2000-2039.
 */
time_t XferLib::ConvertProDOSDateTime(uint16_t prodosDate, uint16_t prodosTime)
{
    if (prodosDate == 0 && prodosTime == 0)
        return kDateNone;

    struct tm tmbuf;
    memset(&tmbuf, 0, sizeof(tmbuf));

    int year = (prodosDate >> 9) & 0x7f;
    if (year < 40)
        year += 100;
    tmbuf.tm_year = year;
    tmbuf.tm_mon = ((prodosDate >> 5) & 0x0f) -1;
    tmbuf.tm_mday = prodosDate & 0x1f;
    tmbuf.tm_hour = (prodosTime >> 8) & 0x1f;
    tmbuf.tm_min = prodosTime & 0x3f;
    tmbuf.tm_sec = 0;
    tmbuf.tm_isdst = -1;

    if (tmbuf.tm_mon < 0 || tmbuf.tm_mon > 11 || tmbuf.tm_mday == 0 ||
        tmbuf.tm_hour > 23 || tmbuf.tm_min > 59)
    {
        return kDateInvalid;
    }

    return mktime(&tmbuf);
}


/*
 * Return a human-readable string for the error.
 */
const char* XferLib::XferStrError(XferError xerr)
{
    if (xerr > 0) {
        const char* msg;
        msg = strerror(xerr);
        if (msg != NULL)
            return msg;
    }

    /*
     * BUG: this should be set up as per-thread storage in an MT environment.
     * So long as valid values are passed in, and the switch statement is
     * kept up to date, we should never have cause to return this.
     */
    static char defaultMsg[32];

    switch (xerr) {
    case kXferErrNone:
        return "(no error)";

    case kXferErrAccessDenied:
        return "access denied";
    case kXferErrWriteProtected:
        return "destination is read-only";

    case kXferErrFileNotFound:
        return "file not found";
    case kXferErrForkNotFound:
        return "fork not found";
    case kXferErrAlreadyOpen:
        return "already open";
    case kXferErrFileOpen:
        return "file is open";
    case kXferErrNotReady:
        return "not ready";
    case kXferErrFileExists:
        return "file already exists";
    case kXferErrDirectoryExists:
        return "directory already exists";

    case kXferErrEOF:
        return "reached end of file";
    case kXferErrReadFailed:
        return "read failed";
    case kXferErrWriteFailed:
        return "write failed";
    case kXferErrGenericIO:
        return "I/O error";

    case kXferErrUnrecognizedFileFmt:
        return "file format not recognized";
    case kXferErrBadFileFormat:
        return "file is not in the expected format";

    case kXferErrBadFile:
        return "file is damaged";
    case kXferErrBadDirectory:
        return "directory is damaged";
    case kXferErrBadArchiveStruct:
        return "archive structure is damaged";

    case kXferErrInvalidFileName:
        return "invalid file name";
    case kXferErrDiskFull:
        return "disk full";
    case kXferErrNameTooLong:
        return "name too long for destination";
    case kXferErrTypeMismatch:
        return "file and directory names collide";
    case kXferErrSelfOverwrite:
        return "cannot overwrite a file with itself";

    case kXferErrGeneric:
        return "generic error";
    case kXferErrInternal:
        return "internal error";
    case kXferErrMalloc:
        return "memory allocation failure";
    case kXferErrInvalidArg:
        return "invalid argument";
    case kXferErrNotSupported:
        return "feature not supported";
    case kXferErrCancelled:
        return "cancelled by user";

    case kXferErrNufxLibInitFailed:
        return "NufxLib initialization failed";

    default:
        sprintf(defaultMsg, "(error=%d)", xerr);
        return defaultMsg;
    }
}
