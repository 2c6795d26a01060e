/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Generic file descriptor class.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"

/*
 * ===========================================================================
 *      GenericFD utility functions
 * ===========================================================================
 */

XferError GenericFD::GetLength(xf_off_t* pLength)
{
    XferError xerr;
    xf_off_t oldPosn;

    if (!IsSeekable())
        return kXferErrNotSupported;

    oldPosn = Tell();
    if (oldPosn < 0)
        return kXferErrGenericIO;
    xerr = Seek(0, kSeekEnd);
    if (xerr != kXferErrNone)
        return xerr;
    *pLength = Tell();
    return Seek(oldPosn, kSeekSet);
}


/*
 * ===========================================================================
 *      GFDFile
 * ===========================================================================
 */

/*
 * The stdio functions are buffered and, therefore, faster for small
 * operations.  We need 64-bit file offsets, so we use fseeko/ftello.
 */

void GFDFile::SetPathName(const char* filename)
{
    delete[] fPathName;
    fPathName = new char[strlen(filename) +1];
    strcpy(fPathName, filename);
}

XferError GFDFile::Open(const char* filename, bool readOnly)
{
    XferError xerr = kXferErrNone;

    if (fFp != NULL)
        return kXferErrAlreadyOpen;
    if (filename == NULL || filename[0] == '\0')
        return kXferErrInvalidArg;

    SetPathName(filename);

    errno = 0;
    fFp = fopen(filename, readOnly ? "rb" : "r+b");
    if (fFp == NULL) {
        if (errno == EACCES)
            xerr = kXferErrAccessDenied;
        else if (errno == ENOENT)
            xerr = kXferErrFileNotFound;
        else
            xerr = ErrnoOrGeneric();
        LOGI("  GFDFile Open failed opening '%s', ro=%d (err=%d)",
            filename, readOnly, xerr);
        return xerr;
    }
    fReadOnly = readOnly;
    return xerr;
}

XferError GFDFile::Create(const char* filename)
{
    XferError xerr = kXferErrNone;

    if (fFp != NULL)
        return kXferErrAlreadyOpen;
    if (filename == NULL || filename[0] == '\0')
        return kXferErrInvalidArg;

    SetPathName(filename);

    errno = 0;
    fFp = fopen(filename, "w+b");
    if (fFp == NULL) {
        if (errno == EACCES)
            xerr = kXferErrAccessDenied;
        else
            xerr = ErrnoOrGeneric();
        LOGI("  GFDFile Create failed on '%s' (err=%d)", filename, xerr);
        return xerr;
    }
    fReadOnly = false;
    return xerr;
}

XferError GFDFile::OpenTemp(void)
{
    if (fFp != NULL)
        return kXferErrAlreadyOpen;

    errno = 0;
    fFp = tmpfile();
    if (fFp == NULL) {
        XferError xerr = ErrnoOrGeneric();
        LOGW("  GFDFile unable to create temp file (err=%d)", xerr);
        return xerr;
    }
    delete[] fPathName;
    fPathName = NULL;
    fReadOnly = false;
    return kXferErrNone;
}

XferError GFDFile::Read(void* buf, size_t length, size_t* pActual)
{
    XferError xerr = kXferErrNone;
    size_t actual;

    if (fFp == NULL)
        return kXferErrNotReady;
    actual = ::fread(buf, 1, length, fFp);
    if (actual == 0) {
        if (feof(fFp))
            return kXferErrEOF;
        if (ferror(fFp)) {
            xerr = ErrnoOrGeneric();
            return xerr;
        }
        LOGI("MYSTERY FREAD RESULT");
        return kXferErrInternal;
    }

    if (pActual == NULL) {
        if (actual != length) {
            xerr = feof(fFp) ? kXferErrEOF : ErrnoOrGeneric();
            LOGW("  GFDFile Read failed on %lu bytes (actual=%lu, err=%d)",
                (unsigned long) length, (unsigned long) actual, xerr);
            return xerr;
        }
    } else {
        *pActual = actual;
    }
    return xerr;
}

XferError GFDFile::Write(const void* buf, size_t length, size_t* pActual)
{
    XferError xerr = kXferErrNone;

    if (fFp == NULL)
        return kXferErrNotReady;
    if (fReadOnly)
        return kXferErrAccessDenied;
    if (length == 0)
        return kXferErrNone;
    if (::fwrite(buf, length, 1, fFp) != 1) {
        xerr = ErrnoOrGeneric();
        LOGW("  GFDFile Write failed on %lu bytes (err=%d)",
            (unsigned long) length, xerr);
        return xerr;
    }
    if (pActual != NULL)
        *pActual = length;
    return xerr;
}

XferError GFDFile::Seek(xf_off_t offset, XferWhence whence)
{
    XferError xerr = kXferErrNone;

    if (fFp == NULL)
        return kXferErrNotReady;
    if (::fseeko(fFp, offset, whence) != 0) {
        xerr = ErrnoOrGeneric();
        LOGI("  GFDFile Seek failed (err=%d)", xerr);
        return xerr;
    }
    return xerr;
}

xf_off_t GFDFile::Tell(void)
{
    xf_off_t result;

    if (fFp == NULL)
        return (xf_off_t) -1;
    result = ::ftello(fFp);
    if (result == -1) {
        LOGI("  GFDFile Tell failed (err=%d)", errno);
    }
    return result;
}

XferError GFDFile::Truncate(void)
{
    int cc;

    if (fFp == NULL)
        return kXferErrNotReady;
    fflush(fFp);
    cc = ::ftruncate(fileno(fFp), Tell());
    if (cc != 0)
        return kXferErrWriteFailed;
    return kXferErrNone;
}

XferError GFDFile::Close(void)
{
    if (fFp == NULL)
        return kXferErrNotReady;

    LOGV("  GFDFile closing '%s'", fPathName == NULL ? "(temp)" : fPathName);
    int cc = fclose(fFp);
    fFp = NULL;
    if (cc != 0)
        return kXferErrWriteFailed;     // buffered data didn't make it
    return kXferErrNone;
}


/*
 * ===========================================================================
 *      GFDBuffer
 * ===========================================================================
 */

XferError GFDBuffer::Open(void* buffer, xf_off_t length, bool doDelete,
    bool doExpand, bool readOnly)
{
    if (fBuffer != NULL)
        return kXferErrAlreadyOpen;
    if (length < 0 || (length == 0 && buffer != NULL))
        return kXferErrInvalidArg;
    if (length > kMaxReasonableSize) {
        // be reasonable
        LOGI(" GFDBuffer refusing to allocate buffer size(long)=%ld bytes",
            (long) length);
        return kXferErrInvalidArg;
    }

    /* if buffer is NULL, allocate it ourselves */
    if (buffer == NULL) {
        fAllocLength = (long) length;
        if (fAllocLength == 0)
            fAllocLength = 8*1024;
        fBuffer = new uint8_t[fAllocLength];
        doDelete = true;
    } else {
        fBuffer = (uint8_t*) buffer;
        fAllocLength = (long) length;
    }

    fLength = (long) length;
    fDoDelete = doDelete;
    fDoExpand = doExpand;
    fReadOnly = readOnly;

    fCurrentOffset = 0;

    return kXferErrNone;
}

XferError GFDBuffer::Read(void* buf, size_t length, size_t* pActual)
{
    if (fBuffer == NULL)
        return kXferErrNotReady;
    if (length == 0)
        return kXferErrInvalidArg;

    if (fCurrentOffset + (long)length > fLength) {
        if (fCurrentOffset >= fLength)
            return kXferErrEOF;
        if (pActual == NULL) {
            LOGW("  GFDBuffer underrun off=%ld len=%lu flen=%ld",
                (long) fCurrentOffset, (unsigned long) length, (long) fLength);
            return kXferErrEOF;
        }
        length = (size_t) (fLength - fCurrentOffset);
    }
    if (pActual != NULL)
        *pActual = length;

    memcpy(buf, fBuffer + fCurrentOffset, length);
    fCurrentOffset += length;

    return kXferErrNone;
}

XferError GFDBuffer::Write(const void* buf, size_t length, size_t* pActual)
{
    if (fBuffer == NULL)
        return kXferErrNotReady;
    if (fReadOnly)
        return kXferErrAccessDenied;
    if (fCurrentOffset + (long)length > fLength) {
        if (fCurrentOffset + (long)length <= fAllocLength) {
            /* fits inside allocated space, so just extend length */
            fLength = (long) fCurrentOffset + (long)length;
        } else {
            if (!fDoExpand) {
                LOGI("  GFDBuffer overrun off=%ld len=%lu flen=%ld",
                    (long) fCurrentOffset, (unsigned long) length,
                    (long) fLength);
                return kXferErrDiskFull;
            }

            /*
             * Does not fit, realloc buffer.  Grow by at least half again
             * so that a long run of small writes doesn't go quadratic.
             *
             * We delete the old buffer unless "doDelete" is not set, in
             * which case we just drop the pointer.  Anything we allocate
             * here can and will be deleted.
             */
            long newAlloc = (long) fCurrentOffset + (long)length + 8*1024;
            if (newAlloc < fAllocLength + fAllocLength / 2)
                newAlloc = fAllocLength + fAllocLength / 2;
            if (newAlloc > kMaxReasonableSize) {
                LOGW("GFDBuffer refusing to grow past %ld", newAlloc);
                return kXferErrMalloc;
            }
            LOGV("Reallocating buffer (new size = %ld)", newAlloc);
            uint8_t* newBuf = new uint8_t[newAlloc];
            memcpy(newBuf, fBuffer, fLength);

            if (fDoDelete)
                delete[] fBuffer;
            else
                fDoDelete = true;       // future deletions are okay

            fBuffer = newBuf;
            fAllocLength = newAlloc;
            fLength = (long) fCurrentOffset + (long)length;
        }
    }

    memcpy(fBuffer + fCurrentOffset, buf, length);
    fCurrentOffset += length;
    if (pActual != NULL)
        *pActual = length;

    return kXferErrNone;
}

XferError GFDBuffer::Seek(xf_off_t offset, XferWhence whence)
{
    if (fBuffer == NULL)
        return kXferErrNotReady;

    switch (whence) {
    case kSeekSet:
        if (offset < 0 || offset > fLength)
            return kXferErrInvalidArg;
        fCurrentOffset = offset;
        break;
    case kSeekEnd:
        if (offset > 0 || offset < -fLength)
            return kXferErrInvalidArg;
        fCurrentOffset = fLength + offset;
        break;
    case kSeekCur:
        if (offset < -fCurrentOffset ||
            offset > (fLength - fCurrentOffset))
        {
            return kXferErrInvalidArg;
        }
        fCurrentOffset += offset;
        break;
    default:
        assert(false);
        return kXferErrInvalidArg;
    }

    assert(fCurrentOffset >= 0 && fCurrentOffset <= fLength);
    return kXferErrNone;
}

xf_off_t GFDBuffer::Tell(void)
{
    if (fBuffer == NULL)
        return (xf_off_t) -1;
    return fCurrentOffset;
}

XferError GFDBuffer::Close(void)
{
    if (fBuffer == NULL)
        return kXferErrNone;

    if (fDoDelete)
        delete[] fBuffer;
    fBuffer = NULL;
    fLength = fAllocLength = 0;

    return kXferErrNone;
}


/*
 * ===========================================================================
 *      GFDSlice
 * ===========================================================================
 */

XferError GFDSlice::Open(GenericFD* pGFD, xf_off_t start, xf_off_t length)
{
    if (pGFD == NULL || start < 0 || length < 0)
        return kXferErrInvalidArg;
    if (fpGFD != NULL)
        return kXferErrAlreadyOpen;
    if (!pGFD->IsSeekable())
        return kXferErrNotSupported;
    fpGFD = pGFD;
    fStart = start;
    fLength = length;
    fPosn = 0;
    fReadOnly = true;
    return kXferErrNone;
}

XferError GFDSlice::Read(void* buf, size_t length, size_t* pActual)
{
    XferError xerr;

    if (fpGFD == NULL)
        return kXferErrNotReady;
    if (fPosn >= fLength)
        return kXferErrEOF;
    if ((xf_off_t) length > fLength - fPosn) {
        if (pActual == NULL)
            return kXferErrEOF;
        length = (size_t) (fLength - fPosn);
    }

    /* the underlying GFD may be shared, so always position it */
    xerr = fpGFD->Seek(fStart + fPosn, kSeekSet);
    if (xerr != kXferErrNone)
        return xerr;
    xerr = fpGFD->Read(buf, length);
    if (xerr != kXferErrNone)
        return xerr;
    fPosn += length;
    if (pActual != NULL)
        *pActual = length;
    return kXferErrNone;
}

XferError GFDSlice::Seek(xf_off_t offset, XferWhence whence)
{
    xf_off_t newPosn;

    if (fpGFD == NULL)
        return kXferErrNotReady;
    switch (whence) {
    case kSeekSet:  newPosn = offset;               break;
    case kSeekCur:  newPosn = fPosn + offset;       break;
    case kSeekEnd:  newPosn = fLength + offset;     break;
    default:
        return kXferErrInvalidArg;
    }
    if (newPosn < 0 || newPosn > fLength)
        return kXferErrInvalidArg;
    fPosn = newPosn;
    return kXferErrNone;
}
