/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Declarations for GenericFD class and sub-classes.
 */
#ifndef XFERLIB_GENERICFD_H
#define XFERLIB_GENERICFD_H

#include "XferLib.h"

namespace XferLib {

/*
 * Generic file source base class.  Allows us to treat files on disk, memory
 * buffers, temp files, and forks embedded inside archives equally.
 *
 * The Read and Write calls take an optional parameter that allows the caller
 * to see how much data was actually read or written.  If the parameter is
 * not specified (or specified as NULL), then failure to return the exact
 * amount of data requested results an error.  Reading at end of file
 * returns kXferErrEOF.
 *
 * Streams handed out by archives may not be seekable (think of a deflated
 * ZIP entry).  Check IsSeekable before calling Seek or Rewind.
 *
 * Some libraries, such as NufxLib, require an actual filename to operate.
 * The GetPathName call will return the original filename if one exists, or
 * NULL if there isn't one.
 */
class XFERLIB_API GenericFD {
public:
    GenericFD(void) : fReadOnly(true) {}
    virtual ~GenericFD(void) {}

    // All sub-classes must provide these, plus a type-specific Open call.
    virtual XferError Read(void* buf, size_t length,
        size_t* pActual = NULL) = 0;
    virtual XferError Write(const void* buf, size_t length,
        size_t* pActual = NULL) = 0;
    virtual XferError Seek(xf_off_t offset, XferWhence whence) = 0;
    virtual xf_off_t Tell(void) = 0;
    virtual XferError Truncate(void) = 0;
    virtual XferError Close(void) = 0;
    virtual const char* GetPathName(void) const = 0;

    // Utility functions.
    virtual XferError Rewind(void) { return Seek(0, kSeekSet); }
    virtual bool IsSeekable(void) const { return true; }

    virtual bool GetReadOnly(void) const { return fReadOnly; }

    /*
     * Determine the length by seeking to the end.  The file position is
     * restored.  Only works on seekable descriptors.
     */
    XferError GetLength(xf_off_t* pLength);

protected:
    GenericFD& operator=(const GenericFD&);
    GenericFD(const GenericFD&);

    bool        fReadOnly;      // set when file is opened
};

/*
 * File on the host filesystem, accessed through stdio.
 */
class XFERLIB_API GFDFile : public GenericFD {
public:
    GFDFile(void) : fPathName(NULL), fFp(NULL) {}
    virtual ~GFDFile(void) { Close(); delete[] fPathName; }

    // Open an existing file.
    virtual XferError Open(const char* filename, bool readOnly);
    // Create a new file, or truncate an existing one.  Opens read-write.
    virtual XferError Create(const char* filename);
    // Open an anonymous temp file, removed automatically on close.
    virtual XferError OpenTemp(void);

    virtual XferError Read(void* buf, size_t length,
        size_t* pActual = NULL) override;
    virtual XferError Write(const void* buf, size_t length,
        size_t* pActual = NULL) override;
    virtual XferError Seek(xf_off_t offset, XferWhence whence) override;
    virtual xf_off_t Tell(void) override;
    virtual XferError Truncate(void) override;
    virtual XferError Close(void) override;
    virtual const char* GetPathName(void) const override { return fPathName; }

private:
    void SetPathName(const char* filename);

    char*       fPathName;
    FILE*       fFp;
};

/*
 * Memory buffer.
 */
class XFERLIB_API GFDBuffer : public GenericFD {
public:
    GFDBuffer(void) : fBuffer(NULL), fLength(0), fAllocLength(0),
        fDoDelete(false), fDoExpand(false), fCurrentOffset(0) {}
    virtual ~GFDBuffer(void) { Close(); }

    // If "doDelete" is set, the buffer will be freed with delete[] when
    // Close is called.
    //
    // "doExpand" will cause writing past the end of the buffer to
    // reallocate the buffer.  If "buffer" is NULL, we allocate "length"
    // bytes ourselves; a length of zero is allowed in that case, and the
    // buffer starts out empty.
    virtual XferError Open(void* buffer, xf_off_t length, bool doDelete,
        bool doExpand, bool readOnly);
    // Shorthand for an empty, growable, read-write buffer.
    XferError OpenExpandable(void) {
        return Open(NULL, 0, true, true, false);
    }
    virtual XferError Read(void* buf, size_t length,
        size_t* pActual = NULL) override;
    virtual XferError Write(const void* buf, size_t length,
        size_t* pActual = NULL) override;
    virtual XferError Seek(xf_off_t offset, XferWhence whence) override;
    virtual xf_off_t Tell(void) override;
    virtual XferError Truncate(void) override {
        fLength = (long) Tell();
        return kXferErrNone;
    }
    virtual XferError Close(void) override;
    virtual const char* GetPathName(void) const override { return NULL; }

    // Back door; try not to use this.
    void* GetBuffer(void) const { return fBuffer; }
    long GetBufferLength(void) const { return fLength; }

private:
    enum { kMaxReasonableSize = 256 * 1024 * 1024 };
    uint8_t*    fBuffer;
    long        fLength;        // these sit in memory, so there's no
    long        fAllocLength;   //  value in using xf_off_t here
    bool        fDoDelete;
    bool        fDoExpand;
    xf_off_t    fCurrentOffset; // actually limited to (long)
};

/*
 * Read-only window onto part of another GFD, e.g. one fork inside an
 * AppleSingle file.  Offsets are relative to the start of the window, and
 * reads stop at the end of it.  Does not own the underlying descriptor.
 */
class XFERLIB_API GFDSlice : public GenericFD {
public:
    GFDSlice(void) : fpGFD(NULL), fStart(0), fLength(0), fPosn(0) {}
    virtual ~GFDSlice(void) { Close(); }

    virtual XferError Open(GenericFD* pGFD, xf_off_t start, xf_off_t length);
    virtual XferError Read(void* buf, size_t length,
        size_t* pActual = NULL) override;
    virtual XferError Write(const void* buf, size_t length,
        size_t* pActual = NULL) override
    {
        (void) buf; (void) length; (void) pActual;
        return kXferErrAccessDenied;
    }
    virtual XferError Seek(xf_off_t offset, XferWhence whence) override;
    virtual xf_off_t Tell(void) override { return fPosn; }
    virtual XferError Truncate(void) override { return kXferErrAccessDenied; }
    virtual XferError Close(void) override {
        /* do NOT close underlying descriptor */
        fpGFD = NULL;
        return kXferErrNone;
    }
    virtual const char* GetPathName(void) const override {
        return fpGFD == NULL ? NULL : fpGFD->GetPathName();
    }

private:
    GenericFD*  fpGFD;
    xf_off_t    fStart;
    xf_off_t    fLength;
    xf_off_t    fPosn;
};

}   // namespace XferLib

#endif /*XFERLIB_GENERICFD_H*/
