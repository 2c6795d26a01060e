/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Part sources provide the bytes for one fork of a file being written.
 *
 * Archives don't read the data when a part is added; they hang on to the
 * source and read it when the transaction is committed, possibly more than
 * once (e.g. if compression fails and the data has to be stored instead).
 * So a source must be able to open, rewind, and close, and be cheap to
 * hold when it isn't open.
 */
#ifndef XFERLIB_PARTSOURCE_H
#define XFERLIB_PARTSOURCE_H

#include "XferLib.h"
#include "GenericFD.h"
#include "CallbackFacts.h"

namespace XferLib {

class ImportConverter;

/*
 * Abstract base class.
 *
 * Open fails with kXferErrAlreadyOpen if the source is already open.
 * Read returns kXferErrNone with *pActual set to zero at end of file.
 * A failed Rewind leaves the source closed.
 * Close may be called any number of times.
 *
 * Sub-class destructors must call CloseLeaked(), which closes the source
 * and complains if the owner forgot to.
 */
class XFERLIB_API PartSource {
public:
    PartSource(void)
        : fIsOpen(false), fProgressFunc(NULL), fProgressState(NULL)
        {}
    virtual ~PartSource(void);

    XferError Open(void);
    XferError Read(void* buf, size_t length, size_t* pActual);
    XferError Rewind(void);
    void Close(void);

    bool IsOpen(void) const { return fIsOpen; }

    /*
     * If set, Open will query for cancellation and then send a progress
     * update with the supplied facts.  Used when an archive reads the
     * source during a commit, because that's the only time we find out
     * that the file is being processed.
     */
    void SetProgressHook(XferCallback func, void* state,
        const CallbackFacts& facts)
    {
        fProgressFunc = func;
        fProgressState = state;
        fProgressFacts = facts;
    }

protected:
    virtual XferError DoOpen(void) = 0;
    virtual XferError DoRead(void* buf, size_t length, size_t* pActual) = 0;
    virtual XferError DoRewind(void) = 0;
    virtual void DoClose(void) = 0;

    void CloseLeaked(void);

    // Read from a GenericFD, converting kXferErrEOF to a zero-length read.
    static XferError ReadGFD(GenericFD* pGFD, void* buf, size_t length,
        size_t* pActual);

private:
    PartSource& operator=(const PartSource&);
    PartSource(const PartSource&);

    bool            fIsOpen;
    XferCallback    fProgressFunc;
    void*           fProgressState;
    CallbackFacts   fProgressFacts;
};

/*
 * Makes sure a source gets closed when we leave a scope.  Does not own the
 * source.
 */
class XFERLIB_API ScopedPartSource {
public:
    explicit ScopedPartSource(PartSource* pSource) : fpSource(pSource) {}
    ~ScopedPartSource(void) {
        if (fpSource != NULL)
            fpSource->Close();
    }

private:
    ScopedPartSource& operator=(const ScopedPartSource&);
    ScopedPartSource(const ScopedPartSource&);

    PartSource*     fpSource;
};

/*
 * Plain file on the host filesystem.
 */
class XFERLIB_API HostFilePartSource : public PartSource {
public:
    explicit HostFilePartSource(const std::string& pathName)
        : fPathName(pathName)
        {}
    virtual ~HostFilePartSource(void) { CloseLeaked(); }

    const std::string& GetPathName(void) const { return fPathName; }

protected:
    virtual XferError DoOpen(void) override;
    virtual XferError DoRead(void* buf, size_t length,
        size_t* pActual) override;
    virtual XferError DoRewind(void) override;
    virtual void DoClose(void) override;

private:
    std::string     fPathName;
    GFDFile         fGFD;
};

/*
 * A descriptor that is already open.  Unless "leaveOpen" is set, we take
 * ownership of it, and delete it when we're deleted.  Open rewinds it.
 */
class XFERLIB_API StreamPartSource : public PartSource {
public:
    StreamPartSource(GenericFD* pGFD, bool leaveOpen)
        : fpGFD(pGFD), fLeaveOpen(leaveOpen)
        {}
    virtual ~StreamPartSource(void);

protected:
    virtual XferError DoOpen(void) override;
    virtual XferError DoRead(void* buf, size_t length,
        size_t* pActual) override;
    virtual XferError DoRewind(void) override;
    virtual void DoClose(void) override {}

private:
    GenericFD*      fpGFD;
    bool            fLeaveOpen;
};

/*
 * Zero-length source.
 */
class XFERLIB_API EmptyPartSource : public PartSource {
public:
    EmptyPartSource(void) {}
    virtual ~EmptyPartSource(void) { CloseLeaked(); }

protected:
    virtual XferError DoOpen(void) override { return kXferErrNone; }
    virtual XferError DoRead(void* buf, size_t length,
        size_t* pActual) override
    {
        (void) buf; (void) length;
        *pActual = 0;
        return kXferErrNone;
    }
    virtual XferError DoRewind(void) override { return kXferErrNone; }
    virtual void DoClose(void) override {}
};

/*
 * One part of an entry in an archive or filesystem.  Archive streams often
 * can't seek, so rewinding them means closing and reopening the part.
 */
class XFERLIB_API EntryPartSource : public PartSource {
public:
    EntryPartSource(const XferContainer& container, FileEntry* pEntry,
        FilePart part)
        : fContainer(container), fpEntry(pEntry), fPart(part), fpGFD(NULL)
        {}
    virtual ~EntryPartSource(void) { CloseLeaked(); }

protected:
    virtual XferError DoOpen(void) override;
    virtual XferError DoRead(void* buf, size_t length,
        size_t* pActual) override;
    virtual XferError DoRewind(void) override;
    virtual void DoClose(void) override;

private:
    XferContainer   fContainer;
    FileEntry*      fpEntry;
    FilePart        fPart;
    GenericFD*      fpGFD;
};

/*
 * One fork of an AppleSingle or AppleDouble file.  The container's bytes
 * come from "pOuter", which may not be seekable, so we copy them to a temp
 * file before parsing.  We own "pOuter".
 */
class XFERLIB_API ContainerPartSource : public PartSource {
public:
    ContainerPartSource(PartSource* pOuter, FilePart part, bool isDouble)
        : fpOuter(pOuter), fPart(part), fIsDouble(isDouble)
        {}
    virtual ~ContainerPartSource(void);

protected:
    virtual XferError DoOpen(void) override;
    virtual XferError DoRead(void* buf, size_t length,
        size_t* pActual) override;
    virtual XferError DoRewind(void) override;
    virtual void DoClose(void) override;

private:
    PartSource*     fpOuter;
    FilePart        fPart;
    bool            fIsDouble;
    GFDFile         fTempGFD;
    GFDSlice        fSlice;
};

/*
 * Output of an import converter.  The whole thing is converted into memory
 * when opened, so reads only ever see converted data.  We own "pOuter",
 * but not the converter.
 */
class XFERLIB_API ImportPartSource : public PartSource {
public:
    ImportPartSource(PartSource* pOuter, const ImportConverter* pConverter,
        FilePart part)
        : fpOuter(pOuter), fpConverter(pConverter), fPart(part)
        {}
    virtual ~ImportPartSource(void);

protected:
    virtual XferError DoOpen(void) override;
    virtual XferError DoRead(void* buf, size_t length,
        size_t* pActual) override;
    virtual XferError DoRewind(void) override;
    virtual void DoClose(void) override;

private:
    PartSource*             fpOuter;
    const ImportConverter*  fpConverter;
    FilePart                fPart;
    GFDBuffer               fConverted;
};

/*
 * An AppleSingle or AppleDouble file generated from a set of attributes
 * and fork sources.  Either fork source may be NULL.  We own the fork
 * sources.  The file is built in memory when opened.
 */
class XFERLIB_API GeneratedASPartSource : public PartSource {
public:
    GeneratedASPartSource(const FileAttribs& attrs,
        const std::string& fileName, PartSource* pDataSrc,
        PartSource* pRsrcSrc, bool asDouble)
        : fAttrs(attrs), fFileName(fileName), fpDataSrc(pDataSrc),
          fpRsrcSrc(pRsrcSrc), fAsDouble(asDouble)
        {}
    virtual ~GeneratedASPartSource(void);

protected:
    virtual XferError DoOpen(void) override;
    virtual XferError DoRead(void* buf, size_t length,
        size_t* pActual) override;
    virtual XferError DoRewind(void) override;
    virtual void DoClose(void) override;

private:
    FileAttribs     fAttrs;
    std::string     fFileName;
    PartSource*     fpDataSrc;
    PartSource*     fpRsrcSrc;
    bool            fAsDouble;
    GFDBuffer       fBuffer;
};

}   // namespace XferLib

#endif /*XFERLIB_PARTSOURCE_H*/
