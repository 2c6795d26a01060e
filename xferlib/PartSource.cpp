/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Part source implementations.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "PartSource.h"
#include "AppleSingle.h"
#include "ImportConverter.h"


/*
 * ===========================================================================
 *      PartSource
 * ===========================================================================
 */

PartSource::~PartSource(void)
{
    if (fIsOpen) {
        /* sub-class didn't call CloseLeaked; nothing we can do now */
        LOGE("PartSource %p destroyed while open", this);
        DebugBreak();
    }
}

/*
 * Close a source that should already have been closed by its owner.
 */
void PartSource::CloseLeaked(void)
{
    if (fIsOpen) {
        LOGE("PartSource %p was not closed", this);
        DebugBreak();
        Close();
    }
}

XferError PartSource::Open(void)
{
    XferError xerr;

    if (fIsOpen)
        return kXferErrAlreadyOpen;

    if (fProgressFunc != NULL) {
        CallbackFacts facts(CallbackFacts::kReasonQueryCancel);
        if ((*fProgressFunc)(&facts, fProgressState) ==
            CallbackFacts::kResultCancel)
        {
            LOGI("Cancel requested while opening part source");
            return kXferErrCancelled;
        }
        fProgressFacts.reason = CallbackFacts::kReasonProgress;
        (void) (*fProgressFunc)(&fProgressFacts, fProgressState);
    }

    xerr = DoOpen();
    if (xerr != kXferErrNone) {
        DoClose();      // release anything that got half-opened
        return xerr;
    }
    fIsOpen = true;
    return kXferErrNone;
}

XferError PartSource::Read(void* buf, size_t length, size_t* pActual)
{
    if (!fIsOpen)
        return kXferErrNotReady;
    if (length == 0) {
        *pActual = 0;
        return kXferErrNone;
    }
    return DoRead(buf, length, pActual);
}

XferError PartSource::Rewind(void)
{
    XferError xerr;

    if (!fIsOpen)
        return kXferErrNotReady;
    xerr = DoRewind();
    if (xerr != kXferErrNone) {
        /* position is unknown, or the reopen failed; either way we're done */
        LOGI("Rewind failed (%s), closing part source", XferStrError(xerr));
        DoClose();
        fIsOpen = false;
    }
    return xerr;
}

void PartSource::Close(void)
{
    if (!fIsOpen)
        return;
    DoClose();
    fIsOpen = false;
}

/*static*/ XferError PartSource::ReadGFD(GenericFD* pGFD, void* buf,
    size_t length, size_t* pActual)
{
    XferError xerr = pGFD->Read(buf, length, pActual);
    if (xerr == kXferErrEOF) {
        *pActual = 0;
        return kXferErrNone;
    }
    return xerr;
}


/*
 * ===========================================================================
 *      HostFilePartSource
 * ===========================================================================
 */

XferError HostFilePartSource::DoOpen(void)
{
    return fGFD.Open(fPathName.c_str(), true);
}

XferError HostFilePartSource::DoRead(void* buf, size_t length, size_t* pActual)
{
    return ReadGFD(&fGFD, buf, length, pActual);
}

XferError HostFilePartSource::DoRewind(void)
{
    return fGFD.Rewind();
}

void HostFilePartSource::DoClose(void)
{
    /* read-only, so a close failure doesn't lose anything */
    XferError xerr = fGFD.Close();
    if (xerr != kXferErrNone && xerr != kXferErrNotReady)
        LOGW("Close of '%s' failed: %s", fPathName.c_str(), XferStrError(xerr));
}


/*
 * ===========================================================================
 *      StreamPartSource
 * ===========================================================================
 */

StreamPartSource::~StreamPartSource(void)
{
    CloseLeaked();
    if (!fLeaveOpen)
        delete fpGFD;
}

XferError StreamPartSource::DoOpen(void)
{
    if (fpGFD == NULL)
        return kXferErrNotReady;
    if (fpGFD->IsSeekable())
        return fpGFD->Rewind();
    return kXferErrNone;
}

XferError StreamPartSource::DoRead(void* buf, size_t length, size_t* pActual)
{
    return ReadGFD(fpGFD, buf, length, pActual);
}

XferError StreamPartSource::DoRewind(void)
{
    if (!fpGFD->IsSeekable())
        return kXferErrNotSupported;
    return fpGFD->Rewind();
}


/*
 * ===========================================================================
 *      EntryPartSource
 * ===========================================================================
 */

XferError EntryPartSource::DoOpen(void)
{
    XferError xerr;

    if (fpEntry == NULL)
        return kXferErrInvalidArg;
    xerr = fContainer.OpenPart(fpEntry, fPart, &fpGFD);
    if (xerr != kXferErrNone) {
        LOGI("Unable to open part %d of '%s': %s", fPart,
            fpEntry->GetPathName(), XferStrError(xerr));
        fpGFD = NULL;
    }
    return xerr;
}

XferError EntryPartSource::DoRead(void* buf, size_t length, size_t* pActual)
{
    if (fpGFD == NULL)
        return kXferErrNotReady;
    return ReadGFD(fpGFD, buf, length, pActual);
}

XferError EntryPartSource::DoRewind(void)
{
    if (fpGFD == NULL)
        return kXferErrNotReady;
    if (fpGFD->IsSeekable())
        return fpGFD->Rewind();

    /* can't seek an archive stream; open the part again */
    LOGD("Reopening part %d of '%s' for rewind", fPart, fpEntry->GetPathName());
    DoClose();
    return DoOpen();
}

void EntryPartSource::DoClose(void)
{
    if (fpGFD != NULL) {
        XferError xerr = fpGFD->Close();
        if (xerr != kXferErrNone && xerr != kXferErrNotReady)
            LOGW("Close of part failed: %s", XferStrError(xerr));
        delete fpGFD;
        fpGFD = NULL;
    }
}


/*
 * ===========================================================================
 *      ContainerPartSource
 * ===========================================================================
 */

ContainerPartSource::~ContainerPartSource(void)
{
    CloseLeaked();
    delete fpOuter;
}

XferError ContainerPartSource::DoOpen(void)
{
    const size_t kCopyBufSize = 32768;
    XferError xerr;
    uint8_t* buf = NULL;
    AppleSingle as;
    xf_off_t offset, length;

    if (fpOuter == NULL)
        return kXferErrNotReady;

    xerr = fTempGFD.OpenTemp();
    if (xerr != kXferErrNone)
        return xerr;

    /*
     * Copy the whole thing to the temp file.
     */
    {
        ScopedPartSource guard(fpOuter);

        xerr = fpOuter->Open();
        if (xerr != kXferErrNone)
            goto bail;

        buf = new uint8_t[kCopyBufSize];
        while (true) {
            size_t actual;
            xerr = fpOuter->Read(buf, kCopyBufSize, &actual);
            if (xerr != kXferErrNone)
                goto bail;
            if (actual == 0)
                break;
            xerr = fTempGFD.Write(buf, actual);
            if (xerr != kXferErrNone)
                goto bail;
        }
    }

    xerr = as.Parse(&fTempGFD, fIsDouble);
    if (xerr != kXferErrNone) {
        LOGW("Container no longer parses as %s: %s",
            fIsDouble ? "AppleDouble" : "AppleSingle", XferStrError(xerr));
        goto bail;
    }
    if (!as.GetForkExtent(fPart, &offset, &length)) {
        LOGW("Container doesn't have part %d", fPart);
        xerr = kXferErrForkNotFound;
        goto bail;
    }
    xerr = fSlice.Open(&fTempGFD, offset, length);

bail:
    delete[] buf;
    return xerr;
}

XferError ContainerPartSource::DoRead(void* buf, size_t length,
    size_t* pActual)
{
    return ReadGFD(&fSlice, buf, length, pActual);
}

XferError ContainerPartSource::DoRewind(void)
{
    return fSlice.Rewind();
}

void ContainerPartSource::DoClose(void)
{
    (void) fSlice.Close();
    (void) fTempGFD.Close();        // temp file is discarded either way
}


/*
 * ===========================================================================
 *      ImportPartSource
 * ===========================================================================
 */

ImportPartSource::~ImportPartSource(void)
{
    CloseLeaked();
    delete fpOuter;
}

/*
 * Convert the entire input into memory.
 *
 * TODO: spill to a temp file when the input is very large
 */
XferError ImportPartSource::DoOpen(void)
{
    const size_t kCopyBufSize = 32768;
    XferError xerr;
    GFDBuffer inBuf;
    uint8_t* buf = NULL;

    if (fpOuter == NULL || fpConverter == NULL)
        return kXferErrNotReady;

    xerr = inBuf.OpenExpandable();
    if (xerr != kXferErrNone)
        return xerr;
    xerr = fConverted.OpenExpandable();
    if (xerr != kXferErrNone)
        return xerr;

    {
        ScopedPartSource guard(fpOuter);

        xerr = fpOuter->Open();
        if (xerr != kXferErrNone)
            goto bail;

        buf = new uint8_t[kCopyBufSize];
        while (true) {
            size_t actual;
            xerr = fpOuter->Read(buf, kCopyBufSize, &actual);
            if (xerr != kXferErrNone)
                goto bail;
            if (actual == 0)
                break;
            xerr = inBuf.Write(buf, actual);
            if (xerr != kXferErrNone)
                goto bail;
        }
    }

    xerr = inBuf.Rewind();
    if (xerr != kXferErrNone)
        goto bail;
    xerr = fpConverter->Convert(&inBuf, fPart, &fConverted);
    if (xerr != kXferErrNone) {
        LOGW("Import conversion (%s) failed: %s", fpConverter->GetTag(),
            XferStrError(xerr));
        goto bail;
    }
    xerr = fConverted.Rewind();

bail:
    delete[] buf;
    (void) inBuf.Close();
    return xerr;
}

XferError ImportPartSource::DoRead(void* buf, size_t length, size_t* pActual)
{
    return ReadGFD(&fConverted, buf, length, pActual);
}

XferError ImportPartSource::DoRewind(void)
{
    return fConverted.Rewind();
}

void ImportPartSource::DoClose(void)
{
    (void) fConverted.Close();
}


/*
 * ===========================================================================
 *      GeneratedASPartSource
 * ===========================================================================
 */

GeneratedASPartSource::~GeneratedASPartSource(void)
{
    CloseLeaked();
    delete fpDataSrc;
    delete fpRsrcSrc;
}

XferError GeneratedASPartSource::DoOpen(void)
{
    XferError xerr;

    xerr = fBuffer.OpenExpandable();
    if (xerr != kXferErrNone)
        return xerr;
    xerr = AppleSingle::Generate(fAttrs, fFileName, fpDataSrc, fpRsrcSrc,
        fAsDouble, &fBuffer);
    if (xerr != kXferErrNone) {
        LOGW("Unable to generate %s for '%s': %s",
            fAsDouble ? "AppleDouble" : "AppleSingle",
            fAttrs.fullPathName.c_str(), XferStrError(xerr));
        return xerr;
    }
    return fBuffer.Rewind();
}

XferError GeneratedASPartSource::DoRead(void* buf, size_t length,
    size_t* pActual)
{
    return ReadGFD(&fBuffer, buf, length, pActual);
}

XferError GeneratedASPartSource::DoRewind(void)
{
    return fBuffer.Rewind();
}

void GeneratedASPartSource::DoClose(void)
{
    (void) fBuffer.Close();
}
