/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Replay a planned transfer into an archive or filesystem.
 */
#ifndef XFERLIB_XFERWORKER_H
#define XFERLIB_XFERWORKER_H

#include "XferLib.h"
#include "CallbackFacts.h"
#include "ClipFileSet.h"

namespace XferLib {

/*
 * Adds the "xfer" items from a ClipFileSet to an archive or filesystem.
 * Conflicts are resolved by asking the callback.
 *
 * Archive modifications must happen inside a transaction that the caller
 * starts before calling here, and commits or cancels afterward.  The data
 * isn't actually read until the commit.
 *
 * The result is kXferOK, kXferFailed, or kXferCancelled.  On failure, the
 * callback has been sent a kReasonFailure message, and GetLastError
 * returns the error code.
 */
class XFERLIB_API XferWorker {
public:
    class Options {
    public:
        Options(void)
            : doCompress(true), macZip(false), convertDOSText(false),
              stripPaths(false), isSameProcess(true)
            {}

        bool    doCompress;         // else store uncompressed
        bool    macZip;             // write "__MACOSX" headers to ZIP
        bool    convertDOSText;     // fix high ASCII on DOS text files
        bool    stripPaths;         // store just the file name
        bool    isSameProcess;      // items came from this process
    };

    XferWorker(XferCallback func, void* state, const Options& opts)
        : fFunc(func), fState(state), fOpts(opts), fCopyBuf(NULL),
          fLastError(kXferErrNone)
        {}
    ~XferWorker(void) { delete[] fCopyBuf; }

    XferStatus AddToArchive(const ClipFileSet::ItemList& items,
        Archive* pArchive);
    XferStatus AddToFileSystem(const ClipFileSet::ItemList& items,
        FileSystem* pFileSystem, FileEntry* pTargetDir);

    XferError GetLastError(void) const { return fLastError; }

    /*
     * Work out the storage path for an archive entry.  Each component is
     * adjusted for the archive, and the archive's separator is used.
     * Returns an empty string if the archive rejects the result.
     */
    static std::string AdjustArchivePath(const Archive* pArchive,
        const std::string& storageDir, char dirSep,
        const std::string& storageName);

private:
    XferWorker& operator=(const XferWorker&);
    XferWorker(const XferWorker&);

    enum { kCopyBufSize = 32768 };

    CallbackFacts::Result Notify(const CallbackFacts& facts) {
        return (*fFunc)(&facts, fState);
    }
    bool IsCancelPending(void);
    XferStatus Fail(XferError xerr, const std::string& msg);

    void FindParts(const ClipFileSet::ItemList& items, size_t* pIdx,
        const ClipFileEntry** ppDataPart, const ClipFileEntry** ppRsrcPart);

    XferError AddMacZipRecord(Archive* pArchive, const ClipFileEntry& item,
        bool withRsrc, const std::string& adjPath, int progressPerc,
        CompressionFormat fmt);
    void SetProgressHook(PartSource* pSource, const ClipFileEntry& item,
        const std::string& storagePath, char storageSep, int progressPerc);

    CallbackFacts::DOSConvMode GetDOSConvMode(const ClipFileEntry& item,
        bool targetIsDOS) const;
    XferError CopyFilePart(const ClipFileEntry& item, int progressPerc,
        const std::string& storagePath, char storageSep,
        CallbackFacts::DOSConvMode dosConv, GenericFD* pOut);

    XferCallback    fFunc;
    void*           fState;
    Options         fOpts;
    uint8_t*        fCopyBuf;       // shared by every fork we copy
    XferError       fLastError;
};

}   // namespace XferLib

#endif /*XFERLIB_XFERWORKER_H*/
