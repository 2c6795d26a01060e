/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Write the "foreign" items from a ClipFileSet to a host directory.
 */
#ifndef XFERLIB_EXTRACTWORKER_H
#define XFERLIB_EXTRACTWORKER_H

#include "XferLib.h"
#include "CallbackFacts.h"
#include "ClipFileSet.h"

namespace XferLib {

class XFERLIB_API ExtractWorker {
public:
    class Options {
    public:
        Options(void) : setModWhen(true), setAccess(true) {}

        bool    setModWhen;         // restore the modification date
        bool    setAccess;          // make locked files read-only
    };

    ExtractWorker(XferCallback func, void* state, const Options& opts)
        : fFunc(func), fState(state), fOpts(opts), fCopyBuf(NULL),
          fLastError(kXferErrNone)
        {}
    ~ExtractWorker(void) { delete[] fCopyBuf; }

    /*
     * Extract the items into "destDir", which is created if it doesn't
     * exist.  Each item's extractPath is relative to it.
     */
    XferStatus ExtractToHost(const ClipFileSet::ItemList& items,
        const std::string& destDir);

    XferError GetLastError(void) const { return fLastError; }

private:
    ExtractWorker& operator=(const ExtractWorker&);
    ExtractWorker(const ExtractWorker&);

    enum { kCopyBufSize = 32768 };

    typedef enum PrepResult {
        kPrepOK = 0,
        kPrepSkip,
        kPrepCancel,
        kPrepFailed,
    } PrepResult;

    CallbackFacts::Result Notify(const CallbackFacts& facts) {
        return (*fFunc)(&facts, fState);
    }
    XferStatus Fail(XferError xerr, const std::string& msg);

    static XferError CreatePath(const std::string& pathName);
    PrepResult PrepareOutputFile(const std::string& outputPath,
        const ClipFileEntry& item);
    XferError WriteItem(const ClipFileEntry& item, const std::string& outputPath);
    bool SetHostAttribs(const ClipFileEntry& item, const std::string& outputPath);

    XferCallback    fFunc;
    void*           fState;
    Options         fOpts;
    uint8_t*        fCopyBuf;
    XferError       fLastError;
};

}   // namespace XferLib

#endif /*XFERLIB_EXTRACTWORKER_H*/
