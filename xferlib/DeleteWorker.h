/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Delete a set of entries from an archive or filesystem.
 */
#ifndef XFERLIB_DELETEWORKER_H
#define XFERLIB_DELETEWORKER_H

#include "XferLib.h"
#include "CallbackFacts.h"
#include <vector>

namespace XferLib {

class XFERLIB_API DeleteWorker {
public:
    DeleteWorker(XferCallback func, void* state, bool macZip)
        : fFunc(func), fState(state), fMacZip(macZip),
          fLastError(kXferErrNone)
        {}
    ~DeleteWorker(void) {}

    /*
     * Mark the entries for deletion.  This must happen inside a
     * transaction, which the caller commits.  With MacZip enabled, the
     * "__MACOSX" header for each entry goes too, and headers in the list
     * are ignored (they're removed along with their file).
     */
    XferStatus DeleteFromArchive(Archive* pArchive,
        const std::vector<FileEntry*>& entries);

    /*
     * Delete files and directories.  A directory can only be removed once
     * it's empty, so the list must have each directory ahead of its
     * contents (which is how ClipFileSet and a directory walk produce
     * them).  We work from the end back to the start.
     */
    XferStatus DeleteFromFileSystem(FileSystem* pFileSystem,
        const std::vector<FileEntry*>& entries);

    XferError GetLastError(void) const { return fLastError; }

private:
    DeleteWorker& operator=(const DeleteWorker&);
    DeleteWorker(const DeleteWorker&);

    CallbackFacts::Result Notify(const CallbackFacts& facts) {
        return (*fFunc)(&facts, fState);
    }
    bool UpdateProgress(const FileEntry* pEntry, int progressPerc);
    XferStatus Fail(XferError xerr, const std::string& pathName);

    XferCallback    fFunc;
    void*           fState;
    bool            fMacZip;
    XferError       fLastError;
};

}   // namespace XferLib

#endif /*XFERLIB_DELETEWORKER_H*/
