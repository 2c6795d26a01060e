/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Entry deletion.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "DeleteWorker.h"
#include "PathName.h"


/*
 * Send a progress update.  Returns false if the user wants to stop.
 */
bool DeleteWorker::UpdateProgress(const FileEntry* pEntry, int progressPerc)
{
    CallbackFacts facts(CallbackFacts::kReasonQueryCancel);
    if (Notify(facts) == CallbackFacts::kResultCancel)
        return false;

    CallbackFacts progress(CallbackFacts::kReasonProgress,
        pEntry->GetPathName(), pEntry->GetFssep());
    progress.origModWhen = pEntry->GetModWhen();
    progress.progressPercent = progressPerc;
    (void) Notify(progress);
    return true;
}

XferStatus DeleteWorker::Fail(XferError xerr, const std::string& pathName)
{
    fLastError = xerr;

    CallbackFacts facts(CallbackFacts::kReasonFailure, pathName, '\0');
    facts.failMessage = "Unable to delete '" + pathName + "': " +
        XferStrError(xerr);
    LOGW("%s", facts.failMessage.c_str());
    (void) Notify(facts);
    return kXferFailed;
}

XferStatus DeleteWorker::DeleteFromArchive(Archive* pArchive,
    const std::vector<FileEntry*>& entries)
{
    const Archive::Characteristics& chars = pArchive->GetCharacteristics();
    bool doMacZip = fMacZip && chars.isMacZipCapable;
    XferError xerr;

    fLastError = kXferErrNone;
    if (!chars.canWrite || pArchive->IsDubious())
        return Fail(kXferErrWriteProtected, pArchive->GetCharacteristics().name);

    LOGI("Deleting %d entries", (int) entries.size());

    /*
     * Find the headers before we start deleting things, so a header that
     * appears in the list and also belongs to a listed file isn't
     * deleted twice.
     */
    std::vector<FileEntry*> headers(entries.size(), (FileEntry*) NULL);
    if (doMacZip) {
        for (size_t idx = 0; idx < entries.size(); idx++) {
            FileEntry* pEntry = entries[idx];
            if (PathName::IsMacZipHeader(pEntry->GetPathName(),
                    pEntry->GetFssep()))
            {
                continue;
            }
            std::string headerName = PathName::GenerateMacZipName(
                pEntry->GetPathName(), pEntry->GetFssep());
            if (!headerName.empty())
                headers[idx] = pArchive->FindEntry(headerName.c_str());
        }
    }

    for (size_t idx = 0; idx < entries.size(); idx++) {
        FileEntry* pEntry = entries[idx];

        if (doMacZip && PathName::IsMacZipHeader(pEntry->GetPathName(),
                pEntry->GetFssep()))
        {
            LOGD("  Skipping MacZip header '%s'", pEntry->GetPathName());
            continue;
        }

        if (!UpdateProgress(pEntry, (int) ((100 * idx) / entries.size())))
            return kXferCancelled;

        std::string pathName(pEntry->GetPathName());
        LOGI("  Deleting '%s'", pathName.c_str());
        xerr = pArchive->DeleteRecord(pEntry);
        if (xerr != kXferErrNone)
            return Fail(xerr, pathName);

        if (headers[idx] != NULL) {
            std::string headerName(headers[idx]->GetPathName());
            LOGI("  Deleting header '%s'", headerName.c_str());
            xerr = pArchive->DeleteRecord(headers[idx]);
            if (xerr != kXferErrNone)
                return Fail(xerr, headerName);
        }
    }

    return kXferOK;
}

XferStatus DeleteWorker::DeleteFromFileSystem(FileSystem* pFileSystem,
    const std::vector<FileEntry*>& entries)
{
    XferError xerr;

    fLastError = kXferErrNone;
    if (pFileSystem->IsReadOnly())
        return Fail(kXferErrWriteProtected, pFileSystem->GetCharacteristics().name);

    LOGI("Deleting %d entries", (int) entries.size());

    size_t count = entries.size();
    for (size_t i = 0; i < count; i++) {
        FileEntry* pEntry = entries[count - 1 - i];

        if (!UpdateProgress(pEntry, (int) ((100 * i) / count)))
            return kXferCancelled;

        /* the entry is invalid after the delete, so grab the name now */
        std::string pathName(pEntry->GetPathName());
        LOGI("  Deleting '%s'", pathName.c_str());
        xerr = pFileSystem->DeleteFile(pEntry);
        if (xerr != kXferErrNone)
            return Fail(xerr, pathName);
    }

    return kXferOK;
}
