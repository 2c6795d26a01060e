/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Add, extract, and delete files in a ShrinkIt archive, with the same
 * attribute preservation handling the desktop app uses.
 */
#include <stdlib.h>
#include <unistd.h>
#include <stdio.h>
#include <string.h>
#include <time.h>
#include <errno.h>
#include <assert.h>
#include "../xferlib/XferLib.h"
#include "../xferlib/AddFileSet.h"
#include "../xferlib/ClipFileSet.h"
#include "../xferlib/XferWorker.h"
#include "../xferlib/ExtractWorker.h"
#include "../xferlib/DeleteWorker.h"
#include "../xferlib/NufxArchive.h"

using namespace XferLib;

/*
 * Globals.
 */
FILE* gLog = NULL;
pid_t gPid = getpid();
bool gOverwrite = false;

/*
 * Show usage info.
 */
void
Usage(const char* argv0)
{
    fprintf(stderr, "Usage: %s a [-f] [-naps|-adf|-as|-none] archive.shk file ...\n",
        argv0);
    fprintf(stderr, "       %s x [-f] [-naps|-adf|-as|-host|-none] archive.shk destdir\n",
        argv0);
    fprintf(stderr, "       %s d archive.shk name ...\n", argv0);
    fprintf(stderr, "\n");
    fprintf(stderr, "When adding, the flag limits which preservation formats are\n");
    fprintf(stderr, "recognized (default is all of them).  When extracting, it\n");
    fprintf(stderr, "picks the format to write (default is NAPS).  Existing files\n");
    fprintf(stderr, "are skipped unless -f is given.\n");
}

/*
 * Answer questions from the library.  There's no user to ask, so we
 * follow the command-line flags.
 */
CallbackFacts::Result
XferCallbackFunc(const CallbackFacts* pFacts, void*)
{
    switch (pFacts->reason) {
    case CallbackFacts::kReasonProgress:
        if (!pFacts->newPathName.empty()) {
            printf("  %s -> %s\n", pFacts->origPathName.c_str(),
                pFacts->newPathName.c_str());
        } else {
            printf("  %s\n", pFacts->origPathName.c_str());
        }
        return CallbackFacts::kResultContinue;
    case CallbackFacts::kReasonFileNameExists:
        if (gOverwrite)
            return CallbackFacts::kResultOverwrite;
        fprintf(stderr, "Skipping '%s': already exists\n",
            pFacts->origPathName.c_str());
        return CallbackFacts::kResultSkip;
    case CallbackFacts::kReasonPathTooLong:
        fprintf(stderr, "Skipping '%s': name too long\n",
            pFacts->origPathName.c_str());
        return CallbackFacts::kResultSkip;
    case CallbackFacts::kReasonResourceForkIgnored:
        fprintf(stderr, "Warning: resource fork of '%s' not kept\n",
            pFacts->origPathName.c_str());
        return CallbackFacts::kResultContinue;
    case CallbackFacts::kReasonAttrFailure:
        fprintf(stderr, "Warning: unable to set attributes on '%s'\n",
            pFacts->origPathName.c_str());
        return CallbackFacts::kResultContinue;
    case CallbackFacts::kReasonOverwriteFailure:
        fprintf(stderr, "Unable to replace '%s'\n", pFacts->origPathName.c_str());
        return CallbackFacts::kResultContinue;
    case CallbackFacts::kReasonFailure:
        fprintf(stderr, "Error: %s\n", pFacts->failMessage.c_str());
        return CallbackFacts::kResultCancel;
    case CallbackFacts::kReasonQueryCancel:
    default:
        return CallbackFacts::kResultContinue;
    }
}

/*
 * Add host files to the archive, creating it if necessary.
 */
int
DoAdd(const char* archiveName, const char* mode, int fileCount,
    char** fileNames)
{
    NufxArchive archive;
    AddFileSet addSet;
    AddFileSet::AddOpts addOpts;
    ClipFileSet clipSet;
    ClipFileSet::Options clipOpts;
    XferWorker::Options xferOpts;
    std::vector<std::string> pathNames;
    XferStatus status;
    XferError xerr;

    if (mode != NULL) {
        addOpts.parseNAPS = (strcmp(mode, "-naps") == 0);
        addOpts.parseADF = (strcmp(mode, "-adf") == 0);
        addOpts.parseAS = (strcmp(mode, "-as") == 0);
    }

    if (access(archiveName, F_OK) == 0)
        xerr = archive.Open(archiveName, false);
    else
        xerr = archive.New(archiveName);
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to open '%s': %s\n", archiveName,
            XferStrError(xerr));
        return -1;
    }

    for (int i = 0; i < fileCount; i++)
        pathNames.push_back(fileNames[i]);

    xerr = addSet.Create("", pathNames, addOpts, NULL);
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to scan files: %s\n", XferStrError(xerr));
        return -1;
    }
    xerr = clipSet.CreateFromAddSet(addSet, clipOpts);
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to plan add: %s\n", XferStrError(xerr));
        return -1;
    }

    xerr = archive.StartTransaction();
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to modify '%s': %s\n", archiveName,
            XferStrError(xerr));
        return -1;
    }

    XferWorker worker(XferCallbackFunc, NULL, xferOpts);
    status = worker.AddToArchive(clipSet.GetXferEntries(), &archive);
    if (status != kXferOK) {
        archive.CancelTransaction();
        return -1;
    }

    xerr = archive.CommitTransaction();
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to update '%s': %s\n", archiveName,
            XferStrError(xerr));
        return -1;
    }
    return 0;
}

/*
 * Extract everything to "destDir".
 */
int
DoExtract(const char* archiveName, const char* mode, const char* destDir)
{
    NufxArchive archive;
    ClipFileSet clipSet;
    ClipFileSet::Options clipOpts;
    ExtractWorker::Options extOpts;
    std::vector<FileEntry*> entries;
    XferError xerr;

    clipOpts.preserve = kPreserveNAPS;
    if (mode != NULL) {
        if (strcmp(mode, "-adf") == 0)
            clipOpts.preserve = kPreserveADF;
        else if (strcmp(mode, "-as") == 0)
            clipOpts.preserve = kPreserveAS;
        else if (strcmp(mode, "-host") == 0)
            clipOpts.preserve = kPreserveHost;
        else if (strcmp(mode, "-none") == 0)
            clipOpts.preserve = kPreserveNone;
    }

    xerr = archive.Open(archiveName, true);
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to open '%s': %s\n", archiveName,
            XferStrError(xerr));
        return -1;
    }

    for (long i = 0; i < archive.GetEntryCount(); i++)
        entries.push_back(archive.GetEntry(i));

    xerr = clipSet.CreateFromArchive(&archive, entries, clipOpts);
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to plan extraction: %s\n", XferStrError(xerr));
        return -1;
    }

    ExtractWorker worker(XferCallbackFunc, NULL, extOpts);
    if (worker.ExtractToHost(clipSet.GetForeignEntries(), destDir) != kXferOK)
        return -1;
    return 0;
}

/*
 * Delete the named records.
 */
int
DoDelete(const char* archiveName, int nameCount, char** names)
{
    NufxArchive archive;
    std::vector<FileEntry*> entries;
    XferError xerr;

    xerr = archive.Open(archiveName, false);
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to open '%s': %s\n", archiveName,
            XferStrError(xerr));
        return -1;
    }

    for (int i = 0; i < nameCount; i++) {
        FileEntry* pEntry = archive.FindEntry(names[i]);
        if (pEntry == NULL) {
            fprintf(stderr, "File '%s' not found in '%s'\n", names[i],
                archiveName);
            return -1;
        }
        entries.push_back(pEntry);
    }

    xerr = archive.StartTransaction();
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to modify '%s': %s\n", archiveName,
            XferStrError(xerr));
        return -1;
    }

    DeleteWorker worker(XferCallbackFunc, NULL, false);
    if (worker.DeleteFromArchive(&archive, entries) != kXferOK) {
        archive.CancelTransaction();
        return -1;
    }

    xerr = archive.CommitTransaction();
    if (xerr != kXferErrNone) {
        fprintf(stderr, "Unable to update '%s': %s\n", archiveName,
            XferStrError(xerr));
        return -1;
    }
    return 0;
}

/*
 * Handle a debug message from the Xfer library.
 */
/*static*/ void
MsgHandler(const char* file, int line, const char* msg)
{
    assert(file != NULL);
    assert(msg != NULL);

    if (gLog != NULL) {
        const char* cp = strrchr(file, '/');
        fprintf(gLog, "%05u %s:%d %s\n", (unsigned) gPid,
            cp != NULL ? cp + 1 : file, line, msg);
    }
}

/*
 * Process args.
 */
int
main(int argc, char** argv)
{
#ifdef _DEBUG
    const char* kLogFile = "xfertool-log.txt";
    gLog = fopen(kLogFile, "w");
    if (gLog == NULL) {
        fprintf(stderr, "ERROR: unable to open log file\n");
        exit(1);
    }
    fprintf(stderr, "Log file is '%s'\n", kLogFile);
#endif

    Global::SetDebugMsgHandler(MsgHandler);
    if (Global::AppInit() != kXferErrNone ||
        NufxArchive::AppInit() != kXferErrNone)
    {
        fprintf(stderr, "ERROR: library init failed\n");
        exit(1);
    }

    if (argc < 3) {
        Usage(argv[0]);
        exit(2);
    }

    const char* cmd = argv[1];
    int argi = 2;
    if (argi < argc && strcmp(argv[argi], "-f") == 0) {
        gOverwrite = true;
        argi++;
    }
    const char* mode = NULL;
    if (argi < argc && argv[argi][0] == '-') {
        mode = argv[argi];
        argi++;
    }
    if (argi >= argc) {
        Usage(argv[0]);
        exit(2);
    }
    const char* archiveName = argv[argi++];

    int result;
    if (strcmp(cmd, "a") == 0 && argi < argc) {
        result = DoAdd(archiveName, mode, argc - argi, argv + argi);
    } else if (strcmp(cmd, "x") == 0 && argi + 1 == argc) {
        result = DoExtract(archiveName, mode, argv[argi]);
    } else if (strcmp(cmd, "d") == 0 && argi < argc && mode == NULL) {
        result = DoDelete(archiveName, argc - argi, argv + argi);
    } else {
        Usage(argv[0]);
        exit(2);
    }

    Global::AppCleanup();
    if (gLog != NULL)
        fclose(gLog);

    exit(result != 0);
    /*NOTREACHED*/
}
