/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Tests for adding planned items to archives and filesystems.
 */
#include "TestUtil.h"
#include "MemArchive.h"
#include "MemFileSystem.h"
#include "ClipFileSet.h"
#include "XferWorker.h"
#include <gtest/gtest.h>
#include <memory>

using namespace XferTest;

namespace {

std::vector<FileEntry*> AllEntries(const Archive& archive)
{
    std::vector<FileEntry*> entries;
    for (long idx = 0; idx < archive.GetEntryCount(); idx++)
        entries.push_back(archive.GetEntry(idx));
    return entries;
}

std::string ReadItem(const ClipFileEntry& item)
{
    std::unique_ptr<PartSource> pSource(item.CreatePartSource());
    std::string contents;
    if (pSource.get() == NULL)
        return "<none>";
    EXPECT_EQ(kXferErrNone, ReadAll(pSource.get(), &contents));
    return contents;
}

/*
 * Source archive with a file or two, and a callback to watch the worker.
 */
class XferWorkerTest : public ::testing::Test {
protected:
    XferWorkerTest(void) : fSource(MemArchive::NuFXLike()) {}

    MemArchiveEntry* AddSource(const std::string& path,
        const std::string& data)
    {
        return fSource.AddTestEntry(path, data);
    }

    const ClipFileSet::ItemList& Plan(void) {
        EXPECT_EQ(kXferErrNone, fClipSet.CreateFromArchive(&fSource,
            AllEntries(fSource), ClipFileSet::Options()));
        return fClipSet.GetXferEntries();
    }

    XferStatus AddToArchive(MemArchive* pTarget, bool commit = true) {
        XferWorker worker(RecordingCallback::Callback, &fCallback, fOpts);
        EXPECT_EQ(kXferErrNone, pTarget->StartTransaction());
        XferStatus status = worker.AddToArchive(Plan(), pTarget);
        fLastError = worker.GetLastError();
        if (commit)
            EXPECT_EQ(kXferErrNone, pTarget->CommitTransaction());
        else
            pTarget->CancelTransaction();
        return status;
    }

    XferStatus AddToFileSystem(MemFileSystem* pTarget) {
        XferWorker worker(RecordingCallback::Callback, &fCallback, fOpts);
        XferStatus status = worker.AddToFileSystem(Plan(), pTarget, NULL);
        fLastError = worker.GetLastError();
        return status;
    }

    MemArchive          fSource;
    ClipFileSet         fClipSet;
    XferWorker::Options fOpts;
    RecordingCallback   fCallback;
    XferError           fLastError;
};


/*
 * ===========================================================================
 *      Archive target
 * ===========================================================================
 */

TEST_F(XferWorkerTest, ArchiveStorageName)
{
    MemArchive zip(MemArchive::ZipLike());

    EXPECT_EQ("A/B/C", XferWorker::AdjustArchivePath(&zip, "A:B", ':', "C"));
    EXPECT_EQ("A_B/C", XferWorker::AdjustArchivePath(&zip, "A/B", ':', "C"));
    EXPECT_EQ("A/C", XferWorker::AdjustArchivePath(&zip, ":A:", ':', "C"));
    EXPECT_EQ("C", XferWorker::AdjustArchivePath(&zip, "", ':', "C"));

    zip.SetMaxNameLen(3);
    EXPECT_EQ("", XferWorker::AdjustArchivePath(&zip, "A:B", ':', "C"));
}

TEST_F(XferWorkerTest, CopiesBothForks)
{
    MemArchiveEntry* pEntry = AddSource("DIR:F", "data");
    pEntry->SetRsrc("rsrc");
    pEntry->SetFileType(0x06);
    pEntry->SetAuxType(0x2000);
    pEntry->SetModWhen(1000000000);

    MemArchive target(MemArchive::NuFXLike());
    ASSERT_EQ(kXferOK, AddToArchive(&target));

    ASSERT_EQ(1, target.GetEntryCount());
    MemArchiveEntry* pNew = target.GetMemEntry(0);
    EXPECT_STREQ("DIR:F", pNew->GetPathName());
    EXPECT_EQ(':', pNew->GetFssep());
    EXPECT_EQ("data", pNew->GetData());
    ASSERT_TRUE(pNew->HasRsrcFork());
    EXPECT_EQ("rsrc", pNew->GetRsrc());
    EXPECT_EQ(0x06u, pNew->GetFileType());
    EXPECT_EQ(0x2000u, pNew->GetAuxType());
    EXPECT_EQ((time_t) 1000000000, pNew->GetModWhen());

    // progress arrives when the archive reads the parts
    EXPECT_EQ(2, fCallback.Count(CallbackFacts::kReasonProgress));
    const CallbackFacts* pFacts =
        fCallback.FindFirst(CallbackFacts::kReasonProgress);
    ASSERT_TRUE(pFacts != NULL);
    EXPECT_EQ("DIR:F", pFacts->origPathName);
    EXPECT_EQ("DIR:F", pFacts->newPathName);
    EXPECT_EQ(kPartDataFork, pFacts->part);
}

TEST_F(XferWorkerTest, ConvertsSeparator)
{
    AddSource("A:B/C", "x");

    MemArchive target(MemArchive::ZipLike());
    ASSERT_EQ(kXferOK, AddToArchive(&target));
    ASSERT_EQ(1, target.GetEntryCount());
    EXPECT_STREQ("A/B_C", target.GetEntry(0)->GetPathName());
}

TEST_F(XferWorkerTest, StripsPaths)
{
    AddSource("DIR:SUB:F", "x");
    fOpts.stripPaths = true;

    MemArchive target(MemArchive::NuFXLike());
    ASSERT_EQ(kXferOK, AddToArchive(&target));
    ASSERT_EQ(1, target.GetEntryCount());
    EXPECT_STREQ("F", target.GetEntry(0)->GetPathName());
}

TEST_F(XferWorkerTest, ResourceForkIgnoredWithoutMacZip)
{
    MemArchiveEntry* pEntry = AddSource("DIR:F", "data");
    pEntry->SetRsrc("rsrc");

    MemArchive target(MemArchive::ZipLike());
    ASSERT_EQ(kXferOK, AddToArchive(&target));

    ASSERT_EQ(1, target.GetEntryCount());
    EXPECT_STREQ("DIR/F", target.GetEntry(0)->GetPathName());
    EXPECT_FALSE(target.GetEntry(0)->HasRsrcFork());
    EXPECT_EQ(1, fCallback.Count(CallbackFacts::kReasonResourceForkIgnored));
    const CallbackFacts* pFacts =
        fCallback.FindFirst(CallbackFacts::kReasonResourceForkIgnored);
    ASSERT_TRUE(pFacts != NULL);
    EXPECT_EQ("DIR:F", pFacts->origPathName);
}

TEST_F(XferWorkerTest, MacZipHeaderCarriesForkAndTypes)
{
    MemArchiveEntry* pEntry = AddSource("DIR:F", "data");
    pEntry->SetRsrc("rsrc");
    pEntry->SetFileType(0x06);
    pEntry->SetAuxType(0x2000);
    fOpts.macZip = true;

    MemArchive target(MemArchive::ZipLike());
    ASSERT_EQ(kXferOK, AddToArchive(&target));

    ASSERT_EQ(2, target.GetEntryCount());
    EXPECT_STREQ("DIR/F", target.GetEntry(0)->GetPathName());
    EXPECT_EQ("data", target.GetMemEntry(0)->GetData());
    EXPECT_STREQ("__MACOSX/DIR/._F", target.GetEntry(1)->GetPathName());

    // planning a copy out of the ZIP pairs the header back up
    ClipFileSet::Options opts;
    opts.macZip = true;
    ClipFileSet zipSet;
    ASSERT_EQ(kXferErrNone,
        zipSet.CreateFromArchive(&target, AllEntries(target), opts));
    const ClipFileSet::ItemList& items = zipSet.GetXferEntries();
    ASSERT_EQ(3u, items.size());
    EXPECT_TRUE(items[0].IsDirectory());
    EXPECT_EQ(0x06u, items[1].attribs.fileType);
    EXPECT_EQ(0x2000u, items[1].attribs.auxType);
    EXPECT_EQ("data", ReadItem(items[1]));
    ASSERT_EQ(kPartRsrcFork, items[2].part);
    EXPECT_EQ("rsrc", ReadItem(items[2]));
}

TEST_F(XferWorkerTest, MacZipHeaderForTypesOnly)
{
    MemArchiveEntry* pEntry = AddSource("F", "data");
    pEntry->SetFileType(0x04);
    fOpts.macZip = true;

    MemArchive target(MemArchive::ZipLike());
    ASSERT_EQ(kXferOK, AddToArchive(&target));
    ASSERT_EQ(2, target.GetEntryCount());
    EXPECT_STREQ("__MACOSX/._F", target.GetEntry(1)->GetPathName());

    // no types, no header
    MemArchive plainSource(MemArchive::NuFXLike());
    (void) plainSource.AddTestEntry("G", "x");
    ClipFileSet plainSet;
    ASSERT_EQ(kXferErrNone, plainSet.CreateFromArchive(&plainSource,
        AllEntries(plainSource), ClipFileSet::Options()));
    XferWorker worker(RecordingCallback::Callback, &fCallback, fOpts);
    MemArchive target2(MemArchive::ZipLike());
    ASSERT_EQ(kXferErrNone, target2.StartTransaction());
    ASSERT_EQ(kXferOK, worker.AddToArchive(plainSet.GetXferEntries(), &target2));
    ASSERT_EQ(kXferErrNone, target2.CommitTransaction());
    EXPECT_EQ(1, target2.GetEntryCount());
}

TEST_F(XferWorkerTest, ExistingEntrySkipped)
{
    AddSource("F", "new");
    MemArchive target(MemArchive::NuFXLike());
    (void) target.AddTestEntry("f", "old");

    ASSERT_EQ(kXferOK, AddToArchive(&target));

    ASSERT_EQ(1, target.GetEntryCount());
    EXPECT_EQ("old", target.GetMemEntry(0)->GetData());
    const CallbackFacts* pFacts =
        fCallback.FindFirst(CallbackFacts::kReasonFileNameExists);
    ASSERT_TRUE(pFacts != NULL);
    EXPECT_EQ("f", pFacts->origPathName);
    EXPECT_EQ("F", pFacts->newPathName);
}

TEST_F(XferWorkerTest, ExistingEntryOverwritten)
{
    AddSource("F", "new");
    MemArchive target(MemArchive::NuFXLike());
    (void) target.AddTestEntry("f", "old");
    (void) target.AddTestEntry("G", "keep");
    fCallback.SetAnswer(CallbackFacts::kReasonFileNameExists,
        CallbackFacts::kResultOverwrite);

    ASSERT_EQ(kXferOK, AddToArchive(&target));

    EXPECT_EQ(1, fCallback.Count(CallbackFacts::kReasonFileNameExists));
    ASSERT_EQ(2, target.GetEntryCount());
    EXPECT_STREQ("G", target.GetEntry(0)->GetPathName());
    EXPECT_STREQ("F", target.GetEntry(1)->GetPathName());
    EXPECT_EQ("new", target.GetMemEntry(1)->GetData());
}

TEST_F(XferWorkerTest, ExistingEntryCancels)
{
    AddSource("F", "new");
    MemArchive target(MemArchive::NuFXLike());
    (void) target.AddTestEntry("F", "old");
    fCallback.SetAnswer(CallbackFacts::kReasonFileNameExists,
        CallbackFacts::kResultCancel);

    EXPECT_EQ(kXferCancelled, AddToArchive(&target, false));
    ASSERT_EQ(1, target.GetEntryCount());
    EXPECT_EQ("old", target.GetMemEntry(0)->GetData());
}

TEST_F(XferWorkerTest, PathTooLongSkipped)
{
    AddSource("LONGNAME", "x");
    AddSource("OK", "y");
    MemArchive target(MemArchive::NuFXLike());
    target.SetMaxNameLen(4);

    ASSERT_EQ(kXferOK, AddToArchive(&target));

    ASSERT_EQ(1, target.GetEntryCount());
    EXPECT_STREQ("OK", target.GetEntry(0)->GetPathName());
    const CallbackFacts* pFacts =
        fCallback.FindFirst(CallbackFacts::kReasonPathTooLong);
    ASSERT_TRUE(pFacts != NULL);
    EXPECT_EQ("LONGNAME", pFacts->origPathName);
}

TEST_F(XferWorkerTest, PathTooLongCancels)
{
    AddSource("LONGNAME", "x");
    MemArchive target(MemArchive::NuFXLike());
    target.SetMaxNameLen(4);
    fCallback.SetAnswer(CallbackFacts::kReasonPathTooLong,
        CallbackFacts::kResultCancel);

    EXPECT_EQ(kXferCancelled, AddToArchive(&target, false));
    EXPECT_EQ(0, target.GetEntryCount());
}

TEST_F(XferWorkerTest, CancelKeepsEarlierItems)
{
    AddSource("A", "a");
    AddSource("B", "b");
    AddSource("C", "c");
    fCallback.CancelAtQuery(2);

    // the caller decides what to do with the partial result; keep it
    MemArchive target(MemArchive::NuFXLike());
    EXPECT_EQ(kXferCancelled, AddToArchive(&target, true));
    ASSERT_EQ(1, target.GetEntryCount());
    EXPECT_STREQ("A", target.GetEntry(0)->GetPathName());
}

TEST_F(XferWorkerTest, ReadOnlyArchive)
{
    AddSource("A", "a");
    Archive::Characteristics chars = MemArchive::NuFXLike();
    chars.canWrite = false;
    MemArchive target(chars);

    XferWorker worker(RecordingCallback::Callback, &fCallback, fOpts);
    EXPECT_EQ(kXferFailed, worker.AddToArchive(Plan(), &target));
    EXPECT_EQ(kXferErrWriteProtected, worker.GetLastError());
    EXPECT_EQ(1, fCallback.Count(CallbackFacts::kReasonFailure));
}


/*
 * ===========================================================================
 *      Filesystem target
 * ===========================================================================
 */

TEST_F(XferWorkerTest, FileSystemCopiesForksAndTypes)
{
    MemArchiveEntry* pEntry = AddSource("DIR:F", "data");
    pEntry->SetRsrc("rsrc");
    pEntry->SetFileType(0x06);
    pEntry->SetAuxType(0x2000);
    pEntry->SetAccess(kFileAccessLocked);

    MemFileSystem target(MemFileSystem::ProDOSLike());
    ASSERT_EQ(kXferOK, AddToFileSystem(&target));

    MemFSEntry* pDir = target.FindPath("DIR");
    ASSERT_TRUE(pDir != NULL);
    EXPECT_TRUE(pDir->IsDirectory());
    MemFSEntry* pNew = target.FindPath("DIR:F");
    ASSERT_TRUE(pNew != NULL);
    EXPECT_EQ("data", pNew->GetData());
    ASSERT_TRUE(pNew->HasRsrcFork());
    EXPECT_EQ("rsrc", pNew->GetRsrc());
    EXPECT_EQ(0x06u, pNew->GetFileType());
    EXPECT_EQ(0x2000u, pNew->GetAuxType());
    EXPECT_EQ((uint32_t) kFileAccessLocked, pNew->GetAccess());
    EXPECT_EQ(1, target.GetSaveCount());

    EXPECT_EQ(2, fCallback.Count(CallbackFacts::kReasonProgress));
}

TEST_F(XferWorkerTest, FileSystemIntoSubdirectory)
{
    AddSource("F", "data");
    MemFileSystem target(MemFileSystem::ProDOSLike());
    MemFSEntry* pSub = target.AddTestDir(target.GetVolDir(), "SUB");

    XferWorker worker(RecordingCallback::Callback, &fCallback, fOpts);
    ASSERT_EQ(kXferOK, worker.AddToFileSystem(Plan(), &target, pSub));
    ASSERT_TRUE(target.FindPath("SUB:F") != NULL);
    EXPECT_TRUE(target.FindPath("F") == NULL);

    // a file isn't a place to put things
    MemFSEntry* pFile = target.FindPath("SUB:F");
    EXPECT_EQ(kXferFailed, worker.AddToFileSystem(Plan(), &target, pFile));
    EXPECT_EQ(kXferErrInvalidArg, worker.GetLastError());
}

TEST_F(XferWorkerTest, FileSystemProDOSTypesOnHFS)
{
    MemArchiveEntry* pEntry = AddSource("F", "data");
    pEntry->SetFileType(0x06);
    pEntry->SetAuxType(0x2000);

    MemFileSystem target(MemFileSystem::HFSLike());
    ASSERT_EQ(kXferOK, AddToFileSystem(&target));

    MemFSEntry* pNew = target.FindPath("F");
    ASSERT_TRUE(pNew != NULL);
    EXPECT_EQ(0x70062000u, pNew->GetHFSFileType());
    EXPECT_EQ(kPdosCreator, pNew->GetHFSCreator());
}

TEST_F(XferWorkerTest, FileSystemExistingSkipped)
{
    AddSource("F", "new");
    MemFileSystem target(MemFileSystem::ProDOSLike());
    (void) target.AddTestFile(target.GetVolDir(), "f", "old");

    ASSERT_EQ(kXferOK, AddToFileSystem(&target));
    MemFSEntry* pFile = target.FindPath("F");
    ASSERT_TRUE(pFile != NULL);
    EXPECT_EQ("old", pFile->GetData());
    EXPECT_EQ(1, fCallback.Count(CallbackFacts::kReasonFileNameExists));
    EXPECT_TRUE(target.GetDeleteLog().empty());
}

TEST_F(XferWorkerTest, FileSystemExistingOverwritten)
{
    AddSource("F", "new");
    MemFileSystem target(MemFileSystem::ProDOSLike());
    (void) target.AddTestFile(target.GetVolDir(), "f", "old");
    fCallback.SetAnswer(CallbackFacts::kReasonFileNameExists,
        CallbackFacts::kResultOverwrite);

    ASSERT_EQ(kXferOK, AddToFileSystem(&target));
    ASSERT_EQ(1u, target.GetDeleteLog().size());
    EXPECT_EQ("f", target.GetDeleteLog()[0]);
    MemFSEntry* pFile = target.FindPath("F");
    ASSERT_TRUE(pFile != NULL);
    EXPECT_STREQ("F", pFile->GetFileName());
    EXPECT_EQ("new", pFile->GetData());
}

TEST_F(XferWorkerTest, FileSystemDamagedNotOverwritten)
{
    AddSource("F", "new");
    MemFileSystem target(MemFileSystem::ProDOSLike());
    MemFSEntry* pOld = target.AddTestFile(target.GetVolDir(), "F", "old");
    pOld->SetDamaged(true);
    fCallback.SetAnswer(CallbackFacts::kReasonFileNameExists,
        CallbackFacts::kResultOverwrite);

    EXPECT_EQ(kXferFailed, AddToFileSystem(&target));
    EXPECT_EQ(kXferErrBadFile, fLastError);
    EXPECT_TRUE(target.GetDeleteLog().empty());
}

TEST_F(XferWorkerTest, FileSystemSelfOverwrite)
{
    MemFileSystem fs(MemFileSystem::ProDOSLike());
    MemFSEntry* pFile = fs.AddTestFile(fs.GetVolDir(), "A", "a");
    std::vector<FileEntry*> entries(1, pFile);

    ClipFileSet clipSet;
    ASSERT_EQ(kXferErrNone, clipSet.CreateFromFileSystem(&fs, entries, NULL,
        ClipFileSet::Options()));
    fCallback.SetAnswer(CallbackFacts::kReasonFileNameExists,
        CallbackFacts::kResultOverwrite);

    XferWorker worker(RecordingCallback::Callback, &fCallback, fOpts);
    EXPECT_EQ(kXferFailed,
        worker.AddToFileSystem(clipSet.GetXferEntries(), &fs, NULL));
    EXPECT_EQ(kXferErrSelfOverwrite, worker.GetLastError());
    EXPECT_EQ(0, fCallback.Count(CallbackFacts::kReasonFileNameExists));
    EXPECT_EQ("a", pFile->GetData());
}

TEST_F(XferWorkerTest, FileSystemFileInTheWay)
{
    AddSource("A:B", "x");
    MemFileSystem target(MemFileSystem::ProDOSLike());
    (void) target.AddTestFile(target.GetVolDir(), "A", "a");

    EXPECT_EQ(kXferFailed, AddToFileSystem(&target));
    EXPECT_EQ(kXferErrTypeMismatch, fLastError);
    const CallbackFacts* pFacts =
        fCallback.FindFirst(CallbackFacts::kReasonFailure);
    ASSERT_TRUE(pFacts != NULL);
    EXPECT_FALSE(pFacts->failMessage.empty());
}

TEST_F(XferWorkerTest, FileSystemDirectoryInTheWay)
{
    AddSource("A", "x");
    MemFileSystem target(MemFileSystem::ProDOSLike());
    (void) target.AddTestDir(target.GetVolDir(), "A");

    EXPECT_EQ(kXferFailed, AddToFileSystem(&target));
    EXPECT_EQ(kXferErrTypeMismatch, fLastError);
}

TEST_F(XferWorkerTest, FileSystemWriteFailureRemovesFile)
{
    AddSource("F", "data");
    MemFileSystem target(MemFileSystem::ProDOSLike());
    target.SetFailWrites(true);

    EXPECT_EQ(kXferFailed, AddToFileSystem(&target));
    EXPECT_EQ(kXferErrWriteFailed, fLastError);
    ASSERT_EQ(1u, target.GetDeleteLog().size());
    EXPECT_EQ("F", target.GetDeleteLog()[0]);
    EXPECT_TRUE(target.FindPath("F") == NULL);
}

TEST_F(XferWorkerTest, FileSystemReadOnly)
{
    AddSource("F", "data");
    MemFileSystem target(MemFileSystem::ProDOSLike());
    target.SetDubious(true);

    EXPECT_EQ(kXferFailed, AddToFileSystem(&target));
    EXPECT_EQ(kXferErrWriteProtected, fLastError);
    EXPECT_TRUE(target.FindPath("F") == NULL);
}

TEST_F(XferWorkerTest, FileSystemResourceForkIgnored)
{
    MemArchiveEntry* pEntry = AddSource("DIR:F", "data");
    pEntry->SetRsrc("rsrc");

    MemFileSystem target(MemFileSystem::DOSLike());
    ASSERT_EQ(kXferOK, AddToFileSystem(&target));

    // no directories on DOS, so the file lands in the catalog
    MemFSEntry* pNew = target.FindPath("F");
    ASSERT_TRUE(pNew != NULL);
    EXPECT_EQ("data", pNew->GetData());
    EXPECT_FALSE(pNew->HasRsrcFork());
    EXPECT_EQ(1, fCallback.Count(CallbackFacts::kReasonResourceForkIgnored));
}

TEST_F(XferWorkerTest, FileSystemCancel)
{
    AddSource("A", "a");
    AddSource("B", "b");
    fCallback.CancelAtQuery(2);

    MemFileSystem target(MemFileSystem::ProDOSLike());
    EXPECT_EQ(kXferCancelled, AddToFileSystem(&target));
    EXPECT_TRUE(target.FindPath("A") != NULL);
    EXPECT_TRUE(target.FindPath("B") == NULL);
}

TEST_F(XferWorkerTest, TextFromDOS)
{
    MemFileSystem dos(MemFileSystem::DOSLike());
    MemFSEntry* pText = dos.AddTestFile(dos.GetVolDir(), "T", "\xc1\xc2\x8d");
    pText->SetFileType(kFileTypeTXT);
    MemFSEntry* pBin = dos.AddTestFile(dos.GetVolDir(), "B", "\xc1");
    pBin->SetFileType(kFileTypeBIN);
    std::vector<FileEntry*> entries;
    entries.push_back(pText);
    entries.push_back(pBin);

    ClipFileSet clipSet;
    ASSERT_EQ(kXferErrNone, clipSet.CreateFromFileSystem(&dos, entries, NULL,
        ClipFileSet::Options()));

    fOpts.convertDOSText = true;
    XferWorker worker(RecordingCallback::Callback, &fCallback, fOpts);
    MemFileSystem target(MemFileSystem::ProDOSLike());
    ASSERT_EQ(kXferOK,
        worker.AddToFileSystem(clipSet.GetXferEntries(), &target, NULL));

    ASSERT_TRUE(target.FindPath("T") != NULL);
    EXPECT_EQ("AB\r", target.FindPath("T")->GetData());
    ASSERT_TRUE(target.FindPath("B") != NULL);
    EXPECT_EQ("\xc1", target.FindPath("B")->GetData());

    const CallbackFacts* pFacts =
        fCallback.FindFirst(CallbackFacts::kReasonProgress);
    ASSERT_TRUE(pFacts != NULL);
    EXPECT_EQ(CallbackFacts::kDOSConvFromDOS, pFacts->dosConv);
}

TEST_F(XferWorkerTest, TextToDOS)
{
    MemArchiveEntry* pEntry = AddSource("T", std::string("A\0B", 3));
    pEntry->SetFileType(kFileTypeTXT);
    fOpts.convertDOSText = true;

    MemFileSystem target(MemFileSystem::DOSLike());
    ASSERT_EQ(kXferOK, AddToFileSystem(&target));
    ASSERT_TRUE(target.FindPath("T") != NULL);
    EXPECT_EQ(std::string("\xc1\0\xc2", 3), target.FindPath("T")->GetData());
}

TEST_F(XferWorkerTest, TypeKnownBeforeDataWritten)
{
    MemArchiveEntry* pEntry = AddSource("T", "text");
    pEntry->SetFileType(kFileTypeTXT);

    MemFileSystem target(MemFileSystem::DOSLike());
    ASSERT_EQ(kXferOK, AddToFileSystem(&target));
    MemFSEntry* pNew = target.FindPath("T");
    ASSERT_TRUE(pNew != NULL);
    EXPECT_EQ(kFileTypeTXT, pNew->GetWriteFileType());
    EXPECT_EQ(kFileTypeTXT, pNew->GetFileType());
}

TEST_F(XferWorkerTest, PdosTypeKnownBeforeDataWritten)
{
    fSource.SetHFSTypes(true);
    MemArchiveEntry* pEntry = AddSource("F", "data");
    pEntry->SetHFSFileType(0x70062000);
    pEntry->SetHFSCreator(kPdosCreator);

    MemFileSystem target(MemFileSystem::ProDOSLike());
    ASSERT_EQ(kXferOK, AddToFileSystem(&target));
    MemFSEntry* pNew = target.FindPath("F");
    ASSERT_TRUE(pNew != NULL);
    EXPECT_EQ(kFileTypeBIN, pNew->GetWriteFileType());
    EXPECT_EQ(0x2000u, pNew->GetAuxType());
}

TEST_F(XferWorkerTest, TextLeftAloneWhenDisabled)
{
    MemArchiveEntry* pEntry = AddSource("T", "AB");
    pEntry->SetFileType(kFileTypeTXT);

    MemFileSystem target(MemFileSystem::DOSLike());
    ASSERT_EQ(kXferOK, AddToFileSystem(&target));
    ASSERT_TRUE(target.FindPath("T") != NULL);
    EXPECT_EQ("AB", target.FindPath("T")->GetData());
}

}   // namespace
