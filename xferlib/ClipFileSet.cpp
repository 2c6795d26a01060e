/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Transfer planning.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "ClipFileSet.h"
#include "AddFileSet.h"
#include "AppleSingle.h"
#include "PartSource.h"
#include "PathName.h"


void ClipFileSet::Clear(void)
{
    fDirSynth.Reset();
    fVisited.clear();
    fXferEntries.clear();
    fForeignEntries.clear();
}

/*
 * Convert a path from the source container to a host path.  NAPS names
 * escape the characters the host can't handle, so that they can be restored
 * when the file comes back in; everything else just gets them replaced.
 */
std::string ClipFileSet::GetExtractPath(const std::string& pathName,
    char dirSep, bool isDirectory) const
{
    std::string extractPath;

    if (fOpts.preserve == kPreserveNAPS && !isDirectory)
        extractPath = PathName::AdjustEscapePathName(pathName, dirSep);
    else
        extractPath = PathName::AdjustPathName(pathName, dirSep);

    if (fOpts.stripPaths)
        extractPath = PathName::GetFileName(extractPath, kHostDirSep);
    return extractPath;
}

/*
 * Add a directory.  Directories have no forks, so one item goes on each
 * list.
 */
void ClipFileSet::AddDirItems(const ClipFileEntry& proto)
{
    ClipFileEntry item(proto);
    item.part = kPartDataFork;
    item.attribs.isDirectory = true;
    item.attribs.dataLength = 0;
    item.attribs.rsrcLength = -1;
    fXferEntries.push_back(item);

    if (proto.pAddEntry == NULL) {
        item.preserve = fOpts.preserve;
        fForeignEntries.push_back(item);
    }
}

/*
 * Add a file.  The xfer list gets the data fork followed by the resource
 * fork.  A file with nothing but a resource fork just gets one item.
 */
void ClipFileSet::AddFileItems(const ClipFileEntry& proto, bool hasDataFork)
{
    if (hasDataFork || !proto.HasRsrcFork())
        fXferEntries.push_back(proto);
    if (proto.HasRsrcFork()) {
        ClipFileEntry rsrcItem(proto);
        rsrcItem.part = kPartRsrcFork;
        fXferEntries.push_back(rsrcItem);
    }

    if (proto.pAddEntry == NULL)
        GenerateForeignItems(proto, fOpts.preserve, hasDataFork,
            &fForeignEntries);
}

/*static*/ void ClipFileSet::GenerateForeignItems(const ClipFileEntry& proto,
    PreserveMode preserve, bool hasDataFork, ItemList* pList)
{
    const std::string& extractPath = proto.extractPath;
    ClipFileEntry item(proto);
    item.preserve = preserve;

    if (proto.attribs.isDirectory) {
        pList->push_back(item);
        return;
    }

    switch (preserve) {
    case kPreserveNone:
        /* data fork only; the resource fork is dropped */
        pList->push_back(item);
        break;

    case kPreserveADF:
        if (hasDataFork)
            pList->push_back(item);
        if (proto.HasRsrcFork() || proto.attribs.HasTypeInfo()) {
            item.part = kPartRsrcFork;
            item.extractPath = PathName::Combine(
                PathName::GetDirectoryName(extractPath, kHostDirSep),
                PathName::kADFPrefix +
                    PathName::GetFileName(extractPath, kHostDirSep),
                kHostDirSep);
            pList->push_back(item);
        }
        break;

    case kPreserveAS:
        item.extractPath = extractPath + PathName::kASExtension;
        pList->push_back(item);
        break;

    case kPreserveHost:
        pList->push_back(item);
        if (proto.HasRsrcFork()) {
            item.part = kPartRsrcFork;
            item.extractPath = extractPath + PathName::kRsrcForkSuffix;
            pList->push_back(item);
        }
        break;

    case kPreserveNAPS:
        {
            std::string tag = PathName::GenerateNAPSTag(proto.attribs.fileType,
                proto.attribs.auxType, proto.attribs.hfsFileType,
                proto.attribs.hfsCreator);
            if (hasDataFork) {
                item.extractPath = extractPath + tag;
                pList->push_back(item);
            }
            if (proto.HasRsrcFork()) {
                item.part = kPartRsrcFork;
                item.extractPath = extractPath + tag + "r";
                pList->push_back(item);
            }
        }
        break;

    default:
        LOGE("Unexpected preserve mode %d", preserve);
        DebugBreak();
        break;
    }
}


/*
 * ===========================================================================
 *      Archive source
 * ===========================================================================
 */

/*
 * Pull the file attributes out of a MacZip "._" header entry.  The entry
 * is probably compressed, so we read the whole thing into memory before
 * parsing it.
 */
XferError ClipFileSet::GetMacZipAttribs(const XferContainer& container,
    FileEntry* pHeaderEntry, FileAttribs* pAttrs)
{
    const size_t kCopyBufSize = 32768;
    XferError xerr;
    EntryPartSource source(container, pHeaderEntry, kPartDataFork);
    ScopedPartSource guard(&source);
    GFDBuffer header;
    AppleSingle as;
    uint8_t* buf = NULL;

    xerr = header.OpenExpandable();
    if (xerr != kXferErrNone)
        goto bail;
    xerr = source.Open();
    if (xerr != kXferErrNone)
        goto bail;

    buf = new uint8_t[kCopyBufSize];
    while (true) {
        size_t actual;
        xerr = source.Read(buf, kCopyBufSize, &actual);
        if (xerr != kXferErrNone)
            goto bail;
        if (actual == 0)
            break;
        xerr = header.Write(buf, actual);
        if (xerr != kXferErrNone)
            goto bail;
    }

    xerr = as.Parse(&header, true);
    if (xerr != kXferErrNone)
        goto bail;

    pAttrs->fileType = as.GetFileType();
    pAttrs->auxType = as.GetAuxType();
    pAttrs->hfsFileType = as.GetHFSFileType();
    pAttrs->hfsCreator = as.GetHFSCreator();
    pAttrs->access = as.GetAccess();
    if (IsValidDate(as.GetCreateWhen()))
        pAttrs->createWhen = as.GetCreateWhen();
    if (IsValidDate(as.GetModWhen()))
        pAttrs->modWhen = as.GetModWhen();
    if (as.HasRsrcFork() && as.GetRsrcLength() > 0)
        pAttrs->rsrcLength = as.GetRsrcLength();
    else
        pAttrs->rsrcLength = -1;

bail:
    delete[] buf;
    return xerr;
}

XferError ClipFileSet::CreateFromArchive(Archive* pArchive,
    const std::vector<FileEntry*>& entries, const Options& opts)
{
    XferContainer container(pArchive);
    const Archive::Characteristics& chars = pArchive->GetCharacteristics();
    bool doMacZip = opts.macZip && chars.isMacZipCapable;

    Clear();
    fOpts = opts;

    for (size_t idx = 0; idx < entries.size(); idx++) {
        FileEntry* pEntry = entries[idx];
        char fssep = pEntry->GetFssep();
        std::string pathName(pEntry->GetPathName());

        /* archive directory entries aren't reconstructed */
        if (pEntry->IsDirectory())
            continue;

        ClipFileEntry proto;
        proto.container = container;
        proto.pEntry = pEntry;
        proto.part = kPartDataFork;
        proto.attribs = FileAttribs(pEntry);
        proto.fsType = kFSUnknown;

        if (doMacZip) {
            /* headers are only handled as part of a pair */
            if (PathName::IsMacZipHeader(pathName, fssep))
                continue;

            std::string macZipName = PathName::GenerateMacZipName(pathName, fssep);
            FileEntry* pHeader = NULL;
            if (!macZipName.empty())
                pHeader = pArchive->FindEntry(macZipName.c_str());
            if (pHeader != NULL) {
                XferError xerr = GetMacZipAttribs(container, pHeader,
                    &proto.attribs);
                if (xerr == kXferErrNone) {
                    proto.pMacZipEntry = pHeader;
                } else {
                    LOGW("Unable to get MacZip attributes for '%s': %s",
                        pathName.c_str(), XferStrError(xerr));
                    proto.attribs = FileAttribs(pEntry);
                }
            }
        }

        if (proto.pMacZipEntry == NULL) {
            /*
             * NuFX records may be "extended" with an empty resource fork,
             * which usually means they came from ProDOS.  Keep those.
             */
            if (!pEntry->HasRsrcFork() ||
                (pEntry->GetRsrcLength() <= 0 && !chars.keepsEmptyRsrc))
            {
                proto.attribs.rsrcLength = -1;
            }
        }

        if (opts.stripPaths) {
            proto.attribs.fullPathName = proto.attribs.fileNameOnly;
        } else {
            std::vector<std::string> newDirs;
            fDirSynth.AddAncestors(pathName, fssep, &newDirs);
            for (size_t i = 0; i < newDirs.size(); i++) {
                ClipFileEntry dirProto;
                dirProto.container = container;
                dirProto.attribs.fullPathName = newDirs[i];
                dirProto.attribs.fullPathSep = fssep;
                dirProto.attribs.fileNameOnly =
                    PathName::GetFileName(newDirs[i], fssep);
                dirProto.extractPath = GetExtractPath(newDirs[i], fssep, true);
                AddDirItems(dirProto);
            }
        }
        proto.extractPath = GetExtractPath(pathName, fssep, false);

        AddFileItems(proto, pEntry->HasDataFork());
    }

    LOGD("ClipFileSet: %d archive entries -> %d xfer, %d foreign",
        (int) entries.size(), (int) fXferEntries.size(),
        (int) fForeignEntries.size());
    return kXferErrNone;
}


/*
 * ===========================================================================
 *      Filesystem source
 * ===========================================================================
 */

void ClipFileSet::WalkFileSystem(FileSystem* pFileSystem, FileEntry* pEntry,
    const FileEntry* pBoundary, const XferContainer& container)
{
    const FileSystem::Characteristics& chars =
        pFileSystem->GetCharacteristics();
    char dirSep = chars.dirSep;

    if (!fVisited.insert(pEntry).second)
        return;         // already handled, e.g. listed along with its dir

    if (!fOpts.stripPaths) {
        std::vector<FileEntry*> newDirs;
        fDirSynth.AddAncestors(pEntry, pBoundary, dirSep, &newDirs);
        for (size_t i = 0; i < newDirs.size(); i++) {
            ClipFileEntry dirProto;
            dirProto.container = container;
            dirProto.pEntry = newDirs[i];
            dirProto.fsType = chars.fsType;
            dirProto.attribs = FileAttribs(newDirs[i]);
            dirProto.attribs.fullPathName =
                DirSynth::GetRelativePath(newDirs[i], pBoundary, dirSep);
            dirProto.attribs.fullPathSep = dirSep;
            dirProto.extractPath =
                GetExtractPath(dirProto.attribs.fullPathName, dirSep, true);
            AddDirItems(dirProto);
        }
    }

    std::string relPath = DirSynth::GetRelativePath(pEntry, pBoundary, dirSep);

    if (pEntry->IsDirectory()) {
        /* the boundary and the volume dir have no path, and aren't output */
        if (!fOpts.stripPaths && !relPath.empty() &&
            fDirSynth.MarkSeen(relPath))
        {
            ClipFileEntry dirProto;
            dirProto.container = container;
            dirProto.pEntry = pEntry;
            dirProto.fsType = chars.fsType;
            dirProto.attribs = FileAttribs(pEntry);
            dirProto.attribs.fullPathName = relPath;
            dirProto.attribs.fullPathSep = dirSep;
            dirProto.extractPath = GetExtractPath(relPath, dirSep, true);
            AddDirItems(dirProto);
        }

        long count = pFileSystem->GetChildCount(pEntry);
        for (long idx = 0; idx < count; idx++) {
            WalkFileSystem(pFileSystem, pFileSystem->GetChild(pEntry, idx),
                pBoundary, container);
        }
        return;
    }

    ClipFileEntry proto;
    proto.container = container;
    proto.pEntry = pEntry;
    proto.fsType = chars.fsType;
    proto.part = kPartDataFork;
    if (fOpts.rawMode && IsDOSFlavored(chars.fsType))
        proto.part = kPartRawData;
    proto.attribs = FileAttribs(pEntry);
    proto.attribs.fullPathName =
        fOpts.stripPaths ? proto.attribs.fileNameOnly : relPath;
    proto.attribs.fullPathSep = dirSep;

    /*
     * ProDOS remembers whether a file is extended even if the resource fork
     * is empty, so keep those.  Everything on HFS has a resource fork, so
     * drop the empty ones there.
     */
    if (!pEntry->HasRsrcFork() ||
        (pEntry->GetRsrcLength() <= 0 && chars.fsType != kFSProDOS))
    {
        proto.attribs.rsrcLength = -1;
    }
    proto.extractPath = GetExtractPath(relPath, dirSep, false);

    AddFileItems(proto, pEntry->HasDataFork());
}

XferError ClipFileSet::CreateFromFileSystem(FileSystem* pFileSystem,
    const std::vector<FileEntry*>& entries, FileEntry* pBaseDir,
    const Options& opts)
{
    XferContainer container(pFileSystem);

    Clear();
    fOpts = opts;

    const FileEntry* pBoundary = pBaseDir;
    if (pBoundary == NULL)
        pBoundary = pFileSystem->GetVolDirEntry();
    if (pBoundary == NULL || !pBoundary->IsDirectory()) {
        LOGW("ClipFileSet: base is not a directory");
        return kXferErrInvalidArg;
    }

    for (size_t idx = 0; idx < entries.size(); idx++)
        WalkFileSystem(pFileSystem, entries[idx], pBoundary, container);

    LOGD("ClipFileSet: %d disk entries -> %d xfer, %d foreign",
        (int) entries.size(), (int) fXferEntries.size(),
        (int) fForeignEntries.size());
    return kXferErrNone;
}


/*
 * ===========================================================================
 *      Host source
 * ===========================================================================
 */

XferError ClipFileSet::CreateFromAddSet(const AddFileSet& addSet,
    const Options& opts)
{
    Clear();
    fOpts = opts;

    for (long idx = 0; idx < addSet.GetCount(); idx++) {
        const AddFileEntry* pAddEntry = addSet.GetEntry(idx);
        char dirSep = pAddEntry->storageDirSep;
        std::string storagePath = pAddEntry->GetStoragePath();

        ClipFileEntry proto;
        proto.pAddEntry = pAddEntry;
        proto.pConverter = addSet.GetConverter();
        proto.part = kPartDataFork;
        pAddEntry->GetAttribs(&proto.attribs);

        if (pAddEntry->isDirectory) {
            if (opts.stripPaths || storagePath.empty() ||
                !fDirSynth.MarkSeen(storagePath))
            {
                continue;
            }
            /* make sure the parents come first */
            std::vector<std::string> newDirs;
            fDirSynth.AddAncestors(storagePath, dirSep, &newDirs);
            for (size_t i = 0; i < newDirs.size(); i++) {
                ClipFileEntry dirProto;
                dirProto.attribs.fullPathName = newDirs[i];
                dirProto.attribs.fullPathSep = dirSep;
                dirProto.attribs.fileNameOnly =
                    PathName::GetFileName(newDirs[i], dirSep);
                dirProto.pAddEntry = pAddEntry;     // marks it host-side
                AddDirItems(dirProto);
            }
            AddDirItems(proto);
            continue;
        }

        if (opts.stripPaths) {
            proto.attribs.fullPathName = proto.attribs.fileNameOnly;
        } else {
            std::vector<std::string> newDirs;
            fDirSynth.AddAncestors(storagePath, dirSep, &newDirs);
            for (size_t i = 0; i < newDirs.size(); i++) {
                ClipFileEntry dirProto;
                dirProto.attribs.fullPathName = newDirs[i];
                dirProto.attribs.fullPathSep = dirSep;
                dirProto.attribs.fileNameOnly =
                    PathName::GetFileName(newDirs[i], dirSep);
                dirProto.pAddEntry = pAddEntry;
                AddDirItems(dirProto);
            }
        }

        AddFileItems(proto, pAddEntry->hasDataFork);
    }

    LOGD("ClipFileSet: %ld host entries -> %d xfer", addSet.GetCount(),
        (int) fXferEntries.size());
    return kXferErrNone;
}
