/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Common code for the archive and filesystem interfaces, and the attribute
 * snapshot that gets passed between them.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"


/*
 * ===========================================================================
 *      Archive
 * ===========================================================================
 */

FileEntry* Archive::FindEntry(const char* pathName) const
{
    long count = GetEntryCount();
    for (long idx = 0; idx < count; idx++) {
        FileEntry* pEntry = GetEntry(idx);
        if (strcmp(pEntry->GetPathName(), pathName) == 0)
            return pEntry;
    }
    return NULL;
}


/*
 * ===========================================================================
 *      FileSystem
 * ===========================================================================
 */

FileEntry* FileSystem::FindFileEntry(const FileEntry* pDir,
    const char* fileName) const
{
    bool caseSensitive = GetCharacteristics().isCaseSensitive;
    long count = GetChildCount(pDir);

    for (long idx = 0; idx < count; idx++) {
        FileEntry* pEntry = GetChild(pDir, idx);
        int cmp;
        if (caseSensitive)
            cmp = strcmp(pEntry->GetFileName(), fileName);
        else
            cmp = strcasecmp(pEntry->GetFileName(), fileName);
        if (cmp == 0)
            return pEntry;
    }
    return NULL;
}

XferError FileSystem::CreateSubdirectories(FileEntry* pBaseDir,
    const std::string& dirPath, char dirSep, FileEntry** ppDir)
{
    XferError xerr;
    FileEntry* pCurDir = pBaseDir;

    if (pBaseDir == NULL || ppDir == NULL)
        return kXferErrInvalidArg;

    size_t start = 0;
    while (start < dirPath.length()) {
        size_t end = dirSep == '\0' ? std::string::npos :
            dirPath.find(dirSep, start);
        if (end == std::string::npos)
            end = dirPath.length();
        std::string component = dirPath.substr(start, end - start);
        start = end + 1;
        if (component.empty())
            continue;       // "a//b" or a leading separator

        std::string adjName = AdjustFileName(component);
        FileEntry* pNext = FindFileEntry(pCurDir, adjName.c_str());
        if (pNext != NULL) {
            if (!pNext->IsDirectory()) {
                LOGW("Can't create directory '%s': file is in the way",
                    adjName.c_str());
                return kXferErrTypeMismatch;
            }
        } else {
            CreateParms parms;
            parms.mode = kCreateDirectory;
            parms.fileType = kFileTypeDIR;
            parms.auxType = 0;
            xerr = CreateFile(pCurDir, adjName.c_str(), &parms, &pNext);
            if (xerr != kXferErrNone) {
                LOGW("Unable to create directory '%s': %s", adjName.c_str(),
                    XferStrError(xerr));
                return xerr;
            }
        }
        pCurDir = pNext;
    }

    *ppDir = pCurDir;
    return kXferErrNone;
}


/*
 * ===========================================================================
 *      XferContainer
 * ===========================================================================
 */

XferError XferContainer::OpenPart(FileEntry* pEntry, FilePart part,
    GenericFD** ppGFD) const
{
    switch (fKind) {
    case kKindArchive:
        return fpArchive->OpenPart(pEntry, part, ppGFD);
    case kKindFileSystem:
        return fpFileSystem->OpenFile(pEntry, true, part, ppGFD);
    default:
        return kXferErrNotReady;
    }
}

FileSystemType XferContainer::GetFSType(void) const
{
    if (fKind == kKindFileSystem)
        return fpFileSystem->GetCharacteristics().fsType;
    return kFSUnknown;
}


/*
 * ===========================================================================
 *      FileAttribs
 * ===========================================================================
 */

FileAttribs::FileAttribs(void)
    : fullPathSep('\0'), isDirectory(false), dataLength(0), rsrcLength(-1),
      fileType(0), auxType(0), hfsFileType(0), hfsCreator(0), access(0),
      createWhen(kDateNone), modWhen(kDateNone)
{
}

FileAttribs::FileAttribs(const FileEntry* pEntry)
    : fullPathName(pEntry->GetPathName()),
      fullPathSep(pEntry->GetFssep()),
      fileNameOnly(pEntry->GetFileName()),
      isDirectory(pEntry->IsDirectory()),
      dataLength(pEntry->GetDataLength()),
      rsrcLength(pEntry->HasRsrcFork() ? pEntry->GetRsrcLength() : -1),
      fileType(pEntry->GetFileType()),
      auxType(pEntry->GetAuxType()),
      hfsFileType(pEntry->GetHFSFileType()),
      hfsCreator(pEntry->GetHFSCreator()),
      access(pEntry->GetAccess()),
      createWhen(pEntry->GetCreateWhen()),
      modWhen(pEntry->GetModWhen())
{
}

void FileAttribs::GetProDOSTypes(uint32_t* pFileType,
    uint32_t* pAuxType) const
{
    *pFileType = fileType;
    *pAuxType = auxType;
    if (fileType == 0 && auxType == 0 && hfsCreator == kPdosCreator &&
        (hfsFileType >> 24) == 'p')
    {
        *pFileType = (hfsFileType >> 16) & 0xff;
        *pAuxType = hfsFileType & 0xffff;
    }
}

void FileAttribs::CopyAttrsTo(FileEntry* pEntry) const
{
    uint32_t proType = fileType;
    uint32_t proAux = auxType;
    uint32_t macType = hfsFileType;
    uint32_t macCreator = hfsCreator;

    if (pEntry->HasHFSTypes() && !pEntry->HasProDOSTypes()) {
        /* store ProDOS types as 'pXYY' / 'pdos' if there's no HFS type */
        if (macType == 0 && macCreator == 0 && (proType != 0 || proAux != 0)) {
            macType = 0x70000000 | (proType & 0xff) << 16 | (proAux & 0xffff);
            macCreator = kPdosCreator;
        }
    } else if (pEntry->HasProDOSTypes() && !pEntry->HasHFSTypes()) {
        /* pull ProDOS types back out of a 'pdos' creator */
        GetProDOSTypes(&proType, &proAux);
    }

    if (pEntry->HasProDOSTypes()) {
        pEntry->SetFileType(proType);
        pEntry->SetAuxType(proAux);
    }
    if (pEntry->HasHFSTypes()) {
        pEntry->SetHFSFileType(macType);
        pEntry->SetHFSCreator(macCreator);
    }
    pEntry->SetAccess(access);
    if (IsValidDate(createWhen))
        pEntry->SetCreateWhen(createWhen);
    if (IsValidDate(modWhen))
        pEntry->SetModWhen(modWhen);
}
