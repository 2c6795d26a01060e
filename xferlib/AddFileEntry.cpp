/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * One file to be added from the host filesystem.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "AddFileEntry.h"
#include "PartSource.h"
#include "PathName.h"


std::string AddFileEntry::GetStoragePath(void) const
{
    return PathName::Combine(storageDir, storageName, storageDirSep);
}

void AddFileEntry::GetAttribs(FileAttribs* pAttrs) const
{
    pAttrs->fullPathName = GetStoragePath();
    pAttrs->fullPathSep = storageDirSep;
    pAttrs->fileNameOnly = storageName;
    pAttrs->isDirectory = isDirectory;

    /* host files can change under us, so we don't try to predict lengths */
    pAttrs->dataLength = 0;
    pAttrs->rsrcLength = hasRsrcFork ? 0 : -1;

    pAttrs->fileType = fileType;
    pAttrs->auxType = auxType;
    pAttrs->hfsFileType = hfsFileType;
    pAttrs->hfsCreator = hfsCreator;
    pAttrs->access = access;
    pAttrs->createWhen = createWhen;
    pAttrs->modWhen = modWhen;
}

PartSource* AddFileEntry::CreatePartSource(FilePart part,
    const ImportConverter* pConverter) const
{
    SourceType sourceType;
    const std::string* pPath;

    if (part == kPartRsrcFork) {
        if (!hasRsrcFork)
            return NULL;
        sourceType = rsrcSource;
        pPath = &fullRsrcPath;
    } else {
        if (!hasDataFork)
            return NULL;
        sourceType = dataSource;
        pPath = &fullDataPath;
    }

    switch (sourceType) {
    case kSourcePlain:
        return new HostFilePartSource(*pPath);
    case kSourceAppleSingle:
        return new ContainerPartSource(new HostFilePartSource(*pPath), part,
            false);
    case kSourceAppleDouble:
        /* only the resource fork lives in the header file */
        return new ContainerPartSource(new HostFilePartSource(*pPath),
            kPartRsrcFork, true);
    case kSourceImport:
        if (pConverter == NULL) {
            LOGW("Import entry '%s' with no converter", pPath->c_str());
            return NULL;
        }
        return new ImportPartSource(new HostFilePartSource(*pPath), pConverter,
            part);
    default:
        LOGE("Unexpected source type %d for '%s'", sourceType, pPath->c_str());
        DebugBreak();
        return NULL;
    }
}
