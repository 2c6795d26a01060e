/*
 * CiderPress
 * Copyright (C) 2007 by faddenSoft, LLC.  All Rights Reserved.
 * See the file LICENSE for distribution terms.
 */
/*
 * Byte sources for planned transfer items.
 */
#include "StdAfx.h"
#include "XferLibPriv.h"
#include "ClipFileEntry.h"
#include "AddFileEntry.h"
#include "PartSource.h"


/*
 * Open one fork of the source, without any preservation encoding.
 */
PartSource* ClipFileEntry::CreateForkSource(FilePart whichPart) const
{
    if (pAddEntry != NULL) {
        PartSource* pSource = pAddEntry->CreatePartSource(whichPart, pConverter);
        if (pSource == NULL && whichPart != kPartRsrcFork)
            pSource = new EmptyPartSource;
        return pSource;
    }

    if (whichPart == kPartRsrcFork) {
        if (!HasRsrcFork())
            return NULL;
        if (pMacZipEntry != NULL) {
            /* resource fork lives inside the AppleDouble header entry */
            return new ContainerPartSource(
                new EntryPartSource(container, pMacZipEntry, kPartDataFork),
                kPartRsrcFork, true);
        }
    }
    if (pEntry == NULL)
        return NULL;
    if (whichPart != kPartRsrcFork && !pEntry->HasDataFork())
        return new EmptyPartSource;
    return new EntryPartSource(container, pEntry, whichPart);
}

PartSource* ClipFileEntry::CreatePartSource(void) const
{
    if (attribs.isDirectory)
        return NULL;

    switch (preserve) {
    case kPreserveUnknown:      // native fork
    case kPreserveNone:
    case kPreserveHost:
    case kPreserveNAPS:
        return CreateForkSource(part);

    case kPreserveADF:
        if (part != kPartRsrcFork)
            return CreateForkSource(part);
        /* the "._" header file, with the resource fork (if any) and types */
        return new GeneratedASPartSource(attribs, attribs.fileNameOnly, NULL,
            CreateForkSource(kPartRsrcFork), true);

    case kPreserveAS:
        {
            PartSource* pDataSrc = NULL;
            if (pAddEntry != NULL ? pAddEntry->hasDataFork :
                    (pEntry != NULL && pEntry->HasDataFork()))
            {
                pDataSrc = CreateForkSource(part == kPartRsrcFork ?
                    kPartDataFork : part);
            }
            return new GeneratedASPartSource(attribs, attribs.fileNameOnly,
                pDataSrc, CreateForkSource(kPartRsrcFork), false);
        }

    default:
        LOGE("Unexpected preserve mode %d", preserve);
        DebugBreak();
        return NULL;
    }
}
